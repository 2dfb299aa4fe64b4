// Copyright 2026 The Vigil Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <boost/program_options.hpp>
#include "logger.h"

namespace vigil
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* CONFIG_FILE_PATH;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
        extern const char* LOG_DIR;
        // monitor
        extern const char* COOLDOWN;
        extern const char* SIGNAL;
        extern const char* THRESHOLD;
        extern const char* THRESHOLD_DAYS;
        extern const char* NOW;
        extern const char* RACE_SIGNAL;
    }

    enum OptionsFlag : int
    {
        GENERAL_OPTIONS = 1 << 0,
        MONITOR_OPTIONS = 1 << 1,

        ALL_OPTIONS     = GENERAL_OPTIONS | MONITOR_OPTIONS
    };

    po::options_description createOptionsDescription(int flags = ALL_OPTIONS);

    // parses the command line, returns false if help was requested
    bool getOptions(int argc, char* argv[], const po::options_description& options, po::variables_map& vm);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_DEBUG);
}
