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

#include "options.h"
#include <map>

using namespace std;

namespace vigil
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* CONFIG_FILE_PATH = "config_file";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
        const char* LOG_DIR = "log_dir";
        // monitor
        const char* COOLDOWN = "cooldown";
        const char* SIGNAL = "signal";
        const char* THRESHOLD = "threshold";
        const char* THRESHOLD_DAYS = "threshold_days";
        const char* NOW = "now";
        const char* RACE_SIGNAL = "race_signal";
    }

    po::options_description createOptionsDescription(int flags)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list of all options")
            (cli::CONFIG_FILE_PATH, po::value<string>(), "path to the JSON config file")
            (cli::LOG_LEVEL, po::value<string>(), "log level [info|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "file log level [info|debug|verbose]")
            (cli::LOG_DIR, po::value<string>()->default_value("logs"), "directory for log files");

        po::options_description monitor_options("Monitor options");
        monitor_options.add_options()
            (cli::COOLDOWN, po::value<uint64_t>(), "per-caller cooldown between actions [seconds], overrides monitor.cooldown_s")
            (cli::SIGNAL, po::value<vector<uint64_t>>()->multitoken(), "life signal timestamps submitted by the provider")
            (cli::THRESHOLD, po::value<uint64_t>(), "inactivity threshold [seconds]")
            (cli::THRESHOLD_DAYS, po::value<uint32_t>()->default_value(90), "inactivity threshold [days], used if no threshold in seconds is given")
            (cli::NOW, po::value<uint64_t>(), "timestamp of the inactivity check")
            (cli::RACE_SIGNAL, po::value<uint64_t>(), "life signal submitted between the check and its decryption result");

        po::options_description options{ "Allowed options" };
        if (flags & GENERAL_OPTIONS)
            options.add(general_options);
        if (flags & MONITOR_OPTIONS)
            options.add(monitor_options);

        return options;
    }

    bool getOptions(int argc, char* argv[], const po::options_description& options, po::variables_map& vm)
    {
        po::store(po::command_line_parser(argc, argv)
            .options(options)
            .style(po::command_line_style::default_style ^ po::command_line_style::allow_guessing)
            .run(), vm);

        if (vm.count(cli::HELP))
        {
            cout << options << std::endl;
            return false;
        }

        vm.notify();
        return true;
    }

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<std::string, int> logLevels
        {
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }
}
