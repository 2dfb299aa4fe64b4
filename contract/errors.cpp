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

#include "errors.h"
#include <stdio.h>

namespace vigil {

const char* error_str(ErrorCode errorCode) {
    switch (errorCode) {
        case EC_OK: return "OK";
#define THE_MACRO(name, descr) case EC_##name: return #name;
        VIGIL_ERROR_MAP(THE_MACRO)
#undef THE_MACRO
        default: return "UNKNOWN";
    }
}

const char* error_descr(ErrorCode errorCode) {
    switch (errorCode) {
        case EC_OK: return "OK";
#define THE_MACRO(name, descr) case EC_##name: return descr;
        VIGIL_ERROR_MAP(THE_MACRO)
#undef THE_MACRO
        default: return "unknown error";
    }
}

std::string format_error(const char* _function, const char* _file, int _line, ErrorCode _code) {
    char buf[1024];
#if defined(SHOW_CODE_LOCATION) && SHOW_CODE_LOCATION
    snprintf(buf, sizeof(buf), "vigil::Exception from %s (%s:%d): %s (%s)", _function, _file, _line, error_str(_code), error_descr(_code));
#else
    (void) _function;
    (void) _file;
    (void) _line;
    snprintf(buf, sizeof(buf), "vigil::Exception: %s (%s)", error_str(_code), error_descr(_code));
#endif
    return std::string(buf);
}

} //namespace
