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
#include <stdexcept>
#include <string>

namespace vigil {

#define VIGIL_ERROR_MAP(macro) \
    macro(NotOwner,             "caller is not the owner") \
    macro(NotProvider,          "caller is not an authorized signal provider") \
    macro(Paused,               "monitor is paused") \
    macro(CooldownActive,       "caller's cooldown has not elapsed") \
    macro(BatchClosedOrInvalid, "current batch is closed") \
    macro(InvalidThreshold,     "threshold is not a valid encrypted value") \
    macro(InvalidSignal,        "life signal is not a valid encrypted value") \
    macro(ReplayDetected,       "decryption request already processed") \
    macro(StateMismatch,        "ciphertext set differs from the one committed at request time") \
    macro(DecryptionFailed,     "decryption proof or cleartexts rejected")

/// Rejection reasons of monitor operations
enum ErrorCode {
    EC_OK = 0,
#define THE_MACRO(name, descr) EC_##name,
    VIGIL_ERROR_MAP(THE_MACRO)
#undef THE_MACRO
};

/// Returns short error string, e.g. "NotOwner"
const char* error_str(ErrorCode errorCode);

/// Returns more verbose error description
const char* error_descr(ErrorCode errorCode);

/// Formats error code to be shown by exception::what()
std::string format_error(const char* _function, const char* _file, int _line, ErrorCode _code);

/// Rejected monitor operation. Thrown before any state is committed
struct Exception : public std::runtime_error {
    ErrorCode errorCode;

    Exception(const char* _function, const char* _file, int _line, ErrorCode _code) :
        std::runtime_error(format_error(_function,_file,_line,_code)),
        errorCode(_code)
    {}
};

#define VIGIL_EXCEPTION(Code) throw vigil::Exception(__FUNCTION__, __FILE__, __LINE__, vigil::EC_##Code)
#define VIGIL_EXCEPTION_IF(cond, Code) if (cond) VIGIL_EXCEPTION(Code)

} //namespace
