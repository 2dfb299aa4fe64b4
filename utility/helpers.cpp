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

#include "helpers.h"
#include <chrono>
#include <stdio.h>
#include <time.h>

namespace vigil {

uint64_t local_timestamp_msec() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

size_t format_timestamp(char* buffer, size_t bufferCap, const char* formatStr, uint64_t timestamp, bool formatMsec) {
    time_t seconds = (time_t)(timestamp/1000);
    struct tm tm;
    size_t nBytes = strftime(buffer, bufferCap, formatStr, localtime_r(&seconds, &tm));
    if (formatMsec && bufferCap - nBytes > 4) {
        snprintf(buffer + nBytes, 5, ".%03d", int(timestamp % 1000));
        nBytes += 4;
    }
    return nBytes;
}

char* to_hex(char* dst, const void* bytes, size_t size) {
    static const char digits[] = "0123456789abcdef";
    char* d = dst;

    const uint8_t* ptr = (const uint8_t*)bytes;
    const uint8_t* end = ptr + size;
    while (ptr < end) {
        uint8_t c = *ptr++;
        *d++ = digits[c >> 4];
        *d++ = digits[c & 0xF];
    }
    *d = '\0';
    return dst;
}

std::string to_hex(const void* bytes, size_t size) {
    std::vector<char> buf(2 * size + 1);
    return std::string(to_hex(buf.data(), bytes, size));
}

std::vector<uint8_t> from_hex(const std::string& str, bool* wholeStringIsNumber)
{
    size_t bias = (str.size() % 2) == 0 ? 0 : 1;
    std::vector<uint8_t> res((str.size() + bias) >> 1);

    if (wholeStringIsNumber) *wholeStringIsNumber = true;

    for (size_t i = 0; i < str.size(); ++i)
    {
        auto c = str[i];
        size_t j = (i + bias) >> 1;
        res[j] <<= 4;
        if (c >= '0' && c <= '9')
        {
            res[j] += (c - '0');
        }
        else if (c >= 'a' && c <= 'f')
        {
            res[j] += 10 + (c - 'a');
        }
        else if (c >= 'A' && c <= 'F')
        {
            res[j] += 10 + (c - 'A');
        }
        else {
            if (wholeStringIsNumber) *wholeStringIsNumber = false;
            break;
        }
    }

    return res;
}

} //namespace
