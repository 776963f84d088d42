/**
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "logging/impl/StringUtil.h"

#include <cstdio>
#include <vector>

using namespace samlauth;

#if defined(_MSC_VER)
    #define VSNPRINTF _vsnprintf
#else
    #define VSNPRINTF vsnprintf
#endif // _MSC_VER

std::string StringUtil::vform(const char* format, va_list args) {
    std::vector<char> buffer(256);

    while (true) {
        va_list args_copy;

        va_copy(args_copy, args);
        int n = VSNPRINTF(buffer.data(), buffer.size(), format, args_copy);
        va_end(args_copy);

        // If that worked, return a string.
        if ((n > -1) && (static_cast<size_t>(n) < buffer.size())) {
            return std::string(buffer.data(), n);
        }

        // Else try again with more space.
        buffer.resize((n > -1) ?
            n + 1 :                 // ISO/IEC 9899:1999
            buffer.size() * 2);     // twice the old size
    }
}
