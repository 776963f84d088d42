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

/**
 * Misc.cpp
 *
 * Miscellaneous utilities.
 */

#include "internal.h"
#include "util/Misc.h"

#include <regex>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <sys/stat.h>

using namespace samlauth;
using namespace std;

vector<string>::size_type samlauth::split_to_container(vector<string>& container, const char* s)
{
    if (s) {
        string dup(s);
        boost::trim(dup);
        if (!dup.empty())
            boost::split(container, dup, boost::is_space(), boost::token_compress_on);
    }
    return container.size();
}

time_t samlauth::parseISODuration(const string& s)
{
    static const regex parser("P([[:d:]]+Y)?([[:d:]]+M)?([[:d:]]+D)?(T([[:d:]]+H)?([[:d:]]+M)?([[:d:]]+S)?)?");

    // A bare "P" or "PT" carries no fields and is not a duration.
    if (s.size() < 2 || s.back() == 'T') {
        return -1;
    }

    smatch match;
    if (!regex_match(s, match, parser)) {
        return -1;
    }

    // Capture groups holding the numeric fields, skipping the "T..." group.
    static const size_t fields[] = { 1, 2, 3, 5, 6, 7 };
    static const double factors[] = {
        31556926,       // years
        2629743.83,     // months
        86400,          // days
        3600,           // hours
        60,             // minutes
        1               // seconds
    };

    double duration = 0;
    for (size_t i = 0; i < 6; ++i) {
        if (match[fields[i]].matched) {
            string str = match[fields[i]];
            str.pop_back();
            try {
                duration += factors[i] * boost::lexical_cast<long>(str);
            }
            catch (const boost::bad_lexical_cast&) {
                return -1;
            }
        }
    }

    return static_cast<time_t>(duration);
}

bool FileSupport::exists(const char* path)
{
#ifdef WIN32
    struct _stat stat_buf;
    if (_stat(path, &stat_buf) == 0) {
        return true;
    }
#else
    struct stat stat_buf;
    if (stat(path, &stat_buf) == 0) {
        return true;
    }
#endif
    return false;
}
