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
 * CGIParser.cpp
 *
 * CGI GET/POST parameter parsing.
 */

#include "internal.h"
#include "AuthConfig.h"
#include "io/HTTPRequest.h"
#include "util/CGIParser.h"
#include "util/URLEncoder.h"

#include <cstring>
#include <vector>
#include <boost/algorithm/string.hpp>

using namespace samlauth;
using namespace std;

CGIParser::CGIParser(const HTTPRequest& request, bool queryOnly)
{
    parse(request.getQueryString());
    if (!queryOnly && request.getMethod() && !strcmp(request.getMethod(), "POST")) {
        if (request.getContentType().find("application/x-www-form-urlencoded") != string::npos)
            parse(request.getRequestBody());
    }
}

CGIParser::~CGIParser()
{
}

void CGIParser::parse(const char* pch)
{
    if (!pch || !*pch)
        return;

    const URLEncoder& dec = AuthConfig::getConfig().getURLEncoder();

    vector<string> pairs;
    boost::split(pairs, pch, boost::is_any_of("&"));
    for (vector<string>::iterator i = pairs.begin(); i != pairs.end(); ++i) {
        if (i->empty())
            continue;
        string name, value;
        string::size_type eq = i->find('=');
        if (eq == string::npos) {
            name = *i;
        }
        else {
            name = i->substr(0, eq);
            value = i->substr(eq + 1);
        }
        dec.decode(name);
        dec.decode(value);
        // Parameters are handed out as C strings, so an embedded NUL would truncate them.
        if (name.find('\0') != string::npos || value.find('\0') != string::npos)
            continue;
        kvp_map.insert(make_pair(name, value));
    }
}

pair<CGIParser::walker,CGIParser::walker> CGIParser::getParameters(const char* name) const
{
    if (name)
        return kvp_map.equal_range(name);
    return make_pair(kvp_map.begin(), kvp_map.end());
}
