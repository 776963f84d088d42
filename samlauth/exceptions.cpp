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
 * exceptions.cpp
 *
 * Exception classes.
 */

#include "internal.h"
#include "AuthConfig.h"
#include "exceptions.h"
#include "logging/Category.h"
#include "util/URLEncoder.h"

#include <map>

using namespace samlauth;
using namespace std;

const char AuthException::IDP_PROP_NAME[] = "idp";
const char AuthException::ATTRIBUTE_PROP_NAME[] = "attribute";

AuthException::AuthException(const char* msg) : m_status(500)
{
    if (msg)
        m_msg = msg;
}

AuthException::AuthException(const string& msg) : m_status(500), m_msg(msg)
{
}

AuthException::~AuthException() noexcept
{
}

const char* AuthException::what() const noexcept
{
    return m_msg.c_str();
}

int AuthException::getStatusCode() const noexcept
{
    return m_status;
}

void AuthException::setStatusCode(int code) noexcept
{
    m_status = code;
}

const unordered_map<string,string>& AuthException::getProperties() const noexcept
{
    return m_props;
}

const char* AuthException::getProperty(const char* name) const noexcept
{
    if (!name)
        return nullptr;
    unordered_map<string,string>::const_iterator i = m_props.find(name);
    return (i != m_props.end()) ? i->second.c_str() : nullptr;
}

void AuthException::addProperties(const unordered_map<string,string>& props)
{
    for (const auto& p : props) {
        m_props[p.first] = p.second;
    }
}

void AuthException::addProperty(const char* name, const char* value)
{
    if (name && value) {
        m_props[name] = value;
    }
}

string AuthException::toQueryString() const
{
    // Sorted for a stable rendering.
    map<string,string> sorted(m_props.begin(), m_props.end());

    string q;
    const URLEncoder& enc = AuthConfig::getConfig().getURLEncoder();
    for (const auto& p : sorted) {
        if (!q.empty())
            q += '&';
        q = q + p.first + '=' + enc.encode(p.second.c_str());
    }
    return q;
}

void AuthException::log(Category& log, Priority::Value priority) const
{
    string msg(m_msg);
    if (!m_props.empty())
        msg += " (" + toQueryString() + ")";
    log.log(priority, msg);
}
