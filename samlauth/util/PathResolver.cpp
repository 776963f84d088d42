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
 * PathResolver.cpp
 *
 * Resolves local filenames into absolute pathnames.
 */

#include "internal.h"
#include "util/PathResolver.h"

#include <stdexcept>

using namespace samlauth;
using namespace std;

PathResolver::PathResolver() : m_defaultPackage(PACKAGE_NAME), m_defaultPrefix("/usr")
{
    setLogDir("/var/log");
    setCfgDir("/etc");
}

PathResolver::~PathResolver()
{
}

void PathResolver::setDefaultPackageName(const char* pkgname)
{
    m_defaultPackage = pkgname;
}

void PathResolver::setDefaultPrefix(const char* prefix)
{
    m_defaultPrefix = prefix;
}

void PathResolver::setLogDir(const char* dir)
{
    m_log = dir;
}

void PathResolver::setCfgDir(const char* dir)
{
    m_cfg = dir;
}

bool PathResolver::isAbsolute(const char* s) const
{
    switch (*s) {
        case 0:
            return false;
        case '/':
        case '\\':
            return true;
        case '.':
            return (*(s+1) == '.' || *(s+1) == '/' || *(s+1) == '\\');
    }
    return *(s+1) == ':';
}

const string& PathResolver::getDir(file_type_t filetype) const
{
    switch (filetype) {
        case SAMLAUTH_LOG_FILE:
            return m_log;
        case SAMLAUTH_CFG_FILE:
            return m_cfg;
    }
    throw invalid_argument("Unknown file type to resolve.");
}

const string& PathResolver::resolve(string& s, file_type_t filetype, const char* pkgname, const char* prefix) const
{
#ifdef WIN32
    // Check for possible environment variable(s).
    if (s.find('%') != string::npos) {
        char expbuf[MAX_PATH + 2];
        DWORD cnt = ExpandEnvironmentStringsA(s.c_str(), expbuf, sizeof(expbuf));
        if (cnt != 0 && cnt <= sizeof(expbuf))
            s = expbuf;
    }
#endif

    if (isAbsolute(s.c_str())) {
        return s;
    }

    const string& dir = getDir(filetype);
    s = dir + '/' + (pkgname ? pkgname : m_defaultPackage) + '/' + s;
    if (!isAbsolute(dir.c_str())) {
        // Fall back to the root for a /usr install.
        if (prefix || m_defaultPrefix != "/usr")
            s = string(prefix ? prefix : m_defaultPrefix) + '/' + s;
        else
            s = string("/") + s;
    }
    return s;
}
