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
 * AuthConfig.cpp
 *
 * Library configuration.
 */

#include "internal.h"

#include "exceptions.h"
#include "version.h"
#include "AuthConfig.h"
#include "binding/ProtocolEngine.h"
#include "logging/Category.h"
#include "logging/LoggingService.h"
#include "util/PathResolver.h"
#include "util/URLEncoder.h"

#include <climits>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

using namespace samlauth;
using namespace boost::property_tree;
using namespace std;

namespace samlauth {
    class SAMLAUTH_DLLLOCAL AuthInternalConfig : public AuthConfig
    {
    public:
        AuthInternalConfig() : m_initCount(0) {}
        ~AuthInternalConfig() {}

        bool init(const char* inst_prefix=nullptr, const char* config_file=nullptr, bool rethrow=false);
        void term();

        const PathResolver& getPathResolver() const {
            return m_pathResolver;
        }
        const URLEncoder& getURLEncoder() const {
            return m_urlEncoder;
        }
        LoggingService& getLoggingService() const;

    private:
        bool _init(const char* inst_prefix, const char* config_file, bool rethrow);
        void _term();

        unsigned int m_initCount;
        mutex m_lock;
        PathResolver m_pathResolver;
        URLEncoder m_urlEncoder;
        unique_ptr<LoggingService> m_logging;
    };

    AuthInternalConfig g_config;

    static const char* getenv_or(const char* name, const char* defaultValue) {
        const char* val = getenv(name);
        return (val && *val) ? val : defaultValue;
    }
}

AuthConfig& AuthConfig::getConfig()
{
    return g_config;
}

AuthConfig::AuthConfig()
    : LoggingServiceManager("LoggingService"), ProtocolEngineManager("ProtocolEngine")
{
}

AuthConfig::~AuthConfig()
{
}

LoggingService& AuthInternalConfig::getLoggingService() const
{
    if (m_logging) {
        return *m_logging;
    }
    throw logic_error("LoggingService not initialized.");
}

bool AuthInternalConfig::init(const char* inst_prefix, const char* config_file, bool rethrow)
{
    lock_guard<mutex> locker(m_lock);

    if (m_initCount == INT_MAX) {
        if (rethrow) {
            throw runtime_error("Library initialized too many times.");
        }
        return false;
    }

    if (m_initCount > 0) {
        ++m_initCount;
        return true;
    }

    if (!_init(inst_prefix, config_file, rethrow)) {
        return false;
    }

    ++m_initCount;
    return true;
}

bool AuthInternalConfig::_init(const char* inst_prefix, const char* config_file, bool rethrow)
{
    // Establish prefix and replace backward slashes in path.
    if (!inst_prefix)
        inst_prefix = getenv_or("SAMLAUTH_PREFIX", SAMLAUTH_PREFIX);
    string inst_prefix2;
    while (*inst_prefix) {
        inst_prefix2.push_back((*inst_prefix=='\\') ? ('/') : (*inst_prefix));
        ++inst_prefix;
    }

    m_pathResolver.setDefaultPackageName(PACKAGE_NAME);
    m_pathResolver.setDefaultPrefix(inst_prefix2.c_str());
    m_pathResolver.setCfgDir(getenv_or("SAMLAUTH_CFGDIR", SAMLAUTH_CFGDIR));
    m_pathResolver.setLogDir(getenv_or("SAMLAUTH_LOGDIR", SAMLAUTH_LOGDIR));

    registerLoggingServices();

    try {
        string path(config_file ? config_file : getenv_or("SAMLAUTH_CONFIG", SAMLAUTH_CONFIG));
        m_pathResolver.resolve(path, PathResolver::SAMLAUTH_CFG_FILE);

        ptree config;
        ini_parser::read_ini(path, config);

        string type = config.get(LoggingService::LOGGING_TYPE_PROP_PATH, CONSOLE_LOGGING_SERVICE);
        unique_ptr<LoggingService> logging(LoggingServiceManager.newPlugin(type, config, false));
        if (!logging->init()) {
            throw ConfigurationException("Unable to initialize " + type + " LoggingService.");
        }

        m_logging = move(logging);
    }
    catch (const exception& ex) {
        LoggingServiceManager.deregisterFactories();
        if (rethrow) {
            throw;
        }
        cerr << PACKAGE_STRING << " library initialization failed: " << ex.what() << endl;
        return false;
    }

    Category::getInstance(SAMLAUTH_LOGCAT ".Config").info("%s library initialization complete", PACKAGE_STRING);
    return true;
}

void AuthInternalConfig::term()
{
    lock_guard<mutex> locker(m_lock);

    if (m_initCount == 0) {
        throw runtime_error("Library terminated without initialization.");
    }
    else if (--m_initCount > 0) {
        return;
    }

    _term();
}

void AuthInternalConfig::_term()
{
    Category::getInstance(SAMLAUTH_LOGCAT ".Config").info("%s library shutting down", PACKAGE_STRING);

    ProtocolEngineManager.deregisterFactories();
    LoggingServiceManager.deregisterFactories();

    m_logging->term();
    m_logging.reset();
}
