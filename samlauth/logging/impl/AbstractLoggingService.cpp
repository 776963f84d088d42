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
 * logging/impl/AbstractLoggingService.cpp
 *
 * Base class for logging service implementations.
 */

#include "internal.h"

#include "AuthConfig.h"
#include "logging/impl/AbstractLoggingService.h"

#include <stdexcept>

using namespace samlauth;
using namespace boost::property_tree;
using namespace std;

namespace samlauth {
    class CategoryImpl : public virtual Category {
    public:
        CategoryImpl(LoggingServiceSPI& spi, const std::string& name, Priority::Value priority)
            : Category(spi, name, priority) {
        }
    };

    extern LoggingService* SAMLAUTH_DLLLOCAL ConsoleLoggingServiceFactory(const ptree& pt, bool);
    extern LoggingService* SAMLAUTH_DLLLOCAL FileLoggingServiceFactory(const ptree& pt, bool);
#ifndef WIN32
    extern LoggingService* SAMLAUTH_DLLLOCAL SyslogLoggingServiceFactory(const ptree& pt, bool);
#endif
}

void SAMLAUTH_API samlauth::registerLoggingServices()
{
    AuthConfig& conf=AuthConfig::getConfig();
    conf.LoggingServiceManager.registerFactory(CONSOLE_LOGGING_SERVICE, ConsoleLoggingServiceFactory);
    conf.LoggingServiceManager.registerFactory(FILE_LOGGING_SERVICE, FileLoggingServiceFactory);
#ifndef WIN32
    conf.LoggingServiceManager.registerFactory(SYSLOG_LOGGING_SERVICE, SyslogLoggingServiceFactory);
#endif
}

const char LoggingService::LOGGING_TYPE_PROP_PATH[] = "logging.type";
const char AbstractLoggingService::CATEGORIES_SECTION_NAME[] = "logging-categories";
const char AbstractLoggingService::DEFAULT_LEVEL_PROP_PATH[] = "logging.default-level";

LoggingService::LoggingService() {}

LoggingService::~LoggingService() {}

LoggingServiceSPI::LoggingServiceSPI() {}

LoggingServiceSPI::~LoggingServiceSPI() {}

AbstractLoggingService::AbstractLoggingService(const ptree& pt)
    : m_config(pt), m_defaultPriority(Priority::AUTH_INFO)
{
}

AbstractLoggingService::~AbstractLoggingService() {}

bool AbstractLoggingService::init()
{
    // Processes property tree to create mappings from category name to logging level.
    // If an invalid property token is seen, the default level is INFO.

    try {
        m_defaultPriority = Priority::getPriorityValue(m_config.get(DEFAULT_LEVEL_PROP_PATH, "INFO"));
    } catch (const invalid_argument&) {
        m_defaultPriority = Priority::AUTH_INFO;
    }

    // Category names contain periods, so the section is walked directly
    // rather than by path.
    const boost::optional<ptree&> categories = m_config.get_child_optional(CATEGORIES_SECTION_NAME);
    if (categories) {
        for (const auto& mapping : categories.get()) {
            try {
                m_priorityMap.insert({mapping.first,
                    Priority::getPriorityValue(mapping.second.get_value("INFO"))});
            } catch (const invalid_argument&) {
                m_priorityMap.insert({mapping.first, m_defaultPriority});
            }
        }
    }

    return true;
}

void AbstractLoggingService::term() {}

Category& AbstractLoggingService::getCategory(const std::string& name)
{
    lock_guard<mutex> locker(m_lock);

    auto cat = m_categoryMap.find(name);
    if (cat != end(m_categoryMap)) {
        return *(cat->second);
    }

    auto iter = m_priorityMap.find(name);
    Priority::Value prio = iter != end(m_priorityMap) ? iter->second : m_defaultPriority;

    auto map_insert_result = m_categoryMap.insert({name, unique_ptr<Category>(new CategoryImpl(*this, name, prio))});
    // The insert result is a pair<iterator,bool> and the map's value is a pair<key,value>.
    return *(map_insert_result.first->second.get());
}
