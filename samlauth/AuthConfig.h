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
 * @file samlauth/AuthConfig.h
 *
 * Library "global" configuration.
 */

#ifndef __samlauth_authconfig_h__
#define __samlauth_authconfig_h__

#include <samlauth/util/PluginManager.h>

#include <string>
#include <boost/property_tree/ptree_fwd.hpp>

namespace samlauth {

    class SAMLAUTH_API LoggingService;
    class SAMLAUTH_API PathResolver;
    class SAMLAUTH_API ProtocolEngine;
    class SAMLAUTH_API URLEncoder;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4250 4251 )
#endif

    /**
     * Singleton interface that manages library startup/shutdown.
     */
    class SAMLAUTH_API AuthConfig
    {
        MAKE_NONCOPYABLE(AuthConfig);
    public:
        AuthConfig();
        virtual ~AuthConfig();

        /**
         * Returns the global configuration object for the library.
         *
         * @return reference to the global library configuration object
         */
        static AuthConfig& getConfig();

        /**
         * Initializes library.
         *
         * Each process using the library MUST call this function at least once
         * before using any library classes. Calls are reference counted and must
         * be balanced by calls to term().
         *
         * @param inst_prefix   installation prefix for software
         * @param config_file   INI file containing library settings
         * @param rethrow       true iff errors should be thrown rather than reported by return value
         * @return true iff initialization was successful
         */
        virtual bool init(const char* inst_prefix=nullptr, const char* config_file=nullptr, bool rethrow=false)=0;

        /**
         * Shuts down library.
         *
         * Each process using the library SHOULD call this function once for each
         * successful call to init().
         */
        virtual void term()=0;

        /**
         * Manages factories for LoggingService plugins.
         */
        PluginManager<LoggingService,std::string,boost::property_tree::ptree> LoggingServiceManager;

        /**
         * Manages factories for ProtocolEngine plugins.
         */
        PluginManager<ProtocolEngine,std::string,boost::property_tree::ptree> ProtocolEngineManager;

        /**
         * Returns a PathResolver instance.
         *
         * @return path resolver
         */
        virtual const PathResolver& getPathResolver() const=0;

        /**
         * Returns a URLEncoder instance.
         *
         * @return URL encoder
         */
        virtual const URLEncoder& getURLEncoder() const=0;

        /**
         * Returns the configured logging service.
         *
         * <p>This method will throw in the event the library is not yet initialized.</p>
         *
         * @return logging service
         */
        virtual LoggingService& getLoggingService() const=0;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_authconfig_h__ */
