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
 * @file samlauth/handler/ServiceProviderSettings.h
 *
 * Settings describing this service provider.
 */

#ifndef __samlauth_spsettings_h__
#define __samlauth_spsettings_h__

#include <samlauth/base.h>

#include <map>
#include <string>
#include <vector>
#include <boost/property_tree/ptree_fwd.hpp>

namespace samlauth {

    class SAMLAUTH_API GenericRequest;
    class SAMLAUTH_API IdentityProvider;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /** Contact person published in metadata. */
    struct SAMLAUTH_API ContactPerson {
        std::string givenName;
        std::string emailAddress;
    };

    /** Organization details published in metadata for one language. */
    struct SAMLAUTH_API OrganizationInfo {
        std::string name;
        std::string displayName;
        std::string url;
    };

    /**
     * Settings describing this service provider, passed explicitly to the backend.
     */
    class SAMLAUTH_API ServiceProviderSettings
    {
    public:
        ServiceProviderSettings();

        /**
         * Constructor from the root of a backend configuration tree.
         *
         * @param pt    configuration tree
         */
        ServiceProviderSettings(const boost::property_tree::ptree& pt);

        ~ServiceProviderSettings();

        /**
         * Checks the settings for errors.
         *
         * @throws ConfigurationException if a required setting is missing or invalid
         */
        void validate() const;

        /**
         * Produces the protocol engine settings for an identity provider.
         *
         * <p>Strict mode is always on. Security and extra settings are merged
         * over the defaults.</p>
         *
         * @param idp       identity provider
         * @param request   request used to make a relative redirect URI absolute, or nullptr
         * @return  the settings tree
         */
        boost::property_tree::ptree toEngineSettings(const IdentityProvider& idp, const GenericRequest* request=nullptr) const;

        /** Entity ID of this service provider. */
        std::string entityID;

        /** Base64-encoded certificate. */
        std::string x509Certificate;

        /** Private key matching the certificate. */
        std::string privateKey;

        /** Assertion consumer service location, made absolute against the request when relative. */
        std::string redirectURI;

        /** NameID formats to request. */
        std::vector<std::string> nameIDFormats;

        /** Organization details keyed by language tag. */
        std::map<std::string,OrganizationInfo> organization;

        ContactPerson technicalContact;
        ContactPerson supportContact;

        /** Engine security settings overriding the defaults. */
        std::map<std::string,std::string> security;

        /** Additional engine settings for this service provider. */
        std::map<std::string,std::string> extra;

        static const char DEFAULT_REDIRECT_URI[];
        static const char METADATA_CACHE_DURATION_PROP_NAME[];
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_spsettings_h__ */
