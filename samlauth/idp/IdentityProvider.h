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
 * @file samlauth/idp/IdentityProvider.h
 *
 * Configuration record for a trusted SAML identity provider.
 */

#ifndef __samlauth_idp_h__
#define __samlauth_idp_h__

#include <samlauth/base.h>

#include <map>
#include <string>
#include <boost/property_tree/ptree_fwd.hpp>

namespace samlauth {

    class SAMLAUTH_API PropertySet;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Immutable configuration record for a trusted SAML identity provider.
     *
     * <p>The name is a short slug (no colons or whitespace) that is used to
     * qualify user identifiers and as the RelayState of a login.</p>
     */
    class SAMLAUTH_API IdentityProvider
    {
    public:
        /** Profile roles that are filled from an attribute. */
        enum AttributeRole {
            USER_PERMANENT_ID,
            FULL_NAME,
            FIRST_NAME,
            LAST_NAME,
            USERNAME,
            EMAIL
        };

        /**
         * Constructor.
         *
         * @param name          provider name
         * @param entityID      entity ID of the provider
         * @param ssoURL        SingleSignOnService endpoint
         * @param certificate   base64-encoded signing certificate
         * @param binding       SingleSignOnService binding, or nullptr for HTTP-Redirect
         * @param overrides     attribute names replacing the default for a role
         */
        IdentityProvider(
            const std::string& name,
            const std::string& entityID,
            const std::string& ssoURL,
            const std::string& certificate,
            const char* binding=nullptr,
            const std::map<AttributeRole,std::string>& overrides=std::map<AttributeRole,std::string>()
            );

        /**
         * Constructor from configuration properties.
         *
         * @param props         provider properties, typically the attributes of an XML element
         * @param certificate   base64-encoded signing certificate
         */
        IdentityProvider(const PropertySet& props, const std::string& certificate);

        ~IdentityProvider();

        const std::string& getName() const {
            return m_name;
        }

        const std::string& getEntityID() const {
            return m_entityID;
        }

        const std::string& getSSOURL() const {
            return m_ssoURL;
        }

        const std::string& getBinding() const {
            return m_binding;
        }

        const std::string& getX509Certificate() const {
            return m_certificate;
        }

        /**
         * Returns the attribute name used to fill a profile role, the configured
         * override if there is one or else the role's default.
         *
         * @param role  the profile role
         * @return  the attribute name
         */
        const std::string& getAttributeName(AttributeRole role) const;

        /**
         * Returns the default attribute name for a profile role.
         *
         * @param role  the profile role
         * @return  the attribute name
         */
        static const char* getDefaultAttributeName(AttributeRole role);

        /**
         * Returns the provider description handed to the protocol engine, with
         * members entityId, singleSignOnService.url, singleSignOnService.binding
         * and x509cert.
         *
         * @return  the descriptor
         */
        boost::property_tree::ptree getMetadataDescriptor() const;

        /**
         * Returns a placeholder provider, used when generating this service
         * provider's own metadata.
         *
         * @return  the placeholder provider
         */
        static const IdentityProvider& getPlaceholder();

        /** Property names. */
        static const char NAME_PROP_NAME[];
        static const char ENTITY_ID_PROP_NAME[];
        static const char URL_PROP_NAME[];
        static const char BINDING_PROP_NAME[];
        static const char USER_PERMANENT_ID_PROP_NAME[];
        static const char FULL_NAME_PROP_NAME[];
        static const char FIRST_NAME_PROP_NAME[];
        static const char LAST_NAME_PROP_NAME[];
        static const char USERNAME_PROP_NAME[];
        static const char EMAIL_PROP_NAME[];

        /** Placeholder values. */
        static const char PLACEHOLDER_NAME[];
        static const char PLACEHOLDER_ENTITY_ID[];
        static const char PLACEHOLDER_URL[];

    private:
        IdentityProvider();
        void validate() const;

        std::string m_name;
        std::string m_entityID;
        std::string m_ssoURL;
        std::string m_binding;
        std::string m_certificate;
        std::map<AttributeRole,std::string> m_attributeNames;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_idp_h__ */
