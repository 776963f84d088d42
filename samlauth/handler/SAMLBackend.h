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
 * @file samlauth/handler/SAMLBackend.h
 *
 * SAML 2.0 Web Browser SSO login backend.
 */

#ifndef __samlauth_samlbackend_h__
#define __samlauth_samlbackend_h__

#include <samlauth/attribute/UserIdentity.h>
#include <samlauth/handler/ServiceProviderSettings.h>

#include <functional>
#include <memory>
#include <utility>

namespace samlauth {

    class SAMLAUTH_API ClaimsMapper;
    class SAMLAUTH_API GenericRequest;
    class SAMLAUTH_API HTTPRequest;
    class SAMLAUTH_API IdentityProvider;
    class SAMLAUTH_API IdentityProviderRegistry;
    class SAMLAUTH_API ProtocolEngine;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * SAML 2.0 Web Browser SSO login backend.
     *
     * <p>One backend serves every configured identity provider. The provider
     * chosen for a login travels through the identity provider as the
     * RelayState, and user identifiers are qualified by the provider name.</p>
     */
    class SAMLAUTH_API SAMLBackend
    {
        MAKE_NONCOPYABLE(SAMLBackend);
    public:
        /**
         * Post-authentication check on a verified response. Returning false
         * rejects the login.
         */
        typedef std::function<bool(const IdentityProvider&, const AttributeSet&)> PolicyCheck;

        /**
         * Constructor.
         *
         * @param settings  service provider settings
         * @param registry  trusted identity providers
         * @param engine    SAML protocol engine
         */
        SAMLBackend(
            const ServiceProviderSettings& settings,
            std::unique_ptr<IdentityProviderRegistry> registry,
            std::unique_ptr<ProtocolEngine> engine
            );

        ~SAMLBackend();

        /**
         * Builds the redirect to the identity provider named by the "idp" request parameter.
         *
         * @param request   the request initiating the login
         * @return  the redirect URL
         * @throws UnknownProviderException if the parameter is missing or names no provider
         */
        std::string resolveRedirectTarget(const HTTPRequest& request) const;

        /**
         * Completes a login from the response returned by the identity provider.
         *
         * @param request   the request carrying the response and RelayState
         * @param check     optional check run against the verified attributes
         * @return  the established identity
         * @throws UnknownProviderException if the RelayState names no provider
         * @throws ProtocolValidationException if the engine reports errors or did not authenticate
         * @throws PolicyRejectedException if the check returns false
         * @throws MissingAttributeException if the permanent ID attribute is absent
         */
        NormalizedIdentity completeLogin(const HTTPRequest& request, const PolicyCheck& check=PolicyCheck()) const;

        /**
         * Returns the user identifier for an identity.
         *
         * @param identity  established identity
         * @return  "idpName:permanentId"
         */
        std::string getUserID(const NormalizedIdentity& identity) const;

        /**
         * Produces the engine settings for an identity provider.
         *
         * @param idp       identity provider
         * @param request   request used to make a relative redirect URI absolute, or nullptr
         * @return  the settings tree
         */
        boost::property_tree::ptree generateSettings(const IdentityProvider& idp, const GenericRequest* request=nullptr) const;

        /**
         * Produces this service provider's metadata.
         *
         * @return  the metadata document and any validation errors
         */
        std::pair<std::string,std::vector<std::string>> generateMetadata() const;

        /**
         * Returns the identity provider registered under a name.
         *
         * @param name  provider name
         * @return  the provider record
         * @throws UnknownProviderException if no provider has that name
         */
        const IdentityProvider& getIdentityProvider(const char* name) const;

        const ServiceProviderSettings& getSettings() const {
            return m_settings;
        }

        const IdentityProviderRegistry& getRegistry() const {
            return *m_registry;
        }

        /**
         * Creates a backend from a configuration tree, constructing the engine
         * named by the root element's "engine" attribute.
         *
         * @param pt    root element of the configuration
         * @return  the backend
         */
        static std::unique_ptr<SAMLBackend> newSAMLBackend(const boost::property_tree::ptree& pt);

        /**
         * Creates a backend from an XML configuration file.
         *
         * @param pathname  configuration file, resolved as a configuration path
         * @return  the backend
         */
        static std::unique_ptr<SAMLBackend> newSAMLBackend(const char* pathname);

        static const char IDP_PARAM_NAME[];
        static const char RELAY_STATE_PARAM_NAME[];
        static const char ROOT_ELEMENT_NAME[];
        static const char ENGINE_PROP_NAME[];

    private:
        ServiceProviderSettings m_settings;
        std::unique_ptr<IdentityProviderRegistry> m_registry;
        std::unique_ptr<ProtocolEngine> m_engine;
        std::unique_ptr<ClaimsMapper> m_mapper;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_samlbackend_h__ */
