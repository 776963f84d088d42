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
 * @file samlauth/idp/IdentityProviderRegistry.h
 *
 * Named collection of trusted identity providers.
 */

#ifndef __samlauth_idpregistry_h__
#define __samlauth_idpregistry_h__

#include <samlauth/idp/IdentityProvider.h>

#include <vector>

namespace samlauth {


#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Named collection of trusted identity providers, read-only once built.
     */
    class SAMLAUTH_API IdentityProviderRegistry
    {
        MAKE_NONCOPYABLE(IdentityProviderRegistry);
    public:
        /**
         * Constructor.
         *
         * @param providers provider records to register
         */
        IdentityProviderRegistry(const std::vector<IdentityProvider>& providers);

        /**
         * Constructor from the root of a backend configuration tree.
         *
         * <p>Each IdentityProvider child element becomes a record. Settings
         * absent from an element are inherited from an IdentityProviderDefaults
         * element, if present.</p>
         *
         * @param pt    configuration tree
         */
        IdentityProviderRegistry(const boost::property_tree::ptree& pt);

        ~IdentityProviderRegistry();

        /**
         * Returns the provider registered under a name.
         *
         * @param name  provider name
         * @return  the provider record
         * @throws UnknownProviderException if no provider has that name
         */
        const IdentityProvider& resolve(const char* name) const;

        /**
         * Returns true iff a provider is registered under a name.
         *
         * @param name  provider name
         * @return  true iff the name is registered
         */
        bool hasProvider(const char* name) const;

        /**
         * Returns the registered provider names in sorted order.
         *
         * @return  provider names
         */
        std::vector<std::string> getProviderNames() const;

        /**
         * Returns the number of registered providers.
         *
         * @return  provider count
         */
        std::size_t size() const;

        static const char PROVIDER_ELEMENT_NAME[];
        static const char DEFAULTS_ELEMENT_NAME[];
        static const char CERTIFICATE_ELEMENT_NAME[];

    private:
        void add(const IdentityProvider& provider);

        std::map<std::string,IdentityProvider> m_providers;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_idpregistry_h__ */
