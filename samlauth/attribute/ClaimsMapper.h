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
 * @file samlauth/attribute/ClaimsMapper.h
 *
 * Maps released attributes onto a user identifier and profile.
 */

#ifndef __samlauth_claimsmapper_h__
#define __samlauth_claimsmapper_h__

#include <samlauth/attribute/UserIdentity.h>

namespace samlauth {

    class SAMLAUTH_API IdentityProvider;

    /**
     * Maps the attributes released by an identity provider onto a permanent
     * user identifier and a normalized profile, using the provider's attribute
     * name overrides. The first value of a multi-valued attribute is used.
     */
    class SAMLAUTH_API ClaimsMapper
    {
        MAKE_NONCOPYABLE(ClaimsMapper);
    public:
        ClaimsMapper();
        ~ClaimsMapper();

        /**
         * Returns the user's permanent identifier at the provider.
         *
         * @param attributes    released attributes
         * @param idp           provider that released them
         * @return  the identifier
         * @throws MissingAttributeException if the identifier attribute is absent or its first value is empty
         */
        std::string extractPermanentId(const AttributeSet& attributes, const IdentityProvider& idp) const;

        /**
         * Maps the profile roles. Each role is looked up on its own, and an
         * absent attribute leaves that field unset.
         *
         * @param attributes    released attributes
         * @param idp           provider that released them
         * @return  the profile
         */
        UserProfile mapProfile(const AttributeSet& attributes, const IdentityProvider& idp) const;

        /**
         * Produces the complete identity for a login.
         *
         * @param attributes    released attributes
         * @param idp           provider that released them
         * @return  the identity
         * @throws MissingAttributeException if the identifier attribute is absent or its first value is empty
         */
        NormalizedIdentity mapIdentity(const AttributeSet& attributes, const IdentityProvider& idp) const;
    };

};

#endif /* __samlauth_claimsmapper_h__ */
