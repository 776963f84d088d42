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
 * @file samlauth/attribute/UserIdentity.h
 *
 * Normalized user data handed back to the login pipeline.
 */

#ifndef __samlauth_useridentity_h__
#define __samlauth_useridentity_h__

#include <samlauth/attribute/Attributes.h>

namespace samlauth {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Profile fields mapped from an attribute set. A field is unset when the
     * identity provider did not release the corresponding attribute.
     */
    struct SAMLAUTH_API UserProfile {
        boost::optional<std::string> fullName;
        boost::optional<std::string> firstName;
        boost::optional<std::string> lastName;
        boost::optional<std::string> username;
        boost::optional<std::string> email;
    };

    /**
     * The identity established by a successful login.
     */
    class SAMLAUTH_API NormalizedIdentity
    {
    public:
        /**
         * Constructor.
         *
         * @param idpName       name of the identity provider that authenticated the user
         * @param permanentId   stable identifier of the user at that provider
         * @param profile       mapped profile fields
         */
        NormalizedIdentity(const std::string& idpName, const std::string& permanentId, const UserProfile& profile);

        ~NormalizedIdentity();

        /**
         * Returns the globally unique user identifier, "idpName:permanentId".
         *
         * @return the user identifier
         */
        std::string getUserID() const;

        const std::string& getIdentityProviderName() const {
            return m_idpName;
        }

        const std::string& getPermanentID() const {
            return m_permanentId;
        }

        const UserProfile& getProfile() const {
            return m_profile;
        }

        /**
         * Returns the SAML session index of the login, if the engine supplied one.
         *
         * @return session index or an empty string
         */
        const std::string& getSessionIndex() const {
            return m_sessionIndex;
        }

        void setSessionIndex(const std::string& sessionIndex) {
            m_sessionIndex = sessionIndex;
        }

        /**
         * Returns the full attribute set released for the login.
         *
         * @return attribute set, including the subject NameID
         */
        const AttributeSet& getAttributes() const {
            return m_attributes;
        }

        void setAttributes(const AttributeSet& attributes) {
            m_attributes = attributes;
        }

    private:
        std::string m_idpName;
        std::string m_permanentId;
        UserProfile m_profile;
        std::string m_sessionIndex;
        AttributeSet m_attributes;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_useridentity_h__ */
