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
 * @file samlauth/handler/EntitlementPolicy.h
 *
 * Login check requiring an entitlement value.
 */

#ifndef __samlauth_entitlement_h__
#define __samlauth_entitlement_h__

#include <samlauth/attribute/Attributes.h>

namespace samlauth {

    class SAMLAUTH_API IdentityProvider;
    class SAMLAUTH_API PropertySet;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Login check that passes when an attribute, eduPersonEntitlement unless
     * configured otherwise, carries at least one of a set of values.
     *
     * <p>Usable directly as a SAMLBackend::PolicyCheck.</p>
     */
    class SAMLAUTH_API EntitlementPolicy
    {
    public:
        /**
         * Constructor.
         *
         * @param values    acceptable values
         * @param attribute attribute to inspect, or nullptr for eduPersonEntitlement
         */
        EntitlementPolicy(const std::vector<std::string>& values, const char* attribute=nullptr);

        /**
         * Constructor from configuration properties "attribute" and "values",
         * the latter a whitespace-delimited list.
         *
         * @param props policy properties
         */
        EntitlementPolicy(const PropertySet& props);

        ~EntitlementPolicy();

        bool operator()(const IdentityProvider& idp, const AttributeSet& attributes) const;

        const std::string& getAttribute() const {
            return m_attribute;
        }

        const std::vector<std::string>& getValues() const {
            return m_values;
        }

        static const char ATTRIBUTE_PROP_NAME[];
        static const char VALUES_PROP_NAME[];

    private:
        std::string m_attribute;
        std::vector<std::string> m_values;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_entitlement_h__ */
