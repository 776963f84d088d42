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
 * EntitlementPolicy.cpp
 *
 * Login check requiring an entitlement value.
 */

#include "internal.h"
#include "exceptions.h"
#include "SAMLConstants.h"
#include "handler/EntitlementPolicy.h"
#include "idp/IdentityProvider.h"
#include "logging/Category.h"
#include "util/Misc.h"
#include "util/PropertySet.h"

using namespace samlauth;
using namespace samlauthconstants;
using namespace std;

const char EntitlementPolicy::ATTRIBUTE_PROP_NAME[] = "attribute";
const char EntitlementPolicy::VALUES_PROP_NAME[] = "values";

EntitlementPolicy::EntitlementPolicy(const vector<string>& values, const char* attribute)
    : m_attribute((attribute && *attribute) ? attribute : OID_EDUPERSON_ENTITLEMENT), m_values(values)
{
    if (m_values.empty()) {
        throw ConfigurationException("EntitlementPolicy requires at least one value.");
    }
}

EntitlementPolicy::EntitlementPolicy(const PropertySet& props)
    : m_attribute(props.getString(ATTRIBUTE_PROP_NAME, OID_EDUPERSON_ENTITLEMENT))
{
    split_to_container(m_values, props.getString(VALUES_PROP_NAME));
    if (m_values.empty()) {
        throw ConfigurationException("EntitlementPolicy requires at least one value.");
    }
}

EntitlementPolicy::~EntitlementPolicy()
{
}

bool EntitlementPolicy::operator()(const IdentityProvider& idp, const AttributeSet& attributes) const
{
    if (hasMatchingValue(attributes, m_attribute, m_values)) {
        return true;
    }
    Category::getInstance(SAMLAUTH_LOGCAT ".Policy").info("IdentityProvider (%s) released no acceptable value of (%s)", idp.getName().c_str(), m_attribute.c_str());
    return false;
}
