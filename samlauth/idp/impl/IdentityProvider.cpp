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
 * IdentityProvider.cpp
 *
 * Configuration record for a trusted SAML identity provider.
 */

#include "internal.h"
#include "exceptions.h"
#include "SAMLConstants.h"
#include "idp/IdentityProvider.h"
#include "util/PropertySet.h"

#include <cctype>
#include <stdexcept>
#include <boost/property_tree/ptree.hpp>

using namespace samlauth;
using namespace samlauthconstants;
using namespace boost::property_tree;
using namespace std;

const char IdentityProvider::NAME_PROP_NAME[] = "name";
const char IdentityProvider::ENTITY_ID_PROP_NAME[] = "entityID";
const char IdentityProvider::URL_PROP_NAME[] = "url";
const char IdentityProvider::BINDING_PROP_NAME[] = "binding";
const char IdentityProvider::USER_PERMANENT_ID_PROP_NAME[] = "userPermanentId";
const char IdentityProvider::FULL_NAME_PROP_NAME[] = "attrFullName";
const char IdentityProvider::FIRST_NAME_PROP_NAME[] = "attrFirstName";
const char IdentityProvider::LAST_NAME_PROP_NAME[] = "attrLastName";
const char IdentityProvider::USERNAME_PROP_NAME[] = "attrUsername";
const char IdentityProvider::EMAIL_PROP_NAME[] = "attrEmail";

const char IdentityProvider::PLACEHOLDER_NAME[] = "dummy";
const char IdentityProvider::PLACEHOLDER_ENTITY_ID[] = "https://dummy.none/saml2";
const char IdentityProvider::PLACEHOLDER_URL[] = "https://dummy.none/SSO";

namespace {
    struct RoleProperty {
        IdentityProvider::AttributeRole role;
        const char* propName;
    };

    const RoleProperty ROLE_PROPERTIES[] = {
        { IdentityProvider::USER_PERMANENT_ID, IdentityProvider::USER_PERMANENT_ID_PROP_NAME },
        { IdentityProvider::FULL_NAME, IdentityProvider::FULL_NAME_PROP_NAME },
        { IdentityProvider::FIRST_NAME, IdentityProvider::FIRST_NAME_PROP_NAME },
        { IdentityProvider::LAST_NAME, IdentityProvider::LAST_NAME_PROP_NAME },
        { IdentityProvider::USERNAME, IdentityProvider::USERNAME_PROP_NAME },
        { IdentityProvider::EMAIL, IdentityProvider::EMAIL_PROP_NAME }
    };

    void fillDefaults(map<IdentityProvider::AttributeRole,string>& names) {
        for (const RoleProperty& rp : ROLE_PROPERTIES) {
            names[rp.role] = IdentityProvider::getDefaultAttributeName(rp.role);
        }
    }
};

IdentityProvider::IdentityProvider()
    : m_name(PLACEHOLDER_NAME), m_entityID(PLACEHOLDER_ENTITY_ID), m_ssoURL(PLACEHOLDER_URL),
        m_binding(SAML20_BINDING_HTTP_REDIRECT)
{
    fillDefaults(m_attributeNames);
}

IdentityProvider::IdentityProvider(
    const string& name,
    const string& entityID,
    const string& ssoURL,
    const string& certificate,
    const char* binding,
    const map<AttributeRole,string>& overrides
    ) : m_name(name), m_entityID(entityID), m_ssoURL(ssoURL),
        m_binding((binding && *binding) ? binding : SAML20_BINDING_HTTP_REDIRECT), m_certificate(certificate)
{
    fillDefaults(m_attributeNames);
    for (const auto& o : overrides) {
        if (!o.second.empty()) {
            m_attributeNames[o.first] = o.second;
        }
    }
    validate();
}

IdentityProvider::IdentityProvider(const PropertySet& props, const string& certificate)
    : m_name(props.getString(NAME_PROP_NAME, "")),
        m_entityID(props.getString(ENTITY_ID_PROP_NAME, "")),
        m_ssoURL(props.getString(URL_PROP_NAME, "")),
        m_binding(props.getString(BINDING_PROP_NAME, "")),
        m_certificate(certificate)
{
    if (m_binding.empty())
        m_binding = SAML20_BINDING_HTTP_REDIRECT;
    fillDefaults(m_attributeNames);
    for (const RoleProperty& rp : ROLE_PROPERTIES) {
        const char* prop = props.getString(rp.propName);
        if (prop && *prop) {
            m_attributeNames[rp.role] = prop;
        }
    }
    validate();
}

IdentityProvider::~IdentityProvider()
{
}

void IdentityProvider::validate() const
{
    bool badName = m_name.empty();
    for (string::const_iterator ch = m_name.begin(); !badName && ch != m_name.end(); ++ch) {
        badName = (*ch == ':' || isspace(static_cast<unsigned char>(*ch)));
    }
    if (badName) {
        ConfigurationException ex("IdentityProvider name must be non-empty and may not contain colons or whitespace.");
        ex.addProperty(AuthException::IDP_PROP_NAME, m_name.c_str());
        throw ex;
    }

    const char* missing = nullptr;
    if (m_entityID.empty())
        missing = ENTITY_ID_PROP_NAME;
    else if (m_ssoURL.empty())
        missing = URL_PROP_NAME;
    else if (m_certificate.empty())
        missing = "Certificate";

    if (missing) {
        ConfigurationException ex(string("IdentityProvider (") + m_name + ") is missing required setting: " + missing);
        ex.addProperty(AuthException::IDP_PROP_NAME, m_name.c_str());
        throw ex;
    }
}

const string& IdentityProvider::getAttributeName(AttributeRole role) const
{
    map<AttributeRole,string>::const_iterator i = m_attributeNames.find(role);
    if (i == m_attributeNames.end()) {
        throw invalid_argument("Unknown attribute role.");
    }
    return i->second;
}

const char* IdentityProvider::getDefaultAttributeName(AttributeRole role)
{
    switch (role) {
        case USER_PERMANENT_ID:
        case USERNAME:
            return OID_UID;
        case FULL_NAME:
            return OID_CN;
        case FIRST_NAME:
            return OID_GIVENNAME;
        case LAST_NAME:
            return OID_SURNAME;
        case EMAIL:
            return OID_MAIL;
    }
    throw invalid_argument("Unknown attribute role.");
}

ptree IdentityProvider::getMetadataDescriptor() const
{
    ptree descriptor;
    descriptor.put("entityId", m_entityID);
    descriptor.put("singleSignOnService.url", m_ssoURL);
    descriptor.put("singleSignOnService.binding", m_binding);
    descriptor.put("x509cert", m_certificate);
    return descriptor;
}

const IdentityProvider& IdentityProvider::getPlaceholder()
{
    static const IdentityProvider placeholder;
    return placeholder;
}
