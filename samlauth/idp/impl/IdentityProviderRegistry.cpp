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
 * IdentityProviderRegistry.cpp
 *
 * Named collection of trusted identity providers.
 */

#include "internal.h"
#include "exceptions.h"
#include "idp/IdentityProviderRegistry.h"
#include "logging/Category.h"
#include "util/BoostPropertySet.h"

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace samlauth;
using namespace boost::property_tree;
using namespace std;

const char IdentityProviderRegistry::PROVIDER_ELEMENT_NAME[] = "IdentityProvider";
const char IdentityProviderRegistry::DEFAULTS_ELEMENT_NAME[] = "IdentityProviderDefaults";
const char IdentityProviderRegistry::CERTIFICATE_ELEMENT_NAME[] = "Certificate";

namespace {
    static const ptree EMPTY_TREE;

    /** Attributes of a provider element, inheriting from the defaults element. */
    class ProviderPropertySet : public BoostPropertySet {
    public:
        ProviderPropertySet(const ptree& element, const PropertySet* parent=nullptr) {
            boost::optional<const ptree&> attrs = element.get_child_optional("<xmlattr>");
            load(attrs ? attrs.get() : EMPTY_TREE, "unset");
            setParent(parent);
        }
    };
};

IdentityProviderRegistry::IdentityProviderRegistry(const vector<IdentityProvider>& providers)
{
    for (const IdentityProvider& provider : providers) {
        add(provider);
    }
}

IdentityProviderRegistry::IdentityProviderRegistry(const ptree& pt)
{
    unique_ptr<ProviderPropertySet> defaults;
    boost::optional<const ptree&> defaultsElement = pt.get_child_optional(DEFAULTS_ELEMENT_NAME);
    if (defaultsElement) {
        defaults.reset(new ProviderPropertySet(defaultsElement.get()));
    }

    for (const auto& child : pt) {
        if (child.first != PROVIDER_ELEMENT_NAME) {
            continue;
        }

        ProviderPropertySet props(child.second, defaults.get());

        string certificate = child.second.get(CERTIFICATE_ELEMENT_NAME, "");
        boost::trim(certificate);
        if (certificate.empty() && defaultsElement) {
            certificate = defaultsElement->get(CERTIFICATE_ELEMENT_NAME, "");
            boost::trim(certificate);
        }

        add(IdentityProvider(props, certificate));
    }

    if (m_providers.empty()) {
        Category::getInstance(SAMLAUTH_LOGCAT ".IdentityProvider").warn("no IdentityProvider elements found in configuration");
    }
}

IdentityProviderRegistry::~IdentityProviderRegistry()
{
}

void IdentityProviderRegistry::add(const IdentityProvider& provider)
{
    if (!m_providers.insert(make_pair(provider.getName(), provider)).second) {
        ConfigurationException ex("Duplicate IdentityProvider name (" + provider.getName() + ")");
        ex.addProperty(AuthException::IDP_PROP_NAME, provider.getName().c_str());
        throw ex;
    }
    Category::getInstance(SAMLAUTH_LOGCAT ".IdentityProvider").debug("registered IdentityProvider (%s) with entityID (%s)", provider.getName().c_str(), provider.getEntityID().c_str());
}

const IdentityProvider& IdentityProviderRegistry::resolve(const char* name) const
{
    map<string,IdentityProvider>::const_iterator i = m_providers.find(name ? name : "");
    if (i == m_providers.end()) {
        Category::getInstance(SAMLAUTH_LOGCAT ".IdentityProvider").warn("request for unknown IdentityProvider (%s)", name ? name : "");
        UnknownProviderException ex(string("Unknown IdentityProvider (") + (name ? name : "") + ")");
        if (name)
            ex.addProperty(AuthException::IDP_PROP_NAME, name);
        throw ex;
    }
    return i->second;
}

bool IdentityProviderRegistry::hasProvider(const char* name) const
{
    return name && m_providers.count(name) > 0;
}

vector<string> IdentityProviderRegistry::getProviderNames() const
{
    vector<string> names;
    for (const auto& p : m_providers) {
        names.push_back(p.first);
    }
    return names;
}

size_t IdentityProviderRegistry::size() const
{
    return m_providers.size();
}
