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
 * SAMLBackend.cpp
 *
 * SAML 2.0 Web Browser SSO login backend.
 */

#include "internal.h"
#include "exceptions.h"
#include "AuthConfig.h"
#include "SAMLConstants.h"
#include "attribute/ClaimsMapper.h"
#include "binding/ProtocolEngine.h"
#include "handler/SAMLBackend.h"
#include "idp/IdentityProviderRegistry.h"
#include "io/HTTPRequest.h"
#include "logging/Category.h"
#include "util/Misc.h"
#include "util/PathResolver.h"

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

using namespace samlauth;
using namespace samlauthconstants;
using namespace boost::property_tree;
using namespace std;

const char SAMLBackend::IDP_PARAM_NAME[] = "idp";
const char SAMLBackend::RELAY_STATE_PARAM_NAME[] = "RelayState";
const char SAMLBackend::ROOT_ELEMENT_NAME[] = "SAMLAuth";
const char SAMLBackend::ENGINE_PROP_NAME[] = "engine";

SAMLBackend::SAMLBackend(
    const ServiceProviderSettings& settings,
    unique_ptr<IdentityProviderRegistry> registry,
    unique_ptr<ProtocolEngine> engine
    ) : m_settings(settings),
        m_registry(move(registry)), m_engine(move(engine)), m_mapper(new ClaimsMapper())
{
    if (!m_registry) {
        throw ConfigurationException("SAMLBackend requires an IdentityProviderRegistry.");
    }
    if (!m_engine) {
        throw ConfigurationException("SAMLBackend requires a ProtocolEngine.");
    }
    m_settings.validate();
    Category::getInstance(SAMLAUTH_LOGCAT ".Backend").info("SAMLBackend for (%s) ready with %lu IdentityProvider(s)",
        m_settings.entityID.c_str(), static_cast<unsigned long>(m_registry->size()));
}

SAMLBackend::~SAMLBackend()
{
}

const IdentityProvider& SAMLBackend::getIdentityProvider(const char* name) const
{
    return m_registry->resolve(name);
}

string SAMLBackend::resolveRedirectTarget(const HTTPRequest& request) const
{
    const char* idpName = request.getParameter(IDP_PARAM_NAME);
    if (!idpName || !*idpName) {
        throw UnknownProviderException("No IdentityProvider specified in login request.");
    }

    const IdentityProvider& idp = getIdentityProvider(idpName);
    ptree settings = generateSettings(idp, &request);

    // The provider name rides along as the RelayState so the response can be matched to it.
    string url = m_engine->login(request, settings, idp.getName().c_str());
    Category::getInstance(SAMLAUTH_LOGCAT ".Backend").debug("redirecting login to IdentityProvider (%s)", idp.getName().c_str());
    return url;
}

NormalizedIdentity SAMLBackend::completeLogin(const HTTPRequest& request, const PolicyCheck& check) const
{
    const char* idpName = request.getParameter(RELAY_STATE_PARAM_NAME);
    if (!idpName || !*idpName) {
        throw UnknownProviderException("No RelayState in SAML response, unable to determine IdentityProvider.");
    }

    const IdentityProvider& idp = getIdentityProvider(idpName);
    ptree settings = generateSettings(idp, &request);

    ProcessedResponse response = m_engine->processResponse(request, settings);
    if (!response.errors.empty() || !response.authenticated) {
        string msg = "SAML login failed: [" + boost::algorithm::join(response.errors, ", ") + "] (" + response.lastErrorReason + ")";
        Category::getInstance(SAMLAUTH_LOGCAT ".Backend").error("login via IdentityProvider (%s) failed: %s", idp.getName().c_str(), msg.c_str());
        ProtocolValidationException ex(msg);
        ex.addProperty(AuthException::IDP_PROP_NAME, idp.getName().c_str());
        throw ex;
    }

    AttributeSet attributes(response.attributes);
    if (!response.nameID.empty())
        attributes[NAMEID_ATTRIBUTE] = vector<string>(1, response.nameID);

    if (check && !check(idp, attributes)) {
        Category::getInstance(SAMLAUTH_LOGCAT ".Backend").warn("login via IdentityProvider (%s) rejected by policy", idp.getName().c_str());
        PolicyRejectedException ex("Login rejected by policy.");
        ex.addProperty(AuthException::IDP_PROP_NAME, idp.getName().c_str());
        throw ex;
    }

    NormalizedIdentity identity = m_mapper->mapIdentity(attributes, idp);
    identity.setSessionIndex(response.sessionIndex);
    Category::getInstance(SAMLAUTH_LOGCAT ".Backend").info("user (%s) authenticated via IdentityProvider (%s)", identity.getUserID().c_str(), idp.getName().c_str());
    return identity;
}

string SAMLBackend::getUserID(const NormalizedIdentity& identity) const
{
    return identity.getUserID();
}

ptree SAMLBackend::generateSettings(const IdentityProvider& idp, const GenericRequest* request) const
{
    return m_settings.toEngineSettings(idp, request);
}

pair<string,vector<string>> SAMLBackend::generateMetadata() const
{
    ptree settings = generateSettings(IdentityProvider::getPlaceholder());
    pair<string,vector<string>> metadata = m_engine->generateMetadata(settings);
    for (const string& e : metadata.second) {
        Category::getInstance(SAMLAUTH_LOGCAT ".Backend").error("metadata validation error: %s", e.c_str());
    }
    return metadata;
}

unique_ptr<SAMLBackend> SAMLBackend::newSAMLBackend(const ptree& pt)
{
    boost::optional<const ptree&> root = pt.get_child_optional(ROOT_ELEMENT_NAME);
    if (!root) {
        throw ConfigurationException(string("Backend configuration has no ") + ROOT_ELEMENT_NAME + " element.");
    }

    string type = root->get(string("<xmlattr>.") + ENGINE_PROP_NAME, "");
    if (type.empty()) {
        throw ConfigurationException(string(ROOT_ELEMENT_NAME) + " element requires an engine attribute.");
    }

    ServiceProviderSettings settings(root.get());
    unique_ptr<IdentityProviderRegistry> registry(new IdentityProviderRegistry(root.get()));
    unique_ptr<ProtocolEngine> engine(AuthConfig::getConfig().ProtocolEngineManager.newPlugin(type, root.get(), false));

    return unique_ptr<SAMLBackend>(new SAMLBackend(settings, move(registry), move(engine)));
}

unique_ptr<SAMLBackend> SAMLBackend::newSAMLBackend(const char* pathname)
{
    string path(pathname ? pathname : SAMLAUTH_BACKEND_CONFIG);
    AuthConfig::getConfig().getPathResolver().resolve(path, PathResolver::SAMLAUTH_CFG_FILE);

    if (!FileSupport::exists(path.c_str())) {
        throw ConfigurationException("Backend configuration (" + path + ") not found.");
    }
    Category::getInstance(SAMLAUTH_LOGCAT ".Config").info("loading backend configuration from (%s)", path.c_str());

    ptree pt;
    xml_parser::read_xml(path, pt, xml_parser::no_comments|xml_parser::trim_whitespace);
    return newSAMLBackend(pt);
}
