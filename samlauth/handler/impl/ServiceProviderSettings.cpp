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
 * ServiceProviderSettings.cpp
 *
 * Settings describing this service provider.
 */

#include "internal.h"
#include "exceptions.h"
#include "SAMLConstants.h"
#include "handler/ServiceProviderSettings.h"
#include "idp/IdentityProvider.h"
#include "io/GenericRequest.h"
#include "logging/Category.h"
#include "util/Misc.h"

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace samlauth;
using namespace samlauthconstants;
using namespace boost::property_tree;
using namespace std;

const char ServiceProviderSettings::DEFAULT_REDIRECT_URI[] = "/complete/saml/";
const char ServiceProviderSettings::METADATA_CACHE_DURATION_PROP_NAME[] = "metadataCacheDuration";

namespace {
    static const char XMLATTR[] = "<xmlattr>";

    string getTrimmed(const ptree& pt, const char* path) {
        string s(pt.get(path, ""));
        boost::trim(s);
        return s;
    }

    void loadContact(const ptree& pt, const char* element, ContactPerson& contact) {
        boost::optional<const ptree&> attrs = pt.get_child_optional(string(element) + '.' + XMLATTR);
        if (attrs) {
            contact.givenName = attrs->get("givenName", "");
            contact.emailAddress = attrs->get("emailAddress", "");
        }
    }

    void loadAttributes(const ptree& pt, map<string,string>& dest) {
        boost::optional<const ptree&> attrs = pt.get_child_optional(XMLATTR);
        if (attrs) {
            for (const auto& a : attrs.get()) {
                dest[a.first] = a.second.data();
            }
        }
    }
};

ServiceProviderSettings::ServiceProviderSettings() : redirectURI(DEFAULT_REDIRECT_URI)
{
}

ServiceProviderSettings::ServiceProviderSettings(const ptree& pt) : redirectURI(DEFAULT_REDIRECT_URI)
{
    boost::optional<const ptree&> sp = pt.get_child_optional("ServiceProvider");
    if (sp) {
        entityID = sp->get("<xmlattr>.entityID", "");
        redirectURI = sp->get("<xmlattr>.redirectURI", DEFAULT_REDIRECT_URI);
        x509Certificate = getTrimmed(sp.get(), "Certificate");
        privateKey = getTrimmed(sp.get(), "PrivateKey");
        for (const auto& child : sp.get()) {
            if (child.first == "NameIDFormat") {
                string format(child.second.data());
                boost::trim(format);
                if (!format.empty())
                    nameIDFormats.push_back(format);
            }
            else if (child.first == "Extra") {
                loadAttributes(child.second, extra);
            }
        }
    }

    for (const auto& child : pt) {
        if (child.first == "Organization") {
            string lang = child.second.get("<xmlattr>.lang", "en-US");
            OrganizationInfo& info = organization[lang];
            info.name = child.second.get("<xmlattr>.name", "");
            info.displayName = child.second.get("<xmlattr>.displayname", "");
            info.url = child.second.get("<xmlattr>.url", "");
        }
        else if (child.first == "Security") {
            loadAttributes(child.second, security);
        }
    }

    loadContact(pt, "TechnicalContact", technicalContact);
    loadContact(pt, "SupportContact", supportContact);
}

ServiceProviderSettings::~ServiceProviderSettings()
{
}

void ServiceProviderSettings::validate() const
{
    if (entityID.empty()) {
        throw ConfigurationException("ServiceProvider requires an entityID.");
    }

    map<string,string>::const_iterator duration = security.find(METADATA_CACHE_DURATION_PROP_NAME);
    if (duration != security.end() && parseISODuration(duration->second) < 0) {
        throw ConfigurationException("Invalid metadataCacheDuration (" + duration->second + "), must be an ISO 8601 duration.");
    }

    if (x509Certificate.empty() || privateKey.empty()) {
        Category::getInstance(SAMLAUTH_LOGCAT ".Config").warn(
            "ServiceProvider (%s) has no certificate or private key, requests will be unsigned", entityID.c_str()
            );
    }
}

ptree ServiceProviderSettings::toEngineSettings(const IdentityProvider& idp, const GenericRequest* request) const
{
    string acs(redirectURI);
    if (request)
        request->absolutize(acs);

    ptree settings;
    settings.put("strict", true);
    settings.put("debug", true);
    settings.put_child("idp", idp.getMetadataDescriptor());

    settings.put("sp.entityId", entityID);
    settings.put("sp.x509cert", x509Certificate);
    settings.put("sp.privateKey", privateKey);
    settings.put("sp.assertionConsumerService.url", acs);
    settings.put("sp.assertionConsumerService.binding", SAML20_BINDING_HTTP_POST);
    ptree& formats = settings.put_child("sp.NameIDFormats", ptree());
    for (const string& f : nameIDFormats) {
        formats.add("NameIDFormat", f);
    }
    for (const auto& e : extra) {
        settings.put("sp." + e.first, e.second);
    }

    settings.put("security.metadataValidUntil", "");
    settings.put("security.metadataCacheDuration", "P10D");
    for (const auto& s : security) {
        settings.put("security." + s.first, s.second);
    }

    for (const auto& org : organization) {
        ptree& info = settings.put_child(ptree::path_type("organization/" + org.first, '/'), ptree());
        info.put("name", org.second.name);
        info.put("displayname", org.second.displayName);
        info.put("url", org.second.url);
    }

    settings.put("contactPerson.technical.givenName", technicalContact.givenName);
    settings.put("contactPerson.technical.emailAddress", technicalContact.emailAddress);
    settings.put("contactPerson.support.givenName", supportContact.givenName);
    settings.put("contactPerson.support.emailAddress", supportContact.emailAddress);

    return settings;
}
