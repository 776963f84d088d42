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
 * EntitlementPolicyTests.cpp
 *
 * Unit tests for the entitlement login check.
 */

#include "exceptions.h"
#include "AuthConfig.h"
#include "SAMLConstants.h"
#include "handler/EntitlementPolicy.h"
#include "idp/IdentityProvider.h"
#include "util/BoostPropertySet.h"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/test/unit_test.hpp>

using namespace samlauth;
using namespace samlauthconstants;
using namespace boost::property_tree;
using namespace std;

#define DATA_PATH "./data/"

namespace {

struct Policy_Fixture {
    Policy_Fixture() : idp("testshib", "https://idp.testshib.org/idp/shibboleth",
            "https://idp.testshib.org/idp/profile/SAML2/Redirect/SSO", "MIIEDjCCAvagAwIBAgIBADANBgkqhkiG9w0B") {
        AuthConfig::getConfig().init(nullptr, DATA_PATH "console-samlauth.ini", true);
        ini_parser::read_ini(DATA_PATH "handler/entitlement.ini", m_tree);
    }
    ~Policy_Fixture() {
        AuthConfig::getConfig().term();
    }

    IdentityProvider idp;
    ptree m_tree;
};

};

BOOST_FIXTURE_TEST_CASE(EntitlementPolicy_values, Policy_Fixture)
{
    vector<string> values;
    values.push_back("urn:mace:example.org:staff");
    EntitlementPolicy policy(values);
    BOOST_CHECK_EQUAL(policy.getAttribute(), OID_EDUPERSON_ENTITLEMENT);

    AttributeSet attributes;
    BOOST_CHECK(!policy(idp, attributes));

    attributes[OID_EDUPERSON_ENTITLEMENT].push_back("urn:mace:example.org:student");
    BOOST_CHECK(!policy(idp, attributes));

    attributes[OID_EDUPERSON_ENTITLEMENT].push_back("urn:mace:example.org:staff");
    BOOST_CHECK(policy(idp, attributes));

    // Values on a different attribute do not count.
    AttributeSet other;
    other[OID_UID].push_back("urn:mace:example.org:staff");
    BOOST_CHECK(!policy(idp, other));

    BOOST_CHECK_THROW(EntitlementPolicy policy((vector<string>())), ConfigurationException);
}

BOOST_FIXTURE_TEST_CASE(EntitlementPolicy_properties, Policy_Fixture)
{
    BoostPropertySet staffProps;
    staffProps.load(m_tree.get_child("staff"));
    EntitlementPolicy staff(staffProps);
    BOOST_CHECK_EQUAL(staff.getAttribute(), OID_EDUPERSON_ENTITLEMENT);
    BOOST_REQUIRE_EQUAL(staff.getValues().size(), 2);
    BOOST_CHECK_EQUAL(staff.getValues()[1], "urn:mace:example.org:faculty");

    AttributeSet attributes;
    attributes[OID_EDUPERSON_ENTITLEMENT].push_back("urn:mace:example.org:faculty");
    BOOST_CHECK(staff(idp, attributes));

    BoostPropertySet customProps;
    customProps.load(m_tree.get_child("custom"));
    EntitlementPolicy custom(customProps);
    BOOST_CHECK_EQUAL(custom.getAttribute(), "urn:oid:1.3.6.1.4.1.5923.1.1.1.1");
    BOOST_CHECK(!custom(idp, attributes));
    attributes["urn:oid:1.3.6.1.4.1.5923.1.1.1.1"].push_back("member");
    BOOST_CHECK(custom(idp, attributes));

    BoostPropertySet emptyProps;
    emptyProps.load(m_tree.get_child("empty"));
    BOOST_CHECK_THROW(EntitlementPolicy policy(emptyProps), ConfigurationException);
}
