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
 * ClaimsMapperTests.cpp
 *
 * Unit tests for mapping attributes onto user identities.
 */

#include "exceptions.h"
#include "AuthConfig.h"
#include "SAMLConstants.h"
#include "attribute/ClaimsMapper.h"
#include "idp/IdentityProvider.h"

#include <cstring>
#include <boost/test/unit_test.hpp>

using namespace samlauth;
using namespace samlauthconstants;
using namespace std;

#define DATA_PATH "./data/"

namespace {

struct CM_Fixture {
    CM_Fixture() : testshib("testshib", "https://idp.testshib.org/idp/shibboleth",
            "https://idp.testshib.org/idp/profile/SAML2/Redirect/SSO", "MIIEDjCCAvagAwIBAgIBADANBgkqhkiG9w0B") {
        AuthConfig::getConfig().init(nullptr, DATA_PATH "console-samlauth.ini", true);
    }
    ~CM_Fixture() {
        AuthConfig::getConfig().term();
    }

    IdentityProvider testshib;
};

class exceptionCheck {
public:
    exceptionCheck(const string& msg) : m_msg(msg) {}
    bool check_message(const exception& e) {
        return strstr(e.what(), m_msg.c_str()) != nullptr;
    }
private:
    string m_msg;
};

};

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_permanent_id, CM_Fixture)
{
    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes[OID_UID].push_back("alice123");

    BOOST_CHECK_EQUAL(mapper.extractPermanentId(attributes, testshib), "alice123");

    NormalizedIdentity identity = mapper.mapIdentity(attributes, testshib);
    BOOST_CHECK_EQUAL(identity.getIdentityProviderName(), "testshib");
    BOOST_CHECK_EQUAL(identity.getPermanentID(), "alice123");
    BOOST_CHECK_EQUAL(identity.getUserID(), "testshib:alice123");
    BOOST_CHECK_EQUAL(identity.getProfile().username.get(), "alice123");
    BOOST_CHECK_EQUAL(identity.getAttributes().size(), 1);
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_first_value, CM_Fixture)
{
    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes[OID_UID].push_back("first");
    attributes[OID_UID].push_back("second");
    attributes[OID_MAIL].push_back("a@example.org");
    attributes[OID_MAIL].push_back("b@example.org");

    BOOST_CHECK_EQUAL(mapper.extractPermanentId(attributes, testshib), "first");
    BOOST_CHECK_EQUAL(mapper.mapProfile(attributes, testshib).email.get(), "a@example.org");
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_missing_permanent_id, CM_Fixture)
{
    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes[OID_MAIL].push_back("alice@example.org");

    exceptionCheck checker("Permanent ID attribute (urn:oid:0.9.2342.19200300.100.1.1) missing");
    BOOST_CHECK_EXCEPTION(mapper.extractPermanentId(attributes, testshib), MissingAttributeException, checker.check_message);
    BOOST_CHECK_THROW(mapper.mapIdentity(attributes, testshib), AuthFailedException);

    // Present but empty is the same as absent.
    attributes[OID_UID];
    try {
        mapper.extractPermanentId(attributes, testshib);
        BOOST_FAIL("expected MissingAttributeException");
    }
    catch (const MissingAttributeException& ex) {
        BOOST_CHECK_EQUAL(ex.getStatusCode(), 401);
        BOOST_CHECK_EQUAL(ex.getProperty(AuthException::IDP_PROP_NAME), "testshib");
        BOOST_CHECK_EQUAL(ex.getProperty(AuthException::ATTRIBUTE_PROP_NAME), OID_UID);
    }
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_profile_email_only, CM_Fixture)
{
    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes[OID_MAIL].push_back("alice@example.org");

    UserProfile profile = mapper.mapProfile(attributes, testshib);
    BOOST_CHECK(!profile.fullName);
    BOOST_CHECK(!profile.firstName);
    BOOST_CHECK(!profile.lastName);
    BOOST_CHECK(!profile.username);
    BOOST_REQUIRE(profile.email);
    BOOST_CHECK_EQUAL(profile.email.get(), "alice@example.org");
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_profile_full, CM_Fixture)
{
    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes[OID_CN].push_back("Alice Smith");
    attributes[OID_GIVENNAME].push_back("Alice");
    attributes[OID_SURNAME].push_back("Smith");
    attributes[OID_UID].push_back("alice123");
    attributes[OID_MAIL].push_back("alice@example.org");

    UserProfile profile = mapper.mapProfile(attributes, testshib);
    BOOST_CHECK_EQUAL(profile.fullName.get(), "Alice Smith");
    BOOST_CHECK_EQUAL(profile.firstName.get(), "Alice");
    BOOST_CHECK_EQUAL(profile.lastName.get(), "Smith");
    BOOST_CHECK_EQUAL(profile.username.get(), "alice123");
    BOOST_CHECK_EQUAL(profile.email.get(), "alice@example.org");
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_overrides, CM_Fixture)
{
    map<IdentityProvider::AttributeRole,string> overrides;
    overrides[IdentityProvider::USERNAME] = "custom:attr";
    overrides[IdentityProvider::USER_PERMANENT_ID] = OID_EPPN;
    IdentityProvider other("other", "https://idp.example.org/idp", "https://idp.example.org/SSO", "MIIcert", nullptr, overrides);

    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes["custom:attr"].push_back("asmith");
    attributes[OID_UID].push_back("alice123");
    attributes[OID_EPPN].push_back("alice@example.org");

    BOOST_CHECK_EQUAL(mapper.extractPermanentId(attributes, other), "alice@example.org");
    BOOST_CHECK_EQUAL(mapper.mapProfile(attributes, other).username.get(), "asmith");
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_distinct_providers, CM_Fixture)
{
    IdentityProvider idpA("idpA", "https://a.example.org/idp", "https://a.example.org/SSO", "MIIa");
    IdentityProvider idpB("idpB", "https://b.example.org/idp", "https://b.example.org/SSO", "MIIb");

    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes[OID_UID].push_back("u1");

    string a = mapper.mapIdentity(attributes, idpA).getUserID();
    string b = mapper.mapIdentity(attributes, idpB).getUserID();
    BOOST_CHECK_EQUAL(a, "idpA:u1");
    BOOST_CHECK_EQUAL(b, "idpB:u1");
    BOOST_CHECK_NE(a, b);
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_empty_permanent_id, CM_Fixture)
{
    map<IdentityProvider::AttributeRole,string> overrides;
    overrides[IdentityProvider::USER_PERMANENT_ID] = NAMEID_ATTRIBUTE;
    IdentityProvider byNameID("byNameID", "https://idp.example.org/idp", "https://idp.example.org/SSO", "MIIcert", nullptr, overrides);

    ClaimsMapper mapper;
    AttributeSet attributes;
    attributes[NAMEID_ATTRIBUTE].push_back("");

    exceptionCheck checker("Permanent ID attribute (name_id) missing");
    BOOST_CHECK_EXCEPTION(mapper.mapIdentity(attributes, byNameID), MissingAttributeException, checker.check_message);

    attributes[OID_UID].push_back("");
    attributes[OID_UID].push_back("alice123");
    BOOST_CHECK_THROW(mapper.extractPermanentId(attributes, testshib), MissingAttributeException);
}

BOOST_FIXTURE_TEST_CASE(ClaimsMapper_reinit, CM_Fixture)
{
    ClaimsMapper mapper;

    AuthConfig::getConfig().term();
    AuthConfig::getConfig().init(nullptr, DATA_PATH "console-samlauth.ini", true);

    AttributeSet attributes;
    attributes[OID_UID].push_back("alice123");
    BOOST_CHECK_EQUAL(mapper.mapIdentity(attributes, testshib).getUserID(), "testshib:alice123");
    BOOST_CHECK_THROW(mapper.extractPermanentId(AttributeSet(), testshib), MissingAttributeException);
}

BOOST_AUTO_TEST_CASE(ClaimsMapper_before_init)
{
    ClaimsMapper mapper;
    IdentityProvider idp("idpA", "https://a.example.org/idp", "https://a.example.org/SSO", "MIIa");

    AttributeSet attributes;
    attributes[OID_MAIL].push_back("alice@example.org");
    BOOST_CHECK_EQUAL(mapper.mapProfile(attributes, idp).email.get(), "alice@example.org");
}
