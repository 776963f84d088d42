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
 * ExceptionsTests.cpp
 *
 * Unit tests for the exception hierarchy.
 */

#include "exceptions.h"
#include "AuthConfig.h"
#include "logging/Category.h"

#include <boost/test/unit_test.hpp>

using namespace samlauth;
using namespace std;

#define DATA_PATH "./data/"

namespace {

struct Exception_Fixture {
    Exception_Fixture() {
        AuthConfig::getConfig().init(nullptr, DATA_PATH "console-samlauth.ini", true);
    }
    ~Exception_Fixture() {
        AuthConfig::getConfig().term();
    }
};

};

BOOST_AUTO_TEST_CASE(Exceptions_status)
{
    BOOST_CHECK_EQUAL(AuthException("x").getStatusCode(), 500);
    BOOST_CHECK_EQUAL(ConfigurationException("x").getStatusCode(), 500);
    BOOST_CHECK_EQUAL(UnknownProviderException("x").getStatusCode(), 400);
    BOOST_CHECK_EQUAL(AuthFailedException("x").getStatusCode(), 401);
    BOOST_CHECK_EQUAL(MissingAttributeException("x").getStatusCode(), 401);
    BOOST_CHECK_EQUAL(ProtocolValidationException("x").getStatusCode(), 401);
    BOOST_CHECK_EQUAL(PolicyRejectedException("x").getStatusCode(), 403);

    AuthException ex(string("custom"));
    ex.setStatusCode(503);
    BOOST_CHECK_EQUAL(ex.getStatusCode(), 503);
    BOOST_CHECK_EQUAL(ex.what(), "custom");
}

BOOST_AUTO_TEST_CASE(Exceptions_hierarchy)
{
    BOOST_CHECK_THROW(throw MissingAttributeException("missing"), AuthFailedException);
    BOOST_CHECK_THROW(throw ProtocolValidationException("invalid"), AuthFailedException);
    BOOST_CHECK_THROW(throw PolicyRejectedException("rejected"), AuthException);
    BOOST_CHECK_THROW(throw UnknownProviderException("unknown"), exception);
}

BOOST_FIXTURE_TEST_CASE(Exceptions_properties, Exception_Fixture)
{
    UnknownProviderException ex("Unknown IdentityProvider (no such)");
    BOOST_CHECK(ex.getProperties().empty());
    BOOST_CHECK(ex.getProperty(AuthException::IDP_PROP_NAME) == nullptr);
    BOOST_CHECK_EQUAL(ex.toQueryString(), "");

    ex.addProperty(AuthException::IDP_PROP_NAME, "no such");
    ex.addProperty(AuthException::ATTRIBUTE_PROP_NAME, "urn:oid:0.9.2342.19200300.100.1.1");
    BOOST_CHECK_EQUAL(ex.getProperty(AuthException::IDP_PROP_NAME), "no such");
    BOOST_CHECK_EQUAL(ex.toQueryString(), "attribute=urn%3Aoid%3A0.9.2342.19200300.100.1.1&idp=no%20such");

    unordered_map<string,string> more;
    more["idp"] = "testshib";
    ex.addProperties(more);
    BOOST_CHECK_EQUAL(ex.getProperties().size(), 2);
    BOOST_CHECK_EQUAL(ex.getProperty(AuthException::IDP_PROP_NAME), "testshib");

    ex.log(Category::getInstance(SAMLAUTH_LOGCAT ".Backend"));
}
