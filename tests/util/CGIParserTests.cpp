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
 * util/CGIParserTests.cpp
 *
 * Unit tests for request parameter parsing and URL encoding.
 */

#include "AuthConfig.h"
#include "util/CGIParser.h"
#include "util/URLEncoder.h"

#include "DummyRequest.h"

#include <boost/test/unit_test.hpp>

using namespace samlauth;
using namespace std;

BOOST_AUTO_TEST_CASE(CGIParser_query)
{
    DummyRequest request("idp=testshib&next=%2Fhome%3Fa%3Db&flag&name=Alice+Smith&idp=other");

    BOOST_CHECK_EQUAL(request.getParameter("idp"), "testshib");
    BOOST_CHECK_EQUAL(request.getParameter("next"), "/home?a=b");
    BOOST_CHECK_EQUAL(request.getParameter("flag"), "");
    BOOST_CHECK_EQUAL(request.getParameter("name"), "Alice Smith");
    BOOST_CHECK(request.getParameter("missing") == nullptr);

    vector<const char*> values;
    BOOST_CHECK_EQUAL(request.getParameters("idp", values), 2);
    BOOST_CHECK_EQUAL(values[0], "testshib");
    BOOST_CHECK_EQUAL(values[1], "other");
}

BOOST_AUTO_TEST_CASE(CGIParser_post)
{
    DummyRequest request("RelayState=fromquery");
    request.setPost("SAMLResponse=PHNhbWxwOlJlc3BvbnNlPg%3D%3D&RelayState=testshib");

    CGIParser parser(request);
    pair<CGIParser::walker,CGIParser::walker> bounds = parser.getParameters("RelayState");
    BOOST_REQUIRE(bounds.first != bounds.second);
    BOOST_CHECK_EQUAL(bounds.first->second, "fromquery");
    ++bounds.first;
    BOOST_REQUIRE(bounds.first != bounds.second);
    BOOST_CHECK_EQUAL(bounds.first->second, "testshib");

    bounds = parser.getParameters("SAMLResponse");
    BOOST_REQUIRE(bounds.first != bounds.second);
    BOOST_CHECK_EQUAL(bounds.first->second, "PHNhbWxwOlJlc3BvbnNlPg==");

    CGIParser queryOnly(request, true);
    bounds = queryOnly.getParameters("SAMLResponse");
    BOOST_CHECK(bounds.first == bounds.second);

    bounds = queryOnly.getParameters(nullptr);
    BOOST_CHECK_EQUAL(distance(bounds.first, bounds.second), 1);
}

BOOST_AUTO_TEST_CASE(CGIParser_post_wrong_type)
{
    DummyRequest request;
    request.setPost("RelayState=testshib");
    request.m_contentType = "text/xml";

    BOOST_CHECK(request.getParameter("RelayState") == nullptr);
}

BOOST_AUTO_TEST_CASE(URLEncoder_encode)
{
    const URLEncoder& enc = AuthConfig::getConfig().getURLEncoder();

    BOOST_CHECK_EQUAL(enc.encode("testshib"), "testshib");
    BOOST_CHECK_EQUAL(enc.encode("a b&c=d/e"), "a%20b%26c%3Dd%2Fe");
    BOOST_CHECK_EQUAL(enc.encode(nullptr), "");

    string s("a%20b%26c+d");
    enc.decode(s);
    BOOST_CHECK_EQUAL(s, "a b&c d");
}

BOOST_AUTO_TEST_CASE(Request_absolutize)
{
    DummyRequest request;
    string url("/complete/saml/");
    request.absolutize(url);
    BOOST_CHECK_EQUAL(url, "https://sp.example.org/complete/saml/");

    request.m_scheme = "http";
    request.m_port = 8080;
    url = "/complete/saml/";
    request.absolutize(url);
    BOOST_CHECK_EQUAL(url, "http://sp.example.org:8080/complete/saml/");

    url = "https://elsewhere.example.org/acs";
    request.absolutize(url);
    BOOST_CHECK_EQUAL(url, "https://elsewhere.example.org/acs");
}

BOOST_AUTO_TEST_CASE(URLEncoder_decode)
{
    const URLEncoder& enc = AuthConfig::getConfig().getURLEncoder();

    string s("a%00junk");
    enc.decode(s);
    BOOST_CHECK_EQUAL(s.length(), 6);
    BOOST_CHECK(s == string("a\0junk", 6));

    // Bytes above 0x7F pass through, and a trailing or malformed escape is kept literally.
    s = "caf\xc3\xa9%\xc3%4";
    enc.decode(s);
    BOOST_CHECK_EQUAL(s, "caf\xc3\xa9%\xc3%4");

    s = "%C3%A9+x";
    enc.decode(s);
    BOOST_CHECK_EQUAL(s, "\xc3\xa9 x");

    char buf[] = "%\xe9\xe9ok%41";
    enc.decode(buf);
    BOOST_CHECK_EQUAL(string(buf), "%\xe9\xe9okA");
}

BOOST_AUTO_TEST_CASE(CGIParser_embedded_nul)
{
    DummyRequest request("RelayState=a%00junk&idp=test%00shib&next=%2Fhome");

    BOOST_CHECK(request.getParameter("RelayState") == nullptr);
    BOOST_CHECK(request.getParameter("idp") == nullptr);
    BOOST_CHECK_EQUAL(request.getParameter("next"), "/home");
}
