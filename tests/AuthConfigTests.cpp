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
 * AuthConfigTests.cpp
 *
 * Unit tests for library config machinery and logging.
 */

#include "exceptions.h"
#include "AuthConfig.h"
#include "logging/Category.h"
#include "logging/LoggingService.h"

#include <cstring>
#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include <boost/property_tree/ini_parser.hpp>

using namespace boost::property_tree::ini_parser;
using namespace samlauth;
using namespace std;

// The ./ bypasses the usual path resolution for relative paths.
#define DATA_PATH "./data/"

namespace {

struct AC_Fixture {
    AC_Fixture() : data_path(DATA_PATH) {}
    string data_path;
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

BOOST_FIXTURE_TEST_CASE(AuthConfig_init_bad_path, AC_Fixture)
{
    BOOST_CHECK(!AuthConfig::getConfig().init(nullptr, (data_path + "missing.ini").c_str(), false));

    exceptionCheck checker("./data/missing.ini: cannot open file");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().init(nullptr, (data_path + "missing.ini").c_str(), true),
        ini_parser_error, checker.check_message);
}

BOOST_FIXTURE_TEST_CASE(AuthConfig_init_bad_format, AC_Fixture)
{
    exceptionCheck checker_unmatched("./data/unmatched-samlauth.ini(1): unmatched '['");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().init(nullptr, (data_path + "unmatched-samlauth.ini").c_str(), true),
        ini_parser_error, checker_unmatched.check_message);

    exceptionCheck checker_dupsection("./data/dupsection-samlauth.ini(4): duplicate section name");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().init(nullptr, (data_path + "dupsection-samlauth.ini").c_str(), true),
        ini_parser_error, checker_dupsection.check_message);

    exceptionCheck checker_noequals("./data/noequals-samlauth.ini(2): '=' character not found in line");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().init(nullptr, (data_path + "noequals-samlauth.ini").c_str(), true),
        ini_parser_error, checker_noequals.check_message);

    exceptionCheck checker_dupproperty("./data/dupproperty-samlauth.ini(3): duplicate key name");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().init(nullptr, (data_path + "dupproperty-samlauth.ini").c_str(), true),
        ini_parser_error, checker_dupproperty.check_message);

    exceptionCheck checker_nokey("./data/nokey-samlauth.ini(2): key expected");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().init(nullptr, (data_path + "nokey-samlauth.ini").c_str(), true),
        ini_parser_error, checker_nokey.check_message);
}

BOOST_FIXTURE_TEST_CASE(AuthConfig_init_bad_logging_type, AC_Fixture)
{
    exceptionCheck checker("Unknown LoggingService plugin type.");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().init(nullptr, (data_path + "badtype-samlauth.ini").c_str(), true),
        invalid_argument, checker.check_message);
    BOOST_CHECK(!AuthConfig::getConfig().init(nullptr, (data_path + "badtype-samlauth.ini").c_str(), false));
}

BOOST_AUTO_TEST_CASE(AuthConfig_term_without_init)
{
    exceptionCheck checker_term("Library terminated without initialization.");
    BOOST_CHECK_EXCEPTION(AuthConfig::getConfig().term(),
        runtime_error, checker_term.check_message);
}

BOOST_AUTO_TEST_CASE(AuthConfig_logging_without_init)
{
    BOOST_CHECK_THROW(AuthConfig::getConfig().getLoggingService(), logic_error);
}

BOOST_FIXTURE_TEST_CASE(AuthConfig_init_console, AC_Fixture)
{
    BOOST_CHECK(AuthConfig::getConfig().init(nullptr, (data_path + "console-samlauth.ini").c_str(), true));

    Category& log = Category::getInstance(SAMLAUTH_LOGCAT ".Config");
    BOOST_CHECK_EQUAL(log.getName(), SAMLAUTH_LOGCAT ".Config");
    BOOST_CHECK(log.isInfoEnabled());
    BOOST_CHECK(!log.isDebugEnabled());
    BOOST_CHECK(Category::getInstance(SAMLAUTH_LOGCAT ".Backend").isDebugEnabled());
    BOOST_CHECK_EQUAL(&log, &Category::getInstance(SAMLAUTH_LOGCAT ".Config"));

    AuthConfig::getConfig().term();
}

BOOST_FIXTURE_TEST_CASE(AuthConfig_init_refcount, AC_Fixture)
{
    BOOST_CHECK(AuthConfig::getConfig().init(nullptr, (data_path + "console-samlauth.ini").c_str(), true));
    BOOST_CHECK(AuthConfig::getConfig().init(nullptr, (data_path + "missing.ini").c_str(), true));
    AuthConfig::getConfig().term();

    // Still initialized after one term.
    BOOST_CHECK_NO_THROW(AuthConfig::getConfig().getLoggingService());
    AuthConfig::getConfig().term();
    BOOST_CHECK_THROW(AuthConfig::getConfig().getLoggingService(), logic_error);
}

BOOST_FIXTURE_TEST_CASE(AuthConfig_init_syslog, AC_Fixture)
{
    BOOST_CHECK(AuthConfig::getConfig().init(nullptr, (data_path + "syslog-samlauth.ini").c_str(), true));
    Category::getInstance(SAMLAUTH_LOGCAT ".Config").info("syslog test message");
    AuthConfig::getConfig().term();
}

BOOST_FIXTURE_TEST_CASE(AuthConfig_init_file, AC_Fixture)
{
    BOOST_CHECK(AuthConfig::getConfig().init(nullptr, (data_path + "file-samlauth.ini").c_str(), true));
    Category::getInstance(SAMLAUTH_LOGCAT ".Config").debug("file test message");
    AuthConfig::getConfig().term();
}
