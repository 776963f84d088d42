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
 * samlidp.cpp
 *
 * IdentityProvider query tool layered on the backend configuration.
 */

#if defined (_MSC_VER) || defined(__BORLANDC__)
# include "config_win32.h"
#else
# include "config.h"
#endif

#ifdef WIN32
# define _CRT_NONSTDC_NO_DEPRECATE 1
# define _CRT_SECURE_NO_DEPRECATE 1
#endif

#include <samlauth/AuthConfig.h>
#include <samlauth/exceptions.h>
#include <samlauth/handler/ServiceProviderSettings.h>
#include <samlauth/idp/IdentityProviderRegistry.h>
#include <samlauth/util/PathResolver.h>
#include <samlauth/version.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

using namespace samlauth;
using namespace boost::property_tree;
using namespace std;

namespace {
    void usage()
    {
        cerr << "usage: samlidp [-c <backend config>] [-f <library config>] (-l | -i <IdP name> | -m | -v)" << endl;
    }

    void print(const ptree& pt, const char* rootName)
    {
        ptree doc;
        doc.add_child(rootName, pt);
        xml_parser::write_xml(cout, doc, xml_parser::xml_writer_make_settings<string>(' ', 2));
        cout << endl;
    }
}

int main(int argc,char* argv[])
{
    const char* c_param = nullptr;
    const char* f_param = nullptr;
    const char* i_param = nullptr;
    bool l_param = false;
    bool m_param = false;
    bool v_param = false;

    for (int i=1; i<argc; i++) {
        if (!strcmp(argv[i],"-c") && i+1<argc)
            c_param=argv[++i];
        else if (!strcmp(argv[i],"-f") && i+1<argc)
            f_param=argv[++i];
        else if (!strcmp(argv[i],"-i") && i+1<argc)
            i_param=argv[++i];
        else if (!strcmp(argv[i],"-l"))
            l_param=true;
        else if (!strcmp(argv[i],"-m"))
            m_param=true;
        else if (!strcmp(argv[i],"-v"))
            v_param=true;
    }

    if (v_param) {
        cout << "samlidp " << gSAMLAuthDotVersionStr << endl;
        return 0;
    }

    if (!l_param && !i_param && !m_param) {
        usage();
        return -1;
    }

    AuthConfig& conf = AuthConfig::getConfig();
    if (!conf.init(nullptr, f_param))
        return -10;

    int ret = 0;
    try {
        string path(c_param ? c_param : SAMLAUTH_BACKEND_CONFIG);
        conf.getPathResolver().resolve(path, PathResolver::SAMLAUTH_CFG_FILE);

        ptree pt;
        xml_parser::read_xml(path, pt, xml_parser::no_comments|xml_parser::trim_whitespace);
        const ptree& root = pt.get_child("SAMLAuth");

        ServiceProviderSettings settings(root);
        settings.validate();
        IdentityProviderRegistry registry(root);

        if (l_param) {
            for (const string& name : registry.getProviderNames()) {
                const IdentityProvider& idp = registry.resolve(name.c_str());
                cout << name << '\t' << idp.getEntityID() << endl;
            }
        }
        else {
            const IdentityProvider& idp = m_param ? IdentityProvider::getPlaceholder() : registry.resolve(i_param);
            print(idp.getMetadataDescriptor(), "IdentityProvider");
            print(settings.toEngineSettings(idp), "Settings");
        }
    }
    catch (const AuthException& ex) {
        cerr << "error: " << ex.what();
        if (!ex.getProperties().empty())
            cerr << " (" << ex.toQueryString() << ")";
        cerr << endl;
        ret = -20;
    }
    catch (const exception& ex) {
        cerr << "error: " << ex.what() << endl;
        ret = -20;
    }

    conf.term();
    return ret;
}
