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
 * @file samlauth/binding/ProtocolEngine.h
 *
 * Interface to the SAML protocol engine that builds requests and verifies responses.
 */

#ifndef __samlauth_protengine_h__
#define __samlauth_protengine_h__

#include <samlauth/attribute/Attributes.h>

#include <utility>
#include <boost/property_tree/ptree_fwd.hpp>

namespace samlauth {

    class SAMLAUTH_API HTTPRequest;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Outcome of processing a SAML response.
     */
    struct SAMLAUTH_API ProcessedResponse {
        ProcessedResponse();

        /** True iff the engine authenticated the subject. */
        bool authenticated;

        /** Attributes from the assertion. */
        AttributeSet attributes;

        /** Subject NameID. */
        std::string nameID;

        /** Session index from the authentication statement, if any. */
        std::string sessionIndex;

        /** Error codes reported by the engine. */
        std::vector<std::string> errors;

        /** Description of the most recent error, if any. */
        std::string lastErrorReason;
    };

    /**
     * Interface to the SAML protocol engine that builds requests and verifies responses.
     *
     * <p>Signature verification, assertion validation and replay detection are
     * the engine's job. Every call receives the complete settings tree for the
     * identity provider involved.</p>
     */
    class SAMLAUTH_API ProtocolEngine
    {
        MAKE_NONCOPYABLE(ProtocolEngine);
    protected:
        ProtocolEngine();
    public:
        virtual ~ProtocolEngine();

        /**
         * Builds the URL that sends the user agent to the identity provider.
         *
         * @param request       the request initiating the login
         * @param settings      engine settings
         * @param relayState    RelayState to send with the request
         * @return  the redirect URL
         */
        virtual std::string login(
            const HTTPRequest& request, const boost::property_tree::ptree& settings, const char* relayState
            ) const=0;

        /**
         * Processes the response returned to the assertion consumer service.
         *
         * @param request   the request carrying the response
         * @param settings  engine settings
         * @return  the outcome
         */
        virtual ProcessedResponse processResponse(
            const HTTPRequest& request, const boost::property_tree::ptree& settings
            ) const=0;

        /**
         * Produces metadata describing this service provider.
         *
         * @param settings  engine settings
         * @return  the metadata document and any validation errors
         */
        virtual std::pair<std::string,std::vector<std::string>> generateMetadata(
            const boost::property_tree::ptree& settings
            ) const=0;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_protengine_h__ */
