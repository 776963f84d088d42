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
 * @file samlauth/io/HTTPRequest.h
 *
 * Interface to HTTP requests handled by the backend.
 */

#ifndef __samlauth_httpreq_h__
#define __samlauth_httpreq_h__

#include <samlauth/io/GenericRequest.h>

#include <memory>

namespace samlauth {

    class SAMLAUTH_API CGIParser;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Interface to HTTP requests handled by the backend.
     *
     * <p>To supply information from the surrounding web server environment,
     * a shim must be supplied in the form of this interface to adapt the
     * library to different server APIs.</p>
     *
     * <p>Parameters are parsed on first use from the query string and, for
     * url-encoded POST requests, from the body.</p>
     *
     * <p>This interface need not be threadsafe.</p>
     */
    class SAMLAUTH_API HTTPRequest : public GenericRequest {
    protected:
        HTTPRequest();
    public:
        virtual ~HTTPRequest();

        bool isSecure() const;
        bool isDefaultPort() const;
        const char* getParameter(const char* name) const;
        std::vector<const char*>::size_type getParameters(const char* name, std::vector<const char*>& values) const;

        /**
         * Returns the HTTP method of the request (GET, POST, etc.)
         *
         * @return the HTTP method
         */
        virtual const char* getMethod() const=0;

        /**
         * Returns the HTTP query string appened to the request. The query
         * string is returned without any decoding applied, everything found
         * after the ? delimiter.
         *
         * @return the query string
         */
        virtual const char* getQueryString() const=0;

    private:
        mutable std::unique_ptr<CGIParser> m_parser;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_httpreq_h__ */
