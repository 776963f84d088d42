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
 * DummyRequest.h
 *
 * Mock HTTPRequest class for unit tests.
 */

#include "io/HTTPRequest.h"

#include <string>

namespace samlauth {

    class DummyRequest : public HTTPRequest {
    public:
        DummyRequest(const char* query=nullptr)
            : m_method("GET"), m_scheme("https"), m_hostname("sp.example.org"), m_port(443),
                m_query(query ? query : "") {
        }
        const char* getMethod() const { return m_method.c_str(); }
        const char* getScheme() const { return m_scheme.c_str(); }
        const char* getHostname() const { return m_hostname.c_str(); }
        int getPort() const { return m_port; }
        std::string getContentType() const { return m_contentType; }
        long getContentLength() const { return m_body.empty() ? -1 : static_cast<long>(m_body.length()); }
        const char* getQueryString() const { return m_query.c_str(); }
        const char* getRequestBody() const { return m_body.empty() ? nullptr : m_body.c_str(); }

        /** Turns the request into a form POST carrying the supplied body. */
        void setPost(const char* body) {
            m_method = "POST";
            m_contentType = "application/x-www-form-urlencoded";
            m_body = body ? body : "";
        }

        std::string m_method;
        std::string m_scheme;
        std::string m_hostname;
        int m_port;
        std::string m_query;
        std::string m_contentType;
        std::string m_body;
    };

};
