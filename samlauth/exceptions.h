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
 * @file samlauth/exceptions.h
 *
 * Exception classes.
 */

#ifndef __samlauth_exceptions_h__
#define __samlauth_exceptions_h__

#include <samlauth/base.h>
#include <samlauth/logging/Priority.h>

#include <exception>
#include <string>
#include <unordered_map>

/**
 * Declares an exception subclass.
 *
 * @param name      the exception class
 * @param linkage   linkage specification for class
 * @param base      the base class
 */
#define DECL_SAMLAUTH_EXCEPTION(name,linkage,base) \
    class linkage name : public base { \
    public: \
        name(const char* msg=nullptr) : base(msg) {} \
        name(const std::string& msg) : base(msg) {} \
        virtual ~name() noexcept {} \
    }

/**
 * Declares an exception subclass with its own default HTTP status code.
 *
 * @param name      the exception class
 * @param linkage   linkage specification for class
 * @param base      the base class
 * @param status    HTTP status code
 */
#define DECL_SAMLAUTH_STATUS_EXCEPTION(name,linkage,base,status) \
    class linkage name : public base { \
    public: \
        name(const char* msg=nullptr) : base(msg) { setStatusCode(status); } \
        name(const std::string& msg) : base(msg) { setStatusCode(status); } \
        virtual ~name() noexcept {} \
    }

namespace samlauth {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4250 4251 )
#endif

    class SAMLAUTH_API Category;

    /**
     * Base exception class, supports attaching additional data for error handling.
     */
    class SAMLAUTH_EXCEPTIONAPI(SAMLAUTH_API) AuthException : public std::exception
    {
    public:
        virtual ~AuthException() noexcept;

        /**
         * Constructs an exception using a message.
         *
         * @param msg   error message
         */
        AuthException(const char* msg=nullptr);

        /**
         * Constructs an exception using a message.
         *
         * @param msg   error message
         */
        AuthException(const std::string& msg);

        /**
         * Returns the error message.
         *
         * @return  the message
         */
        const char* what() const noexcept;

        /**
         * Gets the HTTP status code for the error condition.
         *
         * @return status code
         */
        int getStatusCode() const noexcept;

        /**
         * Sets the HTTP status code for the error condition if not the default of 500.
         *
         * @param code status code
         */
        void setStatusCode(int code) noexcept;

        /**
         * Gets the properties attached to this exception.
         *
         * @return property map
         */
        const std::unordered_map<std::string,std::string>& getProperties() const noexcept;

        /**
         * Gets a specific property attached to this exception.
         *
         * @param name property name
         *
         * @return property value or null
         */
        const char* getProperty(const char* name) const noexcept;

        /**
         * Attach a set of named properties to the exception.
         *
         * @param props properties to attach
         */
        void addProperties(const std::unordered_map<std::string,std::string>& props);

        /**
         * Attach a single named property.
         *
         * @param name  the property name
         * @param value the property value
         */
        void addProperty(const char* name, const char* value);

        /**
         * Returns a set of query string name/value pairs, URL-encoded, representing the
         * exception's properties.
         *
         * @return  the query string representation
         */
        std::string toQueryString() const;

        /**
         * Log the error and its properties to a category.
         *
         * @param log       logging category
         * @param priority  logging level
         */
        void log(Category& log, Priority::Value priority=Priority::AUTH_ERROR) const;

        // Defined properties.
        static const char IDP_PROP_NAME[];
        static const char ATTRIBUTE_PROP_NAME[];

    private:
        int m_status;
        std::string m_msg;
        std::unordered_map<std::string,std::string> m_props;
    };

    /** Misconfigured provider records or settings. */
    DECL_SAMLAUTH_EXCEPTION(ConfigurationException,SAMLAUTH_EXCEPTIONAPI(SAMLAUTH_API),samlauth::AuthException);

    /** Login requested for a provider name that is not configured. */
    DECL_SAMLAUTH_STATUS_EXCEPTION(UnknownProviderException,SAMLAUTH_EXCEPTIONAPI(SAMLAUTH_API),samlauth::AuthException,400);

    /** Base for failures that leave the user unauthenticated. */
    DECL_SAMLAUTH_STATUS_EXCEPTION(AuthFailedException,SAMLAUTH_EXCEPTIONAPI(SAMLAUTH_API),samlauth::AuthException,401);

    /** A required attribute is absent from the response. */
    DECL_SAMLAUTH_EXCEPTION(MissingAttributeException,SAMLAUTH_EXCEPTIONAPI(SAMLAUTH_API),samlauth::AuthFailedException);

    /** The protocol engine reported errors or did not authenticate the user. */
    DECL_SAMLAUTH_EXCEPTION(ProtocolValidationException,SAMLAUTH_EXCEPTIONAPI(SAMLAUTH_API),samlauth::AuthFailedException);

    /** The post-authentication check refused the login. */
    DECL_SAMLAUTH_STATUS_EXCEPTION(PolicyRejectedException,SAMLAUTH_EXCEPTIONAPI(SAMLAUTH_API),samlauth::AuthException,403);

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlauth_exceptions_h__ */
