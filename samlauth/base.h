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
 * @file samlauth/base.h
 *
 * Base header file definitions
 * Must be included prior to including any other header
 */

#ifndef __samlauth_base_h__
#define __samlauth_base_h__

// Windows and GCC4 Symbol Visibility Macros
#ifdef WIN32
  #define SAMLAUTH_IMPORT __declspec(dllimport)
  #define SAMLAUTH_EXPORT __declspec(dllexport)
  #define SAMLAUTH_DLLLOCAL
  #define SAMLAUTH_DLLPUBLIC
#else
  #define SAMLAUTH_IMPORT
  #ifdef GCC_HASCLASSVISIBILITY
    #define SAMLAUTH_EXPORT __attribute__ ((visibility("default")))
    #define SAMLAUTH_DLLLOCAL __attribute__ ((visibility("hidden")))
    #define SAMLAUTH_DLLPUBLIC __attribute__ ((visibility("default")))
  #else
    #define SAMLAUTH_EXPORT
    #define SAMLAUTH_DLLLOCAL
    #define SAMLAUTH_DLLPUBLIC
  #endif
#endif

// Define SAMLAUTH_API for DLL builds
#ifdef SAMLAUTH_EXPORTS
  #define SAMLAUTH_API SAMLAUTH_EXPORT
#else
  #define SAMLAUTH_API SAMLAUTH_IMPORT
#endif

// Throwable classes must always be visible on GCC in all binaries
#ifdef WIN32
  #define SAMLAUTH_EXCEPTIONAPI(api) api
#elif defined(GCC_HASCLASSVISIBILITY)
  #define SAMLAUTH_EXCEPTIONAPI(api) SAMLAUTH_EXPORT
#else
  #define SAMLAUTH_EXCEPTIONAPI(api)
#endif

/**
 * Blocks copy c'tor and assignment operator for a class.
 */
#define MAKE_NONCOPYABLE(type) \
    private: \
        type(const type&); \
        type& operator=(const type&)

/** Logging category for library functions. */
#define SAMLAUTH_LOGCAT "SAMLAuth"

/** Default name of library configuration file. */
#define SAMLAUTH_CONFIG "samlauth.ini"

/** Default name of backend configuration file. */
#define SAMLAUTH_BACKEND_CONFIG "saml-backend.xml"

#ifdef WIN32

/** Default prefix for installation (used to resolve relative paths). */
#define SAMLAUTH_PREFIX   "c:/opt/samlauth"

/** Log directory for installation (used to resolve relative paths). */
#define SAMLAUTH_LOGDIR   "var/log"

/** Configuration directory for installation (used to resolve relative paths). */
#define SAMLAUTH_CFGDIR   "etc"

#else
# include <samlauth/paths.h>
#endif

#endif /* __samlauth_base_h__ */
