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
 * @file samlauth/SAMLConstants.h
 *
 * SAML protocol and attribute naming constants.
 */

#ifndef __samlauth_constants_h__
#define __samlauth_constants_h__

#include <samlauth/base.h>

/**
 * SAML protocol and attribute naming constants.
 */
namespace samlauthconstants {

    /** HTTP-Redirect binding (urn:oasis:names:tc:SAML:2.0:bindings:HTTP-Redirect) */
    extern SAMLAUTH_API const char SAML20_BINDING_HTTP_REDIRECT[];

    /** HTTP-POST binding (urn:oasis:names:tc:SAML:2.0:bindings:HTTP-POST) */
    extern SAMLAUTH_API const char SAML20_BINDING_HTTP_POST[];

    /** Key under which the subject NameID is added to an attribute set ("name_id") */
    extern SAMLAUTH_API const char NAMEID_ATTRIBUTE[];

    /** commonName (urn:oid:2.5.4.3) */
    extern SAMLAUTH_API const char OID_CN[];

    /** givenName (urn:oid:2.5.4.42) */
    extern SAMLAUTH_API const char OID_GIVENNAME[];

    /** surname (urn:oid:2.5.4.4) */
    extern SAMLAUTH_API const char OID_SURNAME[];

    /** uid (urn:oid:0.9.2342.19200300.100.1.1) */
    extern SAMLAUTH_API const char OID_UID[];

    /** mail (urn:oid:0.9.2342.19200300.100.1.3) */
    extern SAMLAUTH_API const char OID_MAIL[];

    /** eduPersonPrincipalName (urn:oid:1.3.6.1.4.1.5923.1.1.1.6) */
    extern SAMLAUTH_API const char OID_EPPN[];

    /** eduPersonEntitlement (urn:oid:1.3.6.1.4.1.5923.1.1.1.7) */
    extern SAMLAUTH_API const char OID_EDUPERSON_ENTITLEMENT[];
};

#endif /* __samlauth_constants_h__ */
