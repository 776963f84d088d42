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
 * SAMLConstants.cpp
 *
 * SAML protocol and attribute naming constants.
 */

#include "internal.h"
#include "SAMLConstants.h"

using namespace samlauthconstants;

const char samlauthconstants::SAML20_BINDING_HTTP_REDIRECT[] = "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-Redirect";
const char samlauthconstants::SAML20_BINDING_HTTP_POST[] = "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-POST";

const char samlauthconstants::NAMEID_ATTRIBUTE[] = "name_id";

const char samlauthconstants::OID_CN[] = "urn:oid:2.5.4.3";
const char samlauthconstants::OID_GIVENNAME[] = "urn:oid:2.5.4.42";
const char samlauthconstants::OID_SURNAME[] = "urn:oid:2.5.4.4";
const char samlauthconstants::OID_UID[] = "urn:oid:0.9.2342.19200300.100.1.1";
const char samlauthconstants::OID_MAIL[] = "urn:oid:0.9.2342.19200300.100.1.3";
const char samlauthconstants::OID_EPPN[] = "urn:oid:1.3.6.1.4.1.5923.1.1.1.6";
const char samlauthconstants::OID_EDUPERSON_ENTITLEMENT[] = "urn:oid:1.3.6.1.4.1.5923.1.1.1.7";
