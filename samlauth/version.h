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
 * version.h
 *
 * Library version macros and constants.
 */

#ifndef __samlauth_version_h__
#define __samlauth_version_h__

#include <samlauth/base.h>

// ---------------------------------------------------------------------------
// V E R S I O N   S P E C I F I C A T I O N

/**
 * MODIFY THESE NUMERIC VALUES TO COINCIDE WITH SAMLAUTH LIBRARY VERSION
 * AND DO NOT MODIFY ANYTHING ELSE IN THIS VERSION HEADER FILE
 */

#define SAMLAUTH_VERSION_MAJOR 1
#define SAMLAUTH_VERSION_MINOR 0
#define SAMLAUTH_VERSION_REVISION 0

/** DO NOT MODIFY BELOW THIS LINE */

// three argument concatenation routines
#define SAMLAUTH_CAT3_SEP_UNDERSCORE(a, b, c) #a "_" #b "_" #c
#define SAMLAUTH_CAT3_SEP_PERIOD(a, b, c) #a "." #b "." #c

// three argument macro invokers
#define SAMLAUTH_INVK_CAT3_SEP_UNDERSCORE(a,b,c) SAMLAUTH_CAT3_SEP_UNDERSCORE(a,b,c)
#define SAMLAUTH_INVK_CAT3_SEP_PERIOD(a,b,c)     SAMLAUTH_CAT3_SEP_PERIOD(a,b,c)

#define SAMLAUTH_CALC_EXPANDED_FORM(a,b,c) ( (10000 * (a)) + (100 * (b)) + (c) )

// ---------------------------------------------------------------------------
// V E R S I O N   I N F O R M A T I O N

// Version strings; these particular macros cannot be used for
// conditional compilation as they are not numeric constants

#define SAMLAUTH_FULLVERSIONSTR SAMLAUTH_INVK_CAT3_SEP_UNDERSCORE(SAMLAUTH_VERSION_MAJOR,SAMLAUTH_VERSION_MINOR,SAMLAUTH_VERSION_REVISION)
#define SAMLAUTH_FULLVERSIONDOT SAMLAUTH_INVK_CAT3_SEP_PERIOD(SAMLAUTH_VERSION_MAJOR,SAMLAUTH_VERSION_MINOR,SAMLAUTH_VERSION_REVISION)

extern SAMLAUTH_API const char* const    gSAMLAuthFullVersionStr;
extern SAMLAUTH_API const char* const    gSAMLAuthDotVersionStr;
extern SAMLAUTH_API const unsigned int   gSAMLAuthMajVersion;
extern SAMLAUTH_API const unsigned int   gSAMLAuthMinVersion;
extern SAMLAUTH_API const unsigned int   gSAMLAuthRevision;

// Numeric constant that can be used for conditional compilation purposes.

#define _SAMLAUTH_VERSION SAMLAUTH_CALC_EXPANDED_FORM (SAMLAUTH_VERSION_MAJOR,SAMLAUTH_VERSION_MINOR,SAMLAUTH_VERSION_REVISION)

#endif /* __samlauth_version_h__ */
