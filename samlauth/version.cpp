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
 * version.cpp
 *
 * Library version macros and constants.
 */

#include "internal.h"
#include "version.h"

SAMLAUTH_API const char* const    gSAMLAuthFullVersionStr = SAMLAUTH_FULLVERSIONSTR;
SAMLAUTH_API const char* const    gSAMLAuthDotVersionStr = SAMLAUTH_FULLVERSIONDOT;
SAMLAUTH_API const unsigned int   gSAMLAuthMajVersion = SAMLAUTH_VERSION_MAJOR;
SAMLAUTH_API const unsigned int   gSAMLAuthMinVersion = SAMLAUTH_VERSION_MINOR;
SAMLAUTH_API const unsigned int   gSAMLAuthRevision   = SAMLAUTH_VERSION_REVISION;
