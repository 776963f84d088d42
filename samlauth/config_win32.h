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

/*
 * config_win32.h - build configuration for Windows builds without CMake
 */

#ifndef __samlauth_config_win32_h__
#define __samlauth_config_win32_h__

#define PACKAGE "samlauth"
#define PACKAGE_NAME "samlauth"
#define PACKAGE_VERSION "1.0.0"
#define PACKAGE_STRING "samlauth 1.0.0"

#endif /* __samlauth_config_win32_h__ */
