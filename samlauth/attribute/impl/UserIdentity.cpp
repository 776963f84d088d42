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
 * UserIdentity.cpp
 *
 * Normalized user data handed back to the login pipeline.
 */

#include "internal.h"
#include "attribute/UserIdentity.h"

using namespace samlauth;
using namespace std;

NormalizedIdentity::NormalizedIdentity(const string& idpName, const string& permanentId, const UserProfile& profile)
    : m_idpName(idpName), m_permanentId(permanentId), m_profile(profile)
{
}

NormalizedIdentity::~NormalizedIdentity()
{
}

string NormalizedIdentity::getUserID() const
{
    return m_idpName + ':' + m_permanentId;
}
