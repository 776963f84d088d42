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
 * ClaimsMapper.cpp
 *
 * Maps released attributes onto a user identifier and profile.
 */

#include "internal.h"
#include "exceptions.h"
#include "attribute/ClaimsMapper.h"
#include "idp/IdentityProvider.h"
#include "logging/Category.h"

using namespace samlauth;
using namespace std;

ClaimsMapper::ClaimsMapper()
{
}

ClaimsMapper::~ClaimsMapper()
{
}

string ClaimsMapper::extractPermanentId(const AttributeSet& attributes, const IdentityProvider& idp) const
{
    const string& id = idp.getAttributeName(IdentityProvider::USER_PERMANENT_ID);
    boost::optional<string> value = getFirstValue(attributes, id);
    if (!value || value->empty()) {
        Category::getInstance(SAMLAUTH_LOGCAT ".ClaimsMapper").warn("IdentityProvider (%s) did not release permanent ID attribute (%s)", idp.getName().c_str(), id.c_str());
        MissingAttributeException ex("Permanent ID attribute (" + id + ") missing from response.");
        ex.addProperty(AuthException::IDP_PROP_NAME, idp.getName().c_str());
        ex.addProperty(AuthException::ATTRIBUTE_PROP_NAME, id.c_str());
        throw ex;
    }
    return value.get();
}

UserProfile ClaimsMapper::mapProfile(const AttributeSet& attributes, const IdentityProvider& idp) const
{
    UserProfile profile;
    profile.fullName = getFirstValue(attributes, idp.getAttributeName(IdentityProvider::FULL_NAME));
    profile.firstName = getFirstValue(attributes, idp.getAttributeName(IdentityProvider::FIRST_NAME));
    profile.lastName = getFirstValue(attributes, idp.getAttributeName(IdentityProvider::LAST_NAME));
    profile.username = getFirstValue(attributes, idp.getAttributeName(IdentityProvider::USERNAME));
    profile.email = getFirstValue(attributes, idp.getAttributeName(IdentityProvider::EMAIL));
    return profile;
}

NormalizedIdentity ClaimsMapper::mapIdentity(const AttributeSet& attributes, const IdentityProvider& idp) const
{
    NormalizedIdentity identity(idp.getName(), extractPermanentId(attributes, idp), mapProfile(attributes, idp));
    identity.setAttributes(attributes);
    Category::getInstance(SAMLAUTH_LOGCAT ".ClaimsMapper").debug("mapped identity (%s)", identity.getUserID().c_str());
    return identity;
}
