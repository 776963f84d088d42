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
 * Attributes.cpp
 *
 * Attribute collections released by an identity provider.
 */

#include "internal.h"
#include "attribute/Attributes.h"

#include <algorithm>

using namespace samlauth;
using namespace std;

boost::optional<string> samlauth::getFirstValue(const AttributeSet& attributes, const string& id)
{
    AttributeSet::const_iterator a = attributes.find(id);
    if (a == attributes.end() || a->second.empty()) {
        return boost::none;
    }
    return a->second.front();
}

bool samlauth::hasMatchingValue(const AttributeSet& attributes, const string& id, const vector<string>& values)
{
    AttributeSet::const_iterator a = attributes.find(id);
    if (a == attributes.end()) {
        return false;
    }

    for (const string& v : a->second) {
        if (find(values.begin(), values.end(), v) != values.end()) {
            return true;
        }
    }
    return false;
}
