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
 * @file samlauth/attribute/Attributes.h
 *
 * Attribute collections released by an identity provider.
 */

#ifndef __samlauth_attributes_h__
#define __samlauth_attributes_h__

#include <samlauth/base.h>

#include <map>
#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace samlauth {

    /**
     * Attribute names (usually OID URNs) mapped to their values in the order
     * the identity provider supplied them.
     */
    typedef std::map<std::string,std::vector<std::string>> AttributeSet;

    /**
     * Returns the first value of an attribute.
     *
     * @param attributes    attribute set to search
     * @param id            attribute name
     *
     * @return the first value, or none if the attribute is absent or has no values
     */
    SAMLAUTH_API boost::optional<std::string> getFirstValue(const AttributeSet& attributes, const std::string& id);

    /**
     * Tests whether an attribute carries any of a set of values.
     *
     * @param attributes    attribute set to search
     * @param id            attribute name
     * @param values        candidate values, compared case-sensitively
     *
     * @return true iff at least one value matched
     */
    SAMLAUTH_API bool hasMatchingValue(
        const AttributeSet& attributes, const std::string& id, const std::vector<std::string>& values
        );
};

#endif /* __samlauth_attributes_h__ */
