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
 * BoostPropertySet.cpp
 *
 * Boost property tree-based property set implementation.
 */

#include "internal.h"
#include "util/BoostPropertySet.h"

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

using namespace samlauth;
using namespace boost;
using namespace std;

PropertySet::PropertySet()
{
}

PropertySet::~PropertySet()
{
}

BoostPropertySet::BoostPropertySet() : m_parent(nullptr), m_pt(nullptr)
{
}

BoostPropertySet::~BoostPropertySet()
{
}

const PropertySet* BoostPropertySet::getParent() const
{
    return m_parent;
}

void BoostPropertySet::setParent(const PropertySet* parent)
{
    m_parent = parent;
}

void BoostPropertySet::load(const property_tree::ptree& pt, const char* unsetter)
{
    m_pt = &pt;
    m_unset.clear();

    // Check for unsetter, pull out and split.
    if (unsetter) {
        const optional<string> val = pt.get_optional<string>(unsetter);
        if (val) {
            string dup(val.get());
            trim(dup);
            if (!dup.empty()) {
                split(m_unset, dup, is_space(), algorithm::token_compress_on);
            }
        }
    }
}

bool BoostPropertySet::inherits(const char* name) const
{
    return m_parent && m_unset.find(name) == m_unset.end();
}

bool BoostPropertySet::hasProperty(const char* name) const
{
    if (m_pt && m_pt->get_child_optional(name)) {
        return true;
    }
    return inherits(name) && m_parent->hasProperty(name);
}

bool BoostPropertySet::getBool(const char* name, bool defaultValue) const
{
    if (m_pt) {
        // Check for a child node with the target name and return its value as a bool.
        const optional<const property_tree::ptree&> child = m_pt->get_child_optional(name);
        if (child) {
            const string& val = child->data();
            return val == "1" || val == "true";
        }
    }

    // If we have a parent and the setting isn't "unset" at this layer, return its copy.
    if (inherits(name)) {
        return m_parent->getBool(name, defaultValue);
    }

    return defaultValue;
}

const char* BoostPropertySet::getString(const char* name, const char* defaultValue) const
{
    if (m_pt) {
        const optional<const property_tree::ptree&> child = m_pt->get_child_optional(name);
        if (child) {
            return child->data().c_str();
        }
    }

    if (inherits(name)) {
        return m_parent->getString(name, defaultValue);
    }

    return defaultValue;
}

unsigned int BoostPropertySet::getUnsignedInt(const char* name, unsigned int defaultValue) const
{
    if (m_pt) {
        const optional<const property_tree::ptree&> child = m_pt->get_child_optional(name);
        if (child) {
            try {
                return lexical_cast<unsigned int>(child->data());
            }
            catch (const bad_lexical_cast&) {
                return defaultValue;
            }
        }
    }

    if (inherits(name)) {
        return m_parent->getUnsignedInt(name, defaultValue);
    }

    return defaultValue;
}

int BoostPropertySet::getInt(const char* name, int defaultValue) const
{
    if (m_pt) {
        const optional<const property_tree::ptree&> child = m_pt->get_child_optional(name);
        if (child) {
            try {
                return lexical_cast<int>(child->data());
            }
            catch (const bad_lexical_cast&) {
                return defaultValue;
            }
        }
    }

    if (inherits(name)) {
        return m_parent->getInt(name, defaultValue);
    }

    return defaultValue;
}
