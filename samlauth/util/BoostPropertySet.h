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
 * @file samlauth/util/BoostPropertySet.h
 *
 * Boost propertytree-based property set implementation.
 */

#ifndef __samlauth_boostpropset_h__
#define __samlauth_boostpropset_h__

#include <samlauth/util/PropertySet.h>

#include <set>
#include <string>
#include <boost/property_tree/ptree.hpp>

#if defined (_MSC_VER)
#    pragma warning( push )
#    pragma warning( disable : 4251 )
#endif

namespace samlauth {

    /**
     * Boost property tree-based property set implementation.
     *
     * <p>This implementation wraps a single level of a tree, such as an INI
     * section or the "<xmlattr>" node of an XML element. The tree is owned
     * by the caller and must outlive the property set.</p>
     */
    class SAMLAUTH_API BoostPropertySet : public virtual PropertySet
    {
    public:
        BoostPropertySet();
        virtual ~BoostPropertySet();

        bool hasProperty(const char* name) const;
        bool getBool(const char* name, bool defaultValue) const;
        const char* getString(const char* name, const char* defaultValue=nullptr) const;
        unsigned int getUnsignedInt(const char* name, unsigned int defaultValue) const;
        int getInt(const char* name, int defaultValue) const;

        /**
         * Loads the property set from a ptree owned and managed by the caller.
         *
         * @param pt        property tree instance to wrap
         * @param unsetter  optional name of a property containing a list of property names to "unset"
         */
        void load(const boost::property_tree::ptree& pt, const char* unsetter=nullptr);

    protected:
        /**
         * Returns the parent PropertySet.
         *
         * @return parent PropertySet
         */
        const PropertySet* getParent() const;

        /**
         * Installs a parent PropertySet to allow an inheritance relationship to a different instance.
         *
         * @param parent the parent PropertySet to install
         */
        void setParent(const PropertySet* parent);

    private:
        bool inherits(const char* name) const;

        const PropertySet* m_parent;
        const boost::property_tree::ptree* m_pt;
        std::set<std::string> m_unset;
    };

#if defined (_MSC_VER)
#   pragma warning( pop )
#endif

};

#endif /* __samlauth_boostpropset_h__ */
