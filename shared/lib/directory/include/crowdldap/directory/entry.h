/**
 * @file entry.h
 * @brief Directory entry returned to the host framework
 */

#pragma once

#include "dn.h"
#include "types.h"

#include <string>
#include <vector>

namespace crowdldap::directory {

/**
 * @brief DN plus attribute multimap
 *
 * Constructed per request and never mutated afterwards; derived entries
 * (extra attributes, projections) are new copies.
 */
class Entry {
public:
    Entry(Dn dn, AttributeMap attributes);

    const Dn& dn() const { return dn_; }
    const AttributeMap& attributes() const { return attributes_; }

    /**
     * @brief Values of an attribute (case-insensitive name)
     * @return Pointer to the values, or nullptr if the attribute is absent
     */
    const std::vector<std::string>* get(const std::string& name) const;

    bool has(const std::string& name) const { return get(name) != nullptr; }

    /// @brief Copy with name set to values (an empty list removes the attribute)
    Entry withAttribute(const std::string& name, std::vector<std::string> values) const;

    /**
     * @brief Copy restricted to the requested attributes
     *
     * An empty list or one containing "*" keeps all attributes.
     */
    Entry project(const std::vector<std::string>& requested) const;

private:
    Dn dn_;
    AttributeMap attributes_;
};

/**
 * @brief True if the requested attribute list selects name
 *
 * Empty list and "*" select everything.
 */
bool isAttributeRequested(const std::vector<std::string>& requested, const std::string& name);

} // namespace crowdldap::directory
