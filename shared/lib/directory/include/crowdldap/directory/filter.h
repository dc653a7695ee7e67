/**
 * @file filter.h
 * @brief LDAP search filter expression tree (RFC 4515)
 *
 * Evaluated in memory against synthesized entries, since the identity
 * backend has no filter language of its own. Matching is two-valued: a
 * comparison against an attribute the entry lacks is simply false.
 */

#pragma once

#include "entry.h"

#include <optional>
#include <string>
#include <vector>

namespace crowdldap::directory {

class Filter {
public:
    enum class Type {
        AND,
        OR,
        NOT,
        EQUALITY,
        SUBSTRING,
        PRESENT,
        GREATER_OR_EQUAL,
        LESS_OR_EQUAL,
        APPROX
    };

    // --- Factories ---
    static Filter equality(const std::string& attribute, const std::string& value);
    static Filter present(const std::string& attribute);
    static Filter substring(const std::string& attribute,
                            std::optional<std::string> initial,
                            std::vector<std::string> any,
                            std::optional<std::string> final);
    static Filter greaterOrEqual(const std::string& attribute, const std::string& value);
    static Filter lessOrEqual(const std::string& attribute, const std::string& value);
    static Filter approx(const std::string& attribute, const std::string& value);
    static Filter andOf(std::vector<Filter> children);
    static Filter orOf(std::vector<Filter> children);
    static Filter notOf(Filter child);

    /// @brief The filter "(objectClass=*)"
    static Filter matchAll();

    /**
     * @brief Parse an RFC 4515 filter string
     * @throws common::FilterSyntaxException on malformed input
     */
    static Filter parse(const std::string& text);

    Type type() const { return type_; }
    const std::string& attribute() const { return attribute_; }
    const std::string& value() const { return value_; }
    const std::vector<Filter>& children() const { return children_; }
    const std::optional<std::string>& initial() const { return initial_; }
    const std::vector<std::string>& any() const { return any_; }
    const std::optional<std::string>& final() const { return final_; }

    /// @brief Evaluate against an entry's attributes
    bool matches(const Entry& entry) const;

    /// @brief True if any node of the tree tests attribute
    bool references(const std::string& attribute) const;

    /**
     * @brief Names the filter pins through equality on one of attributes
     *
     * Returns the values when every entry the filter can match must have
     * one of attributes equal to one of them: a bare equality, an AND with
     * such a child, or an OR whose children all pin. Returns std::nullopt
     * when the filter does not restrict the attributes that way.
     */
    std::optional<std::vector<std::string>> anchoredValues(
        const std::vector<std::string>& attributes) const;

    /// @brief RFC 4515 string form
    std::string toString() const;

private:
    explicit Filter(Type type) : type_(type) {}

    Type type_;
    std::string attribute_;
    std::string value_;
    std::vector<Filter> children_;
    std::optional<std::string> initial_;
    std::vector<std::string> any_;
    std::optional<std::string> final_;
};

/**
 * @brief Escape an assertion value for a filter string (RFC 4515 section 3)
 */
std::string escapeFilterValue(const std::string& value);

/**
 * @brief True for attributes holding DNs (compared by normalized DN)
 */
bool isDnValuedAttribute(const std::string& attribute);

} // namespace crowdldap::directory
