/**
 * @file dn.h
 * @brief LDAP Distinguished Name value type (RFC 4514)
 *
 * A Dn is an ordered list of single-valued RDNs, leaf first:
 * "uid=alice,ou=users,dc=crowd" has rdns() = [uid=alice, ou=users, dc=crowd].
 * Attribute types and values compare ASCII case-insensitively.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace crowdldap::directory {

/**
 * @brief Relative distinguished name (one attribute type/value pair)
 */
struct Rdn {
    std::string type;   ///< Attribute type as written (e.g. "uid")
    std::string value;  ///< Unescaped attribute value

    /// @brief RFC 4514 string form with the value escaped
    std::string toString() const;

    /// @brief Case-insensitive comparison of type and value
    bool matches(const Rdn& other) const;
};

/**
 * @brief Distinguished name
 */
class Dn {
public:
    /// @brief The empty (root DSE) DN
    Dn() = default;

    explicit Dn(std::vector<Rdn> rdns);

    /**
     * @brief Parse an RFC 4514 DN string
     *
     * Handles backslash escapes (\, \+ \2C ...) and whitespace around
     * separators. Multi-valued RDNs ('+') and BER-encoded values ('#') are
     * rejected.
     *
     * @param text DN string ("" yields the empty DN)
     * @return Parsed DN, or std::nullopt if malformed
     */
    static std::optional<Dn> parse(const std::string& text);

    const std::vector<Rdn>& rdns() const { return rdns_; }
    size_t size() const { return rdns_.size(); }
    bool isEmpty() const { return rdns_.empty(); }

    /// @brief Leading (leftmost) RDN; the DN must not be empty
    const Rdn& leaf() const;

    /// @brief DN with the leading RDN removed (empty DN stays empty)
    Dn parent() const;

    /// @brief DN with rdn prepended
    Dn child(const Rdn& rdn) const;

    /// @brief True if this DN equals ancestor or lies beneath it
    bool isWithin(const Dn& ancestor) const;

    /// @brief True if this DN is exactly one level beneath parent
    bool isChildOf(const Dn& parent) const;

    /// @brief RFC 4514 string form
    std::string toString() const;

    /// @brief Lowercased, canonically escaped form for comparisons and map keys
    std::string normalized() const;

    bool operator==(const Dn& other) const;
    bool operator!=(const Dn& other) const { return !(*this == other); }

private:
    std::vector<Rdn> rdns_;
};

/**
 * @brief Escape an attribute value for use inside a DN string (RFC 4514 2.4)
 */
std::string escapeDnValue(const std::string& value);

} // namespace crowdldap::directory
