/**
 * @file ldif_writer.h
 * @brief LDIF (RFC 2849) output for directory entries
 */

#pragma once

#include "crowdldap/directory/entry.h"

#include <cstddef>
#include <ostream>
#include <string>

namespace crowdldap::common {

class LdifWriter {
public:
    /// Maximum line length before folding
    static constexpr size_t kLineWidth = 76;

    /**
     * @brief Base64 encode (OpenSSL BIO, no line breaks)
     */
    static std::string base64Encode(const std::string& data);

    /**
     * @brief "name: value", or "name:: base64" when value is not SAFE-STRING
     */
    static std::string formatAttribute(const std::string& name, const std::string& value);

    /**
     * @brief Fold a line at kLineWidth; continuation lines start with one space
     */
    static std::string foldLine(const std::string& line);

    /**
     * @brief One entry: dn line, objectClass first, then the remaining attributes,
     *        terminated by an empty line
     */
    static std::string formatEntry(const directory::Entry& entry);

    static void writeEntry(std::ostream& out, const directory::Entry& entry) {
        out << formatEntry(entry);
    }
};

} // namespace crowdldap::common
