/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "crowdldap/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace crowdldap {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool lessIgnoreCase(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::optional<bool> parseBool(const std::string& value) {
    std::string lowerValue = toLower(trim(value));

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    }
    if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }
    return std::nullopt;
}

bool isLdifSafe(const std::string& str) {
    if (str.empty()) {
        return true;
    }

    // SAFE-INIT-CHAR excludes SPACE, colon and less-than
    unsigned char first = static_cast<unsigned char>(str.front());
    if (first == ' ' || first == ':' || first == '<') {
        return false;
    }
    if (str.back() == ' ') {
        return false;
    }

    for (unsigned char c : str) {
        if (c == '\0' || c == '\n' || c == '\r' || c > 127) {
            return false;
        }
    }
    return true;
}

} // namespace utils
} // namespace crowdldap
