/**
 * @file dn.cpp
 * @brief RFC 4514 DN parsing and formatting
 */

#include "crowdldap/directory/dn.h"
#include "crowdldap/utils/string_utils.h"

#include <cctype>
#include <stdexcept>

namespace crowdldap::directory {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isSpecial(char c) {
    switch (c) {
        case ',': case '+': case '"': case '\\':
        case '<': case '>': case ';': case '=':
        case ' ': case '#':
            return true;
        default:
            return false;
    }
}

bool isValidAttributeType(const std::string& type) {
    if (type.empty()) return false;
    // descr (ALPHA *keychar) or numericoid
    if (std::isdigit(static_cast<unsigned char>(type[0]))) {
        for (char c : type) {
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') return false;
        }
        return true;
    }
    if (!std::isalpha(static_cast<unsigned char>(type[0]))) return false;
    for (char c : type) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}

void skipSpaces(const std::string& text, size_t& pos) {
    while (pos < text.size() && text[pos] == ' ') pos++;
}

} // anonymous namespace

// --- Rdn ---

std::string Rdn::toString() const {
    return type + "=" + escapeDnValue(value);
}

bool Rdn::matches(const Rdn& other) const {
    return utils::equalsIgnoreCase(type, other.type) &&
           utils::equalsIgnoreCase(value, other.value);
}

// --- Dn ---

Dn::Dn(std::vector<Rdn> rdns) : rdns_(std::move(rdns)) {}

std::optional<Dn> Dn::parse(const std::string& text) {
    std::vector<Rdn> rdns;
    size_t pos = 0;
    skipSpaces(text, pos);
    if (pos == text.size()) {
        return Dn();
    }

    while (true) {
        // attributeType
        skipSpaces(text, pos);
        size_t eq = text.find('=', pos);
        if (eq == std::string::npos) return std::nullopt;
        std::string type = utils::trim(text.substr(pos, eq - pos));
        if (!isValidAttributeType(type)) return std::nullopt;
        pos = eq + 1;

        // attributeValue
        skipSpaces(text, pos);
        if (pos < text.size() && text[pos] == '#') return std::nullopt;

        std::string value;
        size_t significant = 0;  // value length up to the last escaped or non-space char
        bool ended = false;
        while (pos < text.size()) {
            char c = text[pos];
            if (c == '\\') {
                if (pos + 1 >= text.size()) return std::nullopt;
                char next = text[pos + 1];
                if (isSpecial(next)) {
                    value += next;
                    pos += 2;
                } else {
                    if (pos + 2 >= text.size()) return std::nullopt;
                    int hi = hexValue(next);
                    int lo = hexValue(text[pos + 2]);
                    if (hi < 0 || lo < 0) return std::nullopt;
                    value += static_cast<char>((hi << 4) | lo);
                    pos += 3;
                }
                significant = value.size();
                continue;
            }
            if (c == ',' || c == ';') {
                ended = true;
                pos++;
                break;
            }
            if (c == '+' || c == '"' || c == '<' || c == '>') {
                return std::nullopt;
            }
            value += c;
            if (c != ' ') significant = value.size();
            pos++;
        }
        value.resize(significant);
        rdns.push_back(Rdn{type, value});

        if (!ended) break;
        skipSpaces(text, pos);
        if (pos == text.size()) return std::nullopt;  // trailing separator
    }

    return Dn(std::move(rdns));
}

const Rdn& Dn::leaf() const {
    if (rdns_.empty()) {
        throw std::out_of_range("Dn::leaf: empty DN has no RDN");
    }
    return rdns_.front();
}

Dn Dn::parent() const {
    if (rdns_.empty()) return Dn();
    return Dn(std::vector<Rdn>(rdns_.begin() + 1, rdns_.end()));
}

Dn Dn::child(const Rdn& rdn) const {
    std::vector<Rdn> rdns;
    rdns.reserve(rdns_.size() + 1);
    rdns.push_back(rdn);
    rdns.insert(rdns.end(), rdns_.begin(), rdns_.end());
    return Dn(std::move(rdns));
}

bool Dn::isWithin(const Dn& ancestor) const {
    if (ancestor.size() > size()) return false;
    size_t offset = size() - ancestor.size();
    for (size_t i = 0; i < ancestor.size(); ++i) {
        if (!rdns_[offset + i].matches(ancestor.rdns_[i])) return false;
    }
    return true;
}

bool Dn::isChildOf(const Dn& parent) const {
    return size() == parent.size() + 1 && isWithin(parent);
}

std::string Dn::toString() const {
    std::string result;
    for (size_t i = 0; i < rdns_.size(); ++i) {
        if (i > 0) result += ',';
        result += rdns_[i].toString();
    }
    return result;
}

std::string Dn::normalized() const {
    std::string result;
    for (size_t i = 0; i < rdns_.size(); ++i) {
        if (i > 0) result += ',';
        result += utils::toLower(rdns_[i].type) + "=" + utils::toLower(escapeDnValue(rdns_[i].value));
    }
    return result;
}

bool Dn::operator==(const Dn& other) const {
    return size() == other.size() && isWithin(other);
}

std::string escapeDnValue(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        bool leading = (i == 0);
        bool trailing = (i + 1 == value.size());
        if (c == '\0') {
            result += "\\00";
        } else if (c == ',' || c == '+' || c == '"' || c == '\\' ||
                   c == '<' || c == '>' || c == ';') {
            result += '\\';
            result += c;
        } else if ((leading && (c == ' ' || c == '#')) || (trailing && c == ' ')) {
            result += '\\';
            result += c;
        } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
            result += '\\';
            result += hex[(static_cast<unsigned char>(c) >> 4) & 0x0F];
            result += hex[static_cast<unsigned char>(c) & 0x0F];
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace crowdldap::directory
