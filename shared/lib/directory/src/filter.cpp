/**
 * @file filter.cpp
 * @brief Filter construction, evaluation and formatting
 */

#include "crowdldap/directory/filter.h"
#include "crowdldap/utils/string_utils.h"

#include <cctype>
#include <cstdlib>

namespace crowdldap::directory {

namespace {

bool isInteger(const std::string& s) {
    if (s.empty()) return false;
    size_t i = (s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

/// Three-way compare: numeric when both sides are integers, else case-insensitive
int compareOrdering(const std::string& a, const std::string& b) {
    if (isInteger(a) && isInteger(b) && a.size() < 19 && b.size() < 19) {
        long long x = std::strtoll(a.c_str(), nullptr, 10);
        long long y = std::strtoll(b.c_str(), nullptr, 10);
        return (x < y) ? -1 : (x > y ? 1 : 0);
    }
    std::string la = utils::toLower(a);
    std::string lb = utils::toLower(b);
    return la.compare(lb);
}

bool valueEquals(const std::string& attribute, const std::string& value, const std::string& assertion) {
    if (isDnValuedAttribute(attribute)) {
        auto a = Dn::parse(value);
        auto b = Dn::parse(assertion);
        if (a && b) return *a == *b;
    }
    return utils::equalsIgnoreCase(value, assertion);
}

bool substringMatches(const std::string& value,
                      const std::optional<std::string>& initial,
                      const std::vector<std::string>& any,
                      const std::optional<std::string>& final) {
    std::string v = utils::toLower(value);
    size_t pos = 0;

    if (initial) {
        std::string i = utils::toLower(*initial);
        if (!utils::startsWith(v, i)) return false;
        pos = i.size();
    }

    for (const auto& part : any) {
        std::string p = utils::toLower(part);
        size_t found = v.find(p, pos);
        if (found == std::string::npos) return false;
        pos = found + p.size();
    }

    if (final) {
        std::string f = utils::toLower(*final);
        if (v.size() < pos + f.size()) return false;
        if (!utils::endsWith(v, f)) return false;
    }
    return true;
}

} // anonymous namespace

// --- Factories ---

Filter Filter::equality(const std::string& attribute, const std::string& value) {
    Filter f(Type::EQUALITY);
    f.attribute_ = attribute;
    f.value_ = value;
    return f;
}

Filter Filter::present(const std::string& attribute) {
    Filter f(Type::PRESENT);
    f.attribute_ = attribute;
    return f;
}

Filter Filter::substring(const std::string& attribute,
                         std::optional<std::string> initial,
                         std::vector<std::string> any,
                         std::optional<std::string> final) {
    Filter f(Type::SUBSTRING);
    f.attribute_ = attribute;
    f.initial_ = std::move(initial);
    f.any_ = std::move(any);
    f.final_ = std::move(final);
    return f;
}

Filter Filter::greaterOrEqual(const std::string& attribute, const std::string& value) {
    Filter f(Type::GREATER_OR_EQUAL);
    f.attribute_ = attribute;
    f.value_ = value;
    return f;
}

Filter Filter::lessOrEqual(const std::string& attribute, const std::string& value) {
    Filter f(Type::LESS_OR_EQUAL);
    f.attribute_ = attribute;
    f.value_ = value;
    return f;
}

Filter Filter::approx(const std::string& attribute, const std::string& value) {
    Filter f(Type::APPROX);
    f.attribute_ = attribute;
    f.value_ = value;
    return f;
}

Filter Filter::andOf(std::vector<Filter> children) {
    Filter f(Type::AND);
    f.children_ = std::move(children);
    return f;
}

Filter Filter::orOf(std::vector<Filter> children) {
    Filter f(Type::OR);
    f.children_ = std::move(children);
    return f;
}

Filter Filter::notOf(Filter child) {
    Filter f(Type::NOT);
    f.children_.push_back(std::move(child));
    return f;
}

Filter Filter::matchAll() {
    return present("objectClass");
}

// --- Evaluation ---

bool Filter::matches(const Entry& entry) const {
    switch (type_) {
        case Type::AND:
            for (const auto& child : children_) {
                if (!child.matches(entry)) return false;
            }
            return true;

        case Type::OR:
            for (const auto& child : children_) {
                if (child.matches(entry)) return true;
            }
            return false;

        case Type::NOT:
            return !children_.front().matches(entry);

        case Type::PRESENT:
            return entry.has(attribute_);

        default:
            break;
    }

    const auto* values = entry.get(attribute_);
    if (!values) return false;

    for (const auto& v : *values) {
        switch (type_) {
            case Type::EQUALITY:
            case Type::APPROX:
                if (valueEquals(attribute_, v, value_)) return true;
                break;
            case Type::SUBSTRING:
                if (substringMatches(v, initial_, any_, final_)) return true;
                break;
            case Type::GREATER_OR_EQUAL:
                if (compareOrdering(v, value_) >= 0) return true;
                break;
            case Type::LESS_OR_EQUAL:
                if (compareOrdering(v, value_) <= 0) return true;
                break;
            default:
                break;
        }
    }
    return false;
}

bool Filter::references(const std::string& attribute) const {
    switch (type_) {
        case Type::AND:
        case Type::OR:
        case Type::NOT:
            for (const auto& child : children_) {
                if (child.references(attribute)) return true;
            }
            return false;
        default:
            return utils::equalsIgnoreCase(attribute_, attribute);
    }
}

std::optional<std::vector<std::string>> Filter::anchoredValues(
    const std::vector<std::string>& attributes) const {
    switch (type_) {
        case Type::EQUALITY:
            for (const auto& a : attributes) {
                if (utils::equalsIgnoreCase(attribute_, a)) {
                    return std::vector<std::string>{value_};
                }
            }
            return std::nullopt;

        case Type::AND:
            for (const auto& child : children_) {
                auto values = child.anchoredValues(attributes);
                if (values) return values;
            }
            return std::nullopt;

        case Type::OR: {
            std::vector<std::string> all;
            for (const auto& child : children_) {
                auto values = child.anchoredValues(attributes);
                if (!values) return std::nullopt;
                for (auto& v : *values) {
                    bool seen = false;
                    for (const auto& existing : all) {
                        if (utils::equalsIgnoreCase(existing, v)) {
                            seen = true;
                            break;
                        }
                    }
                    if (!seen) all.push_back(std::move(v));
                }
            }
            return all;
        }

        default:
            return std::nullopt;
    }
}

// --- Formatting ---

std::string Filter::toString() const {
    switch (type_) {
        case Type::AND:
        case Type::OR: {
            std::string s = (type_ == Type::AND) ? "(&" : "(|";
            for (const auto& child : children_) s += child.toString();
            return s + ")";
        }
        case Type::NOT:
            return "(!" + children_.front().toString() + ")";
        case Type::EQUALITY:
            return "(" + attribute_ + "=" + escapeFilterValue(value_) + ")";
        case Type::APPROX:
            return "(" + attribute_ + "~=" + escapeFilterValue(value_) + ")";
        case Type::GREATER_OR_EQUAL:
            return "(" + attribute_ + ">=" + escapeFilterValue(value_) + ")";
        case Type::LESS_OR_EQUAL:
            return "(" + attribute_ + "<=" + escapeFilterValue(value_) + ")";
        case Type::PRESENT:
            return "(" + attribute_ + "=*)";
        case Type::SUBSTRING: {
            std::string s = "(" + attribute_ + "=";
            if (initial_) s += escapeFilterValue(*initial_);
            s += "*";
            for (const auto& part : any_) s += escapeFilterValue(part) + "*";
            if (final_) s += escapeFilterValue(*final_);
            return s + ")";
        }
    }
    return "";
}

std::string escapeFilterValue(const std::string& value) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (c == '*' || c == '(' || c == ')' || c == '\\' || c == '\0') {
            result += '\\';
            result += hex[(static_cast<unsigned char>(c) >> 4) & 0x0F];
            result += hex[static_cast<unsigned char>(c) & 0x0F];
        } else {
            result += c;
        }
    }
    return result;
}

bool isDnValuedAttribute(const std::string& attribute) {
    return utils::equalsIgnoreCase(attribute, "memberOf") ||
           utils::equalsIgnoreCase(attribute, "uniqueMember") ||
           utils::equalsIgnoreCase(attribute, "member");
}

} // namespace crowdldap::directory
