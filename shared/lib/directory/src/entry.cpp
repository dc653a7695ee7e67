/**
 * @file entry.cpp
 * @brief Entry accessors, attribute projection and search-scope parsing
 */

#include "crowdldap/directory/entry.h"
#include "crowdldap/directory/types.h"
#include "crowdldap/utils/string_utils.h"

namespace crowdldap::directory {

bool AttributeNameLess::operator()(const std::string& a, const std::string& b) const {
    return utils::lessIgnoreCase(a, b);
}

std::optional<SearchScope> parseSearchScope(const std::string& text) {
    std::string s = utils::toLower(utils::trim(text));
    if (s == "base") return SearchScope::BASE;
    if (s == "one" || s == "onelevel") return SearchScope::ONE_LEVEL;
    if (s == "sub" || s == "subtree") return SearchScope::SUBTREE;
    return std::nullopt;
}

Entry::Entry(Dn dn, AttributeMap attributes)
    : dn_(std::move(dn)), attributes_(std::move(attributes)) {}

const std::vector<std::string>* Entry::get(const std::string& name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) return nullptr;
    return &it->second;
}

Entry Entry::withAttribute(const std::string& name, std::vector<std::string> values) const {
    AttributeMap attributes = attributes_;
    attributes.erase(name);
    if (!values.empty()) {
        attributes.emplace(name, std::move(values));
    }
    return Entry(dn_, std::move(attributes));
}

Entry Entry::project(const std::vector<std::string>& requested) const {
    if (requested.empty()) return *this;
    for (const auto& name : requested) {
        if (name == "*") return *this;
    }

    AttributeMap attributes;
    for (const auto& [name, values] : attributes_) {
        if (isAttributeRequested(requested, name)) {
            attributes.emplace(name, values);
        }
    }
    return Entry(dn_, std::move(attributes));
}

bool isAttributeRequested(const std::vector<std::string>& requested, const std::string& name) {
    if (requested.empty()) return true;
    for (const auto& r : requested) {
        if (r == "*" || utils::equalsIgnoreCase(r, name)) return true;
    }
    return false;
}

} // namespace crowdldap::directory
