/**
 * @file config.cpp
 * @brief BridgeConfig validation
 */

#include "crowdldap/directory/config.h"
#include "crowdldap/utils/string_utils.h"
#include "exceptions.h"

#include <cctype>

namespace crowdldap::directory {

namespace {

void requireNonEmpty(const std::optional<std::string>& component, const char* name) {
    if (component && component->empty()) {
        throw common::ConfigException(std::string("memberOf template component '") + name +
                                      "' is set but empty");
    }
}

} // anonymous namespace

std::optional<long long> parseGidNumber(const std::string& text) {
    std::string value = utils::trim(text);
    if (value.empty() || value.size() > 18) {
        return std::nullopt;
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return std::stoll(value);
}

void BridgeConfig::validate() const {
    if (userNamingAttribute.empty()) {
        throw common::ConfigException("user naming attribute must not be empty");
    }
    if (groupNamingAttribute.empty()) {
        throw common::ConfigException("group naming attribute must not be empty");
    }
    if (searchSizeLimit == 0) {
        throw common::ConfigException("search size limit must be greater than zero");
    }
    if (searchSizeLimit > kMaxSearchSizeLimit) {
        throw common::ConfigException("search size limit must not exceed " +
                                      std::to_string(kMaxSearchSizeLimit));
    }
    requireNonEmpty(memberOfTemplate.cn, "cn");
    requireNonEmpty(memberOfTemplate.ou, "ou");
    requireNonEmpty(memberOfTemplate.dc, "dc");
    if (memberOfGroupSelector && memberOfGroupSelector->empty()) {
        throw common::ConfigException("memberOf group selector is set but empty");
    }
    if (memberOfGroupSelector && !parseGidNumber(*memberOfGroupSelector)) {
        throw common::ConfigException("memberOf group selector is not a gidNumber: '" +
                                      *memberOfGroupSelector + "'");
    }
}

} // namespace crowdldap::directory
