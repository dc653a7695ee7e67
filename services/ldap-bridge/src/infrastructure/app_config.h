#pragma once

/**
 * @file app_config.h
 * @brief crowd-ldap-bridge application configuration
 *
 * Loaded from environment variables at startup.
 */

#include "crowdldap/crowd/http_client.h"
#include "crowdldap/directory/config.h"
#include "crowdldap/utils/string_utils.h"
#include "exceptions.h"

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace crowdldap::infrastructure {

struct AppConfig {
    // Crowd connection
    std::string crowdUrl;
    std::string crowdAppName;
    std::string crowdAppPassword;
    long crowdTimeoutSec = 10;
    long crowdConnectTimeoutSec = 5;
    bool crowdVerifyTls = true;

    // Directory layout
    std::string baseDn = "dc=crowd";
    std::string usersRdn = "ou=users";
    std::string groupsRdn = "ou=groups";

    // AD memberOf emulation
    bool emulateMemberOf = false;
    bool includeNestedGroups = false;
    std::optional<std::string> memberCn;
    std::optional<std::string> memberOu;
    std::optional<std::string> memberDc;
    std::optional<std::string> memberGid;

    size_t searchSizeLimit = 1000;

    // Logging
    std::string logLevel = "info";
    std::string logFile;

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("CROWD_URL")) config.crowdUrl = val;
        if (auto val = std::getenv("CROWD_APP_NAME")) config.crowdAppName = val;
        if (auto val = std::getenv("CROWD_APP_PASSWORD")) config.crowdAppPassword = val;
        if (auto val = std::getenv("CROWD_TIMEOUT_SEC")) config.crowdTimeoutSec = parseNumber("CROWD_TIMEOUT_SEC", val);
        if (auto val = std::getenv("CROWD_CONNECT_TIMEOUT_SEC")) {
            config.crowdConnectTimeoutSec = parseNumber("CROWD_CONNECT_TIMEOUT_SEC", val);
        }
        if (auto val = std::getenv("CROWD_VERIFY_TLS")) config.crowdVerifyTls = parseFlag("CROWD_VERIFY_TLS", val);

        if (auto val = std::getenv("LDAP_BASE_DN")) config.baseDn = val;
        if (auto val = std::getenv("LDAP_USERS_RDN")) config.usersRdn = val;
        if (auto val = std::getenv("LDAP_GROUPS_RDN")) config.groupsRdn = val;

        if (auto val = std::getenv("EMULATE_AD_MEMBEROF")) config.emulateMemberOf = parseFlag("EMULATE_AD_MEMBEROF", val);
        if (auto val = std::getenv("EMULATE_AD_INCLUDE_NESTED")) {
            config.includeNestedGroups = parseFlag("EMULATE_AD_INCLUDE_NESTED", val);
        }

        // "false" is the legacy marker for an unset template component
        config.memberCn = optionalSetting("MAP_MEMBER_CN");
        config.memberOu = optionalSetting("MAP_MEMBER_OU");
        config.memberDc = optionalSetting("MAP_MEMBER_DC");
        config.memberGid = optionalSetting("MAP_MEMBER_GID");
        if (config.memberGid) {
            parseNumber("MAP_MEMBER_GID", config.memberGid->c_str());
        }

        if (auto val = std::getenv("SEARCH_SIZE_LIMIT")) {
            long limit = parseNumber("SEARCH_SIZE_LIMIT", val);
            if (limit <= 0) {
                throw common::ConfigException("SEARCH_SIZE_LIMIT must be positive");
            }
            config.searchSizeLimit = static_cast<size_t>(limit);
        }

        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;

        return config;
    }

    void validateRequiredCredentials() const {
        if (crowdUrl.empty()) {
            throw common::ConfigException("CROWD_URL environment variable not set");
        }
        if (crowdAppName.empty()) {
            throw common::ConfigException("CROWD_APP_NAME environment variable not set");
        }
        if (crowdAppPassword.empty()) {
            throw common::ConfigException("CROWD_APP_PASSWORD environment variable not set");
        }
        spdlog::info("All required credentials loaded from environment");
    }

    directory::BridgeConfig toBridgeConfig() const {
        directory::BridgeConfig bridge;
        bridge.baseDn = baseDn;
        bridge.usersRdn = usersRdn;
        bridge.groupsRdn = groupsRdn;
        bridge.emulateMemberOf = emulateMemberOf;
        bridge.includeNestedGroups = includeNestedGroups;
        bridge.memberOfTemplate.cn = memberCn;
        bridge.memberOfTemplate.ou = memberOu;
        bridge.memberOfTemplate.dc = memberDc;
        bridge.memberOfGroupSelector = memberGid;
        bridge.searchSizeLimit = searchSizeLimit;
        return bridge;
    }

    crowd::HttpClientConfig toHttpClientConfig() const {
        crowd::HttpClientConfig http;
        http.baseUrl = crowdUrl;
        http.username = crowdAppName;
        http.password = crowdAppPassword;
        http.timeoutSec = crowdTimeoutSec;
        http.connectTimeoutSec = crowdConnectTimeoutSec;
        http.verifyTls = crowdVerifyTls;
        return http;
    }

private:
    static long parseNumber(const char* name, const char* value) {
        std::string text = utils::trim(value);
        bool digits = !text.empty();
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                digits = false;
                break;
            }
        }
        if (!digits || text.size() > 9) {
            throw common::ConfigException(std::string(name) + " must be a non-negative integer: '" + text + "'");
        }
        return std::stol(text);
    }

    static bool parseFlag(const char* name, const char* value) {
        auto flag = utils::parseBool(value);
        if (!flag) {
            throw common::ConfigException(std::string(name) + " must be a boolean: '" + value + "'");
        }
        return *flag;
    }

    static std::optional<std::string> optionalSetting(const char* name) {
        const char* val = std::getenv(name);
        if (!val) return std::nullopt;
        std::string text = utils::trim(val);
        if (text.empty() || text == "false") return std::nullopt;
        return text;
    }
};

} // namespace crowdldap::infrastructure
