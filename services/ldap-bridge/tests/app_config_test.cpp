/**
 * @file app_config_test.cpp
 * @brief Unit tests for environment-based AppConfig loading
 */

#include <gtest/gtest.h>
#include "infrastructure/app_config.h"

#include <cstdlib>
#include <string>
#include <vector>

using crowdldap::infrastructure::AppConfig;
using crowdldap::common::ConfigException;

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearAll(); }
    void TearDown() override { clearAll(); }

    static void set(const char* name, const char* value) { setenv(name, value, 1); }

    static void clearAll() {
        static const std::vector<const char*> names = {
            "CROWD_URL", "CROWD_APP_NAME", "CROWD_APP_PASSWORD", "CROWD_TIMEOUT_SEC",
            "CROWD_CONNECT_TIMEOUT_SEC", "CROWD_VERIFY_TLS", "LDAP_BASE_DN", "LDAP_USERS_RDN",
            "LDAP_GROUPS_RDN", "EMULATE_AD_MEMBEROF", "EMULATE_AD_INCLUDE_NESTED", "MAP_MEMBER_CN",
            "MAP_MEMBER_OU", "MAP_MEMBER_DC", "MAP_MEMBER_GID", "SEARCH_SIZE_LIMIT", "LOG_LEVEL",
            "LOG_FILE",
        };
        for (const char* name : names) unsetenv(name);
    }
};

TEST_F(AppConfigTest, Defaults) {
    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.baseDn, "dc=crowd");
    EXPECT_EQ(config.usersRdn, "ou=users");
    EXPECT_EQ(config.groupsRdn, "ou=groups");
    EXPECT_FALSE(config.emulateMemberOf);
    EXPECT_FALSE(config.includeNestedGroups);
    EXPECT_FALSE(config.memberCn.has_value());
    EXPECT_EQ(config.searchSizeLimit, 1000u);
    EXPECT_EQ(config.crowdTimeoutSec, 10);
    EXPECT_TRUE(config.crowdVerifyTls);
    EXPECT_EQ(config.logLevel, "info");
}

TEST_F(AppConfigTest, MissingCredentials_Throw) {
    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_THROW(config.validateRequiredCredentials(), ConfigException);

    set("CROWD_URL", "https://crowd.example.com/crowd");
    set("CROWD_APP_NAME", "ldap");
    config = AppConfig::fromEnvironment();
    EXPECT_THROW(config.validateRequiredCredentials(), ConfigException);

    set("CROWD_APP_PASSWORD", "secret");
    config = AppConfig::fromEnvironment();
    EXPECT_NO_THROW(config.validateRequiredCredentials());
}

TEST_F(AppConfigTest, FullEnvironment) {
    set("CROWD_URL", "https://crowd.example.com/crowd");
    set("CROWD_APP_NAME", "ldap");
    set("CROWD_APP_PASSWORD", "secret");
    set("CROWD_TIMEOUT_SEC", "30");
    set("CROWD_VERIFY_TLS", "no");
    set("LDAP_BASE_DN", "dc=example,dc=com");
    set("EMULATE_AD_MEMBEROF", "true");
    set("EMULATE_AD_INCLUDE_NESTED", "1");
    set("MAP_MEMBER_OU", "groups");
    set("MAP_MEMBER_DC", "example");
    set("MAP_MEMBER_GID", "500");
    set("SEARCH_SIZE_LIMIT", "250");

    AppConfig config = AppConfig::fromEnvironment();
    auto bridge = config.toBridgeConfig();
    EXPECT_EQ(bridge.baseDn, "dc=example,dc=com");
    EXPECT_TRUE(bridge.emulateMemberOf);
    EXPECT_TRUE(bridge.includeNestedGroups);
    EXPECT_FALSE(bridge.memberOfTemplate.cn.has_value());
    EXPECT_EQ(bridge.memberOfTemplate.ou, std::optional<std::string>("groups"));
    EXPECT_EQ(bridge.memberOfTemplate.dc, std::optional<std::string>("example"));
    EXPECT_EQ(bridge.memberOfGroupSelector, std::optional<std::string>("500"));
    EXPECT_EQ(bridge.searchSizeLimit, 250u);
    EXPECT_NO_THROW(bridge.validate());

    auto http = config.toHttpClientConfig();
    EXPECT_EQ(http.baseUrl, "https://crowd.example.com/crowd");
    EXPECT_EQ(http.username, "ldap");
    EXPECT_EQ(http.password, "secret");
    EXPECT_EQ(http.timeoutSec, 30);
    EXPECT_FALSE(http.verifyTls);
}

TEST_F(AppConfigTest, FalseMeansUnsetTemplateComponent) {
    set("MAP_MEMBER_CN", "false");
    set("MAP_MEMBER_OU", "");
    set("MAP_MEMBER_GID", "false");
    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_FALSE(config.memberCn.has_value());
    EXPECT_FALSE(config.memberOu.has_value());
    EXPECT_FALSE(config.memberGid.has_value());
}

TEST_F(AppConfigTest, InvalidValues_Throw) {
    set("SEARCH_SIZE_LIMIT", "0");
    EXPECT_THROW(AppConfig::fromEnvironment(), ConfigException);

    set("SEARCH_SIZE_LIMIT", "lots");
    EXPECT_THROW(AppConfig::fromEnvironment(), ConfigException);
    unsetenv("SEARCH_SIZE_LIMIT");

    set("EMULATE_AD_MEMBEROF", "maybe");
    EXPECT_THROW(AppConfig::fromEnvironment(), ConfigException);
    unsetenv("EMULATE_AD_MEMBEROF");

    set("MAP_MEMBER_GID", "abc");
    EXPECT_THROW(AppConfig::fromEnvironment(), ConfigException);
    unsetenv("MAP_MEMBER_GID");

    set("CROWD_TIMEOUT_SEC", "-5");
    EXPECT_THROW(AppConfig::fromEnvironment(), ConfigException);
}
