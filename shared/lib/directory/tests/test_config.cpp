/**
 * @file test_config.cpp
 * @brief Unit tests for BridgeConfig validation
 */

#include <gtest/gtest.h>
#include <crowdldap/directory/config.h>
#include "exceptions.h"

using namespace crowdldap::directory;
using crowdldap::common::ConfigException;

TEST(BridgeConfigTest, Defaults_AreValid) {
    BridgeConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.baseDn, "dc=crowd");
    EXPECT_EQ(config.usersRdn, "ou=users");
    EXPECT_EQ(config.groupsRdn, "ou=groups");
    EXPECT_FALSE(config.emulateMemberOf);
    EXPECT_FALSE(config.includeNestedGroups);
    EXPECT_FALSE(config.memberOfTemplate.isSet());
}

TEST(BridgeConfigTest, EmptyNamingAttribute_Throws) {
    BridgeConfig config;
    config.userNamingAttribute = "";
    EXPECT_THROW(config.validate(), ConfigException);

    BridgeConfig groups;
    groups.groupNamingAttribute = "";
    EXPECT_THROW(groups.validate(), ConfigException);
}

TEST(BridgeConfigTest, ZeroSizeLimit_Throws) {
    BridgeConfig config;
    config.searchSizeLimit = 0;
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(BridgeConfigTest, EmptyTemplateComponent_Throws) {
    BridgeConfig config;
    config.memberOfTemplate.ou = "";
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(BridgeConfigTest, EmptySelector_Throws) {
    BridgeConfig config;
    config.memberOfGroupSelector = "";
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(BridgeConfigTest, SizeLimitAboveMaximum_Throws) {
    BridgeConfig config;
    config.searchSizeLimit = kMaxSearchSizeLimit;
    EXPECT_NO_THROW(config.validate());

    config.searchSizeLimit = kMaxSearchSizeLimit + 1;
    EXPECT_THROW(config.validate(), ConfigException);

    config.searchSizeLimit = static_cast<size_t>(-1);
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(BridgeConfigTest, NonNumericSelector_Throws) {
    BridgeConfig config;
    config.memberOfGroupSelector = "wheel";
    EXPECT_THROW(config.validate(), ConfigException);

    config.memberOfGroupSelector = "007";
    EXPECT_NO_THROW(config.validate());
}

TEST(BridgeConfigTest, ParseGidNumber) {
    EXPECT_EQ(parseGidNumber("500").value_or(-1), 500);
    EXPECT_EQ(parseGidNumber(" 007 ").value_or(-1), 7);
    EXPECT_FALSE(parseGidNumber("").has_value());
    EXPECT_FALSE(parseGidNumber("-1").has_value());
    EXPECT_FALSE(parseGidNumber("5a").has_value());
}

TEST(BridgeConfigTest, TemplateIsSet_AnyComponent) {
    MemberOfTemplate tpl;
    EXPECT_FALSE(tpl.isSet());
    tpl.dc = "example";
    EXPECT_TRUE(tpl.isSet());
}
