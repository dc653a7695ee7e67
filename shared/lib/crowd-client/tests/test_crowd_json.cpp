/**
 * @file test_crowd_json.cpp
 * @brief Unit tests for Crowd REST JSON conversion
 */

#include <gtest/gtest.h>
#include <crowdldap/crowd/crowd_json.h>

using namespace crowdldap::crowd;
using crowdldap::directory::CredentialStatus;

namespace {

Json::Value parse(const std::string& text) {
    auto json = parseJson(text);
    EXPECT_TRUE(json.has_value()) << text;
    return json ? *json : Json::Value();
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(CrowdJsonTest, ParseJson_Valid) {
    auto json = parseJson(R"({"name": "alice"})");
    ASSERT_TRUE(json.has_value());
    EXPECT_EQ((*json)["name"].asString(), "alice");
}

TEST(CrowdJsonTest, ParseJson_Malformed) {
    EXPECT_FALSE(parseJson("{not json").has_value());
    EXPECT_FALSE(parseJson("").has_value());
}

// ============================================================================
// Users
// ============================================================================

TEST(CrowdJsonTest, UserFromJson_StandardFields) {
    auto user = userFromJson(parse(R"({
        "name": "alice",
        "active": true,
        "first-name": "Alice",
        "last-name": "Liddell",
        "display-name": "Alice Liddell",
        "email": "alice@example.com"
    })"));

    EXPECT_EQ(user.name, "alice");
    EXPECT_EQ(user.attributes.at("cn"), std::vector<std::string>{"alice"});
    EXPECT_EQ(user.attributes.at("givenName"), std::vector<std::string>{"Alice"});
    EXPECT_EQ(user.attributes.at("sn"), std::vector<std::string>{"Liddell"});
    EXPECT_EQ(user.attributes.at("displayName"), std::vector<std::string>{"Alice Liddell"});
    EXPECT_EQ(user.attributes.at("mail"), std::vector<std::string>{"alice@example.com"});
}

TEST(CrowdJsonTest, UserFromJson_EmptyFieldsSkipped) {
    auto user = userFromJson(parse(R"({"name": "bob", "email": "", "first-name": null})"));
    EXPECT_EQ(user.attributes.count("mail"), 0u);
    EXPECT_EQ(user.attributes.count("givenName"), 0u);
}

TEST(CrowdJsonTest, UserFromJson_CustomAttributes) {
    auto user = userFromJson(parse(R"({
        "name": "alice",
        "email": "alice@example.com",
        "attributes": {"attributes": [
            {"name": "uidNumber", "values": ["1000"]},
            {"name": "loginShell", "values": ["/bin/bash", ""]},
            {"name": "mail", "values": ["other@example.com"]},
            {"name": "empty", "values": []}
        ]}
    })"));

    EXPECT_EQ(user.attributes.at("uidNumber"), std::vector<std::string>{"1000"});
    EXPECT_EQ(user.attributes.at("loginShell"), std::vector<std::string>{"/bin/bash"});
    // Standard fields win over custom attributes of the same name
    EXPECT_EQ(user.attributes.at("MAIL"), std::vector<std::string>{"alice@example.com"});
    EXPECT_EQ(user.attributes.count("empty"), 0u);
}

TEST(CrowdJsonTest, UserFromJson_NonObject) {
    EXPECT_TRUE(userFromJson(parse("[]")).name.empty());
    EXPECT_TRUE(userFromJson(parse("42")).name.empty());
}

TEST(CrowdJsonTest, UsersFromJson_List) {
    auto users = usersFromJson(parse(R"({"users": [
        {"name": "alice"}, {"name": ""}, {"link": "no-name"}, {"name": "bob"}
    ]})"));
    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users[0].name, "alice");
    EXPECT_EQ(users[1].name, "bob");

    EXPECT_TRUE(usersFromJson(parse(R"({"groups": []})")).empty());
}

// ============================================================================
// Groups
// ============================================================================

TEST(CrowdJsonTest, GroupFromJson) {
    auto group = groupFromJson(parse(R"({
        "name": "admins",
        "description": "Administrators",
        "attributes": {"attributes": [{"name": "gidNumber", "values": ["500"]}]}
    })"));
    EXPECT_EQ(group.name, "admins");
    EXPECT_EQ(group.attributes.at("description"), std::vector<std::string>{"Administrators"});
    EXPECT_EQ(group.attributes.at("gidNumber"), std::vector<std::string>{"500"});
    EXPECT_TRUE(group.memberUsers.empty());
}

TEST(CrowdJsonTest, GroupsFromJson_List) {
    auto groups = groupsFromJson(parse(R"({"groups": [{"name": "admins"}, {"name": "devs"}]})"));
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[1].name, "devs");
}

TEST(CrowdJsonTest, NamesFromJson) {
    auto names = namesFromJson(parse(R"({"groups": [{"name": "a"}, {"name": "b"}]})"), "groups");
    EXPECT_EQ(names, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(namesFromJson(parse(R"({"groups": [{"name": "a"}]})"), "users").empty());
}

// ============================================================================
// Authentication helpers
// ============================================================================

TEST(CrowdJsonTest, CredentialStatusFromError) {
    EXPECT_EQ(credentialStatusFromError(parse(R"({"reason": "USER_NOT_FOUND"})")),
              CredentialStatus::UNKNOWN_USER);
    EXPECT_EQ(credentialStatusFromError(parse(R"({"reason": "INACTIVE_ACCOUNT"})")),
              CredentialStatus::ACCOUNT_DISABLED);
    EXPECT_EQ(credentialStatusFromError(parse(R"({"reason": "EXPIRED_CREDENTIAL"})")),
              CredentialStatus::ACCOUNT_DISABLED);
    EXPECT_EQ(credentialStatusFromError(parse(R"({"reason": "INVALID_USER_AUTHENTICATION"})")),
              CredentialStatus::INVALID_CREDENTIALS);
    EXPECT_EQ(credentialStatusFromError(parse("{}")), CredentialStatus::INVALID_CREDENTIALS);
}

TEST(CrowdJsonTest, IsActive) {
    EXPECT_TRUE(isActive(parse(R"({"active": true})")));
    EXPECT_FALSE(isActive(parse(R"({"active": false})")));
    EXPECT_TRUE(isActive(parse(R"({"name": "alice"})")));
}

TEST(CrowdJsonTest, PasswordBody) {
    EXPECT_EQ(passwordBody("s3cret"), R"({"value":"s3cret"})");
    auto json = parse(passwordBody("with \"quotes\""));
    EXPECT_EQ(json["value"].asString(), "with \"quotes\"");
}
