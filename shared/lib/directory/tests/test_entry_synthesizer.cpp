/**
 * @file test_entry_synthesizer.cpp
 * @brief Unit tests for EntrySynthesizer - backend record -> LDAP entry
 */

#include <gtest/gtest.h>
#include <crowdldap/directory/entry_synthesizer.h>

using namespace crowdldap::directory;

class EntrySynthesizerTest : public ::testing::Test {
protected:
    BridgeConfig config_;
    DnMapper mapper_{config_};
    EntrySynthesizer synthesizer_{mapper_};
};

// ============================================================================
// Users
// ============================================================================

TEST_F(EntrySynthesizerTest, User_DnAndObjectClasses) {
    Identity alice{"alice", {{"mail", {"alice@example.com"}}}};
    Entry entry = synthesizer_.synthesizeUserEntry(alice);

    EXPECT_EQ(entry.dn(), mapper_.identityToDn("alice"));
    ASSERT_TRUE(entry.has("objectClass"));
    EXPECT_EQ(*entry.get("objectClass"),
              (std::vector<std::string>{"top", "person", "organizationalPerson", "inetOrgPerson"}));
    EXPECT_EQ(*entry.get("uid"), std::vector<std::string>{"alice"});
    EXPECT_EQ(*entry.get("MAIL"), std::vector<std::string>{"alice@example.com"});
}

TEST_F(EntrySynthesizerTest, User_CnDefaultsToName) {
    Entry entry = synthesizer_.synthesizeUserEntry(Identity{"bob", {}});
    EXPECT_EQ(*entry.get("cn"), std::vector<std::string>{"bob"});
}

TEST_F(EntrySynthesizerTest, User_CnAlwaysRecordName) {
    Entry entry = synthesizer_.synthesizeUserEntry(Identity{"bob", {{"cn", {"Robert"}}}});
    EXPECT_EQ(*entry.get("cn"), std::vector<std::string>{"bob"});
}

TEST_F(EntrySynthesizerTest, User_NamingAttributeComesFromRecordName) {
    Entry entry = synthesizer_.synthesizeUserEntry(Identity{"alice", {{"UID", {"mallory"}}}});
    EXPECT_EQ(*entry.get("uid"), std::vector<std::string>{"alice"});
}

TEST_F(EntrySynthesizerTest, User_MultiValuedOrderPreserved) {
    Entry entry = synthesizer_.synthesizeUserEntry(
        Identity{"alice", {{"mail", {"z@example.com", "a@example.com", "m@example.com"}}}});
    EXPECT_EQ(*entry.get("mail"),
              (std::vector<std::string>{"z@example.com", "a@example.com", "m@example.com"}));
}

TEST_F(EntrySynthesizerTest, User_EmptyAttributesOmitted) {
    Entry entry = synthesizer_.synthesizeUserEntry(
        Identity{"alice", {{"sn", {}}, {"givenName", {""}}, {"mail", {"", "a@x"}}}});
    EXPECT_FALSE(entry.has("sn"));
    EXPECT_FALSE(entry.has("givenName"));
    EXPECT_EQ(*entry.get("mail"), std::vector<std::string>{"a@x"});
}

TEST_F(EntrySynthesizerTest, User_Rfc2307AttributesPassThrough) {
    Entry entry = synthesizer_.synthesizeUserEntry(
        Identity{"alice", {{"uidNumber", {"1000"}}, {"gidNumber", {"100"}}, {"homeDirectory", {"/home/alice"}}}});
    EXPECT_EQ(*entry.get("uidNumber"), std::vector<std::string>{"1000"});
    EXPECT_EQ(*entry.get("homeDirectory"), std::vector<std::string>{"/home/alice"});
}

TEST_F(EntrySynthesizerTest, User_Deterministic) {
    Identity alice{"alice", {{"mail", {"a@x"}}, {"sn", {"Liddell"}}}};
    Entry first = synthesizer_.synthesizeUserEntry(alice);
    Entry second = synthesizer_.synthesizeUserEntry(alice);
    EXPECT_EQ(first.dn(), second.dn());
    EXPECT_EQ(first.attributes(), second.attributes());
}

// ============================================================================
// Groups
// ============================================================================

TEST_F(EntrySynthesizerTest, Group_UniqueMemberUsersThenGroups) {
    Group admins{"admins", {"alice", "bob"}, {"devs"}, {{"description", {"Administrators"}}}};
    Entry entry = synthesizer_.synthesizeGroupEntry(admins);

    EXPECT_EQ(entry.dn().toString(), "cn=admins,ou=groups,dc=crowd");
    EXPECT_EQ(*entry.get("objectClass"), (std::vector<std::string>{"top", "groupOfUniqueNames"}));
    EXPECT_EQ(*entry.get("cn"), std::vector<std::string>{"admins"});
    EXPECT_EQ(*entry.get("description"), std::vector<std::string>{"Administrators"});
    EXPECT_EQ(*entry.get("uniqueMember"), (std::vector<std::string>{
        "uid=alice,ou=users,dc=crowd",
        "uid=bob,ou=users,dc=crowd",
        "cn=devs,ou=groups,dc=crowd"}));
}

TEST_F(EntrySynthesizerTest, Group_NoMembersOmitsUniqueMember) {
    Entry entry = synthesizer_.synthesizeGroupEntry(Group{"empty", {}, {}, {}});
    EXPECT_FALSE(entry.has("uniqueMember"));
}

TEST_F(EntrySynthesizerTest, Group_BackendCannotOverrideMembers) {
    Entry entry = synthesizer_.synthesizeGroupEntry(
        Group{"g", {"alice"}, {}, {{"uniqueMember", {"cn=fake"}}}});
    EXPECT_EQ(*entry.get("uniqueMember"), std::vector<std::string>{"uid=alice,ou=users,dc=crowd"});
}

// ============================================================================
// Containers and memberOf
// ============================================================================

TEST_F(EntrySynthesizerTest, Container_ObjectClassFromRdnType) {
    Entry root = synthesizer_.synthesizeContainerEntry(mapper_.baseDn());
    EXPECT_EQ(*root.get("objectClass"), (std::vector<std::string>{"top", "domain"}));
    EXPECT_EQ(*root.get("dc"), std::vector<std::string>{"crowd"});

    Entry users = synthesizer_.synthesizeContainerEntry(mapper_.usersDn());
    EXPECT_EQ(*users.get("objectClass"), (std::vector<std::string>{"top", "organizationalUnit"}));
    EXPECT_EQ(*users.get("ou"), std::vector<std::string>{"users"});

    Entry org = synthesizer_.synthesizeContainerEntry(*Dn::parse("o=acme"));
    EXPECT_EQ(*org.get("objectClass"), (std::vector<std::string>{"top", "organization"}));

    Entry other = synthesizer_.synthesizeContainerEntry(*Dn::parse("l=berlin"));
    EXPECT_EQ(*other.get("objectClass"), (std::vector<std::string>{"top", "extensibleObject"}));
}

TEST_F(EntrySynthesizerTest, WithMemberOf_AddsValues) {
    Entry entry = synthesizer_.synthesizeUserEntry(Identity{"alice", {}});
    Entry withGroups = synthesizer_.withMemberOf(entry, {mapper_.groupToDn("admins"), mapper_.groupToDn("devs")});

    EXPECT_FALSE(entry.has("memberOf"));
    EXPECT_EQ(*withGroups.get("memberOf"), (std::vector<std::string>{
        "cn=admins,ou=groups,dc=crowd", "cn=devs,ou=groups,dc=crowd"}));
}

TEST_F(EntrySynthesizerTest, WithMemberOf_EmptyOmitsAttribute) {
    Entry entry = synthesizer_.synthesizeUserEntry(Identity{"alice", {}});
    EXPECT_FALSE(synthesizer_.withMemberOf(entry, {}).has("memberOf"));
}

// ============================================================================
// Entry projection
// ============================================================================

TEST_F(EntrySynthesizerTest, Project_RequestedAttributesOnly) {
    Entry entry = synthesizer_.synthesizeUserEntry(Identity{"alice", {{"mail", {"a@x"}}}});

    Entry projected = entry.project({"MAIL", "sn"});
    EXPECT_TRUE(projected.has("mail"));
    EXPECT_FALSE(projected.has("objectClass"));
    EXPECT_FALSE(projected.has("sn"));
    EXPECT_EQ(projected.dn(), entry.dn());

    EXPECT_EQ(entry.project({}).attributes(), entry.attributes());
    EXPECT_EQ(entry.project({"*"}).attributes(), entry.attributes());
    EXPECT_TRUE(entry.project({"1.1"}).attributes().empty());
}
