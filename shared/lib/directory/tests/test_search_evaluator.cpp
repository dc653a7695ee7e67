/**
 * @file test_search_evaluator.cpp
 * @brief Unit tests for SearchEvaluator and EntryCursor
 */

#include <gtest/gtest.h>
#include <crowdldap/directory/search_evaluator.h>
#include "test_helpers.h"

#include <memory>
#include <stdexcept>

using namespace crowdldap::directory;
using test_helpers::FakeDirectoryBackend;
using test_helpers::containsIgnoreCase;

class SearchEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_.addUser("alice", {{"mail", {"alice@example.com"}}, {"sn", {"Liddell"}}});
        backend_.addUser("bob", {{"mail", {"bob@example.com"}}});
        backend_.addUser("carol");
        backend_.addGroup("admins", {"alice"}, {"devs"}, {{"description", {"Administrators"}}});
        backend_.addGroup("devs", {"bob"});
    }

    /// Build the evaluator chain from the current config_
    SearchEvaluator& evaluator() {
        mapper_ = std::make_unique<DnMapper>(config_);
        synthesizer_ = std::make_unique<EntrySynthesizer>(*mapper_);
        resolver_ = std::make_unique<MemberOfResolver>(config_, *mapper_, &backend_);
        evaluator_ = std::make_unique<SearchEvaluator>(config_, *mapper_, *synthesizer_, *resolver_, &backend_);
        return *evaluator_;
    }

    std::vector<Entry> run(const std::string& base, SearchScope scope, const std::string& filter,
                           const std::vector<std::string>& attributes = {}) {
        auto cursor = evaluator().search(*Dn::parse(base), scope, Filter::parse(filter), attributes);
        std::vector<Entry> entries = cursor->collect();
        lastStatus_ = cursor->status();
        lastMessage_ = cursor->message();
        return entries;
    }

    static std::vector<std::string> dns(const std::vector<Entry>& entries) {
        std::vector<std::string> result;
        for (const auto& e : entries) result.push_back(e.dn().toString());
        return result;
    }

    BridgeConfig config_;
    FakeDirectoryBackend backend_;
    std::unique_ptr<DnMapper> mapper_;
    std::unique_ptr<EntrySynthesizer> synthesizer_;
    std::unique_ptr<MemberOfResolver> resolver_;
    std::unique_ptr<SearchEvaluator> evaluator_;
    SearchStatus lastStatus_ = SearchStatus::IN_PROGRESS;
    std::string lastMessage_;
};

// ============================================================================
// Scope handling
// ============================================================================

TEST_F(SearchEvaluatorTest, Root_SubtreeReturnsWholeTree) {
    auto entries = run("dc=crowd", SearchScope::SUBTREE, "(objectClass=*)");
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
    EXPECT_EQ(dns(entries), (std::vector<std::string>{
        "dc=crowd",
        "ou=users,dc=crowd",
        "uid=alice,ou=users,dc=crowd",
        "uid=bob,ou=users,dc=crowd",
        "uid=carol,ou=users,dc=crowd",
        "ou=groups,dc=crowd",
        "cn=admins,ou=groups,dc=crowd",
        "cn=devs,ou=groups,dc=crowd",
    }));
}

TEST_F(SearchEvaluatorTest, Root_BaseReturnsRootOnly) {
    auto entries = run("dc=crowd", SearchScope::BASE, "(objectClass=*)");
    EXPECT_EQ(dns(entries), std::vector<std::string>{"dc=crowd"});
    EXPECT_EQ(backend_.totalCalls(), 0);
}

TEST_F(SearchEvaluatorTest, Root_OneLevelReturnsBranches) {
    auto entries = run("dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)");
    EXPECT_EQ(dns(entries), (std::vector<std::string>{"ou=users,dc=crowd", "ou=groups,dc=crowd"}));
    EXPECT_EQ(backend_.totalCalls(), 0);
}

TEST_F(SearchEvaluatorTest, UsersBranch_Subtree) {
    auto entries = run("ou=users,dc=crowd", SearchScope::SUBTREE, "(objectClass=*)");
    EXPECT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries.front().dn().toString(), "ou=users,dc=crowd");
}

TEST_F(SearchEvaluatorTest, UsersBranch_OneLevelExcludesContainer) {
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)");
    EXPECT_EQ(entries.size(), 3u);
}

TEST_F(SearchEvaluatorTest, UsersBranch_BaseIsContainerOnly) {
    auto entries = run("ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)");
    EXPECT_EQ(dns(entries), std::vector<std::string>{"ou=users,dc=crowd"});
    EXPECT_EQ(backend_.totalCalls(), 0);
}

TEST_F(SearchEvaluatorTest, ObjectClassFilter) {
    EXPECT_EQ(run("dc=crowd", SearchScope::SUBTREE, "(objectClass=inetOrgPerson)").size(), 3u);
    EXPECT_EQ(run("dc=crowd", SearchScope::SUBTREE, "(objectClass=groupOfUniqueNames)").size(), 2u);
}

TEST_F(SearchEvaluatorTest, UserEntry_Base) {
    auto entries = run("uid=alice,ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(*entries[0].get("mail"), std::vector<std::string>{"alice@example.com"});
    EXPECT_EQ(backend_.findUserCalls.load(), 1);
    EXPECT_EQ(backend_.listUsersCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, UserEntry_OneLevelIsEmpty) {
    auto entries = run("uid=alice,ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)");
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
    EXPECT_EQ(backend_.totalCalls(), 0);
}

TEST_F(SearchEvaluatorTest, UserEntry_FilterMismatch) {
    auto entries = run("uid=carol,ou=users,dc=crowd", SearchScope::BASE, "(mail=*)");
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
}

TEST_F(SearchEvaluatorTest, MissingEntry_IsEmptySuccess) {
    auto entries = run("uid=nobody,ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)");
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
}

TEST_F(SearchEvaluatorTest, GroupEntry_Base) {
    auto entries = run("cn=admins,ou=groups,dc=crowd", SearchScope::BASE, "(objectClass=*)");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(*entries[0].get("uniqueMember"), (std::vector<std::string>{
        "uid=alice,ou=users,dc=crowd", "cn=devs,ou=groups,dc=crowd"}));
}

TEST_F(SearchEvaluatorTest, OutsideBase_IsEmptyWithoutBackendCalls) {
    auto entries = run("dc=example,dc=com", SearchScope::SUBTREE, "(objectClass=*)");
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
    EXPECT_EQ(backend_.totalCalls(), 0);
}

// ============================================================================
// Point lookups vs listings
// ============================================================================

TEST_F(SearchEvaluatorTest, AnchoredUid_UsesPointLookup) {
    auto entries = run("ou=users,dc=crowd", SearchScope::SUBTREE, "(&(objectClass=person)(uid=alice))");
    EXPECT_EQ(dns(entries), std::vector<std::string>{"uid=alice,ou=users,dc=crowd"});
    EXPECT_EQ(backend_.findUserCalls.load(), 1);
    EXPECT_EQ(backend_.listUsersCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, AnchoredCn_UsesPointLookup) {
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(cn=bob)");
    EXPECT_EQ(dns(entries), std::vector<std::string>{"uid=bob,ou=users,dc=crowd"});
    EXPECT_EQ(backend_.listUsersCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, AnchoredOr_LooksUpEachName) {
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(|(uid=alice)(uid=bob)(uid=ghost))");
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(backend_.findUserCalls.load(), 3);
    EXPECT_EQ(backend_.listUsersCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, AnchoredGroupName_FromRoot) {
    auto entries = run("dc=crowd", SearchScope::SUBTREE, "(cn=admins)");
    EXPECT_EQ(dns(entries), std::vector<std::string>{"cn=admins,ou=groups,dc=crowd"});
    EXPECT_EQ(backend_.listUsersCalls.load(), 0);
    EXPECT_EQ(backend_.listGroupsCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, UnanchoredFilter_UsesListing) {
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(mail=*@example.com)");
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(backend_.listUsersCalls.load(), 1);
    EXPECT_EQ(backend_.findUserCalls.load(), 0);
}

// ============================================================================
// Size limit
// ============================================================================

TEST_F(SearchEvaluatorTest, SizeLimit_ExceededIsSignalled) {
    config_.searchSizeLimit = 2;
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)");
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(lastStatus_, SearchStatus::SIZE_LIMIT_EXCEEDED);
    EXPECT_FALSE(lastMessage_.empty());
    EXPECT_EQ(backend_.lastListMax.load(), 3u);
}

TEST_F(SearchEvaluatorTest, SizeLimit_ExactlyAtLimitIsSuccess) {
    config_.searchSizeLimit = 3;
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)");
    EXPECT_EQ(entries.size(), 3u);
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
}

TEST_F(SearchEvaluatorTest, SizeLimit_StopsRemainingBranches) {
    config_.searchSizeLimit = 2;
    run("dc=crowd", SearchScope::SUBTREE, "(objectClass=*)");
    EXPECT_EQ(lastStatus_, SearchStatus::SIZE_LIMIT_EXCEEDED);
    EXPECT_EQ(backend_.listGroupsCalls.load(), 0);
}

// ============================================================================
// Backend outage
// ============================================================================

TEST_F(SearchEvaluatorTest, Outage_ListingReportsUnavailable) {
    backend_.unavailable = true;
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)");
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(lastStatus_, SearchStatus::BACKEND_UNAVAILABLE);
    EXPECT_FALSE(lastMessage_.empty());
}

TEST_F(SearchEvaluatorTest, Outage_LookupIsNotNoSuchObject) {
    backend_.unavailable = true;
    auto entries = run("uid=alice,ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)");
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(lastStatus_, SearchStatus::BACKEND_UNAVAILABLE);
}

// ============================================================================
// Attribute projection
// ============================================================================

TEST_F(SearchEvaluatorTest, Projection_ReturnsRequestedAttributesOnly) {
    auto entries = run("uid=alice,ou=users,dc=crowd", SearchScope::BASE, "(sn=liddell)", {"mail"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].has("mail"));
    EXPECT_FALSE(entries[0].has("sn"));
    EXPECT_FALSE(entries[0].has("objectClass"));
}

TEST_F(SearchEvaluatorTest, Projection_NoAttributes) {
    auto entries = run("uid=alice,ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)", {"1.1"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].attributes().empty());
}

// ============================================================================
// memberOf emulation
// ============================================================================

TEST_F(SearchEvaluatorTest, MemberOf_DirectGroups) {
    config_.emulateMemberOf = true;
    auto entries = run("uid=bob,ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)", {"memberOf"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(*entries[0].get("memberOf"), std::vector<std::string>{"cn=devs,ou=groups,dc=crowd"});
}

TEST_F(SearchEvaluatorTest, MemberOf_NestedGroups) {
    config_.emulateMemberOf = true;
    config_.includeNestedGroups = true;
    auto entries = run("uid=bob,ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)", {"memberOf"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(*entries[0].get("memberOf"), (std::vector<std::string>{
        "cn=devs,ou=groups,dc=crowd", "cn=admins,ou=groups,dc=crowd"}));
}

TEST_F(SearchEvaluatorTest, MemberOf_OnGroupEntries) {
    config_.emulateMemberOf = true;
    auto entries = run("cn=devs,ou=groups,dc=crowd", SearchScope::BASE, "(objectClass=*)");
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_TRUE(entries[0].has("memberOf"));
    EXPECT_EQ(*entries[0].get("memberOf"), std::vector<std::string>{"cn=admins,ou=groups,dc=crowd"});
}

TEST_F(SearchEvaluatorTest, MemberOf_DisabledNeverComputed) {
    config_.emulateMemberOf = false;
    auto entries = run("uid=bob,ou=users,dc=crowd", SearchScope::BASE, "(objectClass=*)", {"memberOf"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_FALSE(entries[0].has("memberOf"));
    EXPECT_EQ(backend_.directGroupsCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, MemberOf_NotRequestedNotComputed) {
    config_.emulateMemberOf = true;
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)", {"mail", "cn"});
    EXPECT_EQ(entries.size(), 3u);
    EXPECT_EQ(backend_.directGroupsCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, MemberOf_InFilterNested) {
    config_.emulateMemberOf = true;
    config_.includeNestedGroups = true;
    auto entries = run("ou=users,dc=crowd", SearchScope::SUBTREE,
                       "(memberOf=cn=admins,ou=groups,dc=crowd)", {"uid"});
    EXPECT_EQ(dns(entries), (std::vector<std::string>{
        "uid=alice,ou=users,dc=crowd", "uid=bob,ou=users,dc=crowd"}));
    EXPECT_FALSE(entries[0].has("memberOf"));
}

TEST_F(SearchEvaluatorTest, MemberOf_InFilterDirectOnly) {
    config_.emulateMemberOf = true;
    auto entries = run("ou=users,dc=crowd", SearchScope::SUBTREE, "(memberOf=cn=admins,ou=groups,dc=crowd)");
    EXPECT_EQ(dns(entries), std::vector<std::string>{"uid=alice,ou=users,dc=crowd"});
}

TEST_F(SearchEvaluatorTest, MemberOf_ResolutionFailureFailsSearch) {
    config_.emulateMemberOf = true;
    config_.includeNestedGroups = true;
    backend_.failingGroups.insert("devs");
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(objectClass=*)", {"memberOf"});
    EXPECT_EQ(lastStatus_, SearchStatus::BACKEND_UNAVAILABLE);
    EXPECT_TRUE(entries.empty());
}

TEST_F(SearchEvaluatorTest, MemberOf_NotResolvedForNonMatchingEntries) {
    config_.emulateMemberOf = true;
    config_.includeNestedGroups = true;
    backend_.failingGroups.insert("devs");
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(mail=nobody*)");
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(backend_.directGroupsCalls.load(), 0);
}

TEST_F(SearchEvaluatorTest, MemberOf_ResolvedOnlyForHits) {
    config_.emulateMemberOf = true;
    config_.includeNestedGroups = true;
    backend_.failingGroups.insert("devs");
    // bob's membership would fail; only alice matches
    auto entries = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(mail=alice*)");
    EXPECT_EQ(lastStatus_, SearchStatus::SUCCESS);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(*entries[0].get("memberOf"), std::vector<std::string>{"cn=admins,ou=groups,dc=crowd"});
    EXPECT_EQ(backend_.directGroupsCalls.load(), 2);
}

TEST_F(SearchEvaluatorTest, NeedsMemberOf) {
    config_.emulateMemberOf = true;
    SearchEvaluator& eval = evaluator();
    EXPECT_TRUE(eval.needsMemberOf(Filter::matchAll(), {}));
    EXPECT_TRUE(eval.needsMemberOf(Filter::matchAll(), {"*"}));
    EXPECT_TRUE(eval.needsMemberOf(Filter::matchAll(), {"MEMBEROF"}));
    EXPECT_TRUE(eval.needsMemberOf(Filter::parse("(memberOf=cn=x)"), {"uid"}));
    EXPECT_FALSE(eval.needsMemberOf(Filter::matchAll(), {"uid"}));
}

// ============================================================================
// Cursor behaviour
// ============================================================================

TEST_F(SearchEvaluatorTest, Cursor_IsLazy) {
    auto cursor = evaluator().search(*Dn::parse("ou=users,dc=crowd"), SearchScope::ONE_LEVEL,
                                     Filter::matchAll(), {});
    EXPECT_EQ(backend_.totalCalls(), 0);
    EXPECT_EQ(cursor->status(), SearchStatus::IN_PROGRESS);

    Entry entry{Dn(), AttributeMap{}};
    ASSERT_TRUE(cursor->next(entry));
    EXPECT_EQ(backend_.listUsersCalls.load(), 1);
}

TEST_F(SearchEvaluatorTest, Cursor_Abandon) {
    auto cursor = evaluator().search(*Dn::parse("dc=crowd"), SearchScope::SUBTREE, Filter::matchAll(), {});

    Entry entry{Dn(), AttributeMap{}};
    ASSERT_TRUE(cursor->next(entry));
    cursor->abandon();

    EXPECT_FALSE(cursor->next(entry));
    EXPECT_EQ(cursor->status(), SearchStatus::ABANDONED);
    EXPECT_EQ(backend_.totalCalls(), 0);
}

TEST(EntryCursorTest, EmptyCursor) {
    auto cursor = EntryCursor::empty();
    Entry entry{Dn(), AttributeMap{}};
    EXPECT_FALSE(cursor->next(entry));
    EXPECT_EQ(cursor->status(), SearchStatus::SUCCESS);
}

TEST(EntryCursorTest, UnavailableCursor) {
    auto cursor = EntryCursor::unavailable("backend down");
    EXPECT_TRUE(cursor->collect().empty());
    EXPECT_EQ(cursor->status(), SearchStatus::BACKEND_UNAVAILABLE);
    EXPECT_EQ(cursor->message(), "backend down");
}

TEST(EntryCursorTest, SizeLimitStepDeliversThenStops) {
    int laterSteps = 0;
    std::vector<EntryCursor::Step> steps;
    steps.push_back([](std::deque<Entry>& out, std::string& message) {
        out.emplace_back(*Dn::parse("cn=a"), AttributeMap{{"cn", {"a"}}});
        out.emplace_back(*Dn::parse("cn=b"), AttributeMap{{"cn", {"b"}}});
        message = "limit";
        return SearchStatus::SIZE_LIMIT_EXCEEDED;
    });
    steps.push_back([&laterSteps](std::deque<Entry>&, std::string&) {
        laterSteps++;
        return SearchStatus::SUCCESS;
    });

    EntryCursor cursor(std::move(steps), {"cn"});
    auto entries = cursor.collect();
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(cursor.status(), SearchStatus::SIZE_LIMIT_EXCEEDED);
    EXPECT_EQ(cursor.message(), "limit");
    EXPECT_EQ(laterSteps, 0);
}

TEST(EntryCursorTest, StatusToString) {
    EXPECT_EQ(searchStatusToString(SearchStatus::SIZE_LIMIT_EXCEEDED), "SIZE_LIMIT_EXCEEDED");
    EXPECT_EQ(searchStatusToString(SearchStatus::ABANDONED), "ABANDONED");
}

TEST_F(SearchEvaluatorTest, NullBackend_Throws) {
    DnMapper mapper(config_);
    EntrySynthesizer synthesizer(mapper);
    MemberOfResolver resolver(config_, mapper, &backend_);
    EXPECT_THROW(SearchEvaluator(config_, mapper, synthesizer, resolver, nullptr), std::invalid_argument);
}

// ============================================================================
// cn anchoring
// ============================================================================

TEST_F(SearchEvaluatorTest, CnEqualityAgreesWithSubstring) {
    backend_.addUser("dave", {{"cn", {"Dave Smith"}}, {"mail", {"dave@example.com"}}});

    auto equality = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(cn=dave)");
    auto substring = run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(cn=dav*)");
    EXPECT_EQ(dns(equality), std::vector<std::string>{"uid=dave,ou=users,dc=crowd"});
    EXPECT_EQ(dns(substring), dns(equality));

    EXPECT_TRUE(run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(cn=Dave Smith)").empty());
    EXPECT_TRUE(run("ou=users,dc=crowd", SearchScope::ONE_LEVEL, "(cn=Dave S*)").empty());
}
