#include <gtest/gtest.h>
#include <conflux/config.hpp>
#include <conflux/priority.hpp>
#include <conflux/types.hpp>
#include <chrono>
#include "test_helpers.hpp"

using namespace conflux;
using test_utils::unit;

class TypesTest : public ::testing::Test {
protected:
    TimePoint now = TimePoint(std::chrono::hours(24 * 365 * 50));
};

// === LABELS ===

TEST_F(TypesTest, LabelsRoundTripThroughParsers) {
    EXPECT_EQ(parse_complexity(to_string(Complexity::Expert)), Complexity::Expert);
    EXPECT_EQ(parse_priority_tier(to_string(PriorityTier::Low)), PriorityTier::Low);
    EXPECT_EQ(parse_unit_status("in-progress"), UnitStatus::InProgress);
    EXPECT_EQ(parse_conflict_category("agent_busy"), ConflictCategory::AgentBusy);
    EXPECT_STREQ(to_string(ResolutionStrategy::PreemptLowerPriority), "preempt_lower_priority");
}

TEST_F(TypesTest, ParsersRejectUnknownLabels) {
    EXPECT_THROW(parse_complexity("trivial"), std::invalid_argument);
    EXPECT_THROW(parse_priority_tier("urgent"), std::invalid_argument);
    EXPECT_THROW(parse_unit_status("done"), std::invalid_argument);
    EXPECT_THROW(parse_conflict_category("overlap"), std::invalid_argument);
}

TEST_F(TypesTest, TerminalStatuses) {
    EXPECT_FALSE(is_terminal(UnitStatus::Pending));
    EXPECT_FALSE(is_terminal(UnitStatus::InProgress));
    EXPECT_TRUE(is_terminal(UnitStatus::Completed));
    EXPECT_TRUE(is_terminal(UnitStatus::Failed));
    EXPECT_TRUE(is_terminal(UnitStatus::Cancelled));
}

TEST_F(TypesTest, SeverityEscalationIsMonotonic) {
    EXPECT_EQ(escalate(Severity::High, Severity::Low), Severity::High);
    EXPECT_EQ(escalate(Severity::Low, Severity::Medium), Severity::Medium);
    EXPECT_EQ(escalate(Severity::Critical, Severity::High), Severity::Critical);
}

// === REPOSITORY IDS ===

TEST_F(TypesTest, RepositoryIdParsing) {
    RepositoryId id = RepositoryId::parse("acme/widgets");
    EXPECT_EQ(id.owner, "acme");
    EXPECT_EQ(id.name, "widgets");
    EXPECT_EQ(id.to_string(), "acme/widgets");

    EXPECT_THROW(RepositoryId::parse("widgets"), std::invalid_argument);
    EXPECT_THROW(RepositoryId::parse("/widgets"), std::invalid_argument);
    EXPECT_THROW(RepositoryId::parse("acme/"), std::invalid_argument);
    EXPECT_THROW(RepositoryId::parse("a/b/c"), std::invalid_argument);
}

TEST_F(TypesTest, RepositoryIdOrdering) {
    RepositoryId a("acme", "alpha");
    RepositoryId b("acme", "beta");
    RepositoryId c("zeta", "alpha");
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b < c);
    EXPECT_FALSE(a < a);
    EXPECT_NE(a, b);
}

// === PRIORITY SCORING ===

TEST_F(TypesTest, DefaultUnitScoresFifty) {
    EXPECT_EQ(calculate_priority(unit("U1"), now), 50);
}

TEST_F(TypesTest, PriorityCombinesTierComplexityAndType) {
    UnitOfWork high = unit("A").priority(PriorityTier::High).complexity(Complexity::Moderate);
    UnitOfWork low = unit("B").priority(PriorityTier::Low).complexity(Complexity::Complex);
    EXPECT_EQ(calculate_priority(high, now), 70);
    EXPECT_EQ(calculate_priority(low, now), 40);

    UnitOfWork docs = unit("C").type("documentation").complexity(Complexity::Simple);
    EXPECT_EQ(calculate_priority(docs, now), 20);
}

TEST_F(TypesTest, PriorityIsClampedToRange) {
    UnitOfWork urgent = unit("A").type("security").priority(PriorityTier::Critical)
                                 .complexity(Complexity::Expert).deadline(now + std::chrono::hours(2));
    EXPECT_EQ(calculate_priority(urgent, now), 100);

    UnitOfWork idle = unit("B").type("documentation").priority(PriorityTier::Low)
                               .complexity(Complexity::Simple);
    EXPECT_EQ(calculate_priority(idle, now), 0);
}

TEST_F(TypesTest, DeadlineAndBlockingRaisePriority) {
    EXPECT_EQ(calculate_priority(unit("A").deadline(now + std::chrono::hours(12)), now), 80);
    EXPECT_EQ(calculate_priority(unit("A").deadline(now + std::chrono::hours(48)), now), 70);
    EXPECT_EQ(calculate_priority(unit("A").deadline(now + std::chrono::hours(24 * 5)), now), 60);
    EXPECT_EQ(calculate_priority(unit("A").deadline(now + std::chrono::hours(24 * 10)), now), 50);
    EXPECT_EQ(calculate_priority(unit("A").blocks({"B", "C"}), now), 60);
}

// === MERGING ===

TEST_F(TypesTest, MergedUnitKeepsLinksToOriginals) {
    AgentCatalog catalog = AgentCatalog::default_catalog();
    UnitOfWork a = unit("A").title("Checkout flow").files({"x.js", "y.js"}).depends_on({"D", "B"})
                            .agent("junior-developer").complexity(Complexity::Simple)
                            .deadline(now + std::chrono::hours(10));
    UnitOfWork b = unit("B").title("Checkout page").files({"y.js", "z.js"}).depends_on({"E", "A"})
                            .agent("senior-developer").priority(PriorityTier::High)
                            .deadline(now + std::chrono::hours(5));

    UnitOfWork merged = make_merged_unit(a, b, catalog);

    EXPECT_EQ(merged.id, "merged_A_B");
    EXPECT_EQ(merged.title, "Combined: Checkout flow & Checkout page");
    EXPECT_EQ(merged.merged_from, (std::vector<UnitId>{"A", "B"}));
    EXPECT_EQ(merged.dependencies, (std::vector<UnitId>{"D", "E"}));
    EXPECT_EQ(merged.files, (std::vector<std::string>{"x.js", "y.js", "z.js"}));
    EXPECT_EQ(merged.complexity, Complexity::Moderate);
    EXPECT_EQ(merged.priority, PriorityTier::High);
    EXPECT_EQ(merged.assigned_agent, "senior-developer");
    ASSERT_TRUE(merged.deadline.has_value());
    EXPECT_EQ(*merged.deadline, now + std::chrono::hours(5));
}

TEST_F(TypesTest, MergedTypeFallsBackToFeature) {
    AgentCatalog catalog = AgentCatalog::default_catalog();
    EXPECT_EQ(make_merged_unit(unit("A").type("bug"), unit("B").type("bug"), catalog).type, "bug");
    EXPECT_EQ(make_merged_unit(unit("A").type("bug"), unit("B").type("testing"), catalog).type, "feature");
}

// === AGENT CATALOG ===

TEST_F(TypesTest, DefaultCatalogHasSixAgents) {
    AgentCatalog catalog = AgentCatalog::default_catalog();
    ASSERT_EQ(catalog.profiles().size(), 6u);
    EXPECT_EQ(catalog.profiles().front().name, "product-manager");
    EXPECT_EQ(catalog.profiles().back().name, "qa-engineer");
    EXPECT_TRUE(catalog.find("tech-lead")->has_capability("architecture"));
    EXPECT_EQ(catalog.rank_of("unknown-agent"), 1);
    EXPECT_EQ(catalog.base_minutes_of("unknown-agent"), 20u);
}

TEST_F(TypesTest, CatalogRejectsDuplicates) {
    AgentCatalog catalog;
    catalog.add({"reviewer", {"review"}, 2, 10});
    EXPECT_THROW(catalog.add({"reviewer", {}, 1, 5}), std::invalid_argument);
    EXPECT_THROW(catalog.add({"", {}, 1, 5}), std::invalid_argument);
}
