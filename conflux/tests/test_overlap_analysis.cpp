#include <gtest/gtest.h>
#include <conflux/overlap_analysis.hpp>
#include "test_helpers.hpp"

using namespace conflux;
using test_utils::unit;

class OverlapAnalysisTest : public ::testing::Test {
protected:
    TaskContextExtractor extractor;
    OverlapAnalyzer analyzer{extractor};

    static PairOverlap with_severity(Severity severity) {
        PairOverlap overlap;
        overlap.first = "A";
        overlap.second = "B";
        overlap.kinds.push_back(OverlapKind::File);
        overlap.severity = severity;
        return overlap;
    }
};

// === PAIR ANALYSIS ===

TEST_F(OverlapAnalysisTest, DisjointUnitsDoNotOverlap) {
    PairOverlap overlap = analyzer.analyze_pair(unit("A").files({"a.js"}), unit("B").files({"b.js"}));
    EXPECT_FALSE(overlap.has_overlap());
    EXPECT_EQ(overlap.label(), "");
}

TEST_F(OverlapAnalysisTest, FileSeverityFollowsSharedCount) {
    auto one = analyzer.analyze_pair(unit("A").files({"a"}), unit("B").files({"a", "z"}));
    auto two = analyzer.analyze_pair(unit("A").files({"a", "b"}), unit("B").files({"a", "b"}));
    auto four = analyzer.analyze_pair(unit("A").files({"a", "b", "c", "d"}), unit("B").files({"a", "b", "c", "d"}));

    EXPECT_EQ(one.severity, Severity::Low);
    EXPECT_EQ(two.severity, Severity::Medium);
    EXPECT_EQ(four.severity, Severity::High);
    EXPECT_EQ(one.label(), "file_overlap");
    EXPECT_EQ(one.shared_files, (std::vector<std::string>{"a"}));
}

TEST_F(OverlapAnalysisTest, KindsCombineInDetectionOrder) {
    PairOverlap overlap = analyzer.analyze_pair(
        unit("A").type("bug").title("Payment retry").files({"pay.js"}),
        unit("B").type("bug").title("Payment receipt").files({"pay.js"}));

    EXPECT_TRUE(overlap.has(OverlapKind::File));
    EXPECT_TRUE(overlap.has(OverlapKind::Module));
    EXPECT_TRUE(overlap.has(OverlapKind::Conceptual));
    EXPECT_FALSE(overlap.has(OverlapKind::Dependency));
    EXPECT_EQ(overlap.label(), "file_and_module_overlap_and_conceptual");
    EXPECT_EQ(overlap.severity, Severity::High);
    EXPECT_EQ(overlap.shared_modules, (std::vector<std::string>{"payment-service"}));
    EXPECT_EQ(overlap.patterns, (std::vector<std::string>{"same_feature_area:payment"}));
}

TEST_F(OverlapAnalysisTest, CircularDependencyIsCritical) {
    PairOverlap overlap = analyzer.analyze_pair(unit("A").depends_on({"B"}), unit("B").depends_on({"A"}));

    EXPECT_TRUE(overlap.circular);
    EXPECT_EQ(overlap.severity, Severity::Critical);
    EXPECT_EQ(overlap.label(), "dependency_overlap");
}

TEST_F(OverlapAnalysisTest, BlockingAndSharedDependencies) {
    auto blocking = analyzer.analyze_pair(unit("A").blocks({"B"}), unit("B"));
    EXPECT_TRUE(blocking.blocking);
    EXPECT_EQ(blocking.severity, Severity::High);

    auto shared = analyzer.analyze_pair(unit("A").depends_on({"X"}), unit("B").depends_on({"X"}));
    EXPECT_EQ(shared.shared_dependencies, (std::vector<UnitId>{"X"}));
    EXPECT_EQ(shared.severity, Severity::Medium);
}

TEST_F(OverlapAnalysisTest, ConceptualSeverityFollowsSimilarity) {
    auto overlap = analyzer.analyze_pair(unit("A").type("bug").title("checkout cart summary"),
                                         unit("B").type("bug").title("checkout cart summary view"));
    ASSERT_TRUE(overlap.has(OverlapKind::Conceptual));
    EXPECT_DOUBLE_EQ(overlap.similarity, 0.75);
    EXPECT_EQ(overlap.severity, Severity::High);
    EXPECT_EQ(overlap.common_keywords, (std::vector<std::string>{"checkout", "cart", "summary"}));
}

// === BATCH DETECTION ===

TEST_F(OverlapAnalysisTest, DetectReportsOnlyOverlappingPairs) {
    OverlapReport report = analyzer.detect({
        unit("U1").files({"a.js"}), unit("U2").files({"a.js", "b.js"}), unit("U3").files({"c.js"})
    });

    EXPECT_EQ(report.total_units, 3u);
    ASSERT_EQ(report.overlaps.size(), 1u);
    EXPECT_EQ(report.overlaps[0].first, "U1");
    EXPECT_EQ(report.overlaps[0].second, "U2");
    EXPECT_EQ(report.risk_level, RiskLevel::Low);
    ASSERT_EQ(report.recommendations.size(), 1u);
    EXPECT_EQ(report.recommendations[0].kind, "task_sequencing");
    EXPECT_EQ(report.recommendations[0].affected_units, (std::vector<UnitId>{"U1", "U2"}));
}

TEST_F(OverlapAnalysisTest, RiskLevelThresholds) {
    EXPECT_EQ(OverlapAnalyzer::risk_level({}), RiskLevel::None);
    EXPECT_EQ(OverlapAnalyzer::risk_level({with_severity(Severity::Low), with_severity(Severity::Critical)}),
              RiskLevel::Critical);
    EXPECT_EQ(OverlapAnalyzer::risk_level({with_severity(Severity::High), with_severity(Severity::High),
                                           with_severity(Severity::High)}), RiskLevel::High);
    EXPECT_EQ(OverlapAnalyzer::risk_level({with_severity(Severity::High)}), RiskLevel::Medium);

    std::vector<PairOverlap> mediums(3, with_severity(Severity::Medium));
    EXPECT_EQ(OverlapAnalyzer::risk_level(mediums), RiskLevel::Low);
    mediums.push_back(with_severity(Severity::Medium));
    EXPECT_EQ(OverlapAnalyzer::risk_level(mediums), RiskLevel::Medium);
}

TEST_F(OverlapAnalysisTest, RecommendationsKeepFixedOrder) {
    PairOverlap dependency;
    dependency.first = "C";
    dependency.second = "D";
    dependency.kinds = {OverlapKind::Dependency};

    PairOverlap file = with_severity(Severity::Low);

    auto recommendations = OverlapAnalyzer::recommendations({dependency, file});
    ASSERT_EQ(recommendations.size(), 2u);
    EXPECT_EQ(recommendations[0].kind, "task_sequencing");
    EXPECT_EQ(recommendations[1].kind, "dependency_restructuring");
    EXPECT_EQ(recommendations[1].priority, Severity::Critical);
    EXPECT_EQ(recommendations[1].affected_units, (std::vector<UnitId>{"C", "D"}));
}

// === TASK SET VALIDATION ===

TEST_F(OverlapAnalysisTest, ValidateTaskSetReportsFirstMatchingKind) {
    std::vector<UnitOfWork> proposed = {
        unit("A").files({"x.js"}),
        unit("B").files({"x.js"}),
        unit("C").type("bug").title("Checkout summary totals"),
        unit("D").type("bug").title("Checkout summary layout"),
    };
    TaskSetValidation validation = analyzer.validate_task_set(proposed, {});

    EXPECT_FALSE(validation.valid);
    ASSERT_EQ(validation.internal_conflicts.size(), 2u);
    EXPECT_EQ(validation.internal_conflicts[0].kind, OverlapKind::File);
    EXPECT_EQ(validation.internal_conflicts[0].severity, Severity::Medium);
    EXPECT_EQ(validation.internal_conflicts[0].description, "Both tasks modify: x.js");
    EXPECT_EQ(validation.internal_conflicts[1].kind, OverlapKind::Conceptual);
    EXPECT_EQ(validation.internal_conflicts[1].details, (std::vector<std::string>{"checkout", "summary"}));

    ASSERT_EQ(validation.recommendations.size(), 2u);
    EXPECT_EQ(validation.recommendations[0].kind, "task_sequencing");
    EXPECT_EQ(validation.recommendations[1].kind, "coordination");
}

TEST_F(OverlapAnalysisTest, ValidateTaskSetChecksActiveUnits) {
    std::vector<UnitOfWork> active = {unit("X").type("bug").title("User signup email")};
    std::vector<UnitOfWork> proposed = {
        unit("P").type("bug").title("User avatar upload"),
        unit("Q").depends_on({"R"}),
        unit("R"),
    };
    TaskSetValidation validation = analyzer.validate_task_set(proposed, active);

    ASSERT_EQ(validation.internal_conflicts.size(), 1u);
    EXPECT_EQ(validation.internal_conflicts[0].kind, OverlapKind::Dependency);
    EXPECT_EQ(validation.internal_conflicts[0].severity, Severity::Critical);

    ASSERT_EQ(validation.active_conflicts.size(), 1u);
    EXPECT_EQ(validation.active_conflicts[0].proposed, "P");
    EXPECT_EQ(validation.active_conflicts[0].other, "X");
    EXPECT_EQ(validation.active_conflicts[0].kind, OverlapKind::Module);
    EXPECT_EQ(validation.active_conflicts[0].details, (std::vector<std::string>{"user-service"}));
}

TEST_F(OverlapAnalysisTest, IndependentSetIsValid) {
    TaskSetValidation validation = analyzer.validate_task_set(
        {unit("A").files({"a.js"}), unit("B").files({"b.js"})}, {unit("C").files({"c.js"})});
    EXPECT_TRUE(validation.valid);
    EXPECT_TRUE(validation.recommendations.empty());
}
