#include <gtest/gtest.h>
#include <conflux/dependency_planner.hpp>
#include <conflux/reservation_manager.hpp>
#include <conflux/resolution.hpp>
#include <memory>
#include "test_helpers.hpp"

using namespace conflux;
using test_utils::unit;

class ResolutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<test_utils::ManualTimeSource>();
        manager = std::make_unique<ReservationManager>(SchedulerConfig{}, AgentCatalog::default_catalog(), clock);
    }

    Resolution resolve(const UnitOfWork& candidate, const ResolutionOptions& options = {}) {
        return manager->resolve_task_conflicts(candidate, repo, options);
    }

    static ResolutionOptions no_split() {
        ResolutionOptions options;
        options.allow_split = false;
        return options;
    }

    static ResolutionOptions no_merge() {
        ResolutionOptions options;
        options.allow_merge = false;
        return options;
    }

    std::shared_ptr<test_utils::ManualTimeSource> clock;
    std::unique_ptr<ReservationManager> manager;
    RepositoryId repo{"acme", "shop"};
};

TEST_F(ResolutionTest, CompatibleUnitNeedsNoResolution) {
    Resolution resolution = resolve(unit("A").files({"a.js"}).agent("qa-engineer"));
    EXPECT_TRUE(resolution.resolved);
    EXPECT_EQ(resolution.strategy, ResolutionStrategy::NoConflict);
    EXPECT_TRUE(manager->resolution_history(repo).empty());
}

// === FILE OVERLAP ===

TEST_F(ResolutionTest, SmallFileOverlapIsSequenced) {
    manager->reserve_branch(unit("A").files({"x.js"}), "senior-developer", repo);
    Resolution resolution = resolve(unit("B").files({"x.js", "y.js"}).agent("qa-engineer"));

    ASSERT_TRUE(resolution.resolved);
    EXPECT_EQ(resolution.strategy, ResolutionStrategy::SequenceAfterConflicts);
    EXPECT_EQ(resolution.added_dependencies, (std::vector<UnitId>{"A"}));
    EXPECT_TRUE(resolution.unit.depends_on("A"));
    EXPECT_EQ(resolution.estimated_wait_minutes, 60u);
}

TEST_F(ResolutionTest, DifferentKindsOfChangeAreSequenced) {
    manager->reserve_branch(unit("A").files({"x.js", "y.js"}), "senior-developer", repo);
    Resolution resolution = resolve(unit("B").type("bug").files({"x.js", "y.js"}).agent("qa-engineer"));
    EXPECT_EQ(resolution.strategy, ResolutionStrategy::SequenceAfterConflicts);
}

TEST_F(ResolutionTest, HeavyOverlapSplitsOffFreeFiles) {
    manager->reserve_branch(unit("A").files({"x.js", "y.js"}), "senior-developer", repo);
    Resolution resolution = resolve(unit("B").files({"x.js", "y.js", "z.js"}).agent("qa-engineer"));

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::SplitTask);
    ASSERT_EQ(resolution.sub_units.size(), 2u);

    const UnitOfWork& first = resolution.sub_units[0];
    const UnitOfWork& second = resolution.sub_units[1];
    EXPECT_EQ(first.id, "B-part1");
    EXPECT_EQ(first.files, (std::vector<std::string>{"z.js"}));
    EXPECT_EQ(first.parent_id, std::optional<UnitId>("B"));
    EXPECT_EQ(second.id, "B-part2");
    EXPECT_EQ(second.files, (std::vector<std::string>{"x.js", "y.js"}));
    EXPECT_TRUE(second.depends_on("A"));
    EXPECT_TRUE(second.depends_on("B-part1"));
    EXPECT_EQ(resolution.unit.id, "B-part1");
}

TEST_F(ResolutionTest, HigherPriorityPreempts) {
    manager->reserve_branch(unit("P40").files({"a.js", "b.js"})
                                       .priority(PriorityTier::Low).complexity(Complexity::Complex),
                            "qa-engineer", repo);
    Resolution resolution = resolve(unit("P70").files({"a.js", "b.js"})
                                               .priority(PriorityTier::High).agent("senior-developer"));

    ASSERT_TRUE(resolution.resolved);
    EXPECT_EQ(resolution.strategy, ResolutionStrategy::PreemptLowerPriority);
    EXPECT_EQ(resolution.preempted_units, (std::vector<UnitId>{"P40"}));
}

TEST_F(ResolutionTest, LowerPriorityIsQueued) {
    manager->reserve_branch(unit("H70").files({"a.js", "b.js"}).priority(PriorityTier::High),
                            "senior-developer", repo);
    Resolution resolution = resolve(unit("L40").files({"a.js", "b.js"})
                                               .priority(PriorityTier::Low).complexity(Complexity::Complex)
                                               .agent("qa-engineer"));

    EXPECT_EQ(resolution.strategy, ResolutionStrategy::IntelligentQueue);
    EXPECT_EQ(resolution.queue_position, 1u);
    EXPECT_EQ(resolution.estimated_wait_minutes, 60u);
}

// === MODULE OVERLAP ===

TEST_F(ResolutionTest, DisjointLayersWorkSideBySide) {
    manager->reserve_branch(unit("A").type("bug").title("User profile database schema"), "senior-developer", repo);
    Resolution resolution = resolve(unit("B").type("bug").title("User profile page layout").agent("qa-engineer"));

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::LayerSeparation);
    EXPECT_EQ(resolution.layers.at("A"), (std::set<std::string>{"data"}));
    EXPECT_EQ(resolution.layers.at("B"), (std::set<std::string>{"presentation"}));
}

TEST_F(ResolutionTest, SimilarModuleWorkIsMerged) {
    manager->reserve_branch(unit("A").type("bug").title("User avatar upload"), "senior-developer", repo);
    Resolution resolution = resolve(unit("B").type("bug").title("User avatar upload handler").agent("qa-engineer"));

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::MergeRelatedTasks);
    ASSERT_TRUE(resolution.merged_unit.has_value());
    EXPECT_EQ(resolution.merged_unit->id, "merged_B_A");
    EXPECT_EQ(resolution.merged_unit->merged_from, (std::vector<UnitId>{"B", "A"}));
}

TEST_F(ResolutionTest, ModuleOverlapFallsBackToSequentialInterfaces) {
    manager->reserve_branch(unit("A").type("bug").title("User avatar upload"), "senior-developer", repo);
    Resolution resolution = resolve(unit("B").type("bug").title("User avatar upload handler").agent("qa-engineer"),
                                    no_merge());

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::SequentialWithInterface);
    EXPECT_EQ(resolution.execution_order, (std::vector<UnitId>{"A", "B"}));
    EXPECT_EQ(resolution.added_dependencies, (std::vector<UnitId>{"A"}));
    ASSERT_EQ(resolution.interfaces.size(), 1u);
    EXPECT_EQ(resolution.interfaces[0].module, "user-service");
    EXPECT_EQ(resolution.interfaces[0].first_interface, "user-service_A_interface");
    EXPECT_EQ(resolution.interfaces[0].second_interface, "user-service_B_interface");
}

// === DEPENDENCIES ===

TEST_F(ResolutionTest, IncompleteDependencyMeansWaiting) {
    manager->reserve_branch(unit("X").files({"x.js"}), "qa-engineer", repo);
    Resolution resolution = resolve(unit("D").depends_on({"X"}).agent("senior-developer"));

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::WaitForDependencies);
    EXPECT_EQ(resolution.waiting_for, (std::vector<UnitId>{"X"}));
    EXPECT_EQ(resolution.estimated_wait_minutes, 60u);
}

TEST_F(ResolutionTest, CycleIsBrokenAtLowestPriorityDependent) {
    manager->reserve_branch(unit("X").depends_on({"D"}), "qa-engineer", repo);
    Resolution resolution = resolve(unit("D").depends_on({"X"}).priority(PriorityTier::Low)
                                             .agent("senior-developer"));

    ASSERT_TRUE(resolution.resolved);
    EXPECT_EQ(resolution.strategy, ResolutionStrategy::ResolveCircularDependencies);
    ASSERT_EQ(resolution.demoted_edges.size(), 1u);
    EXPECT_EQ(resolution.demoted_edges[0], std::make_pair(UnitId("D"), UnitId("X")));
    EXPECT_EQ(resolution.execution_order, (std::vector<UnitId>{"D", "X"}));
    EXPECT_FALSE(resolution.unit.depends_on("X"));
    ASSERT_EQ(resolution.restructured_units.size(), 1u);
    EXPECT_EQ(resolution.restructured_units[0].id, "D");
}

TEST_F(ResolutionTest, CompletedDependencyAllowsParallelRun) {
    TaskContextExtractor extractor;
    AgentCatalog catalog = AgentCatalog::default_catalog();
    ConflictResolutionEngine engine(extractor, catalog, SchedulerConfig{}, clock);
    RepositoryState state(repo);

    Conflict conflict;
    conflict.category = ConflictCategory::DependencyConflict;
    conflict.units.push_back(unit("X").status(UnitStatus::Completed));
    conflict.dependency_status = UnitStatus::Completed;

    Resolution resolution = engine.resolve(unit("D").depends_on({"X"}), state,
                                           ConflictCategory::DependencyConflict, {conflict});
    EXPECT_EQ(resolution.strategy, ResolutionStrategy::ParallelExecution);
    EXPECT_EQ(resolution.parallel_units, (std::vector<UnitId>{"X"}));
}

// === AGENT CAPACITY ===

TEST_F(ResolutionTest, BusyAgentReassignedToIdleCapableAgent) {
    manager->reserve_branch(unit("A").files({"a.js"}), "senior-developer", repo);
    Resolution resolution = resolve(unit("B").type("bug").title("Login component polish").agent("senior-developer"));

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::ReassignToAvailableAgent);
    EXPECT_EQ(resolution.reassigned_agent, std::optional<AgentType>("junior-developer"));
    EXPECT_EQ(resolution.unit.assigned_agent, "junior-developer");
}

TEST_F(ResolutionTest, ComplexWorkSplitWhenNoCapableAgentIsIdle) {
    manager->reserve_branch(unit("A").files({"a.js"}), "senior-developer", repo);
    manager->reserve_branch(unit("T").files({"t.js"}), "tech-lead", repo);
    Resolution resolution = resolve(unit("B").type("bug").complexity(Complexity::Complex)
                                             .files({"p.js", "q.js", "r.js"}).agent("senior-developer"));

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::SplitForAgentCapacity);
    ASSERT_EQ(resolution.sub_units.size(), 2u);
    EXPECT_EQ(resolution.sub_units[0].files, (std::vector<std::string>{"p.js", "q.js"}));
    EXPECT_EQ(resolution.sub_units[0].complexity, Complexity::Moderate);
    EXPECT_EQ(resolution.sub_units[1].files, (std::vector<std::string>{"r.js"}));
    EXPECT_TRUE(resolution.sub_units[1].depends_on("B-part1"));
    EXPECT_EQ(resolution.sub_units[1].assigned_agent, "senior-developer");
}

TEST_F(ResolutionTest, BusyAgentQueueEstimatesWait) {
    manager->reserve_branch(unit("A").files({"a.js"}), "senior-developer", repo);
    manager->reserve_branch(unit("T").files({"t.js"}), "tech-lead", repo);
    clock->advance_minutes(10);
    Resolution resolution = resolve(unit("B").type("bug").complexity(Complexity::Complex)
                                             .files({"p.js", "q.js"}).agent("senior-developer"),
                                    no_split());

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::WorkloadBalancedQueue);
    EXPECT_EQ(resolution.queue_position, 1u);
    EXPECT_EQ(resolution.estimated_wait_minutes, 20u);
}

// === CONCEPTUAL CONFLICTS ===

class ConceptualResolutionTest : public ResolutionTest {
protected:
    TaskContextExtractor extractor;
    AgentCatalog catalog = AgentCatalog::default_catalog();

    Resolution resolve_conceptual(const UnitOfWork& candidate, const UnitOfWork& related,
                                  const ResolutionOptions& options = {}) {
        ConflictResolutionEngine engine(extractor, catalog, SchedulerConfig{}, clock);
        RepositoryState state(repo);
        Conflict conflict;
        conflict.category = ConflictCategory::ConceptualConflict;
        conflict.units.push_back(related);
        return engine.resolve(candidate, state, ConflictCategory::ConceptualConflict, {conflict}, options);
    }
};

TEST_F(ConceptualResolutionTest, NearDuplicatesAreUnified) {
    Resolution resolution = resolve_conceptual(unit("B").type("bug").title("checkout cart summary view"),
                                               unit("A").type("bug").title("checkout cart summary"));

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::MergeConceptualTasks);
    EXPECT_EQ(resolution.merged_unit->id, "merged_B_A");
    EXPECT_EQ(resolution.shared_components, (std::vector<std::string>{"checkout", "cart", "summary"}));
}

TEST_F(ConceptualResolutionTest, HighestPriorityLeadsCoordination) {
    Resolution resolution = resolve_conceptual(
        unit("B").type("bug").title("checkout cart summary view"),
        unit("A").type("bug").title("checkout cart summary").priority(PriorityTier::High), no_merge());

    ASSERT_EQ(resolution.strategy, ResolutionStrategy::CoordinateRelatedFeatures);
    EXPECT_EQ(resolution.lead_unit, std::optional<UnitId>("A"));
    EXPECT_EQ(resolution.shared_components, (std::vector<std::string>{"checkout", "cart", "summary"}));
}

// === FALLBACK ===

TEST_F(ResolutionTest, UnresolvableConflictGetsFallbackAdvice) {
    TaskContextExtractor extractor;
    AgentCatalog catalog = AgentCatalog::default_catalog();
    ConflictResolutionEngine engine(extractor, catalog, SchedulerConfig{}, clock);
    RepositoryState state(repo);

    Resolution resolution = engine.resolve(unit("A"), state, ConflictCategory::FileOverlap, {});
    EXPECT_FALSE(resolution.resolved);
    EXPECT_EQ(resolution.strategy, ResolutionStrategy::ManualIntervention);
    EXPECT_EQ(resolution.fallback_suggestion, "Consider manual coordination or task postponement");
    EXPECT_EQ(resolution.fallback_options.size(), 4u);
    EXPECT_EQ(resolution.unit.id, "A");
}

TEST_F(ResolutionTest, ConflictsAreRecordedInHistory) {
    manager->reserve_branch(unit("A").files({"x.js"}), "senior-developer", repo);
    resolve(unit("B").files({"x.js"}).agent("qa-engineer"));

    auto history = manager->resolution_history(repo);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].unit_id, "B");
    EXPECT_EQ(history[0].category, ConflictCategory::FileOverlap);
    EXPECT_EQ(history[0].strategy, ResolutionStrategy::SequenceAfterConflicts);
    EXPECT_TRUE(history[0].resolved);
}

// === BATCH OVERLAP PREVENTION ===

TEST_F(ResolutionTest, BatchFileOverlapBecomesDependency) {
    std::vector<UnitOfWork> batch = {
        unit("U1").files({"a.js"}), unit("U2").files({"a.js", "b.js"}), unit("U3").files({"c.js"})
    };
    OverlapPrevention prevention = manager->engine().prevent_overlaps(batch);

    EXPECT_TRUE(prevention.safe);
    EXPECT_TRUE(prevention.modified);
    ASSERT_EQ(prevention.resolutions.size(), 1u);
    EXPECT_EQ(prevention.resolutions[0].action, OverlapAction::AddDependency);
    EXPECT_EQ(prevention.resolutions[0].dependent, "U2");
    EXPECT_EQ(prevention.resolutions[0].prerequisite, "U1");

    ExecutionPlan plan = DependencyPlanner().validate_and_order(prevention.units);
    EXPECT_EQ(plan.order, (std::vector<UnitId>{"U1", "U3", "U2"}));
    ASSERT_EQ(plan.groups.size(), 2u);
    EXPECT_EQ(plan.groups[0], (std::vector<UnitId>{"U1", "U3"}));
    EXPECT_EQ(plan.groups[1], (std::vector<UnitId>{"U2"}));
}

TEST_F(ResolutionTest, BatchNeverAddsCycleClosingEdge) {
    std::vector<UnitOfWork> batch = {
        unit("U1").files({"a.js"}),
        unit("U2").files({"a.js"}).depends_on({"U1"}).priority(PriorityTier::High)
    };
    OverlapPrevention prevention = manager->engine().prevent_overlaps(batch);

    EXPECT_FALSE(prevention.modified);
    EXPECT_TRUE(prevention.resolutions.empty());
    EXPECT_NO_THROW(DependencyPlanner().validate_and_order(prevention.units));
}

TEST_F(ResolutionTest, BatchMergesNearDuplicatesAndRewiresDependents) {
    std::vector<UnitOfWork> batch = {
        unit("A").type("bug").title("checkout cart summary"),
        unit("B").type("bug").title("checkout cart summary view"),
        unit("C").depends_on({"B"})
    };
    OverlapPrevention prevention = manager->engine().prevent_overlaps(batch);

    ASSERT_EQ(prevention.resolutions.size(), 1u);
    EXPECT_EQ(prevention.resolutions[0].action, OverlapAction::MergeUnits);
    ASSERT_EQ(prevention.units.size(), 2u);
    EXPECT_EQ(prevention.units[0].id, "merged_A_B");
    EXPECT_EQ(prevention.units[1].dependencies, (std::vector<UnitId>{"merged_A_B"}));
}

TEST_F(ResolutionTest, ReviewRequiredWithoutAutoResolve) {
    ResolutionOptions options;
    options.auto_resolve = false;
    OverlapPrevention prevention = manager->engine().prevent_overlaps(
        {unit("U1").files({"a.js"}), unit("U2").files({"a.js"})}, options);

    EXPECT_FALSE(prevention.safe);
    EXPECT_TRUE(prevention.requires_review);
    EXPECT_FALSE(prevention.modified);
    EXPECT_FALSE(prevention.units[1].depends_on("U1"));
}
