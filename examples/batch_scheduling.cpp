/**
 * Batch Scheduling Example
 *
 * Demonstrates the scheduling core without any pipeline:
 * - Reserving and releasing branches
 * - Conflict detection and resolution
 * - Overlap prevention and dependency planning for a batch
 */

#include <conflux/compatibility.hpp>
#include <conflux/dependency_planner.hpp>
#include <conflux/errors.hpp>
#include <conflux/reservation_manager.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace conflux;

namespace {

UnitOfWork make_unit(const std::string& id, const std::string& title, std::vector<std::string> files) {
    UnitOfWork unit;
    unit.id = id;
    unit.title = title;
    unit.files = std::move(files);
    return unit;
}

void print_plan(const ExecutionPlan& plan) {
    for (std::size_t i = 0; i < plan.groups.size(); ++i) {
        std::cout << "  Group " << i << ":";
        for (const auto& id : plan.groups[i]) {
            std::cout << " " << id;
        }
        std::cout << "\n";
    }
    std::cout << "  Sequential estimate: " << plan.sequential_minutes << " min, parallel estimate: "
              << plan.parallel_minutes << " min\n";
}

} // namespace

int main() {
    std::cout << "=== Batch Scheduling Example ===\n\n";

    ReservationManager manager;
    const RepositoryId repo("acme", "shop");

    // Example 1: reserve, conflict, release
    std::cout << "=== Example 1: Branch Reservations ===\n";
    UnitOfWork login = make_unit("U1", "Fix login redirect", {"src/auth/login.js"});
    UnitOfWork signup = make_unit("U2", "Add signup captcha", {"src/auth/signup.js"});

    Reservation first = manager.reserve_branch(login, "senior-developer", repo);
    std::cout << "Reserved " << first.branch_name << " for " << login.id << "\n";

    try {
        manager.reserve_branch(signup, "senior-developer", repo);
    } catch (const ConflictError& e) {
        std::cout << "Second reservation refused: " << e.what() << "\n";

        Resolution resolution = manager.resolve_task_conflicts(signup, repo);
        std::cout << "Suggested strategy: " << to_string(resolution.strategy)
                  << " (wait " << resolution.estimated_wait_minutes << " min)\n";
    }

    manager.release_branch(first.branch_name);
    Reservation second = manager.reserve_branch(signup, "senior-developer", repo);
    std::cout << "After release, reserved " << second.branch_name << " for " << signup.id << "\n";
    manager.release_branch(second.branch_name);
    std::cout << "\n";

    // Example 2: overlap prevention then planning
    std::cout << "=== Example 2: Planning a Batch ===\n";
    std::vector<UnitOfWork> batch = {
        make_unit("U1", "Tidy cart totals", {"src/cart/totals.js"}),
        make_unit("U2", "Round cart totals", {"src/cart/totals.js", "src/cart/round.js"}),
        make_unit("U3", "Update footer links", {"src/layout/footer.js"}),
    };

    OverlapPrevention prevention = manager.engine().prevent_overlaps(batch);
    std::cout << "Overlaps found: " << prevention.analysis.overlaps.size()
              << ", resolutions applied: " << prevention.resolutions.size() << "\n";
    for (const auto& applied : prevention.resolutions) {
        std::cout << "  " << to_string(applied.action) << ": " << applied.reason << "\n";
    }

    DependencyPlanner planner(manager.config().max_parallel_group_size);
    print_plan(planner.validate_and_order(prevention.units));
    std::cout << "\n";

    // Example 3: cycles are reported, never broken silently
    std::cout << "=== Example 3: Cycle Detection ===\n";
    UnitOfWork a = make_unit("A", "Schema change", {});
    UnitOfWork b = make_unit("B", "Data migration", {});
    a.dependencies = {"B"};
    b.dependencies = {"A"};

    try {
        planner.validate_and_order({a, b});
    } catch (const CycleError& e) {
        std::cout << "Planning failed: " << e.what() << "\n";
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
