/**
 * Pipeline Usage Example
 *
 * Demonstrates driving units through the agent stages:
 * - Plugging in an Executor and a SourceHost
 * - Running a pipeline in the background and waiting on its handle
 * - Running a batch group by group
 */

#include <conflux/pipeline_orchestrator.hpp>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

using namespace conflux;

namespace {

// Pretends to do the work; mutating stages touch the unit's declared files.
class EchoExecutor : public Executor {
public:
    ExecutionResult execute(const UnitOfWork& unit, const AgentType& agent_type,
                            const std::string&, const StageContext& context) override {
        ExecutionResult result;
        result.success = true;
        result.output = agent_type + " finished " + unit.title;
        if (!context.branch_name.empty()) {
            result.files_changed = unit.files;
        }
        return result;
    }
};

class PrintingSourceHost : public SourceHost {
private:
    std::mutex mutex_;
    int next_pr_ = 1;

public:
    void create_branch(const RepositoryId& repo, const std::string& branch_name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "  [host] branch " << branch_name << " on " << repo.to_string() << "\n";
    }

    std::string create_pull_request(const RepositoryId& repo, const std::string& branch_name,
                                    const std::string& title, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string reference = "#" + std::to_string(next_pr_++);
        std::cout << "  [host] pull request " << reference << " from " << branch_name
                  << " on " << repo.to_string() << ": " << title << "\n";
        return reference;
    }
};

UnitOfWork make_unit(const std::string& id, const std::string& title, std::vector<std::string> files) {
    UnitOfWork unit;
    unit.id = id;
    unit.title = title;
    unit.files = std::move(files);
    return unit;
}

void print_record(const PipelineRecord& record) {
    std::cout << record.unit.id << " -> " << to_string(record.status) << "\n";
    for (const auto& stage : record.stages) {
        std::cout << "  " << stage.agent_type << ": " << to_string(stage.status);
        if (!stage.pull_request.empty()) {
            std::cout << " (" << stage.pull_request << ")";
        }
        std::cout << "\n";
    }
}

} // namespace

int main() {
    std::cout << "=== Pipeline Usage Example ===\n\n";

    ReservationManager manager;
    EchoExecutor executor;
    PrintingSourceHost host;
    InMemoryUnitStore store;

    PipelineConfig config;
    config.worker_threads = 2;
    PipelineOrchestrator orchestrator(manager, executor, host, store, config);

    const RepositoryId repo("acme", "shop");

    // Example 1: one pipeline in the background
    std::cout << "=== Example 1: Background Pipeline ===\n";
    PipelineHandle handle = orchestrator.start_pipeline(
        make_unit("U1", "Add order history page", {"src/orders/history.js"}), repo);
    print_record(handle.result.get());
    std::cout << "\n";

    // Example 2: a batch, overlapping units are sequenced
    std::cout << "=== Example 2: Batch Run ===\n";
    std::vector<UnitOfWork> batch = {
        make_unit("U2", "Tidy cart totals", {"src/cart/totals.js"}),
        make_unit("U3", "Round cart totals", {"src/cart/totals.js"}),
        make_unit("U4", "Update footer links", {"src/layout/footer.js"}),
    };

    BatchResult result = orchestrator.run_batch(batch, repo);
    for (const auto& record : result.records) {
        print_record(record);
    }
    std::cout << "Completed: " << result.count(UnitStatus::Completed) << " of " << result.records.size() << "\n";

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
