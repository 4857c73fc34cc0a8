#ifndef CONFLUX_JOB_HPP
#define CONFLUX_JOB_HPP

#include <memory>
#include <type_traits>
#include <utility>

namespace conflux {

/**
 * Unit of background work run by the JobSystem.
 */
class Job {
public:
    virtual ~Job() = default;

    virtual void execute() = 0;
};

template<typename Func>
class FunctionJob : public Job {
private:
    Func function_;

public:
    template<typename F>
    explicit FunctionJob(F&& func)
        : function_(std::forward<F>(func)) {}

    void execute() override {
        static_assert(std::is_invocable_v<Func&>, "Job function must be callable with no arguments");
        function_();
    }
};

template<typename Func>
auto make_job(Func&& func) {
    return std::make_unique<FunctionJob<std::decay_t<Func>>>(std::forward<Func>(func));
}

using JobPtr = std::unique_ptr<Job>;

} // namespace conflux

#endif // CONFLUX_JOB_HPP
