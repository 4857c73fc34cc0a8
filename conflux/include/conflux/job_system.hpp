#ifndef CONFLUX_JOB_SYSTEM_HPP
#define CONFLUX_JOB_SYSTEM_HPP

#include <conflux/debug_log.hpp>
#include <conflux/errors.hpp>
#include <conflux/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <new>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace conflux {

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught, workers stop
    Aborted,       // AbortedError caught (cooperative cancellation)
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Work-stealing thread pool that runs pipelines in the background.
 *
 * Each worker owns a deque; submit() distributes round-robin and idle workers
 * steal half of a victim's queue. Jobs are expected to report their own results;
 * anything that escapes a job is classified in get_error_type() and logged, and
 * the worker keeps serving (except on out-of-memory, which stops all workers).
 */
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr> tasks;
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executing{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    std::atomic<size_t> total_submitted_{0};
    std::atomic<size_t> total_completed_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};

    std::vector<JobPtr> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);
        for (size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }
        return stolen;
    }

    void record_error(ErrorType type, const char* what) {
        error_type_.store(type, std::memory_order_release);
        CONFLUX_LOG_ERROR("Job escaped with %s: %s", describe(type), what);
    }

    void run_job(WorkerData* data, Job& job) {
        data->jobs_executing.fetch_add(1);

        // Worker threads must not throw
        try {
            job.execute();
        } catch (const std::bad_alloc& e) {
            record_error(ErrorType::OutOfMemory, e.what());
            for (auto& w : workers_) {
                w->stop.store(true);
            }
        } catch (const AbortedError& e) {
            record_error(ErrorType::Aborted, e.what());
        } catch (const std::exception& e) {
            record_error(ErrorType::Exception, e.what());
        } catch (...) {
            record_error(ErrorType::Unhandled, "unknown exception type");
        }

        data->jobs_executing.fetch_sub(1);

        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            total_completed_.fetch_add(1);
        }
        completion_cv_.notify_all();
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();

                    for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (job) {
                run_job(data, *job);
            }
        }
    }

    bool all_work_done() {
        if (total_submitted_.load() != total_completed_.load()) return false;
        for (const auto& worker : workers_) {
            std::lock_guard<std::mutex> worker_lock(worker->mutex);
            if (!worker->tasks.empty() || worker->jobs_executing.load() > 0) {
                return false;
            }
        }
        std::atomic_thread_fence(std::memory_order_acquire);
        return total_submitted_.load() == total_completed_.load();
    }

public:
    explicit JobSystem(size_t num_threads = 0) {
        size_t count = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (count == 0) count = 1;

        workers_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    ~JobSystem() {
        shutdown();
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    void start() {
        if (is_running_.load()) return;

        total_submitted_.store(0);
        total_completed_.store(0);
        error_type_.store(ErrorType::None, std::memory_order_relaxed);

        for (auto& worker : workers_) {
            worker->stop.store(false);
            auto* data = worker.get();
            worker->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    // Drains every queued job, then joins the workers.
    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    // FIFO per worker: the oldest job sits at the back, which is where workers pop.
    void submit(JobPtr job) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        total_submitted_.fetch_add(1);

        auto* worker = workers_[round_robin_.fetch_add(1) % workers_.size()].get();
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            worker->tasks.push_front(std::move(job));
        }
        worker->cv.notify_one();
    }

    template<typename F>
    void submit_function(F&& func) {
        submit(make_job(std::forward<F>(func)));
    }

    // Wait until every submitted job has finished. If abort_check returns true,
    // stops waiting and returns true; returns false on normal completion.
    template<typename AbortCheck>
    bool wait_for_completion_with_abort(AbortCheck&& abort_check,
                                        std::chrono::milliseconds poll = std::chrono::milliseconds(50)) {
        while (true) {
            if (abort_check()) {
                return true;
            }

            {
                std::unique_lock<std::mutex> lock(completion_mutex_);
                completion_cv_.wait_for(lock, poll, [this] {
                    return total_submitted_.load() == total_completed_.load();
                });
            }

            if (all_work_done()) {
                return false;
            }
        }
    }

    void wait_for_completion() {
        wait_for_completion_with_abort([] { return false; }, std::chrono::milliseconds(10));
    }

    size_t get_pending_count() const {
        size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    static const char* describe(ErrorType type) {
        switch (type) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Aborted: return "Aborted";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }
};

} // namespace conflux

#endif // CONFLUX_JOB_SYSTEM_HPP
