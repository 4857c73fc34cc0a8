#include <gtest/gtest.h>
#include <conflux/errors.hpp>
#include <conflux/job_system.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace conflux;

class JobSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        job_system = std::make_unique<JobSystem>(4);
    }

    void TearDown() override {
        job_system->shutdown();
        job_system.reset();
    }

    std::unique_ptr<JobSystem> job_system;
};

TEST_F(JobSystemTest, BasicJobExecution) {
    std::atomic<int> counter{0};

    job_system->start();
    job_system->submit(make_job([&counter]() {
        counter.fetch_add(1);
    }));
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 1);
    EXPECT_FALSE(job_system->has_error());
}

TEST_F(JobSystemTest, MultipleJobsExecution) {
    std::atomic<int> counter{0};
    const int num_jobs = 100;

    job_system->start();
    for (int i = 0; i < num_jobs; ++i) {
        job_system->submit_function([&counter]() {
            counter.fetch_add(1);
        });
    }
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
    EXPECT_EQ(job_system->get_pending_count(), 0u);
}

TEST_F(JobSystemTest, SingleWorkerRunsJobsInSubmissionOrder) {
    JobSystem single(1);
    std::vector<int> execution_order;
    std::mutex order_mutex;

    single.start();
    for (int i = 0; i < 10; ++i) {
        single.submit_function([&execution_order, &order_mutex, i]() {
            std::lock_guard<std::mutex> lock(order_mutex);
            execution_order.push_back(i);
        });
    }
    single.wait_for_completion();
    single.shutdown();

    EXPECT_EQ(execution_order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST_F(JobSystemTest, SubmitRequiresRunningSystem) {
    EXPECT_FALSE(job_system->is_running());
    EXPECT_THROW(job_system->submit_function([] {}), std::runtime_error);
}

TEST_F(JobSystemTest, WorkStealingKeepsWorkersBusy) {
    std::atomic<int> counter{0};
    const int num_jobs = 40;

    job_system->start();
    for (int i = 0; i < num_jobs; ++i) {
        job_system->submit_function([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            counter.fetch_add(1);
        });
    }
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
}

// === ERROR CLASSIFICATION ===

TEST_F(JobSystemTest, EscapedExceptionIsRecordedAndWorkerSurvives) {
    std::atomic<int> counter{0};

    job_system->start();
    job_system->submit_function([]() {
        throw std::runtime_error("executor crashed");
    });
    job_system->wait_for_completion();

    EXPECT_EQ(job_system->get_error_type(), ErrorType::Exception);
    EXPECT_STREQ(JobSystem::describe(job_system->get_error_type()), "Exception thrown");

    job_system->submit_function([&counter]() { counter.fetch_add(1); });
    job_system->wait_for_completion();
    EXPECT_EQ(counter.load(), 1);
}

TEST_F(JobSystemTest, AbortIsClassifiedByType) {
    job_system->start();
    job_system->submit_function([]() {
        throw AbortedError();
    });
    job_system->wait_for_completion();

    EXPECT_EQ(job_system->get_error_type(), ErrorType::Aborted);
}

TEST_F(JobSystemTest, RestartClearsError) {
    job_system->start();
    job_system->submit_function([]() { throw std::logic_error("bad state"); });
    job_system->wait_for_completion();
    ASSERT_TRUE(job_system->has_error());

    job_system->shutdown();
    job_system->start();
    EXPECT_FALSE(job_system->has_error());
}

TEST_F(JobSystemTest, WaitCanBeAborted) {
    std::atomic<bool> release{false};

    job_system->start();
    job_system->submit_function([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    int polls = 0;
    bool aborted = job_system->wait_for_completion_with_abort([&polls]() {
        return ++polls > 3;
    }, std::chrono::milliseconds(1));
    EXPECT_TRUE(aborted);
    EXPECT_EQ(job_system->get_pending_count(), 1u);

    release.store(true);
    job_system->wait_for_completion();
    EXPECT_EQ(job_system->get_pending_count(), 0u);
}

TEST_F(JobSystemTest, ShutdownDrainsQueuedJobs) {
    std::atomic<int> counter{0};
    const int num_jobs = 50;

    job_system->start();
    for (int i = 0; i < num_jobs; ++i) {
        job_system->submit_function([&counter]() {
            counter.fetch_add(1);
        });
    }
    job_system->shutdown();

    EXPECT_EQ(counter.load(), num_jobs);
    EXPECT_FALSE(job_system->is_running());
}
