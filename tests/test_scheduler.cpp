/**
 * @file test_scheduler.cpp
 * @brief Unit tests for admission control and worker target reductions
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include "core/CancellationToken.hpp"
#include "core/downloader/Scheduler.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace lockerfetch::test {

using core::CancellationToken;
using core::downloader::BatchResult;
using core::downloader::ErrorKind;
using core::downloader::Scheduler;
using core::downloader::SchedulerOptions;
using core::downloader::SchedulerPhase;
using core::downloader::TransferResult;
using core::downloader::TransferTask;

using namespace std::chrono_literals;

auto make_tasks(size_t count) -> std::vector<TransferTask> {
    std::vector<TransferTask> tasks;
    for (size_t i = 0; i < count; ++i) {
        tasks.emplace_back("https://cyberdrop.me/f/" + std::to_string(i), "/tmp");
    }
    return tasks;
}

auto immediate_options() -> SchedulerOptions {
    SchedulerOptions options;
    options.admissionDelay = 0.0;
    options.reductionPause = 0.0;
    options.errorThreshold = 3;
    options.sampler = [] { return idle_machine(); };
    return options;
}

auto succeed(const TransferTask& task, size_t index) -> TransferResult {
    TransferResult result = TransferResult::success("/tmp/" + std::to_string(index), 100, 10ms, 65536);
    result.sourceUrl = task.sourceUrl;
    return result;
}

auto fail(const TransferTask& task) -> TransferResult {
    TransferResult result = TransferResult::failed(ErrorKind::NetworkError, "connection reset");
    result.sourceUrl = task.sourceUrl;
    return result;
}

/**
 * Records every admission reported by the scheduler
 */
struct AdmissionLog {
    struct Entry {
        size_t index;
        size_t in_flight;
        int target;
        std::chrono::steady_clock::time_point at;
    };

    auto callback() {
        return [this](size_t index, size_t in_flight, int target) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.push_back({index, in_flight, target, std::chrono::steady_clock::now()});
        };
    }

    std::mutex mutex;
    std::vector<Entry> entries;
};

TEST(SchedulerTest, EmptyBatch) {
    Scheduler scheduler(immediate_options());
    BatchResult batch = scheduler.run({}, 3, succeed);

    EXPECT_EQ(batch.total(), 0u);
    EXPECT_TRUE(batch.success());
    EXPECT_EQ(scheduler.phase(), SchedulerPhase::Done);
}

TEST(SchedulerTest, RunsEveryTaskAndKeepsInputOrder) {
    Scheduler scheduler(immediate_options());
    auto tasks = make_tasks(12);

    BatchResult batch = scheduler.run(tasks, 4, [](const TransferTask& task, size_t index) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5 * (index % 3)));
        return succeed(task, index);
    });

    EXPECT_EQ(batch.successCount, 12u);
    EXPECT_EQ(batch.errorCount, 0u);
    ASSERT_EQ(batch.results.size(), 12u);
    for (size_t i = 0; i < tasks.size(); ++i) {
        EXPECT_EQ(batch.results[i].sourceUrl, tasks[i].sourceUrl);
        EXPECT_EQ(batch.results[i].path, "/tmp/" + std::to_string(i));
    }
    EXPECT_EQ(batch.totalBytes, 1200);
}

TEST(SchedulerTest, NeverExceedsWorkerTarget) {
    AdmissionLog log;
    SchedulerOptions options = immediate_options();
    options.onAdmit = log.callback();
    Scheduler scheduler(options);

    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    BatchResult batch = scheduler.run(make_tasks(8), 2, [&](const TransferTask& task, size_t index) {
        int now = ++running;
        int seen = max_running.load();
        while (now > seen && !max_running.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(30ms);
        --running;
        return succeed(task, index);
    });

    EXPECT_EQ(batch.successCount, 8u);
    EXPECT_LE(max_running.load(), 2);
    EXPECT_LE(batch.peakInFlight, 2u);
    EXPECT_GE(batch.peakInFlight, 1u);
    ASSERT_EQ(log.entries.size(), 8u);
    for (const auto& entry : log.entries) {
        EXPECT_LE(entry.in_flight, static_cast<size_t>(entry.target));
    }
}

TEST(SchedulerTest, ErrorBurstHalvesTargetOnce) {
    AdmissionLog log;
    SchedulerOptions options = immediate_options();
    options.admissionDelay = 0.1;
    options.onAdmit = log.callback();
    Scheduler scheduler(options);

    // Task 0 succeeds, tasks 1-3 fail, task 4 succeeds
    BatchResult batch = scheduler.run(make_tasks(5), 3, [](const TransferTask& task, size_t index) {
        if (index == 0 || index == 4) {
            return succeed(task, index);
        }
        return fail(task);
    });

    EXPECT_EQ(batch.errorCount, 3u);
    EXPECT_EQ(batch.successCount, 2u);
    EXPECT_EQ(batch.reductions, 1);
    EXPECT_EQ(batch.finalWorkerTarget, 1);
    EXPECT_FALSE(batch.success());
    EXPECT_TRUE(batch.results[0].isSuccess());
    EXPECT_TRUE(batch.results[4].isSuccess());

    ASSERT_EQ(log.entries.size(), 5u);
    EXPECT_EQ(log.entries[3].index, 3u);
    EXPECT_EQ(log.entries[3].target, 3);
    const auto& last = log.entries.back();
    EXPECT_EQ(last.index, 4u);
    EXPECT_EQ(last.target, 1);
    EXPECT_EQ(last.in_flight, 1u);
}

TEST(SchedulerTest, SlowSamplerDoesNotHoldUpWorkers) {
    std::atomic<bool> second_finished{false};
    std::atomic<bool> saw_second_finish{false};
    std::atomic<int> sampler_calls{0};

    SchedulerOptions options = immediate_options();
    options.sampler = [&] {
        if (sampler_calls++ == 0) {
            // Stay busy until the other worker has finished its job
            auto deadline = std::chrono::steady_clock::now() + 2s;
            while (!second_finished && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(5ms);
            }
            saw_second_finish = second_finished.load();
            std::this_thread::sleep_for(50ms);
        }
        return idle_machine();
    };
    Scheduler scheduler(options);

    BatchResult batch = scheduler.run(make_tasks(2), 2, [&](const TransferTask& task, size_t index) {
        if (index == 1) {
            std::this_thread::sleep_for(30ms);
            TransferResult result = succeed(task, index);
            second_finished = true;
            return result;
        }
        return succeed(task, index);
    });

    EXPECT_TRUE(saw_second_finish);
    EXPECT_EQ(batch.successCount, 2u);
    EXPECT_EQ(sampler_calls.load(), 2);
    EXPECT_EQ(batch.results[1].path, "/tmp/1");
}

TEST(SchedulerTest, ContinuedErrorsDoNotReduceAgain) {
    SchedulerOptions options = immediate_options();
    options.resourceFeedback = false;
    Scheduler scheduler(options);

    BatchResult batch = scheduler.run(make_tasks(6), 4, [](const TransferTask& task, size_t) {
        return fail(task);
    });

    EXPECT_EQ(batch.errorCount, 6u);
    EXPECT_EQ(batch.reductions, 1);
    EXPECT_EQ(batch.finalWorkerTarget, 2);
}

TEST(SchedulerTest, ResourcePressureLowersTargetStepwise) {
    SchedulerOptions options = immediate_options();
    options.sampler = [] {
        auto sample = idle_machine();
        sample.cpuPercent = 96.0;   // 16 cores -> 12 * 0.4 = 4
        return sample;
    };
    Scheduler scheduler(options);

    BatchResult batch = scheduler.run(make_tasks(10), 8, succeed);

    EXPECT_EQ(batch.successCount, 10u);
    EXPECT_EQ(batch.finalWorkerTarget, 4);
    EXPECT_EQ(batch.reductions, 0);
}

TEST(SchedulerTest, IdleMachineNeverRaisesTarget) {
    Scheduler scheduler(immediate_options());
    BatchResult batch = scheduler.run(make_tasks(6), 2, succeed);
    EXPECT_EQ(batch.finalWorkerTarget, 2);
}

TEST(SchedulerTest, AdmissionsAreSpacedByDelay) {
    AdmissionLog log;
    SchedulerOptions options = immediate_options();
    options.admissionDelay = 0.05;
    options.onAdmit = log.callback();
    Scheduler scheduler(options);

    scheduler.run(make_tasks(3), 3, succeed);

    ASSERT_EQ(log.entries.size(), 3u);
    for (size_t i = 1; i < log.entries.size(); ++i) {
        EXPECT_GE(log.entries[i].at - log.entries[i - 1].at, 45ms);
    }
}

TEST(SchedulerTest, ExceptionsBecomeFailures) {
    Scheduler scheduler(immediate_options());
    auto tasks = make_tasks(3);

    BatchResult batch = scheduler.run(tasks, 2, [](const TransferTask& task, size_t index) {
        if (index == 1) {
            throw std::runtime_error("boom");
        }
        return succeed(task, index);
    });

    EXPECT_EQ(batch.successCount, 2u);
    EXPECT_EQ(batch.errorCount, 1u);
    EXPECT_EQ(batch.results[1].error, ErrorKind::NetworkError);
    EXPECT_EQ(batch.results[1].message, "boom");
    EXPECT_EQ(batch.results[1].sourceUrl, tasks[1].sourceUrl);
}

TEST(SchedulerTest, CancellationStopsAdmissions) {
    CancellationToken cancel;
    Scheduler scheduler(immediate_options(), &cancel);
    auto tasks = make_tasks(10);

    BatchResult batch = scheduler.run(tasks, 2, [&cancel](const TransferTask& task, size_t index) {
        cancel.cancel();
        std::this_thread::sleep_for(20ms);
        return succeed(task, index);
    });

    EXPECT_GE(batch.notStarted, 8u);
    EXPECT_EQ(batch.total(), 10u);
    EXPECT_EQ(batch.successCount + batch.notStarted, 10u);
    EXPECT_EQ(batch.errorCount, 0u);
    const auto& last = batch.results.back();
    EXPECT_EQ(last.error, ErrorKind::Cancelled);
    EXPECT_EQ(last.message, "not started");
    EXPECT_EQ(last.sourceUrl, tasks.back().sourceUrl);
}

TEST(SchedulerTest, OptionsFromEngineConfig) {
    core::EngineConfig config;
    config.admissionDelay = 0.25;
    config.reductionPause = 4.0;
    config.errorThreshold = 5;
    config.memoryWarningPercent = 70.0;

    SchedulerOptions options = SchedulerOptions::fromConfig(config);
    EXPECT_DOUBLE_EQ(options.admissionDelay, 0.25);
    EXPECT_DOUBLE_EQ(options.reductionPause, 4.0);
    EXPECT_EQ(options.errorThreshold, 5);
    EXPECT_DOUBLE_EQ(options.memoryWarningPercent, 70.0);
    EXPECT_TRUE(options.resourceFeedback);
}

} // namespace lockerfetch::test
