/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file workflow_tests.cpp
 * @brief Unit tests for the workflow orchestrator: dispatch, retries, failure
 * propagation, lifecycle control, queries and persistence
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "sched/retry_controller.hpp"
#include "sched/sched_errors.hpp"
#include "sched/snapshot.hpp"
#include "sched/task.hpp"
#include "sched/time.hpp"
#include "sched/workflow.hpp"
#include "sched/workflow_config.hpp"
#include "test_helpers.hpp"

namespace {
namespace cs = conductor::sched;
using cs::test::make_task;
using cs::test::wait_for_task_status;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

/// Thread-safe record of executor invocations
class ExecutionLog final {
public:
    void record(const std::string &task_id) {
        const std::lock_guard<std::mutex> lock(mutex_);
        order_.push_back(task_id);
    }

    [[nodiscard]] std::vector<std::string> order() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
};

/// Tracks the number of simultaneously running executors
class ConcurrencyGauge final {
public:
    void enter() {
        const int now_active = ++active_;
        int seen = peak_.load();
        while (now_active > seen && !peak_.compare_exchange_weak(seen, now_active)) {
        }
    }

    void leave() { --active_; }

    [[nodiscard]] int active() const { return active_.load(); }
    [[nodiscard]] int peak() const { return peak_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

/// Builder preset with short backoff and polling for fast tests
cs::WorkflowBuilder fast_workflow(const std::string &workflow_id) {
    auto builder = cs::Workflow::create(workflow_id);
    builder.backoff(5ms, 2.0, 50ms).idle_poll(5ms);
    return builder;
}

cs::ExecutionResult succeed(const cs::ExecutionContext &ctx) {
    return cs::ExecutionResult::ok(ctx.task_id);
}

/// Executor body that runs until the attempt is cancelled
cs::ExecutionResult run_until_cancelled(const cs::ExecutionContext &ctx) {
    while (!ctx.is_cancelled()) {
        std::this_thread::sleep_for(1ms);
    }
    return cs::ExecutionResult::failure("interrupted");
}

TEST(Workflow, BuilderValidatesConfiguration) {
    EXPECT_THROW(
            static_cast<void>(cs::Workflow::create("bad").max_concurrent(0).build()),
            std::invalid_argument);
    EXPECT_THROW(static_cast<void>(cs::Workflow::create("").build()), std::invalid_argument);
    EXPECT_THROW(
            static_cast<void>(cs::Workflow::create("bad").backoff(1s, 0.5, 2s).build()),
            std::invalid_argument);

    const auto workflow = cs::Workflow::create("good")
                                  .strategy(cs::WorkflowStrategy::Sequential)
                                  .max_concurrent(4)
                                  .continue_on_failure()
                                  .max_attempts(6)
                                  .default_timeout(2s)
                                  .build();
    EXPECT_EQ(workflow->id(), "good");
    EXPECT_EQ(workflow->config().strategy, cs::WorkflowStrategy::Sequential);
    EXPECT_EQ(workflow->config().max_concurrent, 4U);
    EXPECT_TRUE(workflow->config().continue_on_failure);
    EXPECT_EQ(workflow->config().retry.max_attempts, 6U);
    EXPECT_EQ(workflow->get_workflow_status(), cs::WorkflowStatus::Pending);
}

TEST(Workflow, BuilderAppliesLoadedConfig) {
    const auto loaded = cs::parse_workflow_config(
            R"({"workflow_id": "from_config", "strategy": "adaptive", "max_concurrent": 7})");
    ASSERT_TRUE(loaded.has_value());

    const auto named = cs::Workflow::create("override").config(*loaded).build();
    EXPECT_EQ(named->id(), "override");
    EXPECT_EQ(named->config().strategy, cs::WorkflowStrategy::Adaptive);
    EXPECT_EQ(named->config().max_concurrent, 7U);

    const auto unnamed = cs::Workflow::create("").config(*loaded).build();
    EXPECT_EQ(unnamed->id(), "from_config");
}

TEST(Workflow, SubmissionDefaultsAndValidation) {
    const auto workflow = fast_workflow("submit").max_attempts(4).default_timeout(30ms).build();

    ASSERT_FALSE(workflow->add_task(make_task("a")));
    ASSERT_FALSE(workflow->add_task(
            cs::TaskDescriptor::create("b").depends_on("a").max_attempts(1).timeout(1s).build()));

    const auto a = workflow->get_task("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->max_attempts, 4U);
    EXPECT_EQ(a->timeout, cs::Nanos{30ms});
    EXPECT_EQ(a->status, cs::TaskStatus::Pending);

    const auto b = workflow->get_task("b");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->max_attempts, 1U);
    EXPECT_EQ(b->timeout, cs::Nanos{1s});

    const auto duplicate = workflow->add_task(make_task("a"));
    EXPECT_EQ(duplicate, cs::SchedErrc::DuplicateTaskId);
    EXPECT_TRUE(cs::is_validation_error(duplicate));
    EXPECT_EQ(workflow->add_task(make_task("c", {"ghost"})), cs::SchedErrc::UnknownDependency);
    EXPECT_EQ(workflow->add_task(make_task("d", {"d"})), cs::SchedErrc::CycleDetected);

    std::vector<cs::TaskDescriptor> batch{make_task("x", {"y"}), make_task("y", {"x"})};
    EXPECT_EQ(workflow->add_tasks(std::move(batch)), cs::SchedErrc::CycleDetected);
    EXPECT_EQ(workflow->get_queue_stats().total, 2U);
    EXPECT_FALSE(workflow->get_task("nope").has_value());
    EXPECT_FALSE(workflow->get_task_status("nope").has_value());
}

TEST(Workflow, EmptyWorkflowCompletes) {
    const auto workflow = fast_workflow("empty").build();
    const auto summary = workflow->process_queue(succeed);
    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(summary.stats.total, 0U);
}

TEST(Workflow, ProcessQueueRejectsEmptyExecutor) {
    const auto workflow = fast_workflow("no_executor").build();
    EXPECT_THROW(static_cast<void>(workflow->process_queue(cs::Executor{})), std::invalid_argument);
    EXPECT_EQ(workflow->get_workflow_status(), cs::WorkflowStatus::Pending);
}

TEST(Workflow, PriorityOrderWithSingleSlot) {
    const auto workflow = fast_workflow("priority").max_concurrent(1).build();
    ASSERT_FALSE(workflow->add_task(make_task("normal_1")));
    ASSERT_FALSE(workflow->add_task(make_task("background", {}, cs::TaskPriority::Background)));
    ASSERT_FALSE(workflow->add_task(make_task("normal_2")));
    ASSERT_FALSE(workflow->add_task(make_task("critical", {}, cs::TaskPriority::Critical)));
    ASSERT_FALSE(workflow->add_task(make_task("high", {}, cs::TaskPriority::High)));

    ExecutionLog log{};
    const auto summary = workflow->process_queue([&log](const cs::ExecutionContext &ctx) {
        log.record(ctx.task_id);
        return cs::ExecutionResult::ok();
    });

    const std::vector<std::string> expected{
            "critical", "high", "normal_1", "normal_2", "background"};
    EXPECT_EQ(log.order(), expected);
    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(summary.stats.succeeded, 5U);
}

TEST(Workflow, DependenciesRunFirst) {
    const auto workflow = fast_workflow("deps").max_concurrent(4).build();
    std::vector<cs::TaskDescriptor> batch{
            make_task("report", {"transform"}),
            make_task("transform", {"extract_a", "extract_b"}),
            make_task("extract_a"),
            make_task("extract_b")};
    ASSERT_FALSE(workflow->add_tasks(std::move(batch)));

    ExecutionLog log{};
    const auto summary = workflow->process_queue([&log](const cs::ExecutionContext &ctx) {
        log.record(ctx.task_id);
        std::this_thread::sleep_for(2ms);
    });
    ASSERT_EQ(summary.status, cs::WorkflowStatus::Completed);

    const auto order = log.order();
    ASSERT_EQ(order.size(), 4U);
    const auto position = [&order](const std::string &id) {
        return std::find(order.begin(), order.end(), id) - order.begin();
    };
    EXPECT_LT(position("extract_a"), position("transform"));
    EXPECT_LT(position("extract_b"), position("transform"));
    EXPECT_EQ(order.back(), "report");
}

TEST(Workflow, MaxConcurrentNeverExceeded) {
    const auto workflow = fast_workflow("bounded").max_concurrent(3).build();
    for (int i = 0; i < 12; ++i) {
        ASSERT_FALSE(workflow->add_task(make_task("t" + std::to_string(i))));
    }

    ConcurrencyGauge gauge{};
    const auto summary = workflow->process_queue([&gauge](const cs::ExecutionContext &) {
        gauge.enter();
        std::this_thread::sleep_for(10ms);
        gauge.leave();
        return cs::ExecutionResult::ok();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(summary.stats.succeeded, 12U);
    EXPECT_LE(gauge.peak(), 3);
    EXPECT_GE(gauge.peak(), 2);
}

TEST(Workflow, SequentialRunsOneAtATime) {
    const auto workflow =
            fast_workflow("sequential").strategy(cs::WorkflowStrategy::Sequential).build();
    for (int i = 0; i < 5; ++i) {
        ASSERT_FALSE(workflow->add_task(make_task("s" + std::to_string(i))));
    }

    ConcurrencyGauge gauge{};
    ExecutionLog log{};
    const auto summary = workflow->process_queue([&gauge, &log](const cs::ExecutionContext &ctx) {
        gauge.enter();
        log.record(ctx.task_id);
        std::this_thread::sleep_for(5ms);
        gauge.leave();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(gauge.peak(), 1);
    const std::vector<std::string> expected{"s0", "s1", "s2", "s3", "s4"};
    EXPECT_EQ(log.order(), expected);
}

TEST(Workflow, AdaptiveWidensForWideReadySet) {
    const auto workflow = fast_workflow("adaptive")
                                  .strategy(cs::WorkflowStrategy::Adaptive)
                                  .max_concurrent(4)
                                  .build();
    // Wide first generation, then a narrow tail
    for (int i = 0; i < 6; ++i) {
        ASSERT_FALSE(workflow->add_task(make_task("wide" + std::to_string(i))));
    }
    ASSERT_FALSE(workflow->add_task(make_task("tail", {"wide0", "wide5"})));

    ConcurrencyGauge gauge{};
    std::atomic<bool> full_width{false};
    const auto summary = workflow->process_queue([&](const cs::ExecutionContext &) {
        gauge.enter();
        if (!full_width.load()) {
            if (cs::test::wait_for([&gauge] { return gauge.active() >= 4; }, 2000ms)) {
                full_width.store(true);
            }
        }
        gauge.leave();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(summary.stats.succeeded, 7U);
    EXPECT_TRUE(full_width.load());
    EXPECT_EQ(gauge.peak(), 4);
}

TEST(Workflow, AdaptiveNarrowsToReadySet) {
    const auto workflow = fast_workflow("adaptive_chain")
                                  .strategy(cs::WorkflowStrategy::Adaptive)
                                  .max_concurrent(4)
                                  .build();
    ASSERT_FALSE(workflow->add_task(make_task("c0")));
    for (int i = 1; i < 4; ++i) {
        ASSERT_FALSE(workflow->add_task(
                make_task("c" + std::to_string(i), {"c" + std::to_string(i - 1)})));
    }
    // Once c0 finishes only one task is ready at a time, and "slow" holds that single slot
    ASSERT_FALSE(workflow->add_task(make_task("slow", {}, cs::TaskPriority::Critical)));
    ASSERT_FALSE(workflow->add_task(make_task("fast", {"c3"})));
    ASSERT_FALSE(workflow->add_task(make_task("child", {"fast"})));

    ConcurrencyGauge gauge{};
    std::atomic<bool> slow_running{false};
    std::atomic<bool> child_overlapped{false};
    const auto summary = workflow->process_queue([&](const cs::ExecutionContext &ctx) {
        gauge.enter();
        if (ctx.task_id == "slow") {
            slow_running.store(true);
            std::this_thread::sleep_for(200ms);
            slow_running.store(false);
        } else if (ctx.task_id == "child") {
            child_overlapped.store(slow_running.load());
        } else {
            std::this_thread::sleep_for(2ms);
        }
        gauge.leave();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(summary.stats.succeeded, 7U);
    // Only "slow" and "c0" are ever ready together, the chain waits for "slow"
    EXPECT_EQ(gauge.peak(), 2);
    EXPECT_FALSE(child_overlapped.load());
}

/// Runs a failing root and four leaves; reports the peak leaf concurrency
int degraded_leaf_peak(const bool counts_degraded) {
    const auto workflow = fast_workflow("adaptive_degraded")
                                  .strategy(cs::WorkflowStrategy::Adaptive)
                                  .max_concurrent(4)
                                  .continue_on_failure()
                                  .adaptive_counts_degraded_tasks(counts_degraded)
                                  .max_attempts(1)
                                  .build();
    EXPECT_FALSE(workflow->add_task(make_task("root")));
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(workflow->add_task(make_task("leaf" + std::to_string(i), {"root"})));
    }

    ConcurrencyGauge gauge{};
    std::atomic<bool> widened{false};
    const auto summary =
            workflow->process_queue([&](const cs::ExecutionContext &ctx) -> cs::ExecutionResult {
                if (ctx.task_id == "root") {
                    return cs::ExecutionResult::failure("broken");
                }
                gauge.enter();
                if (!widened.load() &&
                    cs::test::wait_for([&gauge] { return gauge.active() >= 2; }, 200ms)) {
                    widened.store(true);
                }
                gauge.leave();
                return cs::ExecutionResult::ok();
            });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(summary.stats.failed, 1U);
    EXPECT_EQ(summary.stats.succeeded, 4U);
    return gauge.peak();
}

TEST(Workflow, AdaptiveIgnoresDegradedTasksWhenDisabled) {
    EXPECT_EQ(degraded_leaf_peak(false), 1);
}

TEST(Workflow, AdaptiveCountsDegradedTasksByDefault) {
    EXPECT_GT(degraded_leaf_peak(true), 1);
}

TEST(Workflow, RetriesWithExponentialBackoff) {
    // Default policy: three attempts, 1s then 2s apart
    const auto workflow = cs::Workflow::create("backoff").idle_poll(20ms).build();
    ASSERT_FALSE(workflow->add_task(make_task("flaky")));

    std::mutex mutex;
    std::map<std::uint32_t, std::chrono::steady_clock::time_point> started;
    const auto summary =
            workflow->process_queue([&mutex, &started](const cs::ExecutionContext &ctx) {
                {
                    const std::lock_guard<std::mutex> lock(mutex);
                    started[ctx.attempt] = std::chrono::steady_clock::now();
                }
                return cs::ExecutionResult::failure("connection reset by peer");
            });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    ASSERT_EQ(started.size(), 3U);
    const auto first_gap = started[2] - started[1];
    const auto second_gap = started[3] - started[2];
    EXPECT_GE(first_gap, 950ms);
    EXPECT_LT(first_gap, 1500ms);
    EXPECT_GE(second_gap, 1950ms);
    EXPECT_LT(second_gap, 2600ms);

    const auto record = workflow->get_task("flaky");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, cs::TaskStatus::Failed);
    EXPECT_EQ(record->attempts, 3U);
    EXPECT_EQ(record->failure_kind, cs::FailureKind::Execution);
    EXPECT_EQ(record->error, "connection reset by peer");

    const auto retry_summary = workflow->get_retry_summary("flaky");
    ASSERT_TRUE(retry_summary.has_value());
    EXPECT_EQ(retry_summary->attempts, 3U);
    EXPECT_EQ(retry_summary->error_history.size(), 3U);
    EXPECT_EQ(retry_summary->total_backoff, cs::Nanos{3s});
    EXPECT_FALSE(retry_summary->succeeded);
    EXPECT_FALSE(workflow->get_retry_summary("unknown").has_value());

    EXPECT_EQ(summary.root_cause_ids, std::vector<std::string>{"flaky"});
}

TEST(Workflow, RetryEventuallySucceeds) {
    const auto workflow = fast_workflow("eventual").max_attempts(3).build();
    ASSERT_FALSE(workflow->add_task(make_task("flaky")));

    std::atomic<int> completions{0};
    std::atomic<int> failures{0};
    workflow->on_task_complete([&completions](const cs::TaskRecord &) { ++completions; });
    workflow->on_task_failed([&failures](const cs::TaskRecord &) { ++failures; });

    const auto summary = workflow->process_queue([](const cs::ExecutionContext &ctx) {
        return ctx.attempt < 3 ? cs::ExecutionResult::failure("resource busy")
                               : cs::ExecutionResult::ok("third time lucky");
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    const auto record = workflow->get_task("flaky");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, cs::TaskStatus::Succeeded);
    EXPECT_EQ(record->attempts, 3U);
    EXPECT_EQ(record->result, "third time lucky");
    EXPECT_TRUE(record->error.empty());
    EXPECT_EQ(record->error_history.size(), 2U);
    EXPECT_EQ(completions.load(), 1);
    // Intermediate failures are not terminal
    EXPECT_EQ(failures.load(), 0);
}

TEST(Workflow, NonRetryableFailureStopsImmediately) {
    cs::RetryPolicy policy{};
    policy.max_attempts = 5;
    policy.backoff_base = 5ms;
    policy.max_backoff = 50ms;
    policy.classify_errors = true;
    const auto workflow = cs::Workflow::create("fatal").retry_policy(policy).idle_poll(5ms).build();
    ASSERT_FALSE(workflow->add_task(make_task("denied")));
    ASSERT_FALSE(workflow->add_task(make_task("rejected")));
    ASSERT_FALSE(workflow->add_task(make_task("thrown")));

    const auto summary = workflow->process_queue(
            [](const cs::ExecutionContext &ctx) -> cs::ExecutionResult {
                if (ctx.task_id == "denied") {
                    return cs::ExecutionResult::failure("Permission denied");
                }
                if (ctx.task_id == "rejected") {
                    return cs::ExecutionResult::non_retryable("schema mismatch");
                }
                throw std::runtime_error("file does not exist");
            });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    EXPECT_EQ(summary.stats.failed, 3U);
    for (const auto *id : {"denied", "rejected", "thrown"}) {
        const auto record = workflow->get_task(id);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->attempts, 1U) << id;
    }
    EXPECT_EQ(workflow->get_task("thrown")->error, "Exception: file does not exist");
}

TEST(Workflow, PermanentLookingFailuresRetryByDefault) {
    const auto workflow = fast_workflow("unclassified").max_attempts(3).build();
    ASSERT_FALSE(workflow->add_task(make_task("lookup")));
    ASSERT_FALSE(workflow->add_task(make_task("flaky_lookup")));

    const auto summary = workflow->process_queue(
            [](const cs::ExecutionContext &ctx) -> cs::ExecutionResult {
                if (ctx.task_id == "flaky_lookup" && ctx.attempt == 3) {
                    return cs::ExecutionResult::ok("found");
                }
                return cs::ExecutionResult::failure("upstream record missing");
            });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    const auto lookup = workflow->get_task("lookup");
    ASSERT_TRUE(lookup.has_value());
    EXPECT_EQ(lookup->status, cs::TaskStatus::Failed);
    EXPECT_EQ(lookup->attempts, 3U);
    EXPECT_EQ(lookup->error_history.size(), 3U);

    const auto flaky = workflow->get_task("flaky_lookup");
    ASSERT_TRUE(flaky.has_value());
    EXPECT_EQ(flaky->status, cs::TaskStatus::Completed);
    EXPECT_EQ(flaky->attempts, 3U);
}

TEST(Workflow, FailurePropagatesToDependents) {
    const auto workflow = fast_workflow("blocked").max_attempts(1).build();
    std::vector<cs::TaskDescriptor> batch{
            make_task("a"),
            make_task("b", {"a"}),
            make_task("c", {"b"}),
            make_task("independent")};
    ASSERT_FALSE(workflow->add_tasks(std::move(batch)));

    ExecutionLog failed{};
    workflow->on_task_failed([&failed](const cs::TaskRecord &record) { failed.record(record.id); });

    ExecutionLog executed{};
    const auto summary = workflow->process_queue([&executed](const cs::ExecutionContext &ctx) {
        executed.record(ctx.task_id);
        return ctx.task_id == "a" ? cs::ExecutionResult::failure("crashed")
                                  : cs::ExecutionResult::ok();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    EXPECT_EQ(workflow->get_task_status("b"), cs::TaskStatus::Blocked);
    EXPECT_EQ(workflow->get_task_status("c"), cs::TaskStatus::Blocked);
    EXPECT_EQ(workflow->get_task_status("independent"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(workflow->get_task("c")->blocked_by, "a");
    EXPECT_EQ(workflow->get_task("c")->failure_kind, cs::FailureKind::DependencyFailed);

    // Blocked tasks never ran
    const auto ran = executed.order();
    EXPECT_EQ(std::count(ran.begin(), ran.end(), "b"), 0);
    EXPECT_EQ(std::count(ran.begin(), ran.end(), "c"), 0);

    EXPECT_EQ(summary.root_cause_ids, std::vector<std::string>{"a"});
    EXPECT_EQ(summary.blocked_ids, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(summary.stats.blocked, 2U);
    EXPECT_EQ(failed.order().size(), 3U);
}

TEST(Workflow, ContinueOnFailureRunsDependents) {
    const auto workflow = fast_workflow("continue").max_attempts(1).continue_on_failure().build();
    std::vector<cs::TaskDescriptor> batch{
            make_task("a"), make_task("b", {"a"}), make_task("c", {"b"})};
    ASSERT_FALSE(workflow->add_tasks(std::move(batch)));

    const auto summary = workflow->process_queue([](const cs::ExecutionContext &ctx) {
        return ctx.task_id == "a" ? cs::ExecutionResult::failure("crashed")
                                  : cs::ExecutionResult::ok();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(workflow->get_task_status("a"), cs::TaskStatus::Failed);
    EXPECT_EQ(workflow->get_task_status("b"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(workflow->get_task_status("c"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(summary.stats.failed, 1U);
    EXPECT_EQ(summary.stats.blocked, 0U);
    EXPECT_EQ(summary.root_cause_ids, std::vector<std::string>{"a"});
}

TEST(Workflow, TimeoutAbandonsAttempt) {
    const auto workflow = fast_workflow("timeouts").max_attempts(2).build();
    ASSERT_FALSE(workflow->add_task(cs::TaskDescriptor::create("hang").timeout(50ms).build()));
    ASSERT_FALSE(workflow->add_task(make_task("quick")));

    const auto started = std::chrono::steady_clock::now();
    const auto summary = workflow->process_queue([](const cs::ExecutionContext &ctx) {
        return ctx.task_id == "hang" ? run_until_cancelled(ctx) : cs::ExecutionResult::ok();
    });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    EXPECT_LT(elapsed, 2s);

    const auto record = workflow->get_task("hang");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, cs::TaskStatus::Failed);
    EXPECT_EQ(record->failure_kind, cs::FailureKind::Timeout);
    EXPECT_EQ(record->attempts, 2U);
    EXPECT_EQ(record->error, "Task 'hang' timed out after 50 ms");
    ASSERT_EQ(record->error_history.size(), 2U);
    EXPECT_EQ(record->error_history[0].kind, cs::FailureKind::Timeout);
    EXPECT_EQ(workflow->get_task_status("quick"), cs::TaskStatus::Succeeded);
}

TEST(Workflow, TaskAfterAbandonedAttemptStillRuns) {
    const auto workflow = fast_workflow("abandoned").max_concurrent(1).max_attempts(1).build();
    ASSERT_FALSE(workflow->add_task(cs::TaskDescriptor::create("hang")
                                            .priority(cs::TaskPriority::Critical)
                                            .timeout(50ms)
                                            .build()));
    ASSERT_FALSE(workflow->add_task(make_task("a", {}, cs::TaskPriority::High)));
    ASSERT_FALSE(workflow->add_task(cs::TaskDescriptor::create("b").timeout(150ms).build()));

    ExecutionLog started{};
    const auto summary = workflow->process_queue([&started](const cs::ExecutionContext &ctx) {
        started.record(ctx.task_id);
        if (ctx.task_id == "hang") {
            // Notices cancellation only on a coarse period
            while (!ctx.is_cancelled()) {
                std::this_thread::sleep_for(400ms);
            }
            return cs::ExecutionResult::failure("interrupted");
        }
        return cs::ExecutionResult::ok();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    EXPECT_EQ(workflow->get_task("hang")->failure_kind, cs::FailureKind::Timeout);
    EXPECT_EQ(workflow->get_task_status("a"), cs::TaskStatus::Succeeded);
    const auto b = workflow->get_task("b");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->status, cs::TaskStatus::Succeeded) << b->error;
    EXPECT_EQ(b->attempts, 1U);
    const std::vector<std::string> expected{"hang", "a", "b"};
    EXPECT_EQ(started.order(), expected);
}

TEST(Workflow, PauseAndResume) {
    const auto workflow = fast_workflow("pausable").max_concurrent(1).build();
    EXPECT_EQ(workflow->pause(), cs::SchedErrc::InvalidTransition);
    EXPECT_EQ(workflow->resume(), cs::SchedErrc::InvalidTransition);
    ASSERT_FALSE(workflow->add_task(make_task("t1", {}, cs::TaskPriority::Critical)));
    ASSERT_FALSE(workflow->add_task(make_task("t2", {}, cs::TaskPriority::Low)));
    ASSERT_FALSE(workflow->add_task(make_task("t3", {}, cs::TaskPriority::High)));
    ASSERT_FALSE(workflow->add_task(make_task("t4")));

    ExecutionLog log{};
    std::atomic<bool> release{false};
    const cs::Executor executor = [&release, &log](const cs::ExecutionContext &ctx) {
        log.record(ctx.task_id);
        while (ctx.task_id == "t1" && !release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        return cs::ExecutionResult::ok();
    };

    cs::WorkflowSummary first{};
    std::thread runner([&workflow, &executor, &first] { first = workflow->process_queue(executor); });

    EXPECT_TRUE(wait_for_task_status(*workflow, "t1", cs::TaskStatus::Running));
    EXPECT_FALSE(workflow->pause());
    EXPECT_EQ(workflow->get_workflow_status(), cs::WorkflowStatus::Paused);
    EXPECT_EQ(workflow->pause(), cs::SchedErrc::InvalidTransition);
    release.store(true);
    runner.join();

    // The running task finished, nothing new was dequeued
    EXPECT_EQ(first.status, cs::WorkflowStatus::Paused);
    EXPECT_EQ(first.stats.succeeded, 1U);
    EXPECT_EQ(workflow->get_task_status("t1"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(workflow->get_queue_stats().running, 0U);
    EXPECT_EQ(log.order(), (std::vector<std::string>{"t1"}));

    EXPECT_FALSE(workflow->resume());
    EXPECT_EQ(workflow->get_workflow_status(), cs::WorkflowStatus::Running);
    const auto second = workflow->process_queue(executor);
    EXPECT_EQ(second.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(second.stats.succeeded, 4U);
    const std::vector<std::string> expected{"t1", "t3", "t4", "t2"};
    EXPECT_EQ(log.order(), expected);
}

TEST(Workflow, LifecycleChangesPersistWithoutLoop) {
    cs::test::TempPathManager temp_manager{"workflow_lifecycle"};
    const auto path = temp_manager.get_temp_path(".json");

    const auto workflow = fast_workflow("lifecycle").max_concurrent(1).snapshot_path(path).build();
    ASSERT_FALSE(workflow->add_task(make_task("first", {}, cs::TaskPriority::High)));
    ASSERT_FALSE(workflow->add_task(make_task("second")));
    ASSERT_FALSE(workflow->add_task(make_task("third", {"second"})));

    std::atomic<bool> release{false};
    const cs::Executor executor = [&release](const cs::ExecutionContext &ctx) {
        while (ctx.task_id == "first" && !release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        return cs::ExecutionResult::ok();
    };

    cs::WorkflowSummary paused{};
    std::thread runner([&workflow, &executor, &paused] { paused = workflow->process_queue(executor); });
    EXPECT_TRUE(wait_for_task_status(*workflow, "first", cs::TaskStatus::Running));
    EXPECT_FALSE(workflow->pause());
    release.store(true);
    runner.join();
    ASSERT_EQ(paused.status, cs::WorkflowStatus::Paused);

    auto stored = cs::read_snapshot(path);
    ASSERT_TRUE(stored.has_value()) << stored.error();
    EXPECT_EQ(stored->workflow_status, cs::WorkflowStatus::Paused);

    // Resume and cancel happen with no loop running
    EXPECT_FALSE(workflow->resume());
    stored = cs::read_snapshot(path);
    ASSERT_TRUE(stored.has_value()) << stored.error();
    EXPECT_EQ(stored->workflow_status, cs::WorkflowStatus::Running);

    EXPECT_FALSE(workflow->cancel());
    const auto reloaded = fast_workflow("lifecycle").snapshot_path(path).build();
    ASSERT_FALSE(reloaded->restore_from_snapshot_file());
    EXPECT_EQ(reloaded->get_workflow_status(), cs::WorkflowStatus::Cancelled);
    EXPECT_EQ(reloaded->get_task_status("first"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(reloaded->get_task_status("second"), cs::TaskStatus::Cancelled);
    EXPECT_EQ(reloaded->get_task_status("third"), cs::TaskStatus::Cancelled);
    EXPECT_EQ(reloaded->get_task("third")->error, "Workflow cancelled");

    // Nothing comes back to life
    std::atomic<int> calls{0};
    const auto again = reloaded->process_queue([&calls](const cs::ExecutionContext &) { ++calls; });
    EXPECT_EQ(again.status, cs::WorkflowStatus::Cancelled);
    EXPECT_EQ(calls.load(), 0);
}

TEST(Workflow, CancelWorkflow) {
    const auto workflow = fast_workflow("cancellable").max_concurrent(1).build();
    ASSERT_FALSE(workflow->add_task(make_task("long", {}, cs::TaskPriority::Critical)));
    ASSERT_FALSE(workflow->add_task(make_task("after", {"long"})));
    ASSERT_FALSE(workflow->add_task(make_task("other", {}, cs::TaskPriority::Low)));

    cs::WorkflowSummary summary{};
    std::thread runner([&workflow, &summary] {
        summary = workflow->process_queue(run_until_cancelled);
    });

    EXPECT_TRUE(wait_for_task_status(*workflow, "long", cs::TaskStatus::Running));
    EXPECT_FALSE(workflow->cancel());
    runner.join();

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Cancelled);
    EXPECT_EQ(summary.stats.cancelled, 3U);
    const auto record = workflow->get_task("long");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, cs::TaskStatus::Cancelled);
    EXPECT_EQ(record->failure_kind, cs::FailureKind::Cancellation);
    EXPECT_EQ(record->error, "Workflow cancelled");
    EXPECT_EQ(workflow->get_task("after")->error, "Workflow cancelled");

    // Cancelled is terminal
    EXPECT_EQ(workflow->cancel(), cs::SchedErrc::WorkflowTerminal);
    EXPECT_EQ(workflow->pause(), cs::SchedErrc::WorkflowTerminal);
    EXPECT_EQ(workflow->resume(), cs::SchedErrc::WorkflowTerminal);
    EXPECT_EQ(workflow->add_task(make_task("late")), cs::SchedErrc::WorkflowTerminal);
    EXPECT_EQ(workflow->cancel_task("other"), cs::SchedErrc::WorkflowTerminal);
}

TEST(Workflow, CancelBeforeProcessing) {
    const auto workflow = fast_workflow("cancel_early").build();
    ASSERT_FALSE(workflow->add_task(make_task("a")));
    EXPECT_FALSE(workflow->cancel());

    const auto summary = workflow->process_queue(succeed);
    EXPECT_EQ(summary.status, cs::WorkflowStatus::Cancelled);
    EXPECT_EQ(workflow->get_task_status("a"), cs::TaskStatus::Cancelled);
}

TEST(Workflow, CancelWaitingTask) {
    const auto workflow = fast_workflow("cancel_waiting").build();
    ASSERT_FALSE(workflow->add_task(make_task("a")));
    ASSERT_FALSE(workflow->add_task(make_task("b", {"a"})));
    ASSERT_FALSE(workflow->add_task(make_task("c", {"b"})));

    EXPECT_FALSE(workflow->cancel_task("b"));
    EXPECT_EQ(workflow->get_task_status("b"), cs::TaskStatus::Cancelled);
    EXPECT_EQ(workflow->cancel_task("b"), cs::SchedErrc::InvalidTransition);
    EXPECT_EQ(workflow->cancel_task("ghost"), cs::SchedErrc::TaskNotFound);

    const auto summary = workflow->process_queue(succeed);
    EXPECT_EQ(workflow->get_task_status("a"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(workflow->get_task_status("c"), cs::TaskStatus::Blocked);
    EXPECT_EQ(workflow->get_task("c")->blocked_by, "b");
    EXPECT_EQ(summary.cancelled_ids, std::vector<std::string>{"b"});
    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
}

TEST(Workflow, CancelRunningTask) {
    const auto workflow =
            fast_workflow("cancel_running").max_concurrent(2).continue_on_failure().build();
    ASSERT_FALSE(workflow->add_task(make_task("slow")));
    ASSERT_FALSE(workflow->add_task(make_task("fast")));

    cs::WorkflowSummary summary{};
    std::thread runner([&workflow, &summary] {
        summary = workflow->process_queue([](const cs::ExecutionContext &ctx) {
            return ctx.task_id == "slow" ? run_until_cancelled(ctx) : cs::ExecutionResult::ok();
        });
    });

    EXPECT_TRUE(wait_for_task_status(*workflow, "slow", cs::TaskStatus::Running));
    EXPECT_FALSE(workflow->cancel_task("slow"));
    runner.join();

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    const auto record = workflow->get_task("slow");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, cs::TaskStatus::Cancelled);
    EXPECT_EQ(record->error, "Cancelled by request");
    EXPECT_EQ(record->attempts, 1U);
    EXPECT_EQ(workflow->get_task_status("fast"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(summary.cancelled_ids, std::vector<std::string>{"slow"});
}

TEST(Workflow, ConcurrentProcessingRejected) {
    const auto workflow = fast_workflow("single_loop").build();
    ASSERT_FALSE(workflow->add_task(make_task("blocker")));

    std::thread runner([&workflow] {
        static_cast<void>(workflow->process_queue(run_until_cancelled));
    });
    EXPECT_TRUE(wait_for_task_status(*workflow, "blocker", cs::TaskStatus::Running));
    EXPECT_THROW(static_cast<void>(workflow->process_queue(succeed)), std::logic_error);

    EXPECT_FALSE(workflow->cancel());
    runner.join();
}

TEST(Workflow, CallbacksFireOutsideLoopFailures) {
    const auto workflow = fast_workflow("callbacks").max_attempts(1).build();
    ASSERT_FALSE(workflow->add_task(make_task("ok_1")));
    ASSERT_FALSE(workflow->add_task(make_task("ok_2")));
    ASSERT_FALSE(workflow->add_task(make_task("bad")));

    ExecutionLog completed{};
    ExecutionLog failed{};
    workflow->on_task_complete([&completed, &workflow](const cs::TaskRecord &record) {
        // Queries from a callback must not deadlock
        EXPECT_EQ(workflow->get_task_status(record.id), cs::TaskStatus::Succeeded);
        completed.record(record.id);
        throw std::runtime_error("callback failure is contained");
    });
    workflow->on_task_failed([&failed](const cs::TaskRecord &record) {
        EXPECT_EQ(record.status, cs::TaskStatus::Failed);
        EXPECT_EQ(record.error, "nope");
        failed.record(record.id);
    });

    const auto summary = workflow->process_queue([](const cs::ExecutionContext &ctx) {
        return ctx.task_id == "bad" ? cs::ExecutionResult::failure("nope")
                                    : cs::ExecutionResult::ok();
    });

    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    EXPECT_EQ(completed.order().size(), 2U);
    EXPECT_EQ(failed.order(), std::vector<std::string>{"bad"});
}

TEST(Workflow, QueriesByTagStatusAndGraph) {
    const auto workflow = fast_workflow("queries").max_concurrent(7).build();
    ASSERT_FALSE(workflow->add_task(cs::TaskDescriptor::create("load").tag("io").build()));
    ASSERT_FALSE(workflow->add_task(
            cs::TaskDescriptor::create("parse").depends_on("load").tag("cpu").build()));
    ASSERT_FALSE(workflow->add_task(
            cs::TaskDescriptor::create("store").depends_on("parse").tag("io").build()));
    ASSERT_FALSE(workflow->add_task(make_task("audit")));

    const auto stats = workflow->get_queue_stats();
    EXPECT_EQ(stats.total, 4U);
    EXPECT_EQ(stats.pending, 4U);
    EXPECT_EQ(stats.max_concurrent, 7U);
    EXPECT_EQ(stats.queue_size, 0U);

    const auto io_tasks = workflow->get_tasks_by_tag("io");
    ASSERT_EQ(io_tasks.size(), 2U);
    EXPECT_EQ(io_tasks[0].id, "load");
    EXPECT_EQ(io_tasks[1].id, "store");
    EXPECT_TRUE(workflow->get_tasks_by_tag("gpu").empty());

    const auto groups = workflow->parallel_groups();
    ASSERT_EQ(groups.size(), 3U);
    EXPECT_EQ(groups[0], (std::vector<std::string>{"load", "audit"}));
    EXPECT_EQ(
            workflow->topological_order(),
            (std::vector<std::string>{"load", "audit", "parse", "store"}));

    const auto summary = workflow->process_queue([](const cs::ExecutionContext &ctx) {
        return ctx.task_id == "audit" ? cs::ExecutionResult::failure("Access denied")
                                      : cs::ExecutionResult::ok();
    });
    EXPECT_EQ(summary.status, cs::WorkflowStatus::Failed);
    EXPECT_EQ(workflow->get_tasks_by_status(cs::TaskStatus::Succeeded).size(), 3U);
    const auto failed = workflow->get_tasks_by_status(cs::TaskStatus::Failed);
    ASSERT_EQ(failed.size(), 1U);
    EXPECT_EQ(failed[0].id, "audit");
}

TEST(Workflow, SummaryMessage) {
    const auto workflow = fast_workflow("report").build();
    ASSERT_FALSE(workflow->add_task(make_task("a")));
    ASSERT_FALSE(workflow->add_task(make_task("b")));
    const auto summary = workflow->process_queue(succeed);

    const std::string message = summary.message();
    EXPECT_EQ(
            message.rfind("Workflow 'report' Completed: 2/2 succeeded, 0 failed, 0 blocked, "
                          "0 cancelled in ",
                          0),
            0U)
            << message;
    EXPECT_EQ(workflow->get_summary().status, cs::WorkflowStatus::Completed);
}

TEST(Workflow, TerminalWorkflowRejectsChanges) {
    const auto workflow = fast_workflow("finished").build();
    ASSERT_FALSE(workflow->add_task(make_task("only")));
    ASSERT_EQ(workflow->process_queue(succeed).status, cs::WorkflowStatus::Completed);

    EXPECT_EQ(workflow->add_task(make_task("late")), cs::SchedErrc::WorkflowTerminal);
    std::vector<cs::TaskDescriptor> batch{make_task("late_batch")};
    EXPECT_EQ(workflow->add_tasks(std::move(batch)), cs::SchedErrc::WorkflowTerminal);
    EXPECT_EQ(workflow->cancel(), cs::SchedErrc::WorkflowTerminal);

    // Processing again reports the final state without running anything
    std::atomic<int> calls{0};
    const auto again = workflow->process_queue([&calls](const cs::ExecutionContext &) { ++calls; });
    EXPECT_EQ(again.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(calls.load(), 0);
}

TEST(Workflow, ClearCompleted) {
    const auto workflow = fast_workflow("cleanup").build();
    ASSERT_FALSE(workflow->add_task(make_task("a")));
    ASSERT_FALSE(workflow->add_task(make_task("b", {"a"})));
    ASSERT_FALSE(workflow->add_task(make_task("c")));
    EXPECT_EQ(workflow->clear_completed(), 0U);

    ASSERT_EQ(workflow->process_queue(succeed).status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(workflow->clear_completed(), 3U);
    EXPECT_EQ(workflow->get_queue_stats().total, 0U);

    const auto snapshot = workflow->snapshot();
    EXPECT_TRUE(snapshot.tasks.empty());
    EXPECT_EQ(snapshot.completed_tasks(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Workflow, PersistsSnapshotWhileProcessing) {
    cs::test::TempPathManager temp_manager{"workflow_snapshot"};
    const auto path = temp_manager.get_temp_path(".json");

    const auto workflow = fast_workflow("persisted").max_attempts(1).snapshot_path(path).build();
    ASSERT_FALSE(workflow->add_task(make_task("good")));
    ASSERT_FALSE(workflow->add_task(make_task("bad")));
    ASSERT_FALSE(workflow->add_task(make_task("child", {"bad"})));

    const auto summary = workflow->process_queue([](const cs::ExecutionContext &ctx) {
        return ctx.task_id == "bad" ? cs::ExecutionResult::failure("broken")
                                    : cs::ExecutionResult::ok();
    });
    ASSERT_EQ(summary.status, cs::WorkflowStatus::Failed);

    const auto stored = cs::read_snapshot(path);
    ASSERT_TRUE(stored.has_value()) << stored.error();
    EXPECT_EQ(stored->workflow_id, "persisted");
    EXPECT_EQ(stored->workflow_status, cs::WorkflowStatus::Failed);
    ASSERT_EQ(stored->tasks.size(), 3U);

    // A fresh workflow with the same id picks up the final state
    const auto reloaded = fast_workflow("persisted").snapshot_path(path).build();
    ASSERT_FALSE(reloaded->restore_from_snapshot_file());
    EXPECT_EQ(reloaded->get_workflow_status(), cs::WorkflowStatus::Failed);
    EXPECT_EQ(reloaded->get_task_status("good"), cs::TaskStatus::Succeeded);
    EXPECT_EQ(reloaded->get_task_status("child"), cs::TaskStatus::Blocked);
    EXPECT_EQ(reloaded->get_task("child")->blocked_by, "bad");
    EXPECT_EQ(reloaded->add_task(make_task("more")), cs::SchedErrc::WorkflowTerminal);
}

TEST(Workflow, RestoreRequeuesInterruptedTasks) {
    const auto source = fast_workflow("resume").build();
    ASSERT_FALSE(source->add_task(make_task("interrupted")));
    ASSERT_FALSE(source->add_task(make_task("queued", {"interrupted"})));
    ASSERT_FALSE(source->add_task(make_task("waiting")));

    auto snapshot = source->snapshot();
    ASSERT_EQ(snapshot.tasks.size(), 3U);
    snapshot.workflow_status = cs::WorkflowStatus::Running;
    snapshot.tasks[0].status = cs::TaskStatus::Running;
    snapshot.tasks[0].attempts = 1;
    snapshot.tasks[0].started_at = cs::Time::now_ns();
    snapshot.tasks[2].status = cs::TaskStatus::Ready;

    const auto target = fast_workflow("resume").build();
    ASSERT_FALSE(target->restore(snapshot));
    EXPECT_EQ(target->get_workflow_status(), cs::WorkflowStatus::Pending);

    const auto restored = target->get_task("interrupted");
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->status, cs::TaskStatus::Pending);
    EXPECT_EQ(restored->attempts, 0U);
    EXPECT_EQ(restored->started_at, cs::Nanos{0});
    EXPECT_EQ(target->get_task_status("waiting"), cs::TaskStatus::Pending);

    const auto summary = target->process_queue(succeed);
    EXPECT_EQ(summary.status, cs::WorkflowStatus::Completed);
    EXPECT_EQ(target->get_task("interrupted")->attempts, 1U);

    // New submissions continue the restored sequence
    const auto other = fast_workflow("paused_copy").build();
    snapshot.workflow_id = "paused_copy";
    snapshot.workflow_status = cs::WorkflowStatus::Paused;
    ASSERT_FALSE(other->restore(snapshot));
    EXPECT_EQ(other->get_workflow_status(), cs::WorkflowStatus::Paused);
    ASSERT_FALSE(other->add_task(make_task("extra")));
    EXPECT_GE(other->get_task("extra")->sequence, snapshot.next_sequence);
}

TEST(Workflow, RestoreErrors) {
    const auto workflow = fast_workflow("strict").build();
    cs::QueueSnapshot foreign{};
    foreign.workflow_id = "someone_else";
    EXPECT_EQ(workflow->restore(foreign), cs::SchedErrc::InvalidParameter);

    cs::QueueSnapshot broken{};
    broken.workflow_id = "strict";
    cs::TaskRecord orphan{};
    orphan.id = "orphan";
    orphan.dependencies = {"missing"};
    broken.tasks.push_back(orphan);
    EXPECT_EQ(workflow->restore(broken), cs::SchedErrc::SnapshotParseFailed);

    EXPECT_EQ(workflow->save_snapshot(), cs::SchedErrc::InvalidParameter);
    EXPECT_EQ(workflow->restore_from_snapshot_file(), cs::SchedErrc::InvalidParameter);

    cs::test::TempPathManager temp_manager{"restore_errors"};
    const auto path = temp_manager.get_temp_path(".json");
    const auto with_path = fast_workflow("strict").snapshot_path(path).build();
    EXPECT_EQ(with_path->restore_from_snapshot_file(), cs::SchedErrc::FileOpenFailed);

    {
        std::ofstream file(path);
        file << "{ definitely not a snapshot";
    }
    EXPECT_EQ(with_path->restore_from_snapshot_file(), cs::SchedErrc::SnapshotParseFailed);

    ASSERT_FALSE(with_path->add_task(make_task("saved")));
    ASSERT_FALSE(with_path->save_snapshot());
    ASSERT_FALSE(with_path->restore_from_snapshot_file());
    EXPECT_EQ(with_path->get_task_status("saved"), cs::TaskStatus::Pending);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // anonymous namespace
