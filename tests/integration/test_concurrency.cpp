/**
 * @file test_concurrency.cpp
 * @brief Concurrency and load tests for upload_manager
 *
 * This file contains tests for:
 * - Large batches under a concurrency limit
 * - Concurrent submitters
 * - Cancellation racing with status queries
 * - Subscribers registered while jobs run
 * - Batch event ordering with slow subscribers
 * - Reclaiming finished worker threads
 */

#include "test_fixtures.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <latch>
#include <mutex>
#include <string>
#include <set>
#include <thread>
#include <vector>

namespace media_upload::test {

using namespace std::chrono_literals;

class ConcurrentUploadTest : public UploadManagerFixture {};

TEST_F(ConcurrentUploadTest, LargeBatchSettlesExactlyOnce) {
    transfer_script script;
    script.chunk_size = 1024;
    script.fail_at_chunk = 2;
    script.fail_status = 500;
    script.failing_titles = {"Clip 3", "Clip 7", "Clip 11", "Clip 15"};
    transfer_ = std::make_shared<mock_transfer_client>(script);
    auto b = manager_builder();
    b.with_max_concurrent_uploads(4);
    auto manager = make_manager(b);
    event_recorder events;
    events.attach(manager);

    std::vector<upload_request> requests;
    for (int i = 0; i < 20; ++i) {
        requests.push_back(make_request("clip" + std::to_string(i) + ".mp4",
                                        "Clip " + std::to_string(i), 16 * 1024));
    }

    auto submitted = manager.submit_batch(requests);
    ASSERT_TRUE(submitted.has_value()) << submitted.error().message;
    ASSERT_TRUE(manager.wait_all(wait_timeout));

    auto completions = events.batch_completions();
    ASSERT_EQ(completions.size(), 1u);
    EXPECT_EQ(completions[0].total, 20u);
    EXPECT_EQ(completions[0].completed, 16u);
    EXPECT_EQ(completions[0].failed, 4u);
    EXPECT_EQ(events.batch_updates().size(), 20u);
    EXPECT_LE(transfer_->peak_open_sessions(), 4);

    for (const auto& id : submitted.value()) {
        EXPECT_EQ(events.completed_for(id).size(), 1u);
        auto percents = events.percents(id);
        EXPECT_TRUE(std::is_sorted(percents.begin(), percents.end()));
    }
}

TEST_F(ConcurrentUploadTest, ConcurrentSubmittersGetDistinctJobs) {
    constexpr int submitters = 8;
    constexpr int per_submitter = 5;
    auto manager = make_manager();

    std::vector<upload_request> requests;
    for (int i = 0; i < submitters * per_submitter; ++i) {
        requests.push_back(make_request("clip" + std::to_string(i) + ".mp4"));
    }

    std::mutex ids_mutex;
    std::vector<job_id> ids;
    std::latch start(submitters);
    std::vector<std::thread> threads;
    for (int t = 0; t < submitters; ++t) {
        threads.emplace_back([&, t]() {
            start.arrive_and_wait();
            for (int i = 0; i < per_submitter; ++i) {
                auto submitted = manager.submit(requests[t * per_submitter + i]);
                if (submitted) {
                    std::lock_guard lock(ids_mutex);
                    ids.push_back(submitted.value());
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(ids.size(), static_cast<std::size_t>(submitters * per_submitter));
    EXPECT_EQ(std::set<job_id>(ids.begin(), ids.end()).size(), ids.size());
    ASSERT_TRUE(manager.wait_all(wait_timeout));
    for (const auto& id : ids) {
        auto outcome = manager.outcome(id);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_TRUE(outcome->success);
    }
    EXPECT_EQ(sink_->records().size(), ids.size());
}

TEST_F(ConcurrentUploadTest, CancelRacesWithStatusQueries) {
    transfer_script script;
    script.chunk_size = 1024;
    script.chunk_delay = 1ms;
    transfer_ = std::make_shared<mock_transfer_client>(script);
    auto b = manager_builder();
    b.with_max_concurrent_uploads(3);
    auto manager = make_manager(b);

    std::vector<upload_request> requests;
    for (int i = 0; i < 10; ++i) {
        requests.push_back(make_request("clip" + std::to_string(i) + ".mp4",
                                        "Clip " + std::to_string(i), 256 * 1024));
    }
    auto submitted = manager.submit_batch(requests);
    ASSERT_TRUE(submitted.has_value());
    auto ids = submitted.value();

    std::atomic<bool> stop{false};
    std::thread poller([&]() {
        while (!stop) {
            for (const auto& id : ids) {
                auto info = manager.status(id);
                if (info) {
                    EXPECT_GE(info->last_progress.percent, 0);
                    EXPECT_LE(info->last_progress.percent, 100);
                }
            }
            (void)manager.active_jobs();
            (void)manager.batch_status();
        }
    });

    std::this_thread::sleep_for(20ms);
    for (std::size_t i = 0; i < ids.size(); i += 2) {
        manager.cancel(ids[i]);
    }
    manager.cancel_all();

    ASSERT_TRUE(manager.wait_all(wait_timeout));
    stop = true;
    poller.join();

    for (const auto& id : ids) {
        auto outcome = manager.outcome(id);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_TRUE(is_terminal(outcome->state));
        EXPECT_FALSE(manager.cancel(id));
    }
    EXPECT_EQ(transfer_->open_sessions(), 0);
    EXPECT_TRUE(manager.active_jobs().empty());
}

TEST_F(ConcurrentUploadTest, SubscribersAddedWhileRunning) {
    transfer_script script;
    script.chunk_size = 1024;
    script.chunk_delay = 1ms;
    transfer_ = std::make_shared<mock_transfer_client>(script);
    auto manager = make_manager();

    auto id = manager.submit(make_request("clip.mp4", "Holiday", 64 * 1024)).value();

    std::atomic<int> late_completions{0};
    for (int i = 0; i < 50; ++i) {
        manager.on_job_progress([](const job_id&, const progress_snapshot&) {});
    }
    manager.on_job_completed([&](const job_result&) { late_completions.fetch_add(1); });

    auto result = manager.wait_for(id, wait_timeout);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().success);
    EXPECT_EQ(late_completions.load(), 1);
}

TEST_F(ConcurrentUploadTest, ShutdownWithQueuedJobs) {
    transfer_script script;
    script.chunk_size = 1024;
    script.chunk_delay = 5ms;
    transfer_ = std::make_shared<mock_transfer_client>(script);
    auto b = manager_builder();
    b.with_max_concurrent_uploads(1);
    auto manager = make_manager(b);
    event_recorder events;
    events.attach(manager);

    std::vector<upload_request> requests;
    for (int i = 0; i < 5; ++i) {
        requests.push_back(make_request("clip" + std::to_string(i) + ".mp4",
                                        "Clip " + std::to_string(i), 1024 * 1024));
    }
    ASSERT_TRUE(manager.submit_batch(requests).has_value());
    std::this_thread::sleep_for(30ms);

    manager.shutdown();

    EXPECT_EQ(events.completed().size(), 5u);
    EXPECT_LE(transfer_->begin_calls(), 1);
    EXPECT_EQ(transfer_->open_sessions(), 0);
    EXPECT_EQ(manager.job_count(), 0u);
}

TEST_F(ConcurrentUploadTest, BatchEventsKeepCommitOrderWithSlowSubscriber) {
    transfer_script script;
    script.chunk_size = 1024;
    script.chunk_delay = 20ms;
    transfer_ = std::make_shared<mock_transfer_client>(script);
    auto manager = make_manager();

    struct batch_event {
        std::string kind;
        std::size_t settled;
    };
    std::mutex events_mutex;
    std::vector<batch_event> batch_events;

    // The first job to finish stalls in its completion subscriber while its
    // sibling finishes and commits the final counters.
    manager.on_job_completed([](const job_result& result) {
        if (result.title == "Short") {
            std::this_thread::sleep_for(400ms);
        }
    });
    manager.on_batch_progress([&](const batch_progress& progress) {
        std::lock_guard lock(events_mutex);
        batch_events.push_back({"progress", progress.settled()});
    });
    manager.on_batch_completed([&](const batch_progress& progress) {
        std::lock_guard lock(events_mutex);
        batch_events.push_back({"completed", progress.settled()});
    });

    auto submitted = manager.submit_batch({
        make_request("short.mp4", "Short", 1024),
        make_request("long.mp4", "Long", 8 * 1024),
    });
    ASSERT_TRUE(submitted.has_value()) << submitted.error().message;
    ASSERT_TRUE(manager.wait_all(wait_timeout));

    std::lock_guard lock(events_mutex);
    ASSERT_EQ(batch_events.size(), 3u);
    EXPECT_EQ(batch_events[0].kind, "progress");
    EXPECT_EQ(batch_events[0].settled, 1u);
    EXPECT_EQ(batch_events[1].kind, "progress");
    EXPECT_EQ(batch_events[1].settled, 2u);
    EXPECT_EQ(batch_events[2].kind, "completed");
    EXPECT_EQ(batch_events[2].settled, 2u);
}

TEST_F(ConcurrentUploadTest, BatchUpdatesAreNonDecreasingUnderLoad) {
    transfer_script script;
    script.chunk_size = 1024;
    transfer_ = std::make_shared<mock_transfer_client>(script);
    auto manager = make_manager();

    std::mutex events_mutex;
    std::vector<std::size_t> settled_sequence;
    bool completed_seen = false;
    bool update_after_completion = false;
    manager.on_batch_progress([&](const batch_progress& progress) {
        std::lock_guard lock(events_mutex);
        if (completed_seen) {
            update_after_completion = true;
        }
        settled_sequence.push_back(progress.settled());
    });
    manager.on_batch_completed([&](const batch_progress&) {
        std::lock_guard lock(events_mutex);
        completed_seen = true;
    });

    std::vector<upload_request> requests;
    for (int i = 0; i < 16; ++i) {
        requests.push_back(make_request("clip" + std::to_string(i) + ".mp4",
                                        "Clip " + std::to_string(i), 1024 * (1 + i % 4)));
    }
    ASSERT_TRUE(manager.submit_batch(requests).has_value());
    ASSERT_TRUE(manager.wait_all(wait_timeout));

    std::lock_guard lock(events_mutex);
    ASSERT_EQ(settled_sequence.size(), 16u);
    for (std::size_t i = 0; i < settled_sequence.size(); ++i) {
        EXPECT_EQ(settled_sequence[i], i + 1);
    }
    EXPECT_TRUE(completed_seen);
    EXPECT_FALSE(update_after_completion);
}

TEST_F(ConcurrentUploadTest, FinishedWorkersAreReclaimed) {
    constexpr int jobs = 30;
    auto manager = make_manager();

    std::vector<job_id> ids;
    for (int i = 0; i < jobs; ++i) {
        auto id = manager.submit(make_request("clip" + std::to_string(i) + ".mp4",
                                              "Clip " + std::to_string(i), 1024));
        ASSERT_TRUE(id.has_value());
        ASSERT_TRUE(manager.wait_for(id.value(), wait_timeout).has_value());
        ids.push_back(id.value());
    }

    // At most the most recent worker may still be exiting its thread
    EXPECT_LE(manager.worker_count(), 2u);

    auto deadline = std::chrono::steady_clock::now() + wait_timeout;
    while (manager.worker_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        manager.wait_all(wait_timeout);
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(manager.worker_count(), 0u);

    // Records outlive their workers
    EXPECT_EQ(manager.job_count(), static_cast<std::size_t>(jobs));
    auto first = manager.status(ids.front());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->state, job_state::completed);
    auto first_outcome = manager.outcome(ids.front());
    ASSERT_TRUE(first_outcome.has_value());
    EXPECT_TRUE(first_outcome->success);
    EXPECT_FALSE(manager.cancel(ids.front()));
}

}  // namespace media_upload::test
