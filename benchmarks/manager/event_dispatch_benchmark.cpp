/**
 * @file event_dispatch_benchmark.cpp
 * @brief End-to-end job overhead of the upload manager without network I/O
 */

#include <benchmark/benchmark.h>

#include <media_upload/manager/upload_manager.h>

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace media_upload::benchmark {

namespace {

constexpr std::chrono::seconds wait_timeout{60};

auto make_manager(std::size_t chunk_size, std::size_t max_concurrent)
    -> result<upload_manager> {
    return upload_manager::builder()
        .with_auth_session(make_signed_in_session())
        .with_transfer_client(std::make_shared<in_memory_transfer_client>(chunk_size))
        .with_checkpoint_delays(std::chrono::milliseconds(0), std::chrono::milliseconds(0))
        .with_progress_interval(std::chrono::milliseconds(0))
        .with_max_concurrent_uploads(max_concurrent)
        .build();
}

}  // namespace

/**
 * @brief One job through a manager with N progress subscribers
 */
static void BM_UploadManager_SingleJob(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    const auto subscribers = static_cast<int>(state.range(1));

    temp_file_manager temp_files;
    auto video = temp_files.create_sparse_file("single.mp4", sizes::medium_file);

    auto built = make_manager(chunk_size, 0);
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    auto& manager = built.value();

    std::atomic<int64_t> events{0};
    for (int i = 0; i < subscribers; ++i) {
        manager.on_job_progress([&events](const job_id&, const progress_snapshot&) {
            events.fetch_add(1, std::memory_order_relaxed);
        });
    }

    for (auto _ : state) {
        auto id = manager.submit({video, "Benchmark", "Event dispatch", std::nullopt});
        if (!id) {
            state.SkipWithError(id.error().message.c_str());
            return;
        }
        auto outcome = manager.wait_for(id.value(), wait_timeout);
        if (!outcome || !outcome.value().success) {
            state.SkipWithError("job did not complete");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["events"] = ::benchmark::Counter(
        static_cast<double>(events.load()), ::benchmark::Counter::kIsRate);
}

/**
 * @brief A batch of jobs under a concurrency cap
 */
static void BM_UploadManager_Batch(::benchmark::State& state) {
    const auto jobs = static_cast<std::size_t>(state.range(0));
    const auto max_concurrent = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    std::vector<upload_request> requests;
    for (std::size_t i = 0; i < jobs; ++i) {
        auto name = "batch_" + std::to_string(i) + ".mp4";
        requests.push_back({temp_files.create_sparse_file(name, sizes::small_file),
                            "Batch " + std::to_string(i), "Event dispatch", std::nullopt});
    }

    auto built = make_manager(sizes::min_chunk, max_concurrent);
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    auto& manager = built.value();

    for (auto _ : state) {
        auto ids = manager.submit_batch(requests);
        if (!ids) {
            state.SkipWithError(ids.error().message.c_str());
            return;
        }
        if (!manager.wait_all(wait_timeout)) {
            state.SkipWithError("batch did not settle");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(jobs) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_UploadManager_SingleJob)
    ->Args({static_cast<int64_t>(sizes::min_chunk), 1})
    ->Args({static_cast<int64_t>(sizes::min_chunk), 8})
    ->Args({static_cast<int64_t>(sizes::max_chunk), 1})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_UploadManager_Batch)
    ->Args({8, 0})
    ->Args({8, 2})
    ->Args({32, 4})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace media_upload::benchmark
