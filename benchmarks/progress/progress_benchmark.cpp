/**
 * @file progress_benchmark.cpp
 * @brief Benchmarks for progress tracking and message formatting
 */

#include <benchmark/benchmark.h>

#include <media_upload/core/progress_tracker.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <chrono>

namespace media_upload::benchmark {

/**
 * @brief Feed a whole transfer through progress_tracker::update
 *
 * Time advances 10 ms per chunk so throttling is exercised the way a real
 * upload would see it.
 */
static void BM_ProgressTracker_Update(::benchmark::State& state) {
    const auto file_size = static_cast<uint64_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));
    const auto chunks = (file_size + chunk_size - 1) / chunk_size;

    int64_t emitted = 0;
    for (auto _ : state) {
        auto start = progress_tracker::clock::now();
        progress_tracker tracker(file_size, std::chrono::milliseconds(2000), 10, start);

        auto now = start;
        for (uint64_t sent = chunk_size; ; sent += chunk_size) {
            now += std::chrono::milliseconds(10);
            auto snapshot = tracker.update(std::min(sent, file_size), now);
            if (snapshot) {
                ++emitted;
                ::benchmark::DoNotOptimize(snapshot->message);
            }
            if (sent >= file_size) {
                break;
            }
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(chunks) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["emitted_per_upload"] = ::benchmark::Counter(
        static_cast<double>(emitted) / static_cast<double>(state.iterations()));
}

static void BM_TransferPercent(::benchmark::State& state) {
    const uint64_t total = sizes::large_file;
    uint64_t sent = 0;

    for (auto _ : state) {
        sent = (sent + sizes::default_chunk) % total;
        ::benchmark::DoNotOptimize(progress_tracker::transfer_percent(sent, total));
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_FormatProgressMessage(::benchmark::State& state) {
    transfer_rate rate;
    rate.uploaded_mb = 12.0;
    rate.total_mb = 50.0;
    rate.speed_mbps = static_cast<double>(state.range(0)) / 10.0;
    rate.eta_seconds = (rate.total_mb - rate.uploaded_mb) / rate.speed_mbps;

    for (auto _ : state) {
        auto message = format_progress_message(rate);
        ::benchmark::DoNotOptimize(message);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

// KB/s and MB/s branches, short and hour-long ETAs
BENCHMARK(BM_FormatProgressMessage)->Arg(5)->Arg(34)->Arg(1000);

BENCHMARK(BM_TransferPercent);

BENCHMARK(BM_ProgressTracker_Update)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMicrosecond);

}  // namespace media_upload::benchmark
