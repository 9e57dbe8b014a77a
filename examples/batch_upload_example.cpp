/**
 * @file batch_upload_example.cpp
 * @brief Batch video upload with a concurrency cap
 *
 * This example demonstrates:
 * - Submitting several videos as one batch
 * - Tracking batch progress across all jobs
 * - Handling individual failures within a batch
 * - Cancelling the remaining jobs after a deadline
 */

#include <media_upload/media_upload.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace media_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_usage(const char* program) {
    std::cout << "Batch Upload Example - Media Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <video>..." << std::endl;
    std::cout << std::endl;
    std::cout << "Every video is titled after its file name." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --description <text>  Description of every video (default: \"Uploaded in batch\")" << std::endl;
    std::cout << "  -c, --max-concurrent <n>  Upload at most n videos at once (default: 2, 0 = unlimited)" << std::endl;
    std::cout << "  -v, --visibility <value>  private, unlisted or public (default: private)" << std::endl;
    std::cout << "  -s, --schedule <time>     Publish time of every video, RFC3339 UTC" << std::endl;
    std::cout << "  --deadline <seconds>      Cancel unfinished uploads after this long (default: 7200)" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " day1.mp4 day2.mp4 day3.mp4" << std::endl;
    std::cout << "  " << program << " -c 4 -v unlisted clips/*.mp4" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::filesystem::path> videos;
    std::string description = "Uploaded in batch";
    std::size_t max_concurrent = 2;
    std::string visibility = "private";
    std::optional<std::string> schedule;
    std::chrono::seconds deadline{7200};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-d" || arg == "--description") && has_value) {
            description = argv[++i];
        } else if ((arg == "-c" || arg == "--max-concurrent") && has_value) {
            max_concurrent = static_cast<std::size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if ((arg == "-v" || arg == "--visibility") && has_value) {
            visibility = argv[++i];
        } else if ((arg == "-s" || arg == "--schedule") && has_value) {
            schedule = argv[++i];
        } else if (arg == "--deadline" && has_value) {
            deadline = std::chrono::seconds(std::strtoll(argv[++i], nullptr, 10));
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown or incomplete option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            videos.emplace_back(arg);
        }
    }

    if (videos.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "       Batch Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    // Services
    std::cout << "[1/4] Preparing services..." << std::endl;
    auto http = make_network_http_client();
    if (!http->is_available()) {
        std::cerr << "This build has no HTTP transport (network_system not found)." << std::endl;
        return 1;
    }

    auto auth = std::make_shared<auth_session>(
        std::make_shared<file_credential_store>(default_credentials_directory()),
        std::make_shared<oauth_token_refresher>(http));
    if (!auth->is_authenticated()) {
        std::cerr << "Not signed in. Run upload_example with --access-token first." << std::endl;
        return 1;
    }

    auto history = std::make_shared<upload_history>(default_history_file());

    auto manager_result = upload_manager::builder()
        .with_auth_session(auth)
        .with_transfer_client(std::make_shared<resumable_upload_client>(http))
        .with_result_sink(history)
        .with_max_concurrent_uploads(max_concurrent)
        .with_visibility(visibility)
        .build();
    if (!manager_result) {
        std::cerr << "Failed to create upload manager: " << manager_result.error().message << std::endl;
        return 1;
    }
    auto& manager = manager_result.value();

    // Build the batch
    std::cout << "[2/4] Building batch..." << std::endl;
    std::vector<upload_request> requests;
    uint64_t total_size = 0;
    for (const auto& video : videos) {
        std::error_code ec;
        auto size = std::filesystem::file_size(video, ec);
        if (!ec) {
            total_size += size;
        }
        requests.push_back({video, video.stem().string(), description, schedule});
        std::cout << "  " << video.filename().string() << " (" << (ec ? std::string("?") : format_bytes(size)) << ")" << std::endl;
    }
    std::cout << "  Total: " << requests.size() << " videos, " << format_bytes(total_size) << std::endl;
    std::cout << "  Max concurrent: " << (max_concurrent == 0 ? std::string("unlimited") : std::to_string(max_concurrent)) << std::endl;
    std::cout << std::endl;

    std::mutex output_mutex;
    manager.on_job_completed([&output_mutex](const job_result& result) {
        std::lock_guard lock(output_mutex);
        if (result.success) {
            std::cout << "  [OK] " << result.title << " -> " << result.video_url << std::endl;
        } else {
            std::cout << "  [" << to_string(result.state) << "] " << result.title
                      << ": " << result.message << std::endl;
        }
    });
    manager.on_batch_progress([&output_mutex](const batch_progress& progress) {
        std::lock_guard lock(output_mutex);
        std::cout << "  Batch: " << progress.settled() << "/" << progress.total
                  << " settled (" << progress.completed << " completed, "
                  << progress.failed << " failed)" << std::endl;
    });

    // A bad entry rejects the whole batch before anything is uploaded
    std::cout << "[3/4] Uploading..." << std::endl;
    auto start_time = std::chrono::steady_clock::now();
    auto submitted = manager.submit_batch(requests);
    if (!submitted) {
        std::cerr << "Batch rejected: " << submitted.error().message << std::endl;
        return 1;
    }
    const auto& ids = submitted.value();

    if (!manager.wait_all(deadline)) {
        auto cancelled = manager.cancel_all();
        std::cout << "  Deadline reached, cancelled " << cancelled << " uploads" << std::endl;
        if (!manager.wait_all(manager.config().shutdown_timeout)) {
            std::cout << "  Some uploads did not stop in time" << std::endl;
        }
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    // Summary
    std::cout << std::endl;
    std::cout << "[4/4] Summary" << std::endl;
    std::size_t succeeded = 0;
    for (const auto& id : ids) {
        auto outcome = manager.outcome(id);
        if (outcome && outcome->success) {
            ++succeeded;
        }
    }

    std::cout << "========================================" << std::endl;
    std::cout << "  Total videos: " << ids.size() << std::endl;
    std::cout << "  Succeeded:    " << succeeded << std::endl;
    std::cout << "  Failed:       " << ids.size() - succeeded << std::endl;
    std::cout << "  Elapsed:      " << std::fixed << std::setprecision(1)
              << static_cast<double>(elapsed.count()) / 1000.0 << " s" << std::endl;
    std::cout << "========================================" << std::endl;

    return succeeded == ids.size() ? 0 : 1;
}
