/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "benchmark_helpers.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>

namespace media_upload::benchmark {

namespace {

std::atomic<uint64_t> directory_sequence{0};

class in_memory_session : public upload_session {
public:
    in_memory_session(uint64_t total, std::size_t chunk_size)
        : total_(total), chunk_size_(chunk_size) {}

    auto next_chunk() -> result<chunk_status> override {
        sent_ = std::min<uint64_t>(total_, sent_ + chunk_size_);
        chunk_status status{sent_, total_, std::nullopt};
        if (sent_ == total_) {
            status.remote_id = "bench_video";
        }
        return status;
    }

    auto abort() -> result<void> override { return {}; }

    auto bytes_sent() const -> uint64_t override { return sent_; }

private:
    uint64_t total_;
    std::size_t chunk_size_;
    uint64_t sent_ = 0;
};

}  // namespace

// ============================================================================
// temp_file_manager
// ============================================================================

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("media_upload_benchmarks_" + std::to_string(directory_sequence.fetch_add(1)));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_sparse_file(const std::string& name, std::size_t size)
    -> std::filesystem::path {
    auto path = base_dir_ / name;
    {
        std::ofstream file(path, std::ios::binary);
    }
    std::error_code ec;
    std::filesystem::resize_file(path, size, ec);
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// ============================================================================
// Session collaborators
// ============================================================================

memory_credential_store::memory_credential_store(std::optional<credential> initial)
    : stored_(std::move(initial)) {}

auto memory_credential_store::load() -> result<std::optional<credential>> {
    std::lock_guard lock(mutex_);
    return stored_;
}

auto memory_credential_store::save(const credential& cred) -> result<void> {
    std::lock_guard lock(mutex_);
    stored_ = cred;
    return {};
}

auto memory_credential_store::remove() -> result<void> {
    std::lock_guard lock(mutex_);
    stored_.reset();
    return {};
}

auto rejecting_token_refresher::refresh(const credential&) -> result<credential> {
    return unexpected{error{error_code::auth_refresh_failed, "refresh disabled in benchmarks"}};
}

auto make_signed_in_session() -> std::shared_ptr<auth_session> {
    credential cred;
    cred.access_token = "bench-access-token";
    cred.refresh_token = "bench-refresh-token";
    cred.expires_at = std::chrono::system_clock::now() + std::chrono::hours(24);

    return std::make_shared<auth_session>(
        std::make_shared<memory_credential_store>(std::move(cred)),
        std::make_shared<rejecting_token_refresher>());
}

// ============================================================================
// in_memory_transfer_client
// ============================================================================

in_memory_transfer_client::in_memory_transfer_client(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? sizes::default_chunk : chunk_size) {}

auto in_memory_transfer_client::begin(
    const upload_source& source,
    const upload_metadata&,
    const std::string&) -> result<std::unique_ptr<upload_session>> {
    return std::unique_ptr<upload_session>(
        std::make_unique<in_memory_session>(source.size, chunk_size_));
}

}  // namespace media_upload::benchmark
