/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef MEDIA_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define MEDIA_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <media_upload/auth/auth_session.h>
#include <media_upload/transfer/transfer_client.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace media_upload::benchmark {

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @param base_dir Base directory for temporary files (a fresh one when empty)
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a sparse file of the given size
     *
     * The content is never read by the in-memory transfer client, so only
     * the size matters.
     */
    auto create_sparse_file(const std::string& name, std::size_t size)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief credential_store holding one credential in memory
 */
class memory_credential_store : public credential_store {
public:
    explicit memory_credential_store(std::optional<credential> initial = std::nullopt);

    auto load() -> result<std::optional<credential>> override;
    auto save(const credential& cred) -> result<void> override;
    auto remove() -> result<void> override;

private:
    std::mutex mutex_;
    std::optional<credential> stored_;
};

/**
 * @brief token_refresher that always fails; benchmark tokens never expire
 */
class rejecting_token_refresher : public token_refresher {
public:
    auto refresh(const credential& current) -> result<credential> override;
};

/**
 * @brief Signed-in session with a token valid for a day
 */
auto make_signed_in_session() -> std::shared_ptr<auth_session>;

/**
 * @brief transfer_client acknowledging chunks without any I/O
 */
class in_memory_transfer_client : public transfer_client {
public:
    explicit in_memory_transfer_client(std::size_t chunk_size);

    auto begin(const upload_source& source,
               const upload_metadata& metadata,
               const std::string& access_token)
        -> result<std::unique_ptr<upload_session>> override;

private:
    std::size_t chunk_size_;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 256 * KB;
constexpr std::size_t max_chunk = 1 * MB;
}  // namespace sizes

}  // namespace media_upload::benchmark

#endif  // MEDIA_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
