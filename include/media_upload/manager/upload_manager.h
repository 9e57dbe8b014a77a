/**
 * @file upload_manager.h
 * @brief Orchestrator of concurrent upload jobs and batches
 */

#ifndef MEDIA_UPLOAD_MANAGER_UPLOAD_MANAGER_H
#define MEDIA_UPLOAD_MANAGER_UPLOAD_MANAGER_H

#include "file_organizer.h"
#include "result_sink.h"
#include "media_upload/auth/auth_session.h"
#include "media_upload/core/job_types.h"
#include "media_upload/core/types.h"
#include "media_upload/core/upload_config.h"
#include "media_upload/transfer/transfer_client.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace media_upload {

using job_started_callback = std::function<void(const job_id&)>;
using job_progress_callback = std::function<void(const job_id&, const progress_snapshot&)>;
using job_completed_callback = std::function<void(const job_result&)>;
using batch_progress_callback = std::function<void(const batch_progress&)>;
using batch_completed_callback = std::function<void(const batch_progress&)>;

/**
 * @brief Validates upload requests, runs one worker per job and tracks batches
 *
 * Every accepted job gets its own worker thread. The job registry and the
 * batch counters are guarded by a single mutex; subscriber callbacks run
 * on worker threads without that mutex held, so they may call back into
 * the manager.
 *
 * Terminal jobs stay in the registry until shutdown so status() keeps
 * answering for them.
 *
 * @code
 * auto manager = upload_manager::builder()
 *     .with_auth_session(session)
 *     .with_transfer_client(client)
 *     .with_result_sink(std::make_shared<upload_history>(default_history_file()))
 *     .build();
 *
 * manager.value().on_job_progress([](const job_id& id, const progress_snapshot& p) {
 *     std::cout << id.str() << " " << p.percent << "% " << p.message << "\n";
 * });
 * auto id = manager.value().submit({"holiday.mp4", "Holiday", "Summer trip"});
 * @endcode
 */
class upload_manager {
public:
    /**
     * @brief Builder for upload_manager
     */
    class builder {
    public:
        builder();

        /**
         * @brief Session that supplies bearer tokens (required)
         */
        auto with_auth_session(std::shared_ptr<auth_session> session) -> builder&;

        /**
         * @brief Client that performs the chunked transfer (required)
         */
        auto with_transfer_client(std::shared_ptr<transfer_client> client) -> builder&;

        /**
         * @brief Receiver of one record per terminal job
         */
        auto with_result_sink(std::shared_ptr<result_sink> sink) -> builder&;

        /**
         * @brief Move each successfully uploaded file into a dated folder
         *
         * Runs before the result sink and the completed event. A failed
         * move is logged; the job still counts as completed.
         */
        auto with_file_organizer(std::shared_ptr<file_organizer> organizer) -> builder&;

        /**
         * @brief Bound concurrently transferring jobs
         * @param limit Maximum active transfers (0 = unlimited)
         */
        auto with_max_concurrent_uploads(std::size_t limit) -> builder&;

        /**
         * @brief Bounded wait per worker during shutdown
         */
        auto with_shutdown_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Pauses after the processing and finalizing checkpoints
         */
        auto with_checkpoint_delays(std::chrono::milliseconds processing,
                                    std::chrono::milliseconds finalizing) -> builder&;

        /**
         * @brief Maximum silence between progress events of a transferring job
         */
        auto with_progress_interval(std::chrono::milliseconds interval) -> builder&;

        auto with_validation_config(validation_config config) -> builder&;

        /**
         * @brief Visibility of uploaded videos: private, unlisted or public
         */
        auto with_visibility(std::string visibility) -> builder&;

        /**
         * @brief Build the manager
         * @return Manager, or invalid_configuration when a collaborator is missing
         */
        [[nodiscard]] auto build() -> result<upload_manager>;

    private:
        manager_config config_;
        std::shared_ptr<auth_session> auth_;
        std::shared_ptr<transfer_client> transfer_;
        std::shared_ptr<result_sink> sink_;
        std::shared_ptr<file_organizer> organizer_;
    };

    upload_manager(const upload_manager&) = delete;
    auto operator=(const upload_manager&) -> upload_manager& = delete;
    upload_manager(upload_manager&&) noexcept;
    auto operator=(upload_manager&&) noexcept -> upload_manager&;

    /**
     * @brief Runs shutdown()
     */
    ~upload_manager();

    // ========================================================================
    // Submission
    // ========================================================================

    /**
     * @brief Check a request without side effects
     *
     * Fails when not authenticated, when the file is missing, not a regular
     * file, of an unsupported format or too large, or when the trimmed title
     * or description is empty or too long.
     */
    [[nodiscard]] auto validate_request(const std::filesystem::path& resource,
                                        const std::string& title,
                                        const std::string& description) const
        -> result<void>;

    /**
     * @brief validate_request() plus the schedule time check
     */
    [[nodiscard]] auto validate_request(const upload_request& request) const -> result<void>;

    /**
     * @brief Validate, register and start one job
     * @return Id of the queued job
     */
    [[nodiscard]] auto submit(const upload_request& request) -> result<job_id>;

    /**
     * @brief Validate every request, then start them all as a new batch
     *
     * Nothing is registered when any request is invalid. The previous batch
     * context, if any, is replaced.
     */
    [[nodiscard]] auto submit_batch(const std::vector<upload_request>& requests)
        -> result<std::vector<job_id>>;

    // ========================================================================
    // Control
    // ========================================================================

    /**
     * @brief Request cooperative cancellation of a job
     * @return false when the job is unknown or already terminal
     */
    auto cancel(const job_id& id) -> bool;

    /**
     * @brief Request cancellation of every non-terminal job
     * @return Number of jobs signalled
     */
    auto cancel_all() -> std::size_t;

    /**
     * @brief Cancel every worker, wait for each with the shutdown timeout and
     *        discard the registry
     *
     * Safe to call more than once. Submissions fail with manager_shut_down
     * afterwards.
     */
    void shutdown();

    [[nodiscard]] auto is_shut_down() const -> bool;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto status(const job_id& id) const -> std::optional<job_info>;

    /**
     * @brief Terminal record of a job that has settled
     */
    [[nodiscard]] auto outcome(const job_id& id) const -> std::optional<job_result>;

    /**
     * @brief Ids of jobs that have not reached a terminal state
     */
    [[nodiscard]] auto active_jobs() const -> std::vector<job_id>;

    [[nodiscard]] auto job_count() const -> std::size_t;

    /**
     * @brief Workers whose threads have not been reclaimed yet
     *
     * Finished workers are joined and released on the next submit,
     * submit_batch, wait_for or wait_all. Their job records remain.
     */
    [[nodiscard]] auto worker_count() const -> std::size_t;

    /**
     * @brief Counters of the running batch, if one is active
     */
    /**
     * @brief Totals of the organized folder tree, if an organizer is set
     */
    [[nodiscard]] auto organization_stats() const -> std::optional<media_upload::organization_stats>;

    [[nodiscard]] auto batch_status() const -> std::optional<batch_progress>;

    /**
     * @brief Block until a job has settled and its events were delivered
     */
    [[nodiscard]] auto wait_for(const job_id& id, std::chrono::milliseconds timeout)
        -> result<job_result>;

    /**
     * @brief Block until every registered job has settled
     * @return false on timeout
     */
    auto wait_all(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto config() const -> const manager_config&;

    // ========================================================================
    // Events
    // ========================================================================

    void on_job_started(job_started_callback callback);
    void on_job_progress(job_progress_callback callback);
    void on_job_completed(job_completed_callback callback);

    /**
     * @brief Batch events arrive in the order the counters changed
     *
     * batch_completed is always the last batch event of its batch. A batch
     * callback must not block on another job of the same batch.
     */
    void on_batch_progress(batch_progress_callback callback);
    void on_batch_completed(batch_completed_callback callback);

private:
    struct impl;

    explicit upload_manager(std::shared_ptr<impl> state);

    std::shared_ptr<impl> impl_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_MANAGER_UPLOAD_MANAGER_H
