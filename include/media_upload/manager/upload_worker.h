/**
 * @file upload_worker.h
 * @brief Runs one upload job on its own thread
 */

#ifndef MEDIA_UPLOAD_MANAGER_UPLOAD_WORKER_H
#define MEDIA_UPLOAD_MANAGER_UPLOAD_WORKER_H

#include "media_upload/auth/auth_session.h"
#include "media_upload/core/job_types.h"
#include "media_upload/core/upload_config.h"
#include "media_upload/transfer/transfer_client.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace media_upload {

/**
 * @brief Cooperative cancellation flag shared by a worker and its owner
 */
class cancellation_token {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Counting gate bounding how many workers transfer at once
 *
 * A limit of 0 admits everyone.
 */
class upload_slots {
public:
    explicit upload_slots(std::size_t limit) : limit_(limit) {}

    /**
     * @brief Block until a slot is free or the token is cancelled
     * @return true when a slot was taken
     */
    [[nodiscard]] auto acquire(const cancellation_token& token) -> bool;

    void release();

    /**
     * @brief Wake waiters so they re-check their tokens
     */
    void notify_all();

    [[nodiscard]] auto in_use() const -> std::size_t;

private:
    std::size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_use_ = 0;
};

/**
 * @brief Receiver of worker events, implemented by the manager
 *
 * Called on the worker thread with no manager lock held.
 */
class worker_listener {
public:
    virtual ~worker_listener() = default;

    virtual void on_worker_started(const job_id& id) = 0;
    virtual void on_worker_progress(const job_id& id, const progress_snapshot& snapshot) = 0;
    virtual void on_worker_finished(const job_result& result) = 0;
};

/**
 * @brief Per-worker tunables taken from manager_config
 */
struct worker_options {
    std::chrono::milliseconds progress_interval{2000};
    std::chrono::milliseconds processing_delay{1000};
    std::chrono::milliseconds finalizing_delay{500};
    std::string visibility = "private";
    std::string category_id = "22";
};

/**
 * @brief Executes one upload_job
 *
 * Lifecycle: queued -> authenticating -> uploading -> processing ->
 * finalizing -> completed, or failed / cancelled from any earlier step.
 * Progress checkpoints are 0, 5, 10, 10..90 while bytes move, 95, 98 and
 * 100. Exactly one on_worker_finished() is delivered per job.
 *
 * Everything the thread touches is shared-owned, so a worker that is
 * detached after a missed join keeps running safely.
 */
class upload_worker {
public:
    upload_worker(upload_job job,
                  std::shared_ptr<auth_session> auth,
                  std::shared_ptr<transfer_client> transfer,
                  std::shared_ptr<upload_slots> slots,
                  worker_options options);

    upload_worker(const upload_worker&) = delete;
    auto operator=(const upload_worker&) -> upload_worker& = delete;

    /**
     * @brief Joins a finished thread; a still-running one must be handled by join_for()
     */
    ~upload_worker();

    /**
     * @brief Launch the worker thread
     * @param listener Event receiver kept alive for the thread's lifetime
     */
    void start(std::shared_ptr<worker_listener> listener);

    /**
     * @brief Request cooperative cancellation
     */
    void cancel() noexcept;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    [[nodiscard]] auto is_finished() const -> bool;

    /**
     * @brief Wait for the thread to exit, detaching it after the timeout
     * @return true when the thread was joined
     */
    auto join_for(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto id() const -> const job_id&;

private:
    struct state;

    static void execute(const std::shared_ptr<state>& st,
                        const std::shared_ptr<worker_listener>& listener);

    std::shared_ptr<state> state_;
    std::thread thread_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_MANAGER_UPLOAD_WORKER_H
