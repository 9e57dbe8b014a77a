/**
 * @file upload_worker.cpp
 * @brief Implementation of upload_worker and upload_slots
 */

#include "media_upload/manager/upload_worker.h"

#include "media_upload/core/logging.h"
#include "media_upload/core/progress_tracker.h"
#include "media_upload/transfer/http_utils.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <optional>
#include <system_error>

namespace media_upload {

// ============================================================================
// upload_slots
// ============================================================================

auto upload_slots::acquire(const cancellation_token& token) -> bool {
    std::unique_lock lock(mutex_);
    while (limit_ != 0 && in_use_ >= limit_) {
        if (token.is_cancelled()) {
            return false;
        }
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (token.is_cancelled()) {
        return false;
    }
    ++in_use_;
    return true;
}

void upload_slots::release() {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

void upload_slots::notify_all() {
    cv_.notify_all();
}

auto upload_slots::in_use() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return in_use_;
}

// ============================================================================
// upload_worker::state
// ============================================================================

struct upload_worker::state {
    upload_job job;
    std::shared_ptr<auth_session> auth;
    std::shared_ptr<transfer_client> transfer;
    std::shared_ptr<upload_slots> slots;
    worker_options options;
    cancellation_token token;

    int last_percent = 0;
    bool holds_slot = false;

    mutable std::mutex done_mutex;
    std::condition_variable done_cv;
    bool done = false;
    bool reported = false;

    state(upload_job j,
          std::shared_ptr<auth_session> a,
          std::shared_ptr<transfer_client> t,
          std::shared_ptr<upload_slots> s,
          worker_options o)
        : job(std::move(j)),
          auth(std::move(a)),
          transfer(std::move(t)),
          slots(std::move(s)),
          options(std::move(o)) {}

    [[nodiscard]] auto make_log_context() const -> upload_log_context {
        upload_log_context ctx;
        ctx.job_id = job.id.str();
        ctx.filename = job.resource.filename().string();
        return ctx;
    }

    void emit(worker_listener& listener, job_state st, int percent, std::string message) {
        last_percent = std::max(last_percent, percent);

        progress_snapshot snapshot;
        snapshot.percent = last_percent;
        snapshot.state = st;
        snapshot.message = std::move(message);
        listener.on_worker_progress(job.id, snapshot);
    }

    void finish(worker_listener& listener, job_result result) {
        if (holds_slot && slots) {
            slots->release();
            holds_slot = false;
        }
        if (reported) {
            return;
        }
        reported = true;

        result.id = job.id;
        result.title = job.title;
        result.resource = job.resource;
        result.finished_at = std::chrono::system_clock::now();
        listener.on_worker_finished(result);
    }

    void fail(worker_listener& listener, const error& err) {
        auto ctx = make_log_context();
        ctx.state = to_string(job_state::failed);
        ctx.error_message = err.message;
        MU_LOG_ERROR_CTX(log_category::worker, "Upload failed", ctx);

        job_result result;
        result.state = job_state::failed;
        result.success = false;
        result.code = err.code;
        result.message = err.message;
        finish(listener, std::move(result));
    }

    void cancelled(worker_listener& listener, upload_session* session) {
        emit(listener, job_state::cancelled, last_percent, "Upload cancelled");

        if (session != nullptr) {
            auto aborted = session->abort();
            if (!aborted) {
                MU_LOG_WARN(log_category::worker,
                    "Could not discard upload session for " + job.id.str() + ": " +
                    aborted.error().message);
            }
        }

        auto ctx = make_log_context();
        ctx.state = to_string(job_state::cancelled);
        MU_LOG_INFO_CTX(log_category::worker, "Upload cancelled", ctx);

        job_result result;
        result.state = job_state::cancelled;
        result.success = false;
        result.code = error_code::upload_cancelled;
        result.message = "cancelled";
        finish(listener, std::move(result));
    }

    void run(worker_listener& listener);
};

void upload_worker::state::run(worker_listener& listener) {
    listener.on_worker_started(job.id);
    emit(listener, job_state::queued, 0, "Queued");

    if (slots) {
        if (!slots->acquire(token)) {
            cancelled(listener, nullptr);
            return;
        }
        holds_slot = true;
    }
    if (token.is_cancelled()) {
        cancelled(listener, nullptr);
        return;
    }

    // Authenticate
    emit(listener, job_state::authenticating, 5, "Authenticating...");

    std::optional<credential> cred;
    if (auth && auth->is_valid()) {
        cred = auth->get_credential();
    }
    if (!cred || cred->access_token.empty()) {
        fail(listener, error(error_code::auth_required, "authentication required"));
        return;
    }
    if (token.is_cancelled()) {
        cancelled(listener, nullptr);
        return;
    }

    // Open the resumable session
    emit(listener, job_state::uploading, 10, "Starting upload...");

    std::error_code ec;
    upload_source source;
    source.path = job.resource;
    source.size = std::filesystem::file_size(job.resource, ec);
    if (ec) {
        fail(listener, error(error_code::file_read_error,
            "cannot read " + job.resource.string() + ": " + ec.message()));
        return;
    }
    source.mime_type = http_utils::detect_video_content_type(job.resource);

    upload_metadata metadata;
    metadata.title = job.title;
    metadata.description = job.description;
    metadata.visibility = options.visibility;
    metadata.category_id = options.category_id;
    metadata.publish_at = job.schedule;

    if (!transfer) {
        fail(listener, error(error_code::internal_error, "no transfer client configured"));
        return;
    }

    auto session_result = transfer->begin(source, metadata, cred->access_token);
    if (!session_result) {
        fail(listener, session_result.error());
        return;
    }
    auto session = std::move(session_result.value());

    auto ctx = make_log_context();
    ctx.file_size = source.size;
    MU_LOG_INFO_CTX(log_category::worker, "Upload started", ctx);

    // Chunk loop
    progress_tracker tracker(source.size, options.progress_interval, last_percent);
    auto started_at = std::chrono::steady_clock::now();
    std::optional<std::string> video_id;

    while (!video_id) {
        auto chunk = session->next_chunk();
        if (!chunk) {
            fail(listener, chunk.error());
            return;
        }

        if (auto snapshot = tracker.update(chunk.value().bytes_sent)) {
            last_percent = std::max(last_percent, snapshot->percent);
            snapshot->percent = last_percent;
            listener.on_worker_progress(job.id, *snapshot);
        }

        if (chunk.value().is_complete()) {
            video_id = chunk.value().remote_id;
            break;
        }
        if (token.is_cancelled()) {
            cancelled(listener, session.get());
            return;
        }
    }

    if (holds_slot && slots) {
        slots->release();
        holds_slot = false;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    auto done_ctx = make_log_context();
    done_ctx.file_size = source.size;
    done_ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
    done_ctx.rate_mbps = tracker.compute_rate(source.size, std::chrono::steady_clock::now()).speed_mbps;
    MU_LOG_INFO_CTX(log_category::worker, "Transfer finished", done_ctx);

    // Remote post-processing checkpoints
    emit(listener, job_state::processing, 95, "Processing video...");
    if (options.processing_delay.count() > 0) {
        std::this_thread::sleep_for(options.processing_delay);
    }

    emit(listener, job_state::finalizing, 98, "Finalizing upload...");
    if (options.finalizing_delay.count() > 0) {
        std::this_thread::sleep_for(options.finalizing_delay);
    }

    emit(listener, job_state::completed, 100, "Upload completed");

    job_result result;
    result.state = job_state::completed;
    result.success = true;
    result.video_id = video_id;
    result.video_url = make_video_url(*video_id);
    result.message = "Upload completed";
    finish(listener, std::move(result));
}

// ============================================================================
// upload_worker
// ============================================================================

upload_worker::upload_worker(upload_job job,
                             std::shared_ptr<auth_session> auth,
                             std::shared_ptr<transfer_client> transfer,
                             std::shared_ptr<upload_slots> slots,
                             worker_options options)
    : state_(std::make_shared<state>(std::move(job), std::move(auth),
                                     std::move(transfer), std::move(slots),
                                     std::move(options))) {}

upload_worker::~upload_worker() {
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void upload_worker::start(std::shared_ptr<worker_listener> listener) {
    thread_ = std::thread([st = state_, listener = std::move(listener)]() {
        execute(st, listener);
    });
}

void upload_worker::execute(const std::shared_ptr<state>& st,
                            const std::shared_ptr<worker_listener>& listener) {
    try {
        st->run(*listener);
    } catch (const std::exception& e) {
        MU_LOG_ERROR(log_category::worker,
            "Worker for " + st->job.id.str() + " raised: " + e.what());
        st->fail(*listener, error(error_code::internal_error, e.what()));
    }

    {
        std::lock_guard lock(st->done_mutex);
        st->done = true;
    }
    st->done_cv.notify_all();
}

void upload_worker::cancel() noexcept {
    state_->token.cancel();
    if (state_->slots) {
        state_->slots->notify_all();
    }
}

auto upload_worker::is_cancelled() const noexcept -> bool {
    return state_->token.is_cancelled();
}

auto upload_worker::is_finished() const -> bool {
    std::lock_guard lock(state_->done_mutex);
    return state_->done;
}

auto upload_worker::join_for(std::chrono::milliseconds timeout) -> bool {
    if (!thread_.joinable()) {
        return true;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return false;
    }

    bool finished = false;
    {
        std::unique_lock lock(state_->done_mutex);
        finished = state_->done_cv.wait_for(lock, timeout, [this] { return state_->done; });
    }

    if (finished) {
        thread_.join();
        return true;
    }

    MU_LOG_WARN(log_category::worker,
        "Worker for " + state_->job.id.str() + " did not stop within " +
        std::to_string(timeout.count()) + "ms; detaching");
    thread_.detach();
    return false;
}

auto upload_worker::id() const -> const job_id& {
    return state_->job.id;
}

}  // namespace media_upload
