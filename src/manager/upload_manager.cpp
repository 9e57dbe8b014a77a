/**
 * @file upload_manager.cpp
 * @brief Implementation of upload_manager
 */

#include "media_upload/manager/upload_manager.h"

#include "media_upload/core/logging.h"
#include "media_upload/core/validation.h"
#include "media_upload/manager/file_organizer.h"
#include "media_upload/manager/upload_worker.h"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>

namespace media_upload {

namespace {

/**
 * @brief Registry entry of one job
 */
struct job_entry {
    upload_job job;
    job_state state = job_state::queued;
    progress_snapshot last_progress;
    std::optional<job_result> outcome;
    bool settled = false;  ///< Terminal and all events delivered
    std::unique_ptr<upload_worker> worker;

    [[nodiscard]] auto to_info() const -> job_info {
        job_info info;
        info.job = job;
        info.state = state;
        info.last_progress = last_progress;
        if (outcome) {
            info.video_id = outcome->video_id;
            if (!outcome->success) {
                info.error_message = outcome->message;
            }
        }
        return info;
    }
};

/**
 * @brief Counters and membership of the running batch
 */
struct batch_context {
    std::set<job_id> members;
    batch_progress counters;
};

template <typename Callback>
struct subscriber_list {
    std::vector<Callback> callbacks;

    template <typename... Args>
    void dispatch(std::mutex& mutex, Args&&... args) const {
        std::vector<Callback> snapshot;
        {
            std::lock_guard lock(mutex);
            snapshot = callbacks;
        }
        for (const auto& callback : snapshot) {
            if (callback) {
                callback(args...);
            }
        }
    }
};

}  // namespace

// ============================================================================
// upload_manager::impl
// ============================================================================

struct upload_manager::impl : worker_listener {
    manager_config config;
    std::shared_ptr<auth_session> auth;
    std::shared_ptr<transfer_client> transfer;
    std::shared_ptr<result_sink> sink;
    std::shared_ptr<file_organizer> organizer;
    std::shared_ptr<upload_slots> slots;

    // Registry and batch context
    mutable std::mutex mutex;
    std::condition_variable settled_cv;
    std::map<job_id, job_entry> jobs;
    std::optional<batch_context> batch;
    bool shut_down = false;
    uint64_t batch_tickets_issued = 0;

    // Batch events leave in the order their counters were committed
    std::mutex batch_dispatch_mutex;
    std::condition_variable batch_dispatch_cv;
    uint64_t batch_tickets_served = 0;

    // Subscribers
    mutable std::mutex callbacks_mutex;
    subscriber_list<job_started_callback> started_subscribers;
    subscriber_list<job_progress_callback> progress_subscribers;
    subscriber_list<job_completed_callback> completed_subscribers;
    subscriber_list<batch_progress_callback> batch_progress_subscribers;
    subscriber_list<batch_completed_callback> batch_completed_subscribers;

    impl(manager_config cfg,
         std::shared_ptr<auth_session> a,
         std::shared_ptr<transfer_client> t,
         std::shared_ptr<result_sink> s,
         std::shared_ptr<file_organizer> o)
        : config(std::move(cfg)),
          auth(std::move(a)),
          transfer(std::move(t)),
          sink(std::move(s)),
          organizer(std::move(o)),
          slots(std::make_shared<upload_slots>(config.max_concurrent_uploads)) {}

    [[nodiscard]] auto make_worker_options() const -> worker_options {
        worker_options options;
        options.progress_interval = config.progress_interval;
        options.processing_delay = config.processing_delay;
        options.finalizing_delay = config.finalizing_delay;
        options.visibility = config.visibility;
        options.category_id = config.category_id;
        return options;
    }

    [[nodiscard]] auto validate(const std::filesystem::path& resource,
                                const std::string& title,
                                const std::string& description) const -> result<void> {
        bool authenticated = auth && auth->is_authenticated();
        return media_upload::validate_request(resource, title, description,
                                              authenticated, config.validation);
    }

    [[nodiscard]] auto validate(const upload_request& request) const -> result<void> {
        auto checked = validate(request.resource, request.title, request.description);
        if (!checked) {
            return checked;
        }
        if (request.schedule) {
            return validate_schedule_time(*request.schedule, std::chrono::system_clock::now());
        }
        return {};
    }

    [[nodiscard]] auto make_job(const upload_request& request) const -> upload_job {
        upload_job job;
        job.id = job_id::generate();
        job.resource = request.resource;
        job.title = trim(request.title);
        job.description = trim(request.description);
        job.schedule = request.schedule;
        job.created_at = std::chrono::system_clock::now();
        return job;
    }

    /**
     * @brief Add a job to the registry and create its worker; caller holds mutex
     */
    auto register_locked(upload_job job) -> upload_worker& {
        auto id = job.id;

        job_entry entry;
        entry.job = job;
        entry.last_progress.message = "Queued";
        entry.worker = std::make_unique<upload_worker>(
            std::move(job), auth, transfer, slots, make_worker_options());

        auto it = jobs.emplace(id, std::move(entry)).first;
        return *it->second.worker;
    }

    /**
     * @brief Take the workers whose threads have exited; caller holds mutex
     *
     * The job entry stays for status() and outcome().
     */
    auto take_finished_workers_locked() -> std::vector<std::unique_ptr<upload_worker>> {
        std::vector<std::unique_ptr<upload_worker>> finished;
        for (auto& [id, entry] : jobs) {
            if (entry.settled && entry.worker && entry.worker->is_finished()) {
                finished.push_back(std::move(entry.worker));
            }
        }
        return finished;
    }

    /**
     * @brief Join and release finished workers; must not hold mutex
     */
    void reap_finished_workers() {
        std::vector<std::unique_ptr<upload_worker>> finished;
        {
            std::lock_guard lock(mutex);
            finished = take_finished_workers_locked();
        }
        if (!finished.empty()) {
            MU_LOG_TRACE(log_category::manager,
                "Reclaimed " + std::to_string(finished.size()) + " finished workers");
        }
    }

    void dispatch_batch_events(uint64_t ticket, const batch_progress& update, bool done) {
        {
            std::unique_lock turn(batch_dispatch_mutex);
            batch_dispatch_cv.wait(turn, [&] { return batch_tickets_served == ticket; });
        }

        struct advance_on_exit {
            impl& self;
            ~advance_on_exit() {
                {
                    std::lock_guard turn(self.batch_dispatch_mutex);
                    ++self.batch_tickets_served;
                }
                self.batch_dispatch_cv.notify_all();
            }
        } advance{*this};

        batch_progress_subscribers.dispatch(callbacks_mutex, update);
        if (done) {
            upload_log_context batch_ctx;
            batch_ctx.batch_size = update.total;
            MU_LOG_INFO_CTX(log_category::manager,
                "Batch finished: " + std::to_string(update.completed) +
                " completed, " + std::to_string(update.failed) + " failed",
                batch_ctx);
            batch_completed_subscribers.dispatch(callbacks_mutex, update);
        }
    }

    // ------------------------------------------------------------------------
    // worker_listener
    // ------------------------------------------------------------------------

    void on_worker_started(const job_id& id) override {
        MU_LOG_DEBUG(log_category::manager, "Job started: " + id.str());
        started_subscribers.dispatch(callbacks_mutex, id);
    }

    void on_worker_progress(const job_id& id, const progress_snapshot& snapshot) override {
        {
            std::lock_guard lock(mutex);
            auto it = jobs.find(id);
            if (it == jobs.end() || is_terminal(it->second.state)) {
                return;
            }
            auto& entry = it->second;
            if (!is_terminal(snapshot.state) && can_transition(entry.state, snapshot.state)) {
                entry.state = snapshot.state;
            }
            if (snapshot.percent >= entry.last_progress.percent) {
                entry.last_progress = snapshot;
            }
        }
        progress_subscribers.dispatch(callbacks_mutex, id, snapshot);
    }

    void on_worker_finished(const job_result& finished) override {
        job_result result = finished;
        std::optional<batch_progress> batch_update;
        uint64_t batch_ticket = 0;
        bool batch_done = false;
        {
            std::lock_guard lock(mutex);
            auto it = jobs.find(result.id);
            if (it == jobs.end()) {
                MU_LOG_DEBUG(log_category::manager,
                    "Result for discarded job " + result.id.str() + " ignored");
                return;
            }

            auto& entry = it->second;
            if (is_terminal(entry.state)) {
                return;
            }
            entry.state = result.state;
            entry.outcome = result;
            entry.last_progress.state = result.state;
            if (!result.success) {
                entry.last_progress.message = result.message;
            }

            if (batch && batch->members.count(result.id) != 0) {
                if (result.success) {
                    ++batch->counters.completed;
                } else {
                    ++batch->counters.failed;
                }
                batch_update = batch->counters;
                batch_ticket = batch_tickets_issued++;
                if (batch->counters.is_complete()) {
                    batch_done = true;
                    batch.reset();
                }
            }
        }

        upload_log_context ctx;
        ctx.job_id = result.id.str();
        ctx.filename = result.resource.filename().string();
        ctx.state = to_string(result.state);
        if (result.success) {
            MU_LOG_INFO_CTX(log_category::manager, "Job completed", ctx);
        } else {
            ctx.error_message = result.message;
            MU_LOG_WARN_CTX(log_category::manager, "Job did not complete", ctx);
        }

        if (organizer && result.success) {
            auto moved = organizer->organize(result.resource);
            if (moved) {
                result.organized_path = moved.value();
            } else {
                MU_LOG_WARN(log_category::manager,
                    "Could not organize " + result.resource.string() + ": "
                    + moved.error().message);
            }
        }

        if (sink) {
            auto recorded = sink->record(result);
            if (!recorded) {
                MU_LOG_WARN(log_category::manager,
                    "Result sink rejected " + result.id.str() + ": " + recorded.error().message);
            }
        }

        completed_subscribers.dispatch(callbacks_mutex, result);
        if (batch_update) {
            dispatch_batch_events(batch_ticket, *batch_update, batch_done);
        }

        {
            std::lock_guard lock(mutex);
            auto it = jobs.find(result.id);
            if (it != jobs.end()) {
                if (result.organized_path && it->second.outcome) {
                    it->second.outcome->organized_path = result.organized_path;
                }
                it->second.settled = true;
            }
        }
        settled_cv.notify_all();
    }
};

// ============================================================================
// Builder
// ============================================================================

upload_manager::builder::builder() = default;

auto upload_manager::builder::with_auth_session(std::shared_ptr<auth_session> session)
    -> builder& {
    auth_ = std::move(session);
    return *this;
}

auto upload_manager::builder::with_transfer_client(std::shared_ptr<transfer_client> client)
    -> builder& {
    transfer_ = std::move(client);
    return *this;
}

auto upload_manager::builder::with_result_sink(std::shared_ptr<result_sink> sink) -> builder& {
    sink_ = std::move(sink);
    return *this;
}

auto upload_manager::builder::with_file_organizer(std::shared_ptr<file_organizer> organizer)
    -> builder& {
    organizer_ = std::move(organizer);
    return *this;
}

auto upload_manager::builder::with_max_concurrent_uploads(std::size_t limit) -> builder& {
    config_.max_concurrent_uploads = limit;
    return *this;
}

auto upload_manager::builder::with_shutdown_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.shutdown_timeout = timeout;
    return *this;
}

auto upload_manager::builder::with_checkpoint_delays(
    std::chrono::milliseconds processing,
    std::chrono::milliseconds finalizing) -> builder& {
    config_.processing_delay = processing;
    config_.finalizing_delay = finalizing;
    return *this;
}

auto upload_manager::builder::with_progress_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.progress_interval = interval;
    return *this;
}

auto upload_manager::builder::with_validation_config(validation_config config) -> builder& {
    config_.validation = std::move(config);
    return *this;
}

auto upload_manager::builder::with_visibility(std::string visibility) -> builder& {
    config_.visibility = std::move(visibility);
    return *this;
}

auto upload_manager::builder::build() -> result<upload_manager> {
    if (!auth_) {
        return unexpected{error{error_code::invalid_configuration,
                               "An auth_session is required"}};
    }
    if (!transfer_) {
        return unexpected{error{error_code::invalid_configuration,
                               "A transfer_client is required"}};
    }
    if (config_.visibility != "private" && config_.visibility != "unlisted" &&
        config_.visibility != "public") {
        return unexpected{error{error_code::invalid_configuration,
                               "Visibility must be private, unlisted or public"}};
    }
    if (config_.shutdown_timeout.count() < 0 || config_.progress_interval.count() < 0 ||
        config_.processing_delay.count() < 0 || config_.finalizing_delay.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Durations must not be negative"}};
    }

    return upload_manager{std::make_shared<impl>(
        std::move(config_), std::move(auth_), std::move(transfer_), std::move(sink_),
        std::move(organizer_))};
}

// ============================================================================
// upload_manager
// ============================================================================

upload_manager::upload_manager(std::shared_ptr<impl> state)
    : impl_(std::move(state)) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

upload_manager::upload_manager(upload_manager&&) noexcept = default;
auto upload_manager::operator=(upload_manager&& other) noexcept -> upload_manager& {
    if (this != &other) {
        if (impl_) {
            shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

upload_manager::~upload_manager() {
    if (impl_) {
        shutdown();
    }
}

auto upload_manager::validate_request(const std::filesystem::path& resource,
                                      const std::string& title,
                                      const std::string& description) const
    -> result<void> {
    return impl_->validate(resource, title, description);
}

auto upload_manager::validate_request(const upload_request& request) const -> result<void> {
    return impl_->validate(request);
}

auto upload_manager::submit(const upload_request& request) -> result<job_id> {
    auto checked = impl_->validate(request);
    if (!checked) {
        MU_LOG_WARN(log_category::manager, "Request rejected: " + checked.error().message);
        return unexpected{checked.error()};
    }

    impl_->reap_finished_workers();

    auto job = impl_->make_job(request);
    auto id = job.id;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->shut_down) {
            return unexpected{error{error_code::manager_shut_down,
                                   "Upload manager is shut down"}};
        }
        auto& worker = impl_->register_locked(std::move(job));
        worker.start(impl_);
    }

    upload_log_context ctx;
    ctx.job_id = id.str();
    ctx.filename = request.resource.filename().string();
    MU_LOG_INFO_CTX(log_category::manager, "Job submitted", ctx);
    return id;
}

auto upload_manager::submit_batch(const std::vector<upload_request>& requests)
    -> result<std::vector<job_id>> {
    if (requests.empty()) {
        return unexpected{error{error_code::empty_batch, "No files selected for upload"}};
    }

    // Every request is checked before any worker exists
    for (std::size_t i = 0; i < requests.size(); ++i) {
        auto checked = impl_->validate(requests[i]);
        if (!checked) {
            MU_LOG_WARN(log_category::manager,
                "Batch rejected at request " + std::to_string(i + 1) + ": " +
                checked.error().message);
            return unexpected{error{checked.error().code,
                "Request " + std::to_string(i + 1) + " (" +
                requests[i].resource.filename().string() + "): " +
                checked.error().message}};
        }
    }

    impl_->reap_finished_workers();

    std::vector<upload_job> jobs;
    jobs.reserve(requests.size());
    for (const auto& request : requests) {
        jobs.push_back(impl_->make_job(request));
    }

    std::vector<job_id> ids;
    ids.reserve(jobs.size());
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->shut_down) {
            return unexpected{error{error_code::manager_shut_down,
                                   "Upload manager is shut down"}};
        }

        batch_context ctx;
        ctx.counters.total = jobs.size();
        for (const auto& job : jobs) {
            ctx.members.insert(job.id);
            ids.push_back(job.id);
        }
        if (impl_->batch) {
            MU_LOG_WARN(log_category::manager,
                "New batch replaces one with " +
                std::to_string(impl_->batch->counters.pending()) + " pending jobs");
        }
        impl_->batch = std::move(ctx);

        std::vector<upload_worker*> workers;
        workers.reserve(jobs.size());
        for (auto& job : jobs) {
            workers.push_back(&impl_->register_locked(std::move(job)));
        }
        for (auto* worker : workers) {
            worker->start(impl_);
        }
    }

    upload_log_context ctx;
    ctx.batch_size = ids.size();
    MU_LOG_INFO_CTX(log_category::manager, "Batch submitted", ctx);
    return ids;
}

auto upload_manager::cancel(const job_id& id) -> bool {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end() || is_terminal(it->second.state) || !it->second.worker) {
        return false;
    }

    it->second.worker->cancel();
    MU_LOG_INFO(log_category::manager, "Cancellation requested for " + id.str());
    return true;
}

auto upload_manager::cancel_all() -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    std::size_t signalled = 0;
    for (auto& [id, entry] : impl_->jobs) {
        if (!is_terminal(entry.state) && entry.worker) {
            entry.worker->cancel();
            ++signalled;
        }
    }
    if (signalled > 0) {
        MU_LOG_INFO(log_category::manager,
            "Cancellation requested for " + std::to_string(signalled) + " jobs");
    }
    return signalled;
}

void upload_manager::shutdown() {
    std::vector<upload_worker*> workers;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->shut_down) {
            return;
        }
        impl_->shut_down = true;
        for (auto& [id, entry] : impl_->jobs) {
            if (entry.worker) {
                entry.worker->cancel();
                workers.push_back(entry.worker.get());
            }
        }
    }

    std::size_t abandoned = 0;
    for (auto* worker : workers) {
        if (!worker->join_for(impl_->config.shutdown_timeout)) {
            ++abandoned;
        }
    }

    std::map<job_id, job_entry> discarded;
    {
        std::lock_guard lock(impl_->mutex);
        discarded.swap(impl_->jobs);
        impl_->batch.reset();
    }
    impl_->settled_cv.notify_all();

    if (abandoned > 0) {
        MU_LOG_WARN(log_category::manager,
            std::to_string(abandoned) + " workers abandoned at shutdown");
    }
    MU_LOG_DEBUG(log_category::manager, "Upload manager shut down");
}

auto upload_manager::is_shut_down() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->shut_down;
}

auto upload_manager::status(const job_id& id) const -> std::optional<job_info> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end()) {
        return std::nullopt;
    }
    return it->second.to_info();
}

auto upload_manager::outcome(const job_id& id) const -> std::optional<job_result> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end() || !it->second.settled) {
        return std::nullopt;
    }
    return it->second.outcome;
}

auto upload_manager::active_jobs() const -> std::vector<job_id> {
    std::lock_guard lock(impl_->mutex);
    std::vector<job_id> ids;
    for (const auto& [id, entry] : impl_->jobs) {
        if (!is_terminal(entry.state)) {
            ids.push_back(id);
        }
    }
    return ids;
}

auto upload_manager::job_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->jobs.size();
}

auto upload_manager::batch_status() const -> std::optional<batch_progress> {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->batch) {
        return std::nullopt;
    }
    return impl_->batch->counters;
}

auto upload_manager::organization_stats() const
    -> std::optional<media_upload::organization_stats> {
    if (!impl_->organizer) {
        return std::nullopt;
    }
    return impl_->organizer->stats();
}

auto upload_manager::wait_for(const job_id& id, std::chrono::milliseconds timeout)
    -> result<job_result> {
    std::vector<std::unique_ptr<upload_worker>> finished;
    std::unique_lock lock(impl_->mutex);

    auto settled = [&]() {
        auto it = impl_->jobs.find(id);
        return it == impl_->jobs.end() || it->second.settled;
    };
    if (!impl_->settled_cv.wait_for(lock, timeout, settled)) {
        return unexpected{error{error_code::internal_error,
                               "Timed out waiting for " + id.str()}};
    }

    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end() || !it->second.outcome) {
        return unexpected{error{error_code::job_not_found, "Job not found: " + id.str()}};
    }
    auto outcome = *it->second.outcome;

    // Joined after the lock is released, when finished goes out of scope
    finished = impl_->take_finished_workers_locked();
    lock.unlock();
    return outcome;
}

auto upload_manager::wait_all(std::chrono::milliseconds timeout) -> bool {
    bool all_settled = false;
    {
        std::unique_lock lock(impl_->mutex);
        all_settled = impl_->settled_cv.wait_for(lock, timeout, [this]() {
            for (const auto& [id, entry] : impl_->jobs) {
                if (!entry.settled) {
                    return false;
                }
            }
            return true;
        });
    }
    impl_->reap_finished_workers();
    return all_settled;
}

auto upload_manager::worker_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    std::size_t count = 0;
    for (const auto& [id, entry] : impl_->jobs) {
        if (entry.worker) {
            ++count;
        }
    }
    return count;
}

auto upload_manager::config() const -> const manager_config& {
    return impl_->config;
}

void upload_manager::on_job_started(job_started_callback callback) {
    std::lock_guard lock(impl_->callbacks_mutex);
    impl_->started_subscribers.callbacks.push_back(std::move(callback));
}

void upload_manager::on_job_progress(job_progress_callback callback) {
    std::lock_guard lock(impl_->callbacks_mutex);
    impl_->progress_subscribers.callbacks.push_back(std::move(callback));
}

void upload_manager::on_job_completed(job_completed_callback callback) {
    std::lock_guard lock(impl_->callbacks_mutex);
    impl_->completed_subscribers.callbacks.push_back(std::move(callback));
}

void upload_manager::on_batch_progress(batch_progress_callback callback) {
    std::lock_guard lock(impl_->callbacks_mutex);
    impl_->batch_progress_subscribers.callbacks.push_back(std::move(callback));
}

void upload_manager::on_batch_completed(batch_completed_callback callback) {
    std::lock_guard lock(impl_->callbacks_mutex);
    impl_->batch_completed_subscribers.callbacks.push_back(std::move(callback));
}

}  // namespace media_upload
