/**
 * @file mock_services.h
 * @brief In-memory stand-ins for the HTTP, credential and transfer seams
 */

#ifndef MEDIA_UPLOAD_TEST_MOCK_SERVICES_H
#define MEDIA_UPLOAD_TEST_MOCK_SERVICES_H

#include <media_upload/auth/auth_session.h>
#include <media_upload/auth/credential_store.h>
#include <media_upload/auth/token_refresher.h>
#include <media_upload/transfer/http_client.h>
#include <media_upload/transfer/transfer_client.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace media_upload::test {

// =============================================================================
// HTTP
// =============================================================================

/**
 * @brief Records every request and answers from a scripted queue
 */
class mock_http_client : public http_client_interface {
public:
    struct request {
        std::string method;
        std::string url;
        std::string body;
        http_headers headers;
    };

    /// Used when the queue is empty
    http_response fallback{200, {}, {}};

    void enqueue(int status, std::string body = {}, http_headers headers = {}) {
        std::lock_guard lock(mutex_);
        http_response resp;
        resp.status_code = status;
        resp.headers = std::move(headers);
        resp.body.assign(body.begin(), body.end());
        responses_.push_back(std::move(resp));
    }

    void enqueue_transport_error(std::string message) {
        std::lock_guard lock(mutex_);
        transport_errors_.push_back(std::move(message));
    }

    auto post(const std::string& url, const std::string& body, const http_headers& headers)
        -> result<http_response> override {
        return respond("POST", url, body, headers);
    }

    auto put(const std::string& url, const std::vector<uint8_t>& body, const http_headers& headers)
        -> result<http_response> override {
        return respond("PUT", url, std::string(body.begin(), body.end()), headers);
    }

    auto del(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        return respond("DELETE", url, {}, headers);
    }

    auto requests() const -> std::vector<request> {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    auto request_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return requests_.size();
    }

private:
    auto respond(const std::string& method, const std::string& url,
                 std::string body, const http_headers& headers) -> result<http_response> {
        std::lock_guard lock(mutex_);
        requests_.push_back({method, url, std::move(body), headers});

        if (!transport_errors_.empty()) {
            auto message = transport_errors_.front();
            transport_errors_.pop_front();
            return unexpected{error{error_code::transfer_failed, message}};
        }
        if (responses_.empty()) {
            return fallback;
        }
        auto resp = responses_.front();
        responses_.pop_front();
        return resp;
    }

    mutable std::mutex mutex_;
    std::deque<http_response> responses_;
    std::deque<std::string> transport_errors_;
    std::vector<request> requests_;
};

// =============================================================================
// Credentials
// =============================================================================

/**
 * @brief credential_store kept in memory
 */
class memory_credential_store : public credential_store {
public:
    memory_credential_store() = default;
    explicit memory_credential_store(credential cred) : stored_(std::move(cred)) {}

    auto load() -> result<std::optional<credential>> override {
        std::lock_guard lock(mutex_);
        if (load_error_) {
            return unexpected{*load_error_};
        }
        return stored_;
    }

    auto save(const credential& cred) -> result<void> override {
        std::lock_guard lock(mutex_);
        stored_ = cred;
        ++saves_;
        return {};
    }

    auto remove() -> result<void> override {
        std::lock_guard lock(mutex_);
        stored_.reset();
        ++removals_;
        return {};
    }

    void fail_loads_with(error err) {
        std::lock_guard lock(mutex_);
        load_error_ = std::move(err);
    }

    auto stored() const -> std::optional<credential> {
        std::lock_guard lock(mutex_);
        return stored_;
    }

    auto saves() const -> int {
        std::lock_guard lock(mutex_);
        return saves_;
    }

    auto removals() const -> int {
        std::lock_guard lock(mutex_);
        return removals_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<credential> stored_;
    std::optional<error> load_error_;
    int saves_ = 0;
    int removals_ = 0;
};

/**
 * @brief token_refresher returning a fixed outcome
 */
class mock_token_refresher : public token_refresher {
public:
    std::function<result<credential>(const credential&)> handler;

    auto refresh(const credential& current) -> result<credential> override {
        calls_.fetch_add(1);
        if (handler) {
            return handler(current);
        }
        return unexpected{error{error_code::auth_refresh_failed, "refresh rejected"}};
    }

    auto calls() const -> int { return calls_.load(); }

private:
    std::atomic<int> calls_{0};
};

/**
 * @brief Manually advanced wall clock
 */
class manual_clock {
public:
    manual_clock() : now_(std::chrono::system_clock::now()) {}

    auto now() const -> std::chrono::system_clock::time_point {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        std::lock_guard lock(mutex_);
        now_ += delta;
    }

    auto as_function() -> clock_function {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point now_;
};

inline auto make_valid_credential() -> credential {
    credential cred;
    cred.access_token = "ya29.valid-access-token";
    cred.refresh_token = "1//refresh-token";
    cred.expires_at = std::chrono::system_clock::now() + std::chrono::hours(1);
    cred.client_id = "client-id";
    cred.client_secret = "client-secret";
    cred.scopes = {"https://www.googleapis.com/auth/youtube.upload"};
    return cred;
}

/**
 * @brief auth_session holding a credential that stays valid for an hour
 */
inline auto make_signed_in_session() -> std::shared_ptr<auth_session> {
    return std::make_shared<auth_session>(
        std::make_shared<memory_credential_store>(make_valid_credential()),
        std::make_shared<mock_token_refresher>());
}

inline auto make_signed_out_session() -> std::shared_ptr<auth_session> {
    return std::make_shared<auth_session>(
        std::make_shared<memory_credential_store>(),
        std::make_shared<mock_token_refresher>());
}

// =============================================================================
// Transfer
// =============================================================================

/**
 * @brief Scripted behaviour of mock_transfer_client sessions
 */
struct transfer_script {
    uint64_t chunk_size = 1024 * 1024;
    std::string video_id = "dQw4w9WgXcQ";

    /// 1-based chunk that fails with fail_status; 0 never fails
    std::size_t fail_at_chunk = 0;
    int fail_status = 403;

    /// Restricts fail_at_chunk to uploads with these titles when not empty
    std::set<std::string> failing_titles;

    /// Error returned by begin(); unset means begin succeeds
    std::optional<error> begin_error;

    std::chrono::milliseconds chunk_delay{0};
};

class mock_transfer_client;

class mock_upload_session : public upload_session {
public:
    mock_upload_session(uint64_t total, transfer_script script, mock_transfer_client& owner)
        : total_(total), script_(std::move(script)), owner_(owner) {}

    auto next_chunk() -> result<chunk_status> override;
    auto abort() -> result<void> override;

    auto bytes_sent() const -> uint64_t override { return sent_; }

private:
    void close();

    uint64_t total_;
    transfer_script script_;
    mock_transfer_client& owner_;
    uint64_t sent_ = 0;
    std::size_t chunks_ = 0;
    bool closed_ = false;
};

/**
 * @brief transfer_client that simulates the chunk loop without I/O
 *
 * Must outlive the sessions it hands out.
 */
class mock_transfer_client : public transfer_client {
public:
    explicit mock_transfer_client(transfer_script script = {}) : script_(std::move(script)) {}

    auto begin(const upload_source& source, const upload_metadata& metadata,
               const std::string& access_token)
        -> result<std::unique_ptr<upload_session>> override {
        begin_calls_.fetch_add(1);
        {
            std::lock_guard lock(mutex_);
            last_metadata_ = metadata;
            last_token_ = access_token;
            last_source_ = source;
        }
        if (script_.begin_error) {
            return unexpected{*script_.begin_error};
        }

        auto script = script_;
        if (!script.failing_titles.empty() && script.failing_titles.count(metadata.title) == 0) {
            script.fail_at_chunk = 0;
        }
        open_session();
        return std::unique_ptr<upload_session>(
            std::make_unique<mock_upload_session>(source.size, std::move(script), *this));
    }

    auto begin_calls() const -> int { return begin_calls_.load(); }
    auto chunk_calls() const -> int { return chunk_calls_.load(); }
    auto abort_calls() const -> int { return abort_calls_.load(); }

    /// Sessions begun and not yet completed, failed or aborted
    auto open_sessions() const -> int { return open_sessions_.load(); }
    auto peak_open_sessions() const -> int { return peak_open_sessions_.load(); }

    auto last_metadata() const -> upload_metadata {
        std::lock_guard lock(mutex_);
        return last_metadata_;
    }

    auto last_token() const -> std::string {
        std::lock_guard lock(mutex_);
        return last_token_;
    }

    auto last_source() const -> upload_source {
        std::lock_guard lock(mutex_);
        return last_source_;
    }

private:
    friend class mock_upload_session;

    void open_session() {
        auto open = open_sessions_.fetch_add(1) + 1;
        auto peak = peak_open_sessions_.load();
        while (open > peak && !peak_open_sessions_.compare_exchange_weak(peak, open)) {
        }
    }

    void close_session() { open_sessions_.fetch_sub(1); }

    transfer_script script_;
    std::atomic<int> open_sessions_{0};
    std::atomic<int> peak_open_sessions_{0};
    std::atomic<int> begin_calls_{0};
    std::atomic<int> chunk_calls_{0};
    std::atomic<int> abort_calls_{0};
    mutable std::mutex mutex_;
    upload_metadata last_metadata_;
    std::string last_token_;
    upload_source last_source_;
};

inline auto mock_upload_session::next_chunk() -> result<chunk_status> {
    owner_.chunk_calls_.fetch_add(1);
    if (script_.chunk_delay.count() > 0) {
        std::this_thread::sleep_for(script_.chunk_delay);
    }

    ++chunks_;
    if (script_.fail_at_chunk != 0 && chunks_ == script_.fail_at_chunk) {
        close();
        return unexpected{classify_http_status(script_.fail_status, "quotaExceeded")};
    }

    sent_ = std::min(total_, sent_ + script_.chunk_size);

    chunk_status status;
    status.bytes_sent = sent_;
    status.total_bytes = total_;
    if (sent_ >= total_) {
        close();
        status.remote_id = script_.video_id;
    }
    return status;
}

inline auto mock_upload_session::abort() -> result<void> {
    owner_.abort_calls_.fetch_add(1);
    close();
    return {};
}

inline void mock_upload_session::close() {
    if (!closed_) {
        closed_ = true;
        owner_.close_session();
    }
}

}  // namespace media_upload::test

#endif  // MEDIA_UPLOAD_TEST_MOCK_SERVICES_H
