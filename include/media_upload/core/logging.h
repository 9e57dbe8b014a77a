// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <optional>
#include <memory>
#include <functional>
#include <sstream>
#include <iomanip>
#include <atomic>
#include <mutex>
#include <iostream>
#include <regex>

#include "media_upload/config/feature_flags.h"
#include "media_upload/transfer/http_utils.h"

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace media_upload {

/**
 * @brief Log categories for the upload pipeline
 */
struct log_category {
    static constexpr std::string_view manager = "media_upload.manager";
    static constexpr std::string_view worker = "media_upload.worker";
    static constexpr std::string_view auth = "media_upload.auth";
    static constexpr std::string_view transfer = "media_upload.transfer";
    static constexpr std::string_view history = "media_upload.history";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Tokens are masked by default; paths only on request.
 */
struct masking_config {
    bool mask_tokens = true;
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks bearer tokens, OAuth token fields and local paths
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;

        if (config_.mask_tokens) {
            result = mask_tokens(result);
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask a secret, keeping only its first characters
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (secret.size() <= config_.visible_chars) {
            return std::string(secret.size(), config_.mask_char[0]);
        }
        return secret.substr(0, config_.visible_chars) +
               std::string(secret.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Mask the directory part of a path, keeping the filename
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + "/" + path.substr(last_sep + 1);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_tokens(const std::string& input) const -> std::string {
        static const std::regex token_pattern(
            R"re((Bearer\s+|"(?:access_token|refresh_token|client_secret)"\s*:\s*"|(?:access_token|refresh_token|client_secret)=)([A-Za-z0-9._~+/\-]+))re");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), token_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& match = *it;
            result += input.substr(last_pos, match.position() - last_pos);
            result += match[1].str();
            result += mask_secret(match[2].str());
            last_pos = match.position() + match.length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured log context for upload jobs
 */
struct upload_log_context {
    std::string job_id;
    std::string filename;
    std::optional<std::string> state;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_sent;
    std::optional<int> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<double> eta_seconds;
    std::optional<uint64_t> duration_ms;
    std::optional<int> http_status;
    std::optional<std::size_t> batch_size;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << http_utils::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!job_id.empty()) add_field("job_id", job_id);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_path(filename) : filename);
        }
        if (state) add_field("state", *state);
        if (file_size) add_uint("size", *file_size);
        if (bytes_sent) add_uint("bytes_sent", *bytes_sent);
        if (progress_percent) add_uint("progress_percent", static_cast<uint64_t>(*progress_percent));
        if (rate_mbps) add_double("rate_mbps", *rate_mbps);
        if (eta_seconds) add_double("eta_seconds", *eta_seconds);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (http_status) add_uint("http_status", static_cast<uint64_t>(*http_status));
        if (batch_size) add_uint("batch_size", *batch_size);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << http_utils::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            std::string file = masker ? masker->mask_path(*source_file) : *source_file;
            oss << ",\"source\":{";
            oss << "\"file\":\"" << http_utils::escape_json_string(file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::worker)
 *     .with_message("Upload completed")
 *     .with_job_id("upload_20250101_120000_000001_1")
 *     .with_filename("holiday.mp4")
 *     .with_file_size(52428800)
 *     .with_rate_mbps(2.0)
 *     .build();
 *
 * std::string json = entry.to_json();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_job_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->job_id = std::string(id);
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context();
        entry_.context->filename = std::string(filename);
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        ensure_context();
        entry_.context->file_size = size;
        return *this;
    }

    auto with_bytes_sent(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_sent = bytes;
        return *this;
    }

    auto with_progress_percent(int percent) -> log_entry_builder& {
        ensure_context();
        entry_.context->progress_percent = percent;
        return *this;
    }

    auto with_rate_mbps(double rate) -> log_entry_builder& {
        ensure_context();
        entry_.context->rate_mbps = rate;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const upload_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = upload_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class upload_logger;

upload_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Process-wide logger for the upload pipeline
 *
 * Writes through logger_system when it is compiled in, otherwise to
 * stderr. Secrets are masked before anything leaves the process.
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called by upload_manager::builder::build().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Set custom log callback
     *
     * The callback receives the message after masking.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {

        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked = current_masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, masked, context, file, line, function, current_masker);
        }
    }

    void flush() {
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const upload_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
        }
#else
        output_to_stderr(json_str);
#endif
    }

    void log_text(log_level level,
                  std::string_view category,
                  const std::string& masked_message,
                  const upload_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function,
                  const sensitive_info_masker& masker) {

        std::ostringstream oss;
#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
        oss << "[" << category << "] " << masked_message;
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
        }
#else
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << masked_message;
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

        output_to_stderr(oss.str());
#endif
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if MEDIA_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

// Logging macros for convenience
#define MU_LOG(level, category, message) \
    media_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define MU_LOG_CTX(level, category, message, context) \
    media_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define MU_LOG_TRACE(category, message) \
    MU_LOG(media_upload::log_level::trace, category, message)

#define MU_LOG_DEBUG(category, message) \
    MU_LOG(media_upload::log_level::debug, category, message)

#define MU_LOG_INFO(category, message) \
    MU_LOG(media_upload::log_level::info, category, message)

#define MU_LOG_WARN(category, message) \
    MU_LOG(media_upload::log_level::warn, category, message)

#define MU_LOG_ERROR(category, message) \
    MU_LOG(media_upload::log_level::error, category, message)

#define MU_LOG_FATAL(category, message) \
    MU_LOG(media_upload::log_level::fatal, category, message)

#define MU_LOG_DEBUG_CTX(category, message, ctx) \
    MU_LOG_CTX(media_upload::log_level::debug, category, message, ctx)

#define MU_LOG_INFO_CTX(category, message, ctx) \
    MU_LOG_CTX(media_upload::log_level::info, category, message, ctx)

#define MU_LOG_WARN_CTX(category, message, ctx) \
    MU_LOG_CTX(media_upload::log_level::warn, category, message, ctx)

#define MU_LOG_ERROR_CTX(category, message, ctx) \
    MU_LOG_CTX(media_upload::log_level::error, category, message, ctx)

} // namespace media_upload
