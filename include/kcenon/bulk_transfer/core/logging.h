// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for bulk_trans_system
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if BULK_TRANS_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::bulk_transfer {

/**
 * @brief Log categories for bulk transfer system
 */
struct log_category {
    static constexpr std::string_view job = "bulk_transfer.job";
    static constexpr std::string_view enumeration = "bulk_transfer.enumeration";
    static constexpr std::string_view batch = "bulk_transfer.batch";
    static constexpr std::string_view statistics = "bulk_transfer.statistics";
    static constexpr std::string_view retry = "bulk_transfer.retry";
    static constexpr std::string_view transport = "bulk_transfer.transport";
    static constexpr std::string_view client = "bulk_transfer.client";
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

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Source and target paths routinely contain user and customer names, so
 * deployments that ship logs off-host usually enable path masking.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_hosts = false;
    bool mask_filenames = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, '*', 4};
    }
};

/**
 * @brief Masks paths, file names and IPv4 host addresses in log text
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every path and host address found in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths && !config_.mask_hosts) {
            return input;
        }

        std::string output = input;
        if (config_.mask_hosts) {
            output = replace_all(output, host_pattern(),
                                 [this](const std::string& m) { return mask_host(m); });
        }
        if (config_.mask_paths) {
            output = replace_all(output, path_pattern(),
                                 [this](const std::string& m) { return mask_path(m); });
        }
        return output;
    }

    /**
     * @brief Mask the directory part of a path, and the file name if enabled
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return config_.mask_filenames ? mask_filename(path) : path;
        }

        std::string file_name = path.substr(last_sep + 1);
        if (config_.mask_filenames) {
            file_name = mask_filename(file_name);
        }
        return std::string(last_sep, config_.mask_char) + path[last_sep] + file_name;
    }

    /**
     * @brief Mask all but the last octet of an IPv4 address
     */
    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.empty()) {
            return host;
        }

        auto last_dot = host.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(host.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + host.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    static auto host_pattern() -> const std::regex& {
        static const std::regex pattern(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+)|(?:\\\\[a-zA-Z0-9._-]+(?:\\[a-zA-Z0-9._$-]+)+))");
        return pattern;
    }

    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn fn)
        -> std::string {
        std::string output;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            auto pos = static_cast<size_t>(it->position());
            output += input.substr(last_pos, pos - last_pos);
            output += fn(it->str());
            last_pos = pos + static_cast<size_t>(it->length());
        }
        output += input.substr(last_pos);
        return output;
    }

    [[nodiscard]] auto mask_filename(const std::string& file_name) const -> std::string {
        auto dot_pos = file_name.find_last_of('.');
        std::string stem = file_name;
        std::string ext;
        if (dot_pos != std::string::npos && dot_pos > 0) {
            stem = file_name.substr(0, dot_pos);
            ext = file_name.substr(dot_pos);
        }

        if (stem.size() <= config_.visible_chars) {
            return file_name;
        }
        return stem.substr(0, config_.visible_chars) +
               std::string(stem.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to job, path and enumeration records
 */
struct transfer_log_context {
    std::string job_id;
    std::string path;
    std::optional<std::string> target;
    std::optional<std::string> transport;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> files;
    std::optional<uint32_t> attempt;
    std::optional<double> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> host;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_string = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
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
        auto masked_path = [&](const std::string& value) {
            return masker ? masker->mask_path(value) : value;
        };

        if (!job_id.empty()) add_string("job_id", job_id);
        if (!path.empty()) add_string("path", masked_path(path));
        if (target) add_string("target", masked_path(*target));
        if (transport) add_string("transport", *transport);
        if (bytes) add_uint("bytes", *bytes);
        if (files) add_uint("files", *files);
        if (attempt) add_uint("attempt", *attempt);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (rate_mbps) add_double("rate_mbps", *rate_mbps);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_string("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        if (host) add_string("host", masker ? masker->mask_host(*host) : *host);

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
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
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
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::job)
 *     .with_message("Job completed")
 *     .with_job_id("4f1c...")
 *     .with_files(120)
 *     .with_bytes(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() { entry_.timestamp = iso8601_now(); }

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
        context().job_id = std::string(id);
        return *this;
    }

    auto with_path(std::string_view path) -> log_entry_builder& {
        context().path = std::string(path);
        return *this;
    }

    auto with_bytes(uint64_t bytes) -> log_entry_builder& {
        context().bytes = bytes;
        return *this;
    }

    auto with_files(uint64_t files) -> log_entry_builder& {
        context().files = files;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        context().attempt = attempt;
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        context().error_message = std::string(message);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }

    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto context() -> transfer_log_context& {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto iso8601_now() -> std::string {
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
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

enum class log_output_format {
    text,   ///< Human readable lines
    json    ///< One JSON object per line
};

/**
 * @brief Process-wide logger for bulk transfer components
 *
 * Forwards to kcenon logger_system when it is part of the build and writes
 * to stderr otherwise. Custom callbacks see every record that passes the
 * level filter, which is how tests and hosting applications capture output.
 */
class bulk_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    bulk_transfer_logger() = default;
    ~bulk_transfer_logger() = default;

    bulk_transfer_logger(const bulk_transfer_logger&) = delete;
    bulk_transfer_logger& operator=(const bulk_transfer_logger&) = delete;

    /**
     * @brief Initialize the backend; later calls are no-ops
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if BULK_TRANS_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if BULK_TRANS_USE_LOGGER_SYSTEM
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
#if BULK_TRANS_USE_LOGGER_SYSTEM
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

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    /**
     * @brief Silence the stderr fallback while keeping callbacks active
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        if (format == log_output_format::json) {
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
            emit_json(builder.build(), masker, file, line, function);
        } else {
            emit_text(level, category, message, context, masker, file, line, function);
        }
    }

    void flush() {
#if BULK_TRANS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit_json(const structured_log_entry& entry,
                   const sensitive_info_masker& masker,
                   [[maybe_unused]] const char* file,
                   [[maybe_unused]] int line,
                   [[maybe_unused]] const char* function) {
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#if BULK_TRANS_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(entry.level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(entry.level), json_str);
            }
            return;
        }
#endif
        output_to_stderr(json_str);
    }

    void emit_text(log_level level,
                   std::string_view category,
                   std::string_view message,
                   const transfer_log_context* context,
                   const sensitive_info_masker& masker,
                   [[maybe_unused]] const char* file,
                   [[maybe_unused]] int line,
                   [[maybe_unused]] const char* function) {
        std::ostringstream body;
        body << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            body << " " << context->to_json_with_masking(&masker);
        }

#if BULK_TRANS_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), body.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), body.str());
            }
            return;
        }
#endif
        output_to_stderr(local_timestamp() + " [" +
                         std::string(log_level_to_string(level)) + "] " + body.str());
    }

    void output_to_stderr(const std::string& msg) {
        if (!console_output_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if BULK_TRANS_USE_LOGGER_SYSTEM
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

    static auto local_timestamp() -> std::string {
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
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline bulk_transfer_logger& get_logger() {
    static bulk_transfer_logger instance;
    return instance;
}

#define BT_LOG(level, category, message) \
    kcenon::bulk_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_CTX(level, category, message, context) \
    kcenon::bulk_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_TRACE(category, message) \
    BT_LOG(kcenon::bulk_transfer::log_level::trace, category, message)

#define BT_LOG_DEBUG(category, message) \
    BT_LOG(kcenon::bulk_transfer::log_level::debug, category, message)

#define BT_LOG_INFO(category, message) \
    BT_LOG(kcenon::bulk_transfer::log_level::info, category, message)

#define BT_LOG_WARN(category, message) \
    BT_LOG(kcenon::bulk_transfer::log_level::warn, category, message)

#define BT_LOG_ERROR(category, message) \
    BT_LOG(kcenon::bulk_transfer::log_level::error, category, message)

#define BT_LOG_FATAL(category, message) \
    BT_LOG(kcenon::bulk_transfer::log_level::fatal, category, message)

#define BT_LOG_DEBUG_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::bulk_transfer::log_level::debug, category, message, ctx)

#define BT_LOG_INFO_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::bulk_transfer::log_level::info, category, message, ctx)

#define BT_LOG_WARN_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::bulk_transfer::log_level::warn, category, message, ctx)

#define BT_LOG_ERROR_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::bulk_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::bulk_transfer
