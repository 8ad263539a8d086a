/**
 * @file path_enumerator.cpp
 * @brief Parallel tree walk, record production and batch serialization
 */

#include "kcenon/bulk_transfer/enumeration/path_enumerator.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>

#include "kcenon/bulk_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/bulk_transfer/core/logging.h"
#include "kcenon/bulk_transfer/enumeration/batch_file.h"

namespace kcenon::bulk_transfer {

namespace fs = std::filesystem;

namespace {

using steady = std::chrono::steady_clock;

/**
 * @brief Closeable blocking queue shared by the walk workers
 */
template <typename T>
class work_queue {
public:
    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    auto pop() -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        auto item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * @brief Let consumers drain what is queued, then stop
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /**
     * @brief Stop consumers and drop what is queued
     */
    void clear_and_close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

struct directory_item {
    std::string path;
    std::string root;
};

struct file_item {
    listing_node node;
    std::string root;
};

auto matches_any(const std::vector<std::string>& patterns, std::string_view name) -> bool {
    return std::any_of(patterns.begin(), patterns.end(),
                       [name](const std::string& p) { return wildcard_match(p, name); });
}

auto error_from(const std::error_code& ec, const std::string& path, const std::string& what)
    -> enumeration_path_error {
    return enumeration_path_error{path, classify_filesystem_error(ec), what + ": " + ec.message(),
                                  ec.value()};
}

auto error_from(const error& err, const std::string& path) -> enumeration_path_error {
    return enumeration_path_error{path, attributes_for(err.code), err.message,
                                  static_cast<int32_t>(err.code)};
}

/**
 * @brief State of one walk
 */
class walk {
public:
    walk(path_source& source,
         const enumeration_context& context,
         const path_sink& sink,
         const cancellation_token& token)
        : source_(source), context_(context), sink_(sink), cancel_(token) {
        registration_ = cancel_.token().register_callback([this] {
            directories_.clear_and_close();
            files_.clear_and_close();
        });
    }

    auto run() -> result<enumeration_result> {
        start_ = steady::now();
        last_statistics_ = start_;

        seed_roots();

        auto directory_pool = adapters::worker_pool_factory::create(
            context_.max_directory_parallelism, "bulk_transfer_enum_dirs");
        auto file_pool = adapters::worker_pool_factory::create(context_.max_file_parallelism,
                                                               "bulk_transfer_enum_files");

        std::vector<std::future<void>> directory_workers;
        for (std::size_t i = 0; i < context_.max_directory_parallelism; ++i) {
            directory_workers.push_back(
                directory_pool->submit_to_stage([this] { directory_loop(); }, "directory_walk"));
        }
        std::vector<std::future<void>> file_workers;
        for (std::size_t i = 0; i < context_.max_file_parallelism; ++i) {
            file_workers.push_back(
                file_pool->submit_to_stage([this] { file_loop(); }, "file_stat"));
        }

        wait_all(directory_workers);
        files_.close();
        wait_all(file_workers);
        directory_pool->shutdown();
        file_pool->shutdown();
        registration_.reset();

        enumeration_result result;
        {
            std::lock_guard lock(sink_mutex_);
            result.total_files = totals_.total_files;
            result.total_bytes = totals_.total_bytes;
            result.total_directories = totals_.total_directories;
            result.error_paths = std::move(errors_);
            result.elapsed = elapsed();
            emit_statistics_locked(true);
        }

        {
            std::lock_guard lock(fatal_mutex_);
            if (fatal_) {
                BT_LOG_ERROR(log_category::enumeration,
                             "Enumeration aborted: " + fatal_->message);
                return unexpected{*fatal_};
            }
        }
        if (cancel_.is_canceled()) {
            return make_error(error_code::operation_canceled, "enumeration canceled");
        }

        BT_LOG_INFO(log_category::enumeration,
                    "Enumerated " + std::to_string(result.total_files) + " files (" +
                        std::to_string(result.total_bytes) + " bytes) in " +
                        std::to_string(result.total_directories) + " directories, " +
                        std::to_string(result.error_paths.size()) + " error paths");
        return result;
    }

private:
    void wait_all(std::vector<std::future<void>>& futures) {
        for (auto& future : futures) {
            try {
                future.get();
            } catch (const std::exception& e) {
                fail(error(error_code::path_read_error,
                           std::string("enumeration worker failed: ") + e.what()));
            }
        }
    }

    auto elapsed() const -> std::chrono::milliseconds {
        return std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start_);
    }

    void seed_roots() {
        std::size_t seeded = 0;
        for (const auto& root : context_.search_paths) {
            if (source_.is_directory(root)) {
                pending_directories_.fetch_add(1);
                directories_.push(directory_item{root, root});
                ++seeded;
                continue;
            }

            // A root that is a single file is enumerated as is.
            listing_node node;
            node.path = root;
            auto stated = source_.stat(node);
            if (!stated) {
                report_error(error_from(stated.error(), root));
                continue;
            }
            auto parent = fs::path(root).parent_path().string();
            files_.push(file_item{std::move(node), parent});
        }
        if (seeded == 0) {
            directories_.close();
        }
    }

    void fail(error err) {
        {
            std::lock_guard lock(fatal_mutex_);
            if (fatal_) {
                return;
            }
            fatal_ = std::move(err);
        }
        cancel_.cancel();
    }

    void report_error(enumeration_path_error path_error) {
        BT_LOG_WARN(log_category::enumeration,
                    "Cannot enumerate '" + path_error.path + "': " + path_error.message);
        std::lock_guard lock(sink_mutex_);
        ++totals_.total_error_paths;
        if (context_.on_path_error) {
            try {
                context_.on_path_error(path_error);
            } catch (const std::exception& e) {
                BT_LOG_WARN(log_category::enumeration,
                            std::string("on_path_error handler threw: ") + e.what());
            }
        }
        errors_.push_back(std::move(path_error));
    }

    void directory_loop() {
        auto token = cancel_.token();
        while (auto item = directories_.pop()) {
            process_directory(*item, token);
            if (pending_directories_.fetch_sub(1) == 1) {
                directories_.close();
            }
        }
    }

    void process_directory(const directory_item& item, const cancellation_token& token) {
        if (token.is_canceled()) {
            return;
        }

        auto listed = source_.list(item.path, token);
        if (!listed) {
            if (listed.error().code != error_code::operation_canceled) {
                report_error(error_from(listed.error(), item.path));
            }
            return;
        }
        auto& entries = listed.value();

        {
            std::lock_guard lock(sink_mutex_);
            ++totals_.total_directories;
        }
        for (auto& entry_error : entries.errors) {
            report_error(std::move(entry_error));
        }

        if (context_.recursive) {
            for (auto& directory : entries.directories) {
                if (matches_any(context_.exclude_directories, file_name_of(directory))) {
                    continue;
                }
                pending_directories_.fetch_add(1);
                directories_.push(directory_item{std::move(directory), item.root});
            }
        }

        for (auto& node : entries.files) {
            auto name = file_name_of(node.path);
            if (!context_.include_patterns.empty() &&
                !matches_any(context_.include_patterns, name)) {
                continue;
            }
            if (matches_any(context_.exclude_patterns, name)) {
                continue;
            }
            files_.push(file_item{std::move(node), item.root});
        }
    }

    void file_loop() {
        while (auto item = files_.pop()) {
            if (cancel_.is_canceled()) {
                continue;
            }
            process_file(*item);
        }
    }

    auto make_record(const file_item& item) const -> transfer_path {
        transfer_path record(item.node.path);
        record.bytes = item.node.size;
        record.direction = context_.direction;

        if (!context_.target_path.empty()) {
            std::string target = context_.target_path;
            if (context_.preserve_folders) {
                auto relative =
                    fs::path(item.node.path).parent_path().lexically_relative(item.root);
                auto relative_text = relative.generic_string();
                if (!relative_text.empty() && relative_text != "." &&
                    relative_text.rfind("..", 0) != 0) {
                    target = join_path(target, relative_text);
                }
            }
            record.target_path = std::move(target);
            record.target_file_name = file_name_of(item.node.path);
        }
        return record;
    }

    void process_file(file_item& item) {
        if (!item.node.size) {
            auto stated = source_.stat(item.node);
            if (!stated) {
                report_error(error_from(stated.error(), item.node.path));
                return;
            }
        }

        auto record = make_record(item);

        if (context_.max_path_length > 0) {
            auto longest = std::max(record.source_path.size(),
                                    record.target_path ? record.target_full_path().size() : 0);
            if (longest > context_.max_path_length) {
                auto message = "path exceeds " + std::to_string(context_.max_path_length) +
                               " characters";
                if (!context_.skip_too_long_paths) {
                    fail(error(error_code::path_too_long, message + ": " + record.source_path));
                    return;
                }
                report_error(enumeration_path_error{
                    record.source_path, attributes_for(error_code::path_too_long), message,
                    static_cast<int32_t>(error_code::path_too_long)});
                return;
            }
        }

        std::lock_guard lock(sink_mutex_);
        if (cancel_.is_canceled()) {
            return;
        }
        auto bytes = record.bytes.value_or(0);
        auto accepted = sink_(std::move(record));
        if (!accepted) {
            // sink_mutex_ is held; fail() only touches fatal_mutex_ and the source.
            fail(accepted.error());
            return;
        }
        ++totals_.total_files;
        totals_.total_bytes += bytes;
        emit_statistics_locked(false);
    }

    void emit_statistics_locked(bool force) {
        if (!context_.on_statistics) {
            return;
        }
        auto now = steady::now();
        if (!force && now - last_statistics_ < context_.statistics_interval) {
            return;
        }
        last_statistics_ = now;
        auto snapshot = totals_;
        snapshot.elapsed = elapsed();
        try {
            context_.on_statistics(snapshot);
        } catch (const std::exception& e) {
            BT_LOG_WARN(log_category::enumeration,
                        std::string("on_statistics handler threw: ") + e.what());
        }
    }

    path_source& source_;
    const enumeration_context& context_;
    const path_sink& sink_;
    cancellation_source cancel_;
    cancellation_registration registration_;

    work_queue<directory_item> directories_;
    work_queue<file_item> files_;
    std::atomic<std::size_t> pending_directories_{0};

    std::mutex sink_mutex_;
    enumeration_statistics totals_;
    std::vector<enumeration_path_error> errors_;
    steady::time_point start_{};
    steady::time_point last_statistics_{};

    std::mutex fatal_mutex_;
    std::optional<error> fatal_;
};

/**
 * @brief Limits the number of concurrent page requests
 */
class paging_gate {
public:
    explicit paging_gate(std::size_t limit) : limit_(std::max<std::size_t>(limit, 1)) {}

    auto acquire(const cancellation_token& token) -> bool {
        std::unique_lock lock(mutex_);
        while (active_ >= limit_) {
            if (token.is_canceled()) {
                return false;
            }
            cv_.wait_for(lock, std::chrono::milliseconds(50));
        }
        ++active_;
        return true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            --active_;
        }
        cv_.notify_one();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t limit_;
    std::size_t active_ = 0;
};

class paging_slot {
public:
    explicit paging_slot(paging_gate& gate) : gate_(gate) {}
    ~paging_slot() { gate_.release(); }

    paging_slot(const paging_slot&) = delete;
    auto operator=(const paging_slot&) -> paging_slot& = delete;

private:
    paging_gate& gate_;
};

}  // namespace

// ============================================================================
// wildcard_match
// ============================================================================

auto wildcard_match(std::string_view pattern, std::string_view name) -> bool {
    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

// ============================================================================
// enumeration_context
// ============================================================================

auto enumeration_context::from(const client_configuration& config) -> enumeration_context {
    enumeration_context context;
    context.skip_too_long_paths = config.skip_too_long_paths;
    context.max_path_length = config.max_path_length;
    context.max_directory_parallelism = config.max_directory_parallelism;
    context.max_file_parallelism = config.max_file_parallelism;
    context.max_paging_parallelism = config.max_paging_parallelism;
    context.max_bytes_per_batch = config.max_bytes_per_batch;
    context.max_files_per_batch = config.max_files_per_batch;
    context.live_sync = config.live_sync_batches;
    return context;
}

// ============================================================================
// local_path_source
// ============================================================================

auto local_path_source::list(const std::string& directory, const cancellation_token& token)
    -> result<listing> {
    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        auto code = classify_filesystem_error(ec) == issue_attributes::file_not_found
                        ? error_code::file_not_found
                        : error_code::path_read_error;
        return make_error(code, "cannot read directory: " + ec.message());
    }

    listing entries;
    for (const auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        if (token.is_canceled()) {
            return make_error(error_code::operation_canceled, "enumeration canceled");
        }

        const auto& entry = *it;
        auto path = entry.path().string();
        std::error_code entry_ec;

        if (entry.is_directory(entry_ec)) {
            // Symbolic links to directories are not followed.
            std::error_code link_ec;
            if (!entry.is_symlink(link_ec)) {
                entries.directories.push_back(std::move(path));
            }
            continue;
        }
        if (entry_ec) {
            entries.errors.push_back(error_from(entry_ec, path, "cannot stat"));
            continue;
        }
        if (entry.is_regular_file(entry_ec)) {
            listing_node node;
            node.path = std::move(path);
            entries.files.push_back(std::move(node));
        }
    }
    if (ec) {
        entries.errors.push_back(error_from(ec, directory, "directory listing interrupted"));
    }

    std::sort(entries.directories.begin(), entries.directories.end());
    std::sort(entries.files.begin(), entries.files.end(),
              [](const listing_node& a, const listing_node& b) { return a.path < b.path; });
    return entries;
}

auto local_path_source::stat(listing_node& node) -> result<void> {
    std::error_code ec;
    auto status = fs::status(node.path, ec);
    if (status.type() == fs::file_type::not_found) {
        return make_error(error_code::file_not_found, "file not found");
    }
    if (ec) {
        return make_error(error_code::path_read_error, "cannot stat: " + ec.message());
    }
    if (!fs::is_regular_file(status)) {
        return make_error(error_code::bad_path, "not a regular file");
    }
    auto size = fs::file_size(node.path, ec);
    if (ec) {
        return make_error(error_code::path_read_error, "cannot read size: " + ec.message());
    }
    node.size = size;
    return {};
}

auto local_path_source::is_directory(const std::string& path) -> bool {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

// ============================================================================
// remote_path_source
// ============================================================================

struct remote_path_source::impl {
    std::shared_ptr<transport_client> client;
    std::size_t page_size;
    paging_gate gate;

    impl(std::shared_ptr<transport_client> c, std::size_t size, std::size_t parallelism)
        : client(std::move(c)), page_size(size), gate(parallelism) {}

    auto fetch(const std::string& directory,
               const std::string& page_token,
               std::size_t size,
               const cancellation_token& token) -> result<listing_page> {
        if (!gate.acquire(token)) {
            return make_error(error_code::operation_canceled, "enumeration canceled");
        }
        paging_slot slot(gate);
        return client->list_directory(directory, page_token, size, token);
    }
};

remote_path_source::remote_path_source(std::shared_ptr<transport_client> client,
                                       std::size_t page_size,
                                       std::size_t max_paging_parallelism)
    : impl_(std::make_unique<impl>(std::move(client), std::max<std::size_t>(page_size, 1),
                                   max_paging_parallelism)) {}

remote_path_source::~remote_path_source() = default;

auto remote_path_source::list(const std::string& directory, const cancellation_token& token)
    -> result<listing> {
    listing entries;
    std::string page_token;
    bool first = true;

    while (true) {
        auto page = impl_->fetch(directory, page_token, impl_->page_size, token);
        if (!page) {
            if (first) {
                return unexpected{page.error()};
            }
            entries.errors.push_back(error_from(page.error(), directory));
            break;
        }
        first = false;

        for (auto& file : page.value().files) {
            entries.files.push_back(std::move(file));
        }
        for (auto& sub : page.value().directories) {
            entries.directories.push_back(std::move(sub.path));
        }
        if (!page.value().next_page_token) {
            break;
        }
        page_token = *page.value().next_page_token;
    }
    return entries;
}

auto remote_path_source::stat(listing_node& node) -> result<void> {
    // Listings carry sizes when the backend knows them; unknown stays unset.
    (void)node;
    return {};
}

auto remote_path_source::is_directory(const std::string& path) -> bool {
    return impl_->fetch(path, {}, 1, cancellation_token::none()).has_value();
}

// ============================================================================
// path_enumerator
// ============================================================================

path_enumerator::path_enumerator(std::shared_ptr<path_source> source)
    : source_(std::move(source)) {}

auto path_enumerator::enumerate_lazy(const enumeration_context& context,
                                     const path_sink& sink,
                                     const cancellation_token& token)
    -> result<enumeration_result> {
    if (!source_) {
        return make_error(error_code::invalid_configuration, "enumerator has no path source");
    }
    if (context.search_paths.empty()) {
        return make_error(error_code::invalid_argument, "no search paths");
    }
    if (context.max_directory_parallelism == 0 || context.max_file_parallelism == 0) {
        return make_error(error_code::invalid_configuration,
                          "enumeration parallelism must be at least 1");
    }
    if (token.is_canceled()) {
        return make_error(error_code::operation_canceled, "enumeration canceled");
    }

    walk state(*source_, context, sink, token);
    return state.run();
}

auto path_enumerator::enumerate(const enumeration_context& context,
                                const cancellation_token& token)
    -> result<enumeration_result> {
    std::vector<transfer_path> paths;
    path_sink collect = [&paths](transfer_path&& record) -> result<void> {
        paths.push_back(std::move(record));
        return {};
    };

    auto walked = enumerate_lazy(context, collect, token);
    if (!walked) {
        return walked;
    }

    std::sort(paths.begin(), paths.end(), [](const transfer_path& a, const transfer_path& b) {
        return a.source_path < b.source_path;
    });
    auto result = std::move(walked).value();
    result.paths = std::move(paths);
    return result;
}

auto path_enumerator::serialize(const fs::path& batch_directory,
                                const enumeration_context& context,
                                const cancellation_token& token)
    -> result<serialization_result> {
    if (context.max_bytes_per_batch == 0 || context.max_files_per_batch == 0) {
        return make_error(error_code::invalid_configuration, "batch ceilings must be positive");
    }

    std::error_code ec;
    fs::create_directories(batch_directory, ec);
    if (ec) {
        return make_error(error_code::batch_write_error,
                          "cannot create " + batch_directory.string() + ": " + ec.message());
    }

    serialization_result output;
    std::unique_ptr<batch_writer> current;
    uint32_t next_number = 1;

    auto close_current = [&]() -> result<void> {
        if (!current) {
            return {};
        }
        auto summary = current->finalize();
        if (!summary) {
            return unexpected{summary.error()};
        }
        output.batches.push_back(batch_descriptor{summary.value().batch_number,
                                                  summary.value().file_count,
                                                  summary.value().byte_count,
                                                  current->location()});
        current.reset();
        return {};
    };

    path_sink write = [&](transfer_path&& record) -> result<void> {
        auto bytes = record.bytes.value_or(0);
        if (current && current->file_count() > 0 &&
            (current->file_count() + 1 > context.max_files_per_batch ||
             current->byte_count() + bytes > context.max_bytes_per_batch)) {
            BT_LOG_DEBUG(log_category::batch,
                         "Batch " + std::to_string(current->batch_number()) +
                             " full, starting batch " + std::to_string(next_number));
            if (auto closed = close_current(); !closed) {
                return closed;
            }
        }
        if (!current) {
            auto created = batch_writer::create(
                batch_directory / batch_file::file_name(context.batch_file_prefix, next_number),
                next_number, context.live_sync);
            if (!created) {
                return unexpected{created.error()};
            }
            current = std::move(created).value();
            ++next_number;
        }
        return current->append(record);
    };

    auto walked = enumerate_lazy(context, write, token);
    auto closed = close_current();
    if (!walked) {
        return unexpected{walked.error()};
    }
    if (!closed) {
        return unexpected{closed.error()};
    }

    output.total_files = walked.value().total_files;
    output.total_bytes = walked.value().total_bytes;
    output.total_directories = walked.value().total_directories;
    output.elapsed = walked.value().elapsed;
    output.error_paths = std::move(walked.value().error_paths);

    BT_LOG_INFO(log_category::batch, "Serialized " + std::to_string(output.total_files) +
                                         " files into " +
                                         std::to_string(output.batches.size()) + " batches");
    return output;
}

}  // namespace kcenon::bulk_transfer
