/**
 * @file bench_job_throughput.cpp
 * @brief Benchmarks for job scheduling and file share copy throughput
 *
 * The null transport isolates the job engine: queueing, worker dispatch,
 * statistics and event delivery. The file share runs measure end-to-end
 * copies on the local disk.
 */

#include <benchmark/benchmark.h>

#include <kcenon/bulk_transfer/bulk_transfer.h>

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::bulk_transfer::benchmark {

namespace {

/**
 * @brief Transport that accepts every path without moving data
 */
class null_transport_client : public transport_client {
public:
    [[nodiscard]] auto id() const -> std::string override { return "null"; }

    [[nodiscard]] auto support_check(const cancellation_token&) -> support_result override {
        return {true, {}};
    }

    [[nodiscard]] auto connection_check(const connection_request&, const cancellation_token&)
        -> connection_result override {
        return {true, issue_attributes::connection, {}, 0};
    }

    [[nodiscard]] auto transfer(const transfer_path& path,
                                const transfer_options&,
                                const cancellation_token&) -> transfer_outcome override {
        ++calls_;
        return transfer_outcome::success(path.bytes.value_or(0));
    }

    [[nodiscard]] auto calls() const -> uint64_t { return calls_.load(); }

private:
    std::atomic<uint64_t> calls_{0};
};

auto make_paths(std::size_t count) -> std::vector<transfer_path> {
    std::vector<transfer_path> paths;
    paths.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        transfer_path path("/bench/source/file" + std::to_string(i) + ".bin");
        path.bytes = sizes::tiny_file;
        paths.push_back(std::move(path));
    }
    return paths;
}

class quiet_logging {
public:
    quiet_logging() { get_logger().set_level(log_level::error); }
    ~quiet_logging() { get_logger().set_level(log_level::info); }
};

}  // namespace

/**
 * @brief Paths per second through the job engine
 *
 * Args: path count, parallelism
 */
static void BM_Job_NullTransport(::benchmark::State& state) {
    quiet_logging quiet;
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto parallelism = static_cast<std::size_t>(state.range(1));

    client_configuration config;
    config.max_job_parallelism = parallelism;
    auto client = std::make_shared<null_transport_client>();
    auto paths = make_paths(count);

    for (auto _ : state) {
        auto request = transfer_request::for_upload(paths, "/bench/target");
        auto created = transfer_job::create(request, client, nullptr, config);
        if (!created) {
            state.SkipWithError(created.error().message.c_str());
            return;
        }
        auto job = std::move(created).value();
        for (const auto& path : paths) {
            if (!job->add_path(path)) {
                state.SkipWithError("add_path failed");
                return;
            }
        }
        auto result = job->complete();
        if (!result || !result.value().is_successful()) {
            state.SkipWithError("job did not succeed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value().total_transferred_files);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["calls"] = static_cast<double>(client->calls());
}

/**
 * @brief Copy throughput of the file share transport
 *
 * Args: file count, file size
 */
static void BM_Job_FileShareCopy(::benchmark::State& state) {
    quiet_logging quiet;
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto file_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto source = temp_files.create_tree("source", 1, count, file_size);

    std::vector<transfer_path> paths;
    for (std::size_t i = 0; i < count; ++i) {
        paths.emplace_back((source / "dir0" / ("file" + std::to_string(i) + ".bin")).string());
    }

    client_configuration config;
    config.max_job_parallelism = 4;
    auto built = bulk_transfer_client::builder()
                     .with_configuration(config)
                     .with_transport("file_share")
                     .build();
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    auto client = std::move(built).value();

    uint32_t run = 0;
    for (auto _ : state) {
        auto target = temp_files.base_dir() / ("target" + std::to_string(run++));
        auto result = client.transfer(transfer_request::for_upload(paths, target.string()));
        if (!result || !result.value().is_successful()) {
            state.SkipWithError("copy did not succeed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(count * file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(count * file_size) + " per run");
}

BENCHMARK(BM_Job_NullTransport)
    ->Args({1000, 1})
    ->Args({1000, 4})
    ->Args({10000, 8})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Job_FileShareCopy)
    ->Args({100, static_cast<int64_t>(sizes::small_file)})
    ->Args({4, static_cast<int64_t>(sizes::medium_file)})
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(3);

}  // namespace kcenon::bulk_transfer::benchmark
