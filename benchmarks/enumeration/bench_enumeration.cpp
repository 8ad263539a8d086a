/**
 * @file bench_enumeration.cpp
 * @brief Benchmarks for tree enumeration and batch serialization
 */

#include <benchmark/benchmark.h>

#include <kcenon/bulk_transfer/enumeration/batch_file.h>
#include <kcenon/bulk_transfer/enumeration/path_enumerator.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <string>

namespace kcenon::bulk_transfer::benchmark {

/**
 * @brief Files per second for a local walk
 *
 * Args: directory count, file parallelism
 */
static void BM_Enumerate_LocalTree(::benchmark::State& state) {
    const auto directories = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t files_per_directory = 100;

    temp_file_manager temp_files;
    auto root = temp_files.create_tree("tree", directories, files_per_directory, 16);

    path_enumerator enumerator(std::make_shared<local_path_source>());
    enumeration_context context;
    context.search_paths = {root.string()};
    context.target_path = "/archive";
    context.max_directory_parallelism = static_cast<std::size_t>(state.range(1));
    context.max_file_parallelism = static_cast<std::size_t>(state.range(1));

    for (auto _ : state) {
        auto result = enumerator.enumerate(context);
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(result.value().paths.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(directories * files_per_directory) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Walk plus batch file output
 *
 * Args: files per batch
 */
static void BM_Serialize_Batches(::benchmark::State& state) {
    constexpr std::size_t directories = 20;
    constexpr std::size_t files_per_directory = 100;

    temp_file_manager temp_files;
    auto root = temp_files.create_tree("tree", directories, files_per_directory, 16);

    path_enumerator enumerator(std::make_shared<local_path_source>());
    enumeration_context context;
    context.search_paths = {root.string()};
    context.target_path = "/archive";
    context.max_files_per_batch = static_cast<uint64_t>(state.range(0));

    uint32_t run = 0;
    std::size_t batches = 0;
    for (auto _ : state) {
        auto output = temp_files.base_dir() / ("batches" + std::to_string(run++));
        auto result = enumerator.serialize(output, context);
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        batches = result.value().batches.size();
    }

    state.SetItemsProcessed(static_cast<int64_t>(directories * files_per_directory) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["batches"] = static_cast<double>(batches);
}

/**
 * @brief Record encode and decode cost
 */
static void BM_BatchFile_Codec(::benchmark::State& state) {
    transfer_path path("/data/incoming/projects/2024/quarterly report \"final\".xlsx",
                       "/mnt/share/archive/projects/2024");
    path.bytes = 123456789;
    path.direction = transfer_direction::upload;

    for (auto _ : state) {
        auto line = batch_file::encode(path);
        auto decoded = batch_file::decode(line);
        ::benchmark::DoNotOptimize(decoded);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Enumerate_LocalTree)
    ->Args({10, 1})
    ->Args({50, 1})
    ->Args({50, 4})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Serialize_Batches)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_BatchFile_Codec);

}  // namespace kcenon::bulk_transfer::benchmark
