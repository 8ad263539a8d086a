/**
 * @file batch_upload_example.cpp
 * @brief Enumerate a directory tree into batch files, then transfer each batch
 *
 * Large trees are split into batches so each job stays bounded. The batch
 * files survive the run and can be fed to a later transfer.
 */

#include <kcenon/bulk_transfer/bulk_transfer.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::bulk_transfer;

namespace {

void print_usage(const char* program) {
    std::cout << "Batch Upload Example - Bulk Transfer System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source-dir> <target-dir>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -b, --batch-files <n>   Files per batch (default: 1000)" << std::endl;
    std::cout << "  -o, --output <dir>      Batch file directory (default: ./batches)" << std::endl;
    std::cout << "  -i, --include <glob>    Only files matching the pattern" << std::endl;
    std::cout << "  --flat                  Do not mirror source folders" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    client_configuration config;
    config.max_job_parallelism = 4;
    config.max_files_per_batch = 1000;
    config.max_file_parallelism = 2;
    std::filesystem::path batch_dir = "batches";
    std::vector<std::string> includes;
    bool flat = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-b" || arg == "--batch-files") {
            if (++i >= argc) {
                std::cerr << "Error: --batch-files requires an argument" << std::endl;
                return 1;
            }
            config.max_files_per_batch = std::stoull(argv[i]);
        } else if (arg == "-o" || arg == "--output") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires an argument" << std::endl;
                return 1;
            }
            batch_dir = argv[i];
        } else if (arg == "-i" || arg == "--include") {
            if (++i >= argc) {
                std::cerr << "Error: --include requires an argument" << std::endl;
                return 1;
            }
            includes.emplace_back(argv[i]);
        } else if (arg == "--flat") {
            flat = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    auto client_result = bulk_transfer_client::builder()
                             .with_configuration(config)
                             .with_transport("file_share")
                             .build();
    if (!client_result) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto client = std::move(client_result).value();

    auto enumerator = client.create_enumerator(enumeration_mode::local);
    if (!enumerator) {
        std::cerr << "Failed to create enumerator: " << enumerator.error().message << std::endl;
        return 1;
    }

    auto context = client.enumeration_defaults();
    context.search_paths = {positional[0]};
    context.target_path = positional[1];
    context.include_patterns = includes;
    context.preserve_folders = !flat;
    context.on_path_error = [](const enumeration_path_error& e) {
        std::cerr << "[SKIPPED] " << e.path << ": " << e.message << std::endl;
    };

    auto serialized = enumerator.value().serialize(batch_dir, context);
    if (!serialized) {
        std::cerr << "Enumeration failed: " << serialized.error().message << std::endl;
        return 1;
    }
    std::cout << "Enumerated " << serialized.value().total_files << " files ("
              << serialized.value().total_bytes << " bytes) into "
              << serialized.value().batches.size() << " batches" << std::endl;

    auto request = transfer_request::for_upload_job(positional[1]);
    request.name = "batch upload";
    auto results = client.transfer_batches(serialized.value().batches, request);
    if (!results) {
        std::cerr << "Batch run failed: " << results.error().message << std::endl;
        return 1;
    }

    bool all_ok = true;
    for (const auto& result : results.value()) {
        std::cout << result.name << ": " << to_string(result.status) << ", "
                  << result.total_transferred_files << " transferred, "
                  << result.total_failed_files << " failed" << std::endl;
        all_ok = all_ok && result.is_successful();
    }
    return all_ok ? 0 : 2;
}
