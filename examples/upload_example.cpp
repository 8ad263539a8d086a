/**
 * @file upload_example.cpp
 * @brief Copy a list of files to a share with progress and issue reporting
 *
 * This example demonstrates:
 * - Building a client over the file share transport
 * - Receiving statistics and path issues through a transfer context
 * - Limiting the data rate
 * - Reading the final transfer result
 */

#include <kcenon/bulk_transfer/bulk_transfer.h>

#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::bulk_transfer;

namespace {

cancellation_source g_cancel;

void on_signal(int) {
    g_cancel.cancel();
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_statistics(const transfer_statistics& stats) {
    std::cout << "\r" << std::fixed << std::setprecision(1) << stats.progress << "%"
              << " | Files: " << stats.total_transferred_files << "/"
              << stats.total_requested_files;
    if (stats.total_failed_files > 0) {
        std::cout << " (failed: " << stats.total_failed_files << ")";
    }
    std::cout << " | " << std::setprecision(2) << stats.transfer_rate_mbps() << " Mbps";
    if (stats.remaining_time) {
        std::cout << " | ETA " << stats.remaining_time->count() / 1000 << "s";
    }
    std::cout << "     " << std::flush;
}

void print_usage(const char* program) {
    std::cout << "Upload Example - Bulk Transfer System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <target> <file1> [file2] ..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -j, --jobs <n>          Parallel transfers (default: 4)" << std::endl;
    std::cout << "  -r, --rate <mbps>       Target data rate in megabits per second" << std::endl;
    std::cout << "  --skip-existing         Leave files already at the target alone" << std::endl;
    std::cout << "  --verify                Compare SHA-256 digests after each copy" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    client_configuration config;
    config.max_job_parallelism = 4;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            config.max_job_parallelism = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-r" || arg == "--rate") {
            if (++i >= argc) {
                std::cerr << "Error: --rate requires an argument" << std::endl;
                return 1;
            }
            config.target_data_rate_mbps = static_cast<uint32_t>(std::stoul(argv[i]));
        } else if (arg == "--skip-existing") {
            config.overwrite = overwrite_policy::skip_existing;
        } else if (arg == "--verify") {
            config.verify_integrity = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
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

    std::vector<transfer_path> paths;
    for (std::size_t i = 1; i < positional.size(); ++i) {
        paths.emplace_back(positional[i]);
    }

    auto request = transfer_request::for_upload(std::move(paths), positional[0]);
    request.name = "upload example";
    request.context = std::make_shared<transfer_context>(transfer_handlers{
        .on_path_issue =
            [](const path_issue_event& e) {
                std::cout << std::endl
                          << (e.issue.is_error() ? "[ERROR] " : "[WARN] ")
                          << (e.issue.path ? e.issue.path->source_path : std::string("job"))
                          << ": " << e.issue.message << std::endl;
            },
        .on_statistics = [](const statistics_event& e) { print_statistics(e.statistics); },
    });

    std::signal(SIGINT, on_signal);

    auto result = client.transfer(request, g_cancel.token());
    std::cout << std::endl;
    if (!result) {
        std::cerr << "Transfer failed to start: " << result.error().message << std::endl;
        return 1;
    }

    const auto& summary = result.value();
    std::cout << "Status:      " << to_string(summary.status) << std::endl;
    std::cout << "Transferred: " << summary.total_transferred_files << " files, "
              << format_bytes(summary.total_transferred_bytes) << std::endl;
    std::cout << "Failed:      " << summary.total_failed_files << std::endl;
    std::cout << "Retries:     " << summary.retry_count << std::endl;
    std::cout << "Elapsed:     " << summary.elapsed.count() << " ms" << std::endl;

    return summary.is_successful() ? 0 : 2;
}
