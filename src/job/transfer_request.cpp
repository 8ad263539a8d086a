/**
 * @file transfer_request.cpp
 * @brief Request factories and correlation id generation
 */

#include "kcenon/bulk_transfer/job/transfer_request.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::bulk_transfer {

auto generate_correlation_id() -> std::string {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, 16> bytes{};
    uint64_t high = dis(gen);
    uint64_t low = dis(gen);
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((high >> (i * 8)) & 0xFF);
        bytes[i + 8] = static_cast<uint8_t>((low >> (i * 8)) & 0xFF);
    }

    // Version 4, RFC 4122 variant
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

namespace {

auto make_request(transfer_direction direction,
                  std::vector<transfer_path> paths,
                  std::string target_path) -> transfer_request {
    transfer_request request;
    request.direction = direction;
    request.paths = std::move(paths);
    request.target_path = std::move(target_path);
    request.client_request_id = generate_correlation_id();
    return request;
}

}  // namespace

auto transfer_request::for_upload(std::vector<transfer_path> paths, std::string target_path)
    -> transfer_request {
    return make_request(transfer_direction::upload, std::move(paths), std::move(target_path));
}

auto transfer_request::for_download(std::vector<transfer_path> paths, std::string target_path)
    -> transfer_request {
    return make_request(transfer_direction::download, std::move(paths), std::move(target_path));
}

auto transfer_request::for_upload_job(std::string target_path) -> transfer_request {
    return make_request(transfer_direction::upload, {}, std::move(target_path));
}

auto transfer_request::for_download_job(std::string target_path) -> transfer_request {
    return make_request(transfer_direction::download, {}, std::move(target_path));
}

auto transfer_request::defaults() const -> path_defaults {
    path_defaults result;
    result.direction = direction;
    result.target_path = target_path;
    result.source_path_resolver = source_path_resolver;
    result.target_path_resolver = target_path_resolver;
    return result;
}

auto transfer_result::error_count() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        issues.begin(), issues.end(), [](const transfer_issue& i) { return i.is_error(); }));
}

auto transfer_result::warning_count() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        issues.begin(), issues.end(), [](const transfer_issue& i) { return i.is_warning(); }));
}

}  // namespace kcenon::bulk_transfer
