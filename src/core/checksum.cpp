/**
 * @file checksum.cpp
 * @brief SHA-256 implementation using OpenSSL EVP
 */

#include "kcenon/bulk_transfer/core/checksum.h"

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

namespace kcenon::bulk_transfer {

namespace {

constexpr std::size_t read_block_size = 1024 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto new_sha256_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

auto finish(EVP_MD_CTX* ctx) -> std::string {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        return {};
    }
    return to_hex(digest, length);
}

}  // namespace

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    auto ctx = new_sha256_context();
    if (!ctx) {
        return {};
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish(ctx.get());
}

auto checksum::sha256_file(const std::filesystem::path& path,
                           const cancellation_token& token) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(error_code::path_read_error,
                          "cannot open '" + path.string() + "' for hashing");
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return make_error(error_code::transport_error, "SHA-256 context unavailable");
    }

    std::vector<char> buffer(read_block_size);
    while (file) {
        if (token.is_canceled()) {
            return make_error(error_code::operation_canceled);
        }
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return make_error(error_code::transport_error, "SHA-256 update failed");
        }
    }
    if (file.bad()) {
        return make_error(error_code::path_read_error,
                          "read failed while hashing '" + path.string() + "'");
    }

    auto digest = finish(ctx.get());
    if (digest.empty()) {
        return make_error(error_code::transport_error, "SHA-256 finalization failed");
    }
    return digest;
}

auto checksum::verify_same_content(const std::filesystem::path& source,
                                   const std::filesystem::path& target,
                                   const cancellation_token& token) -> result<void> {
    auto source_hash = sha256_file(source, token);
    if (!source_hash) {
        return unexpected{source_hash.error()};
    }
    auto target_hash = sha256_file(target, token);
    if (!target_hash) {
        return unexpected{target_hash.error()};
    }
    if (source_hash.value() != target_hash.value()) {
        return make_error(error_code::integrity_mismatch,
                          "SHA-256 of '" + target.string() + "' differs from source");
    }
    return {};
}

}  // namespace kcenon::bulk_transfer
