/**
 * @file path_record.cpp
 * @brief Path resolution helpers
 */

#include "kcenon/bulk_transfer/core/path_record.h"

namespace kcenon::bulk_transfer {

namespace {

auto separator_for(std::string_view path) -> char {
    // UNC and drive-letter paths keep their native separator.
    if (path.find('\\') != std::string_view::npos &&
        path.find('/') == std::string_view::npos) {
        return '\\';
    }
    return '/';
}

auto is_separator(char c) -> bool { return c == '/' || c == '\\'; }

}  // namespace

auto file_name_of(std::string_view path) -> std::string {
    while (!path.empty() && is_separator(path.back())) {
        path.remove_suffix(1);
    }
    auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(pos + 1));
}

auto join_path(std::string_view directory, std::string_view component) -> std::string {
    if (directory.empty()) {
        return std::string(component);
    }
    if (component.empty()) {
        return std::string(directory);
    }

    std::string joined(directory);
    char sep = separator_for(directory);
    while (!component.empty() && is_separator(component.front())) {
        component.remove_prefix(1);
    }
    if (!is_separator(joined.back())) {
        joined += sep;
    }
    joined += component;
    return joined;
}

auto transfer_path::target_full_path() const -> std::string {
    auto name = target_file_name.value_or(file_name_of(source_path));
    return join_path(target_path.value_or(std::string{}), name);
}

auto resolve_path(transfer_path path, const path_defaults& defaults)
    -> result<transfer_path> {
    if (path.source_path.empty()) {
        return make_error(error_code::invalid_argument, "source path is empty");
    }

    if (defaults.source_path_resolver) {
        path.source_path = defaults.source_path_resolver(path.source_path);
        if (path.source_path.empty()) {
            return make_error(error_code::invalid_argument,
                              "source path resolver returned an empty path");
        }
    }

    if (!path.direction) {
        path.direction = defaults.direction;
    }

    std::string target = path.target_path.value_or(defaults.target_path);
    if (defaults.target_path_resolver) {
        target = defaults.target_path_resolver(target);
    }
    if (target.empty()) {
        return make_error(error_code::missing_target_path,
                          "no target path for '" + path.source_path + "'");
    }
    path.target_path = std::move(target);

    if (!path.target_file_name || path.target_file_name->empty()) {
        auto name = file_name_of(path.source_path);
        if (name.empty()) {
            return make_error(error_code::bad_path,
                              "cannot derive a file name from '" + path.source_path + "'");
        }
        path.target_file_name = std::move(name);
    }

    return path;
}

}  // namespace kcenon::bulk_transfer
