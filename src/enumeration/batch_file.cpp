/**
 * @file batch_file.cpp
 * @brief Batch file writer and reader
 */

#include "kcenon/bulk_transfer/enumeration/batch_file.h"

#include <cctype>
#include <cstdio>
#include <map>
#include <optional>
#include <sstream>

#include "kcenon/bulk_transfer/core/logging.h"

namespace kcenon::bulk_transfer {

namespace {

/**
 * @brief Scalar or flat object value read from a batch record
 */
struct json_field {
    enum class kind { string, number, boolean, null, object };

    kind type = kind::null;
    std::string text;
    bool flag = false;
    std::map<std::string, std::string> members;
};

using json_object = std::map<std::string, json_field>;

auto append_utf8(std::string& out, uint32_t code_point) -> void {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

/**
 * @brief Reader for the JSON subset batch files use
 *
 * Objects hold strings, integers, booleans, null, and one level of nested
 * objects whose values are strings.
 */
class json_scanner {
public:
    explicit json_scanner(std::string_view input) : input_(input) {}

    auto parse_object(bool nested = false) -> std::optional<json_object> {
        json_object result;
        skip_whitespace();
        if (!consume('{')) {
            return std::nullopt;
        }
        skip_whitespace();
        if (consume('}')) {
            return result;
        }
        while (true) {
            skip_whitespace();
            auto key = parse_string();
            if (!key) {
                return std::nullopt;
            }
            skip_whitespace();
            if (!consume(':')) {
                return std::nullopt;
            }
            skip_whitespace();
            auto value = parse_value(nested);
            if (!value) {
                return std::nullopt;
            }
            result[*key] = std::move(*value);
            skip_whitespace();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return result;
            }
            return std::nullopt;
        }
    }

private:
    auto parse_value(bool nested) -> std::optional<json_field> {
        json_field field;
        if (pos_ >= input_.size()) {
            return std::nullopt;
        }
        char c = input_[pos_];
        if (c == '"') {
            auto text = parse_string();
            if (!text) {
                return std::nullopt;
            }
            field.type = json_field::kind::string;
            field.text = std::move(*text);
            return field;
        }
        if (c == '{') {
            if (nested) {
                return std::nullopt;
            }
            auto object = parse_object(true);
            if (!object) {
                return std::nullopt;
            }
            field.type = json_field::kind::object;
            for (auto& [key, member] : *object) {
                if (member.type != json_field::kind::string) {
                    return std::nullopt;
                }
                field.members[key] = std::move(member.text);
            }
            return field;
        }
        if (literal("true")) {
            field.type = json_field::kind::boolean;
            field.flag = true;
            return field;
        }
        if (literal("false")) {
            field.type = json_field::kind::boolean;
            return field;
        }
        if (literal("null")) {
            return field;
        }

        auto start = pos_;
        while (pos_ < input_.size() &&
               (std::isdigit(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '-' ||
                input_[pos_] == '+' || input_[pos_] == '.' || input_[pos_] == 'e' ||
                input_[pos_] == 'E')) {
            ++pos_;
        }
        if (start == pos_) {
            return std::nullopt;
        }
        field.type = json_field::kind::number;
        field.text = std::string(input_.substr(start, pos_ - start));
        return field;
    }

    auto parse_string() -> std::optional<std::string> {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < input_.size()) {
            char c = input_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= input_.size()) {
                return std::nullopt;
            }
            char escaped = input_[pos_++];
            switch (escaped) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > input_.size()) {
                        return std::nullopt;
                    }
                    uint32_t code_point = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = input_[pos_++];
                        code_point <<= 4;
                        if (h >= '0' && h <= '9') {
                            code_point |= static_cast<uint32_t>(h - '0');
                        } else if (h >= 'a' && h <= 'f') {
                            code_point |= static_cast<uint32_t>(h - 'a' + 10);
                        } else if (h >= 'A' && h <= 'F') {
                            code_point |= static_cast<uint32_t>(h - 'A' + 10);
                        } else {
                            return std::nullopt;
                        }
                    }
                    append_utf8(out, code_point);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    auto literal(std::string_view word) -> bool {
        if (input_.substr(pos_, word.size()) == word) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    auto consume(char c) -> bool {
        if (pos_ < input_.size() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            ++pos_;
        }
    }

    std::string_view input_;
    std::size_t pos_ = 0;
};

auto format_error(const std::string& message) -> unexpected {
    return make_error(error_code::batch_format_error, message);
}

auto get_unsigned(const json_object& object, const std::string& key) -> std::optional<uint64_t> {
    auto it = object.find(key);
    if (it == object.end() || it->second.type != json_field::kind::number) {
        return std::nullopt;
    }
    try {
        return std::stoull(it->second.text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto get_string(const json_object& object, const std::string& key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || it->second.type != json_field::kind::string) {
        return std::nullopt;
    }
    return it->second.text;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// batch_file
// ============================================================================

auto batch_file::encode(const transfer_path& path) -> std::string {
    std::ostringstream oss;
    oss << "{\"source_path\": \"" << detail::escape_json(path.source_path) << "\"";
    if (path.target_path) {
        oss << ", \"target_path\": \"" << detail::escape_json(*path.target_path) << "\"";
    }
    if (path.target_file_name) {
        oss << ", \"target_file_name\": \"" << detail::escape_json(*path.target_file_name)
            << "\"";
    }
    if (path.direction) {
        oss << ", \"direction\": \"" << to_string(*path.direction) << "\"";
    }
    if (path.order) {
        oss << ", \"order\": " << *path.order;
    }
    if (path.bytes) {
        oss << ", \"bytes\": " << *path.bytes;
    }
    if (path.tag) {
        oss << ", \"tag\": \"" << detail::escape_json(*path.tag) << "\"";
    }
    if (!path.metadata.empty()) {
        oss << ", \"metadata\": {";
        bool first = true;
        for (const auto& [key, value] : path.metadata) {
            oss << (first ? "" : ", ") << "\"" << detail::escape_json(key) << "\": \""
                << detail::escape_json(value) << "\"";
            first = false;
        }
        oss << "}";
    }
    oss << "}";
    return oss.str();
}

auto batch_file::decode(std::string_view line) -> result<transfer_path> {
    json_scanner scanner(line);
    auto object = scanner.parse_object();
    if (!object) {
        return format_error("malformed path record: " + std::string(line.substr(0, 80)));
    }

    auto source = get_string(*object, "source_path");
    if (!source || source->empty()) {
        return format_error("path record without source_path");
    }

    transfer_path path(std::move(*source));
    path.target_path = get_string(*object, "target_path");
    path.target_file_name = get_string(*object, "target_file_name");
    path.tag = get_string(*object, "tag");
    path.bytes = get_unsigned(*object, "bytes");

    if (auto direction = get_string(*object, "direction")) {
        path.direction = parse_direction(*direction);
        if (!path.direction) {
            return format_error("unknown direction: " + *direction);
        }
    }

    if (auto it = object->find("order"); it != object->end()) {
        try {
            path.order = std::stoll(it->second.text);
        } catch (const std::exception&) {
            return format_error("invalid order: " + it->second.text);
        }
    }

    if (auto it = object->find("metadata"); it != object->end()) {
        if (it->second.type != json_field::kind::object) {
            return format_error("metadata must be an object");
        }
        path.metadata = it->second.members;
    }

    return path;
}

auto batch_file::read(const std::filesystem::path& file) -> result<batch_contents> {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return make_error(error_code::batch_read_error, "cannot open " + file.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return make_error(error_code::batch_read_error, "cannot read " + file.string());
    }
    const std::string content = buffer.str();

    auto paths_pos = content.find("\"paths\": [");
    if (paths_pos == std::string::npos) {
        return format_error(file.string() + " has no paths array");
    }

    batch_contents contents;
    {
        const std::string header_text = content.substr(0, paths_pos) + "\"end\": null}";
        json_scanner header_scanner(header_text);
        auto header = header_scanner.parse_object();
        if (!header) {
            return format_error(file.string() + " has a malformed header");
        }
        auto version = get_unsigned(*header, "version");
        if (!version || *version != static_cast<uint64_t>(format_version)) {
            return format_error(file.string() + " has an unsupported version");
        }
        auto number = get_unsigned(*header, "batch_number");
        if (!number) {
            return format_error(file.string() + " has no batch_number");
        }
        contents.summary.batch_number = static_cast<uint32_t>(*number);
    }

    auto line_start = content.find('\n', paths_pos);
    std::size_t array_end = std::string::npos;
    while (line_start != std::string::npos && line_start + 1 < content.size()) {
        ++line_start;
        auto line_end = content.find('\n', line_start);
        auto line = trim(std::string_view(content).substr(
            line_start, (line_end == std::string::npos ? content.size() : line_end) - line_start));

        if (!line.empty() && line.front() == ']') {
            array_end = line_start;
            break;
        }
        if (!line.empty() && line.back() == ',') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            auto record = decode(line);
            if (!record) {
                return unexpected{record.error()};
            }
            contents.paths.push_back(std::move(record).value());
        }
        line_start = line_end;
    }
    if (array_end == std::string::npos) {
        return format_error(file.string() + " has an unterminated paths array");
    }

    auto summary_pos = content.find("\"summary\":", array_end);
    if (summary_pos == std::string::npos) {
        return format_error(file.string() + " has no summary");
    }
    json_scanner summary_scanner(std::string_view(content).substr(summary_pos + 10));
    auto summary = summary_scanner.parse_object();
    if (!summary) {
        return format_error(file.string() + " has a malformed summary");
    }

    auto files = get_unsigned(*summary, "file_count");
    auto bytes = get_unsigned(*summary, "byte_count");
    if (!files || !bytes) {
        return format_error(file.string() + " summary lacks counts");
    }
    contents.summary.file_count = *files;
    contents.summary.byte_count = *bytes;
    if (auto it = summary->find("complete"); it != summary->end()) {
        contents.summary.complete = it->second.flag;
    }

    if (contents.summary.file_count != contents.paths.size()) {
        return format_error(file.string() + " summary count " + std::to_string(*files) +
                            " does not match " + std::to_string(contents.paths.size()) +
                            " records");
    }
    return contents;
}

auto batch_file::file_name(std::string_view prefix, uint32_t batch_number) -> std::string {
    char number[16];
    std::snprintf(number, sizeof(number), "%06u", batch_number);
    return std::string(prefix) + "_" + number + ".json";
}

// ============================================================================
// batch_writer
// ============================================================================

batch_writer::batch_writer(std::filesystem::path file, uint32_t batch_number, bool live_sync)
    : file_(std::move(file)), live_sync_(live_sync) {
    summary_.batch_number = batch_number;
}

batch_writer::~batch_writer() {
    if (!finalized_ && out_.is_open()) {
        out_.close();
    }
}

auto batch_writer::create(const std::filesystem::path& file, uint32_t batch_number, bool live_sync)
    -> result<std::unique_ptr<batch_writer>> {
    std::unique_ptr<batch_writer> writer(new batch_writer(file, batch_number, live_sync));

    writer->out_.open(file, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!writer->out_) {
        return make_error(error_code::batch_write_error, "cannot create " + file.string());
    }

    writer->out_ << "{\n"
                 << "  \"version\": " << batch_file::format_version << ",\n"
                 << "  \"batch_number\": " << batch_number << ",\n"
                 << "  \"paths\": [\n";
    writer->records_end_ = writer->out_.tellp();

    if (live_sync) {
        if (auto written = writer->write_trailer(); !written) {
            return unexpected{written.error()};
        }
    }
    if (!writer->out_) {
        return make_error(error_code::batch_write_error, "cannot write " + file.string());
    }
    return std::move(writer);
}

auto batch_writer::write_trailer() -> result<void> {
    out_.seekp(records_end_);
    out_ << "\n  ],\n"
         << "  \"summary\": {\"file_count\": " << summary_.file_count
         << ", \"byte_count\": " << summary_.byte_count
         << ", \"complete\": " << (summary_.complete ? "true" : "false") << "}\n"
         << "}\n";
    out_.flush();
    if (!out_) {
        return make_error(error_code::batch_write_error,
                          "cannot write summary of " + file_.string());
    }
    return {};
}

auto batch_writer::append(const transfer_path& path) -> result<void> {
    if (finalized_) {
        return make_error(error_code::invalid_state, file_.string() + " is finalized");
    }

    out_.seekp(records_end_);
    out_ << (summary_.file_count == 0 ? "    " : ",\n    ") << batch_file::encode(path);
    if (!out_) {
        return make_error(error_code::batch_write_error, "cannot append to " + file_.string());
    }
    records_end_ = out_.tellp();

    ++summary_.file_count;
    summary_.byte_count += path.bytes.value_or(0);

    if (live_sync_) {
        return write_trailer();
    }
    return {};
}

auto batch_writer::finalize() -> result<batch_summary> {
    if (finalized_) {
        return summary_;
    }
    summary_.complete = true;
    if (auto written = write_trailer(); !written) {
        return unexpected{written.error()};
    }
    auto end = out_.tellp();
    out_.close();
    finalized_ = true;

    // A live-synced trailer can be longer than the final one.
    std::error_code ec;
    std::filesystem::resize_file(file_, static_cast<uintmax_t>(end), ec);
    if (ec) {
        return make_error(error_code::batch_write_error,
                          "cannot truncate " + file_.string() + ": " + ec.message());
    }

    BT_LOG_DEBUG(log_category::batch,
                 "Batch " + std::to_string(summary_.batch_number) + " finalized with " +
                     std::to_string(summary_.file_count) + " files");
    return summary_;
}

}  // namespace kcenon::bulk_transfer
