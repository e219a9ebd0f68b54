/**
 * @file snapshot.cpp
 * @brief Snapshot JSON encoding, decoding and file persistence.
 *
 * The reader accepts exactly the documents the writer produces: one
 * object whose members are scalars, plus the two reserved arrays.
 * Anything else is rejected rather than approximated.
 *
 * @copyright GPL-2.0-or-later
 */

#include "termattr/snapshot.h"
#include "termattr/control_char.h"
#include "termattr/logging.h"

#include <charconv>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace termattr {

// ─────────────────────────────────────────────────────────────────────────────
// JSON Utilities
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::string json_escape(std::string_view str) {
    std::ostringstream result;

    for (char c : str) {
        switch (c) {
            case '"':  result << "\\\""; break;
            case '\\': result << "\\\\"; break;
            case '\n': result << "\\n"; break;
            case '\r': result << "\\r"; break;
            case '\t': result << "\\t"; break;
            case '\b': result << "\\b"; break;
            case '\f': result << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    result << "\\u"
                           << std::hex << std::setfill('0') << std::setw(4)
                           << static_cast<int>(static_cast<unsigned char>(c))
                           << std::dec;
                } else {
                    result << c;
                }
        }
    }

    return result.str();
}

void append_utf8(std::string& out, unsigned codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

/// Parsed JSON value, restricted to what snapshots contain.
struct JsonNode {
    enum class Kind { Null, Bool, Integer, String, Array };

    Kind kind = Kind::Null;
    bool boolean = false;
    std::int64_t integer = 0;
    std::string string;
    std::vector<JsonNode> items;
};

/// Recursive-descent reader over one JSON document.
class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Result<std::vector<std::pair<std::string, JsonNode>>> read_object() {
        std::vector<std::pair<std::string, JsonNode>> members;

        skip_ws();
        TERMATTR_CHECK(consume('{'), ErrorCode::ParseError, error_at("expected '{'"));

        skip_ws();
        if (consume('}')) {
            return finish(std::move(members));
        }

        while (true) {
            skip_ws();
            auto key = TERMATTR_TRY(read_string());
            skip_ws();
            TERMATTR_CHECK(consume(':'), ErrorCode::ParseError, error_at("expected ':'"));
            auto value = TERMATTR_TRY(read_value(0));
            members.emplace_back(std::move(key), std::move(value));

            skip_ws();
            if (consume(',')) {
                continue;
            }
            TERMATTR_CHECK(consume('}'), ErrorCode::ParseError, error_at("expected ',' or '}'"));
            break;
        }

        return finish(std::move(members));
    }

private:
    static constexpr int kMaxDepth = 4;

    Result<std::vector<std::pair<std::string, JsonNode>>>
    finish(std::vector<std::pair<std::string, JsonNode>> members) {
        skip_ws();
        TERMATTR_CHECK(pos_ == text_.size(), ErrorCode::ParseError,
                       error_at("trailing characters after object"));
        return members;
    }

    Result<JsonNode> read_value(int depth) {
        TERMATTR_CHECK(depth < kMaxDepth, ErrorCode::ParseError, error_at("nesting too deep"));

        skip_ws();
        TERMATTR_CHECK(pos_ < text_.size(), ErrorCode::ParseError, error_at("unexpected end of input"));

        JsonNode node;
        char c = text_[pos_];
        if (c == '"') {
            node.kind = JsonNode::Kind::String;
            node.string = TERMATTR_TRY(read_string());
        } else if (c == '[') {
            node.kind = JsonNode::Kind::Array;
            node.items = TERMATTR_TRY(read_array(depth));
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            node.kind = JsonNode::Kind::Integer;
            node.integer = TERMATTR_TRY(read_integer());
        } else if (consume_literal("true")) {
            node.kind = JsonNode::Kind::Bool;
            node.boolean = true;
        } else if (consume_literal("false")) {
            node.kind = JsonNode::Kind::Bool;
            node.boolean = false;
        } else if (consume_literal("null")) {
            node.kind = JsonNode::Kind::Null;
        } else {
            return make_error(ErrorCode::ParseError, error_at("unexpected character"));
        }
        return node;
    }

    Result<std::vector<JsonNode>> read_array(int depth) {
        std::vector<JsonNode> items;
        consume('[');

        skip_ws();
        if (consume(']')) {
            return items;
        }

        while (true) {
            items.push_back(TERMATTR_TRY(read_value(depth + 1)));
            skip_ws();
            if (consume(',')) {
                continue;
            }
            TERMATTR_CHECK(consume(']'), ErrorCode::ParseError, error_at("expected ',' or ']'"));
            return items;
        }
    }

    Result<std::string> read_string() {
        TERMATTR_CHECK(consume('"'), ErrorCode::ParseError, error_at("expected string"));

        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }

            TERMATTR_CHECK(pos_ < text_.size(), ErrorCode::ParseError, error_at("unterminated escape"));
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'u': {
                    TERMATTR_CHECK(pos_ + 4 <= text_.size(), ErrorCode::ParseError,
                                   error_at("truncated \\u escape"));
                    unsigned codepoint = 0;
                    auto digits = text_.substr(pos_, 4);
                    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + 4, codepoint, 16);
                    TERMATTR_CHECK(ec == std::errc{} && ptr == digits.data() + 4, ErrorCode::ParseError,
                                   error_at("invalid \\u escape"));
                    pos_ += 4;
                    append_utf8(out, codepoint);
                    break;
                }
                default:
                    return make_error(ErrorCode::ParseError, error_at("invalid escape"));
            }
        }
        return make_error(ErrorCode::ParseError, error_at("unterminated string"));
    }

    Result<std::int64_t> read_integer() {
        std::int64_t value = 0;
        const char* begin = text_.data() + pos_;
        const char* end = text_.data() + text_.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        TERMATTR_CHECK(ec == std::errc{}, ErrorCode::ParseError, error_at("invalid integer"));
        pos_ += static_cast<std::size_t>(ptr - begin);

        TERMATTR_CHECK(pos_ >= text_.size() ||
                       (text_[pos_] != '.' && text_[pos_] != 'e' && text_[pos_] != 'E'),
                       ErrorCode::ParseError, error_at("non-integer number"));
        return value;
    }

    void skip_ws() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r' || text_[pos_] == '\t')) {
            ++pos_;
        }
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_literal(std::string_view literal) {
        if (text_.substr(pos_).starts_with(literal)) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    std::string error_at(const char* what) const {
        return std::string(what) + " at offset " + std::to_string(pos_);
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

template<typename T>
bool fits(std::int64_t value) {
    return value >= 0 && static_cast<std::uint64_t>(value) <= std::numeric_limits<T>::max();
}

/// Decode "_termios": [iflag, oflag, cflag, lflag, ispeed, ospeed, [cc...]].
Result<RawAttributes> decode_attributes(const JsonNode& node) {
    constexpr std::string_view key = kSnapshotAttributesKey;
    TERMATTR_CHECK(node.kind == JsonNode::Kind::Array && node.items.size() == 7,
                   ErrorCode::MalformedSnapshot,
                   std::string(key) + " must be an array of 7 fields");

    std::int64_t word[6] = {};
    for (std::size_t i = 0; i < 6; ++i) {
        const auto& item = node.items[i];
        bool ok = item.kind == JsonNode::Kind::Integer &&
                  (i < 4 ? fits<tcflag_t>(item.integer) : fits<speed_t>(item.integer));
        TERMATTR_CHECK(ok, ErrorCode::MalformedSnapshot,
                       std::string(key) + " field " + std::to_string(i) + " out of range");
        word[i] = item.integer;
    }

    const auto& cc = node.items[6];
    TERMATTR_CHECK(cc.kind == JsonNode::Kind::Array && cc.items.size() == kControlCharCount,
                   ErrorCode::MalformedSnapshot,
                   std::string(key) + " control characters must be an array of " +
                   std::to_string(kControlCharCount) + " bytes");

    RawAttributes raw;
    raw.iflag = static_cast<tcflag_t>(word[0]);
    raw.oflag = static_cast<tcflag_t>(word[1]);
    raw.cflag = static_cast<tcflag_t>(word[2]);
    raw.lflag = static_cast<tcflag_t>(word[3]);
    raw.ispeed = static_cast<speed_t>(word[4]);
    raw.ospeed = static_cast<speed_t>(word[5]);
    for (std::size_t i = 0; i < kControlCharCount; ++i) {
        const auto& item = cc.items[i];
        TERMATTR_CHECK(item.kind == JsonNode::Kind::Integer && fits<cc_t>(item.integer),
                       ErrorCode::MalformedSnapshot,
                       std::string(key) + " control character " + std::to_string(i) + " out of range");
        raw.cc[i] = static_cast<cc_t>(item.integer);
    }
    return raw;
}

/// Decode "_winsize": [rows, cols, xpixel, ypixel] or null.
Result<std::optional<RawWindowSize>> decode_window_size(const JsonNode& node) {
    if (node.kind == JsonNode::Kind::Null) {
        return std::optional<RawWindowSize>{};
    }

    constexpr std::string_view key = kSnapshotWindowSizeKey;
    TERMATTR_CHECK(node.kind == JsonNode::Kind::Array && node.items.size() == 4,
                   ErrorCode::MalformedSnapshot,
                   std::string(key) + " must be null or an array of 4 fields");

    unsigned short field[4] = {};
    for (std::size_t i = 0; i < 4; ++i) {
        const auto& item = node.items[i];
        TERMATTR_CHECK(item.kind == JsonNode::Kind::Integer && fits<unsigned short>(item.integer),
                       ErrorCode::MalformedSnapshot,
                       std::string(key) + " field " + std::to_string(i) + " out of range");
        field[i] = static_cast<unsigned short>(item.integer);
    }
    return std::optional<RawWindowSize>{RawWindowSize{field[0], field[1], field[2], field[3]}};
}

Result<Value> decode_value(const std::string& name, const JsonNode& node) {
    switch (node.kind) {
        case JsonNode::Kind::Null:    return Value{};
        case JsonNode::Kind::Bool:    return Value{node.boolean};
        case JsonNode::Kind::Integer: return Value{node.integer};
        case JsonNode::Kind::String:  return Value{node.string};
        case JsonNode::Kind::Array:   break;
    }
    return make_error(ErrorCode::MalformedSnapshot,
                      "attribute '" + name + "' must hold a scalar value");
}

void write_value(std::ostringstream& oss, const Value& value) {
    switch (value.index()) {
        case 0: oss << "null"; break;
        case 1: oss << (std::get<bool>(value) ? "true" : "false"); break;
        case 2: oss << std::get<std::int64_t>(value); break;
        case 3: oss << '"' << json_escape(std::get<std::string>(value)) << '"'; break;
        case 4:
            oss << '"'
                << json_escape(format_control_char(std::to_integer<cc_t>(std::get<std::byte>(value))))
                << '"';
            break;
        default: oss << "null"; break;
    }
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────────────────────────────────────

const Value* Snapshot::find(std::string_view name) const noexcept {
    for (const auto& [key, value] : values) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

std::string Snapshot::to_json() const {
    std::ostringstream oss;
    oss << "{\n";

    oss << "  \"" << kSnapshotAttributesKey << "\": ";
    if (raw_attributes) {
        const auto& raw = *raw_attributes;
        oss << '[' << raw.iflag << ", " << raw.oflag << ", " << raw.cflag << ", " << raw.lflag
            << ", " << raw.ispeed << ", " << raw.ospeed << ", [";
        for (std::size_t i = 0; i < raw.cc.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << static_cast<unsigned>(raw.cc[i]);
        }
        oss << "]]";
    } else {
        oss << "null";
    }

    oss << ",\n  \"" << kSnapshotWindowSizeKey << "\": ";
    if (raw_window_size) {
        const auto& ws = *raw_window_size;
        oss << '[' << ws.rows << ", " << ws.cols << ", " << ws.xpixel << ", " << ws.ypixel << ']';
    } else {
        oss << "null";
    }

    for (const auto& [name, value] : values) {
        oss << ",\n  \"" << json_escape(name) << "\": ";
        write_value(oss, value);
    }

    oss << "\n}\n";
    return oss.str();
}

Result<Snapshot> Snapshot::from_json(std::string_view text) {
    JsonReader reader(text);
    auto members = TERMATTR_TRY(reader.read_object());

    Snapshot snapshot;
    for (const auto& [name, node] : members) {
        if (name == kSnapshotAttributesKey) {
            // A null raw block reads the same as an absent one.
            if (node.kind != JsonNode::Kind::Null) {
                snapshot.raw_attributes = TERMATTR_TRY(decode_attributes(node));
            }
        } else if (name == kSnapshotWindowSizeKey) {
            snapshot.raw_window_size = TERMATTR_TRY(decode_window_size(node));
        } else {
            snapshot.values.emplace_back(name, TERMATTR_TRY(decode_value(name, node)));
        }
    }
    return snapshot;
}

// ─────────────────────────────────────────────────────────────────────────────
// Files
// ─────────────────────────────────────────────────────────────────────────────

Result<void> save_snapshot_file(const Snapshot& snapshot, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return make_error(ErrorCode::FileError, "cannot open '" + path + "' for writing");
    }

    out << snapshot.to_json();
    out.flush();
    if (!out) {
        return make_error(ErrorCode::FileError, "failed writing '" + path + "'");
    }

    TERMATTR_LOG_DEBUG("SNAPSHOT", "saved %zu attributes to %s", snapshot.values.size(), path.c_str());
    return Ok();
}

Result<Snapshot> load_snapshot_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error(ErrorCode::FileError, "cannot open '" + path + "' for reading");
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return make_error(ErrorCode::FileError, "failed reading '" + path + "'");
    }

    auto snapshot = Snapshot::from_json(contents.str());
    if (snapshot) {
        TERMATTR_LOG_DEBUG("SNAPSHOT", "loaded %zu attributes from %s",
                           snapshot->values.size(), path.c_str());
    }
    return snapshot;
}

} // namespace termattr
