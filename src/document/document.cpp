#include "sblint/document.hpp"

#include <cstdint>
#include <limits>

namespace sblint {

namespace {

// Deeper documents are rejected before any recursive walk can see them
constexpr std::size_t kMaxNestingDepth = 128;

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool read_hex4(const std::string& s, std::size_t pos, std::uint32_t& value) {
    if (pos + 4 > s.size()) {
        return false;
    }
    value = 0;
    for (std::size_t k = pos; k < pos + 4; ++k) {
        char c = s[k];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<std::uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<std::uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<std::uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

// Decodes the escape whose letter is at s[i] into out. Returns the index of
// the last character consumed.
std::size_t decode_escape(const std::string& s, std::size_t i, std::string& out) {
    switch (s[i]) {
        case 'b': out += '\b'; return i;
        case 'f': out += '\f'; return i;
        case 'n': out += '\n'; return i;
        case 'r': out += '\r'; return i;
        case 't': out += '\t'; return i;
        case 'u': break;
        default: out += s[i]; return i;
    }

    std::uint32_t cp = 0;
    if (!read_hex4(s, i + 1, cp)) {
        out += 'u';
        return i;
    }
    i += 4;

    // Surrogate pair
    std::uint32_t low = 0;
    if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < s.size() && s[i + 1] == '\\' &&
        s[i + 2] == 'u' && read_hex4(s, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        i += 6;
    }
    append_utf8(out, cp);
    return i;
}

// SAX consumer building Value trees. Unlike the DOM parser it never merges
// repeated keys, which the validator must see.
class DocumentBuilder : public nlohmann::json_sax<nlohmann::json> {
public:
    bool null() override { return add(Value::null()); }

    bool boolean(bool val) override { return add(Value::boolean(val)); }

    bool number_integer(number_integer_t val) override {
        return add(Value::integer(static_cast<std::int64_t>(val)));
    }

    bool number_unsigned(number_unsigned_t val) override {
        if (val > static_cast<number_unsigned_t>(std::numeric_limits<std::int64_t>::max())) {
            return add(Value::floating(static_cast<double>(val)));
        }
        return add(Value::integer(static_cast<std::int64_t>(val)));
    }

    bool number_float(number_float_t val, const string_t& /*s*/) override {
        return add(Value::floating(val));
    }

    bool string(string_t& val) override { return add(Value::string(val)); }

    bool binary(binary_t& /*val*/) override { return add(Value::null()); }

    bool start_object(std::size_t /*elements*/) override {
        if (!enter()) return false;
        stack_.push_back(Frame{Value::mapping(), {}});
        return true;
    }

    bool key(string_t& val) override {
        stack_.back().pending_key = val;
        return true;
    }

    bool end_object() override { return close(); }

    bool start_array(std::size_t /*elements*/) override {
        if (!enter()) return false;
        stack_.push_back(Frame{Value::sequence(), {}});
        return true;
    }

    bool end_array() override { return close(); }

    bool parse_error(std::size_t /*position*/, const std::string& /*last_token*/,
                     const nlohmann::json::exception& ex) override {
        error_ = ex.what();
        return false;
    }

    Value& root() { return root_; }
    const std::string& error() const { return error_; }

private:
    struct Frame {
        Value value;
        std::string pending_key;
    };

    bool enter() {
        if (stack_.size() >= kMaxNestingDepth) {
            error_ = "document nested too deeply (limit " +
                     std::to_string(kMaxNestingDepth) + ")";
            return false;
        }
        return true;
    }

    bool add(Value v) {
        if (stack_.empty()) {
            root_ = std::move(v);
            return true;
        }
        Frame& top = stack_.back();
        if (top.value.is_mapping()) {
            top.value.add_entry(std::move(top.pending_key), std::move(v));
            top.pending_key.clear();
        } else {
            top.value.push_back(std::move(v));
        }
        return true;
    }

    bool close() {
        Value v = std::move(stack_.back().value);
        stack_.pop_back();
        return add(std::move(v));
    }

    std::vector<Frame> stack_;
    Value root_;
    std::string error_;
};

} // anonymous namespace

DocumentParseResult parse_document(const std::string& text) {
    DocumentParseResult result;

    DocumentBuilder builder;
    bool parsed = nlohmann::json::sax_parse(text, &builder,
                                            nlohmann::json::input_format_t::json,
                                            true,   // strict
                                            true);  // ignore comments
    if (!parsed) {
        result.error = builder.error().empty() ? "failed to parse document" : builder.error();
        return result;
    }

    Value& root = builder.root();
    if (!root.is_mapping()) {
        result.error = std::string("document root must be an object, got ") +
                       kind_to_string(root.kind());
        return result;
    }

    result.document.entries = root.as_mapping();
    result.document.source = text;
    result.ok = true;
    return result;
}

// ============================================================================
// KeyLocator
// ============================================================================

KeyLocator::KeyLocator(const std::string& source) {
    std::vector<char> depth;
    std::size_t line = 1;

    bool in_string = false;
    bool escaped = false;
    std::string token;
    std::size_t token_line = 0;

    // A string that closed at root-object depth, waiting for ':'
    bool candidate = false;
    std::string candidate_key;
    std::size_t candidate_line = 0;

    for (std::size_t i = 0; i < source.size(); ++i) {
        char c = source[i];

        if (in_string) {
            if (c == '\n') ++line;
            if (escaped) {
                i = decode_escape(source, i, token);
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
                if (depth.size() == 1 && depth.back() == '{') {
                    candidate = true;
                    candidate_key = token;
                    candidate_line = token_line;
                }
            } else {
                token += c;
            }
            continue;
        }

        if (c == '\n') {
            ++line;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r') {
            continue;
        }

        // Comments
        if (c == '/' && i + 1 < source.size()) {
            if (source[i + 1] == '/') {
                while (i < source.size() && source[i] != '\n') ++i;
                if (i < source.size()) ++line;
                continue;
            }
            if (source[i + 1] == '*') {
                i += 2;
                while (i + 1 < source.size() && !(source[i] == '*' && source[i + 1] == '/')) {
                    if (source[i] == '\n') ++line;
                    ++i;
                }
                ++i;
                continue;
            }
        }

        if (c == ':' && candidate) {
            lines_[candidate_key].push_back(candidate_line);
        }
        candidate = false;

        switch (c) {
            case '"':
                in_string = true;
                token.clear();
                token_line = line;
                break;
            case '{':
            case '[':
                depth.push_back(c);
                break;
            case '}':
            case ']':
                if (!depth.empty()) depth.pop_back();
                break;
            default:
                break;
        }
    }
}

std::size_t KeyLocator::line_of(const std::string& key, std::size_t occurrence) const {
    auto it = lines_.find(key);
    if (it == lines_.end() || it->second.empty()) {
        return 0;
    }
    if (occurrence >= it->second.size()) {
        return it->second.back();
    }
    return it->second[occurrence];
}

// ============================================================================
// ValidatedConfig
// ============================================================================

const Value* ValidatedConfig::find(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.key == name) {
            return &field.value;
        }
    }
    return nullptr;
}

// ============================================================================
// JSON output
// ============================================================================

nlohmann::ordered_json to_json(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            return nullptr;
        case Value::Kind::Boolean:
            return value.as_boolean();
        case Value::Kind::Integer:
            return value.as_integer();
        case Value::Kind::Float:
            return value.as_float();
        case Value::Kind::String:
            return value.as_string();
        case Value::Kind::Sequence: {
            auto j = nlohmann::ordered_json::array();
            for (const auto& item : value.as_sequence()) {
                j.push_back(to_json(item));
            }
            return j;
        }
        case Value::Kind::Mapping: {
            auto j = nlohmann::ordered_json::object();
            for (const auto& entry : value.as_mapping()) {
                if (!j.contains(entry.key)) {
                    j[entry.key] = to_json(entry.value);
                }
            }
            return j;
        }
    }
    return nullptr;
}

nlohmann::ordered_json to_json(const ValidatedConfig& config) {
    auto j = nlohmann::ordered_json::object();
    for (const auto& field : config) {
        j[field.key] = to_json(field.value);
    }
    return j;
}

} // namespace sblint
