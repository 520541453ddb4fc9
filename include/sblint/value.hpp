#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sblint {

// ============================================================================
// Value
// ============================================================================

/**
 * Untyped descriptor node.
 *
 * Mappings are kept as an ordered list of entries so that source order and
 * repeated keys survive parsing. Lookups on a mapping return the first entry
 * with a matching key.
 */
class Value {
public:
    enum class Kind {
        Null,
        Boolean,
        Integer,
        Float,
        String,
        Sequence,
        Mapping
    };

    struct Entry;

    Value() = default;

    static Value null();
    static Value boolean(bool b);
    static Value integer(std::int64_t i);
    static Value floating(double d);
    static Value string(std::string s);
    static Value sequence(std::vector<Value> items = {});
    static Value mapping(std::vector<Entry> entries = {});

    Kind kind() const { return kind_; }

    bool is_null() const { return kind_ == Kind::Null; }
    bool is_boolean() const { return kind_ == Kind::Boolean; }
    bool is_integer() const { return kind_ == Kind::Integer; }
    bool is_float() const { return kind_ == Kind::Float; }
    bool is_string() const { return kind_ == Kind::String; }
    bool is_sequence() const { return kind_ == Kind::Sequence; }
    bool is_mapping() const { return kind_ == Kind::Mapping; }

    bool as_boolean() const { return bool_; }
    std::int64_t as_integer() const { return int_; }
    double as_float() const { return float_; }
    const std::string& as_string() const { return string_; }
    const std::vector<Value>& as_sequence() const { return items_; }
    const std::vector<Entry>& as_mapping() const { return entries_; }

    // First entry with the given key, or nullptr (also for non-mappings)
    const Value* find(const std::string& key) const;

    // Sequence whose elements are all strings
    bool is_string_sequence() const;

    void push_back(Value v);
    void add_entry(std::string key, Value v);

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    std::int64_t int_ = 0;
    double float_ = 0.0;
    std::string string_;
    std::vector<Value> items_;
    std::vector<Entry> entries_;
};

struct Value::Entry {
    std::string key;
    Value value;

    bool operator==(const Entry& other) const {
        return key == other.key && value == other.value;
    }
};

const char* kind_to_string(Value::Kind k);

// Short human-readable form used in diagnostics ("'foo'", "1", "[...]")
std::string describe_value(const Value& v);

} // namespace sblint
