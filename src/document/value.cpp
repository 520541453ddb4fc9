#include "sblint/value.hpp"

namespace sblint {

Value Value::null() {
    return Value{};
}

Value Value::boolean(bool b) {
    Value v;
    v.kind_ = Kind::Boolean;
    v.bool_ = b;
    return v;
}

Value Value::integer(std::int64_t i) {
    Value v;
    v.kind_ = Kind::Integer;
    v.int_ = i;
    return v;
}

Value Value::floating(double d) {
    Value v;
    v.kind_ = Kind::Float;
    v.float_ = d;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.kind_ = Kind::String;
    v.string_ = std::move(s);
    return v;
}

Value Value::sequence(std::vector<Value> items) {
    Value v;
    v.kind_ = Kind::Sequence;
    v.items_ = std::move(items);
    return v;
}

Value Value::mapping(std::vector<Entry> entries) {
    Value v;
    v.kind_ = Kind::Mapping;
    v.entries_ = std::move(entries);
    return v;
}

const Value* Value::find(const std::string& key) const {
    if (kind_ != Kind::Mapping) {
        return nullptr;
    }
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

bool Value::is_string_sequence() const {
    if (kind_ != Kind::Sequence) {
        return false;
    }
    for (const auto& item : items_) {
        if (!item.is_string()) {
            return false;
        }
    }
    return true;
}

void Value::push_back(Value v) {
    items_.push_back(std::move(v));
}

void Value::add_entry(std::string key, Value v) {
    entries_.push_back(Entry{std::move(key), std::move(v)});
}

bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case Kind::Null: return true;
        case Kind::Boolean: return bool_ == other.bool_;
        case Kind::Integer: return int_ == other.int_;
        case Kind::Float: return float_ == other.float_;
        case Kind::String: return string_ == other.string_;
        case Kind::Sequence: return items_ == other.items_;
        case Kind::Mapping: return entries_ == other.entries_;
    }
    return false;
}

const char* kind_to_string(Value::Kind k) {
    switch (k) {
        case Value::Kind::Null: return "null";
        case Value::Kind::Boolean: return "boolean";
        case Value::Kind::Integer: return "integer";
        case Value::Kind::Float: return "float";
        case Value::Kind::String: return "string";
        case Value::Kind::Sequence: return "sequence";
        case Value::Kind::Mapping: return "mapping";
        default: return "unknown";
    }
}

std::string describe_value(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null: return "null";
        case Value::Kind::Boolean: return v.as_boolean() ? "true" : "false";
        case Value::Kind::Integer: return std::to_string(v.as_integer());
        case Value::Kind::Float: return std::to_string(v.as_float());
        case Value::Kind::String: return "'" + v.as_string() + "'";
        case Value::Kind::Sequence: return "[...]";
        case Value::Kind::Mapping: return "{...}";
        default: return "?";
    }
}

} // namespace sblint
