#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace planwise::json {

struct Value {
    enum class Kind : uint8_t {
        kNull,
        kBool,
        kNumber,
        kString,
        kArray,
        kObject,
    };

    Kind kind = Kind::kNull;
    bool bool_v = false;
    double number_v = 0.0;
    std::string string_v{};
    std::vector<Value> array_v{};
    std::unordered_map<std::string, Value> object_v{};

    bool is_null() const { return kind == Kind::kNull; }
    bool is_string() const { return kind == Kind::kString; }
    bool is_array() const { return kind == Kind::kArray; }
    bool is_object() const { return kind == Kind::kObject; }
};

struct ParseResult {
    bool ok = false;
    Value value{};
    size_t error_offset = 0;
};

ParseResult parse(std::string_view src);

const Value* get(const Value& obj, std::string_view key);
std::optional<std::string_view> as_string(const Value* v);

/// Returns the string member `key`, or nullopt when it is absent, null or
/// not a string.
std::optional<std::string> get_string(const Value& obj, std::string_view key);

std::string escape(std::string_view s);

} // namespace planwise::json
