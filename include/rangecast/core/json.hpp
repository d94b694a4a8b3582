// RangeCast - Seekable media delivery engine
// Minimal JSON/YAML document model shared by configuration and the cache index
//
// Supports the subset needed for configuration files and the persisted cache
// index: objects, arrays, strings, numbers, booleans and null for JSON; and
// nested maps of scalars plus inline [a, b] lists for YAML.

#ifndef RANGECAST_CORE_JSON_HPP
#define RANGECAST_CORE_JSON_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"

namespace rangecast {
namespace core {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief A parsed JSON (or YAML) value.
 */
struct JsonValue {
    JsonType type = JsonType::Null;
    bool boolValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    bool isNull() const { return type == JsonType::Null; }
    bool isBool() const { return type == JsonType::Boolean; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    bool getBool(bool defaultVal = false) const {
        return isBool() ? boolValue : defaultVal;
    }

    int64_t getInt(int64_t defaultVal = 0) const {
        return isNumber() ? static_cast<int64_t>(numberValue) : defaultVal;
    }

    uint64_t getUInt(uint64_t defaultVal = 0) const {
        return (isNumber() && numberValue >= 0) ? static_cast<uint64_t>(numberValue) : defaultVal;
    }

    double getDouble(double defaultVal = 0.0) const {
        return isNumber() ? numberValue : defaultVal;
    }

    std::string getString(const std::string& defaultVal = "") const {
        return isString() ? stringValue : defaultVal;
    }

    bool contains(const std::string& key) const {
        return isObject() && objectValue.find(key) != objectValue.end();
    }

    const JsonValue& operator[](const std::string& key) const;
};

/**
 * @brief Parse a JSON document.
 * @return The root value or an Error with code ConfigInvalid
 */
Result<JsonValue, Error> parseJson(const std::string& text);

/**
 * @brief Parse an indentation-based YAML document into the JSON model.
 * @return The root object or an Error with code ConfigInvalid
 */
Result<JsonValue, Error> parseYaml(const std::string& text);

/**
 * @brief Escape a string for embedding in a JSON string literal.
 */
std::string escapeJson(const std::string& str);

} // namespace core
} // namespace rangecast

#endif // RANGECAST_CORE_JSON_HPP
