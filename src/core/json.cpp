// RangeCast - Seekable media delivery engine
// Minimal JSON/YAML parser implementation

#include "rangecast/core/json.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace rangecast {
namespace core {

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    if (!isObject()) return nullValue;
    auto it = objectValue.find(key);
    return it != objectValue.end() ? it->second : nullValue;
}

namespace {

using ParseResult = Result<JsonValue, Error>;

ParseResult parseFailure(const std::string& message) {
    return ParseResult::error(Error(ErrorCode::ConfigInvalid, message, "parse"));
}

// =============================================================================
// JSON
// =============================================================================

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    ParseResult parse() {
        skipWhitespace();
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return parseFailure("Unexpected characters after JSON value at offset " +
                                std::to_string(pos_));
        }
        return result;
    }

private:
    static constexpr int MAX_DEPTH = 64;

    const std::string& input_;
    size_t pos_;

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (peek() == c) {
            consume();
            return true;
        }
        return false;
    }

    ParseResult parseValue(int depth) {
        if (depth > MAX_DEPTH) {
            return parseFailure("JSON nesting too deep");
        }

        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        return parseFailure(c == '\0' ? "Unexpected end of input"
                                      : "Unexpected character: " + std::string(1, c));
    }

    ParseResult parseString() {
        if (!match('"')) {
            return parseFailure("Expected '\"'");
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }
            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > input_.size()) {
                        return parseFailure("Truncated \\u escape");
                    }
                    unsigned long code = std::strtoul(input_.substr(pos_, 4).c_str(), nullptr, 16);
                    pos_ += 4;
                    // Only the ASCII range is needed for our documents.
                    result += code < 0x80 ? static_cast<char>(code) : '?';
                    break;
                }
                default: result += escaped; break;
            }
        }

        if (!match('"')) {
            return parseFailure("Unterminated string");
        }

        JsonValue value;
        value.type = JsonType::String;
        value.stringValue = std::move(result);
        return ParseResult::success(std::move(value));
    }

    ParseResult parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        char* end = nullptr;
        double number = std::strtod(numStr.c_str(), &end);
        if (numStr.empty() || numStr == "-" || end == nullptr || *end != '\0') {
            return parseFailure("Invalid number: " + numStr);
        }

        JsonValue value;
        value.type = JsonType::Number;
        value.numberValue = number;
        return ParseResult::success(std::move(value));
    }

    ParseResult parseBool() {
        JsonValue value;
        value.type = JsonType::Boolean;
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            value.boolValue = true;
            return ParseResult::success(std::move(value));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            value.boolValue = false;
            return ParseResult::success(std::move(value));
        }
        return parseFailure("Expected 'true' or 'false'");
    }

    ParseResult parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue{});
        }
        return parseFailure("Expected 'null'");
    }

    ParseResult parseArray(int depth) {
        consume();  // '['

        JsonValue value;
        value.type = JsonType::Array;

        skipWhitespace();
        if (match(']')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.arrayValue.push_back(std::move(element).value());

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return parseFailure("Expected ',' or ']' in array");
            }
        }

        return ParseResult::success(std::move(value));
    }

    ParseResult parseObject(int depth) {
        consume();  // '{'

        JsonValue value;
        value.type = JsonType::Object;

        skipWhitespace();
        if (match('}')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            auto key = parseString();
            if (key.isError()) {
                return parseFailure("Expected string key in object");
            }

            skipWhitespace();
            if (!match(':')) {
                return parseFailure("Expected ':' after key \"" + key.value().stringValue + "\"");
            }

            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.objectValue[key.value().stringValue] = std::move(element).value();

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return parseFailure("Expected ',' or '}' in object");
            }
        }

        return ParseResult::success(std::move(value));
    }
};

// =============================================================================
// YAML
// =============================================================================

class YamlParser {
public:
    explicit YamlParser(const std::string& input) {
        std::istringstream stream(input);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines_.push_back(line);
        }
    }

    ParseResult parse() {
        JsonValue root;
        root.type = JsonType::Object;
        std::string failure;
        if (!parseObject(root.objectValue, 0, 0, lines_.size(), failure)) {
            return parseFailure(failure);
        }
        return ParseResult::success(std::move(root));
    }

private:
    std::vector<std::string> lines_;

    static size_t indentOf(const std::string& line) {
        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') {
            indent++;
        }
        return indent;
    }

    static std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
        return s.substr(start, end - start);
    }

    static bool isBlankOrComment(const std::string& line) {
        std::string trimmed = trim(line);
        return trimmed.empty() || trimmed[0] == '#';
    }

    static std::string stripComment(const std::string& value) {
        bool inQuote = false;
        char quote = '\0';
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (inQuote) {
                if (c == quote) inQuote = false;
            } else if (c == '"' || c == '\'') {
                inQuote = true;
                quote = c;
            } else if (c == '#' && (i == 0 || value[i - 1] == ' ')) {
                return trim(value.substr(0, i));
            }
        }
        return value;
    }

    bool parseObject(std::map<std::string, JsonValue>& obj, size_t baseIndent,
                     size_t startLine, size_t endLine, std::string& failure) {
        size_t i = startLine;
        while (i < endLine) {
            if (isBlankOrComment(lines_[i])) {
                i++;
                continue;
            }

            size_t indent = indentOf(lines_[i]);
            if (indent < baseIndent) {
                break;
            }

            std::string line = trim(lines_[i]);
            size_t colonPos = line.find(':');
            if (colonPos == std::string::npos) {
                failure = "Expected 'key: value' at line " + std::to_string(i + 1);
                return false;
            }

            std::string key = trim(line.substr(0, colonPos));
            std::string valueStr = stripComment(trim(line.substr(colonPos + 1)));

            if (!valueStr.empty()) {
                obj[key] = parseScalarOrList(valueStr);
                i++;
                continue;
            }

            size_t nestedEnd = i + 1;
            while (nestedEnd < endLine) {
                if (!isBlankOrComment(lines_[nestedEnd]) && indentOf(lines_[nestedEnd]) <= indent) {
                    break;
                }
                nestedEnd++;
            }

            JsonValue nested;
            nested.type = JsonType::Object;
            if (!parseObject(nested.objectValue, indent + 1, i + 1, nestedEnd, failure)) {
                return false;
            }
            obj[key] = std::move(nested);
            i = nestedEnd;
        }
        return true;
    }

    JsonValue parseScalarOrList(const std::string& value) {
        if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
            JsonValue list;
            list.type = JsonType::Array;
            std::string inner = value.substr(1, value.size() - 2);
            std::istringstream items(inner);
            std::string item;
            while (std::getline(items, item, ',')) {
                std::string trimmed = trim(item);
                if (!trimmed.empty()) {
                    list.arrayValue.push_back(parseScalar(trimmed));
                }
            }
            return list;
        }
        return parseScalar(value);
    }

    JsonValue parseScalar(const std::string& value) {
        JsonValue result;

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            result.type = JsonType::String;
            result.stringValue = value.substr(1, value.size() - 2);
            return result;
        }

        if (value == "true" || value == "True" || value == "TRUE" || value == "yes") {
            result.type = JsonType::Boolean;
            result.boolValue = true;
            return result;
        }
        if (value == "false" || value == "False" || value == "FALSE" || value == "no") {
            result.type = JsonType::Boolean;
            result.boolValue = false;
            return result;
        }

        if (value == "null" || value == "~") {
            return result;
        }

        char* end = nullptr;
        double number = std::strtod(value.c_str(), &end);
        if (end != nullptr && *end == '\0') {
            result.type = JsonType::Number;
            result.numberValue = number;
            return result;
        }

        result.type = JsonType::String;
        result.stringValue = value;
        return result;
    }
};

} // anonymous namespace

Result<JsonValue, Error> parseJson(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

Result<JsonValue, Error> parseYaml(const std::string& text) {
    YamlParser parser(text);
    return parser.parse();
}

std::string escapeJson(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

} // namespace core
} // namespace rangecast
