// RangeCast - Seekable media delivery engine
// Configuration Manager Implementation

#include "rangecast/core/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace rangecast {
namespace core {

std::string cacheStoreKindToString(CacheStoreKind kind) {
    return kind == CacheStoreKind::Memory ? "memory" : "disk";
}

namespace {

using VoidResult = Result<void, ConfigError>;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<uint64_t> parseUnsigned(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

std::optional<bool> parseBool(const std::string& text) {
    std::string lower = toLower(text);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

std::optional<CacheStoreKind> parseStoreKind(const std::string& text) {
    std::string lower = toLower(text);
    if (lower == "disk") return CacheStoreKind::Disk;
    if (lower == "memory") return CacheStoreKind::Memory;
    return std::nullopt;
}

/**
 * @brief Reads typed fields out of one configuration section.
 *
 * Stops at the first type or range error and remembers it.
 */
class SectionReader {
public:
    SectionReader(const JsonValue& section, std::string name)
        : section_(section), name_(std::move(name)) {}

    template <typename T>
    void readUnsigned(const char* key, T& out, uint64_t min = 0,
                      uint64_t max = std::numeric_limits<T>::max()) {
        if (failed() || !section_.contains(key)) return;
        const JsonValue& v = section_[key];
        if (!v.isNumber() || v.numberValue < 0 ||
            v.numberValue != static_cast<double>(static_cast<uint64_t>(v.numberValue))) {
            fail(key, "must be a non-negative integer");
            return;
        }
        uint64_t value = static_cast<uint64_t>(v.numberValue);
        if (value < min || value > max) {
            fail(key, "must be between " + std::to_string(min) + " and " + std::to_string(max));
            return;
        }
        out = static_cast<T>(value);
    }

    void readBool(const char* key, bool& out) {
        if (failed() || !section_.contains(key)) return;
        const JsonValue& v = section_[key];
        if (!v.isBool()) {
            fail(key, "must be a boolean");
            return;
        }
        out = v.boolValue;
    }

    void readString(const char* key, std::string& out) {
        if (failed() || !section_.contains(key)) return;
        const JsonValue& v = section_[key];
        if (!v.isString()) {
            fail(key, "must be a string");
            return;
        }
        out = v.stringValue;
    }

    void readStringList(const char* key, std::vector<std::string>& out) {
        if (failed() || !section_.contains(key)) return;
        const JsonValue& v = section_[key];
        if (!v.isArray()) {
            fail(key, "must be a list of strings");
            return;
        }
        std::vector<std::string> values;
        for (const auto& item : v.arrayValue) {
            if (!item.isString()) {
                fail(key, "must be a list of strings");
                return;
            }
            values.push_back(item.stringValue);
        }
        out = std::move(values);
    }

    void fail(const std::string& key, const std::string& what) {
        if (failed()) return;
        std::string field = name_ + "." + key;
        error_ = ConfigError(ConfigError::Code::ValidationError, field + " " + what, field);
    }

    bool failed() const { return error_.has_value(); }
    const ConfigError& error() const { return *error_; }

private:
    const JsonValue& section_;
    std::string name_;
    std::optional<ConfigError> error_;
};

} // anonymous namespace

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() {
    config_ = Configuration{};
}

ConfigManager::~ConfigManager() = default;

VoidResult ConfigManager::loadFromFile(const std::string& filePath) {
    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return VoidResult::error(contentResult.error());
    }

    auto format = detectFormat(filePath);
    if (!format) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::UnsupportedFormat,
                        "Unsupported configuration file format. Use .json, .yaml, or .yml"));
    }

    log("Loading configuration from " + filePath);
    if (*format == ConfigFormat::YAML) {
        return loadFromYamlString(contentResult.value());
    }
    return loadFromJsonString(contentResult.value());
}

VoidResult ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto parsed = parseJson(jsonContent);
    if (parsed.isError()) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::ParseError, parsed.error().message));
    }
    return applyDocument(parsed.value());
}

VoidResult ConfigManager::loadFromYamlString(const std::string& yamlContent) {
    auto parsed = parseYaml(yamlContent);
    if (parsed.isError()) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::ParseError, parsed.error().message));
    }
    return applyDocument(parsed.value());
}

void ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }
    log("Configuration loaded with default values");
    logEffectiveConfig();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    auto overrideUnsigned = [this](const char* name, auto& target, uint64_t max) {
        auto val = getEnvVar(name);
        if (!val) return;
        auto parsed = parseUnsigned(*val);
        if (!parsed || *parsed > max) {
            log(std::string("Warning: Invalid ") + name + " value: " + *val);
            return;
        }
        target = static_cast<std::remove_reference_t<decltype(target)>>(*parsed);
        log(std::string("Environment override: ") + name + "=" + *val);
    };

    overrideUnsigned("RANGECAST_PORT", config_.server.port, 65535);
    overrideUnsigned("RANGECAST_SESSION_COUNT", config_.sessions.count,
                     std::numeric_limits<uint32_t>::max());
    overrideUnsigned("RANGECAST_COOLDOWN_SECONDS", config_.sessions.cooldownSeconds,
                     std::numeric_limits<uint32_t>::max());
    overrideUnsigned("RANGECAST_MAX_RETRIES", config_.sessions.maxFetchRetries,
                     std::numeric_limits<uint32_t>::max());
    overrideUnsigned("RANGECAST_CACHE_CAPACITY", config_.cache.capacityBytes,
                     std::numeric_limits<uint64_t>::max());
    overrideUnsigned("RANGECAST_CHUNK_SIZE", config_.cache.chunkSizeBytes,
                     std::numeric_limits<uint64_t>::max());

    if (auto val = getEnvVar("RANGECAST_BIND_ADDRESS")) {
        config_.server.bindAddress = *val;
        log("Environment override: RANGECAST_BIND_ADDRESS=" + *val);
    }

    if (auto val = getEnvVar("RANGECAST_CACHE_DIR")) {
        config_.cache.directory = *val;
        log("Environment override: RANGECAST_CACHE_DIR=" + *val);
    }

    if (auto val = getEnvVar("RANGECAST_PRECACHE_ENABLED")) {
        if (auto enabled = parseBool(*val)) {
            config_.precache.enabled = *enabled;
            log("Environment override: RANGECAST_PRECACHE_ENABLED=" + *val);
        } else {
            log("Warning: Invalid RANGECAST_PRECACHE_ENABLED value: " + *val);
        }
    }

    if (auto val = getEnvVar("RANGECAST_LOG_LEVEL")) {
        if (isValidLogLevel(*val)) {
            config_.logging.level = stringToLogLevel(*val);
            log("Environment override: RANGECAST_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid RANGECAST_LOG_LEVEL value: " + *val);
        }
    }
}

VoidResult ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    auto invalid = [](const std::string& field, const std::string& message) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::ValidationError, field + " " + message, field));
    };

    if (config_.server.port == 0) {
        return invalid("server.port", "must be between 1 and 65535");
    }
    if (config_.server.maxConnections == 0) {
        return invalid("server.maxConnections", "must be greater than 0");
    }

    if (config_.sessions.count == 0 || config_.sessions.count > MAX_POOL_SESSIONS) {
        return invalid("sessions.count",
                       "must be between 1 and " + std::to_string(MAX_POOL_SESSIONS));
    }
    if (config_.sessions.labels.size() > config_.sessions.count) {
        return invalid("sessions.labels", "has more entries than sessions.count");
    }

    if (config_.cache.chunkSizeBytes == 0) {
        return invalid("cache.chunkSizeBytes", "must be greater than 0");
    }
    if (config_.cache.enabled && config_.cache.capacityBytes == 0) {
        return invalid("cache.capacityBytes", "must be greater than 0 when the cache is enabled");
    }
    if (config_.cache.enabled && config_.cache.store == CacheStoreKind::Disk &&
        config_.cache.directory.empty()) {
        return invalid("cache.directory", "is required for the disk store");
    }

    if (config_.fetch.partSizeBytes == 0 ||
        config_.cache.chunkSizeBytes % config_.fetch.partSizeBytes != 0) {
        return invalid("fetch.partSizeBytes", "must divide cache.chunkSizeBytes");
    }

    if (config_.precache.enabled && config_.precache.workers == 0) {
        return invalid("precache.workers", "must be greater than 0 when pre-cache is enabled");
    }

    return VoidResult::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

void ConfigManager::setConfig(const Configuration& config) {
    std::unique_lock<std::shared_mutex> lock(configMutex_);
    config_ = config;
}

std::string ConfigManager::dumpConfig(ConfigFormat format) const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    auto b = [](bool v) { return v ? "true" : "false"; };
    std::ostringstream ss;

    if (format == ConfigFormat::JSON) {
        ss << "{\n";
        ss << "  \"server\": {\n";
        ss << "    \"bindAddress\": \"" << escapeJson(config_.server.bindAddress) << "\",\n";
        ss << "    \"port\": " << config_.server.port << ",\n";
        ss << "    \"maxConnections\": " << config_.server.maxConnections << "\n";
        ss << "  },\n";
        ss << "  \"sessions\": {\n";
        ss << "    \"count\": " << config_.sessions.count << ",\n";
        ss << "    \"labels\": [";
        for (size_t i = 0; i < config_.sessions.labels.size(); ++i) {
            ss << (i ? ", " : "") << "\"" << escapeJson(config_.sessions.labels[i]) << "\"";
        }
        ss << "],\n";
        ss << "    \"cooldownSeconds\": " << config_.sessions.cooldownSeconds << ",\n";
        ss << "    \"acquireTimeoutMs\": " << config_.sessions.acquireTimeoutMs << ",\n";
        ss << "    \"maxFetchRetries\": " << config_.sessions.maxFetchRetries << "\n";
        ss << "  },\n";
        ss << "  \"cache\": {\n";
        ss << "    \"enabled\": " << b(config_.cache.enabled) << ",\n";
        ss << "    \"capacityBytes\": " << config_.cache.capacityBytes << ",\n";
        ss << "    \"chunkSizeBytes\": " << config_.cache.chunkSizeBytes << ",\n";
        ss << "    \"store\": \"" << cacheStoreKindToString(config_.cache.store) << "\",\n";
        ss << "    \"directory\": \"" << escapeJson(config_.cache.directory) << "\",\n";
        ss << "    \"persistIndex\": " << b(config_.cache.persistIndex) << ",\n";
        ss << "    \"cacheAllTypes\": " << b(config_.cache.cacheAllTypes) << "\n";
        ss << "  },\n";
        ss << "  \"fetch\": {\n";
        ss << "    \"partSizeBytes\": " << config_.fetch.partSizeBytes << "\n";
        ss << "  },\n";
        ss << "  \"precache\": {\n";
        ss << "    \"enabled\": " << b(config_.precache.enabled) << ",\n";
        ss << "    \"bytes\": " << config_.precache.bytes << ",\n";
        ss << "    \"workers\": " << config_.precache.workers << "\n";
        ss << "  },\n";
        ss << "  \"logging\": {\n";
        ss << "    \"level\": \"" << logLevelToString(config_.logging.level) << "\",\n";
        ss << "    \"json\": " << b(config_.logging.json) << ",\n";
        ss << "    \"console\": " << b(config_.logging.console) << ",\n";
        ss << "    \"file\": \"" << escapeJson(config_.logging.file) << "\"\n";
        ss << "  }\n";
        ss << "}\n";
    } else {
        ss << "server:\n";
        ss << "  bindAddress: \"" << config_.server.bindAddress << "\"\n";
        ss << "  port: " << config_.server.port << "\n";
        ss << "  maxConnections: " << config_.server.maxConnections << "\n";
        ss << "sessions:\n";
        ss << "  count: " << config_.sessions.count << "\n";
        ss << "  labels: [";
        for (size_t i = 0; i < config_.sessions.labels.size(); ++i) {
            ss << (i ? ", " : "") << config_.sessions.labels[i];
        }
        ss << "]\n";
        ss << "  cooldownSeconds: " << config_.sessions.cooldownSeconds << "\n";
        ss << "  acquireTimeoutMs: " << config_.sessions.acquireTimeoutMs << "\n";
        ss << "  maxFetchRetries: " << config_.sessions.maxFetchRetries << "\n";
        ss << "cache:\n";
        ss << "  enabled: " << b(config_.cache.enabled) << "\n";
        ss << "  capacityBytes: " << config_.cache.capacityBytes << "\n";
        ss << "  chunkSizeBytes: " << config_.cache.chunkSizeBytes << "\n";
        ss << "  store: " << cacheStoreKindToString(config_.cache.store) << "\n";
        ss << "  directory: \"" << config_.cache.directory << "\"\n";
        ss << "  persistIndex: " << b(config_.cache.persistIndex) << "\n";
        ss << "  cacheAllTypes: " << b(config_.cache.cacheAllTypes) << "\n";
        ss << "fetch:\n";
        ss << "  partSizeBytes: " << config_.fetch.partSizeBytes << "\n";
        ss << "precache:\n";
        ss << "  enabled: " << b(config_.precache.enabled) << "\n";
        ss << "  bytes: " << config_.precache.bytes << "\n";
        ss << "  workers: " << config_.precache.workers << "\n";
        ss << "logging:\n";
        ss << "  level: " << logLevelToString(config_.logging.level) << "\n";
        ss << "  json: " << b(config_.logging.json) << "\n";
        ss << "  console: " << b(config_.logging.console) << "\n";
        ss << "  file: \"" << config_.logging.file << "\"\n";
    }

    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

VoidResult ConfigManager::applyDocument(const JsonValue& root) {
    if (!root.isObject()) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::ParseError, "Configuration root must be an object"));
    }

    Configuration next = getConfig();

    {
        SectionReader server(root["server"], "server");
        server.readString("bindAddress", next.server.bindAddress);
        server.readUnsigned("port", next.server.port, 1, 65535);
        server.readUnsigned("maxConnections", next.server.maxConnections, 1);
        if (server.failed()) return VoidResult::error(server.error());
    }

    {
        SectionReader sessions(root["sessions"], "sessions");
        sessions.readUnsigned("count", next.sessions.count, 1, MAX_POOL_SESSIONS);
        sessions.readStringList("labels", next.sessions.labels);
        sessions.readUnsigned("cooldownSeconds", next.sessions.cooldownSeconds);
        sessions.readUnsigned("acquireTimeoutMs", next.sessions.acquireTimeoutMs);
        sessions.readUnsigned("maxFetchRetries", next.sessions.maxFetchRetries);
        if (sessions.failed()) return VoidResult::error(sessions.error());
    }

    {
        SectionReader cache(root["cache"], "cache");
        cache.readBool("enabled", next.cache.enabled);
        cache.readUnsigned("capacityBytes", next.cache.capacityBytes);
        cache.readUnsigned("chunkSizeBytes", next.cache.chunkSizeBytes, 1);
        std::string store = cacheStoreKindToString(next.cache.store);
        cache.readString("store", store);
        if (!cache.failed()) {
            if (auto kind = parseStoreKind(store)) {
                next.cache.store = *kind;
            } else {
                cache.fail("store", "must be \"disk\" or \"memory\"");
            }
        }
        cache.readString("directory", next.cache.directory);
        cache.readBool("persistIndex", next.cache.persistIndex);
        cache.readBool("cacheAllTypes", next.cache.cacheAllTypes);
        if (cache.failed()) return VoidResult::error(cache.error());
    }

    {
        SectionReader fetch(root["fetch"], "fetch");
        fetch.readUnsigned("partSizeBytes", next.fetch.partSizeBytes, 1);
        if (fetch.failed()) return VoidResult::error(fetch.error());
    }

    {
        SectionReader precache(root["precache"], "precache");
        precache.readBool("enabled", next.precache.enabled);
        precache.readUnsigned("bytes", next.precache.bytes);
        precache.readUnsigned("workers", next.precache.workers);
        if (precache.failed()) return VoidResult::error(precache.error());
    }

    {
        SectionReader logging(root["logging"], "logging");
        std::string level = logLevelToString(next.logging.level);
        logging.readString("level", level);
        if (!logging.failed()) {
            if (isValidLogLevel(level)) {
                next.logging.level = stringToLogLevel(level);
            } else {
                logging.fail("level", "must be one of debug, info, warning, error");
            }
        }
        logging.readBool("json", next.logging.json);
        logging.readBool("console", next.logging.console);
        logging.readString("file", next.logging.file);
        if (logging.failed()) return VoidResult::error(logging.error());
    }

    setConfig(next);

    auto valid = validate();
    if (valid.isSuccess()) {
        logEffectiveConfig();
    }
    return valid;
}

std::optional<ConfigFormat> ConfigManager::detectFormat(const std::string& filePath) const {
    size_t dotPos = filePath.rfind('.');
    if (dotPos == std::string::npos) {
        return ConfigFormat::JSON;
    }

    std::string ext = toLower(filePath.substr(dotPos));
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".yaml" || ext == ".yml") return ConfigFormat::YAML;
    return std::nullopt;
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration c = getConfig();
    log("Effective configuration:");
    log("  server: " + c.server.bindAddress + ":" + std::to_string(c.server.port) +
        " maxConnections=" + std::to_string(c.server.maxConnections));
    log("  sessions: count=" + std::to_string(c.sessions.count) +
        " cooldownSeconds=" + std::to_string(c.sessions.cooldownSeconds) +
        " maxFetchRetries=" + std::to_string(c.sessions.maxFetchRetries));
    log("  cache: " + std::string(c.cache.enabled ? "enabled" : "disabled") +
        " store=" + cacheStoreKindToString(c.cache.store) +
        " capacityBytes=" + std::to_string(c.cache.capacityBytes) +
        " chunkSizeBytes=" + std::to_string(c.cache.chunkSizeBytes));
    log("  precache: " + std::string(c.precache.enabled ? "enabled" : "disabled") +
        " bytes=" + std::to_string(c.precache.bytes));
    log("  logging.level: " + logLevelToString(c.logging.level));
}

} // namespace core
} // namespace rangecast
