// RangeCast - Seekable media delivery engine
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse JSON and YAML configuration files
// - Support RANGECAST_* environment variable overrides
// - Validate the configuration with errors naming the offending field
// - Apply defaults when no configuration file is given
// - Report the effective configuration through a log callback

#ifndef RANGECAST_CORE_CONFIG_MANAGER_HPP
#define RANGECAST_CORE_CONFIG_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "rangecast/core/json.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/types.hpp"

namespace rangecast {
namespace core {

/**
 * @brief Configuration file format.
 */
enum class ConfigFormat {
    JSON,
    YAML
};

/**
 * @brief Where cached chunk blocks are kept.
 */
enum class CacheStoreKind {
    Disk,   ///< Block files plus index.json under cache.directory
    Memory  ///< In-process only; the cache is ephemeral
};

std::string cacheStoreKindToString(CacheStoreKind kind);

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief HTTP listener configuration section.
 */
struct ServerConfig {
    std::string bindAddress = "0.0.0.0";  ///< Bind address (default: all interfaces)
    uint16_t port = 8080;                 ///< HTTP port
    uint32_t maxConnections = 256;        ///< Maximum concurrent HTTP connections
};

/**
 * @brief Backend session pool configuration section.
 */
struct SessionsConfig {
    uint32_t count = 1;                   ///< Number of backend sessions (1..50)
    std::vector<std::string> labels;      ///< Optional display labels, in session order
    uint32_t cooldownSeconds = 30;        ///< Cooldown when the backend gives no retry-after
    uint32_t acquireTimeoutMs = 10000;    ///< Max wait for a usable session
    uint32_t maxFetchRetries = 3;         ///< Rotations per request before BackendError
};

/**
 * @brief Media cache configuration section.
 */
struct CacheConfig {
    bool enabled = true;
    uint64_t capacityBytes = 4ULL * 1024 * 1024 * 1024;  ///< Total bytes, pinned fills included
    uint64_t chunkSizeBytes = DEFAULT_CHUNK_SIZE;        ///< Cache granularity
    CacheStoreKind store = CacheStoreKind::Disk;
    std::string directory = "./cache";
    bool persistIndex = true;             ///< Save/load index.json (disk store only)
    bool cacheAllTypes = false;           ///< Admit non-media MIME types too
};

/**
 * @brief Backend fetch configuration section.
 */
struct FetchConfig {
    uint64_t partSizeBytes = DEFAULT_CHUNK_SIZE;  ///< Backend part size; divides chunkSizeBytes
};

/**
 * @brief Pre-cache configuration section.
 */
struct PreCacheConfig {
    bool enabled = true;
    uint64_t bytes = DEFAULT_CHUNK_SIZE;  ///< Leading bytes of the next item to populate
    uint32_t workers = 1;                 ///< Low-priority worker threads
};

/**
 * @brief Logging configuration section.
 */
struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool json = false;                    ///< JSON line format
    bool console = true;                  ///< Log to stderr
    std::string file;                     ///< Append to this file when non-empty
};

/**
 * @brief Complete configuration.
 */
struct Configuration {
    ServerConfig server;
    SessionsConfig sessions;
    CacheConfig cache;
    FetchConfig fetch;
    PreCacheConfig precache;
    LoggingConfig logging;
};

// =============================================================================
// Configuration Error
// =============================================================================

/**
 * @brief Configuration error with detailed information.
 */
struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        UnsupportedFormat,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
};

// =============================================================================
// Configuration Manager
// =============================================================================

using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Loads, overrides and validates the RangeCast configuration.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Uses shared_mutex for read/write locking
 *
 * Usage example:
 * @code
 * ConfigManager manager;
 * if (!path.empty()) {
 *     auto loaded = manager.loadFromFile(path);
 *     if (loaded.isError()) { ... }
 * }
 * manager.applyEnvironmentOverrides();
 * auto valid = manager.validate();
 * Configuration config = manager.getConfig();
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Load configuration from a .json, .yaml or .yml file.
     *
     * Fields absent from the file keep their defaults. The result is
     * validated before it is returned.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);
    Result<void, ConfigError> loadFromYamlString(const std::string& yamlContent);

    /**
     * @brief Reset to built-in defaults.
     */
    void loadDefaults();

    /**
     * @brief Apply RANGECAST_* environment variables.
     *
     * Unparseable values are reported through the log callback and ignored.
     *
     * Supported variables: RANGECAST_PORT, RANGECAST_BIND_ADDRESS,
     * RANGECAST_SESSION_COUNT, RANGECAST_COOLDOWN_SECONDS,
     * RANGECAST_CACHE_CAPACITY, RANGECAST_CHUNK_SIZE, RANGECAST_CACHE_DIR,
     * RANGECAST_PRECACHE_ENABLED, RANGECAST_MAX_RETRIES, RANGECAST_LOG_LEVEL.
     */
    void applyEnvironmentOverrides();

    /**
     * @brief Validate the current configuration.
     * @return ValidationError naming the first offending field
     */
    Result<void, ConfigError> validate() const;

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Replace the configuration wholesale (tests, embedding).
     */
    void setConfig(const Configuration& config);

    /**
     * @brief Serialize the effective configuration.
     */
    std::string dumpConfig(ConfigFormat format = ConfigFormat::JSON) const;

    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> applyDocument(const JsonValue& root);
    std::optional<ConfigFormat> detectFormat(const std::string& filePath) const;
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    std::optional<std::string> getEnvVar(const std::string& name) const;
    void log(const std::string& message) const;
    void logEffectiveConfig() const;

    mutable std::shared_mutex configMutex_;
    Configuration config_;

    mutable std::mutex logMutex_;
    ConfigLogCallback logCallback_;
};

} // namespace core
} // namespace rangecast

#endif // RANGECAST_CORE_CONFIG_MANAGER_HPP
