// RangeCast Directory Server Example
// Serves the files of a local directory through the full delivery pipeline.
//
// Every file of the directory is one backend object (channel 1, message =
// position in the sorted listing) and is reachable as /stream/<file name>.
// Each configured session reads the directory independently, so pool
// rotation, caching and pre-caching behave as they would against a remote
// backend.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

#include "rangecast/rangecast.hpp"
#include "rangecast/core/config_manager.hpp"
#include "rangecast/streaming/media_types.hpp"
#include "rangecast/streaming/series.hpp"

namespace fs = std::filesystem;
using namespace rangecast;

namespace {

constexpr int64_t DIRECTORY_CHANNEL = 1;

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

/**
 * @brief Sorted listing of the regular files of a directory.
 */
class DirectoryListing {
public:
    explicit DirectoryListing(fs::path root) : root_(std::move(root)) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(root_, ec)) {
            if (entry.is_regular_file(ec)) {
                names_.push_back(entry.path().filename().string());
            }
        }
        std::sort(names_.begin(), names_.end());
    }

    const fs::path& root() const { return root_; }
    const std::vector<std::string>& names() const { return names_; }

    std::optional<fs::path> pathOf(const FileReference& file) const {
        if (file.channelId != DIRECTORY_CHANNEL || file.messageId < 1 ||
            static_cast<size_t>(file.messageId) > names_.size()) {
            return std::nullopt;
        }
        return root_ / names_[static_cast<size_t>(file.messageId - 1)];
    }

private:
    fs::path root_;
    std::vector<std::string> names_;
};

class DirectorySession : public streaming::IBackendSession {
public:
    DirectorySession(std::shared_ptr<const DirectoryListing> listing, std::string label)
        : listing_(std::move(listing))
        , label_(std::move(label)) {
    }

    std::string label() const override { return label_; }

    core::Result<Bytes, core::Error> downloadPart(const FileReference& file, ByteCount offset,
                                                  ByteCount limit) override {
        using PartResult = core::Result<Bytes, core::Error>;

        auto path = listing_->pathOf(file);
        if (!path) {
            return PartResult::error(core::Error(core::ErrorCode::NotFound, "No such object", file.toString()));
        }
        std::ifstream in(*path, std::ios::binary);
        if (!in) {
            return PartResult::error(core::Error(core::ErrorCode::NotFound,
                "Cannot open " + path->string(), file.toString()));
        }
        in.seekg(static_cast<std::streamoff>(offset));
        Bytes part(static_cast<size_t>(limit));
        in.read(reinterpret_cast<char*>(part.data()), static_cast<std::streamsize>(limit));
        if (in.bad()) {
            return PartResult::error(core::Error(core::ErrorCode::BackendError,
                "Read failed on " + path->string(), file.toString()));
        }
        part.resize(static_cast<size_t>(in.gcount()));
        return PartResult::success(std::move(part));
    }

private:
    std::shared_ptr<const DirectoryListing> listing_;
    std::string label_;
};

class DirectoryCatalog : public streaming::ICatalog {
public:
    explicit DirectoryCatalog(std::shared_ptr<const DirectoryListing> listing)
        : listing_(std::move(listing)) {
    }

    core::Result<FileReference, core::Error> resolveFile(const std::string& catalogKey) override {
        const auto& names = listing_->names();
        auto it = std::find(names.begin(), names.end(), catalogKey);
        if (it == names.end()) {
            return core::Result<FileReference, core::Error>::error(
                core::Error(core::ErrorCode::NotFound, "Unknown catalog key", catalogKey));
        }
        return core::Result<FileReference, core::Error>::success(
            FileReference(DIRECTORY_CHANNEL, static_cast<int64_t>(it - names.begin()) + 1));
    }

    core::Result<ObjectInfo, core::Error> objectInfo(const FileReference& file) override {
        auto path = listing_->pathOf(file);
        std::error_code ec;
        ByteCount size = path ? static_cast<ByteCount>(fs::file_size(*path, ec)) : 0;
        if (!path || ec) {
            return core::Result<ObjectInfo, core::Error>::error(
                core::Error(core::ErrorCode::NotFound, "No such object", file.toString()));
        }
        ObjectInfo info;
        info.size = size;
        info.fileName = path->filename().string();
        info.mimeType = streaming::guessMimeType(info.fileName);
        return core::Result<ObjectInfo, core::Error>::success(info);
    }

    core::Result<FileReference, core::Error> findSeriesItem(const std::string& groupKey,
                                                            int64_t index) override {
        const auto& names = listing_->names();
        for (size_t i = 0; i < names.size(); ++i) {
            auto position = streaming::parseSeriesPosition(names[i]);
            if (position && position->groupKey == groupKey && position->index == index) {
                return core::Result<FileReference, core::Error>::success(
                    FileReference(DIRECTORY_CHANNEL, static_cast<int64_t>(i) + 1));
            }
        }
        return core::Result<FileReference, core::Error>::error(core::Error(core::ErrorCode::NotFound,
            "No item " + std::to_string(index) + " in series", groupKey));
    }

private:
    std::shared_ptr<const DirectoryListing> listing_;
};

void printUsage(const char* programName) {
    std::cout << "RangeCast Directory Server " << rangecast::version() << "\n"
              << "Usage: " << programName << " [options] MEDIA_DIR\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     JSON or YAML configuration file\n"
              << "  -p, --port PORT       HTTP port (overrides the configuration)\n"
              << "  --dump-config         Print the effective configuration and exit\n"
              << "  -h, --help            Show this help\n"
              << "\nEnvironment variables RANGECAST_* override configuration values.\n"
              << "\nExample:\n"
              << "  " << programName << " -p 8080 ~/Videos\n"
              << "  curl -r 0-1023 http://localhost:8080/stream/Show.S01E01.mkv -o head.bin\n"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string mediaDir;
    int portOverride = -1;
    bool dumpOnly = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            portOverride = std::atoi(argv[++i]);
        } else if (arg == "--dump-config") {
            dumpOnly = true;
        } else if (!arg.empty() && arg[0] != '-') {
            mediaDir = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    core::ConfigManager manager;
    manager.setLogCallback([](const std::string& message) {
        std::cerr << "[config] " << message << std::endl;
    });
    if (!configPath.empty()) {
        auto loaded = manager.loadFromFile(configPath);
        if (loaded.isError()) {
            std::cerr << "Configuration error: " << loaded.error().message;
            if (!loaded.error().field.empty()) {
                std::cerr << " (" << loaded.error().field << ")";
            }
            std::cerr << std::endl;
            return 1;
        }
    }
    manager.applyEnvironmentOverrides();
    if (portOverride >= 0) {
        core::Configuration config = manager.getConfig();
        config.server.port = static_cast<uint16_t>(portOverride);
        manager.setConfig(config);
    }
    auto valid = manager.validate();
    if (valid.isError()) {
        std::cerr << "Invalid configuration: " << valid.error().message
                  << " (" << valid.error().field << ")" << std::endl;
        return 1;
    }
    if (dumpOnly) {
        std::cout << manager.dumpConfig(core::ConfigFormat::YAML) << std::endl;
        return 0;
    }
    if (mediaDir.empty() || !fs::is_directory(mediaDir)) {
        std::cerr << "A readable media directory is required" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    core::Configuration config = manager.getConfig();
    auto logger = api::createLogger(config.logging);

    auto listing = std::make_shared<const DirectoryListing>(fs::path(mediaDir));
    std::vector<std::shared_ptr<streaming::IBackendSession>> sessions;
    for (uint32_t i = 0; i < config.sessions.count; ++i) {
        std::string label = i < config.sessions.labels.size()
            ? config.sessions.labels[i] : "dir-" + std::to_string(i + 1);
        sessions.push_back(std::make_shared<DirectorySession>(listing, label));
    }
    auto catalog = std::make_shared<DirectoryCatalog>(listing);

    auto server = api::MediaServer::create(config, std::move(sessions), catalog, logger);
    if (server.isError()) {
        logger->error("Startup failed: " + server.error().toString(), "Server");
        return 1;
    }
    auto started = server.value()->start();
    if (started.isError()) {
        return 1;
    }
    logger->info("Serving " + std::to_string(listing->names().size()) + " file(s) from " + mediaDir,
                 "Server");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    server.value()->stop();
    return 0;
}
