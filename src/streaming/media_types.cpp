// RangeCast - Seekable media delivery engine
// Media type helpers implementation

#include "rangecast/streaming/media_types.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace rangecast {
namespace streaming {

namespace {

const std::map<std::string, std::string>& extensionMimeTypes() {
    static const std::map<std::string, std::string> types = {
        {".mp4", "video/mp4"},
        {".m4v", "video/mp4"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".avi", "video/avi"},
        {".mov", "video/quicktime"},
        {".flv", "video/x-flv"},
        {".wmv", "video/x-ms-wmv"},
        {".ts", "video/mp2t"},
        {".mp3", "audio/mpeg"},
        {".m4a", "audio/mp4"},
        {".flac", "audio/flac"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".aac", "audio/aac"},
        {".srt", "application/x-subrip"},
        {".vtt", "text/vtt"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".txt", "text/plain"},
    };
    return types;
}

const std::set<std::string>& cacheableMimeTypes() {
    static const std::set<std::string> types = {
        "video/mp4", "video/x-matroska", "video/webm", "video/avi",
        "video/quicktime", "video/x-flv", "video/x-ms-wmv",
        "audio/mpeg", "audio/mp4", "audio/flac", "audio/wav",
        "audio/ogg", "audio/aac",
    };
    return types;
}

const std::set<std::string>& cacheableExtensions() {
    static const std::set<std::string> extensions = {
        ".mp4", ".mkv", ".webm", ".avi", ".mov", ".flv", ".wmv",
        ".mp3", ".m4a", ".flac", ".wav", ".ogg", ".aac",
    };
    return extensions;
}

std::string lowerExtension(const std::string& fileName) {
    size_t dot = fileName.rfind('.');
    if (dot == std::string::npos || fileName.find('/', dot) != std::string::npos) {
        return "";
    }
    std::string ext = fileName.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // anonymous namespace

std::string guessMimeType(const std::string& fileName) {
    const auto& types = extensionMimeTypes();
    auto it = types.find(lowerExtension(fileName));
    return it != types.end() ? it->second : DEFAULT_MIME_TYPE;
}

bool isCacheableMedia(const std::string& mimeType, const std::string& fileName) {
    if (!mimeType.empty() && cacheableMimeTypes().count(mimeType) > 0) {
        return true;
    }
    if (!fileName.empty()) {
        return cacheableExtensions().count(lowerExtension(fileName)) > 0;
    }
    return false;
}

} // namespace streaming
} // namespace rangecast
