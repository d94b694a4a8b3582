// RangeCast - Seekable media delivery engine
// Series ordering implementation

#include "rangecast/streaming/series.hpp"

#include <cctype>
#include <regex>

namespace rangecast {
namespace streaming {

namespace {

// A leading space is prepended to the name so that a marker at the very
// start still has a separator in front of it.
const std::regex& seasonEpisodePattern() {
    static const std::regex pattern(
        R"(^(.*?)[ ._\-\[\(]+s(\d{1,2})[ ._\-]*e(\d{1,4})(?!\d))",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& episodePattern() {
    static const std::regex pattern(
        R"(^(.*?)[ ._\-\[\(]+(?:episode|ep\.?|part|e)[ ._\-]*(\d{1,4})(?!\d))",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

std::string stripExtension(const std::string& fileName) {
    auto dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || fileName.size() - dot > 5) {
        return fileName;
    }
    return fileName.substr(0, dot);
}

/// Lowercase, separators collapsed to single spaces, trimmed.
std::string normalizeGroup(const std::string& text) {
    std::string result;
    bool pendingSpace = false;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pendingSpace && !result.empty()) {
                result += ' ';
            }
            pendingSpace = false;
            result += static_cast<char>(std::tolower(uc));
        } else {
            pendingSpace = true;
        }
    }
    return result;
}

} // anonymous namespace

std::optional<int64_t> NextIndexOrdering::next(const SeriesPosition& position) const {
    return position.index + 1;
}

std::optional<SeriesPosition> parseSeriesPosition(const std::string& fileName) {
    const std::string name = " " + stripExtension(fileName);
    std::smatch match;

    if (std::regex_search(name, match, seasonEpisodePattern())) {
        SeriesPosition position;
        std::string group = normalizeGroup(match[1].str());
        std::string season = "s" + std::to_string(std::stoi(match[2].str()));
        position.groupKey = group.empty() ? season : group + " " + season;
        position.index = std::stoll(match[3].str());
        return position;
    }

    if (std::regex_search(name, match, episodePattern())) {
        SeriesPosition position;
        position.groupKey = normalizeGroup(match[1].str());
        position.index = std::stoll(match[2].str());
        return position;
    }

    return std::nullopt;
}

std::optional<SeriesPosition> seriesPositionOf(const ObjectInfo& info) {
    if (info.series) {
        return info.series;
    }
    return parseSeriesPosition(info.fileName);
}

} // namespace streaming
} // namespace rangecast
