// RangeCast - Seekable media delivery engine
// Series ordering - Predicts the item a viewer will watch next

#ifndef RANGECAST_STREAMING_SERIES_HPP
#define RANGECAST_STREAMING_SERIES_HPP

#include "rangecast/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rangecast {
namespace streaming {

/**
 * @brief Strategy deciding which series item follows another.
 */
class ISeriesOrdering {
public:
    virtual ~ISeriesOrdering() = default;

    /**
     * @brief Index of the item expected after position.
     * @return std::nullopt when nothing should be predicted
     */
    virtual std::optional<int64_t> next(const SeriesPosition& position) const = 0;
};

/**
 * @brief Default ordering: index + 1 within the same group.
 */
class NextIndexOrdering : public ISeriesOrdering {
public:
    std::optional<int64_t> next(const SeriesPosition& position) const override;
};

/**
 * @brief Derive a series position from a file name.
 *
 * Recognized markers (case-insensitive): "S01E02", "E02", "Ep 2", "Ep.2",
 * "Episode 2" and "Part 2". The group key is the normalized text before the
 * marker; a season number, when present, is appended as " s<N>".
 *
 * @code
 * parseSeriesPosition("My.Show.S01E02.mkv");  // {"my show s1", 2}
 * parseSeriesPosition("Lecture - Ep 7.mp4");  // {"lecture", 7}
 * @endcode
 */
std::optional<SeriesPosition> parseSeriesPosition(const std::string& fileName);

/**
 * @brief Catalog position if present, otherwise parsed from the file name.
 */
std::optional<SeriesPosition> seriesPositionOf(const ObjectInfo& info);

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_SERIES_HPP
