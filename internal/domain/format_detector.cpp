#include "format_detector.hpp"

#include <algorithm>
#include <iostream>

namespace domain {

    FormatDetector::FormatDetector(const uint64_t tolerance_bytes):
        _tolerance_bytes(tolerance_bytes),
        _candidates(DetectionOrder().begin(), DetectionOrder().end())
    {}

    FormatDetector::FormatDetector(const uint64_t tolerance_bytes, const std::vector<FrameFormat> &candidates):
        _tolerance_bytes(tolerance_bytes)
    {
        for (const auto format : DetectionOrder()) {
            if (std::find(candidates.begin(), candidates.end(), format) != candidates.end()) {
                _candidates.push_back(format);
            }
        }
    }

    bool FormatDetector::Matches(
        const FrameFormat format, const uint64_t byte_count, const FrameDimensions &dimensions
    ) const {
        const auto &spec = GetFormatSpec(format);
        if (dimensions.PixelCount() == 0 || dimensions.width % spec.pixels_per_group != 0) {
            return false;
        }
        const auto expected = SizeFor(format, dimensions);
        const auto difference = byte_count > expected ? byte_count - expected : expected - byte_count;
        // the slack itself is already too far off; an exact size always matches
        return difference == 0 || difference < _tolerance_bytes;
    }

    std::optional<FrameFormat> FormatDetector::Detect(
        const uint64_t byte_count, const FrameDimensions &dimensions
    ) const {
        for (const auto format : _candidates) {
            if (Matches(format, byte_count, dimensions)) {
                return format;
            }
        }
        return std::nullopt;
    }

    FrameFormat FormatDetector::DetectOr(
        const uint64_t byte_count, const FrameDimensions &dimensions, const FrameFormat fallback
    ) const {
        const auto format = Detect(byte_count, dimensions);
        if (format) {
            return *format;
        }
        std::cerr << "FormatDetector: no format matches " << byte_count << " bytes at " <<
            dimensions.width << "x" << dimensions.height << "; assuming " << ToString(fallback) << std::endl;
        return fallback;
    }

}
