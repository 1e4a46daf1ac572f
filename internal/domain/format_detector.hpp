#ifndef DOMAIN_FORMAT_DETECTOR_HPP
#define DOMAIN_FORMAT_DETECTOR_HPP

#include <optional>
#include <vector>
#include <cstdint>

#include "frame_format.hpp"

namespace domain {

    /*
     * guesses the frame format from a byte count. the first candidate (in detection order) whose
     * size at the given dimensions is within the tolerance wins. the detector keeps no per-stream
     * state; whoever owns the stream decides whether to pin the answer.
     */
    class FormatDetector {
    public:
        static constexpr uint64_t DefaultToleranceBytes = 1000;

        explicit FormatDetector(uint64_t tolerance_bytes = DefaultToleranceBytes);
        // candidates are re-sorted into detection order
        FormatDetector(uint64_t tolerance_bytes, const std::vector<FrameFormat> &candidates);

        [[nodiscard]] std::optional<FrameFormat> Detect(uint64_t byte_count, const FrameDimensions &dimensions) const;
        [[nodiscard]] FrameFormat DetectOr(
            uint64_t byte_count, const FrameDimensions &dimensions, FrameFormat fallback
        ) const;
        [[nodiscard]] bool Matches(FrameFormat format, uint64_t byte_count, const FrameDimensions &dimensions) const;

        [[nodiscard]] uint64_t GetToleranceBytes() const {
            return _tolerance_bytes;
        }
        [[nodiscard]] const std::vector<FrameFormat> &GetCandidates() const {
            return _candidates;
        }
    private:
        const uint64_t _tolerance_bytes;
        std::vector<FrameFormat> _candidates;
    };

}

#endif //DOMAIN_FORMAT_DETECTOR_HPP
