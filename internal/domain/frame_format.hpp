#ifndef DOMAIN_FRAME_FORMAT_HPP
#define DOMAIN_FRAME_FORMAT_HPP

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

namespace domain {

    enum class FrameFormat {
        RAW_PACKED_10,           // 10 bit sample in a little-endian 16 bit word
        RAW_PACKED_12_MSB_FIRST, // 3 bytes -> 2 pixels, high bits in bytes 0 and 1
        RAW_PACKED_12_SBGGR,     // 3 bytes -> 2 pixels, mipi raw12 low bits first
        RAW_UNPACKED_12_LSB,
        RAW_UNPACKED_12_MSB,
        RAW10_PACKED_5_PER_4,    // mipi csi-2 raw10, 5 bytes -> 4 pixels
        RAW8,
        RGB888,
        RGB565,
    };

    constexpr std::size_t FrameFormatCount = 9;

    struct FrameDimensions {
        uint32_t width = 0;
        uint32_t height = 0;

        [[nodiscard]] uint64_t PixelCount() const {
            return static_cast<uint64_t>(width) * height;
        }
        bool operator==(const FrameDimensions &other) const = default;
    };

    struct FormatSpec {
        FrameFormat format;
        const char *name;
        uint32_t bytes_per_group;
        uint32_t pixels_per_group;
        // depth of the samples on the wire
        int wire_bit_depth;
        // depth of the samples the decoder hands out
        int sample_bit_depth;
        // 3 for formats the isp already demosaiced
        int channels;
    };

    [[nodiscard]] const FormatSpec &GetFormatSpec(FrameFormat format);

    // expected byte count of one frame; dimensions are assumed to be valid for the format
    [[nodiscard]] uint64_t SizeFor(FrameFormat format, const FrameDimensions &dimensions);

    [[nodiscard]] inline bool IsDemosaiced(FrameFormat format) {
        return GetFormatSpec(format).channels == 3;
    }

    // throws std::invalid_argument when the width is not a whole number of pixel groups
    void ValidateDimensions(FrameFormat format, const FrameDimensions &dimensions);

    // pre-demosaiced formats first, then raw, in the order ties are broken
    [[nodiscard]] const std::array<FrameFormat, FrameFormatCount> &DetectionOrder();

    [[nodiscard]] std::string ToString(FrameFormat format);

    // "auto" selects detection and yields std::nullopt; unknown names throw std::invalid_argument
    [[nodiscard]] std::optional<FrameFormat> FormatSelectionFromString(const std::string &name);

    [[nodiscard]] FrameFormat FormatFromString(const std::string &name);

}

#endif //DOMAIN_FRAME_FORMAT_HPP
