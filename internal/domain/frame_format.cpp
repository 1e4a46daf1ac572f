#include "frame_format.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace domain {

    static const FormatSpec raw_packed_10_spec =
        { FrameFormat::RAW_PACKED_10, "RAW_PACKED_10", 2, 1, 10, 10, 1 };
    static const FormatSpec raw_packed_12_msb_first_spec =
        { FrameFormat::RAW_PACKED_12_MSB_FIRST, "RAW_PACKED_12_MSB_FIRST", 3, 2, 12, 12, 1 };
    static const FormatSpec raw_packed_12_sbggr_spec =
        { FrameFormat::RAW_PACKED_12_SBGGR, "RAW_PACKED_12_SBGGR", 3, 2, 12, 12, 1 };
    static const FormatSpec raw_unpacked_12_lsb_spec =
        { FrameFormat::RAW_UNPACKED_12_LSB, "RAW_UNPACKED_12_LSB", 2, 1, 12, 12, 1 };
    static const FormatSpec raw_unpacked_12_msb_spec =
        { FrameFormat::RAW_UNPACKED_12_MSB, "RAW_UNPACKED_12_MSB", 2, 1, 12, 12, 1 };
    static const FormatSpec raw10_packed_5_per_4_spec =
        { FrameFormat::RAW10_PACKED_5_PER_4, "RAW10_PACKED_5_PER_4", 5, 4, 10, 10, 1 };
    // raw8 is widened to the 10 bit working depth
    static const FormatSpec raw8_spec =
        { FrameFormat::RAW8, "RAW8", 1, 1, 8, 10, 1 };
    static const FormatSpec rgb888_spec =
        { FrameFormat::RGB888, "RGB888", 3, 1, 8, 8, 3 };
    static const FormatSpec rgb565_spec =
        { FrameFormat::RGB565, "RGB565", 2, 1, 5, 8, 3 };

    const FormatSpec &GetFormatSpec(const FrameFormat format) {
        switch (format) {
            case FrameFormat::RAW_PACKED_10:
                return raw_packed_10_spec;
            case FrameFormat::RAW_PACKED_12_MSB_FIRST:
                return raw_packed_12_msb_first_spec;
            case FrameFormat::RAW_PACKED_12_SBGGR:
                return raw_packed_12_sbggr_spec;
            case FrameFormat::RAW_UNPACKED_12_LSB:
                return raw_unpacked_12_lsb_spec;
            case FrameFormat::RAW_UNPACKED_12_MSB:
                return raw_unpacked_12_msb_spec;
            case FrameFormat::RAW10_PACKED_5_PER_4:
                return raw10_packed_5_per_4_spec;
            case FrameFormat::RAW8:
                return raw8_spec;
            case FrameFormat::RGB888:
                return rgb888_spec;
            case FrameFormat::RGB565:
                return rgb565_spec;
        }
        throw std::invalid_argument("GetFormatSpec: unknown frame format");
    }

    uint64_t SizeFor(const FrameFormat format, const FrameDimensions &dimensions) {
        const auto &spec = GetFormatSpec(format);
        return dimensions.PixelCount() / spec.pixels_per_group * spec.bytes_per_group;
    }

    void ValidateDimensions(const FrameFormat format, const FrameDimensions &dimensions) {
        const auto &spec = GetFormatSpec(format);
        if (dimensions.width == 0 || dimensions.height == 0) {
            throw std::invalid_argument(
                std::string("ValidateDimensions: empty frame dimensions for ") + spec.name
            );
        }
        if (dimensions.width % spec.pixels_per_group != 0) {
            throw std::invalid_argument(
                std::string("ValidateDimensions: width ") + std::to_string(dimensions.width) +
                " is not a multiple of " + std::to_string(spec.pixels_per_group) + " for " + spec.name
            );
        }
    }

    const std::array<FrameFormat, FrameFormatCount> &DetectionOrder() {
        static const std::array<FrameFormat, FrameFormatCount> order = {
            FrameFormat::RGB888,
            FrameFormat::RGB565,
            FrameFormat::RAW8,
            FrameFormat::RAW10_PACKED_5_PER_4,
            FrameFormat::RAW_PACKED_12_MSB_FIRST,
            FrameFormat::RAW_PACKED_12_SBGGR,
            FrameFormat::RAW_PACKED_10,
            FrameFormat::RAW_UNPACKED_12_LSB,
            FrameFormat::RAW_UNPACKED_12_MSB,
        };
        return order;
    }

    std::string ToString(const FrameFormat format) {
        return GetFormatSpec(format).name;
    }

    std::optional<FrameFormat> FormatSelectionFromString(const std::string &name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        if (upper == "AUTO") {
            return std::nullopt;
        }
        for (const auto format : DetectionOrder()) {
            if (upper == GetFormatSpec(format).name) {
                return format;
            }
        }
        throw std::invalid_argument("Unknown frame format: " + name);
    }

    FrameFormat FormatFromString(const std::string &name) {
        auto format = FormatSelectionFromString(name);
        if (!format) {
            throw std::invalid_argument("A concrete frame format is required here, not: " + name);
        }
        return *format;
    }

}
