#include "frame_decoder.hpp"

namespace domain {

    static inline uint16_t read_le16(const uint8_t *bytes) {
        return static_cast<uint16_t>(bytes[0] | (bytes[1] << 8));
    }

    /*
     * mipi csi-2 raw10: [P0 9:2][P1 9:2][P2 9:2][P3 9:2][P3 1:0 P2 1:0 P1 1:0 P0 1:0]
     */
    static void unpack_raw10_5_per_4(const uint8_t *packed, uint16_t *unpacked, uint64_t pixel_count) {
        for (uint64_t i = 0; i < pixel_count; i += 4) {
            const uint8_t *group = packed + (i / 4) * 5;
            const uint8_t low_bits = group[4];
            unpacked[i + 0] = static_cast<uint16_t>((group[0] << 2) | ((low_bits >> 0) & 0x3));
            unpacked[i + 1] = static_cast<uint16_t>((group[1] << 2) | ((low_bits >> 2) & 0x3));
            unpacked[i + 2] = static_cast<uint16_t>((group[2] << 2) | ((low_bits >> 4) & 0x3));
            unpacked[i + 3] = static_cast<uint16_t>((group[3] << 2) | ((low_bits >> 6) & 0x3));
        }
    }

    // [P0 11:4][P1 11:4][P1 3:0 | P0 3:0]
    static void unpack_raw12_msb_first(const uint8_t *packed, uint16_t *unpacked, uint64_t pixel_count) {
        for (uint64_t i = 0; i < pixel_count; i += 2) {
            const uint8_t *group = packed + (i / 2) * 3;
            unpacked[i + 0] = static_cast<uint16_t>((group[0] << 4) | (group[2] & 0x0F));
            unpacked[i + 1] = static_cast<uint16_t>((group[1] << 4) | ((group[2] >> 4) & 0x0F));
        }
    }

    // [P0 7:0][P1 7:0][P1 11:8 | P0 11:8]
    static void unpack_raw12_sbggr(const uint8_t *packed, uint16_t *unpacked, uint64_t pixel_count) {
        for (uint64_t i = 0; i < pixel_count; i += 2) {
            const uint8_t *group = packed + (i / 2) * 3;
            unpacked[i + 0] = static_cast<uint16_t>(((group[2] & 0x0F) << 8) | group[0]);
            unpacked[i + 1] = static_cast<uint16_t>(((group[2] >> 4) << 8) | group[1]);
        }
    }

    static void unpack_word_masked(
        const uint8_t *packed, uint16_t *unpacked, uint64_t pixel_count, uint16_t mask
    ) {
        for (uint64_t i = 0; i < pixel_count; i++) {
            unpacked[i] = read_le16(packed + i * 2) & mask;
        }
    }

    static void unpack_word_msb_aligned(const uint8_t *packed, uint16_t *unpacked, uint64_t pixel_count) {
        for (uint64_t i = 0; i < pixel_count; i++) {
            unpacked[i] = read_le16(packed + i * 2) >> 4;
        }
    }

    static void unpack_raw8(const uint8_t *packed, uint16_t *unpacked, uint64_t pixel_count, int shift) {
        for (uint64_t i = 0; i < pixel_count; i++) {
            unpacked[i] = static_cast<uint16_t>(packed[i] << shift);
        }
    }

    // the isp writes b, g, r
    static void unpack_bgr888(const uint8_t *packed, uint16_t *rgb, uint64_t pixel_count) {
        for (uint64_t i = 0; i < pixel_count; i++) {
            const uint8_t *pixel = packed + i * 3;
            rgb[i * 3 + 0] = pixel[2];
            rgb[i * 3 + 1] = pixel[1];
            rgb[i * 3 + 2] = pixel[0];
        }
    }

    static void unpack_rgb565(const uint8_t *packed, uint16_t *rgb, uint64_t pixel_count) {
        for (uint64_t i = 0; i < pixel_count; i++) {
            const uint16_t word = read_le16(packed + i * 2);
            const uint16_t r5 = (word >> 11) & 0x1F;
            const uint16_t g6 = (word >> 5) & 0x3F;
            const uint16_t b5 = word & 0x1F;
            // replicate the top bits into the vacated low bits so full scale stays full scale
            rgb[i * 3 + 0] = static_cast<uint16_t>((r5 << 3) | (r5 >> 2));
            rgb[i * 3 + 1] = static_cast<uint16_t>((g6 << 2) | (g6 >> 4));
            rgb[i * 3 + 2] = static_cast<uint16_t>((b5 << 3) | (b5 >> 2));
        }
    }

    PixelGridPtr FrameDecoder::Decode(const RawFrame &frame) const {
        const auto format = frame.GetFormat();
        if (!format) {
            throw UnrecognizedFormatError(frame.GetSize());
        }
        return Decode(frame, *format);
    }

    PixelGridPtr FrameDecoder::Decode(const RawFrame &frame, const FrameFormat format) const {
        const auto &dimensions = frame.GetDimensions();
        ValidateDimensions(format, dimensions);

        const auto expected = SizeFor(format, dimensions);
        if (frame.GetSize() < expected) {
            throw InsufficientDataError(format, expected, frame.GetSize());
        }

        const auto &spec = GetFormatSpec(format);
        auto grid = std::make_shared<PixelGrid>(dimensions, spec.channels, spec.sample_bit_depth);
        const uint8_t *packed = frame.GetMemory();
        uint16_t *out = grid->Data();
        const auto pixel_count = dimensions.PixelCount();

        switch (format) {
            case FrameFormat::RAW_PACKED_10:
                unpack_word_masked(packed, out, pixel_count, 0x03FF);
                break;
            case FrameFormat::RAW_PACKED_12_MSB_FIRST:
                unpack_raw12_msb_first(packed, out, pixel_count);
                break;
            case FrameFormat::RAW_PACKED_12_SBGGR:
                unpack_raw12_sbggr(packed, out, pixel_count);
                break;
            case FrameFormat::RAW_UNPACKED_12_LSB:
                unpack_word_masked(packed, out, pixel_count, 0x0FFF);
                break;
            case FrameFormat::RAW_UNPACKED_12_MSB:
                unpack_word_msb_aligned(packed, out, pixel_count);
                break;
            case FrameFormat::RAW10_PACKED_5_PER_4:
                unpack_raw10_5_per_4(packed, out, pixel_count);
                break;
            case FrameFormat::RAW8:
                unpack_raw8(packed, out, pixel_count, spec.sample_bit_depth - spec.wire_bit_depth);
                break;
            case FrameFormat::RGB888:
                unpack_bgr888(packed, out, pixel_count);
                break;
            case FrameFormat::RGB565:
                unpack_rgb565(packed, out, pixel_count);
                break;
        }
        return grid;
    }

}
