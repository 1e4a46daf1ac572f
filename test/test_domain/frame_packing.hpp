#ifndef TEST_DOMAIN_FRAME_PACKING_HPP
#define TEST_DOMAIN_FRAME_PACKING_HPP

#include <vector>
#include <cstdint>
#include <cstddef>

// inverse of the unpackers, so a known grid can be put on the wire and read back

inline std::vector<uint16_t> make_ramp(std::size_t count, uint16_t max_value, uint32_t seed = 7) {
    std::vector<uint16_t> samples(count);
    uint32_t state = seed;
    for (std::size_t i = 0; i < count; i++) {
        state = state * 1103515245u + 12345u;
        samples[i] = static_cast<uint16_t>((state >> 8) % (static_cast<uint32_t>(max_value) + 1));
    }
    // make sure both ends of the range show up
    if (count > 1) {
        samples[0] = 0;
        samples[1] = max_value;
    }
    return samples;
}

inline std::vector<uint8_t> pack_raw10_5_per_4(const std::vector<uint16_t> &pixels) {
    std::vector<uint8_t> packed;
    packed.reserve(pixels.size() / 4 * 5);
    for (std::size_t i = 0; i < pixels.size(); i += 4) {
        uint8_t low_bits = 0;
        for (std::size_t n = 0; n < 4; n++) {
            packed.push_back(static_cast<uint8_t>(pixels[i + n] >> 2));
            low_bits |= static_cast<uint8_t>((pixels[i + n] & 0x3) << (2 * n));
        }
        packed.push_back(low_bits);
    }
    return packed;
}

inline std::vector<uint8_t> pack_raw12_msb_first(const std::vector<uint16_t> &pixels) {
    std::vector<uint8_t> packed;
    packed.reserve(pixels.size() / 2 * 3);
    for (std::size_t i = 0; i < pixels.size(); i += 2) {
        packed.push_back(static_cast<uint8_t>(pixels[i] >> 4));
        packed.push_back(static_cast<uint8_t>(pixels[i + 1] >> 4));
        packed.push_back(static_cast<uint8_t>((pixels[i] & 0x0F) | ((pixels[i + 1] & 0x0F) << 4)));
    }
    return packed;
}

inline std::vector<uint8_t> pack_raw12_sbggr(const std::vector<uint16_t> &pixels) {
    std::vector<uint8_t> packed;
    packed.reserve(pixels.size() / 2 * 3);
    for (std::size_t i = 0; i < pixels.size(); i += 2) {
        packed.push_back(static_cast<uint8_t>(pixels[i] & 0xFF));
        packed.push_back(static_cast<uint8_t>(pixels[i + 1] & 0xFF));
        packed.push_back(static_cast<uint8_t>(((pixels[i] >> 8) & 0x0F) | (((pixels[i + 1] >> 8) & 0x0F) << 4)));
    }
    return packed;
}

// high_bits lands above the significant bits and must be ignored by the decoder
inline std::vector<uint8_t> pack_le16(const std::vector<uint16_t> &pixels, int shift = 0, uint16_t high_bits = 0) {
    std::vector<uint8_t> packed;
    packed.reserve(pixels.size() * 2);
    for (const auto pixel : pixels) {
        const auto word = static_cast<uint16_t>((pixel << shift) | high_bits);
        packed.push_back(static_cast<uint8_t>(word & 0xFF));
        packed.push_back(static_cast<uint8_t>(word >> 8));
    }
    return packed;
}

// rgb in, b g r out like the isp writes it
inline std::vector<uint8_t> pack_bgr888(const std::vector<uint16_t> &rgb) {
    std::vector<uint8_t> packed;
    packed.reserve(rgb.size());
    for (std::size_t i = 0; i < rgb.size(); i += 3) {
        packed.push_back(static_cast<uint8_t>(rgb[i + 2]));
        packed.push_back(static_cast<uint8_t>(rgb[i + 1]));
        packed.push_back(static_cast<uint8_t>(rgb[i]));
    }
    return packed;
}

inline std::vector<uint8_t> pack_rgb565(const std::vector<uint16_t> &rgb) {
    std::vector<uint8_t> packed;
    packed.reserve(rgb.size() / 3 * 2);
    for (std::size_t i = 0; i < rgb.size(); i += 3) {
        const auto word = static_cast<uint16_t>(((rgb[i] >> 3) << 11) | ((rgb[i + 1] >> 2) << 5) | (rgb[i + 2] >> 3));
        packed.push_back(static_cast<uint8_t>(word & 0xFF));
        packed.push_back(static_cast<uint8_t>(word >> 8));
    }
    return packed;
}

#endif //TEST_DOMAIN_FRAME_PACKING_HPP
