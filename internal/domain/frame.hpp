#ifndef DOMAIN_FRAME_HPP
#define DOMAIN_FRAME_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "frame_format.hpp"

namespace domain {

    /*
     * undecoded frame as it came off a file or the wire. immutable once built; the byte count may be
     * larger than the format needs, the decoder ignores the tail.
     */
    class RawFrame {
    public:
        RawFrame(
            std::vector<uint8_t> &&bytes, const FrameDimensions &dimensions,
            std::optional<FrameFormat> format = std::nullopt
        ):
            _bytes(std::move(bytes)),
            _dimensions(dimensions),
            _format(format)
        {}
        RawFrame() = delete;
        RawFrame (const RawFrame&) = delete;
        RawFrame& operator= (const RawFrame&) = delete;

        [[nodiscard]] const uint8_t *GetMemory() const {
            return _bytes.data();
        }
        [[nodiscard]] std::size_t GetSize() const {
            return _bytes.size();
        }
        [[nodiscard]] const std::vector<uint8_t> &GetBytes() const {
            return _bytes;
        }
        [[nodiscard]] const FrameDimensions &GetDimensions() const {
            return _dimensions;
        }
        [[nodiscard]] std::optional<FrameFormat> GetFormat() const {
            return _format;
        }
    private:
        const std::vector<uint8_t> _bytes;
        const FrameDimensions _dimensions;
        const std::optional<FrameFormat> _format;
    };

    typedef std::shared_ptr<const RawFrame> RawFramePtr;

    /*
     * decoded samples, row major, channels interleaved. bayer data has one channel at the
     * format's sample depth; demosaiced data has three 8 bit channels in r, g, b order.
     */
    class PixelGrid {
    public:
        PixelGrid(const FrameDimensions &dimensions, const int channels, const int bit_depth):
            _dimensions(dimensions),
            _channels(channels),
            _bit_depth(bit_depth),
            _samples(dimensions.PixelCount() * channels, 0)
        {}

        [[nodiscard]] uint32_t GetWidth() const {
            return _dimensions.width;
        }
        [[nodiscard]] uint32_t GetHeight() const {
            return _dimensions.height;
        }
        [[nodiscard]] const FrameDimensions &GetDimensions() const {
            return _dimensions;
        }
        [[nodiscard]] int GetChannels() const {
            return _channels;
        }
        [[nodiscard]] int GetBitDepth() const {
            return _bit_depth;
        }
        [[nodiscard]] uint16_t GetMaxValue() const {
            return static_cast<uint16_t>((1u << _bit_depth) - 1);
        }
        [[nodiscard]] uint16_t At(uint32_t row, uint32_t col, int channel = 0) const {
            return _samples[(static_cast<std::size_t>(row) * _dimensions.width + col) * _channels + channel];
        }
        [[nodiscard]] uint16_t *Data() {
            return _samples.data();
        }
        [[nodiscard]] const std::vector<uint16_t> &GetSamples() const {
            return _samples;
        }
    private:
        const FrameDimensions _dimensions;
        const int _channels;
        const int _bit_depth;
        std::vector<uint16_t> _samples;
    };

    typedef std::shared_ptr<PixelGrid> PixelGridPtr;

}

#endif //DOMAIN_FRAME_HPP
