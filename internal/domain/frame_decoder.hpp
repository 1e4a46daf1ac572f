#ifndef DOMAIN_FRAME_DECODER_HPP
#define DOMAIN_FRAME_DECODER_HPP

#include <stdexcept>
#include <string>
#include <cstdint>

#include "frame.hpp"

namespace domain {

    class DecodeError: public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class InsufficientDataError: public DecodeError {
    public:
        InsufficientDataError(FrameFormat format, uint64_t expected, uint64_t actual):
            DecodeError(
                "Insufficient data for " + ToString(format) + ": expected " + std::to_string(expected) +
                " bytes, got " + std::to_string(actual)
            ),
            _expected(expected),
            _actual(actual)
        {}
        [[nodiscard]] uint64_t GetExpected() const {
            return _expected;
        }
        [[nodiscard]] uint64_t GetActual() const {
            return _actual;
        }
    private:
        uint64_t _expected;
        uint64_t _actual;
    };

    class UnrecognizedFormatError: public DecodeError {
    public:
        explicit UnrecognizedFormatError(uint64_t byte_count):
            DecodeError("No frame format matches " + std::to_string(byte_count) + " bytes"),
            _byte_count(byte_count)
        {}
        [[nodiscard]] uint64_t GetByteCount() const {
            return _byte_count;
        }
    private:
        uint64_t _byte_count;
    };

    /*
     * turns the packed bytes of one frame into a PixelGrid of exactly the frame's dimensions.
     * stateless; safe to share between threads.
     */
    class FrameDecoder {
    public:
        // uses the format the frame carries; throws UnrecognizedFormatError if it carries none
        [[nodiscard]] PixelGridPtr Decode(const RawFrame &frame) const;
        [[nodiscard]] PixelGridPtr Decode(const RawFrame &frame, FrameFormat format) const;
    };

}

#endif //DOMAIN_FRAME_DECODER_HPP
