#ifndef INFRASTRUCTURE_STREAM_FRAMER_HPP
#define INFRASTRUCTURE_STREAM_FRAMER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace infrastructure {

    struct StreamFramerConfig {
        // the literal that precedes every part, e.g. "--raw_frame_boundary"
        [[nodiscard]] virtual std::string get_stream_boundary_marker() const = 0;
        [[nodiscard]] virtual std::size_t get_stream_buffer_ceiling() const = 0;
    };

    typedef std::vector<uint8_t> FramePayload;

    enum class FramerState {
        IDLE,
        ACCUMULATING,
        FRAME_READY,
    };

    /*
     * reassembles multipart parts out of arbitrary sized chunks. every segment that ends at a
     * boundary marker is split at its first blank line; the header block is thrown away and the
     * rest is handed out as a payload. the buffer is bounded by the ceiling: complete parts are
     * extracted first, and a leftover in-flight part above the ceiling is dropped so we stay close to live.
     */
    class StreamFramer {
    public:
        static constexpr const char *DefaultBoundaryMarker = "--raw_frame_boundary";
        static constexpr const char *HeaderTerminator = "\r\n\r\n";

        StreamFramer(std::string boundary_marker, std::size_t buffer_ceiling);
        explicit StreamFramer(const StreamFramerConfig &config);
        StreamFramer (const StreamFramer&) = delete;
        StreamFramer& operator= (const StreamFramer&) = delete;

        [[nodiscard]] std::vector<FramePayload> Feed(const uint8_t *data, std::size_t size);
        [[nodiscard]] std::vector<FramePayload> Feed(const std::vector<uint8_t> &chunk) {
            return Feed(chunk.data(), chunk.size());
        }
        void Reset();
        // also resets, a half read part under the old marker is useless
        void SetBoundaryMarker(std::string boundary_marker);

        [[nodiscard]] FramerState GetState() const {
            return _state;
        }
        [[nodiscard]] const std::string &GetBoundaryMarker() const {
            return _marker;
        }
        [[nodiscard]] std::size_t GetBufferedSize() const {
            return _buffer.size();
        }
        [[nodiscard]] std::size_t GetBufferCeiling() const {
            return _ceiling;
        }
        [[nodiscard]] uint64_t GetOverflowCount() const {
            return _overflow_count;
        }
        [[nodiscard]] uint64_t GetPayloadCount() const {
            return _payload_count;
        }
    private:
        void trimOverflow();
        void extractSegment(std::size_t marker_position, std::vector<FramePayload> &payloads);

        std::string _marker;
        const std::size_t _ceiling;
        std::string _buffer;
        // everything before this offset has already been searched for a marker
        std::size_t _search_from = 0;
        FramerState _state = FramerState::IDLE;
        uint64_t _overflow_count = 0;
        uint64_t _payload_count = 0;
    };

}

#endif //INFRASTRUCTURE_STREAM_FRAMER_HPP
