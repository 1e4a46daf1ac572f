#include "stream_framer.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace infrastructure {

    StreamFramer::StreamFramer(std::string boundary_marker, const std::size_t buffer_ceiling):
        _marker(std::move(boundary_marker)),
        _ceiling(buffer_ceiling)
    {
        if (_marker.empty()) {
            throw std::invalid_argument("StreamFramer: boundary marker must not be empty");
        }
        if (_ceiling < _marker.size()) {
            throw std::invalid_argument("StreamFramer: buffer ceiling is smaller than the boundary marker");
        }
    }

    StreamFramer::StreamFramer(const StreamFramerConfig &config):
        StreamFramer(config.get_stream_boundary_marker(), config.get_stream_buffer_ceiling())
    {}

    void StreamFramer::Reset() {
        _buffer.clear();
        _buffer.shrink_to_fit();
        _search_from = 0;
        _state = FramerState::IDLE;
    }

    void StreamFramer::SetBoundaryMarker(std::string boundary_marker) {
        if (boundary_marker.empty()) {
            throw std::invalid_argument("StreamFramer: boundary marker must not be empty");
        }
        _marker = std::move(boundary_marker);
        Reset();
    }

    std::vector<FramePayload> StreamFramer::Feed(const uint8_t *data, const std::size_t size) {
        std::vector<FramePayload> payloads;
        if (size == 0) {
            return payloads;
        }
        _buffer.append(reinterpret_cast<const char *>(data), size);

        while (true) {
            const auto position = _buffer.find(_marker, _search_from);
            if (position == std::string::npos) {
                // a marker may straddle the end of the buffer; search its possible start next time
                _search_from = _buffer.size() >= _marker.size() ? _buffer.size() - _marker.size() + 1 : 0;
                break;
            }
            extractSegment(position, payloads);
            _buffer.erase(0, position + _marker.size());
            _search_from = 0;
        }

        // only the part still in flight counts against the ceiling
        if (_buffer.size() > _ceiling) {
            trimOverflow();
        }

        if (!payloads.empty()) {
            _state = FramerState::FRAME_READY;
        } else {
            _state = _buffer.empty() ? FramerState::IDLE : FramerState::ACCUMULATING;
        }
        return payloads;
    }

    void StreamFramer::extractSegment(const std::size_t marker_position, std::vector<FramePayload> &payloads) {
        const std::string_view segment(_buffer.data(), marker_position);
        const auto header_end = segment.find(HeaderTerminator);
        if (header_end == std::string_view::npos) {
            // preamble or a part without headers; nothing we can use
            return;
        }
        const auto payload = segment.substr(header_end + std::char_traits<char>::length(HeaderTerminator));
        if (payload.empty()) {
            return;
        }
        payloads.emplace_back(
            reinterpret_cast<const uint8_t *>(payload.data()),
            reinterpret_cast<const uint8_t *>(payload.data()) + payload.size()
        );
        _payload_count++;
    }

    void StreamFramer::trimOverflow() {
        const auto before = _buffer.size();
        // every complete part is gone already; keep just enough to complete a marker split across chunks
        const auto keep = std::min(_buffer.size(), _marker.size() - 1);
        _buffer.erase(0, _buffer.size() - keep);
        _search_from = 0;
        _overflow_count++;
        std::cout << "StreamFramer: buffer overflow at " << before << " bytes - trimmed to " <<
            _buffer.size() << " bytes" << std::endl;
    }

}
