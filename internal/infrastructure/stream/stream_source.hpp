#ifndef INFRASTRUCTURE_STREAM_SOURCE_HPP
#define INFRASTRUCTURE_STREAM_SOURCE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>

#include "domain/frame_format.hpp"

namespace infrastructure {

    // connection refused, reset, timed out, cancelled or simply over; always worth a retry
    class TransportError: public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class StreamSourceType {
        HTTP,
        FILE,
    };

    struct StreamSourceConfig {
        [[nodiscard]] virtual StreamSourceType get_stream_source_type() const = 0;
        [[nodiscard]] virtual std::string get_stream_host() const = 0;
        [[nodiscard]] virtual int get_stream_port() const = 0;
        [[nodiscard]] virtual std::string get_stream_path() const = 0;
        [[nodiscard]] virtual std::string get_stream_replay_file() const = 0;
        [[nodiscard]] virtual int get_stream_connect_timeout_ms() const = 0;
        [[nodiscard]] virtual int get_stream_read_timeout_ms() const = 0;
    };

    class StreamSource;
    typedef std::shared_ptr<StreamSource> StreamSourcePtr;

    /*
     * a blocking byte source driven from one ingestion thread. every failure is reported as a
     * TransportError. Cancel may be called from any thread and makes the current and every later
     * call fail until Resume.
     */
    class StreamSource {
    public:
        [[nodiscard]] static StreamSourcePtr Create(const StreamSourceConfig &config);
        virtual ~StreamSource() = default;
        virtual void Connect() = 0;
        // reads at most size bytes; 0 is a valid answer
        [[nodiscard]] virtual std::size_t ReadSome(uint8_t *data, std::size_t size) = 0;
        virtual void Disconnect() = 0;
        virtual void Cancel() = 0;
        virtual void Resume() = 0;
        // marker announced by the other side, empty if it announced none
        [[nodiscard]] virtual std::string GetBoundaryMarker() const {
            return "";
        }
        [[nodiscard]] virtual std::optional<domain::FrameDimensions> GetAnnouncedDimensions() const {
            return std::nullopt;
        }
    };

}

#endif //INFRASTRUCTURE_STREAM_SOURCE_HPP
