#ifndef INFRASTRUCTURE_STREAM_HTTP_STREAM_SOURCE_HPP
#define INFRASTRUCTURE_STREAM_HTTP_STREAM_SOURCE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "utils/asio.hpp"
#include "domain/frame_format.hpp"

#include "stream_source.hpp"

namespace infrastructure {

    /*
     * GET on the streamer's multipart endpoint, body read incrementally into the caller's memory.
     * every asynchronous step is run to completion on a private io_context from the calling thread,
     * so the beast stream timeouts double as the connect / read timeouts of the session.
     */
    class HttpStreamSource: public StreamSource {
    public:
        explicit HttpStreamSource(const StreamSourceConfig &config);
        HttpStreamSource() = delete;
        HttpStreamSource (const HttpStreamSource&) = delete;
        HttpStreamSource& operator= (const HttpStreamSource&) = delete;
        ~HttpStreamSource() override;

        void Connect() override;
        [[nodiscard]] std::size_t ReadSome(uint8_t *data, std::size_t size) override;
        void Disconnect() override;
        void Cancel() override;
        void Resume() override;
        [[nodiscard]] std::string GetBoundaryMarker() const override {
            return _boundary_marker;
        }
        // taken from the X-Frame-Width / X-Frame-Height headers when the streamer sends them
        [[nodiscard]] std::optional<domain::FrameDimensions> GetAnnouncedDimensions() const override {
            return _announced_dimensions;
        }
    private:
        void runOperation(const char *what);
        void readResponseHeaders();

        const std::string _host;
        const std::string _port;
        const std::string _path;
        const std::chrono::milliseconds _connect_timeout;
        const std::chrono::milliseconds _read_timeout;

        net::io_context _context;
        tcp::resolver _resolver;
        std::unique_ptr<beast::tcp_stream> _stream = nullptr;
        beast::flat_buffer _read_buffer;
        http::request<http::empty_body> _request;
        std::unique_ptr<http::response_parser<http::buffer_body>> _parser = nullptr;

        // written by completion handlers, read once the context ran dry
        error_code _operation_ec;

        std::atomic<bool> _is_cancelled = { false };
        std::string _boundary_marker;
        std::optional<domain::FrameDimensions> _announced_dimensions = std::nullopt;
    };

}

#endif //INFRASTRUCTURE_STREAM_HTTP_STREAM_SOURCE_HPP
