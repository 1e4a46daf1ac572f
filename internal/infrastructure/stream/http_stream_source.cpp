#include "http_stream_source.hpp"

#include <iostream>

namespace infrastructure {

    static std::string boundary_marker_from_content_type(const std::string &content_type) {
        const auto key = content_type.find("boundary=");
        if (key == std::string::npos) {
            return "";
        }
        auto token = content_type.substr(key + 9);
        const auto end = token.find(';');
        if (end != std::string::npos) {
            token = token.substr(0, end);
        }
        while (!token.empty() && (token.back() == ' ' || token.back() == '"')) {
            token.pop_back();
        }
        while (!token.empty() && (token.front() == ' ' || token.front() == '"')) {
            token.erase(0, 1);
        }
        if (token.empty()) {
            return "";
        }
        // some servers already include the dashes in the parameter
        if (token.rfind("--", 0) == 0) {
            return token;
        }
        return "--" + token;
    }

    HttpStreamSource::HttpStreamSource(const StreamSourceConfig &config):
        _host(config.get_stream_host()),
        _port(std::to_string(config.get_stream_port())),
        _path(config.get_stream_path()),
        _connect_timeout(config.get_stream_connect_timeout_ms()),
        _read_timeout(config.get_stream_read_timeout_ms()),
        _resolver(_context)
    {}

    HttpStreamSource::~HttpStreamSource() {
        Disconnect();
    }

    void HttpStreamSource::Connect() {
        Disconnect();
        if (_is_cancelled) {
            throw TransportError("HttpStreamSource: cancelled before connect");
        }

        error_code ec;
        const auto endpoints = _resolver.resolve(_host, _port, ec);
        if (ec) {
            throw TransportError("HttpStreamSource: couldn't resolve " + _host + ": " + ec.message());
        }

        std::cout << "HttpStreamSource: connecting to http://" << _host << ":" << _port << _path << std::endl;
        _stream = std::make_unique<beast::tcp_stream>(_context);
        _stream->expires_after(_connect_timeout);
        _stream->async_connect(
            endpoints,
            [this](error_code ec, const tcp::endpoint &) {
                _operation_ec = ec;
            }
        );
        runOperation("connect");
        _stream->socket().set_option(tcp::no_delay(true), ec);
        if (ec) {
            std::cerr << "HttpStreamSource: couldn't disable nagle: " << ec.message() << std::endl;
        }

        _request = {};
        _request.method(http::verb::get);
        _request.target(_path);
        _request.version(11);
        _request.set(http::field::host, _host);
        _request.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " rawstream");
        _request.set(http::field::accept, "*/*");

        _stream->expires_after(_read_timeout);
        http::async_write(
            *_stream, _request,
            [this](error_code ec, std::size_t) {
                _operation_ec = ec;
            }
        );
        runOperation("request");

        readResponseHeaders();
    }

    void HttpStreamSource::readResponseHeaders() {
        _parser = std::make_unique<http::response_parser<http::buffer_body>>();
        // the body of a stream never ends
        _parser->body_limit(boost::none);

        _stream->expires_after(_read_timeout);
        http::async_read_header(
            *_stream, _read_buffer, *_parser,
            [this](error_code ec, std::size_t) {
                _operation_ec = ec;
            }
        );
        runOperation("read header");

        const auto &response = _parser->get();
        if (response.result() != http::status::ok) {
            throw TransportError(
                "HttpStreamSource: " + _path + " answered with status " + std::to_string(response.result_int())
            );
        }

        _boundary_marker = boundary_marker_from_content_type(
            std::string(response[http::field::content_type])
        );
        if (!_boundary_marker.empty()) {
            std::cout << "HttpStreamSource: stream announced boundary " << _boundary_marker << std::endl;
        }

        _announced_dimensions = std::nullopt;
        const auto width = response["X-Frame-Width"];
        const auto height = response["X-Frame-Height"];
        if (!width.empty() && !height.empty()) {
            try {
                domain::FrameDimensions dimensions;
                dimensions.width = static_cast<uint32_t>(std::stoul(std::string(width)));
                dimensions.height = static_cast<uint32_t>(std::stoul(std::string(height)));
                _announced_dimensions = dimensions;
                std::cout << "HttpStreamSource: stream announced " << dimensions.width << "x" <<
                    dimensions.height << " frames" << std::endl;
            } catch (const std::logic_error &e) {
                std::cerr << "HttpStreamSource: ignoring unparsable frame size headers " << width <<
                    "x" << height << std::endl;
            }
        }
    }

    std::size_t HttpStreamSource::ReadSome(uint8_t *data, const std::size_t size) {
        if (_is_cancelled) {
            throw TransportError("HttpStreamSource: cancelled");
        }
        if (!_parser || !_stream) {
            throw TransportError("HttpStreamSource: not connected");
        }
        if (_parser->is_done()) {
            throw TransportError("HttpStreamSource: stream ended");
        }

        _parser->get().body().data = data;
        _parser->get().body().size = size;
        _stream->expires_after(_read_timeout);
        http::async_read_some(
            *_stream, _read_buffer, *_parser,
            [this](error_code ec, std::size_t) {
                // the body buffer filled up; that is the point of reading
                if (ec == http::error::need_buffer) {
                    ec = {};
                }
                _operation_ec = ec;
            }
        );
        runOperation("read");
        return size - _parser->get().body().size;
    }

    void HttpStreamSource::runOperation(const char *what) {
        _operation_ec = {};
        _context.restart();
        _context.run();
        if (_is_cancelled) {
            throw TransportError(std::string("HttpStreamSource: cancelled during ") + what);
        }
        if (_operation_ec) {
            throw TransportError(
                std::string("HttpStreamSource: ") + what + " failed: " + _operation_ec.message()
            );
        }
    }

    void HttpStreamSource::Disconnect() {
        if (_stream) {
            error_code ec;
            _stream->socket().shutdown(tcp::socket::shutdown_both, ec);
            _stream->close();
        }
        // let aborted handlers and queued cancels run before the objects they reference go away
        _context.restart();
        _context.run();
        _parser.reset();
        _stream.reset();
        _read_buffer.consume(_read_buffer.size());
    }

    void HttpStreamSource::Cancel() {
        _is_cancelled = true;
        net::post(_context, [this]() {
            if (_stream) {
                _stream->cancel();
            }
        });
    }

    void HttpStreamSource::Resume() {
        _is_cancelled = false;
    }

}
