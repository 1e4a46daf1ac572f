#include "file_stream_source.hpp"

#include <iostream>
#include <utility>

namespace infrastructure {

    FileStreamSource::FileStreamSource(const StreamSourceConfig &config):
        _recording(config.get_stream_replay_file())
    {}

    FileStreamSource::FileStreamSource(std::filesystem::path recording):
        _recording(std::move(recording))
    {}

    void FileStreamSource::Connect() {
        if (_is_cancelled) {
            throw TransportError("FileStreamSource: cancelled");
        }
        Disconnect();
        _file.open(_recording, std::ios::in | std::ios::binary);
        if (!_file.is_open()) {
            throw TransportError("FileStreamSource: couldn't open recording " + _recording.string());
        }
        std::cout << "FileStreamSource: replaying " << _recording << std::endl;
    }

    std::size_t FileStreamSource::ReadSome(uint8_t *data, const std::size_t size) {
        if (_is_cancelled) {
            throw TransportError("FileStreamSource: cancelled");
        }
        if (!_file.is_open()) {
            throw TransportError("FileStreamSource: not connected");
        }
        _file.read(reinterpret_cast<char *>(data), static_cast<std::streamsize>(size));
        const auto bytes_read = static_cast<std::size_t>(_file.gcount());
        if (bytes_read == 0) {
            throw TransportError("FileStreamSource: end of recording");
        }
        return bytes_read;
    }

    void FileStreamSource::Disconnect() {
        if (_file.is_open()) {
            _file.close();
        }
        _file.clear();
    }

    void FileStreamSource::Cancel() {
        _is_cancelled = true;
    }

    void FileStreamSource::Resume() {
        _is_cancelled = false;
    }

}
