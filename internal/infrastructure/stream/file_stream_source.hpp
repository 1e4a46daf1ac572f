#ifndef INFRASTRUCTURE_STREAM_FILE_STREAM_SOURCE_HPP
#define INFRASTRUCTURE_STREAM_FILE_STREAM_SOURCE_HPP

#include <atomic>
#include <filesystem>
#include <fstream>

#include "stream_source.hpp"

namespace infrastructure {

    // replays a recorded multipart body; the end of the recording looks like a dropped connection
    class FileStreamSource: public StreamSource {
    public:
        explicit FileStreamSource(const StreamSourceConfig &config);
        explicit FileStreamSource(std::filesystem::path recording);
        void Connect() override;
        [[nodiscard]] std::size_t ReadSome(uint8_t *data, std::size_t size) override;
        void Disconnect() override;
        void Cancel() override;
        void Resume() override;
    private:
        const std::filesystem::path _recording;
        std::ifstream _file;
        std::atomic<bool> _is_cancelled = { false };
    };

}

#endif //INFRASTRUCTURE_STREAM_FILE_STREAM_SOURCE_HPP
