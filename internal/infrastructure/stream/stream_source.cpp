#include "stream_source.hpp"
#include "http_stream_source.hpp"
#include "file_stream_source.hpp"

namespace infrastructure {

    StreamSourcePtr StreamSource::Create(const StreamSourceConfig &config) {
        switch (config.get_stream_source_type()) {
            case StreamSourceType::HTTP:
                return std::make_shared<HttpStreamSource>(config);
            case StreamSourceType::FILE:
                return std::make_shared<FileStreamSource>(config);
            default:
                throw std::runtime_error("Selected stream source unavailable... ");
        }
    }

}
