#include "raw_file_loader.hpp"

#include <fstream>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace infrastructure {

    domain::RawFramePtr LoadRawFrame(
        const std::filesystem::path &path,
        const domain::FrameDimensions &dimensions,
        std::optional<domain::FrameFormat> format,
        const domain::FormatDetector &detector,
        const domain::FrameFormat fallback
    ) {
        if (!std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("LoadRawFrame: couldn't find raw file at path: " + path.string());
        }

        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file) {
            throw std::runtime_error("LoadRawFrame: couldn't open raw file at path: " + path.string());
        }
        std::vector<uint8_t> bytes(
            (std::istreambuf_iterator<char>(file)),
            std::istreambuf_iterator<char>()
        );
        if (file.bad()) {
            throw std::runtime_error("LoadRawFrame: failed reading raw file at path: " + path.string());
        }

        const auto resolved = format.has_value() ?
            format.value() : detector.DetectOr(bytes.size(), dimensions, fallback);
        domain::ValidateDimensions(resolved, dimensions);

        std::cout << "LoadRawFrame: " << path.filename().string() << " is " << bytes.size() << " bytes, " <<
            (format.has_value() ? "configured as " : "detected as ") << domain::ToString(resolved) << std::endl;

        return std::make_shared<const domain::RawFrame>(std::move(bytes), dimensions, resolved);
    }

}
