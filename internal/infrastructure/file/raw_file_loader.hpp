#ifndef INFRASTRUCTURE_FILE_RAW_FILE_LOADER_HPP
#define INFRASTRUCTURE_FILE_RAW_FILE_LOADER_HPP

#include <filesystem>
#include <optional>

#include "domain/frame.hpp"
#include "domain/format_detector.hpp"

namespace infrastructure {

    /*
     * reads a headerless dump of one frame. with no explicit format the detector guesses from the
     * file size, and the fallback is assumed when nothing matches.
     */
    [[nodiscard]] domain::RawFramePtr LoadRawFrame(
        const std::filesystem::path &path,
        const domain::FrameDimensions &dimensions,
        std::optional<domain::FrameFormat> format,
        const domain::FormatDetector &detector,
        domain::FrameFormat fallback = domain::FrameFormat::RGB888
    );

}

#endif //INFRASTRUCTURE_FILE_RAW_FILE_LOADER_HPP
