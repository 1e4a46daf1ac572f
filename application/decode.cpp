#include "config.hpp"

#include "domain/format_detector.hpp"
#include "domain/frame_decoder.hpp"
#include "infrastructure/file/raw_file_loader.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {

    auto config = application::get_json_config(application::AppType::DECODE, argc, argv);

    const auto raw_file = application::resolve_config_path(config.value("rawFile", "frame.raw"));
    const auto dimensions = application::get_frame_dimensions(config);
    const domain::FormatDetector detector(config.value("detectionToleranceBytes", 1000));

    const auto frame = infrastructure::LoadRawFrame(
        raw_file,
        dimensions,
        application::get_frame_format(config),
        detector,
        application::get_fallback_format(config)
    );

    const domain::FrameDecoder decoder{};
    domain::PixelGridPtr grid;
    try {
        grid = decoder.Decode(*frame);
    } catch (const domain::DecodeError &e) {
        std::cerr << "decode: " << raw_file << " can't be decoded: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "decode: " << domain::ToString(*frame->GetFormat()) << " -> " <<
        grid->GetHeight() << "x" << grid->GetWidth() << "x" << grid->GetChannels() <<
        " samples at " << grid->GetBitDepth() << " bits" << std::endl;

    const auto channels = grid->GetChannels();
    const auto &samples = grid->GetSamples();
    for (int channel = 0; channel < channels; channel++) {
        uint16_t min_value = grid->GetMaxValue();
        uint16_t max_value = 0;
        double sum = 0.0;
        uint64_t count = 0;
        for (std::size_t i = channel; i < samples.size(); i += channels) {
            min_value = std::min(min_value, samples[i]);
            max_value = std::max(max_value, samples[i]);
            sum += samples[i];
            count++;
        }
        std::cout << "decode: channel " << channel << " min " << min_value << " max " << max_value <<
            " mean " << (count > 0 ? sum / static_cast<double>(count) : 0.0) << std::endl;
    }
}
