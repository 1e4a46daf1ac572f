#ifndef RAWSTREAM_APPLICATION_CONFIG_HPP
#define RAWSTREAM_APPLICATION_CONFIG_HPP

#include <fstream>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/frame_format.hpp"

namespace application {

    enum class AppType {
        VIEWER,
        DECODE
    };

    inline std::filesystem::path get_root_dir() {
        std::filesystem::path app_dir = APPLICATION_DIR;
        return app_dir.parent_path();
    }

    inline nlohmann::json get_json_config(const AppType &app_type, int argc, char * argv[]) {
        std::string config_name;
        switch (app_type) {
            case AppType::VIEWER:
                config_name = "viewer.";
                break;
            case AppType::DECODE:
                config_name = "decode.";
                break;
        }
        if (argc > 1) {
            config_name += argv[1];
        } else {
            config_name += "default";
        }
        config_name += ".json";
        auto conf_dir = get_root_dir() / "config";
        auto conf_file_path = conf_dir / config_name;
        if (!std::filesystem::exists(conf_file_path)) {
            throw std::runtime_error("Couldn't find config file at path: " + conf_file_path.string());
        }

        std::ifstream config_file(conf_file_path);
        nlohmann::json config;
        config_file >> config;
        return config;
    }

    // relative paths in a config are relative to the project root
    inline std::filesystem::path resolve_config_path(const std::string &path) {
        std::filesystem::path resolved = path;
        if (!resolved.empty() && resolved.is_relative()) {
            resolved = get_root_dir() / resolved;
        }
        return resolved;
    }

    inline domain::FrameDimensions get_frame_dimensions(const nlohmann::json &config) {
        const int width = config.value("frameWidth", 1936);
        const int height = config.value("frameHeight", 1100);
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument(
                "Frame dimensions must be positive: " + std::to_string(width) + "x" + std::to_string(height)
            );
        }
        return { static_cast<uint32_t>(width), static_cast<uint32_t>(height) };
    }

    inline std::optional<domain::FrameFormat> get_frame_format(const nlohmann::json &config) {
        return domain::FormatSelectionFromString(config.value("frameFormat", "auto"));
    }

    inline domain::FrameFormat get_fallback_format(const nlohmann::json &config) {
        return domain::FormatFromString(config.value("fallbackFormat", "RGB888"));
    }

}

#endif //RAWSTREAM_APPLICATION_CONFIG_HPP
