#include "settings.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace famicore::app {

bool Settings::load(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file) {
            return false;  // No config file exists, use defaults
        }

        nlohmann::json j;
        file >> j;

        scale = j.value("scale", scale);
        vsync = j.value("vsync", vsync);
        fullscreen = j.value("fullscreen", fullscreen);
        pause_on_load = j.value("pause_on_load", pause_on_load);

        if (scale < 1 || scale > 8) {
            std::cerr << "Ignoring window scale " << scale << " from " << path << std::endl;
            scale = 3;
        }

        std::cout << "Loaded settings from " << path << std::endl;
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error loading settings: " << e.what() << std::endl;
        return false;
    }
}

bool Settings::save(const std::string& path) const {
    try {
        // Create config directory if it doesn't exist
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        nlohmann::json j;
        j["scale"] = scale;
        j["vsync"] = vsync;
        j["fullscreen"] = fullscreen;
        j["pause_on_load"] = pause_on_load;

        std::ofstream file(path);
        if (!file) {
            std::cerr << "Failed to open settings file for writing: " << path << std::endl;
            return false;
        }

        file << j.dump(2);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error saving settings: " << e.what() << std::endl;
        return false;
    }
}

} // namespace famicore::app
