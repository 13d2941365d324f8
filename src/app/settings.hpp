#pragma once

#include <string>

namespace famicore::app {

// Frontend settings, stored as JSON in <config dir>/famicore.json
struct Settings {
    int scale = 3;            // Window size as a multiple of 256x240
    bool vsync = true;
    bool fullscreen = false;
    bool pause_on_load = false;

    bool load(const std::string& path);
    bool save(const std::string& path) const;
};

} // namespace famicore::app
