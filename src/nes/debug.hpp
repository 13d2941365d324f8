#pragma once

#include <cstdlib>

namespace famicore {

// Single debug mode check - caches result of DEBUG environment variable.
// set_debug_mode() overrides it (command line --debug).
inline bool& debug_mode_flag() {
    static bool debug = [] {
        const char* env = std::getenv("DEBUG");
        return env != nullptr && env[0] != '0';
    }();
    return debug;
}

inline bool is_debug_mode() {
    return debug_mode_flag();
}

inline void set_debug_mode(bool enabled) {
    debug_mode_flag() = enabled;
}

} // namespace famicore
