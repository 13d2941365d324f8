#pragma once

#include "settings.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace famicore {
class Console;
}

namespace famicore::app {

class WindowManager;
class Renderer;
class InputManager;

// Main application class - owns the console and the SDL frontend
class Application {
public:
    Application();
    ~Application();

    // Disable copy
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Initialize all subsystems. Returns false on failure; check
    // should_exit() for --help/--version style early exits.
    bool initialize(int argc, char* argv[]);

    // Main loop
    void run();

    // Shutdown and cleanup
    void shutdown();

    // Load an iNES file from disk
    bool load_rom(const std::string& path);

    // Emulation control
    void pause() { m_paused = true; }
    void resume();
    void reset();
    void toggle_pause();
    void frame_advance();

    // Write the last published frame to <config dir>/screenshots as BMP
    bool save_screenshot();
    bool is_paused() const { return m_paused; }
    bool should_exit() const { return m_exit_requested; }

private:
    bool parse_command_line(int argc, char* argv[], std::string& rom_path);
    void print_usage(const char* program_name);
    void print_version();

    void process_events();
    void run_emulation_frame();
    void render();

    std::string settings_path() const;
    std::string input_config_path() const;

    // Subsystems
    std::unique_ptr<Console> m_console;
    std::unique_ptr<WindowManager> m_window_manager;
    std::unique_ptr<Renderer> m_renderer;
    std::unique_ptr<InputManager> m_input_manager;

    Settings m_settings;
    std::string m_config_dir = "config";
    std::string m_rom_path;

    // State
    bool m_initialized = false;
    bool m_exit_requested = false;
    bool m_quit_requested = false;
    bool m_paused = true;  // Start paused until ROM loaded
    bool m_frame_advance_requested = false;
    bool m_trace = false;
};

} // namespace famicore::app
