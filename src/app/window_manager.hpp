#pragma once

#include <cstdint>
#include <string>

struct SDL_Window;
union SDL_Event;
typedef void* SDL_GLContext;

namespace famicore::app {

struct WindowConfig {
    std::string title = "famicore";
    int scale = 3;          // Initial size as a multiple of the NES picture
    bool fullscreen = false;
    bool vsync = true;
};

// SDL window with a GL 2.1 context for the frame texture
class WindowManager {
public:
    WindowManager() = default;
    ~WindowManager();

    // Disable copy
    WindowManager(const WindowManager&) = delete;
    WindowManager& operator=(const WindowManager&) = delete;

    bool initialize(const WindowConfig& config);
    void shutdown();

    // Track size changes; returns true if the event was a window event
    bool process_event(const SDL_Event& event);

    void set_title(const std::string& title);
    void toggle_fullscreen();
    void set_scale(int scale);

    bool is_fullscreen() const { return m_fullscreen; }
    int get_scale() const { return m_scale; }

    // Size of the GL drawable in pixels (differs from the window size on HiDPI)
    int get_drawable_width() const { return m_drawable_width; }
    int get_drawable_height() const { return m_drawable_height; }

    void swap_buffers();

    // High-resolution timer
    static uint64_t get_ticks();
    static uint64_t get_performance_frequency();

private:
    bool create_context(bool vsync);
    void update_drawable_size();

    SDL_Window* m_window = nullptr;
    SDL_GLContext m_gl_context = nullptr;
    int m_drawable_width = 0;
    int m_drawable_height = 0;
    int m_scale = 3;
    bool m_fullscreen = false;
};

} // namespace famicore::app
