#include "window_manager.hpp"

#include "famicore/frame_buffer.hpp"

#include <SDL.h>
#include <SDL_opengl.h>
#include <iostream>

namespace famicore::app {

WindowManager::~WindowManager() {
    shutdown();
}

bool WindowManager::initialize(const WindowConfig& config) {
    m_scale = config.scale;
    m_fullscreen = config.fullscreen;

    // Compatibility profile: the renderer uses the fixed-function pipeline
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 2);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 1);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    uint32_t flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI;
    if (m_fullscreen) {
        flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;
    }

    m_window = SDL_CreateWindow(config.title.c_str(),
                                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                FrameBuffer::WIDTH * m_scale, FrameBuffer::HEIGHT * m_scale,
                                flags);
    if (!m_window) {
        std::cerr << "Failed to create window: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_SetWindowMinimumSize(m_window, FrameBuffer::WIDTH, FrameBuffer::HEIGHT);

    if (!create_context(config.vsync)) {
        return false;
    }

    update_drawable_size();
    std::cout << "Window created: " << m_drawable_width << "x" << m_drawable_height
              << " (x" << m_scale << "), OpenGL " << glGetString(GL_VERSION) << std::endl;
    return true;
}

bool WindowManager::create_context(bool vsync) {
    m_gl_context = SDL_GL_CreateContext(m_window);
    if (!m_gl_context) {
        std::cerr << "Failed to create OpenGL context: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_gl_context);

    // Adaptive vsync first, then plain vsync
    if (vsync && SDL_GL_SetSwapInterval(-1) != 0 && SDL_GL_SetSwapInterval(1) != 0) {
        std::cerr << "VSync not available: " << SDL_GetError() << std::endl;
    } else if (!vsync) {
        SDL_GL_SetSwapInterval(0);
    }
    return true;
}

void WindowManager::shutdown() {
    if (m_gl_context) {
        SDL_GL_DeleteContext(m_gl_context);
        m_gl_context = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
}

bool WindowManager::process_event(const SDL_Event& event) {
    if (event.type != SDL_WINDOWEVENT) {
        return false;
    }
    if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
        update_drawable_size();
    }
    return true;
}

void WindowManager::update_drawable_size() {
    SDL_GL_GetDrawableSize(m_window, &m_drawable_width, &m_drawable_height);
}

void WindowManager::set_title(const std::string& title) {
    if (m_window) {
        SDL_SetWindowTitle(m_window, title.c_str());
    }
}

void WindowManager::toggle_fullscreen() {
    if (!m_window) return;

    m_fullscreen = !m_fullscreen;
    if (SDL_SetWindowFullscreen(m_window, m_fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0) != 0) {
        std::cerr << "Failed to change fullscreen mode: " << SDL_GetError() << std::endl;
        m_fullscreen = !m_fullscreen;
    }
    update_drawable_size();
}

void WindowManager::set_scale(int scale) {
    if (!m_window || m_fullscreen || scale < 1) return;

    m_scale = scale;
    SDL_SetWindowSize(m_window, FrameBuffer::WIDTH * m_scale, FrameBuffer::HEIGHT * m_scale);
    update_drawable_size();
}

void WindowManager::swap_buffers() {
    SDL_GL_SwapWindow(m_window);
}

uint64_t WindowManager::get_ticks() {
    return SDL_GetPerformanceCounter();
}

uint64_t WindowManager::get_performance_frequency() {
    return SDL_GetPerformanceFrequency();
}

} // namespace famicore::app
