#pragma once

#include <cstdint>

namespace famicore {
class FrameBuffer;
}

namespace famicore::app {

// Draws the console picture as one nearest-filtered GL texture
class Renderer {
public:
    Renderer() = default;
    ~Renderer();

    // Disable copy
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Requires a current GL context
    bool initialize();
    void shutdown();

    // Copy the latest published frame to the texture
    void upload(const FrameBuffer& frame);

    // Clear the drawable and draw the frame letterboxed at 256:240
    void draw(int drawable_width, int drawable_height);

private:
    uint32_t m_texture = 0;
    bool m_has_frame = false;
};

} // namespace famicore::app
