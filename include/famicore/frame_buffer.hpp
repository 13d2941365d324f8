#pragma once

#include <array>
#include <cstdint>

namespace famicore {

// 256x240 picture, one RGBA8888 value per pixel (R in the lowest byte)
class FrameBuffer {
public:
    static constexpr int WIDTH = 256;
    static constexpr int HEIGHT = 240;

    FrameBuffer() { m_pixels.fill(0); }

    uint32_t get_pixel(int x, int y) const { return m_pixels[y * WIDTH + x]; }
    void set_pixel(int x, int y, uint32_t color) { m_pixels[y * WIDTH + x] = color; }

    void clear(uint32_t color = 0) { m_pixels.fill(color); }

    const uint32_t* data() const { return m_pixels.data(); }
    int width() const { return WIDTH; }
    int height() const { return HEIGHT; }

private:
    std::array<uint32_t, WIDTH * HEIGHT> m_pixels;
};

} // namespace famicore
