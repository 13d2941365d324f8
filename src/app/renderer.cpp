#include "renderer.hpp"

#include "famicore/frame_buffer.hpp"

#include <SDL.h>
#include <SDL_opengl.h>
#include <algorithm>
#include <iostream>

namespace famicore::app {

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::initialize() {
    GLuint texture = 0;
    glGenTextures(1, &texture);
    if (texture == 0) {
        std::cerr << "Failed to create frame texture" << std::endl;
        return false;
    }
    m_texture = texture;

    glBindTexture(GL_TEXTURE_2D, m_texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    // Pixels are RGBA8888 with R in the lowest byte, which is GL_RGBA on little endian
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, FrameBuffer::WIDTH, FrameBuffer::HEIGHT, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glBindTexture(GL_TEXTURE_2D, 0);

    m_has_frame = false;
    return true;
}

void Renderer::shutdown() {
    if (m_texture) {
        GLuint texture = m_texture;
        glDeleteTextures(1, &texture);
        m_texture = 0;
    }
    m_has_frame = false;
}

void Renderer::upload(const FrameBuffer& frame) {
    if (!m_texture) return;

    glBindTexture(GL_TEXTURE_2D, m_texture);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, frame.width(), frame.height(),
                    GL_RGBA, GL_UNSIGNED_BYTE, frame.data());
    glBindTexture(GL_TEXTURE_2D, 0);
    m_has_frame = true;
}

void Renderer::draw(int drawable_width, int drawable_height) {
    glViewport(0, 0, drawable_width, drawable_height);
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    if (!m_has_frame || drawable_width <= 0 || drawable_height <= 0) return;

    float fit = std::min(static_cast<float>(drawable_width) / FrameBuffer::WIDTH,
                         static_cast<float>(drawable_height) / FrameBuffer::HEIGHT);
    // Half extents in normalized device coordinates
    float hx = FrameBuffer::WIDTH * fit / drawable_width;
    float hy = FrameBuffer::HEIGHT * fit / drawable_height;

    glEnable(GL_TEXTURE_2D);
    glBindTexture(GL_TEXTURE_2D, m_texture);
    glBegin(GL_TRIANGLE_STRIP);
    glTexCoord2f(0.0f, 1.0f); glVertex2f(-hx, -hy);
    glTexCoord2f(1.0f, 1.0f); glVertex2f(hx, -hy);
    glTexCoord2f(0.0f, 0.0f); glVertex2f(-hx, hy);
    glTexCoord2f(1.0f, 0.0f); glVertex2f(hx, hy);
    glEnd();
    glBindTexture(GL_TEXTURE_2D, 0);
    glDisable(GL_TEXTURE_2D);
}

} // namespace famicore::app
