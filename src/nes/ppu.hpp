#pragma once

#include "famicore/frame_buffer.hpp"

#include <cstdint>
#include <array>

namespace famicore {

class Mapper;

// NES PPU (Picture Processing Unit) - 2C02
class PPU {
public:
    static constexpr int DOTS_PER_SCANLINE = 341;
    static constexpr int SCANLINES_PER_FRAME = 262;
    static constexpr int VISIBLE_SCANLINES = 240;
    static constexpr int POST_RENDER_SCANLINE = 240;
    static constexpr int VBLANK_SCANLINE = 241;
    static constexpr int PRE_RENDER_SCANLINE = 261;

    // PPUSTATUS bits
    static constexpr uint8_t STATUS_SPRITE_OVERFLOW = 0x20;
    static constexpr uint8_t STATUS_SPRITE_ZERO_HIT = 0x40;
    static constexpr uint8_t STATUS_VBLANK = 0x80;

    explicit PPU(Mapper& mapper);
    ~PPU();

    // Reset
    void reset();

    // Advance one dot
    void tick();

    // CPU register access ($2000-$2007, already reduced to 0-7)
    uint8_t cpu_read(uint16_t address);
    void cpu_write(uint16_t address, uint8_t value);

    // Register value without read side effects (for tracing)
    uint8_t peek_register(uint16_t address) const;

    // PPU memory access (pattern tables, nametables, palettes)
    uint8_t ppu_read(uint16_t address);
    void ppu_write(uint16_t address, uint8_t value);

    // OAMDATA write used by OAM DMA
    void oam_dma_write(uint8_t value);

    // NMI line, raised at vblank start when enabled in PPUCTRL.
    // The CPU takes it at the next instruction boundary.
    bool nmi_line() const { return m_nmi_line; }
    bool take_nmi();

    // Frame complete check (returns true once per frame, at start of VBlank)
    bool check_frame_complete();

    // Last completed frame
    const FrameBuffer& get_framebuffer() const { return m_framebuffers[m_back_buffer ^ 1]; }

    // Timing state
    int get_scanline() const { return m_scanline; }
    int get_dot() const { return m_cycle; }
    uint64_t get_frame() const { return m_frame; }
    bool is_odd_frame() const { return m_odd_frame; }

    // Register state
    uint8_t get_ctrl() const { return m_ctrl; }
    uint8_t get_mask() const { return m_mask; }
    uint8_t get_status() const { return m_status; }
    uint8_t get_oam_addr() const { return m_oam_addr; }
    uint16_t get_vram_address() const { return m_v; }
    uint16_t get_temp_address() const { return m_t; }
    uint8_t get_fine_x() const { return m_x; }
    bool get_write_toggle() const { return m_w; }
    bool in_vblank() const { return (m_status & STATUS_VBLANK) != 0; }
    bool sprite_zero_hit() const { return (m_status & STATUS_SPRITE_ZERO_HIT) != 0; }
    bool sprite_overflow() const { return (m_status & STATUS_SPRITE_OVERFLOW) != 0; }
    bool rendering_enabled() const { return (m_mask & 0x18) != 0; }
    int get_sprite_count() const { return m_sprite_count; }
    const std::array<uint8_t, 256>& get_oam() const { return m_oam; }

    // 2C02 palette entry, RGBA8888 (R in the lowest byte)
    static uint32_t palette_color(uint8_t index);

private:
    void render_pixel();
    uint8_t get_background_pixel(uint8_t& palette);
    uint8_t get_sprite_pixel(uint8_t& palette, bool& behind_background, bool& sprite_zero);
    void fetch_background();
    void evaluate_sprites();
    void load_background_shifters();
    void update_shifters();
    void increment_x();
    void increment_y();
    void advance();
    uint16_t mirror_nametable(uint16_t address) const;
    uint32_t output_color(uint8_t color_index) const;

    Mapper& m_mapper;

    // PPU registers
    uint8_t m_ctrl = 0;     // $2000 PPUCTRL
    uint8_t m_mask = 0;     // $2001 PPUMASK
    uint8_t m_status = 0;   // $2002 PPUSTATUS
    uint8_t m_oam_addr = 0; // $2003 OAMADDR

    // Internal registers
    uint16_t m_v = 0;       // Current VRAM address (15 bits)
    uint16_t m_t = 0;       // Temporary VRAM address
    uint8_t m_x = 0;        // Fine X scroll (3 bits)
    bool m_w = false;       // Write toggle shared by $2005/$2006

    // PPUDATA read buffer
    uint8_t m_data_buffer = 0;

    // Last value driven on the CPU-facing data bus
    uint8_t m_io_latch = 0;

    // Timing
    int m_scanline = 0;
    int m_cycle = 0;
    uint64_t m_frame = 0;
    bool m_odd_frame = false;
    bool m_frame_rendering = false;  // Rendering state latched at pre-render dot 1

    bool m_nmi_line = false;
    bool m_frame_complete = false;

    // Background rendering
    uint16_t m_bg_shifter_pattern_lo = 0;
    uint16_t m_bg_shifter_pattern_hi = 0;
    uint16_t m_bg_shifter_attrib_lo = 0;
    uint16_t m_bg_shifter_attrib_hi = 0;
    uint8_t m_bg_next_tile_id = 0;
    uint8_t m_bg_next_tile_attrib = 0;
    uint8_t m_bg_next_tile_lo = 0;
    uint8_t m_bg_next_tile_hi = 0;

    // Sprite rendering
    struct Sprite {
        uint8_t y;
        uint8_t tile;
        uint8_t attr;
        uint8_t x;
    };

    std::array<uint8_t, 256> m_oam;  // Object Attribute Memory
    std::array<Sprite, 8> m_scanline_sprites;
    std::array<uint8_t, 8> m_sprite_shifter_lo;
    std::array<uint8_t, 8> m_sprite_shifter_hi;
    int m_sprite_count = 0;
    bool m_sprite_zero_hit_possible = false;

    // Memory
    std::array<uint8_t, 4096> m_nametable;  // 2KB console VRAM, 4KB for four-screen boards
    std::array<uint8_t, 32> m_palette;      // Palette RAM

    // Back buffer is written during rendering, the other one is published
    std::array<FrameBuffer, 2> m_framebuffers;
    int m_back_buffer = 0;

    // NES color palette
    static const uint32_t s_palette[64];
};

} // namespace famicore
