#include "ppu.hpp"
#include "mappers/mapper.hpp"

namespace famicore {

// NES color palette (2C02) - ABGR format for OpenGL RGBA on little-endian
const uint32_t PPU::s_palette[64] = {
    0xFF545454, 0xFF741E00, 0xFF901008, 0xFF880030, 0xFF640044, 0xFF30005C, 0xFF000454, 0xFF00183C,
    0xFF002A20, 0xFF003A08, 0xFF004000, 0xFF003C00, 0xFF3C3200, 0xFF000000, 0xFF000000, 0xFF000000,
    0xFF989698, 0xFFC44C08, 0xFFEC3230, 0xFFE41E5C, 0xFFB01488, 0xFF6414A0, 0xFF202298, 0xFF003C78,
    0xFF005A54, 0xFF007228, 0xFF007C08, 0xFF287600, 0xFF786600, 0xFF000000, 0xFF000000, 0xFF000000,
    0xFFECEEEC, 0xFFEC9A4C, 0xFFEC7C78, 0xFFEC62B0, 0xFFEC54E4, 0xFFB458EC, 0xFF646AEC, 0xFF2088D4,
    0xFF00AAA0, 0xFF00C474, 0xFF20D04C, 0xFF6CCC38, 0xFFCCB438, 0xFF3C3C3C, 0xFF000000, 0xFF000000,
    0xFFECEEEC, 0xFFECCCA8, 0xFFECBCBC, 0xFFECB2D4, 0xFFECAEEC, 0xFFD4AEEC, 0xFFB0B4EC, 0xFF90C4E4,
    0xFF78D2CC, 0xFF78DEB4, 0xFF90E2A8, 0xFFB4E298, 0xFFE4D6A0, 0xFFA0A2A0, 0xFF000000, 0xFF000000,
};

uint32_t PPU::palette_color(uint8_t index) {
    return s_palette[index & 0x3F];
}

PPU::PPU(Mapper& mapper) : m_mapper(mapper) {
    reset();
}

PPU::~PPU() = default;

void PPU::reset() {
    m_ctrl = 0;
    m_mask = 0;
    m_status = 0;
    m_oam_addr = 0;
    m_v = 0;
    m_t = 0;
    m_x = 0;
    m_w = false;
    m_data_buffer = 0;
    m_io_latch = 0;
    m_scanline = 0;
    m_cycle = 0;
    m_frame = 0;
    m_odd_frame = false;
    m_frame_rendering = false;
    m_nmi_line = false;
    m_frame_complete = false;

    m_bg_shifter_pattern_lo = 0;
    m_bg_shifter_pattern_hi = 0;
    m_bg_shifter_attrib_lo = 0;
    m_bg_shifter_attrib_hi = 0;
    m_bg_next_tile_id = 0;
    m_bg_next_tile_attrib = 0;
    m_bg_next_tile_lo = 0;
    m_bg_next_tile_hi = 0;

    m_sprite_count = 0;
    m_sprite_zero_hit_possible = false;
    m_sprite_shifter_lo.fill(0);
    m_sprite_shifter_hi.fill(0);

    m_oam.fill(0);
    m_nametable.fill(0);
    m_palette.fill(0);
    for (auto& buffer : m_framebuffers) {
        buffer.clear();
    }
    m_back_buffer = 0;
}

void PPU::tick() {
    const bool visible = m_scanline < VISIBLE_SCANLINES;
    const bool pre_render = m_scanline == PRE_RENDER_SCANLINE;

    if (visible || pre_render) {
        if (pre_render && m_cycle == 1) {
            m_status &= ~(STATUS_VBLANK | STATUS_SPRITE_ZERO_HIT | STATUS_SPRITE_OVERFLOW);
            m_frame_rendering = rendering_enabled();
        }

        // Background fetches, including the two-tile prefetch for the next line
        if ((m_cycle >= 2 && m_cycle <= 257) || (m_cycle >= 321 && m_cycle <= 337)) {
            update_shifters();
            fetch_background();
        }

        if (visible && m_cycle >= 1 && m_cycle <= 256) {
            render_pixel();
        }

        if (rendering_enabled()) {
            if (m_cycle == 256) {
                increment_y();
            }
            // Copy horizontal bits
            if (m_cycle == 257) {
                m_v = (m_v & ~0x041F) | (m_t & 0x041F);
            }
            // Copy vertical bits
            if (pre_render && m_cycle >= 280 && m_cycle <= 304) {
                m_v = (m_v & ~0x7BE0) | (m_t & 0x7BE0);
            }
        }

        if (m_cycle == 257) {
            if (visible && rendering_enabled()) {
                evaluate_sprites();
            } else {
                // No sprites on the first visible line
                m_sprite_count = 0;
                m_sprite_zero_hit_possible = false;
            }
        }
    }

    // VBlank start - publish the finished frame
    if (m_scanline == VBLANK_SCANLINE && m_cycle == 1) {
        m_status |= STATUS_VBLANK;
        if (m_ctrl & 0x80) {
            m_nmi_line = true;
        }
        m_back_buffer ^= 1;
        m_frame_complete = true;
    }

    advance();
}

void PPU::advance() {
    m_cycle++;

    // Odd frames with rendering enabled drop the last pre-render dot
    if (m_scanline == PRE_RENDER_SCANLINE && m_cycle == DOTS_PER_SCANLINE - 1 &&
        m_odd_frame && m_frame_rendering) {
        m_cycle = DOTS_PER_SCANLINE;
    }

    if (m_cycle >= DOTS_PER_SCANLINE) {
        m_cycle = 0;
        m_scanline++;
        if (m_scanline >= SCANLINES_PER_FRAME) {
            m_scanline = 0;
            m_frame++;
            m_odd_frame = !m_odd_frame;
        }
    }
}

uint8_t PPU::cpu_read(uint16_t address) {
    uint8_t data = m_io_latch;

    switch (address & 7) {
        case 2: // PPUSTATUS
            data = (m_status & 0xE0) | (m_io_latch & 0x1F);
            m_status &= ~STATUS_VBLANK;
            m_w = false;
            break;

        case 4: // OAMDATA
            data = m_oam[m_oam_addr];
            if ((m_oam_addr & 0x03) == 2) {
                data &= 0xE3;  // Unimplemented attribute bits
            }
            break;

        case 7: { // PPUDATA
            uint16_t addr = m_v & 0x3FFF;
            if (addr >= 0x3F00) {
                // Palette reads are not buffered; the buffer gets the nametable byte underneath
                data = (ppu_read(addr) & 0x3F) | (m_io_latch & 0xC0);
                m_data_buffer = ppu_read(addr - 0x1000);
            } else {
                data = m_data_buffer;
                m_data_buffer = ppu_read(addr);
            }
            m_v = (m_v + ((m_ctrl & 0x04) ? 32 : 1)) & 0x7FFF;
            break;
        }

        default:
            // Write-only registers
            break;
    }

    m_io_latch = data;
    return data;
}

uint8_t PPU::peek_register(uint16_t address) const {
    switch (address & 7) {
        case 2:
            return (m_status & 0xE0) | (m_io_latch & 0x1F);
        case 4:
            return m_oam[m_oam_addr];
        case 7:
            return m_data_buffer;
        default:
            return m_io_latch;
    }
}

void PPU::cpu_write(uint16_t address, uint8_t value) {
    m_io_latch = value;

    switch (address & 7) {
        case 0: { // PPUCTRL
            bool was_enabled = (m_ctrl & 0x80) != 0;
            m_ctrl = value;
            m_t = (m_t & ~0x0C00) | ((value & 0x03) << 10);
            // Enabling NMI during vblank raises it immediately
            if (!was_enabled && (value & 0x80) && (m_status & STATUS_VBLANK)) {
                m_nmi_line = true;
            }
            break;
        }

        case 1: // PPUMASK
            m_mask = value;
            break;

        case 2: // PPUSTATUS is read-only
            break;

        case 3: // OAMADDR
            m_oam_addr = value;
            break;

        case 4: // OAMDATA
            m_oam[m_oam_addr++] = value;
            break;

        case 5: // PPUSCROLL
            if (!m_w) {
                m_t = (m_t & ~0x001F) | (value >> 3);
                m_x = value & 0x07;
            } else {
                m_t = (m_t & ~0x73E0) | ((value & 0x07) << 12) | ((value & 0xF8) << 2);
            }
            m_w = !m_w;
            break;

        case 6: // PPUADDR
            if (!m_w) {
                m_t = (m_t & 0x00FF) | ((value & 0x3F) << 8);
            } else {
                m_t = (m_t & 0xFF00) | value;
                m_v = m_t;
            }
            m_w = !m_w;
            break;

        case 7: // PPUDATA
            ppu_write(m_v, value);
            m_v = (m_v + ((m_ctrl & 0x04) ? 32 : 1)) & 0x7FFF;
            break;
    }
}

void PPU::oam_dma_write(uint8_t value) {
    m_oam[m_oam_addr++] = value;
}

uint16_t PPU::mirror_nametable(uint16_t address) const {
    address &= 0x0FFF;
    switch (m_mapper.get_mirror_mode()) {
        case MirrorMode::Horizontal:
            // $2000/$2400 share the first 1KB, $2800/$2C00 the second
            return ((address & 0x0800) >> 1) | (address & 0x03FF);
        case MirrorMode::Vertical:
            // $2000/$2800 share the first 1KB, $2400/$2C00 the second
            return address & 0x07FF;
        case MirrorMode::SingleScreen0:
            return address & 0x03FF;
        case MirrorMode::SingleScreen1:
            return 0x0400 | (address & 0x03FF);
        case MirrorMode::FourScreen:
        default:
            return address;
    }
}

uint8_t PPU::ppu_read(uint16_t address) {
    address &= 0x3FFF;

    if (address < 0x2000) {
        return m_mapper.read_chr(address);
    }
    if (address < 0x3F00) {
        return m_nametable[mirror_nametable(address)];
    }

    // Palette
    address &= 0x1F;
    if ((address & 0x13) == 0x10) {
        address &= 0x0F;
    }
    return m_palette[address];
}

void PPU::ppu_write(uint16_t address, uint8_t value) {
    address &= 0x3FFF;

    if (address < 0x2000) {
        m_mapper.write_chr(address, value);
    } else if (address < 0x3F00) {
        m_nametable[mirror_nametable(address)] = value;
    } else {
        address &= 0x1F;
        if ((address & 0x13) == 0x10) {
            address &= 0x0F;
        }
        m_palette[address] = value & 0x3F;
    }
}

bool PPU::take_nmi() {
    if (m_nmi_line) {
        m_nmi_line = false;
        return true;
    }
    return false;
}

bool PPU::check_frame_complete() {
    if (m_frame_complete) {
        m_frame_complete = false;
        return true;
    }
    return false;
}

void PPU::fetch_background() {
    uint16_t pattern_base = (m_ctrl & 0x10) << 8;
    uint8_t fine_y = (m_v >> 12) & 0x07;

    switch ((m_cycle - 1) % 8) {
        case 0:
            load_background_shifters();
            m_bg_next_tile_id = ppu_read(0x2000 | (m_v & 0x0FFF));
            break;
        case 2:
            m_bg_next_tile_attrib = ppu_read(0x23C0 | (m_v & 0x0C00) |
                ((m_v >> 4) & 0x38) | ((m_v >> 2) & 0x07));
            if (m_v & 0x40) m_bg_next_tile_attrib >>= 4;
            if (m_v & 0x02) m_bg_next_tile_attrib >>= 2;
            break;
        case 4:
            m_bg_next_tile_lo = ppu_read(pattern_base + (m_bg_next_tile_id << 4) + fine_y);
            break;
        case 6:
            m_bg_next_tile_hi = ppu_read(pattern_base + (m_bg_next_tile_id << 4) + fine_y + 8);
            break;
        case 7:
            if (rendering_enabled()) {
                increment_x();
            }
            break;
    }
}

void PPU::increment_x() {
    if ((m_v & 0x001F) == 31) {
        m_v &= ~0x001F;
        m_v ^= 0x0400;
    } else {
        m_v++;
    }
}

void PPU::increment_y() {
    if ((m_v & 0x7000) != 0x7000) {
        m_v += 0x1000;
        return;
    }

    m_v &= ~0x7000;
    int y = (m_v & 0x03E0) >> 5;
    if (y == 29) {
        y = 0;
        m_v ^= 0x0800;
    } else if (y == 31) {
        y = 0;
    } else {
        y++;
    }
    m_v = (m_v & ~0x03E0) | (y << 5);
}

uint8_t PPU::get_background_pixel(uint8_t& palette) {
    palette = 0;
    if (!(m_mask & 0x08)) {
        return 0;
    }

    uint16_t bit = 0x8000 >> m_x;
    uint8_t p0 = (m_bg_shifter_pattern_lo & bit) ? 1 : 0;
    uint8_t p1 = (m_bg_shifter_pattern_hi & bit) ? 2 : 0;
    uint8_t a0 = (m_bg_shifter_attrib_lo & bit) ? 1 : 0;
    uint8_t a1 = (m_bg_shifter_attrib_hi & bit) ? 2 : 0;
    palette = a0 | a1;
    return p0 | p1;
}

uint8_t PPU::get_sprite_pixel(uint8_t& palette, bool& behind_background, bool& sprite_zero) {
    palette = 0;
    behind_background = false;
    sprite_zero = false;
    if (!(m_mask & 0x10)) {
        return 0;
    }

    for (int i = 0; i < m_sprite_count; i++) {
        if (m_scanline_sprites[i].x != 0) {
            continue;
        }
        uint8_t p0 = (m_sprite_shifter_lo[i] & 0x80) ? 1 : 0;
        uint8_t p1 = (m_sprite_shifter_hi[i] & 0x80) ? 2 : 0;
        uint8_t pixel = p0 | p1;
        if (pixel != 0) {
            sprite_zero = (i == 0) && m_sprite_zero_hit_possible;
            palette = (m_scanline_sprites[i].attr & 0x03) + 4;
            behind_background = (m_scanline_sprites[i].attr & 0x20) != 0;
            return pixel;
        }
    }
    return 0;
}

void PPU::render_pixel() {
    int x = m_cycle - 1;
    int y = m_scanline;

    uint8_t bg_palette = 0;
    uint8_t bg_pixel = 0;
    if ((m_mask & 0x02) || x >= 8) {
        bg_pixel = get_background_pixel(bg_palette);
    }

    uint8_t sprite_palette = 0;
    uint8_t sprite_pixel = 0;
    bool behind_background = false;
    bool sprite_zero = false;
    if ((m_mask & 0x04) || x >= 8) {
        sprite_pixel = get_sprite_pixel(sprite_palette, behind_background, sprite_zero);
    }

    // Combine background and sprite
    uint8_t pixel = 0;
    uint8_t palette = 0;

    if (bg_pixel == 0 && sprite_pixel != 0) {
        pixel = sprite_pixel;
        palette = sprite_palette;
    } else if (bg_pixel != 0 && sprite_pixel == 0) {
        pixel = bg_pixel;
        palette = bg_palette;
    } else if (bg_pixel != 0 && sprite_pixel != 0) {
        // Sprite 0 hit never triggers at x=255
        if (sprite_zero && (m_mask & 0x18) == 0x18 && x != 255) {
            m_status |= STATUS_SPRITE_ZERO_HIT;
        }

        if (!behind_background) {
            pixel = sprite_pixel;
            palette = sprite_palette;
        } else {
            pixel = bg_pixel;
            palette = bg_palette;
        }
    }

    uint8_t color_index = ppu_read(0x3F00 + (palette << 2) + pixel) & 0x3F;
    m_framebuffers[m_back_buffer].set_pixel(x, y, output_color(color_index));

    // Update sprite shifters
    for (int i = 0; i < m_sprite_count; i++) {
        if (m_scanline_sprites[i].x > 0) {
            m_scanline_sprites[i].x--;
        } else {
            m_sprite_shifter_lo[i] <<= 1;
            m_sprite_shifter_hi[i] <<= 1;
        }
    }
}

uint32_t PPU::output_color(uint8_t color_index) const {
    // Greyscale keeps only the luma column
    if (m_mask & 0x01) {
        color_index &= 0x30;
    }

    uint32_t color = s_palette[color_index & 0x3F];
    uint8_t emphasis = m_mask >> 5;
    if (emphasis == 0) {
        return color;
    }

    // Emphasis darkens the channels that are not emphasized
    uint32_t r = color & 0xFF;
    uint32_t g = (color >> 8) & 0xFF;
    uint32_t b = (color >> 16) & 0xFF;
    if (!(emphasis & 0x01)) r = r * 3 / 4;
    if (!(emphasis & 0x02)) g = g * 3 / 4;
    if (!(emphasis & 0x04)) b = b * 3 / 4;
    return 0xFF000000 | (b << 16) | (g << 8) | r;
}

void PPU::evaluate_sprites() {
    m_sprite_count = 0;
    m_sprite_zero_hit_possible = false;
    m_sprite_shifter_lo.fill(0);
    m_sprite_shifter_hi.fill(0);

    int sprite_height = (m_ctrl & 0x20) ? 16 : 8;

    for (int i = 0; i < 64; i++) {
        int diff = m_scanline - m_oam[i * 4];
        if (diff < 0 || diff >= sprite_height) {
            continue;
        }

        if (m_sprite_count == 8) {
            m_status |= STATUS_SPRITE_OVERFLOW;
            break;
        }

        if (i == 0) m_sprite_zero_hit_possible = true;

        Sprite& sprite = m_scanline_sprites[m_sprite_count];
        sprite.y = m_oam[i * 4];
        sprite.tile = m_oam[i * 4 + 1];
        sprite.attr = m_oam[i * 4 + 2];
        sprite.x = m_oam[i * 4 + 3];

        // Fetch sprite pattern
        uint16_t addr;
        int row = diff;

        if (sprite.attr & 0x80) {
            // Vertical flip
            row = sprite_height - 1 - row;
        }

        if (sprite_height == 16) {
            addr = ((sprite.tile & 0x01) << 12) | ((sprite.tile & 0xFE) << 4);
            if (row >= 8) {
                addr += 16;
                row -= 8;
            }
        } else {
            addr = ((m_ctrl & 0x08) << 9) | (sprite.tile << 4);
        }
        addr += row;

        uint8_t lo = ppu_read(addr);
        uint8_t hi = ppu_read(addr + 8);

        // Horizontal flip
        if (sprite.attr & 0x40) {
            auto flip = [](uint8_t b) {
                b = (b & 0xF0) >> 4 | (b & 0x0F) << 4;
                b = (b & 0xCC) >> 2 | (b & 0x33) << 2;
                b = (b & 0xAA) >> 1 | (b & 0x55) << 1;
                return b;
            };
            lo = flip(lo);
            hi = flip(hi);
        }

        m_sprite_shifter_lo[m_sprite_count] = lo;
        m_sprite_shifter_hi[m_sprite_count] = hi;
        m_sprite_count++;
    }
}

void PPU::load_background_shifters() {
    m_bg_shifter_pattern_lo = (m_bg_shifter_pattern_lo & 0xFF00) | m_bg_next_tile_lo;
    m_bg_shifter_pattern_hi = (m_bg_shifter_pattern_hi & 0xFF00) | m_bg_next_tile_hi;

    m_bg_shifter_attrib_lo = (m_bg_shifter_attrib_lo & 0xFF00) |
        ((m_bg_next_tile_attrib & 0x01) ? 0xFF : 0x00);
    m_bg_shifter_attrib_hi = (m_bg_shifter_attrib_hi & 0xFF00) |
        ((m_bg_next_tile_attrib & 0x02) ? 0xFF : 0x00);
}

void PPU::update_shifters() {
    if (rendering_enabled()) {
        m_bg_shifter_pattern_lo <<= 1;
        m_bg_shifter_pattern_hi <<= 1;
        m_bg_shifter_attrib_lo <<= 1;
        m_bg_shifter_attrib_hi <<= 1;
    }
}

} // namespace famicore
