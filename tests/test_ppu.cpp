#include "ppu.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace famicore;
using namespace famicore::test;

namespace {

constexpr int DOTS_PER_FRAME = PPU::DOTS_PER_SCANLINE * PPU::SCANLINES_PER_FRAME;

// Tick until the PPU is about to process (scanline, dot)
void run_to(PPU& ppu, int scanline, int dot) {
    while (ppu.get_scanline() != scanline || ppu.get_dot() != dot) {
        ppu.tick();
    }
}

int dots_until_next_frame(PPU& ppu) {
    uint64_t frame = ppu.get_frame();
    int dots = 0;
    while (ppu.get_frame() == frame) {
        ppu.tick();
        dots++;
    }
    return dots;
}

struct PpuFixture {
    explicit PpuFixture(MirrorMode mirroring = MirrorMode::Horizontal)
        : mapper(make_mapper(image(mirroring))), ppu(*mapper) {}

    static CartridgeImage image(MirrorMode mirroring) {
        CartridgeImage img = make_nrom_image({0xEA});
        img.mirroring = mirroring;
        // Tile 1: every pixel uses colour 1
        for (int row = 0; row < 8; row++) {
            img.chr_rom[0x10 + row] = 0xFF;
        }
        return img;
    }

    std::unique_ptr<Mapper> mapper;
    PPU ppu;
};

} // namespace

TEST_CASE("frame length without rendering", "[ppu]") {
    PpuFixture f;
    CHECK(dots_until_next_frame(f.ppu) == DOTS_PER_FRAME);
    CHECK(f.ppu.is_odd_frame());
    // Odd frame, rendering off: no skipped dot
    CHECK(dots_until_next_frame(f.ppu) == DOTS_PER_FRAME);
    CHECK(f.ppu.get_frame() == 2);
    CHECK(f.ppu.get_scanline() == 0);
    CHECK(f.ppu.get_dot() == 0);
}

TEST_CASE("odd frames skip one dot while rendering", "[ppu]") {
    PpuFixture f;
    f.ppu.cpu_write(1, 0x08);
    CHECK(dots_until_next_frame(f.ppu) == DOTS_PER_FRAME);
    CHECK(dots_until_next_frame(f.ppu) == DOTS_PER_FRAME - 1);
    CHECK(dots_until_next_frame(f.ppu) == DOTS_PER_FRAME);
}

TEST_CASE("vblank flag timing", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    run_to(ppu, PPU::VBLANK_SCANLINE, 1);
    CHECK(!ppu.in_vblank());
    ppu.tick();
    CHECK(ppu.in_vblank());
    CHECK(ppu.check_frame_complete());
    CHECK(!ppu.check_frame_complete());

    run_to(ppu, PPU::PRE_RENDER_SCANLINE, 1);
    CHECK(ppu.in_vblank());
    ppu.tick();
    CHECK(!ppu.in_vblank());
}

TEST_CASE("NMI line at vblank start", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    SECTION("enabled") {
        ppu.cpu_write(0, 0x80);
        run_to(ppu, PPU::VBLANK_SCANLINE, 1);
        CHECK(!ppu.nmi_line());
        ppu.tick();
        CHECK(ppu.nmi_line());
        CHECK(ppu.take_nmi());
        CHECK(!ppu.take_nmi());
    }

    SECTION("disabled") {
        run_to(ppu, PPU::VBLANK_SCANLINE, 2);
        CHECK(!ppu.nmi_line());

        // Enabling NMI during vblank raises it at once
        ppu.cpu_write(0, 0x80);
        CHECK(ppu.nmi_line());
    }
}

TEST_CASE("CPU takes the NMI on its next step", "[ppu]") {
    TestSystem sys = make_system({0xEA, 0xEA, 0xEA});
    PPU& ppu = sys.bus->get_ppu();

    sys.bus->cpu_write(0x2000, 0x80);
    run_to(ppu, PPU::VBLANK_SCANLINE, 2);

    CHECK(sys.cpu->step() == 7);
    CHECK(sys.cpu->get_pc() == NMI_HANDLER);
    CHECK(sys.cpu->get_flag(FLAG_I));
    CHECK(sys.cpu->get_sp() == 0xFA);
    CHECK(sys.bus->peek(0x01FD) == 0x80);
    CHECK(sys.bus->peek(0x01FC) == 0x00);
    CHECK((sys.bus->peek(0x01FB) & FLAG_B) == 0);
    CHECK(!ppu.nmi_line());
}

TEST_CASE("status read clears vblank and the write toggle", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;
    run_to(ppu, PPU::VBLANK_SCANLINE, 2);

    ppu.cpu_write(6, 0x21);
    CHECK(ppu.get_write_toggle());

    uint8_t status = ppu.cpu_read(2);
    CHECK((status & PPU::STATUS_VBLANK) != 0);
    CHECK(!ppu.in_vblank());
    CHECK(!ppu.get_write_toggle());
    CHECK((ppu.cpu_read(2) & PPU::STATUS_VBLANK) == 0);
}

TEST_CASE("scroll and address registers share the write toggle", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.cpu_write(0, 0x00);
    ppu.cpu_write(5, 0x7D);
    CHECK(ppu.get_temp_address() == 0x000F);
    CHECK(ppu.get_fine_x() == 5);
    ppu.cpu_write(5, 0x5E);
    CHECK(ppu.get_temp_address() == 0x616F);

    ppu.cpu_write(6, 0x3D);
    CHECK(ppu.get_temp_address() == 0x3D6F);
    ppu.cpu_write(6, 0xF0);
    CHECK(ppu.get_temp_address() == 0x3DF0);
    CHECK(ppu.get_vram_address() == 0x3DF0);
    CHECK(!ppu.get_write_toggle());
}

TEST_CASE("PPUDATA reads are buffered", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.cpu_write(6, 0x21);
    ppu.cpu_write(6, 0x08);
    ppu.cpu_write(7, 0x55);
    ppu.cpu_write(7, 0x66);
    CHECK(ppu.get_vram_address() == 0x210A);

    ppu.cpu_write(6, 0x21);
    ppu.cpu_write(6, 0x08);
    ppu.cpu_read(7);  // Stale buffer
    CHECK(ppu.cpu_read(7) == 0x55);
    CHECK(ppu.cpu_read(7) == 0x66);
}

TEST_CASE("PPUDATA increment of 32", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.cpu_write(0, 0x04);
    ppu.cpu_write(6, 0x20);
    ppu.cpu_write(6, 0x00);
    ppu.cpu_write(7, 0x01);
    ppu.cpu_write(7, 0x02);
    CHECK(ppu.get_vram_address() == 0x2040);
    CHECK(ppu.ppu_read(0x2000) == 0x01);
    CHECK(ppu.ppu_read(0x2020) == 0x02);
}

TEST_CASE("palette reads are immediate and mirrored", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.cpu_write(6, 0x3F);
    ppu.cpu_write(6, 0x10);
    ppu.cpu_write(7, 0x2C);

    CHECK(ppu.ppu_read(0x3F00) == 0x2C);
    CHECK(ppu.ppu_read(0x3F10) == 0x2C);

    ppu.cpu_write(6, 0x3F);
    ppu.cpu_write(6, 0x00);
    CHECK((ppu.cpu_read(7) & 0x3F) == 0x2C);

    // Palette entries are six bits wide
    ppu.ppu_write(0x3F01, 0xFF);
    CHECK(ppu.ppu_read(0x3F01) == 0x3F);
    CHECK(ppu.ppu_read(0x3F21) == 0x3F);
}

TEST_CASE("nametable mirroring", "[ppu]") {
    SECTION("horizontal") {
        PpuFixture f(MirrorMode::Horizontal);
        f.ppu.ppu_write(0x2005, 0x11);
        CHECK(f.ppu.ppu_read(0x2405) == 0x11);
        CHECK(f.ppu.ppu_read(0x2805) != 0x11);
        f.ppu.ppu_write(0x2C05, 0x22);
        CHECK(f.ppu.ppu_read(0x2805) == 0x22);
        CHECK(f.ppu.ppu_read(0x3005) == 0x11);
    }

    SECTION("vertical") {
        PpuFixture f(MirrorMode::Vertical);
        f.ppu.ppu_write(0x2005, 0x11);
        CHECK(f.ppu.ppu_read(0x2805) == 0x11);
        CHECK(f.ppu.ppu_read(0x2405) != 0x11);
        f.ppu.ppu_write(0x2405, 0x22);
        CHECK(f.ppu.ppu_read(0x2C05) == 0x22);
    }

    SECTION("four screen") {
        PpuFixture f(MirrorMode::FourScreen);
        f.ppu.ppu_write(0x2005, 0x11);
        f.ppu.ppu_write(0x2405, 0x22);
        f.ppu.ppu_write(0x2805, 0x33);
        f.ppu.ppu_write(0x2C05, 0x44);
        CHECK(f.ppu.ppu_read(0x2005) == 0x11);
        CHECK(f.ppu.ppu_read(0x2405) == 0x22);
        CHECK(f.ppu.ppu_read(0x2805) == 0x33);
        CHECK(f.ppu.ppu_read(0x2C05) == 0x44);
    }
}

TEST_CASE("write-only registers read back the I/O latch", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.cpu_write(1, 0x9C);
    CHECK(ppu.cpu_read(0) == 0x9C);
    CHECK(ppu.cpu_read(5) == 0x9C);
    // Low five bits of PPUSTATUS are open bus as well
    CHECK((ppu.cpu_read(2) & 0x1F) == (0x9C & 0x1F));
}

TEST_CASE("OAM access", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.cpu_write(3, 0x10);
    ppu.cpu_write(4, 0xAA);
    ppu.cpu_write(4, 0xBB);
    ppu.cpu_write(4, 0xFF);
    CHECK(ppu.get_oam_addr() == 0x13);
    CHECK(ppu.get_oam()[0x10] == 0xAA);

    ppu.cpu_write(3, 0x12);
    // Attribute bytes have no bits 2-4
    CHECK(ppu.cpu_read(4) == 0xE3);
}

TEST_CASE("sprite overflow with nine sprites on a line", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.cpu_write(3, 0x00);
    for (int i = 0; i < 64; i++) {
        ppu.cpu_write(4, i < 9 ? 10 : 0xF0);  // Y
        ppu.cpu_write(4, 0x01);               // Tile
        ppu.cpu_write(4, 0x00);               // Attributes
        ppu.cpu_write(4, static_cast<uint8_t>(i * 8));
    }
    ppu.cpu_write(1, 0x10);

    run_to(ppu, 10, 0);
    CHECK(!ppu.sprite_overflow());
    run_to(ppu, 11, 0);
    CHECK(ppu.sprite_overflow());
    CHECK(ppu.get_sprite_count() == 8);

    run_to(ppu, PPU::PRE_RENDER_SCANLINE, 2);
    CHECK(!ppu.sprite_overflow());
}

TEST_CASE("sprite zero hit", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    // Background of tile 1 everywhere
    for (uint16_t addr = 0x2000; addr < 0x23C0; addr++) {
        ppu.ppu_write(addr, 0x01);
    }

    ppu.cpu_write(3, 0x00);
    ppu.cpu_write(4, 30);    // Y
    ppu.cpu_write(4, 0x01);  // Tile
    ppu.cpu_write(4, 0x00);  // Attributes
    ppu.cpu_write(4, 40);    // X
    for (int i = 4; i < 256; i++) {
        ppu.cpu_write(4, 0xF0);
    }

    ppu.cpu_write(1, 0x1E);

    run_to(ppu, 31, 0);
    CHECK(!ppu.sprite_zero_hit());
    run_to(ppu, 32, 0);
    CHECK(ppu.sprite_zero_hit());

    run_to(ppu, PPU::PRE_RENDER_SCANLINE, 2);
    CHECK(!ppu.sprite_zero_hit());
}

TEST_CASE("frame buffer is published at vblank", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    // Universal background colour $21
    ppu.ppu_write(0x3F00, 0x21);
    ppu.cpu_write(1, 0x0A);

    run_to(ppu, PPU::VBLANK_SCANLINE, 1);
    CHECK(ppu.get_framebuffer().get_pixel(0, 0) == 0);
    ppu.tick();

    const FrameBuffer& fb = ppu.get_framebuffer();
    CHECK(fb.get_pixel(0, 0) == PPU::palette_color(0x21));
    CHECK(fb.get_pixel(255, 239) == PPU::palette_color(0x21));
}

TEST_CASE("greyscale keeps the luma column", "[ppu]") {
    PpuFixture f;
    PPU& ppu = f.ppu;

    ppu.ppu_write(0x3F00, 0x16);
    ppu.cpu_write(1, 0x01);
    run_to(ppu, PPU::VBLANK_SCANLINE, 2);
    CHECK(ppu.get_framebuffer().get_pixel(10, 10) == PPU::palette_color(0x10));
}

TEST_CASE("palette colours are RGBA with red in the low byte", "[ppu]") {
    // $16 is a red, $12 a blue
    uint32_t red = PPU::palette_color(0x16);
    CHECK((red & 0xFF) == 0x98);
    CHECK(((red >> 16) & 0xFF) == 0x20);
    CHECK((red >> 24) == 0xFF);

    uint32_t blue = PPU::palette_color(0x12);
    CHECK((blue & 0xFF) == 0x30);
    CHECK(((blue >> 16) & 0xFF) == 0xEC);
}
