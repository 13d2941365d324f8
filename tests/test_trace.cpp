#include "trace.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <string>

using namespace famicore;
using namespace famicore::test;

namespace {

// Disassembly column, trailing padding removed
std::string disassembly(const std::string& line) {
    std::string text = line.substr(0, 47);
    while (!text.empty() && text.back() == ' ') {
        text.pop_back();
    }
    return text;
}

} // namespace

TEST_CASE("trace line layout", "[trace]") {
    TestSystem sys = make_system({0xA9, 0x05});
    std::string line = format_trace(*sys.cpu, *sys.bus);

    CHECK(disassembly(line) == "8000  A9 05     LDA #$05");
    CHECK(line.find("A:") == 48);
    CHECK(line.substr(48) == "A:00 X:00 Y:00 P:24 SP:FD PPU:  0,  0 CYC:7");
}

TEST_CASE("trace operand formats", "[trace]") {
    TestSystem sys = make_system({
        0x4C, 0xF5, 0xC5,   // JMP $C5F5
        0xA5, 0x10,         // LDA $10
        0xBD, 0xFF, 0x02,   // LDA $02FF,X
        0x6C, 0xFF, 0x02,   // JMP ($02FF)
        0xB1, 0x20,         // LDA ($20),Y
        0xD0, 0xFE,         // BNE *
        0x0A,               // ASL A
        0x04, 0x10,         // *NOP $10
    });
    sys.bus->cpu_write(0x0010, 0x77);
    sys.bus->cpu_write(0x0300, 0x33);
    sys.bus->cpu_write(0x02FF, 0x00);
    sys.bus->cpu_write(0x0200, 0x06);
    sys.bus->cpu_write(0x0020, 0x00);
    sys.bus->cpu_write(0x0021, 0x03);

    CpuRegisters regs = sys.cpu->get_registers();
    regs.x = 1;
    regs.y = 2;
    sys.cpu->set_registers(regs);

    auto at = [&sys](uint16_t pc) {
        CpuRegisters r = sys.cpu->get_registers();
        r.pc = pc;
        sys.cpu->set_registers(r);
        return disassembly(format_trace(*sys.cpu, *sys.bus));
    };

    CHECK(at(0x8000) == "8000  4C F5 C5  JMP $C5F5");
    CHECK(at(0x8003) == "8003  A5 10     LDA $10 = 77");
    CHECK(at(0x8005) == "8005  BD FF 02  LDA $02FF,X @ 0300 = 33");
    CHECK(at(0x8008) == "8008  6C FF 02  JMP ($02FF) = 0600");
    CHECK(at(0x800B) == "800B  B1 20     LDA ($20),Y = 0300 @ 0302 = 00");
    CHECK(at(0x800D) == "800D  D0 FE     BNE $800D");
    CHECK(at(0x800F) == "800F  0A        ASL A");
    CHECK(at(0x8010) == "8010  04 10    *NOP $10 = 77");
}

TEST_CASE("tracing does not disturb PPU state", "[trace]") {
    TestSystem sys = make_system({0xAD, 0x02, 0x20});  // LDA $2002
    PPU& ppu = sys.bus->get_ppu();
    for (int i = 0; i < 241 * PPU::DOTS_PER_SCANLINE + 2; i++) {
        ppu.tick();
    }
    REQUIRE(ppu.in_vblank());

    std::string line = format_trace(*sys.cpu, *sys.bus);
    CHECK(disassembly(line) == "8000  AD 02 20  LDA $2002 = 80");
    CHECK(ppu.in_vblank());
    CHECK(line.find("PPU:241,  2") != std::string::npos);
}
