#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace famicore;
using namespace famicore::test;

namespace {

void set_status(CPU& cpu, uint8_t status) {
    CpuRegisters regs = cpu.get_registers();
    regs.status = status;
    cpu.set_registers(regs);
}

void set_a(CPU& cpu, uint8_t a) {
    CpuRegisters regs = cpu.get_registers();
    regs.a = a;
    cpu.set_registers(regs);
}

} // namespace

TEST_CASE("reset state", "[cpu]") {
    TestSystem sys = make_system({0xEA});
    CpuRegisters regs = sys.cpu->get_registers();
    CHECK(regs.pc == PROGRAM_ORIGIN);
    CHECK(regs.sp == 0xFD);
    CHECK(regs.status == 0x24);
    CHECK(regs.a == 0);
    CHECK(regs.x == 0);
    CHECK(regs.y == 0);
    CHECK(sys.cpu->get_total_cycles() == 7);
}

TEST_CASE("LDA #$05, TAX, INX, BRK", "[cpu]") {
    TestSystem sys = make_system({0xA9, 0x05, 0xAA, 0xE8, 0x00});
    CPU& cpu = *sys.cpu;

    CHECK(cpu.step() == 2);
    CHECK(cpu.get_a() == 0x05);
    CHECK(!cpu.get_flag(FLAG_Z));
    CHECK(!cpu.get_flag(FLAG_N));

    CHECK(cpu.step() == 2);
    CHECK(cpu.get_x() == 0x05);

    CHECK(cpu.step() == 2);
    CHECK(cpu.get_x() == 0x06);

    CHECK(cpu.step() == 7);
    CHECK(cpu.get_pc() == IRQ_HANDLER);
    CHECK(cpu.get_flag(FLAG_I));
    CHECK(cpu.get_sp() == 0xFA);

    // Return address skips the padding byte; status pushed with B set
    CHECK(sys.bus->peek(0x01FD) == 0x80);
    CHECK(sys.bus->peek(0x01FC) == 0x06);
    CHECK(sys.bus->peek(0x01FB) == (0x24 | FLAG_B | FLAG_U));
    CHECK(cpu.get_total_cycles() == 7 + 2 + 2 + 2 + 7);
}

TEST_CASE("zero and negative flags follow the result", "[cpu]") {
    TestSystem sys = make_system({0xEA});
    for (int value = 0; value < 256; value++) {
        sys.load_ram_program(0x0200, {0xA9, static_cast<uint8_t>(value)});
        sys.cpu->step();
        CHECK(sys.cpu->get_flag(FLAG_Z) == (value == 0));
        CHECK(sys.cpu->get_flag(FLAG_N) == ((value & 0x80) != 0));
    }
}

TEST_CASE("ADC and SBC carry and overflow", "[cpu]") {
    TestSystem sys = make_system({0xEA});

    // $50 + $50 overflows into the sign bit
    set_status(*sys.cpu, 0x24);
    set_a(*sys.cpu, 0x50);
    sys.load_ram_program(0x0200, {0x69, 0x50});
    sys.cpu->step();
    CHECK(sys.cpu->get_a() == 0xA0);
    CHECK(sys.cpu->get_flag(FLAG_V));
    CHECK(!sys.cpu->get_flag(FLAG_C));
    CHECK(sys.cpu->get_flag(FLAG_N));

    // $FF + $01 carries out
    set_status(*sys.cpu, 0x24);
    set_a(*sys.cpu, 0xFF);
    sys.load_ram_program(0x0200, {0x69, 0x01});
    sys.cpu->step();
    CHECK(sys.cpu->get_a() == 0x00);
    CHECK(sys.cpu->get_flag(FLAG_C));
    CHECK(sys.cpu->get_flag(FLAG_Z));
    CHECK(!sys.cpu->get_flag(FLAG_V));

    // SEC; SBC #$01 from $00 borrows
    set_status(*sys.cpu, 0x24);
    set_a(*sys.cpu, 0x00);
    sys.load_ram_program(0x0200, {0x38, 0xE9, 0x01});
    sys.cpu->step();
    sys.cpu->step();
    CHECK(sys.cpu->get_a() == 0xFF);
    CHECK(!sys.cpu->get_flag(FLAG_C));
    CHECK(sys.cpu->get_flag(FLAG_N));

    // SEC; SBC #$01 from $80 overflows
    set_status(*sys.cpu, 0x24);
    set_a(*sys.cpu, 0x80);
    sys.load_ram_program(0x0200, {0x38, 0xE9, 0x01});
    sys.cpu->step();
    sys.cpu->step();
    CHECK(sys.cpu->get_a() == 0x7F);
    CHECK(sys.cpu->get_flag(FLAG_V));
    CHECK(sys.cpu->get_flag(FLAG_C));
}

TEST_CASE("decimal flag does not change arithmetic", "[cpu]") {
    TestSystem sys = make_system({0xEA});
    set_a(*sys.cpu, 0x09);
    sys.load_ram_program(0x0200, {0xF8, 0x18, 0x69, 0x01});
    sys.cpu->step();
    sys.cpu->step();
    sys.cpu->step();
    CHECK(sys.cpu->get_flag(FLAG_D));
    CHECK(sys.cpu->get_a() == 0x0A);
}

TEST_CASE("PHP then PLP restores the status byte", "[cpu]") {
    TestSystem sys = make_system({0xEA});
    for (int status = 0; status < 256; status++) {
        set_status(*sys.cpu, static_cast<uint8_t>(status));
        uint8_t before = sys.cpu->get_status();
        uint8_t sp = sys.cpu->get_sp();

        sys.load_ram_program(0x0200, {0x08, 0x28});
        CHECK(sys.cpu->step() == 3);
        // Pushed with Break and Unused set
        CHECK(sys.bus->peek(0x0100 + sp) == (before | FLAG_B | FLAG_U));
        CHECK(sys.cpu->step() == 4);

        CHECK(sys.cpu->get_status() == ((before & ~FLAG_B) | FLAG_U));
        CHECK(sys.cpu->get_sp() == sp);
    }
}

TEST_CASE("stack pointer wraps within page one", "[cpu]") {
    TestSystem sys = make_system({0xEA});
    CpuRegisters regs = sys.cpu->get_registers();
    regs.sp = 0x00;
    regs.a = 0x5A;
    sys.cpu->set_registers(regs);

    sys.load_ram_program(0x0200, {0x48, 0x68});
    sys.cpu->step();
    CHECK(sys.bus->peek(0x0100) == 0x5A);
    CHECK(sys.cpu->get_sp() == 0xFF);
    sys.cpu->step();
    CHECK(sys.cpu->get_sp() == 0x00);
    CHECK(sys.cpu->get_a() == 0x5A);
}

TEST_CASE("branch timing", "[cpu]") {
    TestSystem sys = make_system({0xEA});

    // Not taken
    set_status(*sys.cpu, 0x24 | FLAG_Z);
    sys.load_ram_program(0x0200, {0xD0, 0x10});
    CHECK(sys.cpu->step() == 2);
    CHECK(sys.cpu->get_pc() == 0x0202);

    // Taken, same page
    set_status(*sys.cpu, 0x24);
    sys.load_ram_program(0x0200, {0xD0, 0x10});
    CHECK(sys.cpu->step() == 3);
    CHECK(sys.cpu->get_pc() == 0x0212);

    // Taken, crossing into the previous page
    sys.load_ram_program(0x0200, {0xD0, 0xF0});
    CHECK(sys.cpu->step() == 4);
    CHECK(sys.cpu->get_pc() == 0x01F2);
}

TEST_CASE("JSR pushes the return address minus one", "[cpu]") {
    TestSystem sys = make_system({0x20, 0x00, 0x81});
    CHECK(sys.cpu->step() == 6);
    CHECK(sys.cpu->get_pc() == 0x8100);
    CHECK(sys.bus->peek(0x01FD) == 0x80);
    CHECK(sys.bus->peek(0x01FC) == 0x02);
}

TEST_CASE("RTS returns past the JSR", "[cpu]") {
    TestSystem sys = make_system({0xEA});
    sys.load_ram_program(0x0200, {0x20, 0x10, 0x02});
    sys.bus->cpu_write(0x0210, 0x60);
    sys.cpu->step();
    CHECK(sys.cpu->get_pc() == 0x0210);
    CHECK(sys.cpu->step() == 6);
    CHECK(sys.cpu->get_pc() == 0x0203);
}

TEST_CASE("NMI sequence", "[cpu]") {
    TestSystem sys = make_system({0xEA});
    sys.cpu->trigger_nmi();

    CHECK(sys.cpu->step() == 7);
    CHECK(sys.cpu->get_pc() == NMI_HANDLER);
    CHECK(sys.cpu->get_flag(FLAG_I));
    CHECK(sys.bus->peek(0x01FD) == 0x80);
    CHECK(sys.bus->peek(0x01FC) == 0x00);
    // Hardware interrupts push with Break clear
    CHECK(sys.bus->peek(0x01FB) == ((0x24 & ~FLAG_B) | FLAG_U));

    // RTI
    CHECK(sys.cpu->step() == 6);
    CHECK(sys.cpu->get_pc() == PROGRAM_ORIGIN);
    CHECK(sys.cpu->get_status() == 0x24);
}

TEST_CASE("NMI from the PPU and trigger_nmi together run the handler once", "[cpu]") {
    TestSystem sys = make_system({0xEA, 0xEA});
    PPU& ppu = sys.bus->get_ppu();
    ppu.cpu_write(0, 0x80);
    while (!ppu.nmi_line()) {
        ppu.tick();
    }
    sys.cpu->trigger_nmi();

    CHECK(sys.cpu->step() == 7);
    CHECK(sys.cpu->get_pc() == NMI_HANDLER);
    CHECK(!ppu.nmi_line());

    // RTI, then straight back to the program
    CHECK(sys.cpu->step() == 6);
    CHECK(sys.cpu->get_pc() == PROGRAM_ORIGIN);
    CHECK(sys.cpu->step() == 2);
    CHECK(sys.cpu->get_pc() == PROGRAM_ORIGIN + 1);
}

TEST_CASE("IRQ is masked by the interrupt disable flag", "[cpu]") {
    TestSystem sys = make_system({0xEA, 0xEA});
    sys.cpu->set_irq_line(true);

    // Reset leaves I set
    CHECK(sys.cpu->step() == 2);
    CHECK(sys.cpu->get_pc() == PROGRAM_ORIGIN + 1);

    set_status(*sys.cpu, FLAG_U);
    CHECK(sys.cpu->step() == 7);
    CHECK(sys.cpu->get_pc() == IRQ_HANDLER);
    CHECK(sys.cpu->get_flag(FLAG_I));
}

TEST_CASE("JAM halts until reset", "[cpu]") {
    TestSystem sys = make_system({0x02});
    CHECK(sys.cpu->step() == 2);
    CHECK(sys.cpu->is_jammed());
    CHECK(sys.cpu->get_pc() == PROGRAM_ORIGIN);

    for (int i = 0; i < 4; i++) {
        CHECK(sys.cpu->step() == 2);
        CHECK(sys.cpu->get_pc() == PROGRAM_ORIGIN);
    }

    sys.cpu->reset();
    CHECK(!sys.cpu->is_jammed());
    CHECK(sys.cpu->get_pc() == PROGRAM_ORIGIN);
}

TEST_CASE("undocumented opcodes", "[cpu]") {
    TestSystem sys = make_system({0xEA});

    SECTION("LAX loads A and X") {
        sys.bus->cpu_write(0x0010, 0x8F);
        sys.load_ram_program(0x0200, {0xA7, 0x10});
        CHECK(sys.cpu->step() == 3);
        CHECK(sys.cpu->get_a() == 0x8F);
        CHECK(sys.cpu->get_x() == 0x8F);
        CHECK(sys.cpu->get_flag(FLAG_N));
    }

    SECTION("SAX stores A AND X") {
        CpuRegisters regs = sys.cpu->get_registers();
        regs.a = 0xF0;
        regs.x = 0x3C;
        sys.cpu->set_registers(regs);
        sys.load_ram_program(0x0200, {0x87, 0x10});
        sys.cpu->step();
        CHECK(sys.bus->peek(0x0010) == 0x30);
    }

    SECTION("DCP decrements then compares") {
        set_a(*sys.cpu, 0x41);
        sys.bus->cpu_write(0x0010, 0x42);
        sys.load_ram_program(0x0200, {0xC7, 0x10});
        CHECK(sys.cpu->step() == 5);
        CHECK(sys.bus->peek(0x0010) == 0x41);
        CHECK(sys.cpu->get_flag(FLAG_Z));
        CHECK(sys.cpu->get_flag(FLAG_C));
    }

    SECTION("ISB increments then subtracts") {
        set_status(*sys.cpu, 0x24 | FLAG_C);
        set_a(*sys.cpu, 0x10);
        sys.bus->cpu_write(0x0010, 0x04);
        sys.load_ram_program(0x0200, {0xE7, 0x10});
        sys.cpu->step();
        CHECK(sys.bus->peek(0x0010) == 0x05);
        CHECK(sys.cpu->get_a() == 0x0B);
        CHECK(sys.cpu->get_flag(FLAG_C));
    }

    SECTION("multi-byte NOP skips its operand") {
        sys.load_ram_program(0x0200, {0x0C, 0x34, 0x12});
        CHECK(sys.cpu->step() == 4);
        CHECK(sys.cpu->get_pc() == 0x0203);
    }
}
