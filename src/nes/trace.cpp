#include "trace.hpp"
#include "bus.hpp"
#include "cpu.hpp"
#include "instructions.hpp"

#include <cstdio>

namespace famicore {

namespace {

uint16_t peek16_zero_page(Bus& bus, uint8_t address) {
    uint8_t lo = bus.peek(address);
    uint8_t hi = bus.peek(static_cast<uint8_t>(address + 1));
    return (static_cast<uint16_t>(hi) << 8) | lo;
}

// Operand text in the nestest disassembly format
std::string format_operand(const Instruction& instr, const CPU& cpu, Bus& bus,
                           uint16_t pc, uint8_t lo, uint8_t hi) {
    char text[64] = {0};
    uint16_t absolute = (static_cast<uint16_t>(hi) << 8) | lo;

    switch (instr.mode) {
        case AddressingMode::Implied:
            break;

        case AddressingMode::Accumulator:
            snprintf(text, sizeof(text), "A");
            break;

        case AddressingMode::Immediate:
            snprintf(text, sizeof(text), "#$%02X", lo);
            break;

        case AddressingMode::ZeroPage:
            snprintf(text, sizeof(text), "$%02X = %02X", lo, bus.peek(lo));
            break;

        case AddressingMode::ZeroPageX: {
            uint8_t addr = static_cast<uint8_t>(lo + cpu.get_x());
            snprintf(text, sizeof(text), "$%02X,X @ %02X = %02X", lo, addr, bus.peek(addr));
            break;
        }

        case AddressingMode::ZeroPageY: {
            uint8_t addr = static_cast<uint8_t>(lo + cpu.get_y());
            snprintf(text, sizeof(text), "$%02X,Y @ %02X = %02X", lo, addr, bus.peek(addr));
            break;
        }

        case AddressingMode::Absolute:
            if (instr.operation == Operation::JMP || instr.operation == Operation::JSR) {
                snprintf(text, sizeof(text), "$%04X", absolute);
            } else {
                snprintf(text, sizeof(text), "$%04X = %02X", absolute, bus.peek(absolute));
            }
            break;

        case AddressingMode::AbsoluteX: {
            uint16_t addr = absolute + cpu.get_x();
            snprintf(text, sizeof(text), "$%04X,X @ %04X = %02X", absolute, addr, bus.peek(addr));
            break;
        }

        case AddressingMode::AbsoluteY: {
            uint16_t addr = absolute + cpu.get_y();
            snprintf(text, sizeof(text), "$%04X,Y @ %04X = %02X", absolute, addr, bus.peek(addr));
            break;
        }

        case AddressingMode::Indirect: {
            // Same page-wrap bug as the CPU
            uint16_t next = (absolute & 0xFF00) | ((absolute + 1) & 0x00FF);
            uint16_t target = (static_cast<uint16_t>(bus.peek(next)) << 8) | bus.peek(absolute);
            snprintf(text, sizeof(text), "($%04X) = %04X", absolute, target);
            break;
        }

        case AddressingMode::IndirectX: {
            uint8_t ptr = static_cast<uint8_t>(lo + cpu.get_x());
            uint16_t addr = peek16_zero_page(bus, ptr);
            snprintf(text, sizeof(text), "($%02X,X) @ %02X = %04X = %02X", lo, ptr, addr, bus.peek(addr));
            break;
        }

        case AddressingMode::IndirectY: {
            uint16_t base = peek16_zero_page(bus, lo);
            uint16_t addr = base + cpu.get_y();
            snprintf(text, sizeof(text), "($%02X),Y = %04X @ %04X = %02X", lo, base, addr, bus.peek(addr));
            break;
        }

        case AddressingMode::Relative: {
            uint16_t target = pc + 2 + static_cast<int8_t>(lo);
            snprintf(text, sizeof(text), "$%04X", target);
            break;
        }
    }

    return text;
}

} // namespace

std::string format_trace(const CPU& cpu, Bus& bus) {
    uint16_t pc = cpu.get_pc();
    uint8_t opcode = bus.peek(pc);
    const Instruction& instr = decode(opcode);
    int length = instruction_length(instr.mode);

    uint8_t lo = length > 1 ? bus.peek(pc + 1) : 0;
    uint8_t hi = length > 2 ? bus.peek(pc + 2) : 0;

    // Raw bytes
    char bytes[16];
    if (length == 1) {
        snprintf(bytes, sizeof(bytes), "%02X", opcode);
    } else if (length == 2) {
        snprintf(bytes, sizeof(bytes), "%02X %02X", opcode, lo);
    } else {
        snprintf(bytes, sizeof(bytes), "%02X %02X %02X", opcode, lo, hi);
    }

    std::string operand = format_operand(instr, cpu, bus, pc, lo, hi);

    // Disassembly, unofficial opcodes marked with '*'
    char disasm[96];
    snprintf(disasm, sizeof(disasm), "%04X  %-8s %c%s %s",
             pc, bytes, instr.official ? ' ' : '*', instr.mnemonic, operand.c_str());

    std::string asm_text = disasm;
    while (!asm_text.empty() && asm_text.back() == ' ') {
        asm_text.pop_back();
    }

    const PPU& ppu = bus.get_ppu();
    char line[160];
    snprintf(line, sizeof(line), "%-47s A:%02X X:%02X Y:%02X P:%02X SP:%02X PPU:%3d,%3d CYC:%llu",
             asm_text.c_str(), cpu.get_a(), cpu.get_x(), cpu.get_y(), cpu.get_status(),
             cpu.get_sp(), ppu.get_scanline(), ppu.get_dot(),
             static_cast<unsigned long long>(cpu.get_total_cycles()));
    return line;
}

} // namespace famicore
