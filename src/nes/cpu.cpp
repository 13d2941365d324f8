#include "cpu.hpp"
#include "bus.hpp"
#include "debug.hpp"

#include <cstdio>

namespace famicore {

CPU::CPU(Bus& bus) : m_bus(bus) {
    reset();
}

CPU::~CPU() = default;

void CPU::reset() {
    m_pc = read16(RESET_VECTOR);
    m_a = 0;
    m_x = 0;
    m_y = 0;
    m_sp = 0xFD;
    m_status = FLAG_I | FLAG_U;
    m_nmi_pending = false;
    m_irq_line = false;
    m_jammed = false;

    // Reset sequence takes 7 cycles
    m_total_cycles = 7;
}

int CPU::step() {
    int cycles = 0;
    // The PPU line is consumed every step, even when trigger_nmi() is also pending
    const bool ppu_nmi = m_bus.poll_nmi();

    if (m_jammed) {
        // Locked until reset; time still passes
        cycles = 2;
    } else if (m_nmi_pending || ppu_nmi) {
        m_nmi_pending = false;
        interrupt(NMI_VECTOR);
        cycles = 7;
    } else if ((m_irq_line || m_bus.irq_pending()) && !get_flag(FLAG_I)) {
        interrupt(IRQ_VECTOR);
        cycles = 7;
    } else {
        // Fetch, decode, execute
        const Instruction& instr = decode(read(m_pc++));
        Operand operand = fetch_operand(instr.mode);

        cycles = instr.cycles;
        if (instr.page_penalty && operand.page_crossed) {
            cycles++;
        }
        cycles += execute(instr, operand);
    }

    m_total_cycles += cycles;
    return cycles;
}

void CPU::trigger_nmi() {
    m_nmi_pending = true;
}

void CPU::interrupt(uint16_t vector) {
    push16(m_pc);
    push((m_status & ~FLAG_B) | FLAG_U);
    set_flag(FLAG_I, true);
    m_pc = read16(vector);
}

CpuRegisters CPU::get_registers() const {
    CpuRegisters regs;
    regs.a = m_a;
    regs.x = m_x;
    regs.y = m_y;
    regs.sp = m_sp;
    regs.pc = m_pc;
    regs.status = m_status;
    return regs;
}

void CPU::set_registers(const CpuRegisters& regs) {
    m_a = regs.a;
    m_x = regs.x;
    m_y = regs.y;
    m_sp = regs.sp;
    m_pc = regs.pc;
    m_status = regs.status | FLAG_U;
}

uint8_t CPU::read(uint16_t address) {
    return m_bus.cpu_read(address);
}

void CPU::write(uint16_t address, uint8_t value) {
    m_bus.cpu_write(address, value);
}

uint16_t CPU::read16(uint16_t address) {
    uint8_t lo = read(address);
    uint8_t hi = read(address + 1);
    return (static_cast<uint16_t>(hi) << 8) | lo;
}

void CPU::push(uint8_t value) {
    write(0x0100 + m_sp, value);
    m_sp--;
}

uint8_t CPU::pop() {
    m_sp++;
    return read(0x0100 + m_sp);
}

void CPU::push16(uint16_t value) {
    push(static_cast<uint8_t>(value >> 8));
    push(static_cast<uint8_t>(value & 0xFF));
}

uint16_t CPU::pop16() {
    uint8_t lo = pop();
    uint8_t hi = pop();
    return (static_cast<uint16_t>(hi) << 8) | lo;
}

// Addressing modes
Operand CPU::fetch_operand(AddressingMode mode) {
    Operand operand;

    switch (mode) {
        case AddressingMode::Implied:
        case AddressingMode::Accumulator:
            break;

        case AddressingMode::Immediate:
            operand.address = m_pc++;
            break;

        case AddressingMode::ZeroPage:
            operand.address = read(m_pc++);
            break;

        case AddressingMode::ZeroPageX:
            operand.base = read(m_pc++);
            operand.address = (operand.base + m_x) & 0xFF;
            break;

        case AddressingMode::ZeroPageY:
            operand.base = read(m_pc++);
            operand.address = (operand.base + m_y) & 0xFF;
            break;

        case AddressingMode::Absolute:
            operand.address = read16(m_pc);
            m_pc += 2;
            break;

        case AddressingMode::AbsoluteX:
        case AddressingMode::AbsoluteY: {
            operand.base = read16(m_pc);
            m_pc += 2;
            uint8_t index = (mode == AddressingMode::AbsoluteX) ? m_x : m_y;
            operand.address = operand.base + index;
            operand.page_crossed = (operand.base & 0xFF00) != (operand.address & 0xFF00);
            break;
        }

        case AddressingMode::Indirect: {
            uint16_t ptr = read16(m_pc);
            m_pc += 2;
            // 6502 bug: the pointer high byte does not carry into the next page
            uint16_t ptr_next = (ptr & 0xFF00) | ((ptr + 1) & 0x00FF);
            operand.base = ptr;
            operand.address = (static_cast<uint16_t>(read(ptr_next)) << 8) | read(ptr);
            break;
        }

        case AddressingMode::IndirectX: {
            uint8_t ptr = (read(m_pc++) + m_x) & 0xFF;
            uint8_t lo = read(ptr);
            uint8_t hi = read((ptr + 1) & 0xFF);
            operand.base = ptr;
            operand.address = (static_cast<uint16_t>(hi) << 8) | lo;
            break;
        }

        case AddressingMode::IndirectY: {
            uint8_t ptr = read(m_pc++);
            uint8_t lo = read(ptr);
            uint8_t hi = read((ptr + 1) & 0xFF);
            operand.base = (static_cast<uint16_t>(hi) << 8) | lo;
            operand.address = operand.base + m_y;
            operand.page_crossed = (operand.base & 0xFF00) != (operand.address & 0xFF00);
            break;
        }

        case AddressingMode::Relative: {
            int8_t offset = static_cast<int8_t>(read(m_pc++));
            operand.base = m_pc;
            operand.address = m_pc + offset;
            operand.page_crossed = (operand.base & 0xFF00) != (operand.address & 0xFF00);
            break;
        }
    }

    return operand;
}

int CPU::execute(const Instruction& instr, const Operand& operand) {
    const uint16_t addr = operand.address;
    const bool accumulator = instr.mode == AddressingMode::Accumulator;

    switch (instr.operation) {
        // Loads and stores
        case Operation::LDA: m_a = read(addr); update_zero_negative(m_a); break;
        case Operation::LDX: m_x = read(addr); update_zero_negative(m_x); break;
        case Operation::LDY: m_y = read(addr); update_zero_negative(m_y); break;
        case Operation::STA: write(addr, m_a); break;
        case Operation::STX: write(addr, m_x); break;
        case Operation::STY: write(addr, m_y); break;

        // Arithmetic and logic
        case Operation::ADC: op_adc(read(addr)); break;
        case Operation::SBC: op_adc(static_cast<uint8_t>(~read(addr))); break;
        case Operation::AND: op_and(read(addr)); break;
        case Operation::ORA: op_ora(read(addr)); break;
        case Operation::EOR: op_eor(read(addr)); break;
        case Operation::BIT: op_bit(read(addr)); break;
        case Operation::CMP: op_cmp(m_a, read(addr)); break;
        case Operation::CPX: op_cmp(m_x, read(addr)); break;
        case Operation::CPY: op_cmp(m_y, read(addr)); break;

        // Shifts and rotates
        case Operation::ASL:
            if (accumulator) m_a = op_asl(m_a);
            else write(addr, op_asl(read(addr)));
            break;
        case Operation::LSR:
            if (accumulator) m_a = op_lsr(m_a);
            else write(addr, op_lsr(read(addr)));
            break;
        case Operation::ROL:
            if (accumulator) m_a = op_rol(m_a);
            else write(addr, op_rol(read(addr)));
            break;
        case Operation::ROR:
            if (accumulator) m_a = op_ror(m_a);
            else write(addr, op_ror(read(addr)));
            break;

        // Increments and decrements
        case Operation::INC: {
            uint8_t value = read(addr) + 1;
            write(addr, value);
            update_zero_negative(value);
            break;
        }
        case Operation::DEC: {
            uint8_t value = read(addr) - 1;
            write(addr, value);
            update_zero_negative(value);
            break;
        }
        case Operation::INX: m_x++; update_zero_negative(m_x); break;
        case Operation::INY: m_y++; update_zero_negative(m_y); break;
        case Operation::DEX: m_x--; update_zero_negative(m_x); break;
        case Operation::DEY: m_y--; update_zero_negative(m_y); break;

        // Transfers
        case Operation::TAX: m_x = m_a; update_zero_negative(m_x); break;
        case Operation::TAY: m_y = m_a; update_zero_negative(m_y); break;
        case Operation::TSX: m_x = m_sp; update_zero_negative(m_x); break;
        case Operation::TXA: m_a = m_x; update_zero_negative(m_a); break;
        case Operation::TXS: m_sp = m_x; break;
        case Operation::TYA: m_a = m_y; update_zero_negative(m_a); break;

        // Stack
        case Operation::PHA: push(m_a); break;
        case Operation::PHP: push(m_status | FLAG_B | FLAG_U); break;
        case Operation::PLA: m_a = pop(); update_zero_negative(m_a); break;
        case Operation::PLP: m_status = (pop() & ~FLAG_B) | FLAG_U; break;

        // Flags
        case Operation::CLC: set_flag(FLAG_C, false); break;
        case Operation::CLD: set_flag(FLAG_D, false); break;
        case Operation::CLI: set_flag(FLAG_I, false); break;
        case Operation::CLV: set_flag(FLAG_V, false); break;
        case Operation::SEC: set_flag(FLAG_C, true); break;
        case Operation::SED: set_flag(FLAG_D, true); break;
        case Operation::SEI: set_flag(FLAG_I, true); break;

        // Branches
        case Operation::BCC: return op_branch(!get_flag(FLAG_C), operand);
        case Operation::BCS: return op_branch(get_flag(FLAG_C), operand);
        case Operation::BEQ: return op_branch(get_flag(FLAG_Z), operand);
        case Operation::BNE: return op_branch(!get_flag(FLAG_Z), operand);
        case Operation::BMI: return op_branch(get_flag(FLAG_N), operand);
        case Operation::BPL: return op_branch(!get_flag(FLAG_N), operand);
        case Operation::BVC: return op_branch(!get_flag(FLAG_V), operand);
        case Operation::BVS: return op_branch(get_flag(FLAG_V), operand);

        // Jumps and returns
        case Operation::JMP: m_pc = addr; break;
        case Operation::JSR: push16(m_pc - 1); m_pc = addr; break;
        case Operation::RTS: m_pc = pop16() + 1; break;
        case Operation::RTI:
            m_status = (pop() & ~FLAG_B) | FLAG_U;
            m_pc = pop16();
            break;
        case Operation::BRK: op_brk(); break;

        case Operation::NOP:
            // Multi-byte NOPs still perform the read
            if (instr.mode != AddressingMode::Implied && instr.mode != AddressingMode::Immediate) {
                read(addr);
            }
            break;

        // Undocumented read-modify-write combinations
        case Operation::SLO: {
            uint8_t value = op_asl(read(addr));
            write(addr, value);
            op_ora(value);
            break;
        }
        case Operation::RLA: {
            uint8_t value = op_rol(read(addr));
            write(addr, value);
            op_and(value);
            break;
        }
        case Operation::SRE: {
            uint8_t value = op_lsr(read(addr));
            write(addr, value);
            op_eor(value);
            break;
        }
        case Operation::RRA: {
            uint8_t value = op_ror(read(addr));
            write(addr, value);
            op_adc(value);
            break;
        }
        case Operation::DCP: {
            uint8_t value = read(addr) - 1;
            write(addr, value);
            op_cmp(m_a, value);
            break;
        }
        case Operation::ISB: {
            uint8_t value = read(addr) + 1;
            write(addr, value);
            op_adc(static_cast<uint8_t>(~value));
            break;
        }

        case Operation::SAX: write(addr, m_a & m_x); break;
        case Operation::LAX:
            m_a = m_x = read(addr);
            update_zero_negative(m_a);
            break;

        // Undocumented immediate operations
        case Operation::ANC:
            op_and(read(addr));
            set_flag(FLAG_C, get_flag(FLAG_N));
            break;
        case Operation::ALR:
            op_and(read(addr));
            m_a = op_lsr(m_a);
            break;
        case Operation::ARR: {
            m_a &= read(addr);
            m_a = (m_a >> 1) | (get_flag(FLAG_C) ? 0x80 : 0x00);
            update_zero_negative(m_a);
            set_flag(FLAG_C, (m_a & 0x40) != 0);
            set_flag(FLAG_V, (((m_a >> 6) ^ (m_a >> 5)) & 0x01) != 0);
            break;
        }
        case Operation::XAA:
            m_a = (m_a | 0xEE) & m_x & read(addr);
            update_zero_negative(m_a);
            break;
        case Operation::LXA:
            m_a = m_x = (m_a | 0xEE) & read(addr);
            update_zero_negative(m_a);
            break;
        case Operation::AXS: {
            uint8_t value = read(addr);
            uint8_t masked = m_a & m_x;
            set_flag(FLAG_C, masked >= value);
            m_x = masked - value;
            update_zero_negative(m_x);
            break;
        }
        case Operation::LAS:
            m_a = m_x = m_sp = read(addr) & m_sp;
            update_zero_negative(m_a);
            break;

        // Unstable stores
        case Operation::TAS:
            m_sp = m_a & m_x;
            store_high_and(operand, m_sp);
            break;
        case Operation::SHA: store_high_and(operand, m_a & m_x); break;
        case Operation::SHX: store_high_and(operand, m_x); break;
        case Operation::SHY: store_high_and(operand, m_y); break;

        case Operation::JAM:
            m_jammed = true;
            m_pc--;
            if (is_debug_mode()) {
                fprintf(stderr, "[CPU] JAM opcode $%02X at $%04X\n", instr.opcode, m_pc);
            }
            break;
    }

    return 0;
}

void CPU::set_flag(uint8_t flag, bool value) {
    if (value) {
        m_status |= flag;
    } else {
        m_status &= ~flag;
    }
}

bool CPU::get_flag(uint8_t flag) const {
    return (m_status & flag) != 0;
}

void CPU::update_zero_negative(uint8_t value) {
    set_flag(FLAG_Z, value == 0);
    set_flag(FLAG_N, (value & 0x80) != 0);
}

// Instructions
void CPU::op_adc(uint8_t value) {
    // Decimal flag has no effect on the 2A03
    uint16_t sum = m_a + value + (get_flag(FLAG_C) ? 1 : 0);
    set_flag(FLAG_C, sum > 0xFF);
    set_flag(FLAG_V, (~(m_a ^ value) & (m_a ^ sum) & 0x80) != 0);
    m_a = static_cast<uint8_t>(sum);
    update_zero_negative(m_a);
}

void CPU::op_and(uint8_t value) {
    m_a &= value;
    update_zero_negative(m_a);
}

void CPU::op_ora(uint8_t value) {
    m_a |= value;
    update_zero_negative(m_a);
}

void CPU::op_eor(uint8_t value) {
    m_a ^= value;
    update_zero_negative(m_a);
}

void CPU::op_bit(uint8_t value) {
    set_flag(FLAG_Z, (m_a & value) == 0);
    set_flag(FLAG_N, (value & 0x80) != 0);
    set_flag(FLAG_V, (value & 0x40) != 0);
}

void CPU::op_cmp(uint8_t reg, uint8_t value) {
    set_flag(FLAG_C, reg >= value);
    update_zero_negative(static_cast<uint8_t>(reg - value));
}

uint8_t CPU::op_asl(uint8_t value) {
    set_flag(FLAG_C, (value & 0x80) != 0);
    value <<= 1;
    update_zero_negative(value);
    return value;
}

uint8_t CPU::op_lsr(uint8_t value) {
    set_flag(FLAG_C, (value & 0x01) != 0);
    value >>= 1;
    update_zero_negative(value);
    return value;
}

uint8_t CPU::op_rol(uint8_t value) {
    bool carry = get_flag(FLAG_C);
    set_flag(FLAG_C, (value & 0x80) != 0);
    value = (value << 1) | (carry ? 1 : 0);
    update_zero_negative(value);
    return value;
}

uint8_t CPU::op_ror(uint8_t value) {
    bool carry = get_flag(FLAG_C);
    set_flag(FLAG_C, (value & 0x01) != 0);
    value = (value >> 1) | (carry ? 0x80 : 0);
    update_zero_negative(value);
    return value;
}

int CPU::op_branch(bool condition, const Operand& operand) {
    if (!condition) {
        return 0;
    }
    // Branch taken adds 1 cycle, page crossing adds another
    m_pc = operand.address;
    return operand.page_crossed ? 2 : 1;
}

void CPU::op_brk() {
    // Skip the padding byte
    m_pc++;
    push16(m_pc);
    push(m_status | FLAG_B | FLAG_U);
    set_flag(FLAG_I, true);
    m_pc = read16(IRQ_VECTOR);
}

// SHA/SHX/SHY/TAS store value AND (high byte of the base address + 1);
// on a page cross the stored value also replaces the address high byte
void CPU::store_high_and(const Operand& operand, uint8_t value) {
    uint8_t high = static_cast<uint8_t>((operand.base >> 8) + 1);
    uint8_t result = value & high;
    uint16_t address = operand.address;
    if (operand.page_crossed) {
        address = (address & 0x00FF) | (static_cast<uint16_t>(result) << 8);
    }
    write(address, result);
}

} // namespace famicore
