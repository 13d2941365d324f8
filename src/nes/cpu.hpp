#pragma once

#include "famicore/types.hpp"
#include "instructions.hpp"

#include <cstdint>

namespace famicore {

class Bus;

// Resolved operand of one instruction
struct Operand {
    uint16_t address = 0;       // Effective address (Immediate: address of the byte)
    uint16_t base = 0;          // Address before indexing
    bool page_crossed = false;
};

// 6502 CPU (2A03 core, decimal mode inert)
class CPU {
public:
    static constexpr uint16_t NMI_VECTOR = 0xFFFA;
    static constexpr uint16_t RESET_VECTOR = 0xFFFC;
    static constexpr uint16_t IRQ_VECTOR = 0xFFFE;

    explicit CPU(Bus& bus);
    ~CPU();

    // Reset the CPU
    void reset();

    // Execute one instruction (or interrupt sequence), return cycles consumed
    int step();

    // Resolve the operand for mode at PC, advancing PC past it
    Operand fetch_operand(AddressingMode mode);

    // Interrupts
    void trigger_nmi();
    void set_irq_line(bool asserted) { m_irq_line = asserted; }

    // Register access (for debugging and conformance tests)
    CpuRegisters get_registers() const;
    void set_registers(const CpuRegisters& regs);
    uint16_t get_pc() const { return m_pc; }
    uint8_t get_a() const { return m_a; }
    uint8_t get_x() const { return m_x; }
    uint8_t get_y() const { return m_y; }
    uint8_t get_sp() const { return m_sp; }
    uint8_t get_status() const { return m_status; }
    bool get_flag(uint8_t flag) const;

    bool is_jammed() const { return m_jammed; }

    // Cycles since power-on, stalls included
    uint64_t get_total_cycles() const { return m_total_cycles; }
    void add_stall_cycles(int cycles) { m_total_cycles += cycles; }

private:
    // Memory access
    uint8_t read(uint16_t address);
    void write(uint16_t address, uint8_t value);
    uint16_t read16(uint16_t address);

    // Stack operations
    void push(uint8_t value);
    uint8_t pop();
    void push16(uint16_t value);
    uint16_t pop16();

    // Execute a decoded instruction, return extra cycles (branches)
    int execute(const Instruction& instr, const Operand& operand);
    void interrupt(uint16_t vector);

    // Flag operations
    void set_flag(uint8_t flag, bool value);
    void update_zero_negative(uint8_t value);

    // Instructions
    void op_adc(uint8_t value);
    void op_and(uint8_t value);
    void op_ora(uint8_t value);
    void op_eor(uint8_t value);
    void op_bit(uint8_t value);
    void op_cmp(uint8_t reg, uint8_t value);
    uint8_t op_asl(uint8_t value);
    uint8_t op_lsr(uint8_t value);
    uint8_t op_rol(uint8_t value);
    uint8_t op_ror(uint8_t value);
    int op_branch(bool condition, const Operand& operand);
    void op_brk();
    void store_high_and(const Operand& operand, uint8_t value);

    // Bus reference
    Bus& m_bus;

    // Registers
    uint16_t m_pc = 0;       // Program counter
    uint8_t m_a = 0;         // Accumulator
    uint8_t m_x = 0;         // X index register
    uint8_t m_y = 0;         // Y index register
    uint8_t m_sp = 0xFD;     // Stack pointer
    uint8_t m_status = 0x24; // Status register

    // Interrupt state
    bool m_nmi_pending = false;
    bool m_irq_line = false;

    bool m_jammed = false;
    uint64_t m_total_cycles = 0;
};

} // namespace famicore
