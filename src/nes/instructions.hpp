#pragma once

#include <cstdint>

namespace famicore {

// Operand addressing modes
enum class AddressingMode : uint8_t {
    Implied,
    Accumulator,
    Immediate,
    ZeroPage,
    ZeroPageX,
    ZeroPageY,
    Absolute,
    AbsoluteX,
    AbsoluteY,
    Indirect,
    IndirectX,   // ($nn,X)
    IndirectY,   // ($nn),Y
    Relative
};

// Operation kinds, dispatched by CPU::execute()
enum class Operation : uint8_t {
    ADC, AND, ASL, BCC, BCS, BEQ, BIT, BMI, BNE, BPL, BRK, BVC, BVS,
    CLC, CLD, CLI, CLV, CMP, CPX, CPY, DEC, DEX, DEY, EOR, INC, INX, INY,
    JMP, JSR, LDA, LDX, LDY, LSR, NOP, ORA, PHA, PHP, PLA, PLP, ROL, ROR,
    RTI, RTS, SBC, SEC, SED, SEI, STA, STX, STY, TAX, TAY, TSX, TXA, TXS, TYA,

    // Undocumented
    SLO, RLA, SRE, RRA, SAX, LAX, DCP, ISB,
    ANC, ALR, ARR, XAA, LXA, AXS, LAS, TAS, SHA, SHX, SHY,
    JAM
};

// One row of the opcode table
struct Instruction {
    uint8_t opcode;
    const char* mnemonic;
    Operation operation;
    AddressingMode mode;
    uint8_t cycles;       // Base cycle count
    bool page_penalty;    // +1 cycle when indexing crosses a page
    bool official;
};

// Every opcode decodes to a row
const Instruction& decode(uint8_t opcode);

// Instruction size in bytes, opcode included
int instruction_length(AddressingMode mode);

} // namespace famicore
