#include "instructions.hpp"

namespace famicore {

namespace {

using Op = Operation;
using Mode = AddressingMode;

// NMOS 6502 opcode matrix. Undocumented rows follow the behaviour exercised
// by nestest; the twelve JAM opcodes lock the CPU.
const Instruction s_instructions[256] = {
    {0x00, "BRK", Op::BRK, Mode::Implied, 7, false, true},
    {0x01, "ORA", Op::ORA, Mode::IndirectX, 6, false, true},
    {0x02, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x03, "SLO", Op::SLO, Mode::IndirectX, 8, false, false},
    {0x04, "NOP", Op::NOP, Mode::ZeroPage, 3, false, false},
    {0x05, "ORA", Op::ORA, Mode::ZeroPage, 3, false, true},
    {0x06, "ASL", Op::ASL, Mode::ZeroPage, 5, false, true},
    {0x07, "SLO", Op::SLO, Mode::ZeroPage, 5, false, false},
    {0x08, "PHP", Op::PHP, Mode::Implied, 3, false, true},
    {0x09, "ORA", Op::ORA, Mode::Immediate, 2, false, true},
    {0x0A, "ASL", Op::ASL, Mode::Accumulator, 2, false, true},
    {0x0B, "ANC", Op::ANC, Mode::Immediate, 2, false, false},
    {0x0C, "NOP", Op::NOP, Mode::Absolute, 4, false, false},
    {0x0D, "ORA", Op::ORA, Mode::Absolute, 4, false, true},
    {0x0E, "ASL", Op::ASL, Mode::Absolute, 6, false, true},
    {0x0F, "SLO", Op::SLO, Mode::Absolute, 6, false, false},
    {0x10, "BPL", Op::BPL, Mode::Relative, 2, false, true},
    {0x11, "ORA", Op::ORA, Mode::IndirectY, 5, true, true},
    {0x12, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x13, "SLO", Op::SLO, Mode::IndirectY, 8, false, false},
    {0x14, "NOP", Op::NOP, Mode::ZeroPageX, 4, false, false},
    {0x15, "ORA", Op::ORA, Mode::ZeroPageX, 4, false, true},
    {0x16, "ASL", Op::ASL, Mode::ZeroPageX, 6, false, true},
    {0x17, "SLO", Op::SLO, Mode::ZeroPageX, 6, false, false},
    {0x18, "CLC", Op::CLC, Mode::Implied, 2, false, true},
    {0x19, "ORA", Op::ORA, Mode::AbsoluteY, 4, true, true},
    {0x1A, "NOP", Op::NOP, Mode::Implied, 2, false, false},
    {0x1B, "SLO", Op::SLO, Mode::AbsoluteY, 7, false, false},
    {0x1C, "NOP", Op::NOP, Mode::AbsoluteX, 4, true, false},
    {0x1D, "ORA", Op::ORA, Mode::AbsoluteX, 4, true, true},
    {0x1E, "ASL", Op::ASL, Mode::AbsoluteX, 7, false, true},
    {0x1F, "SLO", Op::SLO, Mode::AbsoluteX, 7, false, false},
    {0x20, "JSR", Op::JSR, Mode::Absolute, 6, false, true},
    {0x21, "AND", Op::AND, Mode::IndirectX, 6, false, true},
    {0x22, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x23, "RLA", Op::RLA, Mode::IndirectX, 8, false, false},
    {0x24, "BIT", Op::BIT, Mode::ZeroPage, 3, false, true},
    {0x25, "AND", Op::AND, Mode::ZeroPage, 3, false, true},
    {0x26, "ROL", Op::ROL, Mode::ZeroPage, 5, false, true},
    {0x27, "RLA", Op::RLA, Mode::ZeroPage, 5, false, false},
    {0x28, "PLP", Op::PLP, Mode::Implied, 4, false, true},
    {0x29, "AND", Op::AND, Mode::Immediate, 2, false, true},
    {0x2A, "ROL", Op::ROL, Mode::Accumulator, 2, false, true},
    {0x2B, "ANC", Op::ANC, Mode::Immediate, 2, false, false},
    {0x2C, "BIT", Op::BIT, Mode::Absolute, 4, false, true},
    {0x2D, "AND", Op::AND, Mode::Absolute, 4, false, true},
    {0x2E, "ROL", Op::ROL, Mode::Absolute, 6, false, true},
    {0x2F, "RLA", Op::RLA, Mode::Absolute, 6, false, false},
    {0x30, "BMI", Op::BMI, Mode::Relative, 2, false, true},
    {0x31, "AND", Op::AND, Mode::IndirectY, 5, true, true},
    {0x32, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x33, "RLA", Op::RLA, Mode::IndirectY, 8, false, false},
    {0x34, "NOP", Op::NOP, Mode::ZeroPageX, 4, false, false},
    {0x35, "AND", Op::AND, Mode::ZeroPageX, 4, false, true},
    {0x36, "ROL", Op::ROL, Mode::ZeroPageX, 6, false, true},
    {0x37, "RLA", Op::RLA, Mode::ZeroPageX, 6, false, false},
    {0x38, "SEC", Op::SEC, Mode::Implied, 2, false, true},
    {0x39, "AND", Op::AND, Mode::AbsoluteY, 4, true, true},
    {0x3A, "NOP", Op::NOP, Mode::Implied, 2, false, false},
    {0x3B, "RLA", Op::RLA, Mode::AbsoluteY, 7, false, false},
    {0x3C, "NOP", Op::NOP, Mode::AbsoluteX, 4, true, false},
    {0x3D, "AND", Op::AND, Mode::AbsoluteX, 4, true, true},
    {0x3E, "ROL", Op::ROL, Mode::AbsoluteX, 7, false, true},
    {0x3F, "RLA", Op::RLA, Mode::AbsoluteX, 7, false, false},
    {0x40, "RTI", Op::RTI, Mode::Implied, 6, false, true},
    {0x41, "EOR", Op::EOR, Mode::IndirectX, 6, false, true},
    {0x42, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x43, "SRE", Op::SRE, Mode::IndirectX, 8, false, false},
    {0x44, "NOP", Op::NOP, Mode::ZeroPage, 3, false, false},
    {0x45, "EOR", Op::EOR, Mode::ZeroPage, 3, false, true},
    {0x46, "LSR", Op::LSR, Mode::ZeroPage, 5, false, true},
    {0x47, "SRE", Op::SRE, Mode::ZeroPage, 5, false, false},
    {0x48, "PHA", Op::PHA, Mode::Implied, 3, false, true},
    {0x49, "EOR", Op::EOR, Mode::Immediate, 2, false, true},
    {0x4A, "LSR", Op::LSR, Mode::Accumulator, 2, false, true},
    {0x4B, "ALR", Op::ALR, Mode::Immediate, 2, false, false},
    {0x4C, "JMP", Op::JMP, Mode::Absolute, 3, false, true},
    {0x4D, "EOR", Op::EOR, Mode::Absolute, 4, false, true},
    {0x4E, "LSR", Op::LSR, Mode::Absolute, 6, false, true},
    {0x4F, "SRE", Op::SRE, Mode::Absolute, 6, false, false},
    {0x50, "BVC", Op::BVC, Mode::Relative, 2, false, true},
    {0x51, "EOR", Op::EOR, Mode::IndirectY, 5, true, true},
    {0x52, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x53, "SRE", Op::SRE, Mode::IndirectY, 8, false, false},
    {0x54, "NOP", Op::NOP, Mode::ZeroPageX, 4, false, false},
    {0x55, "EOR", Op::EOR, Mode::ZeroPageX, 4, false, true},
    {0x56, "LSR", Op::LSR, Mode::ZeroPageX, 6, false, true},
    {0x57, "SRE", Op::SRE, Mode::ZeroPageX, 6, false, false},
    {0x58, "CLI", Op::CLI, Mode::Implied, 2, false, true},
    {0x59, "EOR", Op::EOR, Mode::AbsoluteY, 4, true, true},
    {0x5A, "NOP", Op::NOP, Mode::Implied, 2, false, false},
    {0x5B, "SRE", Op::SRE, Mode::AbsoluteY, 7, false, false},
    {0x5C, "NOP", Op::NOP, Mode::AbsoluteX, 4, true, false},
    {0x5D, "EOR", Op::EOR, Mode::AbsoluteX, 4, true, true},
    {0x5E, "LSR", Op::LSR, Mode::AbsoluteX, 7, false, true},
    {0x5F, "SRE", Op::SRE, Mode::AbsoluteX, 7, false, false},
    {0x60, "RTS", Op::RTS, Mode::Implied, 6, false, true},
    {0x61, "ADC", Op::ADC, Mode::IndirectX, 6, false, true},
    {0x62, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x63, "RRA", Op::RRA, Mode::IndirectX, 8, false, false},
    {0x64, "NOP", Op::NOP, Mode::ZeroPage, 3, false, false},
    {0x65, "ADC", Op::ADC, Mode::ZeroPage, 3, false, true},
    {0x66, "ROR", Op::ROR, Mode::ZeroPage, 5, false, true},
    {0x67, "RRA", Op::RRA, Mode::ZeroPage, 5, false, false},
    {0x68, "PLA", Op::PLA, Mode::Implied, 4, false, true},
    {0x69, "ADC", Op::ADC, Mode::Immediate, 2, false, true},
    {0x6A, "ROR", Op::ROR, Mode::Accumulator, 2, false, true},
    {0x6B, "ARR", Op::ARR, Mode::Immediate, 2, false, false},
    {0x6C, "JMP", Op::JMP, Mode::Indirect, 5, false, true},
    {0x6D, "ADC", Op::ADC, Mode::Absolute, 4, false, true},
    {0x6E, "ROR", Op::ROR, Mode::Absolute, 6, false, true},
    {0x6F, "RRA", Op::RRA, Mode::Absolute, 6, false, false},
    {0x70, "BVS", Op::BVS, Mode::Relative, 2, false, true},
    {0x71, "ADC", Op::ADC, Mode::IndirectY, 5, true, true},
    {0x72, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x73, "RRA", Op::RRA, Mode::IndirectY, 8, false, false},
    {0x74, "NOP", Op::NOP, Mode::ZeroPageX, 4, false, false},
    {0x75, "ADC", Op::ADC, Mode::ZeroPageX, 4, false, true},
    {0x76, "ROR", Op::ROR, Mode::ZeroPageX, 6, false, true},
    {0x77, "RRA", Op::RRA, Mode::ZeroPageX, 6, false, false},
    {0x78, "SEI", Op::SEI, Mode::Implied, 2, false, true},
    {0x79, "ADC", Op::ADC, Mode::AbsoluteY, 4, true, true},
    {0x7A, "NOP", Op::NOP, Mode::Implied, 2, false, false},
    {0x7B, "RRA", Op::RRA, Mode::AbsoluteY, 7, false, false},
    {0x7C, "NOP", Op::NOP, Mode::AbsoluteX, 4, true, false},
    {0x7D, "ADC", Op::ADC, Mode::AbsoluteX, 4, true, true},
    {0x7E, "ROR", Op::ROR, Mode::AbsoluteX, 7, false, true},
    {0x7F, "RRA", Op::RRA, Mode::AbsoluteX, 7, false, false},
    {0x80, "NOP", Op::NOP, Mode::Immediate, 2, false, false},
    {0x81, "STA", Op::STA, Mode::IndirectX, 6, false, true},
    {0x82, "NOP", Op::NOP, Mode::Immediate, 2, false, false},
    {0x83, "SAX", Op::SAX, Mode::IndirectX, 6, false, false},
    {0x84, "STY", Op::STY, Mode::ZeroPage, 3, false, true},
    {0x85, "STA", Op::STA, Mode::ZeroPage, 3, false, true},
    {0x86, "STX", Op::STX, Mode::ZeroPage, 3, false, true},
    {0x87, "SAX", Op::SAX, Mode::ZeroPage, 3, false, false},
    {0x88, "DEY", Op::DEY, Mode::Implied, 2, false, true},
    {0x89, "NOP", Op::NOP, Mode::Immediate, 2, false, false},
    {0x8A, "TXA", Op::TXA, Mode::Implied, 2, false, true},
    {0x8B, "XAA", Op::XAA, Mode::Immediate, 2, false, false},
    {0x8C, "STY", Op::STY, Mode::Absolute, 4, false, true},
    {0x8D, "STA", Op::STA, Mode::Absolute, 4, false, true},
    {0x8E, "STX", Op::STX, Mode::Absolute, 4, false, true},
    {0x8F, "SAX", Op::SAX, Mode::Absolute, 4, false, false},
    {0x90, "BCC", Op::BCC, Mode::Relative, 2, false, true},
    {0x91, "STA", Op::STA, Mode::IndirectY, 6, false, true},
    {0x92, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0x93, "SHA", Op::SHA, Mode::IndirectY, 6, false, false},
    {0x94, "STY", Op::STY, Mode::ZeroPageX, 4, false, true},
    {0x95, "STA", Op::STA, Mode::ZeroPageX, 4, false, true},
    {0x96, "STX", Op::STX, Mode::ZeroPageY, 4, false, true},
    {0x97, "SAX", Op::SAX, Mode::ZeroPageY, 4, false, false},
    {0x98, "TYA", Op::TYA, Mode::Implied, 2, false, true},
    {0x99, "STA", Op::STA, Mode::AbsoluteY, 5, false, true},
    {0x9A, "TXS", Op::TXS, Mode::Implied, 2, false, true},
    {0x9B, "TAS", Op::TAS, Mode::AbsoluteY, 5, false, false},
    {0x9C, "SHY", Op::SHY, Mode::AbsoluteX, 5, false, false},
    {0x9D, "STA", Op::STA, Mode::AbsoluteX, 5, false, true},
    {0x9E, "SHX", Op::SHX, Mode::AbsoluteY, 5, false, false},
    {0x9F, "SHA", Op::SHA, Mode::AbsoluteY, 5, false, false},
    {0xA0, "LDY", Op::LDY, Mode::Immediate, 2, false, true},
    {0xA1, "LDA", Op::LDA, Mode::IndirectX, 6, false, true},
    {0xA2, "LDX", Op::LDX, Mode::Immediate, 2, false, true},
    {0xA3, "LAX", Op::LAX, Mode::IndirectX, 6, false, false},
    {0xA4, "LDY", Op::LDY, Mode::ZeroPage, 3, false, true},
    {0xA5, "LDA", Op::LDA, Mode::ZeroPage, 3, false, true},
    {0xA6, "LDX", Op::LDX, Mode::ZeroPage, 3, false, true},
    {0xA7, "LAX", Op::LAX, Mode::ZeroPage, 3, false, false},
    {0xA8, "TAY", Op::TAY, Mode::Implied, 2, false, true},
    {0xA9, "LDA", Op::LDA, Mode::Immediate, 2, false, true},
    {0xAA, "TAX", Op::TAX, Mode::Implied, 2, false, true},
    {0xAB, "LXA", Op::LXA, Mode::Immediate, 2, false, false},
    {0xAC, "LDY", Op::LDY, Mode::Absolute, 4, false, true},
    {0xAD, "LDA", Op::LDA, Mode::Absolute, 4, false, true},
    {0xAE, "LDX", Op::LDX, Mode::Absolute, 4, false, true},
    {0xAF, "LAX", Op::LAX, Mode::Absolute, 4, false, false},
    {0xB0, "BCS", Op::BCS, Mode::Relative, 2, false, true},
    {0xB1, "LDA", Op::LDA, Mode::IndirectY, 5, true, true},
    {0xB2, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0xB3, "LAX", Op::LAX, Mode::IndirectY, 5, true, false},
    {0xB4, "LDY", Op::LDY, Mode::ZeroPageX, 4, false, true},
    {0xB5, "LDA", Op::LDA, Mode::ZeroPageX, 4, false, true},
    {0xB6, "LDX", Op::LDX, Mode::ZeroPageY, 4, false, true},
    {0xB7, "LAX", Op::LAX, Mode::ZeroPageY, 4, false, false},
    {0xB8, "CLV", Op::CLV, Mode::Implied, 2, false, true},
    {0xB9, "LDA", Op::LDA, Mode::AbsoluteY, 4, true, true},
    {0xBA, "TSX", Op::TSX, Mode::Implied, 2, false, true},
    {0xBB, "LAS", Op::LAS, Mode::AbsoluteY, 4, true, false},
    {0xBC, "LDY", Op::LDY, Mode::AbsoluteX, 4, true, true},
    {0xBD, "LDA", Op::LDA, Mode::AbsoluteX, 4, true, true},
    {0xBE, "LDX", Op::LDX, Mode::AbsoluteY, 4, true, true},
    {0xBF, "LAX", Op::LAX, Mode::AbsoluteY, 4, true, false},
    {0xC0, "CPY", Op::CPY, Mode::Immediate, 2, false, true},
    {0xC1, "CMP", Op::CMP, Mode::IndirectX, 6, false, true},
    {0xC2, "NOP", Op::NOP, Mode::Immediate, 2, false, false},
    {0xC3, "DCP", Op::DCP, Mode::IndirectX, 8, false, false},
    {0xC4, "CPY", Op::CPY, Mode::ZeroPage, 3, false, true},
    {0xC5, "CMP", Op::CMP, Mode::ZeroPage, 3, false, true},
    {0xC6, "DEC", Op::DEC, Mode::ZeroPage, 5, false, true},
    {0xC7, "DCP", Op::DCP, Mode::ZeroPage, 5, false, false},
    {0xC8, "INY", Op::INY, Mode::Implied, 2, false, true},
    {0xC9, "CMP", Op::CMP, Mode::Immediate, 2, false, true},
    {0xCA, "DEX", Op::DEX, Mode::Implied, 2, false, true},
    {0xCB, "AXS", Op::AXS, Mode::Immediate, 2, false, false},
    {0xCC, "CPY", Op::CPY, Mode::Absolute, 4, false, true},
    {0xCD, "CMP", Op::CMP, Mode::Absolute, 4, false, true},
    {0xCE, "DEC", Op::DEC, Mode::Absolute, 6, false, true},
    {0xCF, "DCP", Op::DCP, Mode::Absolute, 6, false, false},
    {0xD0, "BNE", Op::BNE, Mode::Relative, 2, false, true},
    {0xD1, "CMP", Op::CMP, Mode::IndirectY, 5, true, true},
    {0xD2, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0xD3, "DCP", Op::DCP, Mode::IndirectY, 8, false, false},
    {0xD4, "NOP", Op::NOP, Mode::ZeroPageX, 4, false, false},
    {0xD5, "CMP", Op::CMP, Mode::ZeroPageX, 4, false, true},
    {0xD6, "DEC", Op::DEC, Mode::ZeroPageX, 6, false, true},
    {0xD7, "DCP", Op::DCP, Mode::ZeroPageX, 6, false, false},
    {0xD8, "CLD", Op::CLD, Mode::Implied, 2, false, true},
    {0xD9, "CMP", Op::CMP, Mode::AbsoluteY, 4, true, true},
    {0xDA, "NOP", Op::NOP, Mode::Implied, 2, false, false},
    {0xDB, "DCP", Op::DCP, Mode::AbsoluteY, 7, false, false},
    {0xDC, "NOP", Op::NOP, Mode::AbsoluteX, 4, true, false},
    {0xDD, "CMP", Op::CMP, Mode::AbsoluteX, 4, true, true},
    {0xDE, "DEC", Op::DEC, Mode::AbsoluteX, 7, false, true},
    {0xDF, "DCP", Op::DCP, Mode::AbsoluteX, 7, false, false},
    {0xE0, "CPX", Op::CPX, Mode::Immediate, 2, false, true},
    {0xE1, "SBC", Op::SBC, Mode::IndirectX, 6, false, true},
    {0xE2, "NOP", Op::NOP, Mode::Immediate, 2, false, false},
    {0xE3, "ISB", Op::ISB, Mode::IndirectX, 8, false, false},
    {0xE4, "CPX", Op::CPX, Mode::ZeroPage, 3, false, true},
    {0xE5, "SBC", Op::SBC, Mode::ZeroPage, 3, false, true},
    {0xE6, "INC", Op::INC, Mode::ZeroPage, 5, false, true},
    {0xE7, "ISB", Op::ISB, Mode::ZeroPage, 5, false, false},
    {0xE8, "INX", Op::INX, Mode::Implied, 2, false, true},
    {0xE9, "SBC", Op::SBC, Mode::Immediate, 2, false, true},
    {0xEA, "NOP", Op::NOP, Mode::Implied, 2, false, true},
    {0xEB, "SBC", Op::SBC, Mode::Immediate, 2, false, false},
    {0xEC, "CPX", Op::CPX, Mode::Absolute, 4, false, true},
    {0xED, "SBC", Op::SBC, Mode::Absolute, 4, false, true},
    {0xEE, "INC", Op::INC, Mode::Absolute, 6, false, true},
    {0xEF, "ISB", Op::ISB, Mode::Absolute, 6, false, false},
    {0xF0, "BEQ", Op::BEQ, Mode::Relative, 2, false, true},
    {0xF1, "SBC", Op::SBC, Mode::IndirectY, 5, true, true},
    {0xF2, "JAM", Op::JAM, Mode::Implied, 2, false, false},
    {0xF3, "ISB", Op::ISB, Mode::IndirectY, 8, false, false},
    {0xF4, "NOP", Op::NOP, Mode::ZeroPageX, 4, false, false},
    {0xF5, "SBC", Op::SBC, Mode::ZeroPageX, 4, false, true},
    {0xF6, "INC", Op::INC, Mode::ZeroPageX, 6, false, true},
    {0xF7, "ISB", Op::ISB, Mode::ZeroPageX, 6, false, false},
    {0xF8, "SED", Op::SED, Mode::Implied, 2, false, true},
    {0xF9, "SBC", Op::SBC, Mode::AbsoluteY, 4, true, true},
    {0xFA, "NOP", Op::NOP, Mode::Implied, 2, false, false},
    {0xFB, "ISB", Op::ISB, Mode::AbsoluteY, 7, false, false},
    {0xFC, "NOP", Op::NOP, Mode::AbsoluteX, 4, true, false},
    {0xFD, "SBC", Op::SBC, Mode::AbsoluteX, 4, true, true},
    {0xFE, "INC", Op::INC, Mode::AbsoluteX, 7, false, true},
    {0xFF, "ISB", Op::ISB, Mode::AbsoluteX, 7, false, false},
};

} // namespace

const Instruction& decode(uint8_t opcode) {
    return s_instructions[opcode];
}

int instruction_length(AddressingMode mode) {
    switch (mode) {
        case AddressingMode::Implied:
        case AddressingMode::Accumulator:
            return 1;
        case AddressingMode::Immediate:
        case AddressingMode::ZeroPage:
        case AddressingMode::ZeroPageX:
        case AddressingMode::ZeroPageY:
        case AddressingMode::IndirectX:
        case AddressingMode::IndirectY:
        case AddressingMode::Relative:
            return 2;
        case AddressingMode::Absolute:
        case AddressingMode::AbsoluteX:
        case AddressingMode::AbsoluteY:
        case AddressingMode::Indirect:
            return 3;
    }
    return 1;
}

} // namespace famicore
