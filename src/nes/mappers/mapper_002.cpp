#include "mapper_002.hpp"

namespace famicore {

Mapper002::Mapper002(CartridgeImage& image)
    : Mapper(image)
{
    reset();
}

void Mapper002::reset() {
    m_prg_bank = 0;
    m_prg_bank_offset = 0;
    m_last_bank_offset = static_cast<uint32_t>(m_prg_rom.size() - 0x4000);
}

uint8_t Mapper002::read_prg(uint16_t address) {
    if (address < 0x8000) {
        return read_prg_ram(address);
    }

    // $8000-$BFFF switchable, $C000-$FFFF fixed to the last bank
    uint32_t base = (address < 0xC000) ? m_prg_bank_offset : m_last_bank_offset;
    return m_prg_rom[base + (address & 0x3FFF)];
}

void Mapper002::write_prg(uint16_t address, uint8_t value) {
    if (address < 0x8000) {
        write_prg_ram(address, value);
        return;
    }

    // Bank select: $8000-$FFFF
    m_prg_bank = value & 0x0F;
    m_prg_bank_offset = static_cast<uint32_t>((m_prg_bank * 0x4000) % m_prg_rom.size());
}

uint8_t Mapper002::read_chr(uint16_t address) {
    return m_chr[address & 0x1FFF];
}

void Mapper002::write_chr(uint16_t address, uint8_t value) {
    if (m_has_chr_ram) {
        m_chr[address & 0x1FFF] = value;
    }
}

} // namespace famicore
