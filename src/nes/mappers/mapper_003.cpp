#include "mapper_003.hpp"
#include "../debug.hpp"

#include <cstdio>

namespace famicore {

Mapper003::Mapper003(CartridgeImage& image)
    : Mapper(image)
{
    m_prg_mask = (m_prg_rom.size() <= 0x4000) ? 0x3FFF : 0x7FFF;
    reset();
}

void Mapper003::reset() {
    m_chr_bank = 0;
    m_chr_bank_offset = 0;
}

uint8_t Mapper003::read_prg(uint16_t address) {
    if (address < 0x8000) {
        return read_prg_ram(address);
    }
    return m_prg_rom[address & m_prg_mask];
}

void Mapper003::write_prg(uint16_t address, uint8_t value) {
    if (address < 0x8000) {
        write_prg_ram(address, value);
        return;
    }

    // Bank select: $8000-$FFFF
    m_chr_bank = value & 0x03;
    m_chr_bank_offset = static_cast<uint32_t>((m_chr_bank * 0x2000) % m_chr.size());
    if (is_debug_mode()) {
        fprintf(stderr, "CNROM: CHR bank = %02X (addr=%04X val=%02X)\n", m_chr_bank, address, value);
    }
}

uint8_t Mapper003::read_chr(uint16_t address) {
    return m_chr[m_chr_bank_offset + (address & 0x1FFF)];
}

void Mapper003::write_chr(uint16_t address, uint8_t value) {
    if (m_has_chr_ram) {
        m_chr[m_chr_bank_offset + (address & 0x1FFF)] = value;
    }
}

} // namespace famicore
