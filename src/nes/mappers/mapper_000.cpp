#include "mapper_000.hpp"
#include "../debug.hpp"

#include <cstdio>

namespace famicore {

Mapper000::Mapper000(CartridgeImage& image)
    : Mapper(image)
{
    m_prg_mask = (m_prg_rom.size() <= 0x4000) ? 0x3FFF : 0x7FFF;
}

uint8_t Mapper000::read_prg(uint16_t address) {
    if (address < 0x8000) {
        return read_prg_ram(address);
    }
    return m_prg_rom[address & m_prg_mask];
}

void Mapper000::write_prg(uint16_t address, uint8_t value) {
    if (address < 0x8000) {
        write_prg_ram(address, value);
        return;
    }
    // PRG ROM writes are ignored on NROM
    if (is_debug_mode()) {
        fprintf(stderr, "NROM: ignored ROM write %04X=%02X\n", address, value);
    }
}

uint8_t Mapper000::read_chr(uint16_t address) {
    return m_chr[address & 0x1FFF];
}

void Mapper000::write_chr(uint16_t address, uint8_t value) {
    if (m_has_chr_ram) {
        m_chr[address & 0x1FFF] = value;
    }
}

} // namespace famicore
