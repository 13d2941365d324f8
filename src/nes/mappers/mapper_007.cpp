#include "mapper_007.hpp"

namespace famicore {

Mapper007::Mapper007(CartridgeImage& image)
    : Mapper(image)
{
    reset();
}

void Mapper007::reset() {
    // Power up with the last bank so the reset vector points at real code
    size_t num_banks = m_prg_rom.size() / 0x8000;
    m_prg_bank = (num_banks > 0) ? static_cast<uint8_t>(num_banks - 1) : 0;
    m_prg_bank_offset = m_prg_bank * 0x8000u;
    m_mirror_mode = MirrorMode::SingleScreen0;
}

uint8_t Mapper007::read_prg(uint16_t address) {
    if (address < 0x8000) {
        return read_prg_ram(address);
    }
    return m_prg_rom[m_prg_bank_offset + (address & 0x7FFF)];
}

void Mapper007::write_prg(uint16_t address, uint8_t value) {
    if (address < 0x8000) {
        write_prg_ram(address, value);
        return;
    }

    // Bits 0-3: 32KB PRG bank, bit 4: nametable select
    m_prg_bank = value & 0x0F;
    m_prg_bank_offset = static_cast<uint32_t>((m_prg_bank * 0x8000u) % m_prg_rom.size());
    m_mirror_mode = (value & 0x10) ? MirrorMode::SingleScreen1 : MirrorMode::SingleScreen0;
}

uint8_t Mapper007::read_chr(uint16_t address) {
    return m_chr[address & 0x1FFF];
}

void Mapper007::write_chr(uint16_t address, uint8_t value) {
    if (m_has_chr_ram) {
        m_chr[address & 0x1FFF] = value;
    }
}

} // namespace famicore
