#pragma once

#include "mapper.hpp"

namespace famicore {

// Mapper 7: AxROM
// - PRG ROM: up to 256KB, switchable 32KB bank
// - CHR RAM: 8KB
// - Single-screen mirroring, nametable selected by bit 4 of the bank write
class Mapper007 : public Mapper {
public:
    explicit Mapper007(CartridgeImage& image);

    void reset() override;

    uint8_t read_prg(uint16_t address) override;
    void write_prg(uint16_t address, uint8_t value) override;

    uint8_t read_chr(uint16_t address) override;
    void write_chr(uint16_t address, uint8_t value) override;

    uint8_t get_prg_bank() const { return m_prg_bank; }

private:
    uint8_t m_prg_bank = 0;
    uint32_t m_prg_bank_offset = 0;
};

} // namespace famicore
