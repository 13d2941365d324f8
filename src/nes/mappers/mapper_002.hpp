#pragma once

#include "mapper.hpp"

namespace famicore {

// Mapper 2: UxROM (UNROM/UOROM)
// - PRG ROM: up to 256KB, switchable 16KB bank at $8000
// - Fixed last bank at $C000
// - CHR RAM: 8KB
class Mapper002 : public Mapper {
public:
    explicit Mapper002(CartridgeImage& image);

    void reset() override;

    uint8_t read_prg(uint16_t address) override;
    void write_prg(uint16_t address, uint8_t value) override;

    uint8_t read_chr(uint16_t address) override;
    void write_chr(uint16_t address, uint8_t value) override;

    uint8_t get_prg_bank() const { return m_prg_bank; }

private:
    uint8_t m_prg_bank = 0;
    uint32_t m_prg_bank_offset = 0;
    uint32_t m_last_bank_offset = 0;
};

} // namespace famicore
