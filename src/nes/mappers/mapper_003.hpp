#pragma once

#include "mapper.hpp"

namespace famicore {

// Mapper 3: CNROM
// - PRG ROM: 16KB or 32KB, fixed
// - CHR ROM: up to 32KB, switchable 8KB bank
class Mapper003 : public Mapper {
public:
    explicit Mapper003(CartridgeImage& image);

    void reset() override;

    uint8_t read_prg(uint16_t address) override;
    void write_prg(uint16_t address, uint8_t value) override;

    uint8_t read_chr(uint16_t address) override;
    void write_chr(uint16_t address, uint8_t value) override;

    uint8_t get_chr_bank() const { return m_chr_bank; }

private:
    uint16_t m_prg_mask;
    uint8_t m_chr_bank = 0;
    uint32_t m_chr_bank_offset = 0;
};

} // namespace famicore
