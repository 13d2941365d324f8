#pragma once

#include "mapper.hpp"

namespace famicore {

// Mapper 0: NROM
// - PRG ROM: 16KB or 32KB (mirrored if 16KB)
// - CHR ROM: 8KB, or 8KB CHR RAM
// - No banking, simplest mapper
class Mapper000 : public Mapper {
public:
    explicit Mapper000(CartridgeImage& image);

    uint8_t read_prg(uint16_t address) override;
    void write_prg(uint16_t address, uint8_t value) override;

    uint8_t read_chr(uint16_t address) override;
    void write_chr(uint16_t address, uint8_t value) override;

private:
    uint16_t m_prg_mask;  // 0x3FFF for 16KB, 0x7FFF for 32KB
};

} // namespace famicore
