#pragma once

#include "famicore/types.hpp"

#include <cstdint>
#include <cstddef>

namespace famicore {

// iNES header format
struct iNESHeader {
    uint8_t signature[4];    // "NES\x1A"
    uint8_t prg_rom_size;    // PRG ROM size in 16KB units
    uint8_t chr_rom_size;    // CHR ROM size in 8KB units
    uint8_t flags6;          // Mapper, mirroring, battery, trainer
    uint8_t flags7;          // Mapper, VS/Playchoice, NES 2.0
    uint8_t flags8;          // PRG RAM size (rarely used extension)
    uint8_t flags9;          // TV system (rarely used extension)
    uint8_t flags10;         // TV system, PRG RAM presence (unofficial)
    uint8_t padding[5];      // Unused padding
};

static_assert(sizeof(iNESHeader) == 16, "iNES header must be 16 bytes");

// Parse an iNES / NES 2.0 file image into a CartridgeImage
CartridgeError parse_ines(const uint8_t* data, size_t size, CartridgeImage& image);

} // namespace famicore
