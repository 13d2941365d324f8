#include "cartridge.hpp"

#include <cstring>

namespace famicore {

const char* to_string(CartridgeError error) {
    switch (error) {
        case CartridgeError::None: return "no error";
        case CartridgeError::BadSignature: return "not an iNES image";
        case CartridgeError::Truncated: return "image shorter than its header declares";
        case CartridgeError::UnsupportedMapper: return "unsupported mapper";
        case CartridgeError::InvalidRomSize: return "ROM size does not fit the mapper";
    }
    return "unknown error";
}

CartridgeError parse_ines(const uint8_t* data, size_t size, CartridgeImage& image) {
    if (data == nullptr || size < sizeof(iNESHeader)) {
        return CartridgeError::Truncated;
    }

    iNESHeader header;
    std::memcpy(&header, data, sizeof(header));

    if (std::memcmp(header.signature, "NES\x1A", 4) != 0) {
        return CartridgeError::BadSignature;
    }

    const bool nes2 = (header.flags7 & 0x0C) == 0x08;

    size_t prg_units = header.prg_rom_size;
    size_t chr_units = header.chr_rom_size;
    int mapper = (header.flags6 >> 4) | (header.flags7 & 0xF0);
    if (nes2) {
        // Size MSBs and mapper bits 8-11 (exponent notation not supported)
        prg_units |= static_cast<size_t>(header.flags9 & 0x0F) << 8;
        chr_units |= static_cast<size_t>(header.flags9 & 0xF0) << 4;
        mapper |= (header.flags8 & 0x0F) << 8;
    } else if (header.padding[1] != 0 || header.padding[2] != 0 ||
               header.padding[3] != 0 || header.padding[4] != 0) {
        // Dirty header ("DiskDude!" etc.), upper mapper nibble is garbage
        mapper &= 0x0F;
    }

    const size_t prg_size = prg_units * 0x4000;
    const size_t chr_size = chr_units * 0x2000;
    const bool has_trainer = (header.flags6 & 0x04) != 0;

    size_t offset = sizeof(header) + (has_trainer ? 512 : 0);
    if (prg_size == 0 || size < offset + prg_size + chr_size) {
        return CartridgeError::Truncated;
    }

    image.prg_rom.assign(data + offset, data + offset + prg_size);
    offset += prg_size;
    image.chr_rom.assign(data + offset, data + offset + chr_size);

    image.mapper_id = mapper;
    image.has_chr_ram = (chr_size == 0);
    image.has_battery = (header.flags6 & 0x02) != 0;
    image.prg_ram_size = 0x2000;

    if (header.flags6 & 0x08) {
        image.mirroring = MirrorMode::FourScreen;
    } else if (header.flags6 & 0x01) {
        image.mirroring = MirrorMode::Vertical;
    } else {
        image.mirroring = MirrorMode::Horizontal;
    }

    return CartridgeError::None;
}

} // namespace famicore
