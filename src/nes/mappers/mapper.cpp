#include "mapper.hpp"
#include "mapper_000.hpp"
#include "mapper_002.hpp"
#include "mapper_003.hpp"
#include "mapper_007.hpp"
#include "../debug.hpp"

#include <cstdio>
#include <utility>

namespace famicore {

Mapper::Mapper(CartridgeImage& image)
    : m_prg_rom(std::move(image.prg_rom)),
      m_chr(std::move(image.chr_rom)),
      m_prg_ram(image.prg_ram_size, 0),
      m_mirror_mode(image.mirroring),
      m_has_chr_ram(image.has_chr_ram || m_chr.empty()),
      m_id(image.mapper_id)
{
    // Boards without CHR ROM carry 8KB of CHR RAM
    if (m_chr.empty()) {
        m_chr.assign(0x2000, 0);
    }
}

uint8_t Mapper::read_prg_ram(uint16_t address) const {
    if (m_prg_ram.empty()) {
        return 0;
    }
    return m_prg_ram[(address - 0x6000) % m_prg_ram.size()];
}

void Mapper::write_prg_ram(uint16_t address, uint8_t value) {
    if (!m_prg_ram.empty()) {
        m_prg_ram[(address - 0x6000) % m_prg_ram.size()] = value;
    }
}

namespace {

bool is_bank_multiple(size_t size, size_t bank) {
    return size != 0 && (size % bank) == 0;
}

bool sizes_fit(const CartridgeImage& image) {
    const size_t prg = image.prg_rom.size();
    const size_t chr = image.chr_rom.size();

    if (!is_bank_multiple(prg, 0x4000)) {
        return false;
    }
    if (!image.chr_rom.empty() && !is_bank_multiple(chr, 0x2000)) {
        return false;
    }

    switch (image.mapper_id) {
        case 0:
            return prg <= 0x8000 && chr <= 0x2000;
        case 2:
            return chr <= 0x2000;
        case 3:
            return prg <= 0x8000;
        case 7:
            return is_bank_multiple(prg, 0x8000) && chr <= 0x2000;
        default:
            return true;
    }
}

} // namespace

std::unique_ptr<Mapper> create_mapper(CartridgeImage image, CartridgeError& error) {
    const int id = image.mapper_id;
    switch (id) {
        case 0:
        case 2:
        case 3:
        case 7:
            break;
        default:
            error = CartridgeError::UnsupportedMapper;
            if (is_debug_mode()) {
                fprintf(stderr, "Unsupported mapper: %d\n", id);
            }
            return nullptr;
    }

    if (!sizes_fit(image)) {
        error = CartridgeError::InvalidRomSize;
        if (is_debug_mode()) {
            fprintf(stderr, "Mapper %d: PRG %zu / CHR %zu bytes do not fit the board\n",
                    id, image.prg_rom.size(), image.chr_rom.size());
        }
        return nullptr;
    }

    error = CartridgeError::None;
    switch (id) {
        case 0:
            return std::make_unique<Mapper000>(image);
        case 2:
            return std::make_unique<Mapper002>(image);
        case 3:
            return std::make_unique<Mapper003>(image);
        default:
            return std::make_unique<Mapper007>(image);
    }
}

} // namespace famicore
