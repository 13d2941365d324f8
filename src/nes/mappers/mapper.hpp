#pragma once

#include "famicore/types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace famicore {

// Base class for cartridge mappers. A mapper owns the cartridge memory and
// its bank registers; the Bus and PPU only see it through this interface.
class Mapper {
public:
    explicit Mapper(CartridgeImage& image);
    virtual ~Mapper() = default;

    // CPU memory access ($6000-$FFFF)
    virtual uint8_t read_prg(uint16_t address) = 0;
    virtual void write_prg(uint16_t address, uint8_t value) = 0;

    // PPU memory access ($0000-$1FFF)
    virtual uint8_t read_chr(uint16_t address) = 0;
    virtual void write_chr(uint16_t address, uint8_t value) = 0;

    // Current nametable arrangement
    virtual MirrorMode get_mirror_mode() const { return m_mirror_mode; }

    // IRQ support (none of the built-in boards raise one)
    virtual bool irq_pending() const { return false; }

    // Reset bank registers to power-on state
    virtual void reset() {}

    int get_id() const { return m_id; }
    bool has_chr_ram() const { return m_has_chr_ram; }
    // Without PRG RAM nothing drives $6000-$7FFF
    bool has_prg_ram() const { return !m_prg_ram.empty(); }

protected:
    // PRG RAM: $6000-$7FFF
    uint8_t read_prg_ram(uint16_t address) const;
    void write_prg_ram(uint16_t address, uint8_t value);

    std::vector<uint8_t> m_prg_rom;
    std::vector<uint8_t> m_chr;
    std::vector<uint8_t> m_prg_ram;
    MirrorMode m_mirror_mode = MirrorMode::Horizontal;
    bool m_has_chr_ram = false;
    int m_id = 0;
};

// Create the mapper for image.mapper_id, taking ownership of the image
// memory. Returns nullptr and sets error if the board is unsupported or the
// ROM sizes do not fit it.
std::unique_ptr<Mapper> create_mapper(CartridgeImage image, CartridgeError& error);

} // namespace famicore
