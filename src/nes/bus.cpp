#include "bus.hpp"
#include "debug.hpp"

#include <cstdio>
#include <utility>

namespace famicore {

Bus::Bus(std::unique_ptr<Mapper> mapper)
    : m_mapper(std::move(mapper))
    , m_ppu(*m_mapper) {
    m_ram.fill(0);
}

Bus::~Bus() = default;

void Bus::reset() {
    m_mapper->reset();
    m_ppu.reset();
    for (auto& controller : m_controllers) {
        controller.reset();
    }
    m_open_bus = 0;
    m_pending_dma_cycles = 0;
}

uint8_t Bus::cpu_read(uint16_t address) {
    uint8_t data = m_open_bus;

    if (address < 0x2000) {
        // Internal RAM (mirrored)
        data = m_ram[address & 0x07FF];
    }
    else if (address < 0x4000) {
        // PPU registers (mirrored every 8 bytes)
        data = m_ppu.cpu_read(address & 0x0007);
    }
    else if (address == 0x4016) {
        data = read_controller(0);
    }
    else if (address == 0x4017) {
        data = read_controller(1);
    }
    else if (address >= 0x8000 || (address >= 0x6000 && m_mapper->has_prg_ram())) {
        // Cartridge space
        data = m_mapper->read_prg(address);
    }
    // $4000-$4015 (APU), $4018-$401F (test mode) and $4020-$5FFF
    // (expansion) are not driven: open bus. So is $6000-$7FFF on boards
    // without PRG RAM

    m_open_bus = data;
    return data;
}

void Bus::cpu_write(uint16_t address, uint8_t value) {
    m_open_bus = value;

    if (address < 0x2000) {
        // Internal RAM (mirrored)
        m_ram[address & 0x07FF] = value;
    }
    else if (address < 0x4000) {
        // PPU registers (mirrored every 8 bytes)
        m_ppu.cpu_write(address & 0x0007, value);
    }
    else if (address == 0x4014) {
        // OAM DMA
        oam_dma(value);
    }
    else if (address == 0x4016) {
        // Controller strobe reaches both ports
        m_controllers[0].write_strobe(value);
        m_controllers[1].write_strobe(value);
    }
    else if (address >= 0x6000) {
        // Cartridge space
        m_mapper->write_prg(address, value);
    }
    else if (is_debug_mode() && address >= 0x4020) {
        fprintf(stderr, "[Bus] Write to unmapped $%04X = $%02X ignored\n", address, value);
    }
}

uint8_t Bus::peek(uint16_t address) {
    if (address < 0x2000) {
        return m_ram[address & 0x07FF];
    }
    if (address < 0x4000) {
        return m_ppu.peek_register(address & 0x0007);
    }
    if (address >= 0x8000 || (address >= 0x6000 && m_mapper->has_prg_ram())) {
        return m_mapper->read_prg(address);
    }
    return m_open_bus;
}

void Bus::set_controller_state(int controller, uint8_t buttons) {
    if (controller >= 0 && controller < 2) {
        m_controllers[controller].set_buttons(buttons);
    }
}

uint8_t Bus::read_controller(int controller) {
    // Only D0 is driven; the upper bits keep the previous bus value
    return (m_open_bus & 0xE0) | m_controllers[controller].read();
}

void Bus::oam_dma(uint8_t page) {
    uint16_t addr = static_cast<uint16_t>(page) << 8;
    for (int i = 0; i < 256; i++) {
        m_ppu.oam_dma_write(cpu_read(addr + i));
    }
    m_pending_dma_cycles = OAM_DMA_CYCLES;
}

int Bus::get_pending_dma_cycles() {
    int cycles = m_pending_dma_cycles;
    m_pending_dma_cycles = 0;
    return cycles;
}

} // namespace famicore
