#pragma once

#include "controller.hpp"
#include "ppu.hpp"
#include "mappers/mapper.hpp"

#include <cstdint>
#include <array>
#include <memory>

namespace famicore {

// NES CPU memory bus - owns internal RAM, the cartridge mapper, the PPU and
// the controller ports, and routes every CPU access by address range
class Bus {
public:
    // OAM DMA stall on an even CPU cycle; one more on an odd cycle
    static constexpr int OAM_DMA_CYCLES = 513;

    explicit Bus(std::unique_ptr<Mapper> mapper);
    ~Bus();

    // Disable copy
    Bus(const Bus&) = delete;
    Bus& operator=(const Bus&) = delete;

    // Reset PPU, mapper and controllers (RAM keeps its contents)
    void reset();

    // CPU memory access
    uint8_t cpu_read(uint16_t address);
    void cpu_write(uint16_t address, uint8_t value);

    // Read without side effects (tracing, debugging)
    uint8_t peek(uint16_t address);

    // Controller input, bits as BUTTON_*
    void set_controller_state(int controller, uint8_t buttons);

    // DMA
    void oam_dma(uint8_t page);
    int get_pending_dma_cycles();  // Returns and clears pending DMA cycles

    // Interrupt sources
    bool poll_nmi() { return m_ppu.take_nmi(); }
    bool irq_pending() const { return m_mapper->irq_pending(); }

    // Last value driven on the CPU data bus
    uint8_t get_open_bus() const { return m_open_bus; }

    PPU& get_ppu() { return m_ppu; }
    const PPU& get_ppu() const { return m_ppu; }
    Mapper& get_mapper() { return *m_mapper; }

private:
    uint8_t read_controller(int controller);

    // Internal RAM (2KB, mirrored 4 times in $0000-$1FFF)
    std::array<uint8_t, 2048> m_ram;

    // Declared before m_ppu, which holds a reference to it
    std::unique_ptr<Mapper> m_mapper;
    PPU m_ppu;

    std::array<Controller, 2> m_controllers;

    uint8_t m_open_bus = 0;

    // DMA cycles pending (set by oam_dma, consumed by the console)
    int m_pending_dma_cycles = 0;
};

} // namespace famicore
