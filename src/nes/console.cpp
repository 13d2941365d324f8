#include "famicore/console.hpp"
#include "bus.hpp"
#include "cartridge.hpp"
#include "cpu.hpp"
#include "trace.hpp"
#include "mappers/mapper.hpp"

#include <iostream>
#include <utility>

namespace famicore {

Console::Console() = default;

Console::~Console() = default;

bool Console::load_rom(const uint8_t* data, size_t size) {
    CartridgeImage image;
    CartridgeError error = parse_ines(data, size, image);
    if (error != CartridgeError::None) {
        m_last_error = error;
        std::cerr << "Failed to load ROM: " << to_string(error) << std::endl;
        return false;
    }
    return load_cartridge(std::move(image));
}

bool Console::load_cartridge(CartridgeImage image) {
    const int mapper_id = image.mapper_id;
    const size_t prg_size = image.prg_rom.size();
    const size_t chr_size = image.chr_rom.size();

    CartridgeError error = CartridgeError::None;
    std::unique_ptr<Mapper> mapper = create_mapper(std::move(image), error);
    if (!mapper) {
        m_last_error = error;
        std::cerr << "Failed to load cartridge: " << to_string(error)
                  << " (mapper " << mapper_id << ")" << std::endl;
        return false;
    }

    unload();
    m_bus = std::make_unique<Bus>(std::move(mapper));
    m_cpu = std::make_unique<CPU>(*m_bus);
    m_last_error = CartridgeError::None;
    reset();

    std::cout << "Cartridge loaded: mapper " << mapper_id
              << ", PRG " << prg_size / 1024 << "KB"
              << ", CHR " << (chr_size ? chr_size / 1024 : 8) << "KB"
              << (chr_size ? "" : " RAM") << std::endl;
    return true;
}

void Console::unload() {
    m_cpu.reset();
    m_bus.reset();
    m_frame_count = 0;
    m_frame_complete = false;
}

void Console::reset() {
    if (!is_loaded()) return;

    m_bus->reset();
    m_cpu->reset();
    m_frame_count = 0;
    m_frame_complete = false;

    // The PPU keeps running during the 7-cycle reset sequence
    tick_ppu(7);
}

int Console::step() {
    if (!is_loaded()) return 0;

    if (m_trace) {
        m_trace(format_trace(*m_cpu, *m_bus));
    }

    int cycles = m_cpu->step();

    // OAM DMA halts the CPU; one more cycle to align when it starts on an odd cycle
    int dma_cycles = m_bus->get_pending_dma_cycles();
    if (dma_cycles > 0) {
        if (m_cpu->get_total_cycles() & 1) {
            dma_cycles++;
        }
        m_cpu->add_stall_cycles(dma_cycles);
        cycles += dma_cycles;
    }

    tick_ppu(cycles);
    return cycles;
}

bool Console::run_frame(uint64_t cycle_budget) {
    if (!is_loaded()) return false;

    // Run until PPU signals frame completion (at VBlank start)
    m_frame_complete = false;
    uint64_t elapsed = 0;
    while (!m_frame_complete && elapsed < cycle_budget) {
        elapsed += step();
    }
    return m_frame_complete;
}

void Console::tick_ppu(int cpu_cycles) {
    PPU& ppu = m_bus->get_ppu();

    // Step PPU (3 PPU cycles per CPU cycle)
    for (int i = 0; i < cpu_cycles * 3; i++) {
        ppu.tick();
        if (ppu.check_frame_complete()) {
            m_frame_complete = true;
            m_frame_count++;
        }
    }
}

const FrameBuffer& Console::get_framebuffer() const {
    if (!is_loaded()) return m_blank;
    return m_bus->get_ppu().get_framebuffer();
}

CpuRegisters Console::get_registers() const {
    if (!is_loaded()) return CpuRegisters{};
    return m_cpu->get_registers();
}

void Console::set_controller_state(int controller, uint8_t buttons) {
    if (is_loaded()) {
        m_bus->set_controller_state(controller, buttons);
    }
}

uint8_t Console::read_memory(uint16_t address) {
    return is_loaded() ? m_bus->cpu_read(address) : 0;
}

void Console::write_memory(uint16_t address, uint8_t value) {
    if (is_loaded()) {
        m_bus->cpu_write(address, value);
    }
}

uint64_t Console::get_cycle_count() const {
    return is_loaded() ? m_cpu->get_total_cycles() : 0;
}

} // namespace famicore
