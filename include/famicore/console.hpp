#pragma once

#include "famicore/frame_buffer.hpp"
#include "famicore/types.hpp"

#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace famicore {

class Bus;
class CPU;

// Emulation driver: one CPU instruction, then three PPU dots per CPU cycle
class Console {
public:
    // Frame is ~29781 CPU cycles; leave room for a stalled frame
    static constexpr uint64_t DEFAULT_FRAME_BUDGET = 4 * 29781;

    using TraceCallback = std::function<void(const std::string&)>;

    Console();
    ~Console();

    // Disable copy
    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    // Cartridge management. Builds a fresh Bus/CPU/PPU around the mapper.
    bool load_rom(const uint8_t* data, size_t size);
    bool load_cartridge(CartridgeImage image);
    void unload();
    bool is_loaded() const { return m_bus != nullptr; }
    CartridgeError get_last_error() const { return m_last_error; }

    // Power-on/reset state, PC from the reset vector
    void reset();

    // Execute one instruction, return CPU cycles consumed (DMA stall included)
    int step();

    // Run until the PPU publishes a frame or cycle_budget CPU cycles elapse.
    // Returns true if a frame completed.
    bool run_frame(uint64_t cycle_budget = DEFAULT_FRAME_BUDGET);

    // Last completed frame
    const FrameBuffer& get_framebuffer() const;

    // Register access (for conformance tests and debugging)
    CpuRegisters get_registers() const;

    // Controller input, bits as BUTTON_*
    void set_controller_state(int controller, uint8_t buttons);

    // CPU bus access
    uint8_t read_memory(uint16_t address);
    void write_memory(uint16_t address, uint8_t value);

    uint64_t get_cycle_count() const;
    uint64_t get_frame_count() const { return m_frame_count; }

    // Called with a trace line before every instruction; empty to disable
    void set_trace_callback(TraceCallback callback) { m_trace = std::move(callback); }

    // Components, nullptr while no cartridge is loaded
    Bus* get_bus() { return m_bus.get(); }
    CPU* get_cpu() { return m_cpu.get(); }

private:
    void tick_ppu(int cpu_cycles);

    std::unique_ptr<Bus> m_bus;
    std::unique_ptr<CPU> m_cpu;

    CartridgeError m_last_error = CartridgeError::None;
    uint64_t m_frame_count = 0;
    bool m_frame_complete = false;
    TraceCallback m_trace;

    FrameBuffer m_blank;
};

} // namespace famicore
