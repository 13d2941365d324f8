#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace famicore {

// Mirror modes for nametables
enum class MirrorMode {
    Horizontal,
    Vertical,
    SingleScreen0,
    SingleScreen1,
    FourScreen
};

// Parsed cartridge contents handed to the core by a loader
struct CartridgeImage {
    std::vector<uint8_t> prg_rom;   // Multiple of 16KB
    std::vector<uint8_t> chr_rom;   // Multiple of 8KB, or empty for CHR RAM
    size_t prg_ram_size = 0x2000;
    int mapper_id = 0;
    MirrorMode mirroring = MirrorMode::Horizontal;
    bool has_chr_ram = false;
    bool has_battery = false;
};

// Load-time failures. Nothing past loading reports an error.
enum class CartridgeError {
    None,
    BadSignature,
    Truncated,
    UnsupportedMapper,
    InvalidRomSize
};

const char* to_string(CartridgeError error);

// Read-only snapshot of the CPU registers
struct CpuRegisters {
    uint8_t a = 0;
    uint8_t x = 0;
    uint8_t y = 0;
    uint8_t sp = 0;
    uint16_t pc = 0;
    uint8_t status = 0;
};

// Status register flags
constexpr uint8_t FLAG_C = 0x01;  // Carry
constexpr uint8_t FLAG_Z = 0x02;  // Zero
constexpr uint8_t FLAG_I = 0x04;  // Interrupt disable
constexpr uint8_t FLAG_D = 0x08;  // Decimal (no effect on the 2A03 ALU)
constexpr uint8_t FLAG_B = 0x10;  // Break (only exists on the stack)
constexpr uint8_t FLAG_U = 0x20;  // Unused (always 1)
constexpr uint8_t FLAG_V = 0x40;  // Overflow
constexpr uint8_t FLAG_N = 0x80;  // Negative

// Standard controller bits, in shift-out order
constexpr uint8_t BUTTON_A      = 0x01;
constexpr uint8_t BUTTON_B      = 0x02;
constexpr uint8_t BUTTON_SELECT = 0x04;
constexpr uint8_t BUTTON_START  = 0x08;
constexpr uint8_t BUTTON_UP     = 0x10;
constexpr uint8_t BUTTON_DOWN   = 0x20;
constexpr uint8_t BUTTON_LEFT   = 0x40;
constexpr uint8_t BUTTON_RIGHT  = 0x80;

} // namespace famicore
