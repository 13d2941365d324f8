#pragma once

#include "famicore/types.hpp"

#include <cstdint>

namespace famicore {

// Standard pad buttons, in shift-register order
enum class PadButton : uint32_t {
    A = 0,
    B,
    Select,
    Start,
    Up,
    Down,
    Left,
    Right,
    COUNT
};

// Physical input source types
enum class InputSourceType {
    Keyboard,
    GamepadButton,
    GamepadAxis,
};

// Represents a physical input binding
struct InputBinding {
    InputSourceType type = InputSourceType::Keyboard;
    int device_id = -1;          // Gamepad instance id or -1 for any
    int code = 0;                // SDL scancode or gamepad button/axis
    float axis_threshold = 0.5f; // For axis bindings, the threshold to trigger
    bool axis_positive = true;   // For axis bindings, which direction

    bool operator==(const InputBinding& other) const {
        return type == other.type &&
               device_id == other.device_id &&
               code == other.code;
    }
};

// Convert PadButton to its BUTTON_* bit
inline uint8_t button_to_mask(PadButton button) {
    return static_cast<uint8_t>(1u << static_cast<uint32_t>(button));
}

static_assert(BUTTON_RIGHT == 0x80, "pad bits follow the shift-register order");

} // namespace famicore
