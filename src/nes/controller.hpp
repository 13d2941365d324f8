#pragma once

#include <cstdint>

namespace famicore {

// Standard controller: 8-bit parallel-in/serial-out shift register
class Controller {
public:
    // Buttons currently held, bits as BUTTON_*
    void set_buttons(uint8_t buttons);
    uint8_t get_buttons() const { return m_buttons; }

    // $4016 write, bit 0 is the strobe line
    void write_strobe(uint8_t value);

    // Next serial bit in D0
    uint8_t read();

    void reset();

private:
    uint8_t m_buttons = 0;
    uint8_t m_shift = 0;
    bool m_strobe = false;
};

} // namespace famicore
