#include "controller.hpp"

namespace famicore {

void Controller::set_buttons(uint8_t buttons) {
    m_buttons = buttons;
    if (m_strobe) {
        m_shift = m_buttons;
    }
}

void Controller::write_strobe(uint8_t value) {
    m_strobe = (value & 1) != 0;
    if (m_strobe) {
        m_shift = m_buttons;
    }
}

uint8_t Controller::read() {
    // While strobe is high the register keeps reloading, so A is returned
    if (m_strobe) {
        return m_buttons & 0x01;
    }

    uint8_t data = m_shift & 0x01;
    m_shift >>= 1;
    m_shift |= 0x80;  // Official pads shift in 1s after the 8th bit
    return data;
}

void Controller::reset() {
    m_shift = 0;
    m_strobe = false;
}

} // namespace famicore
