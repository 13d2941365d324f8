#pragma once

#include <string>

namespace famicore {

class Bus;
class CPU;

// One nestest-log style line for the instruction at PC, e.g.
// "C000  4C F5 C5  JMP $C5F5                       A:00 X:00 Y:00 P:24 SP:FD PPU:  0, 21 CYC:7"
// Uses only side-effect-free bus peeks.
std::string format_trace(const CPU& cpu, Bus& bus);

} // namespace famicore
