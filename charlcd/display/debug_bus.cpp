#include "debug_bus.hpp"

#include <iomanip>

DebugBus::DebugBus(std::ostream& out, bool eightBit)
    : out_(out), eightBit_(eightBit)
{
}

bool DebugBus::initialize() {
    return eightBit_;
}

void DebugBus::sendCommand(uint8_t cmd) {
    print("command", cmd);
}

void DebugBus::sendData(uint8_t val) {
    print("data", val);
}

void DebugBus::print(const char* kind, uint8_t val) {
    std::ios::fmtflags flags = out_.flags();
    char fill = out_.fill();
    out_ << kind << " 0x" << std::hex << std::setw(2) << std::setfill('0')
         << static_cast<int>(val) << std::endl;
    out_.flags(flags);
    out_.fill(fill);
}
