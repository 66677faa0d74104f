#ifndef DEBUG_BUS_HPP
#define DEBUG_BUS_HPP

#include <iostream>

#include "lcd_bus.hpp"

// Prints every byte instead of driving hardware:
//   command 0x38
//   data 0x41
class DebugBus : public LcdBus {
public:
    explicit DebugBus(std::ostream& out = std::cout, bool eightBit = true);

    bool initialize() override;
    void sendCommand(uint8_t cmd) override;
    void sendData(uint8_t val) override;

private:
    std::ostream& out_;
    bool eightBit_;

    void print(const char* kind, uint8_t val);
};

#endif
