#ifndef LCD_BUS_HPP
#define LCD_BUS_HPP

#include <cstdint>

// Write-only transport to the controller. There is no read path, so the
// controller keeps shadow copies of everything it writes.
class LcdBus {
public:
    virtual ~LcdBus() {}

    // Called once after the interface reset. Returns true if the transport
    // drives all 8 data lines and the function set must select 8-bit mode.
    virtual bool initialize() = 0;

    virtual void sendCommand(uint8_t cmd) = 0;
    virtual void sendData(uint8_t val) = 0;
};

#endif
