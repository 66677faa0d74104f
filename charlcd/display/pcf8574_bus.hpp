#ifndef PCF8574_BUS_HPP
#define PCF8574_BUS_HPP

#include "lcd_bus.hpp"

// HD44780 behind a PCF8574 I2C backpack, driven in 4-bit mode.
//   P0 RS, P1 RW (held low), P2 EN, P3 backlight, P4-P7 D4-D7
class Pcf8574Bus : public LcdBus {
public:
    explicit Pcf8574Bus(int addr = 0x27);

    bool initialize() override;
    void sendCommand(uint8_t cmd) override;
    void sendData(uint8_t val) override;

    void backlight(bool on);

    // false once the device could not be opened or a write failed
    bool ok() const { return ok_; }

private:
    int fd;
    int addr_;
    int backlight_;
    bool fourBit_ = false;
    bool ok_ = true;

    void iowrite(int bits);
    void toggleEnable(int bits);
    void writeNibble(int nibble, int mode);
    void lcdByte(int bits, int mode);
};

#endif
