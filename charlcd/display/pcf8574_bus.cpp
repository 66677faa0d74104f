#include "pcf8574_bus.hpp"
#include <wiringPiI2C.h>
#include <unistd.h>
#include <iostream>

#define LCD_CHR  1
#define LCD_CMD  0

#define ENABLE    0b00000100
#define BACKLIGHT 0b00001000


Pcf8574Bus::Pcf8574Bus(int addr)
    : addr_(addr), backlight_(BACKLIGHT)
{
    fd = wiringPiI2CSetup(addr_);
    if (fd == -1) {
        std::cerr << "PCF8574 setup failed at 0x" << std::hex << addr_ << std::dec << std::endl;
        ok_ = false;
    }
}

void Pcf8574Bus::iowrite(int bits) {
    if (!ok_) return;
    if (wiringPiI2CWrite(fd, bits) < 0) {
        std::cerr << "PCF8574 write failed at 0x" << std::hex << addr_ << std::dec << std::endl;
        ok_ = false;
    }
}

void Pcf8574Bus::toggleEnable(int bits) {
    usleep(500);
    iowrite(bits | ENABLE);
    usleep(500);
    iowrite(bits & ~ENABLE);
    usleep(500);
}

void Pcf8574Bus::writeNibble(int nibble, int mode) {
    int bits = mode | ((nibble << 4) & 0xF0) | backlight_;
    iowrite(bits);
    toggleEnable(bits);
}

void Pcf8574Bus::lcdByte(int bits, int mode) {
    writeNibble(bits >> 4, mode);
    writeNibble(bits & 0x0F, mode);
}

// The controller has already sent two 8-bit function sets (one strobe each).
// Finish the reset with a third and switch the interface to 4 bits.
bool Pcf8574Bus::initialize() {
    writeNibble(0x03, LCD_CMD);
    usleep(150);
    writeNibble(0x02, LCD_CMD);
    fourBit_ = true;
    return false;
}

void Pcf8574Bus::sendCommand(uint8_t cmd) {
    // In 8-bit mode D0-D3 are not wired, one strobe is one instruction
    if (!fourBit_) {
        writeNibble(cmd >> 4, LCD_CMD);
        return;
    }
    lcdByte(cmd, LCD_CMD);
}

void Pcf8574Bus::sendData(uint8_t val) {
    lcdByte(val, LCD_CHR);
}

void Pcf8574Bus::backlight(bool on) {
    backlight_ = on ? BACKLIGHT : 0;
    iowrite(backlight_);
}
