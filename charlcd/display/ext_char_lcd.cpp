#include "ext_char_lcd.hpp"
#include "instructions.hpp"

using namespace st7032;

ExtCharLcd::ExtCharLcd(LcdBus& bus, LcdDelay& delay, int columns, int lines,
                       const std::vector<int>& rowOffsets)
    : bus_(bus),
      delay_(delay),
      lcd_(bus, delay, columns, lines, rowOffsets, *this)
{
}

void ExtCharLcd::reset() {
    biasSet_ = BIAS_SET;
    powerSet_ = 0;
    contrast_ = 0;
    follower_ = -1;
    iconAddress_ = 0;
    functionSet_ = 0;
    inTable1_ = false;
}

void ExtCharLcd::initialize(CharLcd& lcd) {
    functionSet_ = lcd.functionSet();
    biasSet_ = BIAS_SET | BIAS_1_5;
    if (lcd.geometry().lines == 3) {
        biasSet_ |= BIAS_3LINE;
    }
    powerSet_ = BOOSTER_ON;
    iconAddress_ = 0;

    bus_.sendCommand(FUNCTION_TABLE1 | functionSet_);
    inTable1_ = true;
    bus_.sendCommand(biasSet_);
    setContrast(DEFAULT_CONTRAST);
    setFollower(DEFAULT_FOLLOWER);
    // Wait for the booster and follower supply to settle
    delay_.sleepMs(200);
    bus_.sendCommand(FUNCTION_TABLE0 | functionSet_);
    inTable1_ = false;
}

// Table 1 instructions decode as something else in table 0
void ExtCharLcd::writeTable1(uint8_t cmd) {
    if (inTable1_) {
        bus_.sendCommand(cmd);
        return;
    }
    bus_.sendCommand(FUNCTION_TABLE1 | functionSet_);
    bus_.sendCommand(cmd);
    bus_.sendCommand(FUNCTION_TABLE0 | functionSet_);
}

void ExtCharLcd::writePowerSet() {
    writeTable1(POWER_SET | powerSet_ | (contrast_ >> 4));
}

void ExtCharLcd::setIconAddress(int address) {
    address &= 0b1111;
    iconAddress_ = address;
    writeTable1(ICON_ADDRESS | address);
}

bool ExtCharLcd::getIcon() const {
    return powerSet_ & ICON_ON;
}

void ExtCharLcd::setIcon(bool enable) {
    if (enable)
        powerSet_ |= ICON_ON;
    else
        powerSet_ &= ~ICON_ON;
    writePowerSet();
}

bool ExtCharLcd::getBooster() const {
    return powerSet_ & BOOSTER_ON;
}

void ExtCharLcd::setBooster(bool enable) {
    if (enable)
        powerSet_ |= BOOSTER_ON;
    else
        powerSet_ &= ~BOOSTER_ON;
    writePowerSet();
}

void ExtCharLcd::setContrast(int contrast) {
    if (contrast < 0)
        contrast = 0;
    else if (contrast > CONTRAST_MAX)
        contrast = CONTRAST_MAX;
    contrast_ = contrast;

    if (inTable1_) {
        bus_.sendCommand(CONTRAST_LO | (contrast_ & 0b1111));
        bus_.sendCommand(POWER_SET | powerSet_ | (contrast_ >> 4));
        return;
    }
    bus_.sendCommand(FUNCTION_TABLE1 | functionSet_);
    bus_.sendCommand(CONTRAST_LO | (contrast_ & 0b1111));
    bus_.sendCommand(POWER_SET | powerSet_ | (contrast_ >> 4));
    bus_.sendCommand(FUNCTION_TABLE0 | functionSet_);
}

void ExtCharLcd::setFollower(int amp) {
    if (amp < 0) {
        follower_ = -1;
        writeTable1(FOLLOWER_OFF);
        return;
    }
    if (amp > FOLLOWER_MAX) {
        amp = FOLLOWER_MAX;
    }
    follower_ = amp;
    writeTable1(FOLLOWER_ON | follower_);
}
