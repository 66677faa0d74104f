#ifndef EXT_CHAR_LCD_HPP
#define EXT_CHAR_LCD_HPP

#include <cstdint>
#include <vector>

#include "char_lcd.hpp"

// Extended character LCD controller, such as ST7032 or ST7036.
//
// Owns a CharLcd for the HD44780 part and plugs its own init phase into it,
// which programs the instruction table 1 registers (bias, power/icon/booster,
// contrast, follower).
class ExtCharLcd : private InitSequence {
public:
    ExtCharLcd(LcdBus& bus, LcdDelay& delay, int columns, int lines,
               const std::vector<int>& rowOffsets = std::vector<int>());

    ExtCharLcd(const ExtCharLcd&) = delete;
    ExtCharLcd& operator=(const ExtCharLcd&) = delete;

    CharLcd& lcd() { return lcd_; }
    const CharLcd& lcd() const { return lcd_; }

    int getIconAddress() const { return iconAddress_; }
    void setIconAddress(int address);

    bool getIcon() const;
    void setIcon(bool enable);
    bool getBooster() const;
    void setBooster(bool enable);

    // 0-63
    int getContrast() const { return contrast_; }
    void setContrast(int contrast);

    // -1: follower circuit off, 0-7: on with amplifier ratio N
    int getFollower() const { return follower_; }
    void setFollower(int amp);

    uint8_t biasSet() const { return biasSet_; }
    uint8_t powerSet() const { return powerSet_; }

private:
    LcdBus& bus_;
    LcdDelay& delay_;

    uint8_t biasSet_ = 0;
    uint8_t powerSet_ = 0;
    int contrast_ = 0;
    int follower_ = -1;
    int iconAddress_ = 0;
    uint8_t functionSet_ = 0;
    bool inTable1_ = false;

    // Declared last: its constructor calls back into reset()/initialize()
    CharLcd lcd_;

    void reset() override;
    void initialize(CharLcd& lcd) override;

    void writeTable1(uint8_t cmd);
    void writePowerSet();
};

#endif
