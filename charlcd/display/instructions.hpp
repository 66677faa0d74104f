#ifndef INSTRUCTIONS_HPP
#define INSTRUCTIONS_HPP

#include <cstdint>

// HD44780 compatible instruction set
namespace hd44780 {

constexpr uint8_t CLEAR_DISPLAY   = 0b00000001;
constexpr uint8_t RETURN_HOME     = 0b00000010;

// Entry mode set
constexpr uint8_t ENTRY_LEFT      = 0b00000110;
constexpr uint8_t ENTRY_RIGHT     = 0b00000100;

// Display on/off control
constexpr uint8_t DISPLAY_CONTROL = 0b00001000;
constexpr uint8_t DISPLAY_ENABLE  = 0b00000100;
constexpr uint8_t CURSOR_SHOW     = 0b00000010;
constexpr uint8_t CURSOR_BLINK    = 0b00000001;

// Cursor or display shift
constexpr uint8_t CURSOR_LEFT     = 0b00010000;
constexpr uint8_t CURSOR_RIGHT    = 0b00010100;
constexpr uint8_t DISPLAY_LEFT    = 0b00011000;
constexpr uint8_t DISPLAY_RIGHT   = 0b00011100;

// Function set
constexpr uint8_t FUNCTION_8BIT   = 0b00110000;
constexpr uint8_t FUNCTION_4BIT   = 0b00100000;
constexpr uint8_t FUNCTION_1LINE  = 0b00100000;
constexpr uint8_t FUNCTION_2LINE  = 0b00101000;
constexpr uint8_t FUNCTION_5X8    = 0b00100000;
constexpr uint8_t FUNCTION_5X10   = 0b00100100;

constexpr uint8_t CGRAM_ADDRESS   = 0b01000000;
constexpr uint8_t DDRAM_ADDRESS   = 0b10000000;

} // namespace hd44780

// ST7032 / ST7036 extension (instruction table 1)
namespace st7032 {

// Instruction table select, OR-ed into function set
constexpr uint8_t FUNCTION_TABLE0 = 0b00100000;
constexpr uint8_t FUNCTION_TABLE1 = 0b00100001;

// Bias set
constexpr uint8_t BIAS_SET        = 0b00010100;
constexpr uint8_t BIAS_1_4        = 0b00001000;
constexpr uint8_t BIAS_1_5        = 0b00000000;
constexpr uint8_t BIAS_3LINE      = 0b00000001;

constexpr uint8_t ICON_ADDRESS    = 0b01000000;

// Power/ICON control/Contrast set (low 2 bits: contrast C5 C4)
constexpr uint8_t POWER_SET       = 0b01010000;
constexpr uint8_t ICON_ON         = 0b00001000;
constexpr uint8_t BOOSTER_ON      = 0b00000100;

// Follower control (low 3 bits: amplifier ratio)
constexpr uint8_t FOLLOWER_ON     = 0b01101000;
constexpr uint8_t FOLLOWER_OFF    = 0b01100000;

// Contrast set (low 4 bits: contrast C3..C0)
constexpr uint8_t CONTRAST_LO     = 0b01110000;

constexpr int CONTRAST_MAX        = 0b111111;
constexpr int FOLLOWER_MAX        = 7;
constexpr int DEFAULT_CONTRAST    = 0b100011;
constexpr int DEFAULT_FOLLOWER    = 4;

} // namespace st7032

#endif
