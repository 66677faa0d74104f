#include "char_lcd.hpp"
#include "instructions.hpp"

#include <sstream>

using namespace hd44780;

namespace {

LcdGeometry makeGeometry(int columns, int lines, const std::vector<int>& rowOffsets)
{
    LcdGeometry geometry;
    geometry.columns = columns;
    geometry.lines = lines;
    geometry.rowOffsets = rowOffsets;
    if (geometry.rowOffsets.empty()) {
        geometry.rowOffsets = {0x00, 0x40};
    }

    if (columns < 1 || lines < 1) {
        std::ostringstream msg;
        msg << "invalid LCD size " << columns << "x" << lines;
        throw InvalidGeometry(msg.str());
    }
    if (static_cast<int>(geometry.rowOffsets.size()) < lines) {
        std::ostringstream msg;
        msg << geometry.rowOffsets.size() << " row offsets for " << lines << " lines";
        throw InvalidGeometry(msg.str());
    }
    return geometry;
}

int clamp(int value, int low, int high)
{
    if (value < low) return low;
    if (value > high) return high;
    return value;
}

} // namespace

std::vector<int> standardRowOffsets(int columns) {
    return {0x00, 0x40, columns, 0x40 + columns};
}

void StandardInit::initialize(CharLcd& lcd) {
    lcd.bus().sendCommand(lcd.functionSet());
}

CharLcd::CharLcd(LcdBus& bus, LcdDelay& delay, int columns, int lines,
                 const std::vector<int>& rowOffsets)
    : CharLcd(bus, delay, columns, lines, rowOffsets, standardInit_)
{
}

CharLcd::CharLcd(LcdBus& bus, LcdDelay& delay, int columns, int lines,
                 const std::vector<int>& rowOffsets, InitSequence& init)
    : bus_(bus),
      delay_(delay),
      geometry_(makeGeometry(columns, lines, rowOffsets)),
      init_(init)
{
    reset();
    initialize();
}

void CharLcd::reset() {
    init_.reset();
    functionSet_ = 0;
    displayControl_ = DISPLAY_CONTROL;
    column_ = 0;
    row_ = 0;
    message_.clear();
    columnAlign_ = false;
    rightToLeft_ = false;
}

void CharLcd::initialize() {
    // Power-on bus width is unknown, force 8-bit mode first
    bus_.sendCommand(FUNCTION_8BIT);
    delay_.sleepMs(4);
    bus_.sendCommand(FUNCTION_8BIT);
    delay_.sleepMs(1);

    functionSet_ = FUNCTION_1LINE | FUNCTION_5X8;
    if (bus_.initialize()) {
        functionSet_ |= FUNCTION_8BIT;
    }
    if (geometry_.lines >= 2) {
        functionSet_ |= FUNCTION_2LINE;
    }
    init_.initialize(*this);

    setDisplay(true);
    clear();
    setRightToLeft(false);
}

void CharLcd::clear() {
    bus_.sendCommand(CLEAR_DISPLAY);
    column_ = 0;
    row_ = 0;
    delay_.sleepMs(2);
}

void CharLcd::home() {
    bus_.sendCommand(RETURN_HOME);
    column_ = 0;
    row_ = 0;
    delay_.sleepMs(2);
}

void CharLcd::setRightToLeft(bool enable) {
    rightToLeft_ = enable;
    bus_.sendCommand(rightToLeft_ ? ENTRY_RIGHT : ENTRY_LEFT);
}

void CharLcd::setDisplayControl(uint8_t field, bool set) {
    if (set)
        displayControl_ |= field;
    else
        displayControl_ &= ~field;
    bus_.sendCommand(displayControl_);
}

bool CharLcd::getDisplay() const {
    return displayControl_ & DISPLAY_ENABLE;
}

void CharLcd::setDisplay(bool enable) {
    setDisplayControl(DISPLAY_ENABLE, enable);
}

bool CharLcd::getCursor() const {
    return displayControl_ & CURSOR_SHOW;
}

void CharLcd::setCursor(bool show) {
    setDisplayControl(CURSOR_SHOW, show);
}

bool CharLcd::getBlink() const {
    return displayControl_ & CURSOR_BLINK;
}

void CharLcd::setBlink(bool blink) {
    setDisplayControl(CURSOR_BLINK, blink);
}

void CharLcd::displayLeft() {
    bus_.sendCommand(DISPLAY_LEFT);
}

void CharLcd::displayRight() {
    bus_.sendCommand(DISPLAY_RIGHT);
}

void CharLcd::cursorLeft() {
    bus_.sendCommand(CURSOR_LEFT);
}

void CharLcd::cursorRight() {
    bus_.sendCommand(CURSOR_RIGHT);
}

void CharLcd::cursorPosition(int column, int row) {
    column_ = clamp(column, 0, geometry_.columns - 1);
    row_ = clamp(row, 0, geometry_.lines - 1);
    int address = geometry_.rowOffsets[row_] + column_;
    bus_.sendCommand(DDRAM_ADDRESS | (address & 0x7f));
}

void CharLcd::setMessage(const std::string& message) {
    message_ = message;

    int column = column_;
    int line = row_;
    if (rightToLeft_ && !message.empty()) {
        // Entry mode decrements the address, start from the mirrored column
        column = geometry_.columns - column - 1;
        cursorPosition(column, line);
        column = column_;
    }
    const int startColumn = column;

    for (char c : message) {
        if (c == '\n') {
            line++;
            if (columnAlign_)
                column = startColumn;
            else
                column = rightToLeft_ ? geometry_.columns - 1 : 0;
            cursorPosition(column, line);
        } else {
            bus_.sendData(static_cast<uint8_t>(c));
        }
    }
}

void CharLcd::createCharacter(int code, const uint8_t dots[8]) {
    code &= 7;
    bus_.sendCommand(CGRAM_ADDRESS | (code << 3));
    for (int i = 0; i < 8; i++) {
        bus_.sendData(dots[i]);
    }
}
