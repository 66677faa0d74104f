#ifndef CHAR_LCD_HPP
#define CHAR_LCD_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "lcd_bus.hpp"
#include "lcd_delay.hpp"

// Row offset table shorter than the number of lines (or a non-positive size)
class InvalidGeometry : public std::invalid_argument {
public:
    explicit InvalidGeometry(const std::string& what)
        : std::invalid_argument(what) {}
};

struct LcdGeometry {
    int columns;
    int lines;
    std::vector<int> rowOffsets;   // DDRAM base address per row
};

// {0x00, 0x40, columns, 0x40 + columns}, the usual 4-line wiring
std::vector<int> standardRowOffsets(int columns);

class CharLcd;

// The phase of the power-on protocol that differs between controller
// variants. CharLcd runs the shared steps and calls into this for the rest.
class InitSequence {
public:
    virtual ~InitSequence() {}

    // Reset the variant's own shadow registers (no bus traffic)
    virtual void reset() = 0;

    // Program the function set (and whatever else the variant needs) after
    // the interface reset. lcd.functionSet() is valid at this point.
    virtual void initialize(CharLcd& lcd) = 0;
};

// Plain HD44780 / ST7066U: write the function set and nothing else
class StandardInit : public InitSequence {
public:
    void reset() override {}
    void initialize(CharLcd& lcd) override;
};

// Base character LCD controller, such as HD44780 or ST7066U.
//
// The bus cannot be read back. Every getter is answered from shadow state
// that is updated together with the command that programs the device.
class CharLcd {
public:
    // Throws InvalidGeometry before any bus traffic if rowOffsets is shorter
    // than lines. An empty rowOffsets selects {0x00, 0x40}.
    CharLcd(LcdBus& bus, LcdDelay& delay, int columns, int lines,
            const std::vector<int>& rowOffsets = std::vector<int>());
    CharLcd(LcdBus& bus, LcdDelay& delay, int columns, int lines,
            const std::vector<int>& rowOffsets, InitSequence& init);

    CharLcd(const CharLcd&) = delete;
    CharLcd& operator=(const CharLcd&) = delete;

    LcdBus& bus() { return bus_; }
    LcdDelay& delay() { return delay_; }
    const LcdGeometry& geometry() const { return geometry_; }
    uint8_t functionSet() const { return functionSet_; }

    void clear();
    void home();

    bool getRightToLeft() const { return rightToLeft_; }
    void setRightToLeft(bool enable);

    bool getDisplay() const;
    void setDisplay(bool enable);
    bool getCursor() const;
    void setCursor(bool show);
    bool getBlink() const;
    void setBlink(bool blink);

    // Shift commands. The device keeps the shift offset internally.
    void displayLeft();
    void displayRight();
    void cursorLeft();
    void cursorRight();

    // Out of range coordinates saturate to the nearest cell
    void cursorPosition(int column, int row);
    int getColumn() const { return column_; }
    int getRow() const { return row_; }

    // When set, a line break keeps the column the text started at
    bool getColumnAlign() const { return columnAlign_; }
    void setColumnAlign(bool enable) { columnAlign_ = enable; }

    const std::string& getMessage() const { return message_; }
    void setMessage(const std::string& message);

    // code 0-7, dots: 8 rows of 5 bits
    void createCharacter(int code, const uint8_t dots[8]);

private:
    LcdBus& bus_;
    LcdDelay& delay_;
    const LcdGeometry geometry_;
    StandardInit standardInit_;
    InitSequence& init_;

    uint8_t functionSet_ = 0;
    uint8_t displayControl_ = 0;
    int column_ = 0;
    int row_ = 0;
    bool rightToLeft_ = false;
    bool columnAlign_ = false;
    std::string message_;

    void reset();
    void initialize();
    void setDisplayControl(uint8_t field, bool set);
};

#endif
