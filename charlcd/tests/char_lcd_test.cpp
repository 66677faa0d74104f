#include <gtest/gtest.h>

#include <memory>

#include "display/char_lcd.hpp"
#include "recording_bus.hpp"

namespace {

class CharLcdTest : public ::testing::Test {
protected:
    EventLog log;
    RecordingBus bus{log};
    RecordingDelay delay{log};
    std::unique_ptr<CharLcd> lcd;

    // Build a controller and drop the init traffic
    CharLcd& make(int columns = 16, int lines = 2,
                  const std::vector<int>& rowOffsets = std::vector<int>())
    {
        lcd.reset(new CharLcd(bus, delay, columns, lines, rowOffsets));
        log.clear();
        return *lcd;
    }
};

TEST_F(CharLcdTest, InitSequence8Bit2Line)
{
    CharLcd lcd(bus, delay, 16, 2);

    EventLog expected = {
        cmd(0x30), delayMs(4), cmd(0x30), delayMs(1),
        cmd(0x38),
        cmd(0x0c),
        cmd(0x01), delayMs(2),
        cmd(0x06),
    };
    EXPECT_EQ(expected, log);
    EXPECT_EQ(1, bus.initializeCalls);
    EXPECT_EQ(0x38, lcd.functionSet());
}

TEST_F(CharLcdTest, InitSequence4Bit1Line)
{
    RecordingBus bus4(log, false);
    CharLcd lcd(bus4, delay, 8, 1);

    EventLog expected = {
        cmd(0x30), delayMs(4), cmd(0x30), delayMs(1),
        cmd(0x20),
        cmd(0x0c),
        cmd(0x01), delayMs(2),
        cmd(0x06),
    };
    EXPECT_EQ(expected, log);
    EXPECT_EQ(0x20, lcd.functionSet());
}

TEST_F(CharLcdTest, InitialState)
{
    CharLcd& lcd = make();

    EXPECT_EQ(0, lcd.getColumn());
    EXPECT_EQ(0, lcd.getRow());
    EXPECT_TRUE(lcd.getDisplay());
    EXPECT_FALSE(lcd.getCursor());
    EXPECT_FALSE(lcd.getBlink());
    EXPECT_FALSE(lcd.getRightToLeft());
    EXPECT_FALSE(lcd.getColumnAlign());
    EXPECT_EQ("", lcd.getMessage());
    EXPECT_TRUE(log.empty());
}

TEST_F(CharLcdTest, DefaultRowOffsets)
{
    CharLcd& lcd = make();

    std::vector<int> expected = {0x00, 0x40};
    EXPECT_EQ(expected, lcd.geometry().rowOffsets);
    EXPECT_EQ(16, lcd.geometry().columns);
    EXPECT_EQ(2, lcd.geometry().lines);
}

TEST_F(CharLcdTest, ShortRowOffsetTableThrows)
{
    EXPECT_THROW(CharLcd(bus, delay, 16, 2, {0x00}), InvalidGeometry);
    EXPECT_THROW(CharLcd(bus, delay, 20, 4, {0x00, 0x40, 0x14}), InvalidGeometry);
    // Default table only covers two rows
    EXPECT_THROW(CharLcd(bus, delay, 20, 4), InvalidGeometry);
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(0, bus.initializeCalls);
}

TEST_F(CharLcdTest, NonPositiveSizeThrows)
{
    EXPECT_THROW(CharLcd(bus, delay, 0, 2), InvalidGeometry);
    EXPECT_THROW(CharLcd(bus, delay, 16, 0), InvalidGeometry);
    EXPECT_TRUE(log.empty());
}

TEST_F(CharLcdTest, LongerRowOffsetTableAccepted)
{
    CharLcd& lcd = make(20, 4, standardRowOffsets(20));

    EXPECT_EQ(0, lcd.getColumn());
    EXPECT_EQ(0, lcd.getRow());
    lcd.cursorPosition(3, 3);
    EXPECT_EQ(EventLog{cmd(0x80 | (0x54 + 3))}, log);
}

TEST_F(CharLcdTest, StandardRowOffsets)
{
    std::vector<int> expected = {0x00, 0x40, 0x14, 0x54};
    EXPECT_EQ(expected, standardRowOffsets(20));
}

TEST_F(CharLcdTest, CursorPositionInRange)
{
    CharLcd& lcd = make();

    lcd.cursorPosition(5, 1);
    EXPECT_EQ(EventLog{cmd(0xc5)}, log);
    EXPECT_EQ(5, lcd.getColumn());
    EXPECT_EQ(1, lcd.getRow());
}

TEST_F(CharLcdTest, CursorPositionClamps)
{
    CharLcd& lcd = make();

    struct Case { int column, row, expColumn, expRow; uint8_t address; };
    const Case cases[] = {
        { -3,   5,  0, 1, 0xc0 },
        { 100,  0, 15, 0, 0x8f },
        { 16,   1, 15, 1, 0xcf },
        { -1,  -1,  0, 0, 0x80 },
        { 7,  -20,  7, 0, 0x87 },
    };
    for (const Case& c : cases) {
        log.clear();
        lcd.cursorPosition(c.column, c.row);
        EXPECT_EQ(EventLog{cmd(c.address)}, log) << c.column << "," << c.row;
        EXPECT_EQ(c.expColumn, lcd.getColumn());
        EXPECT_EQ(c.expRow, lcd.getRow());
    }
}

TEST_F(CharLcdTest, CustomRowOffsets)
{
    CharLcd& lcd = make(16, 3, {0x00, 0x10, 0x20});

    lcd.cursorPosition(2, 2);
    EXPECT_EQ(EventLog{cmd(0x80 | 0x22)}, log);
}

TEST_F(CharLcdTest, DisplayControlBitsAreIndependent)
{
    CharLcd& lcd = make();

    lcd.setCursor(true);
    lcd.setBlink(true);
    lcd.setDisplay(false);
    lcd.setCursor(false);
    lcd.setDisplay(true);

    EventLog expected = { cmd(0x0e), cmd(0x0f), cmd(0x0b), cmd(0x09), cmd(0x0d) };
    EXPECT_EQ(expected, log);

    log.clear();
    EXPECT_TRUE(lcd.getDisplay());
    EXPECT_FALSE(lcd.getCursor());
    EXPECT_TRUE(lcd.getBlink());
    EXPECT_TRUE(log.empty());
}

TEST_F(CharLcdTest, SettingSameValueStillWrites)
{
    CharLcd& lcd = make();

    lcd.setDisplay(true);
    EXPECT_EQ(EventLog{cmd(0x0c)}, log);
}

TEST_F(CharLcdTest, ClearResetsCursor)
{
    CharLcd& lcd = make();

    lcd.cursorPosition(9, 1);
    log.clear();
    lcd.clear();
    EventLog expected = { cmd(0x01), delayMs(2) };
    EXPECT_EQ(expected, log);
    EXPECT_EQ(0, lcd.getColumn());
    EXPECT_EQ(0, lcd.getRow());

    lcd.clear();
    EXPECT_EQ(0, lcd.getColumn());
    EXPECT_EQ(0, lcd.getRow());
}

TEST_F(CharLcdTest, HomeResetsCursor)
{
    CharLcd& lcd = make();

    lcd.cursorPosition(3, 1);
    log.clear();
    lcd.home();
    EventLog expected = { cmd(0x02), delayMs(2) };
    EXPECT_EQ(expected, log);
    EXPECT_EQ(0, lcd.getColumn());
    EXPECT_EQ(0, lcd.getRow());
}

TEST_F(CharLcdTest, EntryMode)
{
    CharLcd& lcd = make();

    lcd.setRightToLeft(true);
    EXPECT_TRUE(lcd.getRightToLeft());
    lcd.setRightToLeft(false);
    EXPECT_FALSE(lcd.getRightToLeft());

    EventLog expected = { cmd(0x04), cmd(0x06) };
    EXPECT_EQ(expected, log);
}

TEST_F(CharLcdTest, ShiftCommands)
{
    CharLcd& lcd = make();

    lcd.displayLeft();
    lcd.displayRight();
    lcd.cursorLeft();
    lcd.cursorRight();

    EventLog expected = { cmd(0x18), cmd(0x1c), cmd(0x10), cmd(0x14) };
    EXPECT_EQ(expected, log);
    EXPECT_EQ(0, lcd.getColumn());
    EXPECT_TRUE(lcd.getDisplay());
}

TEST_F(CharLcdTest, MessageLeftToRight)
{
    CharLcd& lcd = make();

    lcd.setMessage("AB\nCD");

    EventLog expected = { data('A'), data('B'), cmd(0xc0), data('C'), data('D') };
    EXPECT_EQ(expected, log);
    EXPECT_EQ("AB\nCD", lcd.getMessage());
}

TEST_F(CharLcdTest, MessageRightToLeft)
{
    CharLcd& lcd = make();
    lcd.setRightToLeft(true);
    log.clear();

    lcd.setMessage("AB\nCD");

    EventLog expected = {
        cmd(0x8f), data('A'), data('B'),
        cmd(0xcf), data('C'), data('D'),
    };
    EXPECT_EQ(expected, log);
}

TEST_F(CharLcdTest, MessageStartsAtCursor)
{
    CharLcd& lcd = make();
    lcd.cursorPosition(4, 0);
    log.clear();

    lcd.setMessage("AB\nCD");

    EventLog expected = { data('A'), data('B'), cmd(0xc0), data('C'), data('D') };
    EXPECT_EQ(expected, log);
}

TEST_F(CharLcdTest, MessageColumnAlign)
{
    CharLcd& lcd = make();
    lcd.setColumnAlign(true);
    EXPECT_TRUE(lcd.getColumnAlign());
    lcd.cursorPosition(4, 0);
    log.clear();

    lcd.setMessage("AB\nCD");

    EventLog expected = { data('A'), data('B'), cmd(0xc4), data('C'), data('D') };
    EXPECT_EQ(expected, log);
}

TEST_F(CharLcdTest, MessageColumnAlignRightToLeft)
{
    CharLcd& lcd = make();
    lcd.setColumnAlign(true);
    lcd.cursorPosition(4, 0);
    lcd.setRightToLeft(true);
    log.clear();

    lcd.setMessage("AB\nCD");

    // Column 4 mirrored on a 16 column display is 11
    EventLog expected = {
        cmd(0x8b), data('A'), data('B'),
        cmd(0xcb), data('C'), data('D'),
    };
    EXPECT_EQ(expected, log);
}

TEST_F(CharLcdTest, MessageExtraLineBreaksStayOnLastRow)
{
    CharLcd& lcd = make();

    lcd.setMessage("A\nB\nC");

    EventLog expected = {
        data('A'), cmd(0xc0), data('B'), cmd(0xc0), data('C'),
    };
    EXPECT_EQ(expected, log);
    EXPECT_EQ(1, lcd.getRow());
}

TEST_F(CharLcdTest, MessageDoesNotWrap)
{
    CharLcd& lcd = make(4, 2);

    lcd.setMessage("ABCDEF");

    EXPECT_EQ(6u, log.size());
    for (const BusEvent& event : log) {
        EXPECT_EQ(BusEvent::DATA, event.kind);
    }
}

TEST_F(CharLcdTest, EmptyMessage)
{
    CharLcd& lcd = make();
    lcd.setRightToLeft(true);
    log.clear();

    lcd.setMessage("");
    EXPECT_TRUE(log.empty());
    EXPECT_EQ("", lcd.getMessage());
}

TEST_F(CharLcdTest, CreateCharacter)
{
    CharLcd& lcd = make();
    const uint8_t dots[8] = { 0x00, 0x0a, 0x1f, 0x1f, 0x0e, 0x04, 0x00, 0x00 };

    lcd.createCharacter(2, dots);

    EventLog expected = { cmd(0x50) };
    for (uint8_t row : dots) {
        expected.push_back(data(row));
    }
    EXPECT_EQ(expected, log);
}

TEST_F(CharLcdTest, CreateCharacterMasksCode)
{
    CharLcd& lcd = make();
    const uint8_t dots[8] = { 1, 2, 3, 4, 5, 6, 7, 8 };

    lcd.createCharacter(9, dots);

    ASSERT_EQ(9u, log.size());
    EXPECT_EQ(cmd(0x48), log[0]);
    EXPECT_EQ(data(8), log[8]);
}

} // namespace
