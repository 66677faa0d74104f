#include "display/char_lcd.hpp"
#include "display/ext_char_lcd.hpp"
#include "display/debug_bus.hpp"
#include "display/pcf8574_bus.hpp"
#include <wiringPi.h>
#include <iostream>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>


// Settings
constexpr int LCD_ADDR      = 0x27;   // PCF8574 (0x3F for PCF8574A)
constexpr int LCD_COLUMNS   = 16;
constexpr int LCD_LINES     = 2;
constexpr int LCD_CONTRAST  = 40;     // ST7032 only, 0-63
const char* TRACE_FILE      = "lcd_trace.log";

enum BusChoice {
    BUS_DEBUG   = 0,
    BUS_PCF8574 = 1,
    BUS_ST7032  = 2
};

// Show stdin two lines at a time
static void showInput(CharLcd& lcd)
{
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(std::cin, line))
    {
        lines.push_back(line.substr(0, LCD_COLUMNS));
        if (static_cast<int>(lines.size()) < LCD_LINES)
            continue;

        std::string message = lines[0];
        for (size_t i = 1; i < lines.size(); i++)
            message += "\n" + lines[i];

        lcd.clear();
        lcd.setMessage(message);
        std::cout << "LCD <- \"" << lines[0] << "\" / \"" << lines.back() << "\"" << std::endl;
        lines.clear();
    }

    if (!lines.empty())
    {
        lcd.clear();
        lcd.setMessage(lines[0]);
    }
}

int main()
{
    int bus_id;
    std::cout << "Select bus (0=debug, 1=pcf8574, 2=st7032 debug): ";
    if (!(std::cin >> bus_id))
    {
        std::cerr << "No bus selected." << std::endl;
        return EXIT_FAILURE;
    }
    std::cin.ignore(1, '\n');

    SystemDelay delay;

    try
    {
        if (bus_id == BUS_PCF8574)
        {
            if (wiringPiSetup() == -1)
            {
                std::cerr << "Failed to initialize wiringPi!" << std::endl;
                return EXIT_FAILURE;
            }

            Pcf8574Bus bus(LCD_ADDR);
            if (!bus.ok())
                return EXIT_FAILURE;

            CharLcd lcd(bus, delay, LCD_COLUMNS, LCD_LINES);
            std::cout << "LCD initialized at 0x" << std::hex << LCD_ADDR << std::dec << std::endl;
            showInput(lcd);

            bus.backlight(false);
            return bus.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        std::ofstream traceFile(TRACE_FILE, std::ios::out);
        if (!traceFile)
        {
            std::cerr << "Cannot open " << TRACE_FILE << std::endl;
            return EXIT_FAILURE;
        }
        DebugBus bus(traceFile);

        if (bus_id == BUS_ST7032)
        {
            ExtCharLcd ext(bus, delay, LCD_COLUMNS, LCD_LINES);
            ext.setContrast(LCD_CONTRAST);
            showInput(ext.lcd());
        }
        else
        {
            CharLcd lcd(bus, delay, LCD_COLUMNS, LCD_LINES);
            showInput(lcd);
        }
        std::cout << "Bus trace written to " << TRACE_FILE << std::endl;
    }
    catch (const InvalidGeometry& e)
    {
        std::cerr << "LCD geometry: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
