#include "lcd_delay.hpp"
#include <unistd.h>

void SystemDelay::sleepMs(unsigned int ms) {
    usleep(ms * 1000);
}
