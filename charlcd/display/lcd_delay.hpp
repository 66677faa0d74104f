#ifndef LCD_DELAY_HPP
#define LCD_DELAY_HPP

// Blocking wait used for the controller's command execution times.
class LcdDelay {
public:
    virtual ~LcdDelay() {}

    virtual void sleepMs(unsigned int ms) = 0;
};

// usleep() based delay for Linux hosts
class SystemDelay : public LcdDelay {
public:
    void sleepMs(unsigned int ms) override;
};

#endif
