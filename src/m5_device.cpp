/**
 * @file m5_device.cpp
 * @brief M5Stack board services implementation
 */

#include "m5_device.h"
#include "debug.h"
#include <M5Unified.h>

M5Device::M5Device()
    : started(false)
    , statusConnected(false)
{
}

void M5Device::begin(const char* deviceName)
{
    auto cfg = M5.config();
    // USB CDC stays with the debug Serial set up in setup()
    cfg.serial_baudrate = 0;
    M5.begin(cfg);
    started = true;

    M5.Display.setRotation(1);
    M5.Display.fillScreen(TFT_BLACK);
    M5.Display.setTextColor(TFT_WHITE, TFT_BLACK);
    M5.Display.setTextSize(2);
    M5.Display.setCursor(4, 4);
    M5.Display.print(deviceName);

    statusConnected = true;
    showConnected(false);
}

void M5Device::update()
{
    if (started) {
        M5.update();
    }
}

void M5Device::setDisplayBrightness(uint8_t level)
{
    if (!started) {
        return;
    }
    M5.Display.setBrightness(level);
    DBGPRINTF("[M5] Backlight %u\n", level);
}

bool M5Device::wasReleaseButtonPressed()
{
    return started && M5.BtnA.wasPressed();
}

void M5Device::showConnected(bool connected)
{
    if (!started || connected == statusConnected) {
        return;
    }
    statusConnected = connected;

    M5.Display.fillRect(0, 32, M5.Display.width(), 20, TFT_BLACK);
    M5.Display.setCursor(4, 32);
    M5.Display.setTextColor(connected ? TFT_GREEN : TFT_YELLOW, TFT_BLACK);
    M5.Display.print(connected ? "Connected" : "Advertising");
}

void M5Device::restart()
{
    DBGPRINTLN("[M5] Restarting");
    Serial.flush();
    ESP.restart();
}
