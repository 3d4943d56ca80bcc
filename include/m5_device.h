/**
 * @file m5_device.h
 * @brief M5Stack board services (Cardputer / AtomS3 class) via M5Unified
 */

#pragma once

#include <stdint.h>
#include "bridge_device.h"

class M5Device : public BridgeDevice {
public:
    M5Device();

    /**
     * Initialise the board and draw the idle screen
     */
    void begin(const char* deviceName);

    void update() override;
    void setDisplayBrightness(uint8_t level) override;
    bool wasReleaseButtonPressed() override;
    void restart() override;

    /**
     * Show the connection state on the status line
     */
    void showConnected(bool connected);

private:
    bool started;
    bool statusConnected;
};
