/**
 * @file mock_bridge_device.h
 * @brief Recording board services for native testing
 */

#pragma once

#include <stdint.h>
#include "bridge_device.h"

class MockBridgeDevice : public BridgeDevice {
public:
    int brightnessCalls;
    uint8_t brightness;
    int restartCalls;
    int updateCalls;
    bool buttonPressed;     // Consumed by the next wasReleaseButtonPressed()

    MockBridgeDevice() { reset(); }

    void reset() {
        brightnessCalls = 0;
        brightness = 0;
        restartCalls = 0;
        updateCalls = 0;
        buttonPressed = false;
    }

    void update() override { updateCalls++; }

    void setDisplayBrightness(uint8_t level) override {
        brightnessCalls++;
        brightness = level;
    }

    bool wasReleaseButtonPressed() override {
        bool pressed = buttonPressed;
        buttonPressed = false;
        return pressed;
    }

    void restart() override { restartCalls++; }
};
