/**
 * @file bridge_device.h
 * @brief Board services used by the control plane
 */

#pragma once

#include <stdint.h>

class BridgeDevice {
public:
    virtual ~BridgeDevice() {}

    /**
     * Refresh button and power state
     * Call once per loop before polling buttons.
     */
    virtual void update() {}

    /**
     * Set the display backlight
     * @param level 0 (off) .. 255 (full)
     */
    virtual void setDisplayBrightness(uint8_t level) = 0;

    /**
     * Check whether the release-capture button was pressed since the last update
     */
    virtual bool wasReleaseButtonPressed() = 0;

    /**
     * Reboot the bridge. Does not return on hardware.
     */
    virtual void restart() = 0;
};
