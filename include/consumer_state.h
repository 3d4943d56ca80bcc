/**
 * @file consumer_state.h
 * @brief Media key (consumer control) press with timed auto-release
 */

#pragma once

#include <stdint.h>
#include "hid_sink.h"

class ConsumerState {
public:
    /**
     * @param sink HID output
     * @param releaseDelayMs Time a media usage stays pressed
     */
    ConsumerState(HidSink& sink, uint32_t releaseDelayMs);

    /**
     * Press a usage now and schedule its release
     * @param usage Consumer usage ID, 0 releases immediately
     * @param nowMs Current time in milliseconds
     */
    void press(uint16_t usage, uint32_t nowMs);

    /**
     * Send the pending release once its delay has passed
     * Call from the main loop.
     */
    void service(uint32_t nowMs);

    /**
     * Release a held usage immediately
     * @return true if a release was sent
     */
    bool releaseAll();

    bool isHeld() const { return heldUsage != 0; }
    uint16_t getHeldUsage() const { return heldUsage; }

    uint32_t getSinkFailures() const { return sinkFailures; }
    void resetStats() { sinkFailures = 0; }

private:
    HidSink& sink;
    uint32_t releaseDelayMs;
    uint16_t heldUsage;
    uint32_t pressTimeMs;
    uint32_t sinkFailures;

    void send(uint16_t usage);
};
