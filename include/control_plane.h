/**
 * @file control_plane.h
 * @brief Device-side control commands: display, USB wake/recovery, reset
 *
 * Display power follows a two state machine:
 *
 *   AWAKE  --(no activity for timeout)-->  DIMMED (display off)
 *   DIMMED --(any dispatched command)--->  AWAKE  (prior brightness restored)
 *
 * Results describe whether an action was attempted, never whether the
 * host reacted to it.
 */

#pragma once

#include <stdint.h>
#include "bridge_device.h"
#include "hid_sink.h"
#include "keyboard_state.h"
#include "mouse_state.h"
#include "consumer_state.h"
#include "transport_adapter.h"

enum ControlResult {
    CONTROL_REQUESTED,
    CONTROL_UNSUPPORTED
};

class ControlPlane {
public:
    enum DisplayState {
        DISPLAY_AWAKE,
        DISPLAY_DIMMED
    };

    ControlPlane(BridgeDevice& device, HidSink& sink, KeyboardState& keyboard,
                 MouseState& mouse, ConsumerState& consumer, TransportAdapter& transport);

    /**
     * Apply the initial display state
     */
    void begin(uint32_t nowMs);

    /**
     * Poll the release button and the display timeout
     * Call from the main loop after BridgeDevice::update().
     */
    void service(uint32_t nowMs);

    /**
     * Record input or control activity, waking a dimmed display
     */
    void noteActivity(uint32_t nowMs);

    /**
     * Set display brightness from its wire value
     * Counts as activity, so a dimmed display is awake afterwards.
     * @param wireLevel 0 off, 1..254 dim, 255 on
     * @return true if the display level changed
     */
    bool setBrightness(uint8_t wireLevel, uint32_t nowMs);

    /**
     * Set the inactivity timeout
     * @param seconds 0 disables the timeout
     */
    void setDisplayTimeout(uint16_t seconds, uint32_t nowMs);

    /**
     * Ask the host to wake from suspend
     */
    ControlResult wakeUsb();

    /**
     * Re-emit HID activity so a stalled USB stack recovers
     * A corrupted stack may crash the device while doing so; the reboot
     * brings USB back too. Queues a status notification for the browser.
     */
    ControlResult recoverUsb();

    /**
     * Release held input and reboot
     */
    void resetDevice();

    /**
     * Queue the release-capture notification
     * @return false if no browser is connected or the queue is full
     */
    bool sendReleaseCapture();

    /**
     * Release every held key, button and media usage
     */
    void releaseInput();

    DisplayState getDisplayState() const { return displayState; }
    uint8_t getDisplayLevel() const { return displayLevel; }
    uint8_t getConfiguredLevel() const { return configuredLevel; }
    uint16_t getDisplayTimeout() const { return timeoutSeconds; }

    static uint8_t brightnessLevel(uint8_t wireLevel);

private:
    BridgeDevice& device;
    HidSink& sink;
    KeyboardState& keyboard;
    MouseState& mouse;
    ConsumerState& consumer;
    TransportAdapter& transport;

    DisplayState displayState;
    uint8_t displayLevel;       // Level the display is showing
    uint8_t configuredLevel;    // Level restored after a timeout
    uint16_t timeoutSeconds;
    uint32_t lastActivityMs;
    bool displayInitialized;

    void applyDisplayLevel(uint8_t level);
};
