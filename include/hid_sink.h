/**
 * @file hid_sink.h
 * @brief Output side of the bridge: asserts HID reports on the target host
 *
 * The state machines only ever talk to this interface. The firmware binds it
 * to the arduino-esp32 USB HID stack; tests bind it to a recorder.
 */

#pragma once

#include <stdint.h>

#define HID_KEY_SLOTS 6

// Mouse button bits shared by the wire format and the reports
#define HID_MOUSE_LEFT 0x01
#define HID_MOUSE_RIGHT 0x02
#define HID_MOUSE_MIDDLE 0x04
#define HID_MOUSE_BUTTON_MASK 0x07

// Absolute pointer logical range
#define HID_ABS_MAX 32767

class HidSink {
public:
    virtual ~HidSink() {}

    /**
     * Send a full boot-keyboard style report
     * @param modifier Modifier mask, bit0 LeftCtrl .. bit7 RightGUI
     * @param keys Six key slots, 0 = empty
     * @return false if the report could not be queued on the bus
     */
    virtual bool sendKeyboardReport(uint8_t modifier, const uint8_t keys[HID_KEY_SLOTS]) = 0;

    virtual bool sendMouseReport(uint8_t buttons, int8_t dx, int8_t dy, int8_t scroll) = 0;

    /**
     * Send an absolute pointer report
     * @param x,y Position on the 0..HID_ABS_MAX scale
     */
    virtual bool sendAbsoluteMouseReport(uint8_t buttons, uint16_t x, uint16_t y, int8_t scroll) = 0;

    /**
     * Send a consumer control report (0 = release)
     */
    virtual bool sendConsumerReport(uint16_t usage) = 0;

    /**
     * Ask the host to leave suspend
     * @return true if a wake attempt was made, false if this sink cannot wake
     */
    virtual bool wakeHost() { return false; }

    /**
     * Check if the host has enumerated the device
     */
    virtual bool isReady() = 0;

    /**
     * Keyboard LED state from the host (NumLock bit0, CapsLock bit1, ScrollLock bit2)
     */
    virtual uint8_t getKeyboardLeds() const { return 0; }
};
