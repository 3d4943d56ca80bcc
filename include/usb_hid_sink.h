/**
 * @file usb_hid_sink.h
 * @brief Composite USB HID device on the arduino-esp32 TinyUSB stack
 *
 * One HID interface carrying four reports:
 *   1 - keyboard (modifier, reserved, 6 keys; LED output report)
 *   2 - relative mouse (3 buttons, dx, dy, wheel)
 *   3 - consumer control (16-bit usage)
 *   4 - digitizer pen (in-range, tip, barrel, X/Y 0..32767)
 *
 * The pen report is what lets absolute coordinates work on Windows, macOS
 * and Linux without a driver. It has no wheel or middle button, so those
 * go out through the relative mouse report.
 */

#pragma once

#include <stdint.h>
#include <USB.h>
#include <USBHID.h>
#include "hid_sink.h"

#define USB_REPORT_ID_KEYBOARD 1
#define USB_REPORT_ID_MOUSE 2
#define USB_REPORT_ID_CONSUMER 3
#define USB_REPORT_ID_DIGITIZER 4

class UsbHidSink : public USBHIDDevice, public HidSink {
public:
    UsbHidSink();

    /**
     * Register the HID interface and start USB
     * Must run before USB enumeration, i.e. from setup().
     */
    void begin();

    // HidSink
    bool sendKeyboardReport(uint8_t modifier, const uint8_t keys[HID_KEY_SLOTS]) override;
    bool sendMouseReport(uint8_t buttons, int8_t dx, int8_t dy, int8_t scroll) override;
    bool sendAbsoluteMouseReport(uint8_t buttons, uint16_t x, uint16_t y, int8_t scroll) override;
    bool sendConsumerReport(uint16_t usage) override;
    bool wakeHost() override;
    bool isReady() override;
    uint8_t getKeyboardLeds() const override { return keyboardLeds; }

    // USBHIDDevice
    uint16_t _onGetDescriptor(uint8_t* buffer) override;
    void _onOutput(uint8_t report_id, const uint8_t* buffer, uint16_t len) override;

private:
    USBHID hid;
    bool started;
    volatile uint8_t keyboardLeds;  // Written from the TinyUSB task
    uint8_t relativeButtons;        // Buttons last sent in the relative report

    bool send(uint8_t reportId, const void* data, uint16_t length);
};
