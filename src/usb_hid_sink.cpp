/**
 * @file usb_hid_sink.cpp
 * @brief Composite USB HID device implementation
 */

#include "usb_hid_sink.h"
#include "debug.h"
#include <string.h>

// TinyUSB device API, linked in with the USB-OTG stack
extern "C" {
bool tud_suspended(void);
bool tud_remote_wakeup(void);
}

// Report send timeout; a stalled host must not block the loop for long
#define USB_REPORT_TIMEOUT_MS 20

// Digitizer button bits
#define PEN_IN_RANGE 0x01
#define PEN_TIP 0x02
#define PEN_BARREL 0x04

static const uint8_t reportDescriptor[] = {
    // Keyboard
    0x05, 0x01,        // Usage Page (Generic Desktop)
    0x09, 0x06,        // Usage (Keyboard)
    0xA1, 0x01,        // Collection (Application)
    0x85, USB_REPORT_ID_KEYBOARD,
    0x05, 0x07,        //   Usage Page (Key Codes)
    0x19, 0xE0,        //   Usage Minimum (224)
    0x29, 0xE7,        //   Usage Maximum (231)
    0x15, 0x00,        //   Logical Minimum (0)
    0x25, 0x01,        //   Logical Maximum (1)
    0x75, 0x01,        //   Report Size (1)
    0x95, 0x08,        //   Report Count (8)
    0x81, 0x02,        //   Input (Data, Variable, Absolute) - Modifiers
    0x95, 0x01,        //   Report Count (1)
    0x75, 0x08,        //   Report Size (8)
    0x81, 0x01,        //   Input (Constant) - Reserved
    0x05, 0x08,        //   Usage Page (LEDs)
    0x19, 0x01,        //   Usage Minimum (Num Lock)
    0x29, 0x05,        //   Usage Maximum (Kana)
    0x95, 0x05,        //   Report Count (5)
    0x75, 0x01,        //   Report Size (1)
    0x91, 0x02,        //   Output (Data, Variable, Absolute) - LEDs
    0x95, 0x01,        //   Report Count (1)
    0x75, 0x03,        //   Report Size (3)
    0x91, 0x01,        //   Output (Constant) - Padding
    0x95, 0x06,        //   Report Count (6)
    0x75, 0x08,        //   Report Size (8)
    0x15, 0x00,        //   Logical Minimum (0)
    0x26, 0xFF, 0x00,  //   Logical Maximum (255)
    0x05, 0x07,        //   Usage Page (Key Codes)
    0x19, 0x00,        //   Usage Minimum (0)
    0x2A, 0xFF, 0x00,  //   Usage Maximum (255)
    0x81, 0x00,        //   Input (Data, Array) - Keys
    0xC0,              // End Collection

    // Relative mouse
    0x05, 0x01,        // Usage Page (Generic Desktop)
    0x09, 0x02,        // Usage (Mouse)
    0xA1, 0x01,        // Collection (Application)
    0x85, USB_REPORT_ID_MOUSE,
    0x09, 0x01,        //   Usage (Pointer)
    0xA1, 0x00,        //   Collection (Physical)
    0x05, 0x09,        //     Usage Page (Buttons)
    0x19, 0x01,        //     Usage Minimum (1)
    0x29, 0x03,        //     Usage Maximum (3)
    0x15, 0x00,        //     Logical Minimum (0)
    0x25, 0x01,        //     Logical Maximum (1)
    0x95, 0x03,        //     Report Count (3)
    0x75, 0x01,        //     Report Size (1)
    0x81, 0x02,        //     Input (Data, Variable, Absolute) - Buttons
    0x95, 0x01,        //     Report Count (1)
    0x75, 0x05,        //     Report Size (5)
    0x81, 0x01,        //     Input (Constant) - Padding
    0x05, 0x01,        //     Usage Page (Generic Desktop)
    0x09, 0x30,        //     Usage (X)
    0x09, 0x31,        //     Usage (Y)
    0x09, 0x38,        //     Usage (Wheel)
    0x15, 0x81,        //     Logical Minimum (-127)
    0x25, 0x7F,        //     Logical Maximum (127)
    0x75, 0x08,        //     Report Size (8)
    0x95, 0x03,        //     Report Count (3)
    0x81, 0x06,        //     Input (Data, Variable, Relative)
    0xC0,              //   End Collection
    0xC0,              // End Collection

    // Consumer control
    0x05, 0x0C,        // Usage Page (Consumer)
    0x09, 0x01,        // Usage (Consumer Control)
    0xA1, 0x01,        // Collection (Application)
    0x85, USB_REPORT_ID_CONSUMER,
    0x15, 0x00,        //   Logical Minimum (0)
    0x26, 0xFF, 0x03,  //   Logical Maximum (1023)
    0x19, 0x00,        //   Usage Minimum (0)
    0x2A, 0xFF, 0x03,  //   Usage Maximum (1023)
    0x75, 0x10,        //   Report Size (16)
    0x95, 0x01,        //   Report Count (1)
    0x81, 0x00,        //   Input (Data, Array)
    0xC0,              // End Collection

    // Digitizer pen (absolute pointer)
    0x05, 0x0D,        // Usage Page (Digitizer)
    0x09, 0x02,        // Usage (Pen)
    0xA1, 0x01,        // Collection (Application)
    0x85, USB_REPORT_ID_DIGITIZER,
    0x09, 0x32,        //   Usage (In Range) - hosts ignore X/Y without it
    0x09, 0x42,        //   Usage (Tip Switch)
    0x09, 0x44,        //   Usage (Barrel Switch)
    0x15, 0x00,        //   Logical Minimum (0)
    0x25, 0x01,        //   Logical Maximum (1)
    0x75, 0x01,        //   Report Size (1)
    0x95, 0x03,        //   Report Count (3)
    0x81, 0x02,        //   Input (Data, Variable, Absolute)
    0x95, 0x05,        //   Report Count (5)
    0x81, 0x03,        //   Input (Constant) - Padding
    0x05, 0x01,        //   Usage Page (Generic Desktop)
    0x09, 0x30,        //   Usage (X)
    0x15, 0x00,        //   Logical Minimum (0)
    0x26, 0xFF, 0x7F,  //   Logical Maximum (32767)
    0x75, 0x10,        //   Report Size (16)
    0x95, 0x01,        //   Report Count (1)
    0x81, 0x02,        //   Input (Data, Variable, Absolute)
    0x09, 0x31,        //   Usage (Y)
    0x81, 0x02,        //   Input (Data, Variable, Absolute)
    0xC0               // End Collection
};

UsbHidSink::UsbHidSink()
    : started(false)
    , keyboardLeds(0)
    , relativeButtons(0)
{
}

void UsbHidSink::begin()
{
    if (started) {
        return;
    }
    if (!USBHID::addDevice(this, sizeof(reportDescriptor))) {
        DBGPRINTLN("[USB] HID report descriptor rejected");
        return;
    }
    hid.begin();
    USB.begin();
    started = true;
    DBGPRINTLN("[USB] HID composite device started");
}

uint16_t UsbHidSink::_onGetDescriptor(uint8_t* buffer)
{
    memcpy(buffer, reportDescriptor, sizeof(reportDescriptor));
    return sizeof(reportDescriptor);
}

void UsbHidSink::_onOutput(uint8_t report_id, const uint8_t* buffer, uint16_t len)
{
    if (report_id == USB_REPORT_ID_KEYBOARD && len >= 1) {
        keyboardLeds = buffer[0];
    }
}

bool UsbHidSink::send(uint8_t reportId, const void* data, uint16_t length)
{
    if (!started || !hid.ready()) {
        return false;
    }
    return hid.SendReport(reportId, data, length, USB_REPORT_TIMEOUT_MS);
}

bool UsbHidSink::isReady()
{
    return started && hid.ready();
}

// ============================================================================
// Reports
// ============================================================================

bool UsbHidSink::sendKeyboardReport(uint8_t modifier, const uint8_t keys[HID_KEY_SLOTS])
{
    uint8_t report[2 + HID_KEY_SLOTS];
    report[0] = modifier;
    report[1] = 0;
    memcpy(&report[2], keys, HID_KEY_SLOTS);
    return send(USB_REPORT_ID_KEYBOARD, report, sizeof(report));
}

bool UsbHidSink::sendMouseReport(uint8_t buttons, int8_t dx, int8_t dy, int8_t scroll)
{
    uint8_t report[4];
    report[0] = buttons & HID_MOUSE_BUTTON_MASK;
    report[1] = (uint8_t)dx;
    report[2] = (uint8_t)dy;
    report[3] = (uint8_t)scroll;

    bool ok = send(USB_REPORT_ID_MOUSE, report, sizeof(report));
    if (ok) {
        relativeButtons = report[0];
    }
    return ok;
}

bool UsbHidSink::sendAbsoluteMouseReport(uint8_t buttons, uint16_t x, uint16_t y, int8_t scroll)
{
    uint8_t pen = PEN_IN_RANGE;
    if (buttons & HID_MOUSE_LEFT) pen |= PEN_TIP;
    if (buttons & HID_MOUSE_RIGHT) pen |= PEN_BARREL;

    uint8_t report[5];
    report[0] = pen;
    report[1] = (uint8_t)(x & 0xFF);
    report[2] = (uint8_t)(x >> 8);
    report[3] = (uint8_t)(y & 0xFF);
    report[4] = (uint8_t)(y >> 8);

    if (!send(USB_REPORT_ID_DIGITIZER, report, sizeof(report))) {
        return false;
    }

    // Middle button and wheel only exist on the relative mouse
    uint8_t middle = buttons & HID_MOUSE_MIDDLE;
    if (scroll != 0 || middle != (relativeButtons & HID_MOUSE_MIDDLE)) {
        return sendMouseReport(middle, 0, 0, scroll);
    }
    return true;
}

bool UsbHidSink::sendConsumerReport(uint16_t usage)
{
    uint8_t report[2];
    report[0] = (uint8_t)(usage & 0xFF);
    report[1] = (uint8_t)(usage >> 8);
    return send(USB_REPORT_ID_CONSUMER, report, sizeof(report));
}

bool UsbHidSink::wakeHost()
{
    if (!started) {
        return false;
    }

    if (tud_suspended()) {
        DBGPRINTLN("[USB] Bus suspended, requesting remote wakeup");
        if (!tud_remote_wakeup()) {
            DBGPRINTLN("[USB] Host has remote wakeup disabled");
        }
    }
    return true;
}
