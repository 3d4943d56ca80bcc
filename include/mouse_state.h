/**
 * @file mouse_state.h
 * @brief Mouse button tracking with relative and absolute pointer modes
 *
 * Button changes and motion are reported separately: every changed button
 * bit gets its own report without motion, then motion or scroll follows in
 * one report carrying the final button state.
 */

#pragma once

#include <stdint.h>
#include "hid_sink.h"

enum MouseMode {
    MOUSE_MODE_RELATIVE,
    MOUSE_MODE_ABSOLUTE
};

/**
 * One decoded mouse packet. mode selects the active member of the union.
 */
struct MouseUpdate {
    struct Relative {
        int8_t dx;
        int8_t dy;
    };

    struct Absolute {
        uint16_t x;
        uint16_t y;
    };

    MouseMode mode;
    uint8_t buttons;
    int8_t scroll;
    union {
        Relative relative;
        Absolute absolute;
    };

    static MouseUpdate makeRelative(uint8_t buttons, int8_t dx, int8_t dy, int8_t scroll);
    static MouseUpdate makeAbsolute(uint8_t buttons, uint16_t x, uint16_t y, int8_t scroll);
};

class MouseState {
public:
    explicit MouseState(HidSink& sink);

    /**
     * Apply one mouse packet
     * @return Number of reports emitted
     */
    uint8_t apply(const MouseUpdate& update);

    /**
     * Release every held button with one report per button and forget the
     * last absolute position, so the next absolute packet is always sent
     * @return Number of reports emitted
     */
    uint8_t releaseAll();

    uint8_t getHeldButtons() const { return heldButtons; }
    MouseMode getLastMode() const { return lastMode; }
    uint16_t getLastX() const { return lastX; }
    uint16_t getLastY() const { return lastY; }

    /**
     * Get statistics
     */
    uint32_t getReportsSent() const { return reportsSent; }
    uint32_t getSinkFailures() const { return sinkFailures; }

    /**
     * Reset statistics
     */
    void resetStats();

    static int8_t clampDelta(int8_t value) { return value < -127 ? -127 : value; }
    static uint16_t clampPosition(uint16_t value) { return value > HID_ABS_MAX ? HID_ABS_MAX : value; }

private:
    HidSink& sink;
    uint8_t heldButtons;
    MouseMode lastMode;
    bool hasAbsolutePosition;
    uint16_t lastX;
    uint16_t lastY;

    uint32_t reportsSent;
    uint32_t sinkFailures;

    void emitRelative(int8_t dx, int8_t dy, int8_t scroll);
    void emitAbsolute(uint16_t x, uint16_t y, int8_t scroll);
    void checkResult(bool ok);
};
