/**
 * @file mouse_state.cpp
 * @brief Mouse state tracking implementation
 */

#include "mouse_state.h"
#include "debug.h"

MouseUpdate MouseUpdate::makeRelative(uint8_t buttons, int8_t dx, int8_t dy, int8_t scroll)
{
    MouseUpdate update;
    update.mode = MOUSE_MODE_RELATIVE;
    update.buttons = buttons;
    update.scroll = scroll;
    update.relative.dx = dx;
    update.relative.dy = dy;
    return update;
}

MouseUpdate MouseUpdate::makeAbsolute(uint8_t buttons, uint16_t x, uint16_t y, int8_t scroll)
{
    MouseUpdate update;
    update.mode = MOUSE_MODE_ABSOLUTE;
    update.buttons = buttons;
    update.scroll = scroll;
    update.absolute.x = x;
    update.absolute.y = y;
    return update;
}

MouseState::MouseState(HidSink& sink)
    : sink(sink)
    , heldButtons(0)
    , lastMode(MOUSE_MODE_RELATIVE)
    , hasAbsolutePosition(false)
    , lastX(0)
    , lastY(0)
    , reportsSent(0)
    , sinkFailures(0)
{
}

void MouseState::resetStats()
{
    reportsSent = 0;
    sinkFailures = 0;
}

void MouseState::checkResult(bool ok)
{
    reportsSent++;
    if (!ok) {
        sinkFailures++;
        DBGPRINTF("[MOUSE] Report rejected (buttons=0x%02X)\n", heldButtons);
    }
}

void MouseState::emitRelative(int8_t dx, int8_t dy, int8_t scroll)
{
    checkResult(sink.sendMouseReport(heldButtons, dx, dy, scroll));
}

void MouseState::emitAbsolute(uint16_t x, uint16_t y, int8_t scroll)
{
    checkResult(sink.sendAbsoluteMouseReport(heldButtons, x, y, scroll));
}

uint8_t MouseState::apply(const MouseUpdate& update)
{
    uint8_t events = 0;
    uint8_t buttons = update.buttons & HID_MOUSE_BUTTON_MASK;
    int8_t scroll = clampDelta(update.scroll);

    if (update.mode == MOUSE_MODE_RELATIVE) {
        int8_t dx = clampDelta(update.relative.dx);
        int8_t dy = clampDelta(update.relative.dy);

        for (uint8_t bit = 0; bit < 3; bit++) {
            uint8_t mask = (uint8_t)(1 << bit);
            if ((heldButtons & mask) != (buttons & mask)) {
                heldButtons ^= mask;
                emitRelative(0, 0, 0);
                events++;
            }
        }

        if (dx != 0 || dy != 0 || scroll != 0) {
            emitRelative(dx, dy, scroll);
            events++;
        }
    } else {
        uint16_t x = clampPosition(update.absolute.x);
        uint16_t y = clampPosition(update.absolute.y);

        // Button reports land where the pointer is going
        for (uint8_t bit = 0; bit < 3; bit++) {
            uint8_t mask = (uint8_t)(1 << bit);
            if ((heldButtons & mask) != (buttons & mask)) {
                heldButtons ^= mask;
                emitAbsolute(x, y, 0);
                events++;
            }
        }

        bool moved = !hasAbsolutePosition || x != lastX || y != lastY;
        if (moved || scroll != 0) {
            emitAbsolute(x, y, scroll);
            events++;
        }

        hasAbsolutePosition = true;
        lastX = x;
        lastY = y;
    }

    lastMode = update.mode;
    return events;
}

uint8_t MouseState::releaseAll()
{
    uint8_t events = 0;

    for (uint8_t bit = 0; bit < 3; bit++) {
        uint8_t mask = (uint8_t)(1 << bit);
        if (heldButtons & mask) {
            heldButtons &= (uint8_t)~mask;
            if (lastMode == MOUSE_MODE_ABSOLUTE) {
                emitAbsolute(lastX, lastY, 0);
            } else {
                emitRelative(0, 0, 0);
            }
            events++;
        }
    }

    // The next controller starts from an unknown pointer position
    hasAbsolutePosition = false;

    if (events > 0) {
        DBGPRINTF("[MOUSE] Released all (%u buttons)\n", events);
    }
    return events;
}
