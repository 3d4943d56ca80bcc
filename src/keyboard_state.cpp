/**
 * @file keyboard_state.cpp
 * @brief Keyboard state tracking implementation
 */

#include "keyboard_state.h"
#include "debug.h"
#include <string.h>

KeyboardState::KeyboardState(HidSink& sink)
    : sink(sink)
    , modifierMask(0)
    , reportsSent(0)
    , sinkFailures(0)
    , phantomReports(0)
{
    memset(keySlots, 0, sizeof(keySlots));
}

void KeyboardState::resetStats()
{
    reportsSent = 0;
    sinkFailures = 0;
    phantomReports = 0;
}

uint8_t KeyboardState::getHeldKeyCount() const
{
    uint8_t count = 0;
    for (uint8_t i = 0; i < HID_KEY_SLOTS; i++) {
        if (keySlots[i] != 0) count++;
    }
    return count;
}

bool KeyboardState::isKeyHeld(uint8_t code) const
{
    if (code == 0) return false;
    for (uint8_t i = 0; i < HID_KEY_SLOTS; i++) {
        if (keySlots[i] == code) return true;
    }
    return false;
}

bool KeyboardState::isPhantomSnapshot(const uint8_t keys[HID_KEY_SLOTS])
{
    for (uint8_t i = 0; i < HID_KEY_SLOTS; i++) {
        if (keys[i] >= HID_KEY_ERROR_ROLLOVER && keys[i] <= HID_KEY_ERROR_UNDEFINED) {
            return true;
        }
    }
    return false;
}

void KeyboardState::emitReport()
{
    reportsSent++;
    if (!sink.sendKeyboardReport(modifierMask, keySlots)) {
        // Keep the model moving; resync() repairs the host side later
        sinkFailures++;
        DBGPRINTF("[KBD] Report rejected (mod=0x%02X)\n", modifierMask);
    }
}

uint8_t KeyboardState::apply(uint8_t modifier, const uint8_t keys[HID_KEY_SLOTS])
{
    uint8_t events = 0;

    // 1. Modifiers, lowest bit first
    for (uint8_t bit = 0; bit < 8; bit++) {
        uint8_t mask = (uint8_t)(1 << bit);
        if ((modifierMask & mask) != (modifier & mask)) {
            modifierMask ^= mask;
            emitReport();
            events++;
        }
    }

    if (isPhantomSnapshot(keys)) {
        phantomReports++;
        DBGPRINTLN("[KBD] Rollover report, keeping held keys");
        return events;
    }

    // Distinct non-zero codes in snapshot order
    uint8_t wanted[HID_KEY_SLOTS];
    uint8_t wantedCount = 0;
    for (uint8_t i = 0; i < HID_KEY_SLOTS; i++) {
        uint8_t code = keys[i];
        if (code == 0) continue;

        bool duplicate = false;
        for (uint8_t j = 0; j < wantedCount; j++) {
            if (wanted[j] == code) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            wanted[wantedCount++] = code;
        }
    }

    // 2. Releases
    for (uint8_t slot = 0; slot < HID_KEY_SLOTS; slot++) {
        uint8_t code = keySlots[slot];
        if (code == 0) continue;

        bool stillHeld = false;
        for (uint8_t j = 0; j < wantedCount; j++) {
            if (wanted[j] == code) {
                stillHeld = true;
                break;
            }
        }
        if (!stillHeld) {
            keySlots[slot] = 0;
            emitReport();
            events++;
        }
    }

    // 3. Presses
    for (uint8_t j = 0; j < wantedCount; j++) {
        if (isKeyHeld(wanted[j])) continue;

        for (uint8_t slot = 0; slot < HID_KEY_SLOTS; slot++) {
            if (keySlots[slot] == 0) {
                keySlots[slot] = wanted[j];
                emitReport();
                events++;
                break;
            }
        }
    }

    return events;
}

uint8_t KeyboardState::releaseAll()
{
    static const uint8_t noKeys[HID_KEY_SLOTS] = {0};
    uint8_t events = apply(0, noKeys);
    if (events > 0) {
        DBGPRINTF("[KBD] Released all (%u events)\n", events);
    }
    return events;
}

bool KeyboardState::resync()
{
    reportsSent++;
    if (!sink.sendKeyboardReport(modifierMask, keySlots)) {
        sinkFailures++;
        DBGPRINTLN("[KBD] Resync report rejected");
        return false;
    }
    return true;
}
