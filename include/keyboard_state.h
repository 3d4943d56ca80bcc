/**
 * @file keyboard_state.h
 * @brief Keyboard state tracking and press/release diffing
 *
 * The wire carries a full keyboard snapshot (modifier byte + 6 key slots)
 * on every change. This class keeps the state the host currently sees and
 * turns each snapshot into the minimal sequence of single press or release
 * events, one HID report per event:
 *
 *   1. modifier bits, bit 0 to bit 7, that changed
 *   2. releases of held keys missing from the snapshot
 *   3. presses of new keys, in snapshot order
 *
 * A release frees its report slot; a press takes the lowest free slot.
 * Releases always run before presses, so a 6 slot snapshot never needs a
 * 7th slot.
 */

#pragma once

#include <stdint.h>
#include "hid_sink.h"

// HID keyboard error codes reported in every slot on rollover
#define HID_KEY_ERROR_ROLLOVER 0x01
#define HID_KEY_POST_FAIL 0x02
#define HID_KEY_ERROR_UNDEFINED 0x03

class KeyboardState {
public:
    explicit KeyboardState(HidSink& sink);

    /**
     * Move the host to a new keyboard snapshot
     * @param modifier Modifier mask, bit0 LeftCtrl .. bit7 RightGUI
     * @param keys Six key codes, 0 = empty, duplicates count once
     * @return Number of events emitted
     */
    uint8_t apply(uint8_t modifier, const uint8_t keys[HID_KEY_SLOTS]);

    /**
     * Release every held key and modifier with explicit events
     * @return Number of events emitted
     */
    uint8_t releaseAll();

    /**
     * Re-send the current state in one report regardless of changes
     * Used after the host dropped reports or the USB stack recovered.
     * @return true if the sink accepted the report
     */
    bool resync();

    uint8_t getModifiers() const { return modifierMask; }
    const uint8_t* getKeys() const { return keySlots; }
    uint8_t getHeldKeyCount() const;
    bool isKeyHeld(uint8_t code) const;

    /**
     * Get statistics
     */
    uint32_t getReportsSent() const { return reportsSent; }
    uint32_t getSinkFailures() const { return sinkFailures; }
    uint32_t getPhantomReports() const { return phantomReports; }

    /**
     * Reset statistics
     */
    void resetStats();

private:
    HidSink& sink;
    uint8_t modifierMask;
    uint8_t keySlots[HID_KEY_SLOTS];

    uint32_t reportsSent;
    uint32_t sinkFailures;
    uint32_t phantomReports;

    void emitReport();
    static bool isPhantomSnapshot(const uint8_t keys[HID_KEY_SLOTS]);
};
