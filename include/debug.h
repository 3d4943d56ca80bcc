#pragma once

#include <Arduino.h>

// ============================================================================
// Debug Output Control
// ============================================================================

/**
 * Log output on the Arduino Serial port (USB CDC on the S3).
 *
 * Lines start with a subsystem tag so a capture can be filtered:
 *   [PROTO] [KBD] [MOUSE] [MEDIA] [CTRL] [LINK] [BLE] [USB] [M5] [RELAY]
 *
 *   DBGPRINTLN("[BLE] Advertising");
 *   DBGPRINTF("[KBD] mod=0x%02X\n", m);
 *   DBGHEX("[PROTO] rx", buf, len);
 *
 * DEBUG_ENABLED=0 removes every call at compile time.
 * Debug::setEnabled(false) mutes output at runtime.
 *
 * Nothing per-report is logged: a mouse stream would saturate the port and
 * stall the loop. Log drops, failures and state transitions only.
 */

class Debug
{
public:
    static void setEnabled(bool enabled) { debugEnabled = enabled; }
    static bool isEnabled() { return debugEnabled; }

    /**
     * One-line hex dump, e.g. "[PROTO] rx (7): 57 AB 00 01 00 03 06"
     * Long buffers are cut off with "...".
     */
    static void hexDump(const char* label, const uint8_t* data, size_t length);

private:
    static bool debugEnabled;
};

#ifndef DEBUG_ENABLED
#define DEBUG_ENABLED 1
#endif

#if DEBUG_ENABLED

// Runs stmt only while output is enabled
#define DBG_WHEN_ENABLED(stmt)  \
    do                          \
    {                           \
        if (Debug::isEnabled()) \
        {                       \
            stmt;               \
        }                       \
    } while (0)

#define DBGPRINT(...) DBG_WHEN_ENABLED(Serial.print(__VA_ARGS__))
#define DBGPRINTLN(...) DBG_WHEN_ENABLED(Serial.println(__VA_ARGS__))
#define DBGPRINTF(...) DBG_WHEN_ENABLED(Serial.printf(__VA_ARGS__))
#define DBGHEX(label, data, len) DBG_WHEN_ENABLED(Debug::hexDump(label, data, len))

#else

#define DBGPRINT(...) do {} while (0)
#define DBGPRINTLN(...) do {} while (0)
#define DBGPRINTF(...) do {} while (0)
#define DBGHEX(label, data, len) do {} while (0)

#endif // DEBUG_ENABLED
