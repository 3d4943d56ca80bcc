/**
 * @file debug.cpp
 * @brief Debug output state and helpers
 */

#include "debug.h"

bool Debug::debugEnabled = true;

// Bytes shown by hexDump() before truncating
#define MAX_DUMP_BYTES 32

void Debug::hexDump(const char* label, const uint8_t* data, size_t length)
{
    Serial.printf("%s (%u):", label, (unsigned)length);
    size_t shown = length < MAX_DUMP_BYTES ? length : MAX_DUMP_BYTES;
    for (size_t i = 0; i < shown; i++) {
        Serial.printf(" %02X", data[i]);
    }
    if (shown < length) {
        Serial.printf(" ...");
    }
    Serial.printf("\n");
}
