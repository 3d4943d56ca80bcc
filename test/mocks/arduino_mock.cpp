/**
 * @file arduino_mock.cpp
 * @brief Host Arduino clock and Serial instance
 */

#include "arduino_mock.h"

MockSerial Serial;

// Microseconds since the test started. Kept wide so millis() wraps at
// 2^32 ms like the real core, not when micros() does.
static uint64_t nowUs = 0;

uint32_t micros() { return (uint32_t)nowUs; }
uint32_t millis() { return (uint32_t)(nowUs / 1000); }

void delay(uint32_t ms) { arduino_mock_advance_time_ms(ms); }

void arduino_mock_set_time_us(uint32_t time_us) { nowUs = time_us; }
void arduino_mock_set_time_ms(uint32_t time_ms) { nowUs = (uint64_t)time_ms * 1000; }
void arduino_mock_advance_time_us(uint32_t delta_us) { nowUs += delta_us; }
void arduino_mock_advance_time_ms(uint32_t delta_ms) { nowUs += (uint64_t)delta_ms * 1000; }
void arduino_mock_reset_time() { nowUs = 0; }
