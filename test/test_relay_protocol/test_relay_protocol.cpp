/**
 * @file test_relay_protocol.cpp
 * @brief Packet codec tests
 *
 * Expected frames are written out by hand so the encoder is checked
 * against the wire format rather than against itself.
 */

#include <unity.h>
#include <stdint.h>
#include <string.h>

#include "arduino_mock.h"
#include "relay_protocol.h"

static uint8_t frame[RELAY_MAX_PACKET_SIZE + 8];

void setUp(void) {
    memset(frame, 0, sizeof(frame));
}

void tearDown(void) {
}

/**
 * Test: Keyboard packet for the "a" key matches the reference bytes
 */
void test_encode_keyboard_packet(void) {
    // Arrange
    const uint8_t payload[8] = {0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00};
    // 0x57 + 0xAB + 0x00 + 0x02 + 0x08 + 0x04 = 0x110 -> 0x10
    const uint8_t expected[14] = {0x57, 0xAB, 0x00, 0x02, 0x08,
                                  0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00,
                                  0x10};

    // Act
    size_t length = relay_build_packet(RELAY_CMD_KB_GENERAL, payload, sizeof(payload),
                                       frame, sizeof(frame));

    // Assert
    TEST_ASSERT_EQUAL_UINT32(14, length);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, frame, 14);
}

/**
 * Test: Empty payload produces a 6 byte packet
 */
void test_encode_empty_payload(void) {
    size_t length = relay_build_packet(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0, frame, sizeof(frame));

    // 0x57 + 0xAB + 0x80 = 0x182 -> 0x82
    const uint8_t expected[6] = {0x57, 0xAB, 0x00, 0x80, 0x00, 0x82};
    TEST_ASSERT_EQUAL_UINT32(6, length);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, frame, 6);
}

/**
 * Test: Payload over 255 bytes and undersized buffers are refused
 */
void test_encode_rejects_oversize(void) {
    static uint8_t payload[256];
    memset(payload, 0x11, sizeof(payload));

    TEST_ASSERT_EQUAL_UINT32(0, relay_build_packet(0x02, payload, 256, frame, sizeof(frame)));
    TEST_ASSERT_EQUAL_UINT32(0, relay_build_packet(0x02, payload, 8, frame, 13));
    TEST_ASSERT_EQUAL_UINT32(261, relay_build_packet(0x02, payload, 255, frame, sizeof(frame)));
}

/**
 * Test: A valid packet decodes to its fields, payload points into the buffer
 */
void test_decode_valid_packet(void) {
    // Arrange: relative mouse, right 10, up 5
    const uint8_t data[11] = {0x57, 0xAB, 0x00, 0x05, 0x05,
                              0x01, 0x00, 0x0A, 0xFB, 0x00,
                              0x00};
    uint8_t packetBytes[11];
    memcpy(packetBytes, data, sizeof(data));
    packetBytes[10] = relay_checksum(packetBytes, 10);

    // Act
    RelayPacket packet;
    RelayDecodeResult result = relay_decode_packet(packetBytes, sizeof(packetBytes), packet);

    // Assert
    TEST_ASSERT_EQUAL(RELAY_DECODE_OK, result);
    TEST_ASSERT_EQUAL_HEX8(0x05, packet.command);
    TEST_ASSERT_EQUAL_UINT8(5, packet.length);
    TEST_ASSERT_EQUAL_PTR(&packetBytes[5], packet.payload);
    TEST_ASSERT_EQUAL_INT8(-5, (int8_t)packet.payload[3]);
}

/**
 * Test: Decode error classes
 */
void test_decode_errors(void) {
    RelayPacket packet;

    const uint8_t tooShort[5] = {0x57, 0xAB, 0x00, 0x02, 0x00};
    TEST_ASSERT_EQUAL(RELAY_DECODE_TOO_SHORT, relay_decode_packet(tooShort, 5, packet));

    const uint8_t badHeader[6] = {0x57, 0xAC, 0x00, 0x83, 0x00, 0xDD};
    TEST_ASSERT_EQUAL(RELAY_DECODE_BAD_HEADER, relay_decode_packet(badHeader, 6, packet));

    // Declares 8 payload bytes, carries 4
    const uint8_t truncated[10] = {0x57, 0xAB, 0x00, 0x02, 0x08, 0x00, 0x00, 0x04, 0x00, 0x00};
    TEST_ASSERT_EQUAL(RELAY_DECODE_LENGTH_MISMATCH, relay_decode_packet(truncated, 10, packet));

    const uint8_t badSum[6] = {0x57, 0xAB, 0x00, 0x83, 0x00, 0x00};
    TEST_ASSERT_EQUAL(RELAY_DECODE_CHECKSUM_MISMATCH, relay_decode_packet(badSum, 6, packet));
}

/**
 * Test: Any single bit flip in command or payload is caught by the checksum
 */
void test_checksum_detects_single_bit_flips(void) {
    const uint8_t payload[7] = {0x02, 0x01, 0x00, 0x40, 0x00, 0x20, 0x00};
    size_t length = relay_build_packet(RELAY_CMD_MS_ABSOLUTE, payload, sizeof(payload),
                                       frame, sizeof(frame));
    TEST_ASSERT_EQUAL_UINT32(13, length);

    uint8_t corrupted[13];
    RelayPacket packet;

    // Byte 3 is the command, bytes 5..11 the payload
    for (size_t byteIndex = 3; byteIndex < 12; byteIndex++) {
        if (byteIndex == 4) continue;  // Length flips are caught as length errors
        for (uint8_t bit = 0; bit < 8; bit++) {
            memcpy(corrupted, frame, length);
            corrupted[byteIndex] ^= (uint8_t)(1 << bit);
            TEST_ASSERT_EQUAL_MESSAGE(RELAY_DECODE_CHECKSUM_MISMATCH,
                relay_decode_packet(corrupted, length, packet),
                "Bit flip should be reported as checksum mismatch");
        }
    }
}

/**
 * Test: Encode then decode returns the command and payload for sizes 0..255
 */
void test_round_trip_all_lengths(void) {
    static uint8_t payload[RELAY_MAX_PAYLOAD];
    for (int i = 0; i < RELAY_MAX_PAYLOAD; i++) {
        payload[i] = (uint8_t)(i * 7 + 3);
    }

    for (size_t len = 0; len <= RELAY_MAX_PAYLOAD; len += 51) {
        size_t total = relay_build_packet(0x81, payload, len, frame, sizeof(frame));
        TEST_ASSERT_EQUAL_UINT32(len + RELAY_OVERHEAD, total);

        RelayPacket packet;
        TEST_ASSERT_EQUAL(RELAY_DECODE_OK, relay_decode_packet(frame, total, packet));
        TEST_ASSERT_EQUAL_HEX8(0x81, packet.command);
        TEST_ASSERT_EQUAL_UINT8(len, packet.length);
        if (len > 0) {
            TEST_ASSERT_EQUAL_HEX8_ARRAY(payload, packet.payload, len);
        }
    }
}

/**
 * Test: Little-endian helpers
 */
void test_le16_helpers(void) {
    uint8_t bytes[2];
    relay_write_le16(0x00E9, bytes);
    TEST_ASSERT_EQUAL_HEX8(0xE9, bytes[0]);
    TEST_ASSERT_EQUAL_HEX8(0x00, bytes[1]);

    const uint8_t position[2] = {0xFF, 0x7F};
    TEST_ASSERT_EQUAL_UINT16(32767, relay_read_le16(position));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_encode_keyboard_packet);
    RUN_TEST(test_encode_empty_payload);
    RUN_TEST(test_encode_rejects_oversize);
    RUN_TEST(test_decode_valid_packet);
    RUN_TEST(test_decode_errors);
    RUN_TEST(test_checksum_detects_single_bit_flips);
    RUN_TEST(test_round_trip_all_lengths);
    RUN_TEST(test_le16_helpers);
    return UNITY_END();
}
