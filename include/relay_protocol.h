/**
 * @file relay_protocol.h
 * @brief RelayKVM packet format, command codes and codec
 *
 * Packet layout (NanoKVM style framing):
 *   [HEAD1][HEAD2][ADDR][CMD][LEN][PAYLOAD x LEN][SUM]
 * SUM is the sum of every preceding byte modulo 256. It only hints at
 * corruption; a mismatching packet is dropped, never treated as fatal.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>

// ============================================================================
// Framing Constants
// ============================================================================

#define RELAY_HEAD1 0x57
#define RELAY_HEAD2 0xAB
#define RELAY_ADDRESS 0x00

#define RELAY_HEADER_SIZE 5       // HEAD1 HEAD2 ADDR CMD LEN
#define RELAY_OVERHEAD 6          // Header + checksum
#define RELAY_MAX_PAYLOAD 255
#define RELAY_MAX_PACKET_SIZE (RELAY_OVERHEAD + RELAY_MAX_PAYLOAD)

// Version reported in the GET_INFO reply
#define RELAY_PROTOCOL_VERSION 0x01

// ============================================================================
// Command Codes
// ============================================================================

// Input commands
#define RELAY_CMD_GET_INFO 0x01
#define RELAY_CMD_KB_GENERAL 0x02
#define RELAY_CMD_KB_MEDIA 0x03
#define RELAY_CMD_MS_ABSOLUTE 0x04
#define RELAY_CMD_MS_RELATIVE 0x05

// Control commands (0x80+)
#define RELAY_CMD_RELEASE_CAPTURE 0x80   // Outbound only
#define RELAY_CMD_DISPLAY_BRIGHTNESS 0x81
#define RELAY_CMD_DISPLAY_TIMEOUT 0x82
#define RELAY_CMD_USB_WAKE 0x83
#define RELAY_CMD_USB_RECOVERY 0x84
#define RELAY_CMD_DEVICE_RESET 0x85

// Minimum payload sizes
#define RELAY_KB_GENERAL_LEN 8      // modifier, reserved, keys[6]
#define RELAY_KB_MEDIA_LEN 2        // usage LE16
#define RELAY_MS_RELATIVE_LEN 5     // mode, buttons, dx, dy, scroll
#define RELAY_MS_ABSOLUTE_LEN 7     // mode, buttons, x LE16, y LE16, scroll

// Mouse mode indicator (first payload byte of 0x04 / 0x05)
#define RELAY_MOUSE_MODE_RELATIVE 0x01
#define RELAY_MOUSE_MODE_ABSOLUTE 0x02

// Display brightness wire values
#define RELAY_BRIGHTNESS_OFF 0
#define RELAY_BRIGHTNESS_ON 255

// USB recovery notification status
#define RELAY_RECOVERY_SINK_OK 0x00
#define RELAY_RECOVERY_SINK_UNRESPONSIVE 0x01

// ============================================================================
// Codec
// ============================================================================

enum RelayDecodeResult {
    RELAY_DECODE_OK = 0,
    RELAY_DECODE_TOO_SHORT,
    RELAY_DECODE_BAD_HEADER,
    RELAY_DECODE_LENGTH_MISMATCH,
    RELAY_DECODE_CHECKSUM_MISMATCH
};

/**
 * A decoded packet. payload points into the buffer passed to
 * relay_decode_packet() and is only valid while that buffer is.
 */
struct RelayPacket {
    uint8_t address;
    uint8_t command;
    uint8_t length;
    const uint8_t* payload;
};

/**
 * Sum of a byte range modulo 256
 */
uint8_t relay_checksum(const uint8_t* data, size_t len);

/**
 * Build a packet into frame
 * @param command Command code
 * @param payload Payload bytes (may be nullptr when payloadLen is 0)
 * @param payloadLen Payload size, at most RELAY_MAX_PAYLOAD
 * @param frame Output buffer
 * @param frameCapacity Size of the output buffer
 * @return Total packet length, or 0 if the payload or buffer is too large
 */
size_t relay_build_packet(uint8_t command, const uint8_t* payload, size_t payloadLen,
                          uint8_t* frame, size_t frameCapacity);

/**
 * Validate and decode one whole packet
 * @param data Packet bytes, starting at HEAD1
 * @param len Number of bytes available
 * @param packet Filled in on RELAY_DECODE_OK
 */
RelayDecodeResult relay_decode_packet(const uint8_t* data, size_t len, RelayPacket& packet);

/**
 * Short name of a decode result for log output
 */
const char* relay_decode_result_name(RelayDecodeResult result);

inline uint16_t relay_read_le16(const uint8_t* data)
{
    return (uint16_t)(data[0] | ((uint16_t)data[1] << 8));
}

inline void relay_write_le16(uint16_t value, uint8_t* data)
{
    data[0] = (uint8_t)(value & 0xFF);
    data[1] = (uint8_t)(value >> 8);
}
