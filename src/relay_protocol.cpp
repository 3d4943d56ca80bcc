/**
 * @file relay_protocol.cpp
 * @brief RelayKVM packet codec implementation
 */

#include "relay_protocol.h"
#include <string.h>

uint8_t relay_checksum(const uint8_t* data, size_t len)
{
    uint8_t sum = 0;
    while (len--) {
        sum = (uint8_t)(sum + *data++);
    }
    return sum;
}

size_t relay_build_packet(uint8_t command, const uint8_t* payload, size_t payloadLen,
                          uint8_t* frame, size_t frameCapacity)
{
    if (payloadLen > RELAY_MAX_PAYLOAD) return 0;

    size_t total = RELAY_OVERHEAD + payloadLen;
    if (total > frameCapacity) return 0;

    frame[0] = RELAY_HEAD1;
    frame[1] = RELAY_HEAD2;
    frame[2] = RELAY_ADDRESS;
    frame[3] = command;
    frame[4] = (uint8_t)payloadLen;
    if (payloadLen > 0) {
        memcpy(&frame[RELAY_HEADER_SIZE], payload, payloadLen);
    }
    frame[total - 1] = relay_checksum(frame, total - 1);

    return total;
}

RelayDecodeResult relay_decode_packet(const uint8_t* data, size_t len, RelayPacket& packet)
{
    if (len < RELAY_OVERHEAD) {
        return RELAY_DECODE_TOO_SHORT;
    }

    if (data[0] != RELAY_HEAD1 || data[1] != RELAY_HEAD2) {
        return RELAY_DECODE_BAD_HEADER;
    }

    uint8_t payloadLen = data[4];
    size_t total = RELAY_OVERHEAD + payloadLen;
    if (len < total) {
        return RELAY_DECODE_LENGTH_MISMATCH;
    }

    // Trailing bytes beyond the declared length are not part of this packet
    if (relay_checksum(data, total - 1) != data[total - 1]) {
        return RELAY_DECODE_CHECKSUM_MISMATCH;
    }

    packet.address = data[2];
    packet.command = data[3];
    packet.length = payloadLen;
    packet.payload = &data[RELAY_HEADER_SIZE];
    return RELAY_DECODE_OK;
}

const char* relay_decode_result_name(RelayDecodeResult result)
{
    switch (result) {
        case RELAY_DECODE_OK:                return "ok";
        case RELAY_DECODE_TOO_SHORT:         return "too short";
        case RELAY_DECODE_BAD_HEADER:        return "bad header";
        case RELAY_DECODE_LENGTH_MISMATCH:   return "length mismatch";
        case RELAY_DECODE_CHECKSUM_MISMATCH: return "checksum mismatch";
    }
    return "unknown";
}
