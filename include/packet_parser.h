/**
 * @file packet_parser.h
 * @brief RelayKVM packet reassembly from a chunked byte stream
 *
 * BLE writes do not line up with packet boundaries: one write may carry
 * half a packet or several packets. The parser hunts for HEAD1/HEAD2,
 * collects exactly one packet, validates it with the codec and hands it
 * to the packet callback. A malformed packet is counted and dropped as a
 * whole unit (6 + declared length bytes); nothing inside its payload is
 * ever run. A lost fragment therefore also costs the packet whose head was
 * swallowed as payload.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include "relay_protocol.h"

/**
 * Callback type for validated packets
 * @param packet Decoded packet, valid only for the duration of the call
 * @param context Opaque pointer given to setPacketCallback()
 */
typedef void (*RelayPacketCallback)(const RelayPacket& packet, void* context);

class PacketParser {
public:
    PacketParser();

    /**
     * Process one byte from the transport
     * @param byte Received byte
     */
    void processByte(uint8_t byte);

    /**
     * Process a chunk of bytes in arrival order
     */
    void processBytes(const uint8_t* data, size_t length);

    /**
     * Set the callback receiving validated packets
     */
    void setPacketCallback(RelayPacketCallback callback, void* context)
    {
        packetCallback = callback;
        packetContext = context;
    }

    /**
     * Drop any partially received packet
     * Called on disconnect so a new session never completes an old packet.
     */
    void reset();

    /**
     * Check if a packet is partially received
     */
    bool isIdle() const { return state == WAIT_HEAD1; }

    /**
     * Get statistics
     */
    uint32_t getPacketsReceived() const { return packetsReceived; }
    uint32_t getChecksumErrors() const { return checksumErrors; }
    uint32_t getBytesDiscarded() const { return bytesDiscarded; }

    /**
     * Reset statistics
     */
    void resetStats();

private:
    enum State {
        WAIT_HEAD1,
        WAIT_HEAD2,
        WAIT_ADDRESS,
        WAIT_COMMAND,
        WAIT_LENGTH,
        RECEIVE_PAYLOAD,
        WAIT_CHECKSUM
    };

    State state;
    uint8_t rxBuffer[RELAY_MAX_PACKET_SIZE];
    uint16_t rxBufferIndex;
    uint16_t rxPacketLength;

    RelayPacketCallback packetCallback;
    void* packetContext;

    uint32_t packetsReceived;
    uint32_t checksumErrors;
    uint32_t bytesDiscarded;

    void processPacket();
};
