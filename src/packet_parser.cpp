/**
 * @file packet_parser.cpp
 * @brief RelayKVM packet reassembly implementation
 */

#include "packet_parser.h"
#include "debug.h"

PacketParser::PacketParser()
    : state(WAIT_HEAD1)
    , rxBufferIndex(0)
    , rxPacketLength(0)
    , packetCallback(nullptr)
    , packetContext(nullptr)
    , packetsReceived(0)
    , checksumErrors(0)
    , bytesDiscarded(0)
{
}

void PacketParser::resetStats()
{
    packetsReceived = 0;
    checksumErrors = 0;
    bytesDiscarded = 0;
}

void PacketParser::reset()
{
    if (state != WAIT_HEAD1) {
        DBGPRINTF("[PROTO] Dropping partial packet (%u bytes)\n", (unsigned)rxBufferIndex);
        bytesDiscarded += rxBufferIndex;
    }
    state = WAIT_HEAD1;
    rxBufferIndex = 0;
    rxPacketLength = 0;
}

void PacketParser::processBytes(const uint8_t* data, size_t length)
{
    for (size_t i = 0; i < length; i++) {
        processByte(data[i]);
    }
}

void PacketParser::processByte(uint8_t byte)
{
    switch (state) {
        case WAIT_HEAD1:
            if (byte == RELAY_HEAD1) {
                rxBuffer[0] = byte;
                rxBufferIndex = 1;
                state = WAIT_HEAD2;
            } else {
                bytesDiscarded++;
            }
            break;

        case WAIT_HEAD2:
            if (byte == RELAY_HEAD2) {
                rxBuffer[rxBufferIndex++] = byte;
                state = WAIT_ADDRESS;
            } else if (byte == RELAY_HEAD1) {
                // Previous HEAD1 was noise, this one may start the packet
                bytesDiscarded++;
            } else {
                bytesDiscarded += 2;
                rxBufferIndex = 0;
                state = WAIT_HEAD1;
            }
            break;

        case WAIT_ADDRESS:
            rxBuffer[rxBufferIndex++] = byte;
            state = WAIT_COMMAND;
            break;

        case WAIT_COMMAND:
            rxBuffer[rxBufferIndex++] = byte;
            state = WAIT_LENGTH;
            break;

        case WAIT_LENGTH:
            rxBuffer[rxBufferIndex++] = byte;
            rxPacketLength = RELAY_OVERHEAD + byte;
            state = (byte == 0) ? WAIT_CHECKSUM : RECEIVE_PAYLOAD;
            break;

        case RECEIVE_PAYLOAD:
            rxBuffer[rxBufferIndex++] = byte;
            if (rxBufferIndex >= rxPacketLength - 1) {
                state = WAIT_CHECKSUM;
            }
            break;

        case WAIT_CHECKSUM:
            rxBuffer[rxBufferIndex++] = byte;
            processPacket();
            break;
    }
}

void PacketParser::processPacket()
{
    RelayPacket packet;
    RelayDecodeResult result = relay_decode_packet(rxBuffer, rxBufferIndex, packet);
    uint16_t unitLength = rxBufferIndex;

    state = WAIT_HEAD1;
    rxBufferIndex = 0;

    if (result != RELAY_DECODE_OK) {
        // The whole declared unit goes, payload included; hunting resumes
        // with the byte after its checksum
        checksumErrors++;
        bytesDiscarded += unitLength;
        DBGPRINTF("[PROTO] Dropped packet cmd=0x%02X len=%u: %s\n",
                  rxBuffer[3], (unsigned)rxBuffer[4], relay_decode_result_name(result));
        DBGHEX("[PROTO] dropped", rxBuffer, unitLength);
        return;
    }

    packetsReceived++;
    if (packetCallback) {
        packetCallback(packet, packetContext);
    }
}
