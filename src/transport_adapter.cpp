/**
 * @file transport_adapter.cpp
 * @brief Session ownership and outbound queue implementation
 */

#include "transport_adapter.h"
#include "debug.h"

TransportAdapter::TransportAdapter(LinkChannel& channel, Link& link)
    : channel(channel)
    , link(link)
    , listener(nullptr)
    , txHead(0)
    , txCount(0)
    , packetsSent(0)
    , sendFailures(0)
    , busyRetries(0)
    , queueFullDrops(0)
    , rejectedConnections(0)
{
    session.connected = false;
    session.peerId = 0;
    session.mtu = RELAY_BLE_DEFAULT_MTU;
}

void TransportAdapter::resetStats()
{
    packetsSent = 0;
    sendFailures = 0;
    busyRetries = 0;
    queueFullDrops = 0;
    rejectedConnections = 0;
}

uint16_t TransportAdapter::getFragmentSize() const
{
    if (session.mtu <= RELAY_ATT_OVERHEAD) {
        return 1;
    }
    return session.mtu - RELAY_ATT_OVERHEAD;
}

// ============================================================================
// Inbound
// ============================================================================

void TransportAdapter::poll()
{
    LinkEvent event;
    while (channel.pop(event)) {
        handleEvent(event);
    }
}

void TransportAdapter::handleEvent(const LinkEvent& event)
{
    switch (event.type) {
        case LINK_EVENT_DATA:
            if (!session.connected || event.peerId != session.peerId) {
                DBGPRINTF("[LINK] Ignoring %u bytes from peer %u\n",
                          (unsigned)event.length, (unsigned)event.peerId);
                break;
            }
            if (listener) {
                listener->onLinkData(event.data, event.length);
            }
            break;

        case LINK_EVENT_CONNECT:
            if (session.connected) {
                // Existing control is never replaced
                rejectedConnections++;
                DBGPRINTF("[LINK] Rejecting peer %u, peer %u is connected\n",
                          (unsigned)event.peerId, (unsigned)session.peerId);
                link.disconnect(event.peerId);
                break;
            }
            session.connected = true;
            session.peerId = event.peerId;
            session.mtu = event.mtu > 0 ? event.mtu : RELAY_BLE_DEFAULT_MTU;
            DBGPRINTF("[LINK] Connected peer %u (mtu %u)\n",
                      (unsigned)session.peerId, (unsigned)session.mtu);
            if (listener) {
                listener->onLinkConnected(session);
            }
            break;

        case LINK_EVENT_MTU:
            if (session.connected && event.peerId == session.peerId && event.mtu > 0) {
                session.mtu = event.mtu;
                DBGPRINTF("[LINK] MTU %u\n", (unsigned)session.mtu);
            }
            break;

        case LINK_EVENT_DISCONNECT:
            if (!session.connected || event.peerId != session.peerId) {
                break;
            }
            DBGPRINTF("[LINK] Disconnected peer %u\n", (unsigned)session.peerId);
            session.connected = false;
            failAll(SEND_DISCONNECTED);
            if (listener) {
                listener->onLinkDisconnected(session);
            }
            session.mtu = RELAY_BLE_DEFAULT_MTU;
            break;
    }
}

// ============================================================================
// Outbound
// ============================================================================

bool TransportAdapter::send(uint8_t command, const uint8_t* payload, size_t payloadLen,
                            SendCallback callback, void* context)
{
    if (!session.connected) {
        DBGPRINTF("[LINK] Not connected, dropping cmd 0x%02X\n", command);
        return false;
    }

    if (txCount >= RELAY_TX_QUEUE_DEPTH) {
        queueFullDrops++;
        DBGPRINTF("[LINK] TX queue full, dropping cmd 0x%02X\n", command);
        return false;
    }

    uint8_t index = (uint8_t)((txHead + txCount) % RELAY_TX_QUEUE_DEPTH);
    OutboundPacket& packet = txQueue[index];

    size_t length = relay_build_packet(command, payload, payloadLen,
                                       packet.frame, sizeof(packet.frame));
    if (length == 0) {
        DBGPRINTF("[LINK] Payload too large for cmd 0x%02X\n", command);
        return false;
    }

    packet.length = (uint16_t)length;
    packet.offset = 0;
    packet.callback = callback;
    packet.context = context;
    txCount++;
    return true;
}

void TransportAdapter::pump()
{
    while (session.connected && txCount > 0) {
        OutboundPacket& packet = txQueue[txHead];

        uint16_t remaining = packet.length - packet.offset;
        uint16_t fragment = getFragmentSize();
        if (fragment > remaining) {
            fragment = remaining;
        }

        LinkWriteResult result = link.write(session.peerId, &packet.frame[packet.offset], fragment);
        if (result == LINK_BUSY) {
            busyRetries++;
            return;
        }

        if (result == LINK_FAILED) {
            sendFailures++;
            DBGPRINTF("[LINK] Write failed, dropping cmd 0x%02X\n", packet.frame[3]);
            completeHead(SEND_FAILED);
            continue;
        }

        packet.offset += fragment;
        if (packet.offset >= packet.length) {
            packetsSent++;
            completeHead(SEND_OK);
        }
    }
}

void TransportAdapter::completeHead(SendResult result)
{
    OutboundPacket& packet = txQueue[txHead];
    SendCallback callback = packet.callback;
    void* context = packet.context;

    // Pop before calling out so a callback may queue a new packet
    txHead = (uint8_t)((txHead + 1) % RELAY_TX_QUEUE_DEPTH);
    txCount--;

    if (callback) {
        callback(result, context);
    }
}

void TransportAdapter::failAll(SendResult result)
{
    uint8_t pending = txCount;
    if (pending > 0) {
        DBGPRINTF("[LINK] Failing %u queued packets\n", (unsigned)pending);
    }
    for (uint8_t i = 0; i < pending; i++) {
        completeHead(result);
    }
}
