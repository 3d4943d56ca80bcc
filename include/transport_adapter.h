/**
 * @file transport_adapter.h
 * @brief Session ownership and ordered, fragmented outbound delivery
 *
 * Inbound: drains the LinkChannel on the loop task and forwards data and
 * session changes to a TransportListener.
 *
 * Outbound: whole packets wait in a FIFO. Only the head packet is in flight;
 * it is cut into (mtu - 3) byte writes. A busy link keeps the write for the
 * next pump(), a failed write fails the packet and moves on. Every queued
 * packet completes exactly once.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include "bridge_config.h"
#include "link_channel.h"
#include "relay_protocol.h"

enum LinkWriteResult {
    LINK_OK,
    LINK_BUSY,      // Nothing written, try again later
    LINK_FAILED
};

enum SendResult {
    SEND_OK,
    SEND_FAILED,
    SEND_DISCONNECTED
};

/**
 * Concrete transport used for outbound writes
 */
class Link {
public:
    virtual ~Link() {}

    /**
     * Write one fragment, at most (mtu - 3) bytes
     */
    virtual LinkWriteResult write(uint16_t peerId, const uint8_t* data, size_t length) = 0;

    /**
     * Drop a peer (used to turn away a second connection)
     */
    virtual void disconnect(uint16_t peerId) = 0;
};

struct Session {
    bool connected;
    uint16_t peerId;
    uint16_t mtu;
};

/**
 * Receives inbound traffic on the loop task
 */
class TransportListener {
public:
    virtual ~TransportListener() {}
    virtual void onLinkData(const uint8_t* data, size_t length) = 0;
    virtual void onLinkConnected(const Session& session) = 0;
    virtual void onLinkDisconnected(const Session& session) = 0;
};

/**
 * Completion callback for an outbound packet
 * @param result How the packet ended
 * @param context Opaque pointer given to send()
 */
typedef void (*SendCallback)(SendResult result, void* context);

class TransportAdapter {
public:
    TransportAdapter(LinkChannel& channel, Link& link);

    void setListener(TransportListener* listener) { this->listener = listener; }

    /**
     * Drain pending link events
     * Call from the loop task only.
     */
    void poll();

    /**
     * Encode and queue a packet
     * @param callback Optional, invoked exactly once when the packet completes
     * @return false if disconnected, the queue is full or the payload too large.
     *         The callback is not invoked in that case.
     */
    bool send(uint8_t command, const uint8_t* payload, size_t payloadLen,
              SendCallback callback = nullptr, void* context = nullptr);

    /**
     * Push queued packets to the link until it is busy or the queue is empty
     */
    void pump();

    const Session& getSession() const { return session; }
    bool isConnected() const { return session.connected; }
    uint16_t getFragmentSize() const;
    uint8_t getQueuedCount() const { return txCount; }

    /**
     * Get statistics
     */
    uint32_t getPacketsSent() const { return packetsSent; }
    uint32_t getSendFailures() const { return sendFailures; }
    uint32_t getBusyRetries() const { return busyRetries; }
    uint32_t getQueueFullDrops() const { return queueFullDrops; }
    uint32_t getRejectedConnections() const { return rejectedConnections; }

    /**
     * Reset statistics
     */
    void resetStats();

private:
    struct OutboundPacket {
        uint8_t frame[RELAY_MAX_PACKET_SIZE];
        uint16_t length;
        uint16_t offset;    // Bytes already accepted by the link
        SendCallback callback;
        void* context;
    };

    LinkChannel& channel;
    Link& link;
    TransportListener* listener;
    Session session;

    OutboundPacket txQueue[RELAY_TX_QUEUE_DEPTH];
    uint8_t txHead;
    uint8_t txCount;

    uint32_t packetsSent;
    uint32_t sendFailures;
    uint32_t busyRetries;
    uint32_t queueFullDrops;
    uint32_t rejectedConnections;

    void handleEvent(const LinkEvent& event);
    void completeHead(SendResult result);
    void failAll(SendResult result);
};
