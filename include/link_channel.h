/**
 * @file link_channel.h
 * @brief Bounded single-producer single-consumer channel for link events
 *
 * The BLE host task is the only producer, the Arduino loop task the only
 * consumer. Data chunks, connects and disconnects travel through the same
 * ring so the consumer sees them in the order the radio delivered them.
 *
 * The last CONTROL_RESERVE slots are kept for connect/disconnect/MTU events:
 * a flood of data can fill the channel but can never make the consumer
 * miss a disconnect.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <atomic>
#include "bridge_config.h"

enum LinkEventType {
    LINK_EVENT_DATA,
    LINK_EVENT_CONNECT,
    LINK_EVENT_DISCONNECT,
    LINK_EVENT_MTU
};

struct LinkEvent {
    LinkEventType type;
    uint16_t peerId;
    uint16_t mtu;       // CONNECT and MTU events
    uint8_t length;     // DATA events
    uint8_t data[RELAY_LINK_CHUNK_SIZE];
};

class LinkChannel {
public:
    static const uint16_t CAPACITY = RELAY_LINK_CHANNEL_DEPTH;
    static const uint16_t CONTROL_RESERVE = 2;

    LinkChannel()
        : head(0)
        , tail(0)
        , rxOverflows(0)
    {
    }

    // ========================================================================
    // Producer side (BLE host task)
    // ========================================================================

    /**
     * Queue received bytes, split into chunk sized events
     * @return false if any chunk was dropped because the channel is full
     */
    bool pushData(uint16_t peerId, const uint8_t* data, size_t length)
    {
        bool complete = true;
        while (length > 0) {
            size_t chunk = length > RELAY_LINK_CHUNK_SIZE ? RELAY_LINK_CHUNK_SIZE : length;

            LinkEvent* slot = reserve(CONTROL_RESERVE);
            if (slot == nullptr) {
                rxOverflows.fetch_add(1, std::memory_order_relaxed);
                complete = false;
            } else {
                slot->type = LINK_EVENT_DATA;
                slot->peerId = peerId;
                slot->mtu = 0;
                slot->length = (uint8_t)chunk;
                memcpy(slot->data, data, chunk);
                commit();
            }

            data += chunk;
            length -= chunk;
        }
        return complete;
    }

    bool pushConnect(uint16_t peerId, uint16_t mtu) { return pushControl(LINK_EVENT_CONNECT, peerId, mtu); }
    bool pushDisconnect(uint16_t peerId) { return pushControl(LINK_EVENT_DISCONNECT, peerId, 0); }
    bool pushMtu(uint16_t peerId, uint16_t mtu) { return pushControl(LINK_EVENT_MTU, peerId, mtu); }

    // ========================================================================
    // Consumer side (loop task)
    // ========================================================================

    /**
     * Take the oldest event
     * @return false if the channel is empty
     */
    bool pop(LinkEvent& event)
    {
        uint16_t t = tail.load(std::memory_order_relaxed);
        if (t == head.load(std::memory_order_acquire)) {
            return false;
        }
        event = slots[t];
        tail.store(next(t), std::memory_order_release);
        return true;
    }

    bool isEmpty() const
    {
        return tail.load(std::memory_order_acquire) == head.load(std::memory_order_acquire);
    }

    uint16_t size() const
    {
        uint16_t h = head.load(std::memory_order_acquire);
        uint16_t t = tail.load(std::memory_order_acquire);
        return (uint16_t)((h + SLOT_COUNT - t) % SLOT_COUNT);
    }

    uint32_t getRxOverflows() const { return rxOverflows.load(std::memory_order_relaxed); }

private:
    // One slot stays empty to tell full from empty
    static const uint16_t SLOT_COUNT = CAPACITY + 1;

    LinkEvent slots[SLOT_COUNT];
    std::atomic<uint16_t> head;   // Written by the producer
    std::atomic<uint16_t> tail;   // Written by the consumer
    std::atomic<uint32_t> rxOverflows;

    static uint16_t next(uint16_t index) { return (uint16_t)((index + 1) % SLOT_COUNT); }

    LinkEvent* reserve(uint16_t keepFree)
    {
        uint16_t h = head.load(std::memory_order_relaxed);
        uint16_t t = tail.load(std::memory_order_acquire);
        uint16_t used = (uint16_t)((h + SLOT_COUNT - t) % SLOT_COUNT);
        if (used + keepFree >= CAPACITY) {
            return nullptr;
        }
        return &slots[h];
    }

    void commit()
    {
        head.store(next(head.load(std::memory_order_relaxed)), std::memory_order_release);
    }

    bool pushControl(LinkEventType type, uint16_t peerId, uint16_t mtu)
    {
        LinkEvent* slot = reserve(0);
        if (slot == nullptr) {
            rxOverflows.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        slot->type = type;
        slot->peerId = peerId;
        slot->mtu = mtu;
        slot->length = 0;
        commit();
        return true;
    }
};
