/**
 * @file nus_link.h
 * @brief Nordic UART Service peripheral on NimBLE-Arduino
 *
 * The browser writes packets to RX and receives notifications on TX.
 * NimBLE callbacks run on the BLE host task and only feed the LinkChannel;
 * write() is called from the loop task.
 */

#pragma once

#include <stdint.h>
#include <atomic>
#include <NimBLEDevice.h>
#include "link_channel.h"
#include "transport_adapter.h"

class NusLink : public Link,
                public NimBLEServerCallbacks,
                public NimBLECharacteristicCallbacks {
public:
    explicit NusLink(LinkChannel& channel);

    /**
     * Create the GATT service and start advertising
     * @return false if the service could not be created
     */
    bool begin(const char* deviceName);

    // Link
    LinkWriteResult write(uint16_t peerId, const uint8_t* data, size_t length) override;
    void disconnect(uint16_t peerId) override;

    // NimBLEServerCallbacks
    void onConnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo) override;
    void onDisconnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo, int reason) override;
    void onMTUChange(uint16_t mtu, NimBLEConnInfo& connInfo) override;

    // NimBLECharacteristicCallbacks
    void onWrite(NimBLECharacteristic* characteristic, NimBLEConnInfo& connInfo) override;

    bool isConnected() const { return activeHandle.load() != NO_CONNECTION; }
    uint32_t getRejectedConnections() const { return rejectedConnections.load(); }

private:
    static const uint16_t NO_CONNECTION = 0xFFFF;

    // Consecutive notify failures before a fragment counts as failed
    static const uint8_t MAX_NOTIFY_RETRIES = 50;

    LinkChannel& channel;
    NimBLEServer* server;
    NimBLECharacteristic* txCharacteristic;

    std::atomic<uint16_t> activeHandle;
    std::atomic<uint32_t> rejectedConnections;
    uint8_t notifyRetries;
};
