/**
 * @file nus_link.cpp
 * @brief Nordic UART Service peripheral implementation
 */

#include "nus_link.h"
#include "bridge_config.h"
#include "debug.h"

NusLink::NusLink(LinkChannel& channel)
    : channel(channel)
    , server(nullptr)
    , txCharacteristic(nullptr)
    , activeHandle(NO_CONNECTION)
    , rejectedConnections(0)
    , notifyRetries(0)
{
}

bool NusLink::begin(const char* deviceName)
{
    NimBLEDevice::init(deviceName);
    NimBLEDevice::setMTU(RELAY_BLE_PREFERRED_MTU);

    server = NimBLEDevice::createServer();
    if (server == nullptr) {
        DBGPRINTLN("[BLE] Server creation failed");
        return false;
    }
    server->setCallbacks(this, false);
    server->advertiseOnDisconnect(true);

    NimBLEService* service = server->createService(RELAY_NUS_SERVICE_UUID);
    if (service == nullptr) {
        DBGPRINTLN("[BLE] NUS service creation failed");
        return false;
    }

    NimBLECharacteristic* rx = service->createCharacteristic(
        RELAY_NUS_RX_UUID, NIMBLE_PROPERTY::WRITE | NIMBLE_PROPERTY::WRITE_NR);
    txCharacteristic = service->createCharacteristic(RELAY_NUS_TX_UUID, NIMBLE_PROPERTY::NOTIFY);
    if (rx == nullptr || txCharacteristic == nullptr) {
        DBGPRINTLN("[BLE] NUS characteristic creation failed");
        return false;
    }
    rx->setCallbacks(this);
    service->start();

    NimBLEAdvertising* advertising = NimBLEDevice::getAdvertising();
    advertising->setName(deviceName);
    advertising->addServiceUUID(RELAY_NUS_SERVICE_UUID);
    advertising->enableScanResponse(true);
    if (!advertising->start()) {
        DBGPRINTLN("[BLE] Advertising failed to start");
        return false;
    }

    DBGPRINTF("[BLE] Advertising as %s\n", deviceName);
    return true;
}

// ============================================================================
// BLE host task callbacks
// ============================================================================

void NusLink::onConnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo)
{
    uint16_t handle = connInfo.getConnHandle();
    uint16_t expected = NO_CONNECTION;

    if (!activeHandle.compare_exchange_strong(expected, handle)) {
        // One browser controls the target at a time
        rejectedConnections.fetch_add(1);
        DBGPRINTF("[BLE] Rejecting second connection %u\n", (unsigned)handle);
        if (!pServer->disconnect(handle)) {
            DBGPRINTF("[BLE] Disconnect of %u failed\n", (unsigned)handle);
        }
        return;
    }

    DBGPRINTF("[BLE] Connected %u, mtu %u\n", (unsigned)handle, (unsigned)connInfo.getMTU());
    if (!channel.pushConnect(handle, connInfo.getMTU())) {
        DBGPRINTLN("[BLE] Link channel full, connect event lost");
    }
}

void NusLink::onDisconnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo, int reason)
{
    uint16_t handle = connInfo.getConnHandle();
    uint16_t expected = handle;

    if (!activeHandle.compare_exchange_strong(expected, NO_CONNECTION)) {
        // A rejected newcomer going away
        return;
    }

    DBGPRINTF("[BLE] Disconnected %u (reason 0x%02X)\n", (unsigned)handle, reason);
    if (!channel.pushDisconnect(handle)) {
        DBGPRINTLN("[BLE] Link channel full, disconnect event lost");
    }
}

void NusLink::onMTUChange(uint16_t mtu, NimBLEConnInfo& connInfo)
{
    if (connInfo.getConnHandle() != activeHandle.load()) {
        return;
    }
    if (!channel.pushMtu(connInfo.getConnHandle(), mtu)) {
        DBGPRINTLN("[BLE] Link channel full, MTU event lost");
    }
}

void NusLink::onWrite(NimBLECharacteristic* characteristic, NimBLEConnInfo& connInfo)
{
    uint16_t handle = connInfo.getConnHandle();
    if (handle != activeHandle.load()) {
        return;
    }

    std::string value = characteristic->getValue();
    if (value.empty()) {
        return;
    }

    if (!channel.pushData(handle, (const uint8_t*)value.data(), value.length())) {
        DBGPRINTF("[BLE] RX overflow, dropped part of %u bytes\n", (unsigned)value.length());
    }
}

// ============================================================================
// Loop task
// ============================================================================

LinkWriteResult NusLink::write(uint16_t peerId, const uint8_t* data, size_t length)
{
    if (txCharacteristic == nullptr || peerId != activeHandle.load()) {
        return LINK_FAILED;
    }

    if (txCharacteristic->notify(data, length, peerId)) {
        notifyRetries = 0;
        return LINK_OK;
    }

    // Usually the controller is out of buffers; give it a few loops
    if (++notifyRetries < MAX_NOTIFY_RETRIES) {
        return LINK_BUSY;
    }

    DBGPRINTF("[BLE] Notify failed %u times, giving up\n", (unsigned)notifyRetries);
    notifyRetries = 0;
    return LINK_FAILED;
}

void NusLink::disconnect(uint16_t peerId)
{
    if (server != nullptr && !server->disconnect(peerId)) {
        DBGPRINTF("[BLE] Disconnect of %u failed\n", (unsigned)peerId);
    }
}
