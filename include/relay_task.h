/**
 * @file relay_task.h
 * @brief Main relay task class
 *
 * Wires the transport, parser, dispatcher and control plane together and
 * services their timers. Everything runs on the loop task; the only state
 * shared with the BLE host task is the LinkChannel.
 */

#pragma once

#include <stdint.h>
#include "transport_adapter.h"
#include "packet_parser.h"
#include "command_dispatcher.h"
#include "control_plane.h"
#include "consumer_state.h"
#include "bridge_device.h"

/**
 * @class RelayTask
 * @brief Per-loop driver of the bridge
 *
 * One run() call:
 * - refreshes the board (buttons)
 * - drains link events into the parser and dispatcher
 * - releases expired media keys
 * - polls the release button and display timeout
 * - pushes queued notifications to the link
 */
class RelayTask : public TransportListener {
public:
    RelayTask(TransportAdapter& transport, PacketParser& parser, CommandDispatcher& dispatcher,
              ControlPlane& control, ConsumerState& consumer, BridgeDevice& device);

    /**
     * Register callbacks and apply the initial display state
     */
    void begin();

    /**
     * Execute one iteration
     * Should be called repeatedly from the main loop().
     */
    void run();

    // TransportListener
    void onLinkData(const uint8_t* data, size_t length) override;
    void onLinkConnected(const Session& session) override;
    void onLinkDisconnected(const Session& session) override;

    uint32_t getSessionCount() const { return sessionCount; }

private:
    TransportAdapter& transport;
    PacketParser& parser;
    CommandDispatcher& dispatcher;
    ControlPlane& control;
    ConsumerState& consumer;
    BridgeDevice& device;

    uint32_t sessionCount;

    static void handlePacket(const RelayPacket& packet, void* context);
};
