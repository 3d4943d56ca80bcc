/**
 * @file relay_task.cpp
 * @brief Main relay task implementation
 */

#include "relay_task.h"
#include "debug.h"
#include <Arduino.h>

RelayTask::RelayTask(TransportAdapter& transport, PacketParser& parser,
                     CommandDispatcher& dispatcher, ControlPlane& control,
                     ConsumerState& consumer, BridgeDevice& device)
    : transport(transport)
    , parser(parser)
    , dispatcher(dispatcher)
    , control(control)
    , consumer(consumer)
    , device(device)
    , sessionCount(0)
{
}

void RelayTask::begin()
{
    transport.setListener(this);
    parser.setPacketCallback(&RelayTask::handlePacket, this);
    control.begin(millis());
}

void RelayTask::run()
{
    device.update();

    // Inbound first so queued replies go out in this same iteration
    transport.poll();

    uint32_t now = millis();
    consumer.service(now);
    control.service(now);

    transport.pump();
}

void RelayTask::handlePacket(const RelayPacket& packet, void* context)
{
    RelayTask* self = static_cast<RelayTask*>(context);
    self->dispatcher.dispatch(packet, millis());
}

// ============================================================================
// TransportListener
// ============================================================================

void RelayTask::onLinkData(const uint8_t* data, size_t length)
{
    parser.processBytes(data, length);
}

void RelayTask::onLinkConnected(const Session& session)
{
    sessionCount++;
    DBGPRINTF("[RELAY] Session %u started (peer %u)\n",
              (unsigned)sessionCount, (unsigned)session.peerId);
    control.noteActivity(millis());
}

void RelayTask::onLinkDisconnected(const Session& session)
{
    DBGPRINTF("[RELAY] Session ended (peer %u), releasing input\n", (unsigned)session.peerId);
    control.releaseInput();
    parser.reset();
}
