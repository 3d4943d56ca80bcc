/**
 * @file command_dispatcher.h
 * @brief Routes validated packets to the input state machines and control plane
 */

#pragma once

#include <stdint.h>
#include "relay_protocol.h"
#include "keyboard_state.h"
#include "consumer_state.h"
#include "mouse_state.h"
#include "control_plane.h"
#include "transport_adapter.h"
#include "hid_sink.h"

class CommandDispatcher {
public:
    CommandDispatcher(KeyboardState& keyboard, ConsumerState& consumer, MouseState& mouse,
                      ControlPlane& control, TransportAdapter& transport, HidSink& sink);

    /**
     * Execute one packet
     * @param packet Decoded packet
     * @param nowMs Current time in milliseconds
     * @return true if the command was recognised and well formed
     */
    bool dispatch(const RelayPacket& packet, uint32_t nowMs);

    /**
     * Decode a mouse payload; the mode byte selects the layout
     * @return false if the mode is unknown or the payload too short for it
     */
    static bool decodeMouse(const uint8_t* payload, uint8_t length, MouseUpdate& update);

    /**
     * Get statistics
     */
    uint32_t getCommandsDispatched() const { return commandsDispatched; }
    uint32_t getMalformedCommands() const { return malformedCommands; }
    uint32_t getUnknownCommands() const { return unknownCommands; }

    /**
     * Reset statistics
     */
    void resetStats();

private:
    KeyboardState& keyboard;
    ConsumerState& consumer;
    MouseState& mouse;
    ControlPlane& control;
    TransportAdapter& transport;
    HidSink& sink;

    uint32_t commandsDispatched;
    uint32_t malformedCommands;
    uint32_t unknownCommands;

    bool rejectMalformed(const RelayPacket& packet, uint8_t minLength);
    void sendInfo();
};
