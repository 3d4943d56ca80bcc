/**
 * @file command_dispatcher.cpp
 * @brief Packet routing implementation
 */

#include "command_dispatcher.h"
#include "debug.h"

CommandDispatcher::CommandDispatcher(KeyboardState& keyboard, ConsumerState& consumer,
                                     MouseState& mouse, ControlPlane& control,
                                     TransportAdapter& transport, HidSink& sink)
    : keyboard(keyboard)
    , consumer(consumer)
    , mouse(mouse)
    , control(control)
    , transport(transport)
    , sink(sink)
    , commandsDispatched(0)
    , malformedCommands(0)
    , unknownCommands(0)
{
}

void CommandDispatcher::resetStats()
{
    commandsDispatched = 0;
    malformedCommands = 0;
    unknownCommands = 0;
}

bool CommandDispatcher::rejectMalformed(const RelayPacket& packet, uint8_t minLength)
{
    if (packet.length >= minLength) {
        return false;
    }
    malformedCommands++;
    DBGPRINTF("[PROTO] Cmd 0x%02X payload %u bytes, need %u\n",
              packet.command, (unsigned)packet.length, (unsigned)minLength);
    return true;
}

bool CommandDispatcher::decodeMouse(const uint8_t* payload, uint8_t length, MouseUpdate& update)
{
    if (length < 1) {
        return false;
    }

    switch (payload[0]) {
        case RELAY_MOUSE_MODE_RELATIVE:
            if (length < RELAY_MS_RELATIVE_LEN) return false;
            update = MouseUpdate::makeRelative(payload[1],
                                               (int8_t)payload[2],
                                               (int8_t)payload[3],
                                               (int8_t)payload[4]);
            return true;

        case RELAY_MOUSE_MODE_ABSOLUTE:
            if (length < RELAY_MS_ABSOLUTE_LEN) return false;
            update = MouseUpdate::makeAbsolute(payload[1],
                                               relay_read_le16(&payload[2]),
                                               relay_read_le16(&payload[4]),
                                               (int8_t)payload[6]);
            return true;

        default:
            return false;
    }
}

void CommandDispatcher::sendInfo()
{
    uint8_t info[3];
    info[0] = RELAY_PROTOCOL_VERSION;
    info[1] = sink.isReady() ? 1 : 0;
    info[2] = sink.getKeyboardLeds();

    if (!transport.send(RELAY_CMD_GET_INFO, info, sizeof(info))) {
        DBGPRINTLN("[PROTO] Info reply not queued");
    }
}

bool CommandDispatcher::dispatch(const RelayPacket& packet, uint32_t nowMs)
{
    const uint8_t* payload = packet.payload;

    switch (packet.command) {
        case RELAY_CMD_GET_INFO:
            control.noteActivity(nowMs);
            sendInfo();
            break;

        case RELAY_CMD_KB_GENERAL:
            if (rejectMalformed(packet, RELAY_KB_GENERAL_LEN)) return false;
            control.noteActivity(nowMs);
            // payload[1] is reserved
            keyboard.apply(payload[0], &payload[2]);
            break;

        case RELAY_CMD_KB_MEDIA:
            if (rejectMalformed(packet, RELAY_KB_MEDIA_LEN)) return false;
            control.noteActivity(nowMs);
            consumer.press(relay_read_le16(payload), nowMs);
            break;

        case RELAY_CMD_MS_ABSOLUTE:
        case RELAY_CMD_MS_RELATIVE: {
            uint8_t minLength = (packet.command == RELAY_CMD_MS_ABSOLUTE)
                                    ? RELAY_MS_ABSOLUTE_LEN : RELAY_MS_RELATIVE_LEN;
            if (rejectMalformed(packet, minLength)) return false;

            MouseUpdate update;
            if (!decodeMouse(payload, packet.length, update)) {
                malformedCommands++;
                DBGPRINTF("[PROTO] Bad mouse mode 0x%02X\n", payload[0]);
                return false;
            }
            control.noteActivity(nowMs);
            mouse.apply(update);
            break;
        }

        case RELAY_CMD_DISPLAY_BRIGHTNESS:
            if (rejectMalformed(packet, 1)) return false;
            control.setBrightness(payload[0], nowMs);
            break;

        case RELAY_CMD_DISPLAY_TIMEOUT: {
            if (rejectMalformed(packet, 1)) return false;
            uint16_t seconds = (packet.length >= 2) ? relay_read_le16(payload) : payload[0];
            control.setDisplayTimeout(seconds, nowMs);
            break;
        }

        case RELAY_CMD_USB_WAKE:
            control.noteActivity(nowMs);
            control.wakeUsb();
            break;

        case RELAY_CMD_USB_RECOVERY:
            control.noteActivity(nowMs);
            control.recoverUsb();
            break;

        case RELAY_CMD_DEVICE_RESET:
            control.resetDevice();
            break;

        default:
            unknownCommands++;
            DBGPRINTF("[PROTO] Unknown cmd 0x%02X (%u bytes)\n",
                      packet.command, (unsigned)packet.length);
            return false;
    }

    commandsDispatched++;
    return true;
}
