#include <Arduino.h>
#include "bridge_config.h"
#include "debug.h"
#include "link_channel.h"
#include "nus_link.h"
#include "transport_adapter.h"
#include "packet_parser.h"
#include "usb_hid_sink.h"
#include "keyboard_state.h"
#include "consumer_state.h"
#include "mouse_state.h"
#include "m5_device.h"
#include "control_plane.h"
#include "command_dispatcher.h"
#include "relay_task.h"

// ============================================================================
// Global Objects
// ============================================================================

// BLE host task -> loop task
static LinkChannel linkChannel;
static NusLink nusLink(linkChannel);
static TransportAdapter transport(linkChannel, nusLink);
static PacketParser parser;

// USB HID output and the state the host currently sees
static UsbHidSink usbHid;
static KeyboardState keyboard(usbHid);
static ConsumerState consumer(usbHid, RELAY_MEDIA_RELEASE_MS);
static MouseState mouse(usbHid);

static M5Device board;
static ControlPlane control(board, usbHid, keyboard, mouse, consumer, transport);
static CommandDispatcher dispatcher(keyboard, consumer, mouse, control, transport, usbHid);
static RelayTask relayTask(transport, parser, dispatcher, control, consumer, board);

// ============================================================================
// Setup
// ============================================================================

void setup()
{
    Serial.begin(RELAY_DEBUG_BAUD);

    // Debug output control:
    // This affects all DBGPRINT/DBGPRINTLN/DBGPRINTF output throughout the code
    Debug::setEnabled(true);

    // USB must register its HID interface before the host enumerates us
    usbHid.begin();

    board.begin(RELAY_DEVICE_NAME);
    relayTask.begin();

    if (!nusLink.begin(RELAY_DEVICE_NAME)) {
        DBGPRINTLN("[BLE] Startup failed, restarting");
        delay(1000);
        board.restart();
    }
}

// ============================================================================
// Main Loop
// ============================================================================

void loop()
{
    relayTask.run();
    board.showConnected(transport.isConnected());

    // Let the BLE host and TinyUSB tasks run
    delay(1);
}
