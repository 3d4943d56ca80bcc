/**
 * @file control_plane.cpp
 * @brief Device-side control command implementation
 */

#include "control_plane.h"
#include "bridge_config.h"
#include "debug.h"

ControlPlane::ControlPlane(BridgeDevice& device, HidSink& sink, KeyboardState& keyboard,
                           MouseState& mouse, ConsumerState& consumer, TransportAdapter& transport)
    : device(device)
    , sink(sink)
    , keyboard(keyboard)
    , mouse(mouse)
    , consumer(consumer)
    , transport(transport)
    , displayState(DISPLAY_AWAKE)
    , displayLevel(RELAY_DISPLAY_ON_LEVEL)
    , configuredLevel(RELAY_DISPLAY_ON_LEVEL)
    , timeoutSeconds(RELAY_DEFAULT_DISPLAY_TIMEOUT_S)
    , lastActivityMs(0)
    , displayInitialized(false)
{
}

uint8_t ControlPlane::brightnessLevel(uint8_t wireLevel)
{
    if (wireLevel == RELAY_BRIGHTNESS_OFF) return RELAY_DISPLAY_OFF_LEVEL;
    if (wireLevel == RELAY_BRIGHTNESS_ON) return RELAY_DISPLAY_ON_LEVEL;
    return RELAY_DISPLAY_DIM_LEVEL;
}

void ControlPlane::begin(uint32_t nowMs)
{
    lastActivityMs = nowMs;
    displayState = DISPLAY_AWAKE;
    displayInitialized = false;
    applyDisplayLevel(configuredLevel);
}

void ControlPlane::applyDisplayLevel(uint8_t level)
{
    if (displayInitialized && level == displayLevel) {
        return;
    }
    displayLevel = level;
    displayInitialized = true;
    device.setDisplayBrightness(level);
}

// ============================================================================
// Display
// ============================================================================

void ControlPlane::noteActivity(uint32_t nowMs)
{
    lastActivityMs = nowMs;

    if (displayState == DISPLAY_DIMMED) {
        displayState = DISPLAY_AWAKE;
        DBGPRINTLN("[CTRL] Activity, display restored");
        applyDisplayLevel(configuredLevel);
    }
}

bool ControlPlane::setBrightness(uint8_t wireLevel, uint32_t nowMs)
{
    uint8_t level = brightnessLevel(wireLevel);

    // Wakes a dimmed display to the prior level first
    noteActivity(nowMs);
    configuredLevel = level;

    if (displayInitialized && level == displayLevel) {
        return false;
    }

    DBGPRINTF("[CTRL] Display brightness %u\n", level);
    applyDisplayLevel(level);
    return true;
}

void ControlPlane::setDisplayTimeout(uint16_t seconds, uint32_t nowMs)
{
    timeoutSeconds = seconds;
    DBGPRINTF("[CTRL] Display timeout %us\n", (unsigned)seconds);
    noteActivity(nowMs);
}

void ControlPlane::service(uint32_t nowMs)
{
    if (device.wasReleaseButtonPressed()) {
        noteActivity(nowMs);
        sendReleaseCapture();
    }

    if (displayState == DISPLAY_AWAKE && timeoutSeconds > 0) {
        if ((uint32_t)(nowMs - lastActivityMs) >= (uint32_t)timeoutSeconds * 1000UL) {
            displayState = DISPLAY_DIMMED;
            DBGPRINTLN("[CTRL] Inactivity timeout, display off");
            applyDisplayLevel(RELAY_DISPLAY_OFF_LEVEL);
        }
    }
}

// ============================================================================
// USB
// ============================================================================

ControlResult ControlPlane::wakeUsb()
{
    if (!sink.wakeHost()) {
        DBGPRINTLN("[CTRL] USB wake unsupported");
        return CONTROL_UNSUPPORTED;
    }

    // Hosts that ignore remote wakeup still wake on pointer movement
    uint8_t buttons = mouse.getHeldButtons();
    bool jittered = sink.sendMouseReport(buttons, 1, 0, 0);
    jittered = sink.sendMouseReport(buttons, -1, 0, 0) && jittered;
    if (!jittered) {
        DBGPRINTLN("[CTRL] Wake jitter report rejected");
    }

    DBGPRINTLN("[CTRL] USB wake requested");
    return CONTROL_REQUESTED;
}

ControlResult ControlPlane::recoverUsb()
{
    DBGPRINTLN("[CTRL] USB recovery, re-sending HID state");

    bool keyboardOk = keyboard.resync();
    bool mouseOk = sink.sendMouseReport(mouse.getHeldButtons(), 0, 0, 0);
    bool responsive = keyboardOk && mouseOk && sink.isReady();

    uint8_t status = responsive ? RELAY_RECOVERY_SINK_OK : RELAY_RECOVERY_SINK_UNRESPONSIVE;
    if (!responsive) {
        DBGPRINTLN("[CTRL] USB sink unresponsive");
    }

    if (!transport.send(RELAY_CMD_USB_RECOVERY, &status, 1)) {
        DBGPRINTLN("[CTRL] Recovery status not queued");
    }
    return CONTROL_REQUESTED;
}

void ControlPlane::resetDevice()
{
    DBGPRINTLN("[CTRL] Device reset");
    releaseInput();
    device.restart();
}

// ============================================================================
// Input / notifications
// ============================================================================

bool ControlPlane::sendReleaseCapture()
{
    if (!transport.isConnected()) {
        DBGPRINTLN("[CTRL] Release button pressed, no browser connected");
        return false;
    }

    DBGPRINTLN("[CTRL] Release capture");
    return transport.send(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0);
}

void ControlPlane::releaseInput()
{
    keyboard.releaseAll();
    mouse.releaseAll();
    consumer.releaseAll();
}
