/**
 * @file bridge_config.h
 * @brief Compile-time configuration for the RelayKVM bridge
 *
 * Every value can be overridden from the build flags (-DNAME=value).
 * Runtime settings (display brightness and timeout) arrive over the wire
 * and are not persisted.
 */

#pragma once

// ============================================================================
// BLE Nordic UART Service
// ============================================================================

#ifndef RELAY_DEVICE_NAME
#define RELAY_DEVICE_NAME "RelayKVM-S3"
#endif

#define RELAY_NUS_SERVICE_UUID "6e400001-b5a3-f393-e0a9-e50e24dcca9e"
#define RELAY_NUS_RX_UUID      "6e400002-b5a3-f393-e0a9-e50e24dcca9e"  // Browser writes here
#define RELAY_NUS_TX_UUID      "6e400003-b5a3-f393-e0a9-e50e24dcca9e"  // We notify here

// Requested ATT MTU. Browsers usually settle on 247 or fall back to 23.
#ifndef RELAY_BLE_PREFERRED_MTU
#define RELAY_BLE_PREFERRED_MTU 247
#endif

// ATT MTU before any exchange; leaves 20 bytes of payload per write
#define RELAY_BLE_DEFAULT_MTU 23

// ATT header bytes subtracted from the MTU for each notification
#define RELAY_ATT_OVERHEAD 3

// ============================================================================
// Queues
// ============================================================================

// Slots in the BLE callback -> loop task channel
#ifndef RELAY_LINK_CHANNEL_DEPTH
#define RELAY_LINK_CHANNEL_DEPTH 32
#endif

// Largest chunk carried by one channel slot; longer writes use several slots
#ifndef RELAY_LINK_CHUNK_SIZE
#define RELAY_LINK_CHUNK_SIZE 64
#endif

// Whole packets waiting for the outbound link
#ifndef RELAY_TX_QUEUE_DEPTH
#define RELAY_TX_QUEUE_DEPTH 8
#endif

// ============================================================================
// Input
// ============================================================================

// Media keys are sent as a press followed by a release after this delay
#ifndef RELAY_MEDIA_RELEASE_MS
#define RELAY_MEDIA_RELEASE_MS 50
#endif

// ============================================================================
// Display
// ============================================================================

#ifndef RELAY_DISPLAY_OFF_LEVEL
#define RELAY_DISPLAY_OFF_LEVEL 0
#endif

#ifndef RELAY_DISPLAY_DIM_LEVEL
#define RELAY_DISPLAY_DIM_LEVEL 32
#endif

#ifndef RELAY_DISPLAY_ON_LEVEL
#define RELAY_DISPLAY_ON_LEVEL 128
#endif

// Display timeout at boot in seconds (0 = never turn the display off)
#ifndef RELAY_DEFAULT_DISPLAY_TIMEOUT_S
#define RELAY_DEFAULT_DISPLAY_TIMEOUT_S 0
#endif

// ============================================================================
// Debug serial
// ============================================================================

#ifndef RELAY_DEBUG_BAUD
#define RELAY_DEBUG_BAUD 115200
#endif
