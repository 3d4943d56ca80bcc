/**
 * @file mock_link.h
 * @brief Scriptable outbound link for native testing
 */

#pragma once

#include <stdint.h>
#include <string.h>
#include "transport_adapter.h"

class MockLink : public Link {
public:
    static const int MAX_BYTES = 2048;
    static const int MAX_WRITES = 128;
    static const int MAX_SCRIPT = 32;

    // Accepted bytes, concatenated
    uint8_t written[MAX_BYTES];
    int writtenLength;

    // Size of every accepted fragment
    uint16_t fragmentSizes[MAX_WRITES];
    int fragmentCount;

    int writeCalls;
    int disconnectCalls;
    uint16_t lastDisconnectedPeer;
    uint16_t lastPeer;

    MockLink() { reset(); }

    void reset() {
        memset(written, 0, sizeof(written));
        writtenLength = 0;
        fragmentCount = 0;
        writeCalls = 0;
        disconnectCalls = 0;
        lastDisconnectedPeer = 0;
        lastPeer = 0;
        scriptLength = 0;
        scriptIndex = 0;
    }

    /**
     * Queue the result of an upcoming write() call. Unscripted calls succeed.
     */
    void script(LinkWriteResult result) {
        if (scriptLength < MAX_SCRIPT) {
            scriptResults[scriptLength++] = result;
        }
    }

    LinkWriteResult write(uint16_t peerId, const uint8_t* data, size_t length) override {
        writeCalls++;
        lastPeer = peerId;

        LinkWriteResult result = LINK_OK;
        if (scriptIndex < scriptLength) {
            result = scriptResults[scriptIndex++];
        }

        if (result == LINK_OK && writtenLength + (int)length <= MAX_BYTES) {
            memcpy(&written[writtenLength], data, length);
            writtenLength += (int)length;
            if (fragmentCount < MAX_WRITES) {
                fragmentSizes[fragmentCount++] = (uint16_t)length;
            }
        }
        return result;
    }

    void disconnect(uint16_t peerId) override {
        disconnectCalls++;
        lastDisconnectedPeer = peerId;
    }

private:
    LinkWriteResult scriptResults[MAX_SCRIPT];
    int scriptLength;
    int scriptIndex;
};
