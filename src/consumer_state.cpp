/**
 * @file consumer_state.cpp
 * @brief Media key press/release implementation
 */

#include "consumer_state.h"
#include "debug.h"

ConsumerState::ConsumerState(HidSink& sink, uint32_t releaseDelayMs)
    : sink(sink)
    , releaseDelayMs(releaseDelayMs)
    , heldUsage(0)
    , pressTimeMs(0)
    , sinkFailures(0)
{
}

void ConsumerState::send(uint16_t usage)
{
    if (!sink.sendConsumerReport(usage)) {
        sinkFailures++;
        DBGPRINTF("[MEDIA] Report rejected (usage=0x%04X)\n", usage);
    }
}

void ConsumerState::press(uint16_t usage, uint32_t nowMs)
{
    if (usage == 0) {
        releaseAll();
        return;
    }

    // A new usage replaces the held one in the same report
    heldUsage = usage;
    pressTimeMs = nowMs;
    send(usage);
}

void ConsumerState::service(uint32_t nowMs)
{
    if (heldUsage != 0 && (uint32_t)(nowMs - pressTimeMs) >= releaseDelayMs) {
        heldUsage = 0;
        send(0);
    }
}

bool ConsumerState::releaseAll()
{
    if (heldUsage == 0) {
        return false;
    }
    heldUsage = 0;
    send(0);
    return true;
}
