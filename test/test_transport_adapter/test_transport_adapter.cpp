/**
 * @file test_transport_adapter.cpp
 * @brief Session handling, inbound channel and outbound queue tests
 */

#include <unity.h>
#include <stdint.h>
#include <string.h>

#include "arduino_mock.h"
#include "link_channel.h"
#include "transport_adapter.h"
#include "relay_protocol.h"
#include "mock_link.h"

#define PEER 7
#define OTHER_PEER 8

/**
 * Listener recording what reaches the loop task
 */
class RecordingListener : public TransportListener {
public:
    uint8_t data[512];
    int dataLength;
    int connects;
    int disconnects;
    int dataBytesAtDisconnect;

    RecordingListener() { reset(); }

    void reset() {
        memset(data, 0, sizeof(data));
        dataLength = 0;
        connects = 0;
        disconnects = 0;
        dataBytesAtDisconnect = -1;
    }

    void onLinkData(const uint8_t* bytes, size_t length) override {
        memcpy(&data[dataLength], bytes, length);
        dataLength += (int)length;
    }

    void onLinkConnected(const Session& session) override {
        (void)session;
        connects++;
    }

    void onLinkDisconnected(const Session& session) override {
        (void)session;
        disconnects++;
        dataBytesAtDisconnect = dataLength;
    }
};

// Completion tracking
#define MAX_COMPLETIONS 16
static SendResult completions[MAX_COMPLETIONS];
static int completionTags[MAX_COMPLETIONS];
static int completionCount = 0;

static void recordCompletion(SendResult result, void* context) {
    if (completionCount < MAX_COMPLETIONS) {
        completions[completionCount] = result;
        completionTags[completionCount] = *static_cast<int*>(context);
    }
    completionCount++;
}

static LinkChannel* channel = nullptr;
static MockLink* mockLink = nullptr;
static TransportAdapter* adapter = nullptr;
static RecordingListener* listener = nullptr;

static void connectPeer(uint16_t mtu) {
    channel->pushConnect(PEER, mtu);
    adapter->poll();
}

void setUp(void) {
    completionCount = 0;
    channel = new LinkChannel();
    mockLink = new MockLink();
    adapter = new TransportAdapter(*channel, *mockLink);
    listener = new RecordingListener();
    adapter->setListener(listener);
}

void tearDown(void) {
    delete adapter;
    delete listener;
    delete mockLink;
    delete channel;
}

/**
 * Test: Connect event opens the session with the negotiated MTU
 */
void test_connect_opens_session(void) {
    TEST_ASSERT_FALSE(adapter->isConnected());

    connectPeer(247);

    TEST_ASSERT_TRUE(adapter->isConnected());
    TEST_ASSERT_EQUAL_UINT16(PEER, adapter->getSession().peerId);
    TEST_ASSERT_EQUAL_UINT16(247, adapter->getSession().mtu);
    TEST_ASSERT_EQUAL_UINT16(244, adapter->getFragmentSize());
    TEST_ASSERT_EQUAL_INT(1, listener->connects);
}

/**
 * Test: A packet longer than mtu - 3 is split into ordered fragments
 */
void test_fragmentation_at_default_mtu(void) {
    connectPeer(23);
    uint8_t payload[30];
    for (int i = 0; i < 30; i++) payload[i] = (uint8_t)i;
    int tag = 1;

    TEST_ASSERT_TRUE(adapter->send(0x01, payload, sizeof(payload), recordCompletion, &tag));
    adapter->pump();

    TEST_ASSERT_EQUAL_INT(2, mockLink->fragmentCount);
    TEST_ASSERT_EQUAL_UINT16(20, mockLink->fragmentSizes[0]);
    TEST_ASSERT_EQUAL_UINT16(16, mockLink->fragmentSizes[1]);
    TEST_ASSERT_EQUAL_UINT16(PEER, mockLink->lastPeer);

    // Reassembled bytes decode to the original packet
    RelayPacket packet;
    TEST_ASSERT_EQUAL(RELAY_DECODE_OK, relay_decode_packet(mockLink->written, mockLink->writtenLength, packet));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(payload, packet.payload, 30);

    TEST_ASSERT_EQUAL_INT(1, completionCount);
    TEST_ASSERT_EQUAL(SEND_OK, completions[0]);
}

/**
 * Test: MTU update changes the fragment size
 */
void test_mtu_update(void) {
    connectPeer(23);
    channel->pushMtu(PEER, 100);
    adapter->poll();

    TEST_ASSERT_EQUAL_UINT16(97, adapter->getFragmentSize());
}

/**
 * Test: Packets leave in the order they were queued
 */
void test_fifo_order(void) {
    connectPeer(247);
    uint8_t a = 0xAA;
    uint8_t b = 0xBB;
    int tagA = 1;
    int tagB = 2;

    adapter->send(0x81, &a, 1, recordCompletion, &tagA);
    adapter->send(0x81, &b, 1, recordCompletion, &tagB);
    TEST_ASSERT_EQUAL_UINT8(2, adapter->getQueuedCount());
    adapter->pump();

    TEST_ASSERT_EQUAL_INT(14, mockLink->writtenLength);
    TEST_ASSERT_EQUAL_HEX8(0xAA, mockLink->written[5]);
    TEST_ASSERT_EQUAL_HEX8(0xBB, mockLink->written[12]);
    TEST_ASSERT_EQUAL_INT(2, completionCount);
    TEST_ASSERT_EQUAL_INT(1, completionTags[0]);
    TEST_ASSERT_EQUAL_INT(2, completionTags[1]);
}

/**
 * Test: A busy link keeps the fragment for the next pump
 */
void test_busy_retry(void) {
    connectPeer(23);
    int tag = 1;
    mockLink->script(LINK_BUSY);

    adapter->send(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0, recordCompletion, &tag);
    adapter->pump();

    TEST_ASSERT_EQUAL_INT(0, mockLink->writtenLength);
    TEST_ASSERT_EQUAL_INT(0, completionCount);
    TEST_ASSERT_EQUAL_UINT32(1, adapter->getBusyRetries());

    adapter->pump();

    TEST_ASSERT_EQUAL_INT(6, mockLink->writtenLength);
    TEST_ASSERT_EQUAL_INT(1, completionCount);
    TEST_ASSERT_EQUAL(SEND_OK, completions[0]);
}

/**
 * Test: A failed write fails that packet only
 */
void test_failed_write(void) {
    connectPeer(23);
    int tagA = 1;
    int tagB = 2;
    mockLink->script(LINK_FAILED);

    adapter->send(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0, recordCompletion, &tagA);
    adapter->send(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0, recordCompletion, &tagB);
    adapter->pump();

    TEST_ASSERT_EQUAL_INT(2, completionCount);
    TEST_ASSERT_EQUAL(SEND_FAILED, completions[0]);
    TEST_ASSERT_EQUAL(SEND_OK, completions[1]);
    TEST_ASSERT_EQUAL_UINT32(1, adapter->getSendFailures());
}

/**
 * Test: Disconnect fails queued packets exactly once, later sends are refused
 */
void test_disconnect_fails_queue(void) {
    connectPeer(23);
    int tagA = 1;
    int tagB = 2;
    mockLink->script(LINK_BUSY);

    adapter->send(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0, recordCompletion, &tagA);
    adapter->send(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0, recordCompletion, &tagB);
    adapter->pump();

    channel->pushDisconnect(PEER);
    adapter->poll();

    TEST_ASSERT_FALSE(adapter->isConnected());
    TEST_ASSERT_EQUAL_INT(1, listener->disconnects);
    TEST_ASSERT_EQUAL_INT(2, completionCount);
    TEST_ASSERT_EQUAL(SEND_DISCONNECTED, completions[0]);
    TEST_ASSERT_EQUAL(SEND_DISCONNECTED, completions[1]);
    TEST_ASSERT_EQUAL_UINT8(0, adapter->getQueuedCount());

    // Nothing more happens
    adapter->pump();
    TEST_ASSERT_EQUAL_INT(2, completionCount);
    TEST_ASSERT_FALSE(adapter->send(RELAY_CMD_RELEASE_CAPTURE, nullptr, 0));
}

/**
 * Test: A second connection is turned away, the first keeps control
 */
void test_second_connection_rejected(void) {
    connectPeer(23);

    channel->pushConnect(OTHER_PEER, 247);
    const uint8_t bytes[3] = {1, 2, 3};
    channel->pushData(OTHER_PEER, bytes, sizeof(bytes));
    adapter->poll();

    TEST_ASSERT_EQUAL_UINT16(PEER, adapter->getSession().peerId);
    TEST_ASSERT_EQUAL_INT(1, mockLink->disconnectCalls);
    TEST_ASSERT_EQUAL_UINT16(OTHER_PEER, mockLink->lastDisconnectedPeer);
    TEST_ASSERT_EQUAL_UINT32(1, adapter->getRejectedConnections());
    TEST_ASSERT_EQUAL_INT(0, listener->dataLength);

    // Its disconnect does not end our session
    channel->pushDisconnect(OTHER_PEER);
    adapter->poll();
    TEST_ASSERT_TRUE(adapter->isConnected());
}

/**
 * Test: Data queued before a disconnect is delivered before it
 */
void test_data_ordered_before_disconnect(void) {
    connectPeer(23);
    uint8_t bytes[100];
    for (int i = 0; i < 100; i++) bytes[i] = (uint8_t)(i + 1);

    TEST_ASSERT_TRUE(channel->pushData(PEER, bytes, sizeof(bytes)));
    channel->pushDisconnect(PEER);
    adapter->poll();

    TEST_ASSERT_EQUAL_INT(100, listener->dataBytesAtDisconnect);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(bytes, listener->data, 100);
}

/**
 * Test: A full channel drops data but still takes the disconnect
 */
void test_channel_overflow_keeps_control_slots(void) {
    connectPeer(23);
    uint8_t chunk[RELAY_LINK_CHUNK_SIZE];
    memset(chunk, 0x42, sizeof(chunk));

    for (int i = 0; i < LinkChannel::CAPACITY; i++) {
        channel->pushData(PEER, chunk, sizeof(chunk));
    }
    TEST_ASSERT_EQUAL_UINT32(LinkChannel::CONTROL_RESERVE, channel->getRxOverflows());

    TEST_ASSERT_TRUE(channel->pushDisconnect(PEER));
    adapter->poll();

    TEST_ASSERT_FALSE(adapter->isConnected());
    TEST_ASSERT_TRUE(channel->isEmpty());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_connect_opens_session);
    RUN_TEST(test_fragmentation_at_default_mtu);
    RUN_TEST(test_mtu_update);
    RUN_TEST(test_fifo_order);
    RUN_TEST(test_busy_retry);
    RUN_TEST(test_failed_write);
    RUN_TEST(test_disconnect_fails_queue);
    RUN_TEST(test_second_connection_rejected);
    RUN_TEST(test_data_ordered_before_disconnect);
    RUN_TEST(test_channel_overflow_keeps_control_slots);
    return UNITY_END();
}
