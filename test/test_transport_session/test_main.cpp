#include <unity.h>

#include "Modules/Network/BleTransportModule/TransportSession.h"

void setUp() {}
void tearDown() {}

void test_starts_disconnected()
{
    TransportSession s;
    TEST_ASSERT_EQUAL(SessionState::Disconnected, s.state());
    TEST_ASSERT_FALSE(s.isConnected());
    TEST_ASSERT_FALSE(s.isTimeSynced());
    TEST_ASSERT_EQUAL_UINT32(0, s.connectCount());
}

void test_connect_then_time_sync()
{
    TransportSession s;
    s.onConnected();
    TEST_ASSERT_EQUAL(SessionState::ConnectedUnsynced, s.state());
    TEST_ASSERT_TRUE(s.isConnected());
    TEST_ASSERT_FALSE(s.isTimeSynced());

    TEST_ASSERT_TRUE(s.onTimeSync());
    TEST_ASSERT_EQUAL(SessionState::ConnectedSynced, s.state());
    TEST_ASSERT_TRUE(s.isTimeSynced());

    // A second sync keeps the session synced.
    TEST_ASSERT_TRUE(s.onTimeSync());
    TEST_ASSERT_TRUE(s.isTimeSynced());
}

void test_reconnect_requires_a_new_time_sync()
{
    TransportSession s;
    s.onConnected();
    s.onTimeSync();
    s.onDisconnected();
    TEST_ASSERT_EQUAL(SessionState::Disconnected, s.state());
    TEST_ASSERT_FALSE(s.isTimeSynced());

    s.onConnected();
    TEST_ASSERT_FALSE(s.isTimeSynced());
    TEST_ASSERT_EQUAL_UINT32(2, s.connectCount());
}

void test_time_sync_while_disconnected_is_ignored()
{
    TransportSession s;
    TEST_ASSERT_FALSE(s.onTimeSync());
    TEST_ASSERT_EQUAL(SessionState::Disconnected, s.state());
}

void test_state_names()
{
    TEST_ASSERT_EQUAL_STRING("disconnected", sessionStateStr(SessionState::Disconnected));
    TEST_ASSERT_EQUAL_STRING("connected", sessionStateStr(SessionState::ConnectedUnsynced));
    TEST_ASSERT_EQUAL_STRING("synced", sessionStateStr(SessionState::ConnectedSynced));
}

void test_lost_link_event_is_replayed_once()
{
    LinkEventLatch latch;
    TEST_ASSERT_FALSE(latch.takePending());
    latch.onLost();
    TEST_ASSERT_TRUE(latch.takePending());
    TEST_ASSERT_FALSE(latch.takePending());
}

void test_queued_link_event_supersedes_a_lost_one()
{
    TransportSession s;
    LinkEventLatch latch;
    s.onConnected();
    s.onTimeSync();

    // Disconnect lost on a full queue, reconnect queued, then the peer syncs.
    latch.onLost();
    latch.onQueued();
    s.onConnected();
    TEST_ASSERT_TRUE(s.onTimeSync());

    // Queue drained: nothing to replay, the new connection stays synced.
    TEST_ASSERT_FALSE(latch.takePending());
    TEST_ASSERT_TRUE(s.isTimeSynced());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_starts_disconnected);
    RUN_TEST(test_connect_then_time_sync);
    RUN_TEST(test_reconnect_requires_a_new_time_sync);
    RUN_TEST(test_time_sync_while_disconnected_is_ignored);
    RUN_TEST(test_state_names);
    RUN_TEST(test_lost_link_event_is_replayed_once);
    RUN_TEST(test_queued_link_event_supersedes_a_lost_one);
    return UNITY_END();
}
