#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailcache/remote_task_queue.hpp"
#include "MockRemoteGateway.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Throw;

class RemoteTaskQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway = std::make_shared<NiceMock<MockRemoteGateway>>();
        gateway->delegateToMailbox();
        gateway->addLabel(Label(LABEL_INBOX, "INBOX", LABEL_TYPE_SYSTEM));
        gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
        provider = new StaticSessionProvider(gateway);
        queue = new RemoteTaskQueue(provider);
    }

    void TearDown() override {
        delete queue;
        delete provider;
        gateway = nullptr;
    }

    std::shared_ptr<NiceMock<MockRemoteGateway>> gateway;
    StaticSessionProvider * provider;
    RemoteTaskQueue * queue;
};

TEST_F(RemoteTaskQueueTest, RunsTasksInOrder) {
    {
        InSequence seq;
        EXPECT_CALL(*gateway, trash("m1"));
        EXPECT_CALL(*gateway, untrash("m1"));
        EXPECT_CALL(*gateway, archive("m1"));
        EXPECT_CALL(*gateway, unarchive("m1"));
        EXPECT_CALL(*gateway, markRead("m1", true));
    }
    queue->trash("m1");
    queue->untrash("m1");
    queue->archive("m1");
    queue->unarchive("m1");
    queue->markRead("m1", true);

    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_FALSE(gateway->mock_isTrashed("m1"));
    EXPECT_TRUE(gateway->mock_hasLabel("m1", LABEL_INBOX));
}

TEST_F(RemoteTaskQueueTest, FailureDoesNotStopLaterTasks) {
    EXPECT_CALL(*gateway, archive("m1")).WillOnce(Throw(SyncException("server-error", "503", true)));
    EXPECT_CALL(*gateway, trash("m1"));

    queue->archive("m1");
    queue->trash("m1");

    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_TRUE(gateway->mock_isTrashed("m1"));
}

TEST_F(RemoteTaskQueueTest, AuthenticationFailureIsLoggedNotThrown) {
    provider->authenticated = false;
    EXPECT_CALL(*gateway, trash("m1")).Times(0);

    queue->trash("m1");
    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_FALSE(gateway->mock_isTrashed("m1"));
}

TEST_F(RemoteTaskQueueTest, StopDropsQueuedTasks) {
    std::atomic<bool> started(false);
    std::atomic<bool> release(false);
    std::atomic<int> ran(0);

    queue->enqueue({"block", "m1", [&](RemoteGateway &) {
        started = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        ran++;
    }});
    for (int ii = 0; ii < 3; ii ++) {
        queue->enqueue({"count", "m1", [&](RemoteGateway &) { ran++; }});
    }

    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::thread stopper([&]() { queue->stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    release = true;
    stopper.join();

    EXPECT_EQ(ran, 1);

    // anything queued after shutdown is dropped
    queue->enqueue({"late", "m1", [&](RemoteGateway &) { ran++; }});
    EXPECT_EQ(ran, 1);
}
