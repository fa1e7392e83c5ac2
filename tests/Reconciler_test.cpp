#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailcache/reconciler.hpp"
#include "MockRemoteGateway.hpp"
#include <stdlib.h>
#include <chrono>
#include <memory>
#include <thread>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Throw;

class ReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::string("/tmp/mailcache_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name();
        setenv("CONFIG_DIR_PATH", dir.c_str(), 1);
        system(("rm -rf " + dir + " && mkdir -p " + dir).c_str());

        store = new CacheStore(dir + FS_PATH_SEP + "mailcache.db");
        store->migrate();

        gateway = std::make_shared<NiceMock<MockRemoteGateway>>();
        gateway->delegateToMailbox();
        gateway->addLabel(Label(LABEL_INBOX, "INBOX", LABEL_TYPE_SYSTEM));
        gateway->addLabel(Label("WORK", "Work", LABEL_TYPE_USER));

        provider = new StaticSessionProvider(gateway);
        state = new SyncState();
        reconciler = new Reconciler(store, provider, state, 30);
    }

    void TearDown() override {
        delete reconciler;
        delete state;
        delete provider;
        gateway = nullptr;
        delete store;
        system(("rm -rf " + dir).c_str());
    }

    std::string dir;
    CacheStore * store;
    std::shared_ptr<NiceMock<MockRemoteGateway>> gateway;
    StaticSessionProvider * provider;
    SyncState * state;
    Reconciler * reconciler;
};

TEST_F(ReconcilerTest, FirstPassFetchesEverything) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    gateway->addMessage(TestMessage("m2", "t2", 2000, "Budget", {LABEL_INBOX, "WORK"}));

    EXPECT_TRUE(reconciler->syncNow());

    EXPECT_EQ(store->countMessages(), 2);
    EXPECT_THAT(store->labelIdsForMessage("m2"), ElementsAre(LABEL_INBOX, "WORK"));
    EXPECT_EQ(store->allLabels().size(), 2u);

    SyncStatus status = state->snapshot();
    EXPECT_EQ(status.phase, SyncPhase::Idle);
    EXPECT_GT(status.lastSuccess, 0);
    EXPECT_TRUE(state->hasSynced(LABEL_INBOX));
    EXPECT_TRUE(state->hasSynced("WORK"));
}

TEST_F(ReconcilerTest, UnchangedMessagesAreNotRefetched) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    EXPECT_CALL(*gateway, getMessage("m1")).Times(1);

    reconciler->syncNow();
    reconciler->syncNow();
}

TEST_F(ReconcilerTest, NewerRemoteVersionIsRefetched) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    reconciler->syncNow();

    gateway->addMessage(TestMessage("m1", "t1", 5000, "Hello again", {LABEL_INBOX}));
    reconciler->syncNow();

    EXPECT_EQ(store->messageDate("m1"), 5000);
    EXPECT_EQ(store->findMessage("m1")->subject(), "Hello again");
    auto hits = store->search("again", 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0]->id(), "m1");
}

TEST_F(ReconcilerTest, CompleteListingRemovesAssociationButKeepsMessage) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX, "WORK"}));
    reconciler->syncNow();

    // archived from another client
    gateway->mock_setLabel("m1", LABEL_INBOX, false);
    reconciler->syncNow();

    EXPECT_TRUE(store->messageExists("m1"));
    EXPECT_THAT(store->labelIdsForMessage("m1"), ElementsAre("WORK"));
}

TEST_F(ReconcilerTest, IncompleteListingNeverRemoves) {
    gateway->addMessage(TestMessage("old", "t1", 1000, "Old", {LABEL_INBOX}));
    gateway->addMessage(TestMessage("new", "t2", 2000, "New", {LABEL_INBOX}));
    reconciler->syncNow();

    gateway->setPageLimit(1);
    reconciler->syncNow();

    EXPECT_EQ(store->countMessagesForLabel(LABEL_INBOX), 2);
}

TEST_F(ReconcilerTest, MissingAssociationIsRestoredForCurrentMessage) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    reconciler->syncNow();

    store->removeLabel("m1", LABEL_INBOX);
    EXPECT_CALL(*gateway, getMessage(_)).Times(0);
    reconciler->syncNow();

    EXPECT_THAT(store->labelIdsForMessage("m1"), ElementsAre(LABEL_INBOX));
}

TEST_F(ReconcilerTest, ItemFailureDoesNotAbortThePass) {
    gateway->addMessage(TestMessage("bad", "t1", 2000, "Broken", {LABEL_INBOX}));
    gateway->addMessage(TestMessage("good", "t2", 1000, "Fine", {LABEL_INBOX}));

    EXPECT_CALL(*gateway, getMessage("bad")).WillRepeatedly(Throw(SyncException("server-error", "500 from messages.get", true)));

    EXPECT_FALSE(reconciler->syncNow());

    EXPECT_TRUE(store->messageExists("good"));
    EXPECT_FALSE(store->messageExists("bad"));

    SyncStatus status = state->snapshot();
    EXPECT_EQ(status.phase, SyncPhase::Error);
    EXPECT_NE(status.error.find("getMessage bad"), std::string::npos);
    EXPECT_EQ(status.lastSuccess, 0);
}

TEST_F(ReconcilerTest, LabelListingFailureSkipsOnlyThatLabel) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    gateway->addMessage(TestMessage("m2", "t2", 1000, "Budget", {"WORK"}));

    EXPECT_CALL(*gateway, listMessages("WORK")).WillRepeatedly(Throw(SyncException("offline", "network unreachable", true, true)));

    EXPECT_FALSE(reconciler->syncNow());
    EXPECT_TRUE(store->messageExists("m1"));
    EXPECT_FALSE(store->messageExists("m2"));
}

TEST_F(ReconcilerTest, LabelsFailureFallsBackToCachedLabels) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    reconciler->syncNow();

    gateway->addMessage(TestMessage("m2", "t2", 2000, "Later", {LABEL_INBOX}));
    EXPECT_CALL(*gateway, listLabels()).WillOnce(Throw(SyncException("server-error", "labels.list failed", true)));

    EXPECT_FALSE(reconciler->syncNow());
    EXPECT_TRUE(store->messageExists("m2"));
    EXPECT_EQ(store->allLabels().size(), 2u);
}

TEST_F(ReconcilerTest, CacheReadFailureSkipsOnlyThatLabel) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    EXPECT_TRUE(reconciler->syncNow());

    store->db().exec("DROP TABLE MessageLabel");
    EXPECT_CALL(*gateway, listMessages(LABEL_INBOX)).Times(1);
    EXPECT_CALL(*gateway, listMessages("WORK")).Times(1);

    bool synced = true;
    EXPECT_NO_THROW(synced = reconciler->syncNow());
    EXPECT_FALSE(synced);

    SyncStatus status = state->snapshot();
    EXPECT_EQ(status.phase, SyncPhase::Error);
    EXPECT_EQ(status.error.find("messageIdsForLabel "), 0u);
}

TEST_F(ReconcilerTest, CachedLabelsUnreadableEndsPassWithError) {
    store->db().exec("DROP TABLE Label");
    EXPECT_CALL(*gateway, listLabels()).WillOnce(Throw(SyncException("server-error", "labels.list failed", true)));
    EXPECT_CALL(*gateway, listMessages(_)).Times(0);

    bool synced = true;
    EXPECT_NO_THROW(synced = reconciler->syncNow());
    EXPECT_FALSE(synced);
    EXPECT_EQ(state->snapshot().error.find("listLabels: "), 0u);
}

TEST_F(ReconcilerTest, PrioritizedLabelIsSyncedFirst) {
    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX, "WORK"}));
    reconciler->prioritizeLabel("WORK");

    {
        InSequence seq;
        EXPECT_CALL(*gateway, listMessages("WORK"));
        EXPECT_CALL(*gateway, listMessages(LABEL_INBOX));
    }
    reconciler->syncNow();
}

TEST_F(ReconcilerTest, AuthenticationFailureIsReportedAndThrown) {
    provider->authenticated = false;

    EXPECT_THROW(reconciler->syncNow(), AuthenticationException);

    SyncStatus status = state->snapshot();
    EXPECT_EQ(status.phase, SyncPhase::Error);
    EXPECT_EQ(status.error, "Refresh token was revoked");
    EXPECT_EQ(store->countMessages(), 0);
}

TEST_F(ReconcilerTest, AuthenticationFailureParksLoopUntilWoken) {
    provider->authenticated = false;
    reconciler->start();

    for (int ii = 0; ii < 200 && !reconciler->isParked(); ii ++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(reconciler->isParked());

    gateway->addMessage(TestMessage("m1", "t1", 1000, "Hello", {LABEL_INBOX}));
    provider->authenticated = true;
    reconciler->wake();

    for (int ii = 0; ii < 200 && !store->messageExists("m1"); ii ++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(store->messageExists("m1"));
    reconciler->stop();
}

TEST_F(ReconcilerTest, SyncRaceConvergesAfterRemoteArchiveCompletes) {
    gateway->addMessage(TestMessage("m2", "t2", 1000, "Hello", {LABEL_INBOX, "WORK"}));
    reconciler->syncNow();

    // local archive applied, remote call not yet completed
    store->removeLabel("m2", LABEL_INBOX);

    // a pass in the window reasserts the stale remote state
    reconciler->syncNow();
    EXPECT_THAT(store->labelIdsForMessage("m2"), ElementsAre(LABEL_INBOX, "WORK"));

    // the remote archive lands, the next pass converges
    gateway->mock_setLabel("m2", LABEL_INBOX, false);
    reconciler->syncNow();
    EXPECT_THAT(store->labelIdsForMessage("m2"), ElementsAre("WORK"));
}
