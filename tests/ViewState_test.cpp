#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailcache/view_state.hpp"
#include "MockRemoteGateway.hpp"
#include <stdlib.h>
#include <memory>

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::NiceMock;

class ViewStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::string("/tmp/mailcache_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name();
        setenv("CONFIG_DIR_PATH", dir.c_str(), 1);
        system(("rm -rf " + dir + " && mkdir -p " + dir).c_str());

        store = new CacheStore(dir + FS_PATH_SEP + "mailcache.db");
        store->migrate();

        std::vector<Label> labels = {
            Label(LABEL_INBOX, "INBOX", LABEL_TYPE_SYSTEM),
            Label("WORK", "Work", LABEL_TYPE_USER),
        };
        store->replaceLabels(labels);

        gateway = std::make_shared<NiceMock<MockRemoteGateway>>();
        gateway->delegateToMailbox();
        for (const auto & label : labels) {
            gateway->addLabel(label);
        }

        addMessage(TestMessage("m1", "t1", 3000, "Lunch plans", {LABEL_INBOX}));
        addMessage(TestMessage("m2", "t2", 2000, "Budget review", {LABEL_INBOX, "WORK"}));
        addMessage(TestMessage("m3", "t2", 1000, "Re: Budget review", {LABEL_INBOX}));

        provider = new StaticSessionProvider(gateway);
        queue = new RemoteTaskQueue(provider);
        view = new ViewState(store, queue, &syncState, 50);
        view->load();
    }

    void TearDown() override {
        delete view;
        delete queue;
        delete provider;
        gateway = nullptr;
        delete store;
        system(("rm -rf " + dir).c_str());
    }

    void addMessage(Message message) {
        gateway->addMessage(message);
        store->upsertMessage(message, "");
    }

    std::vector<std::string> visibleIds() {
        std::vector<std::string> ids;
        for (const auto & message : view->visibleMessages()) {
            ids.push_back(message->id());
        }
        return ids;
    }

    std::string dir;
    CacheStore * store;
    std::shared_ptr<NiceMock<MockRemoteGateway>> gateway;
    StaticSessionProvider * provider;
    RemoteTaskQueue * queue;
    SyncState syncState;
    ViewState * view;
};

TEST_F(ViewStateTest, LoadSelectsInbox) {
    EXPECT_EQ(view->currentLabelId(), LABEL_INBOX);
    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2", "m3"));
    EXPECT_EQ(view->labels().size(), 2u);
    EXPECT_EQ(view->selectedIndex(), 0u);
    EXPECT_EQ(view->threadDetail().size(), 1u);
    EXPECT_FALSE(view->canUndo());
}

TEST_F(ViewStateTest, SelectMessageLoadsThread) {
    EXPECT_TRUE(view->selectMessage(1).success);
    EXPECT_EQ(view->selectedMessage()->id(), "m2");
    EXPECT_EQ(view->threadDetail().size(), 2u);

    EXPECT_FALSE(view->selectMessage(7).success);
    EXPECT_EQ(view->selectedIndex(), 1u);
}

TEST_F(ViewStateTest, DeleteThenUndoRestoresEverything) {
    view->selectMessage(1);
    EXPECT_TRUE(view->deleteSelected().success);

    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m3"));
    EXPECT_FALSE(store->messageExists("m2"));
    EXPECT_EQ(store->search("Budget", 10).size(), 1u);
    EXPECT_EQ(view->undoDepth(), 1u);
    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_TRUE(gateway->mock_isTrashed("m2"));

    CommandResult result = view->undo();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(view->statusText(), "Undone: delete");

    EXPECT_THAT(visibleIds(), ElementsAre("m2", "m1", "m3"));
    EXPECT_EQ(view->selectedMessage()->id(), "m2");
    EXPECT_THAT(store->labelIdsForMessage("m2"), ElementsAre(LABEL_INBOX, "WORK"));
    EXPECT_EQ(store->search("Budget", 10).size(), 2u);
    EXPECT_EQ(view->threadDetail().size(), 2u);
    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_FALSE(gateway->mock_isTrashed("m2"));
    EXPECT_TRUE(gateway->mock_hasLabel("m2", LABEL_INBOX));

    result = view->undo();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(view->statusText(), "Nothing to undo");
}

TEST_F(ViewStateTest, DeleteUpdatesThreadDetail) {
    view->selectMessage(2);
    EXPECT_EQ(view->threadDetail().size(), 2u);

    view->deleteSelected();

    // selection moves to m2, same thread, now one message
    EXPECT_EQ(view->selectedMessage()->id(), "m2");
    ASSERT_EQ(view->threadDetail().size(), 1u);
    EXPECT_EQ(view->threadDetail()[0]->id(), "m2");
}

TEST_F(ViewStateTest, ArchiveFromInboxRemovesAndUndoRestoresToTop) {
    view->selectMessage(2);
    EXPECT_TRUE(view->archiveSelected().success);

    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2"));
    EXPECT_TRUE(store->messageExists("m3"));
    EXPECT_THAT(store->labelIdsForMessage("m3"), IsEmpty());
    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_FALSE(gateway->mock_hasLabel("m3", LABEL_INBOX));

    EXPECT_TRUE(view->undo().success);
    EXPECT_THAT(visibleIds(), ElementsAre("m3", "m1", "m2"));
    EXPECT_EQ(view->selectedIndex(), 0u);
    EXPECT_THAT(store->labelIdsForMessage("m3"), ElementsAre(LABEL_INBOX));
    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_TRUE(gateway->mock_hasLabel("m3", LABEL_INBOX));
}

TEST_F(ViewStateTest, ArchiveFromOtherLabelKeepsMessageVisible) {
    view->selectLabel("WORK");
    EXPECT_THAT(visibleIds(), ElementsAre("m2"));

    EXPECT_TRUE(view->archiveSelected().success);
    EXPECT_THAT(visibleIds(), ElementsAre("m2"));
    EXPECT_THAT(store->labelIdsForMessage("m2"), ElementsAre("WORK"));

    EXPECT_TRUE(view->undo().success);
    EXPECT_EQ(view->statusText(), "Undone: archive");
    EXPECT_THAT(visibleIds(), ElementsAre("m2"));
    EXPECT_THAT(store->labelIdsForMessage("m2"), ElementsAre(LABEL_INBOX, "WORK"));

    view->selectLabel(LABEL_INBOX);
    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2", "m3"));
}

TEST_F(ViewStateTest, UndoIsLastInFirstOut) {
    view->deleteMessage("m1");
    view->archiveMessage("m3");
    EXPECT_EQ(view->undoDepth(), 2u);

    EXPECT_EQ(view->undo().description, "Undone: archive");
    EXPECT_FALSE(store->messageExists("m1"));
    EXPECT_THAT(store->labelIdsForMessage("m3"), ElementsAre(LABEL_INBOX));

    EXPECT_EQ(view->undo().description, "Undone: delete");
    EXPECT_TRUE(store->messageExists("m1"));
    EXPECT_FALSE(view->canUndo());
}

TEST_F(ViewStateTest, UndoDeleteWhileViewingAnotherLabel) {
    view->deleteMessage("m1");
    view->selectLabel("WORK");

    EXPECT_TRUE(view->undo().success);
    EXPECT_THAT(visibleIds(), ElementsAre("m2"));
    EXPECT_THAT(store->labelIdsForMessage("m1"), ElementsAre(LABEL_INBOX));
}

TEST_F(ViewStateTest, DeleteFromSearchResults) {
    view->search("budget");
    EXPECT_EQ(view->currentLabelId(), "");
    EXPECT_EQ(visibleIds().size(), 2u);

    view->deleteMessage("m2");
    EXPECT_EQ(visibleIds().size(), 1u);

    EXPECT_TRUE(view->undo().success);
    EXPECT_EQ(view->visibleMessages()[0]->id(), "m2");
    EXPECT_THAT(store->labelIdsForMessage("m2"), ElementsAre(LABEL_INBOX, "WORK"));

    view->search("");
    EXPECT_EQ(view->currentLabelId(), LABEL_INBOX);
    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2", "m3"));
}

TEST_F(ViewStateTest, SearchWithNoUsableTermShowsNothing) {
    view->search("\"*");
    EXPECT_THAT(visibleIds(), IsEmpty());
    EXPECT_EQ(view->selectedMessage(), nullptr);
    EXPECT_THAT(view->threadDetail(), IsEmpty());
}

TEST_F(ViewStateTest, MarkReadTogglesCacheAndRemote) {
    EXPECT_FALSE(view->selectedMessage()->isRead());

    EXPECT_EQ(view->markRead().description, "mark read");
    EXPECT_TRUE(view->selectedMessage()->isRead());
    EXPECT_TRUE(store->findMessage("m1")->isRead());
    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_TRUE(gateway->mock_getMessage("m1").isRead());

    EXPECT_EQ(view->markRead().description, "mark unread");
    EXPECT_FALSE(store->findMessage("m1")->isRead());
    EXPECT_FALSE(view->canUndo());
}

TEST_F(ViewStateTest, LoadMoreGrowsByPage) {
    ViewState paged(store, queue, &syncState, 2);
    paged.load();
    EXPECT_EQ(paged.visibleMessages().size(), 2u);

    EXPECT_TRUE(paged.loadMore().success);
    EXPECT_EQ(paged.visibleMessages().size(), 3u);

    CommandResult result = paged.loadMore();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.description, "No more messages");
}

TEST_F(ViewStateTest, LoadMoreAfterDelete) {
    ViewState paged(store, queue, &syncState, 2);
    paged.load();
    ASSERT_TRUE(paged.deleteMessage("m1").success);
    EXPECT_EQ(paged.visibleMessages().size(), 1u);

    // the list is shorter than the page, but m3 is still in the cache
    EXPECT_TRUE(paged.loadMore().success);
    ASSERT_EQ(paged.visibleMessages().size(), 2u);
    EXPECT_EQ(paged.visibleMessages()[0]->id(), "m2");
    EXPECT_EQ(paged.visibleMessages()[1]->id(), "m3");

    EXPECT_EQ(paged.loadMore().description, "No more messages");
}

TEST_F(ViewStateTest, LoadMoreInSearchResults) {
    ViewState paged(store, queue, &syncState, 1);
    paged.load();
    paged.search("budget");
    EXPECT_EQ(paged.visibleMessages().size(), 1u);

    EXPECT_TRUE(paged.loadMore().success);
    EXPECT_EQ(paged.visibleMessages().size(), 2u);
    EXPECT_FALSE(paged.loadMore().success);
}

TEST_F(ViewStateTest, FailedDeleteLeavesNothingToUndo) {
    store->db().exec("CREATE TRIGGER FailDelete BEFORE DELETE ON Message BEGIN SELECT RAISE(ABORT, 'disk full'); END");
    view->selectMessage(1);

    CommandResult result = view->deleteSelected();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(view->statusText(), "Delete failed");
    EXPECT_FALSE(view->canUndo());
    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2", "m3"));
    EXPECT_EQ(view->selectedIndex(), 1u);
    EXPECT_EQ(view->threadDetail().size(), 2u);
    EXPECT_TRUE(store->messageExists("m2"));

    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_FALSE(gateway->mock_isTrashed("m2"));
    EXPECT_EQ(view->undo().description, "Nothing to undo");
}

TEST_F(ViewStateTest, FailedArchiveLeavesNothingToUndo) {
    store->db().exec("CREATE TRIGGER FailUnlabel BEFORE DELETE ON MessageLabel BEGIN SELECT RAISE(ABORT, 'disk full'); END");

    CommandResult result = view->archiveMessage("m1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(view->statusText(), "Archive failed");
    EXPECT_FALSE(view->canUndo());
    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2", "m3"));
    EXPECT_THAT(store->labelIdsForMessage("m1"), ElementsAre(LABEL_INBOX));

    ASSERT_TRUE(queue->waitUntilIdle(2000));
    EXPECT_TRUE(gateway->mock_hasLabel("m1", LABEL_INBOX));
}

TEST_F(ViewStateTest, StorageErrorsAreReportedNotThrown) {
    store->db().exec("DROP TABLE MessageLabel");
    store->db().exec("DROP TABLE MessageSearch");

    CommandResult result;
    EXPECT_NO_THROW(result = view->selectLabel("WORK"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(view->currentLabelId(), LABEL_INBOX);
    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2", "m3"));

    EXPECT_NO_THROW(result = view->search("budget"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(view->statusText(), "Search failed");

    EXPECT_NO_THROW(result = view->refresh());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(view->statusText(), "Refresh failed");

    EXPECT_NO_THROW(result = view->loadMore());
    EXPECT_FALSE(result.success);

    EXPECT_NO_THROW(result = view->deleteMessage("m2"));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(view->canUndo());
    EXPECT_THAT(visibleIds(), ElementsAre("m1", "m2", "m3"));
}

TEST_F(ViewStateTest, RefreshPicksUpWritesAndKeepsStatus) {
    auto deltas = std::make_shared<DeltaStream>();
    store->setDeltaStream(deltas);
    view->setDeltaStream(deltas);

    view->deleteMessage("m3");
    view->undo();
    EXPECT_EQ(view->statusText(), "Undone: delete");

    Message fresh = TestMessage("m4", "t4", 4000, "Fresh", {});
    store->upsertMessage(fresh, LABEL_INBOX);
    view->refresh();

    EXPECT_EQ(view->visibleMessages()[0]->id(), "m4");
    EXPECT_EQ(view->statusText(), "Undone: delete");
    EXPECT_THAT(deltas->drain(), IsEmpty());

    view->selectMessage(0);
    EXPECT_EQ(view->statusText(), "");
}

TEST_F(ViewStateTest, SyncStatusIsShown) {
    EXPECT_EQ(view->syncStatusText(), "Not synced yet");
    syncState.beginPass();
    syncState.beginLabel("WORK");
    EXPECT_EQ(view->syncStatusText(), "Syncing WORK...");
}
