//
//  view_state.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/view_state.hpp"
#include "mailcache/models/label.hpp"

#include <algorithm>


ViewState::ViewState(CacheStore * store, RemoteTaskQueue * remote, SyncState * syncState, int pageSize) :
    _store(store),
    _remote(remote),
    _syncState(syncState),
    _reconciler(nullptr),
    _deltas(nullptr),
    logger(spdlog::get("logger")),
    _pageSize(pageSize),
    _labels(),
    _currentLabelId(""),
    _searchTerm(""),
    _limit(pageSize),
    _messages(),
    _selectedIndex(0),
    _threadDetail(),
    _journal(),
    _statusText("")
{
}

void ViewState::setReconciler(Reconciler * reconciler) {
    _reconciler = reconciler;
}

void ViewState::setDeltaStream(std::shared_ptr<DeltaStream> deltas) {
    _deltas = deltas;
}

void ViewState::load() {
    _labels = _store->allLabels();
    _currentLabelId = "";
    for (const auto & label : _labels) {
        if (label->id() == LABEL_INBOX) {
            _currentLabelId = LABEL_INBOX;
        }
    }
    if (_currentLabelId == "" && _labels.size() > 0) {
        _currentLabelId = _labels.front()->id();
    }
    _searchTerm = "";
    _limit = _pageSize;
    _selectedIndex = 0;
    reloadMessages();
}

#pragma mark Commands

CommandResult ViewState::selectLabel(std::string labelId) {
    _statusText = "";

    std::vector<std::shared_ptr<Message>> messages;
    try {
        messages = queryMessages(labelId, "", _pageSize);
    } catch (SQLite::Exception & ex) {
        logger->error("Loading label {} failed: {}", labelId, ex.what());
        _statusText = "Could not load " + labelId;
        return CommandResult{false, _statusText};
    }

    _currentLabelId = labelId;
    _searchTerm = "";
    _limit = _pageSize;
    _selectedIndex = 0;
    _messages = messages;
    clampSelection();
    refreshThreadDetail();

    if (_reconciler) {
        _reconciler->prioritizeLabel(labelId);
    }
    return CommandResult{true, "select " + labelId};
}

CommandResult ViewState::selectMessage(size_t index) {
    _statusText = "";
    if (index >= _messages.size()) {
        return CommandResult{false, "No message at " + std::to_string(index)};
    }
    _selectedIndex = index;
    refreshThreadDetail();
    return CommandResult{true, "select " + _messages[index]->id()};
}

CommandResult ViewState::markRead() {
    _statusText = "";
    auto message = selectedMessage();
    if (message == nullptr) {
        return CommandResult{false, "No message selected"};
    }

    bool read = !message->isRead();
    try {
        _store->setRead(message->id(), read);
    } catch (SQLite::Exception & ex) {
        logger->error("Marking {} as read={} failed: {}", message->id(), read, ex.what());
        _statusText = "Mark as read failed";
        return CommandResult{false, _statusText};
    }
    message->setRead(read);
    _remote->markRead(message->id(), read);

    return CommandResult{true, read ? "mark read" : "mark unread"};
}

CommandResult ViewState::deleteSelected() {
    auto message = selectedMessage();
    if (message == nullptr) {
        _statusText = "";
        return CommandResult{false, "No message selected"};
    }
    return deleteMessage(message->id());
}

CommandResult ViewState::deleteMessage(std::string id) {
    _statusText = "";

    long index = indexOfMessage(id);
    std::shared_ptr<Message> visible = index >= 0 ? _messages[(size_t)index] : nullptr;
    size_t selected = _selectedIndex;
    bool recorded = false;

    try {
        std::shared_ptr<Message> cached = _store->findMessage(id);
        if (cached == nullptr && visible == nullptr) {
            return CommandResult{false, "Message " + id + " not found"};
        }

        Message snapshot = cached ? *cached : *visible;
        if (cached) {
            snapshot.setLabelIds(_store->labelIdsForMessage(id));
        }
        std::string context = _searchTerm != "" ? "" : _currentLabelId;
        _journal.record(UndoableAction::deleteAction(snapshot, context));
        recorded = true;

        if (visible) {
            removeVisibleAt((size_t)index);
        }
        _store->removeMessage(id);

    } catch (SQLite::Exception & ex) {
        logger->error("Removing {} from the cache failed: {}", id, ex.what());
        if (recorded) {
            _journal.discardLast();
        }
        if (visible) {
            restoreVisibleAt((size_t)index, visible, selected);
        }
        _statusText = "Delete failed";
        refreshThreadDetail();
        return CommandResult{false, _statusText};
    }

    _remote->trash(id);
    refreshThreadDetail();

    return CommandResult{true, "delete"};
}

CommandResult ViewState::archiveSelected() {
    auto message = selectedMessage();
    if (message == nullptr) {
        _statusText = "";
        return CommandResult{false, "No message selected"};
    }
    return archiveMessage(message->id());
}

CommandResult ViewState::archiveMessage(std::string id) {
    _statusText = "";

    long index = indexOfMessage(id);
    std::shared_ptr<Message> visible = index >= 0 ? _messages[(size_t)index] : nullptr;
    size_t selected = _selectedIndex;
    bool recorded = false;
    bool hidden = false;

    try {
        std::shared_ptr<Message> cached = _store->findMessage(id);
        if (cached == nullptr && visible == nullptr) {
            return CommandResult{false, "Message " + id + " not found"};
        }

        Message snapshot = cached ? *cached : *visible;
        if (cached) {
            snapshot.setLabelIds(_store->labelIdsForMessage(id));
        }
        _journal.record(UndoableAction::archiveAction(snapshot));
        recorded = true;

        // other labels keep showing the message after it leaves the inbox
        if (visible && _searchTerm == "" && _currentLabelId == LABEL_INBOX) {
            removeVisibleAt((size_t)index);
            hidden = true;
        }
        _store->removeLabel(id, LABEL_INBOX);

    } catch (SQLite::Exception & ex) {
        logger->error("Removing {} from the inbox failed: {}", id, ex.what());
        if (recorded) {
            _journal.discardLast();
        }
        if (hidden) {
            restoreVisibleAt((size_t)index, visible, selected);
        }
        _statusText = "Archive failed";
        refreshThreadDetail();
        return CommandResult{false, _statusText};
    }

    _remote->archive(id);
    refreshThreadDetail();

    return CommandResult{true, "archive"};
}

CommandResult ViewState::undo() {
    CommandResult result = _journal.undoLast(*this);
    _statusText = result.description;
    if (result.success) {
        refreshThreadDetail();
    }
    return result;
}

CommandResult ViewState::search(std::string term) {
    _statusText = "";

    std::vector<std::shared_ptr<Message>> messages;
    try {
        messages = queryMessages(_currentLabelId, term, _pageSize);
    } catch (SQLite::Exception & ex) {
        logger->error("Search for \"{}\" failed: {}", term, ex.what());
        _statusText = "Search failed";
        return CommandResult{false, _statusText};
    }

    _searchTerm = term;
    _limit = _pageSize;
    _selectedIndex = 0;
    _messages = messages;
    clampSelection();
    refreshThreadDetail();
    return CommandResult{true, term == "" ? "clear search" : "search"};
}

CommandResult ViewState::loadMore() {
    _statusText = "";

    // deletes and archives shrink the visible list below the limit
    size_t before = _messages.size();
    std::vector<std::shared_ptr<Message>> messages;
    try {
        messages = queryMessages(_currentLabelId, _searchTerm, _limit + _pageSize);
    } catch (SQLite::Exception & ex) {
        logger->error("Loading more messages failed: {}", ex.what());
        _statusText = "Load more failed";
        return CommandResult{false, _statusText};
    }
    if (messages.size() <= before) {
        return CommandResult{false, "No more messages"};
    }

    _limit += _pageSize;
    _messages = messages;
    clampSelection();
    refreshThreadDetail();
    return CommandResult{true, "load more"};
}

CommandResult ViewState::refresh() {
    if (_deltas) {
        auto deltas = _deltas->drain();
        if (deltas.size() > 0) {
            logger->info("Refreshing after {} change notifications", deltas.size());
        }
    }

    std::vector<std::shared_ptr<Label>> labels;
    std::vector<std::shared_ptr<Message>> messages;
    try {
        labels = _store->allLabels();
        messages = queryMessages(_currentLabelId, _searchTerm, _limit);
    } catch (SQLite::Exception & ex) {
        logger->error("Refresh failed: {}", ex.what());
        _statusText = "Refresh failed";
        return CommandResult{false, _statusText};
    }

    _labels = labels;
    _messages = messages;
    clampSelection();
    refreshThreadDetail();
    return CommandResult{true, "refresh"};
}

#pragma mark Queries

const std::vector<std::shared_ptr<Message>> & ViewState::visibleMessages() const {
    return _messages;
}

const std::vector<std::shared_ptr<Message>> & ViewState::threadDetail() const {
    return _threadDetail;
}

const std::vector<std::shared_ptr<Label>> & ViewState::labels() const {
    return _labels;
}

std::shared_ptr<Message> ViewState::selectedMessage() const {
    if (_selectedIndex < _messages.size()) {
        return _messages[_selectedIndex];
    }
    return nullptr;
}

size_t ViewState::selectedIndex() const {
    return _selectedIndex;
}

std::string ViewState::currentLabelId() const {
    if (_searchTerm != "") {
        return "";
    }
    return _currentLabelId;
}

std::string ViewState::searchTerm() const {
    return _searchTerm;
}

std::string ViewState::statusText() const {
    return _statusText;
}

std::string ViewState::syncStatusText() const {
    if (_syncState == nullptr) {
        return "";
    }
    return _syncState->statusText();
}

bool ViewState::canUndo() const {
    return !_journal.empty();
}

size_t ViewState::undoDepth() const {
    return _journal.size();
}

#pragma mark Journal Support

CacheStore * ViewState::store() {
    return _store;
}

RemoteTaskQueue * ViewState::remote() {
    return _remote;
}

void ViewState::restoreToTop(std::shared_ptr<Message> message) {
    if (indexOfMessage(message->id()) >= 0) {
        return;
    }
    _messages.insert(_messages.begin(), message);
    _selectedIndex = 0;
}

void ViewState::refreshThreadDetail() {
    auto message = selectedMessage();
    if (message == nullptr) {
        _threadDetail = {};
        return;
    }
    try {
        _threadDetail = _store->queryThread(message->threadId());
    } catch (SQLite::Exception & ex) {
        logger->error("Loading thread {} failed: {}", message->threadId(), ex.what());
        _threadDetail = {message};
    }
}

#pragma mark Private

void ViewState::reloadMessages() {
    _messages = queryMessages(_currentLabelId, _searchTerm, _limit);
    clampSelection();
    refreshThreadDetail();
}

std::vector<std::shared_ptr<Message>> ViewState::queryMessages(std::string labelId, std::string term, int limit) {
    if (term != "") {
        return _store->search(term, limit);
    }
    if (labelId != "") {
        return _store->queryByLabel(labelId, limit, 0);
    }
    return {};
}

long ViewState::indexOfMessage(std::string id) const {
    for (size_t ii = 0; ii < _messages.size(); ii ++) {
        if (_messages[ii]->id() == id) {
            return (long)ii;
        }
    }
    return -1;
}

void ViewState::removeVisibleAt(size_t index) {
    _messages.erase(_messages.begin() + index);
    clampSelection();
}

void ViewState::restoreVisibleAt(size_t index, std::shared_ptr<Message> message, size_t selectedIndex) {
    if (indexOfMessage(message->id()) >= 0) {
        return;
    }
    _messages.insert(_messages.begin() + std::min(index, _messages.size()), message);
    _selectedIndex = selectedIndex;
    clampSelection();
}

void ViewState::clampSelection() {
    if (_messages.empty()) {
        _selectedIndex = 0;
    } else if (_selectedIndex >= _messages.size()) {
        _selectedIndex = _messages.size() - 1;
    }
}
