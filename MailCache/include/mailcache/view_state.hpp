/** ViewState [MailCache]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef ViewState_hpp
#define ViewState_hpp

#include <stddef.h>
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "mailcache/action_journal.hpp"
#include "mailcache/cache_store.hpp"
#include "mailcache/delta_stream.hpp"
#include "mailcache/reconciler.hpp"
#include "mailcache/remote_task_queue.hpp"
#include "mailcache/sync_state.hpp"


/*
 What the presentation layer shows: the label list, the messages of the
 selected label (or of a search), the selection and its thread, and a
 transient status line. Owned by the interactive thread, not thread safe.

 Commands apply to the view and the cache synchronously. Remote calls go
 through the RemoteTaskQueue and never block a command.
*/
class ViewState {
    CacheStore * _store;
    RemoteTaskQueue * _remote;
    SyncState * _syncState;
    Reconciler * _reconciler;
    std::shared_ptr<DeltaStream> _deltas;
    std::shared_ptr<spdlog::logger> logger;
    int _pageSize;

    std::vector<std::shared_ptr<Label>> _labels;
    std::string _currentLabelId;
    std::string _searchTerm;
    int _limit;

    std::vector<std::shared_ptr<Message>> _messages;
    size_t _selectedIndex;
    std::vector<std::shared_ptr<Message>> _threadDetail;

    ActionJournal _journal;
    std::string _statusText;

public:
    ViewState(CacheStore * store, RemoteTaskQueue * remote, SyncState * syncState, int pageSize);

    // Optional: selecting a label asks the reconciler to sync it first.
    void setReconciler(Reconciler * reconciler);

    // Optional: refresh() drains it before reloading.
    void setDeltaStream(std::shared_ptr<DeltaStream> deltas);

    // Loads labels and selects INBOX, or the first label if there is none.
    void load();

#pragma mark Commands

    CommandResult selectLabel(std::string labelId);
    CommandResult selectMessage(size_t index);
    CommandResult markRead();
    CommandResult deleteSelected();
    CommandResult deleteMessage(std::string id);
    CommandResult archiveSelected();
    CommandResult archiveMessage(std::string id);
    CommandResult undo();
    CommandResult search(std::string term);
    CommandResult loadMore();
    CommandResult refresh();

#pragma mark Queries

    const std::vector<std::shared_ptr<Message>> & visibleMessages() const;
    const std::vector<std::shared_ptr<Message>> & threadDetail() const;
    const std::vector<std::shared_ptr<Label>> & labels() const;
    std::shared_ptr<Message> selectedMessage() const;
    size_t selectedIndex() const;
    std::string currentLabelId() const;
    std::string searchTerm() const;
    std::string statusText() const;
    std::string syncStatusText() const;
    bool canUndo() const;
    size_t undoDepth() const;

#pragma mark Journal Support

    CacheStore * store();
    RemoteTaskQueue * remote();

    // Puts the message first in the visible list unless it is already shown.
    void restoreToTop(std::shared_ptr<Message> message);

    void refreshThreadDetail();

private:
    // Throws SQLite::Exception, callers leave the view unchanged on failure.
    void reloadMessages();
    std::vector<std::shared_ptr<Message>> queryMessages(std::string labelId, std::string term, int limit);
    long indexOfMessage(std::string id) const;
    void removeVisibleAt(size_t index);
    void restoreVisibleAt(size_t index, std::shared_ptr<Message> message, size_t selectedIndex);
    void clampSelection();
};

#endif /* ViewState_hpp */
