//
//  action_journal.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/action_journal.hpp"
#include "mailcache/view_state.hpp"

#include "SQLiteCpp/SQLiteCpp.h"


ActionJournal::ActionJournal() : _entries() {
}

void ActionJournal::record(UndoableAction action) {
    spdlog::get("logger")->info("Recorded {} of {}", action.description(), action.snapshot().id());
    _entries.push_back(action);
}

CommandResult ActionJournal::undoLast(ViewState & view) {
    if (_entries.empty()) {
        return CommandResult{false, "Nothing to undo"};
    }

    UndoableAction action = _entries.back();
    _entries.pop_back();

    try {
        action.reverse(view);
    } catch (SQLite::Exception & ex) {
        spdlog::get("logger")->error("Undo of {} for {} failed: {}", action.description(), action.snapshot().id(), ex.what());
        return CommandResult{false, "Undo failed: " + std::string(ex.what())};
    }

    spdlog::get("logger")->info("Undid {} of {}", action.description(), action.snapshot().id());
    return CommandResult{true, "Undone: " + action.description()};
}

void ActionJournal::discardLast() {
    if (_entries.empty()) {
        return;
    }
    spdlog::get("logger")->info("Discarded {} of {}", _entries.back().description(), _entries.back().snapshot().id());
    _entries.pop_back();
}

size_t ActionJournal::size() const {
    return _entries.size();
}

bool ActionJournal::empty() const {
    return _entries.empty();
}

void ActionJournal::clear() {
    _entries.clear();
}
