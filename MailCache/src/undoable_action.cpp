//
//  undoable_action.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/undoable_action.hpp"
#include "mailcache/view_state.hpp"
#include "mailcache/models/label.hpp"

#include <memory>


UndoableAction::UndoableAction(Kind kind, Message snapshot, std::string contextLabelId) :
    _kind(kind), _snapshot(snapshot), _contextLabelId(contextLabelId)
{
}

UndoableAction UndoableAction::deleteAction(Message snapshot, std::string contextLabelId) {
    return UndoableAction(Kind::Delete, snapshot, contextLabelId);
}

UndoableAction UndoableAction::archiveAction(Message snapshot) {
    return UndoableAction(Kind::Archive, snapshot, LABEL_INBOX);
}

UndoableAction::Kind UndoableAction::kind() const {
    return _kind;
}

const Message & UndoableAction::snapshot() const {
    return _snapshot;
}

std::string UndoableAction::contextLabelId() const {
    return _contextLabelId;
}

std::string UndoableAction::description() const {
    switch (_kind) {
        case Kind::Delete:
            return "delete";
        case Kind::Archive:
            return "archive";
    }
    return "";
}

void UndoableAction::reverse(ViewState & view) const {
    switch (_kind) {
        case Kind::Delete:
            reverseDelete(view);
            break;
        case Kind::Archive:
            reverseArchive(view);
            break;
    }
}

void UndoableAction::reverseDelete(ViewState & view) const {
    Message restored = _snapshot;
    view.store()->upsertMessage(restored, _contextLabelId);

    std::string viewing = view.currentLabelId();
    if (viewing == _contextLabelId || restored.hasLabel(viewing)) {
        view.restoreToTop(std::make_shared<Message>(restored));
    }

    view.remote()->untrash(restored.id());
}

void UndoableAction::reverseArchive(ViewState & view) const {
    Message restored = _snapshot;
    if (view.store()->messageExists(restored.id())) {
        view.store()->addLabel(restored.id(), LABEL_INBOX);
    } else {
        // removed from the cache since, bring the snapshot back with it
        view.store()->upsertMessage(restored, LABEL_INBOX);
    }

    if (view.currentLabelId() == LABEL_INBOX) {
        auto current = view.store()->findMessage(restored.id());
        view.restoreToTop(current ? current : std::make_shared<Message>(restored));
    }

    view.remote()->unarchive(restored.id());
}
