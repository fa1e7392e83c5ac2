/** UndoableAction [MailCache]
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

#ifndef UndoableAction_hpp
#define UndoableAction_hpp

#include <string>

#include "mailcache/models/message.hpp"

class ViewState;

/*
 A user action that can be reversed. The message is a deep copy taken
 when the action was applied, including the labels the cache had for it,
 so later writes to the cache don't change what an undo restores.

 Each kind has exactly one reversal. Adding a kind means adding a case
 to Kind and its reverse function.
*/
class UndoableAction {
public:
    enum class Kind {
        Delete,
        Archive
    };

private:
    Kind _kind;
    Message _snapshot;
    std::string _contextLabelId;

    UndoableAction(Kind kind, Message snapshot, std::string contextLabelId);

public:
    // contextLabelId is empty when the message was deleted from a search result list
    static UndoableAction deleteAction(Message snapshot, std::string contextLabelId);
    static UndoableAction archiveAction(Message snapshot);

    Kind kind() const;
    const Message & snapshot() const;
    std::string contextLabelId() const;

    // "delete" / "archive"
    std::string description() const;

    // Writes the cache first and throws if that fails, in which case the
    // view has not been touched. Remote calls are queued, never awaited.
    void reverse(ViewState & view) const;

private:
    void reverseDelete(ViewState & view) const;
    void reverseArchive(ViewState & view) const;
};

#endif /* UndoableAction_hpp */
