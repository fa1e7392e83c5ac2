/** ActionJournal [MailCache]
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

#ifndef ActionJournal_hpp
#define ActionJournal_hpp

#include <stddef.h>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "mailcache/undoable_action.hpp"

class ViewState;

struct CommandResult {
    bool success;
    std::string description;
};

/*
 LIFO of reversible actions for this session. Lives only in memory and is
 only touched from the interactive thread. An entry popped by undoLast is
 never pushed back, even when reversing it fails.
*/
class ActionJournal {
    std::vector<UndoableAction> _entries;

public:
    ActionJournal();

    void record(UndoableAction action);

    CommandResult undoLast(ViewState & view);

    // Drops the newest entry without reversing it, for an action whose
    // cache write failed after it was recorded.
    void discardLast();

    size_t size() const;
    bool empty() const;
    void clear();
};

#endif /* ActionJournal_hpp */
