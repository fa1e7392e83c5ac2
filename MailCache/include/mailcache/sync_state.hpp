/** SyncState [MailCache]
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

#ifndef SyncState_hpp
#define SyncState_hpp

#include <stdio.h>
#include <time.h>
#include <mutex>
#include <set>
#include <string>

#include "nlohmann/json.hpp"

enum class SyncPhase {
    Idle,
    Syncing,
    Error
};

struct SyncStatus {
    SyncPhase phase;
    std::string error;
    time_t lastSuccess;
    std::string currentLabelId;
    std::set<std::string> syncedLabelIds;

    nlohmann::json toJSON() const;
};

/*
 Progress of the reconciler, shared with whoever displays it. Owned by the
 caller and handed to both sides, every access goes through the mutex.
*/
class SyncState {
    mutable std::mutex _mtx;
    SyncStatus _status;

public:
    SyncState();

    void beginPass();
    void beginLabel(std::string labelId);
    void finishLabel(std::string labelId);

    // An empty error marks the pass successful.
    void finishPass(std::string error);

    SyncStatus snapshot() const;

    bool hasSynced(std::string labelId) const;

    std::string statusText() const;
};

#endif /* SyncState_hpp */
