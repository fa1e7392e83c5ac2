/** Reconciler [MailCache]
 *
 * Author(s): Ben Gotow
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

#ifndef Reconciler_hpp
#define Reconciler_hpp

#include <stdio.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "spdlog/spdlog.h"

#include "mailcache/cache_store.hpp"
#include "mailcache/remote_gateway.hpp"
#include "mailcache/sync_state.hpp"


class Reconciler {
    CacheStore * store;
    SessionProvider * provider;
    SyncState * state;
    std::shared_ptr<spdlog::logger> logger;
    int intervalSeconds;

    std::thread * thread;
    std::mutex wakeMtx;
    std::condition_variable wakeCv;
    bool wakeRequested;
    bool stopRequested;
    bool parked;
    std::string priorityLabelId;

public:
    Reconciler(CacheStore * store, SessionProvider * provider, SyncState * state, int intervalSeconds);
    ~Reconciler();

#pragma mark Thread Control
    void start();
    void run();
    void wake();
    void stop();

    // The label is synced first on the next pass.
    void prioritizeLabel(std::string labelId);

    // True while the loop waits for wake() after an authentication failure.
    bool isParked();

#pragma mark Sync
    // Runs a single pass. Returns false if any item failed, the failure is
    // recorded in the sync state. Throws AuthenticationException.
    bool syncNow();

    std::vector<std::string> syncLabels(RemoteGateway & gateway, std::string & firstError);

    void syncLabel(RemoteGateway & gateway, std::string labelId, std::string & firstError);

private:
    void recordFailure(std::string & firstError, std::string context, std::string message);
};

#endif /* Reconciler_hpp */
