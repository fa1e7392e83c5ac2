/** RemoteTaskQueue [MailCache]
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

#ifndef RemoteTaskQueue_hpp
#define RemoteTaskQueue_hpp

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "spdlog/spdlog.h"

#include "mailcache/remote_gateway.hpp"


struct RemoteTask {
    std::string name;
    std::string messageId;
    std::function<void(RemoteGateway &)> perform;
};

/*
 Runs remote calls triggered by user actions on one background thread, in
 the order they were queued, so an untrash never overtakes its trash.
 Nobody waits on these: failures are logged and the next reconciler pass
 picks up whatever state the service ended up in.
*/
class RemoteTaskQueue {
    SessionProvider * _provider;
    std::shared_ptr<spdlog::logger> logger;

    std::thread * _thread;
    std::mutex _mtx;
    std::condition_variable _cv;
    std::condition_variable _idleCv;
    std::deque<RemoteTask> _queue;
    bool _busy;
    bool _stopped;

public:
    RemoteTaskQueue(SessionProvider * provider);
    ~RemoteTaskQueue();

    void enqueue(RemoteTask task);

    void trash(std::string messageId);
    void untrash(std::string messageId);
    void archive(std::string messageId);
    void unarchive(std::string messageId);
    void markRead(std::string messageId, bool read);

    // Finishes the task in flight, drops the rest.
    void stop();

    // Returns false if the queue did not drain within the timeout.
    bool waitUntilIdle(int ms);

private:
    void run();
    void performTask(RemoteTask & task);
};

#endif /* RemoteTaskQueue_hpp */
