//
//  remote_task_queue.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/remote_task_queue.hpp"
#include "mailcache/thread_utils.hpp"

#include <chrono>


RemoteTaskQueue::RemoteTaskQueue(SessionProvider * provider) :
    _provider(provider),
    logger(spdlog::get("logger")),
    _thread(nullptr),
    _busy(false),
    _stopped(false)
{
    _thread = new std::thread([this]() {
        SetThreadName("remote");
        run();
    });
}

RemoteTaskQueue::~RemoteTaskQueue() {
    stop();
}

void RemoteTaskQueue::enqueue(RemoteTask task) {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_stopped) {
        logger->warn("Remote task {} for {} queued after shutdown, dropping it.", task.name, task.messageId);
        return;
    }
    _queue.push_back(task);
    _cv.notify_one();
}

void RemoteTaskQueue::trash(std::string messageId) {
    enqueue({"trash", messageId, [messageId](RemoteGateway & gateway) {
        gateway.trash(messageId);
    }});
}

void RemoteTaskQueue::untrash(std::string messageId) {
    enqueue({"untrash", messageId, [messageId](RemoteGateway & gateway) {
        gateway.untrash(messageId);
    }});
}

void RemoteTaskQueue::archive(std::string messageId) {
    enqueue({"archive", messageId, [messageId](RemoteGateway & gateway) {
        gateway.archive(messageId);
    }});
}

void RemoteTaskQueue::unarchive(std::string messageId) {
    enqueue({"unarchive", messageId, [messageId](RemoteGateway & gateway) {
        gateway.unarchive(messageId);
    }});
}

void RemoteTaskQueue::markRead(std::string messageId, bool read) {
    enqueue({read ? "markRead" : "markUnread", messageId, [messageId, read](RemoteGateway & gateway) {
        gateway.markRead(messageId, read);
    }});
}

void RemoteTaskQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(_mtx);
        if (_stopped) {
            return;
        }
        _stopped = true;
        if (_queue.size() > 0) {
            logger->info("Shutting down with {} remote tasks queued, they will not run.", _queue.size());
            _queue.clear();
        }
        _cv.notify_all();
    }
    if (_thread) {
        _thread->join();
        delete _thread;
        _thread = nullptr;
    }
}

bool RemoteTaskQueue::waitUntilIdle(int ms) {
    std::unique_lock<std::mutex> lock(_mtx);
    return _idleCv.wait_for(lock, std::chrono::milliseconds(ms), [this]() {
        return _queue.size() == 0 && !_busy;
    });
}

void RemoteTaskQueue::run() {
    while (true) {
        RemoteTask task;
        {
            std::unique_lock<std::mutex> lock(_mtx);
            _cv.wait(lock, [this]() {
                return _stopped || _queue.size() > 0;
            });
            if (_stopped) {
                _idleCv.notify_all();
                return;
            }
            task = _queue.front();
            _queue.pop_front();
            _busy = true;
        }

        performTask(task);

        {
            std::lock_guard<std::mutex> lock(_mtx);
            _busy = false;
            _idleCv.notify_all();
        }
    }
}

void RemoteTaskQueue::performTask(RemoteTask & task) {
    logger->info("Remote {} for {}", task.name, task.messageId);
    try {
        auto gateway = _provider->gateway();
        task.perform(*gateway);
    } catch (SyncException & ex) {
        logger->error("Remote {} for {} failed: {}", task.name, task.messageId, ex.toJSON().dump());
    } catch (std::exception & ex) {
        logger->error("Remote {} for {} failed: {}", task.name, task.messageId, ex.what());
    }
}
