//
//  thread_utils.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/thread_utils.hpp"
#include "spdlog/details/os.h"

#include <stdio.h>
#include <map>
#include <mutex>
#include <thread>

#include <unistd.h>

static std::map<size_t, std::string> names{};
static std::mutex namesMtx;

#ifdef _POSIX_THREADS
#include <pthread.h>

void SetThreadName(const char* threadName)
{
    namesMtx.lock();
    names[spdlog::details::os::thread_id()] = threadName;
    namesMtx.unlock();
#ifdef __APPLE__
    pthread_setname_np(threadName);
#else
    pthread_setname_np(pthread_self(), threadName);
#endif
}

#else

#include <sys/prctl.h>

void SetThreadName(const char* threadName)
{
    namesMtx.lock();
    names[spdlog::details::os::thread_id()] = threadName;
    namesMtx.unlock();
    prctl(PR_SET_NAME, threadName, 0, 0, 0);
}

#endif // pthread

std::string GetThreadName(size_t spdlog_thread_id) {
    std::lock_guard<std::mutex> lock(namesMtx);
    auto it = names.find(spdlog_thread_id);
    if (it == names.end()) {
        return std::to_string(spdlog_thread_id);
    }
    return it->second;
}
