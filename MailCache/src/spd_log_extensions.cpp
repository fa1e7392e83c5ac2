//
//  spd_log_extensions.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/spd_log_extensions.hpp"
#include "mailcache/thread_utils.hpp"

#include <chrono>


static std::mutex spdFlushMtx;
static std::condition_variable spdFlushCV;
static int spdUnflushed = 0;
static bool spdFlushExit = false;

static void runFlushLoop() {
    while (true) {
        std::chrono::system_clock::time_point desiredTime = std::chrono::system_clock::now();
        desiredTime += std::chrono::milliseconds(30000);
        {
            // Wait for a message, or for 30 seconds, whichever happens first
            std::unique_lock<std::mutex> lck(spdFlushMtx);
            spdFlushCV.wait_until(lck, desiredTime);
            if (spdFlushExit) {
                return;
            }
            if (spdUnflushed == 0) {
                continue; // detect, avoid spurious wakes
            }
        }

        // Debounce 1sec for more messages to arrive
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));

        {
            // Perform flush
            std::unique_lock<std::mutex> lck(spdFlushMtx);
            if (spdFlushExit) {
                return;
            }
            auto logger = spdlog::get("logger");
            if (logger) {
                logger->flush();
            }
            spdUnflushed = 0;
        }
    }
}

SPDFlusherSink::SPDFlusherSink() {
    spdFlushExit = false;
    flushThread = new std::thread(runFlushLoop);
}

SPDFlusherSink::~SPDFlusherSink() {
    {
        std::lock_guard<std::mutex> lck(spdFlushMtx);
        spdFlushExit = true;
        spdFlushCV.notify_one();
    }
    flushThread->join();
    delete flushThread;
}

void SPDFlusherSink::log(const spdlog::details::log_msg& msg) {
    // ensure we have a flush queued
    std::lock_guard<std::mutex> lck(spdFlushMtx);
    spdUnflushed += 1;
    spdFlushCV.notify_one();
}

void SPDFlusherSink::flush() {
    // no-op
}

void SPDFlusherSink::set_pattern(const std::string& pattern) {
    // no-op, nothing is formatted
}

void SPDFlusherSink::set_formatter(std::unique_ptr<spdlog::formatter> sink_formatter) {
    // no-op, nothing is formatted
}

void SPDThreadNameFlag::format(const spdlog::details::log_msg& msg, const std::tm& tm_time, spdlog::memory_buf_t& dest) {
    std::string name = GetThreadName(msg.thread_id);
    dest.append(name.data(), name.data() + name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> SPDThreadNameFlag::clone() const {
    return spdlog::details::make_unique<SPDThreadNameFlag>();
}

std::unique_ptr<spdlog::pattern_formatter> SPDFormatterWithThreadNames(const std::string& pattern) {
    auto formatter = spdlog::details::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<SPDThreadNameFlag>('N').set_pattern(pattern);
    return formatter;
}
