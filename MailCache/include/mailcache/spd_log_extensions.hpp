/** SPDLogExtensions [MailCache]
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

#ifndef SPDLogExtensions_h
#define SPDLogExtensions_h

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "spdlog/spdlog.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/sink.h"


/*
 A sink that writes nothing. Every message it sees schedules a debounced
 flush of the "logger" so the rotating file is current within a second or
 two without flushing on every line.
*/
class SPDFlusherSink : public spdlog::sinks::sink {
    std::thread * flushThread;

public:
    SPDFlusherSink();
    ~SPDFlusherSink();

    void log(const spdlog::details::log_msg& msg) override;
    void flush() override;
    void set_pattern(const std::string& pattern) override;
    void set_formatter(std::unique_ptr<spdlog::formatter> sink_formatter) override;
};

// %N in a pattern prints the name given to the thread with SetThreadName.
class SPDThreadNameFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm& tm_time, spdlog::memory_buf_t& dest) override;
    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
};

std::unique_ptr<spdlog::pattern_formatter> SPDFormatterWithThreadNames(const std::string& pattern);

#endif /* SPDLogExtensions_h */
