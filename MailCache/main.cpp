//
//  main.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "mailcache/cache_config.hpp"
#include "mailcache/cache_store.hpp"
#include "mailcache/mail_utils.hpp"
#include "mailcache/spd_log_extensions.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/thread_utils.hpp"

using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;


struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path mailcache [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, MODE, QUERY, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tRequired: migrate, inspect, or search." },
    {QUERY,   0,"q", "query",   CArg::Optional,  "  --query, -q  \tOptional: search term for --mode search." },
    {ORPHAN,  0,"o", "orphan",  CArg::None,      "  --orphan, -o  \tOptional: log to the console instead of mailcache.log." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log debug output." },
    {0,0,0,0,0,0}
};

int runSingleFunctionAndExit(std::function<nlohmann::json()> fn) {
    nlohmann::json resp = {{"error", nullptr}};
    int code = 0;
    try {
        resp["result"] = fn();
    } catch (SyncException & ex) {
        resp["error"] = ex.toJSON();
        code = 1;
    } catch (std::exception & ex) {
        resp["error"] = ex.what();
        code = 1;
    }
    std::cout << "\n" << resp.dump() << std::endl;
    return code;
}

nlohmann::json runInspect(CacheStore & store) {
    nlohmann::json labels = nlohmann::json::array();
    for (const auto & label : store.allLabels()) {
        labels.push_back({
            {"id", label->id()},
            {"name", label->displayName()},
            {"type", label->type()},
            {"messages", store.countMessagesForLabel(label->id())},
        });
    }
    return {
        {"messages", store.countMessages()},
        {"labels", labels},
    };
}

nlohmann::json runSearch(CacheStore & store, std::string term, int limit) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto & message : store.search(term, limit)) {
        results.push_back({
            {"id", message->id()},
            {"threadId", message->threadId()},
            {"from", message->fromAddress()},
            {"subject", message->subject()},
            {"date", MailUtils::timestampForTime((time_t)(message->internalDate() / 1000))},
            {"labelIds", store.labelIdsForMessage(message->id())},
        });
    }
    return results;
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // indicate we use cout, not stdout
    std::cout.sync_with_stdio(false);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || argc == 0 || !options[MODE]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // check required environment
    std::string eConfigDirPath = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (eConfigDirPath == "") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    CacheConfig config;
    try {
        config = CacheConfig::load();
    } catch (SyncException & ex) {
        std::cout << "\n" << nlohmann::json({{"error", ex.toJSON()}}).dump() << std::endl;
        return 1;
    }

    // keep SQLite's temporary files next to the database
    sqlite3_temp_directory = sqlite3_mprintf("%s", eConfigDirPath.c_str());

    // setup logging to file or console
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;

    if (!options[ORPHAN]) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.logPath(), 1048576 * 5, 3);
        fileSink->set_formatter(SPDFormatterWithThreadNames("%P [%N] %+"));
        sinks.push_back(fileSink);
        sinks.push_back(std::make_shared<SPDFlusherSink>());
    } else {
        auto consoleSink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
        consoleSink->set_formatter(SPDFormatterWithThreadNames("[%N] %l: %v"));
        sinks.push_back(consoleSink);
    }

    // Always log critical errors to the stderr as well as a log file / stdout.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = std::make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    spdlog::register_logger(logger);

    if (options[VERBOSE] || config.verbose) {
        logger->set_level(spdlog::level::debug);
    }
    logger->debug("Loaded config {}", config.toJSON().dump());

    std::string mode(options[MODE].arg);

    if (mode == "migrate") {
        return runSingleFunctionAndExit([&config]() {
            CacheStore store(config.databasePath());
            store.migrate();
            return nlohmann::json("ok");
        });
    }

    if (mode == "inspect") {
        return runSingleFunctionAndExit([&config]() {
            CacheStore store(config.databasePath());
            store.migrate();
            return runInspect(store);
        });
    }

    if (mode == "search") {
        std::string term = options[QUERY].count() > 0 && options[QUERY].arg ? options[QUERY].arg : "";
        return runSingleFunctionAndExit([&config, term]() {
            CacheStore store(config.databasePath());
            store.migrate();
            return runSearch(store, term, config.pageSize);
        });
    }

    option::printUsage(std::cout, usage);
    return 1;
}
