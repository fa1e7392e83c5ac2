//
//  cache_store_transaction.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/cache_store_transaction.hpp"

#include "spdlog/spdlog.h"

using namespace std::chrono;


CacheStoreTransaction::CacheStoreTransaction(CacheStore * store, std::string nameHint) :
    mStore(store), mCommited(false), mStart(system_clock::now()), mBegan(system_clock::now()), mNameHint(nameHint)
{
    mStore->beginTransaction();
    mBegan = system_clock::now();
}

CacheStoreTransaction::~CacheStoreTransaction() noexcept // nothrow
{
    if (false == mCommited) {
        try {
            mStore->rollbackTransaction();
        } catch (SQLite::Exception & ex) {
            // Never throw an exception in a destructor
            spdlog::get("logger")->warn("Rollback of transaction={} failed: {}", mNameHint, ex.what());
        }
    }
}

void CacheStoreTransaction::commit()
{
    if (false == mCommited) {
        mStore->commitTransaction();
        mCommited = true;

        auto now = system_clock::now();
        auto elapsed = now - mStart;
        long long milliseconds = duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (milliseconds > 80) { // 80ms
            long long waiting = duration_cast<std::chrono::milliseconds>(mBegan - mStart).count();
            spdlog::get("logger")->warn("[SLOW] Transaction={} > 80ms ({}ms, {} waiting to aquire)", mNameHint, milliseconds, waiting);
        }

    } else {
        throw SQLite::Exception("Transaction already commited.");
    }
}
