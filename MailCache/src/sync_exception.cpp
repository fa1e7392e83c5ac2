//
//  sync_exception.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/sync_exception.hpp"

SyncException::SyncException(std::string key, std::string di, bool retryable) :
    GenericException(key + ": " + di), retryable(retryable), key(key), debuginfo(di)
{
}

SyncException::SyncException(std::string key, std::string di, bool retryable, bool offline) :
    GenericException(key + ": " + di), retryable(retryable), offline(offline), key(key), debuginfo(di)
{
}

bool SyncException::isRetryable() {
    return retryable;
}

bool SyncException::isOffline() {
    return offline;
}

bool SyncException::isAuthentication() {
    return false;
}

nlohmann::json SyncException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}

AuthenticationException::AuthenticationException(std::string di) :
    SyncException("authentication", di, false)
{
}

bool AuthenticationException::isAuthentication() {
    return true;
}
