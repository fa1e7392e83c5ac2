//
//  reconciler.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/reconciler.hpp"
#include "mailcache/thread_utils.hpp"

#include <algorithm>
#include <chrono>


Reconciler::Reconciler(CacheStore * store, SessionProvider * provider, SyncState * state, int intervalSeconds) :
    store(store),
    provider(provider),
    state(state),
    logger(spdlog::get("logger")),
    intervalSeconds(intervalSeconds),
    thread(nullptr),
    wakeRequested(false),
    stopRequested(false),
    parked(false),
    priorityLabelId("")
{
}

Reconciler::~Reconciler() {
    stop();
}

#pragma mark Thread Control

void Reconciler::start() {
    if (thread) {
        return;
    }
    thread = new std::thread([this]() {
        SetThreadName("reconciler");
        run();
    });
}

void Reconciler::run() {
    while (true) {
        {
            std::lock_guard<std::mutex> lck(wakeMtx);
            if (stopRequested) {
                return;
            }
        }

        try {
            syncNow();
        } catch (AuthenticationException & ex) {
            logger->error("Authentication failed, sync paused until woken: {}", ex.toJSON().dump());
            std::lock_guard<std::mutex> lck(wakeMtx);
            parked = true;
        } catch (std::exception & ex) {
            logger->error("Sync pass aborted: {}", ex.what());
            state->finishPass(ex.what());
        }

        std::unique_lock<std::mutex> lck(wakeMtx);
        if (parked) {
            wakeCv.wait(lck, [this]() { return wakeRequested || stopRequested; });
            parked = false;
        } else {
            wakeCv.wait_for(lck, std::chrono::seconds(intervalSeconds), [this]() { return wakeRequested || stopRequested; });
        }
        wakeRequested = false;
    }
}

void Reconciler::wake() {
    std::lock_guard<std::mutex> lck(wakeMtx);
    wakeRequested = true;
    wakeCv.notify_one();
}

void Reconciler::stop() {
    {
        std::lock_guard<std::mutex> lck(wakeMtx);
        stopRequested = true;
        wakeCv.notify_one();
    }
    if (thread) {
        thread->join();
        delete thread;
        thread = nullptr;
    }
}

void Reconciler::prioritizeLabel(std::string labelId) {
    std::lock_guard<std::mutex> lck(wakeMtx);
    priorityLabelId = labelId;
}

bool Reconciler::isParked() {
    std::lock_guard<std::mutex> lck(wakeMtx);
    return parked;
}

#pragma mark Sync

bool Reconciler::syncNow() {
    state->beginPass();
    logger->info("------------- Starting sync pass ---------------");

    std::shared_ptr<RemoteGateway> gateway;
    try {
        gateway = provider->gateway();
    } catch (AuthenticationException & ex) {
        state->finishPass(ex.debuginfo);
        throw;
    }

    std::string firstError = "";

    try {
        std::vector<std::string> labelIds = syncLabels(*gateway, firstError);

        std::string priority;
        {
            std::lock_guard<std::mutex> lck(wakeMtx);
            priority = priorityLabelId;
            priorityLabelId = "";
        }
        auto it = std::find(labelIds.begin(), labelIds.end(), priority);
        if (it != labelIds.end()) {
            std::rotate(labelIds.begin(), it, it + 1);
        }

        for (const auto & labelId : labelIds) {
            state->beginLabel(labelId);
            syncLabel(*gateway, labelId, firstError);
            state->finishLabel(labelId);
        }
    } catch (AuthenticationException & ex) {
        state->finishPass(ex.debuginfo);
        throw;
    }

    state->finishPass(firstError);
    if (firstError == "") {
        logger->info("------------- Sync pass complete ---------------");
    } else {
        logger->warn("------------- Sync pass finished with errors: {}", firstError);
    }
    return firstError == "";
}

std::vector<std::string> Reconciler::syncLabels(RemoteGateway & gateway, std::string & firstError) {
    std::vector<std::string> labelIds;

    try {
        std::vector<Label> remoteLabels = gateway.listLabels();
        store->replaceLabels(remoteLabels);
        for (const auto & label : remoteLabels) {
            labelIds.push_back(label.id());
        }
        logger->info("Synced {} labels", labelIds.size());
        return labelIds;

    } catch (AuthenticationException & ex) {
        throw;
    } catch (SyncException & ex) {
        recordFailure(firstError, "listLabels", ex.toJSON().dump());
    } catch (SQLite::Exception & ex) {
        recordFailure(firstError, "replaceLabels", ex.what());
    }

    // carry on with the labels we already know about
    try {
        for (const auto & label : store->allLabels()) {
            labelIds.push_back(label->id());
        }
    } catch (SQLite::Exception & ex) {
        recordFailure(firstError, "allLabels", ex.what());
    }
    return labelIds;
}

void Reconciler::syncLabel(RemoteGateway & gateway, std::string labelId, std::string & firstError) {
    RemoteListing listing;
    try {
        listing = gateway.listMessages(labelId);
    } catch (AuthenticationException & ex) {
        throw;
    } catch (SyncException & ex) {
        recordFailure(firstError, "listMessages " + labelId, ex.toJSON().dump());
        return;
    }

    std::vector<std::string> localIdsVector;
    try {
        localIdsVector = store->messageIdsForLabel(labelId);
    } catch (SQLite::Exception & ex) {
        recordFailure(firstError, "messageIdsForLabel " + labelId, ex.what());
        return;
    }
    std::set<std::string> localIds(localIdsVector.begin(), localIdsVector.end());
    std::set<std::string> remoteIds;

    int fetched = 0;
    int associated = 0;
    int removed = 0;

    for (const auto & entry : listing.entries) {
        remoteIds.insert(entry.id);

        try {
            int64_t localDate = store->messageDate(entry.id);
            if (localDate < 0 || localDate < entry.internalDate) {
                Message message = gateway.getMessage(entry.id);
                store->upsertMessage(message, labelId);
                fetched++;
            } else if (!localIds.count(entry.id)) {
                store->addLabel(entry.id, labelId);
                associated++;
            }
        } catch (AuthenticationException & ex) {
            throw;
        } catch (SyncException & ex) {
            recordFailure(firstError, "getMessage " + entry.id, ex.toJSON().dump());
        } catch (SQLite::Exception & ex) {
            recordFailure(firstError, "upsert " + entry.id, ex.what());
        }
    }

    // A truncated listing can't tell us what left the label.
    if (listing.complete) {
        for (const auto & localId : localIds) {
            if (remoteIds.count(localId)) {
                continue;
            }
            try {
                store->removeLabel(localId, labelId);
                removed++;
            } catch (SQLite::Exception & ex) {
                recordFailure(firstError, "removeLabel " + localId, ex.what());
            }
        }
    }

    logger->info("Synced label {}: {} remote, {} fetched, {} associated, {} removed (complete={})",
                 labelId, listing.entries.size(), fetched, associated, removed, listing.complete);
}

void Reconciler::recordFailure(std::string & firstError, std::string context, std::string message) {
    logger->warn("Sync of {} failed: {}", context, message);
    if (firstError == "") {
        firstError = context + ": " + message;
    }
}
