//
//  sync_state.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/sync_state.hpp"
#include "mailcache/mail_utils.hpp"


nlohmann::json SyncStatus::toJSON() const {
    std::string phaseName = "idle";
    if (phase == SyncPhase::Syncing) {
        phaseName = "syncing";
    } else if (phase == SyncPhase::Error) {
        phaseName = "error";
    }
    nlohmann::json j = {
        {"phase", phaseName},
        {"error", error},
        {"lastSuccess", (long long)lastSuccess},
        {"currentLabelId", currentLabelId},
        {"syncedLabelIds", syncedLabelIds},
    };
    return j;
}

SyncState::SyncState() {
    _status.phase = SyncPhase::Idle;
    _status.lastSuccess = 0;
}

void SyncState::beginPass() {
    std::lock_guard<std::mutex> lock(_mtx);
    _status.phase = SyncPhase::Syncing;
    _status.error = "";
}

void SyncState::beginLabel(std::string labelId) {
    std::lock_guard<std::mutex> lock(_mtx);
    _status.currentLabelId = labelId;
}

void SyncState::finishLabel(std::string labelId) {
    std::lock_guard<std::mutex> lock(_mtx);
    _status.syncedLabelIds.insert(labelId);
    _status.currentLabelId = "";
}

void SyncState::finishPass(std::string error) {
    std::lock_guard<std::mutex> lock(_mtx);
    _status.currentLabelId = "";
    if (error == "") {
        _status.phase = SyncPhase::Idle;
        _status.error = "";
        _status.lastSuccess = time(0);
    } else {
        _status.phase = SyncPhase::Error;
        _status.error = error;
    }
}

SyncStatus SyncState::snapshot() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _status;
}

bool SyncState::hasSynced(std::string labelId) const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _status.syncedLabelIds.count(labelId) > 0;
}

std::string SyncState::statusText() const {
    SyncStatus status = snapshot();

    if (status.phase == SyncPhase::Syncing) {
        if (status.currentLabelId != "") {
            return "Syncing " + status.currentLabelId + "...";
        }
        return "Syncing...";
    }
    if (status.phase == SyncPhase::Error) {
        return "Sync failed: " + status.error;
    }
    if (status.lastSuccess == 0) {
        return "Not synced yet";
    }
    return "Last synced " + MailUtils::timestampForTime(status.lastSuccess);
}
