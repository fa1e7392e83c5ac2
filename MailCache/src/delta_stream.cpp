//
//  delta_stream.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/delta_stream.hpp"


// DeltaStreamItem

DeltaStreamItem::DeltaStreamItem(std::string type, std::string modelClass, std::vector<nlohmann::json> inJSONs) :
    type(type), modelClass(modelClass)
{
    for (const auto & itemJSON : inJSONs) {
        upsertModelJSON(itemJSON);
    }
}

DeltaStreamItem::DeltaStreamItem(std::string type, MailModel * model) :
    type(type), modelClass(model->tableName())
{
    upsertModelJSON(model->toJSON());
}

bool DeltaStreamItem::concatenate(const DeltaStreamItem & other) {
    if (other.type != type || other.modelClass != modelClass) {
        return false;
    }
    for (const auto & modelJSON : other.modelJSONs) {
        upsertModelJSON(modelJSON);
    }
    return true;
}

void DeltaStreamItem::upsertModelJSON(const nlohmann::json & item) {
    // scan and replace any instance of the object already available, or append.
    // It's important two back-to-back saves of the same object don't create two entries,
    // only the last one.
    std::string id = item["id"].get<std::string>();

    if (idIndexes.count(id)) {
        modelJSONs[idIndexes[id]] = item;
    } else {
        idIndexes[id] = modelJSONs.size();
        modelJSONs.push_back(item);
    }
}

std::vector<std::string> DeltaStreamItem::modelIds() const {
    std::vector<std::string> ids;
    for (const auto & modelJSON : modelJSONs) {
        ids.push_back(modelJSON["id"].get<std::string>());
    }
    return ids;
}

std::string DeltaStreamItem::dump() const {
    nlohmann::json j = {
        {"type", type},
        {"modelJSONs", modelJSONs},
        {"modelClass", modelClass}
    };
    return j.dump();
}

// Class

DeltaStream::DeltaStream() {
}

DeltaStream::~DeltaStream() {
}

void DeltaStream::queueDeltaForDelivery(DeltaStreamItem item) {
    std::lock_guard<std::mutex> lock(bufferMtx);

    if (!buffer.count(item.modelClass)) {
        buffer[item.modelClass] = {};
    }
    if (buffer[item.modelClass].size() == 0 || !buffer[item.modelClass].back().concatenate(item)) {
        buffer[item.modelClass].push_back(item);
    }
}

void DeltaStream::emit(DeltaStreamItem item) {
    queueDeltaForDelivery(item);
    bufferCv.notify_all();
}

void DeltaStream::emit(std::vector<DeltaStreamItem> items) {
    for (const auto & item : items) {
        queueDeltaForDelivery(item);
    }
    bufferCv.notify_all();
}

std::vector<DeltaStreamItem> DeltaStream::drain() {
    std::lock_guard<std::mutex> lock(bufferMtx);
    std::vector<DeltaStreamItem> results;
    for (const auto & it : buffer) {
        for (const auto & item : it.second) {
            results.push_back(item);
        }
    }
    buffer = {};
    return results;
}

std::vector<DeltaStreamItem> DeltaStream::waitForDeltas(int ms) {
    {
        std::unique_lock<std::mutex> lock(bufferMtx);
        bufferCv.wait_for(lock, std::chrono::milliseconds(ms), [this]() {
            return buffer.size() > 0;
        });
    }
    return drain();
}
