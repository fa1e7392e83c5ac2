/** DeltaStream [MailCache]
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

#ifndef DeltaStream_hpp
#define DeltaStream_hpp

#include <stdio.h>

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailcache/models/mail_model.hpp"

#define DELTA_TYPE_PERSIST              "persist"
#define DELTA_TYPE_UNPERSIST            "unpersist"

class DeltaStreamItem {
public:
    std::string type;
    std::vector<nlohmann::json> modelJSONs;
    std::string modelClass;
    std::map<std::string, size_t> idIndexes;

    DeltaStreamItem(std::string type, std::string modelClass, std::vector<nlohmann::json> modelJSONs);
    DeltaStreamItem(std::string type, MailModel * model);

    bool concatenate(const DeltaStreamItem & other);
    void upsertModelJSON(const nlohmann::json & modelJSON);
    std::vector<std::string> modelIds() const;
    std::string dump() const;
};

/*
 Carries change notifications from a writer thread (the reconciler) to the
 interactive thread. Writers emit deltas when a transaction commits, the
 reader drains them and reloads whatever projection it shows. Back-to-back
 changes to the same model are coalesced so the reader sees one entry.
*/
class DeltaStream  {
    std::mutex bufferMtx;
    std::condition_variable bufferCv;
    std::map<std::string, std::vector<DeltaStreamItem>> buffer;

public:
    DeltaStream();
    ~DeltaStream();

    void queueDeltaForDelivery(DeltaStreamItem item);

    void emit(DeltaStreamItem item);
    void emit(std::vector<DeltaStreamItem> items);

    // Returns everything buffered so far and empties the buffer.
    std::vector<DeltaStreamItem> drain();

    // Blocks until a delta is buffered or the timeout elapses, then drains.
    std::vector<DeltaStreamItem> waitForDeltas(int ms);
};

#endif /* DeltaStream_hpp */
