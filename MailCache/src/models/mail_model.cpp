//
//  mail_model.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/models/mail_model.hpp"
#include "mailcache/cache_store.hpp"
#include "mailcache/sync_exception.hpp"


std::string MailModel::TABLE_NAME = "MailModel";

MailModel::MailModel(std::string id) :
    _data({{"id", id}})
{
}

MailModel::MailModel(SQLite::Statement & query) :
    _data(nlohmann::json::parse(query.getColumn("data").getString()))
{
}

MailModel::MailModel(nlohmann::json json) :
    _data(json)
{
    if (!_data.is_object() || !_data.count("id") || !_data["id"].is_string()) {
        throw SyncException("invalid-model", "Model JSON must be an object with a string id: " + _data.dump(), false);
    }
}

std::string MailModel::id() const
{
    return _data.at("id").get<std::string>();
}

std::string MailModel::tableName() const
{
    return TABLE_NAME;
}

nlohmann::json MailModel::toJSON() const
{
    return _data;
}

void MailModel::bindToQuery(SQLite::Statement * query) {
    query->bind(":id", id());
    query->bind(":data", this->toJSON().dump());
}

void MailModel::afterSave(CacheStore * store) {
}

void MailModel::afterRemove(CacheStore * store) {
}

std::string MailModel::_stringOrEmpty(const char * key) const {
    auto it = _data.find(key);
    if (it == _data.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

void MailModel::_bindStringOrNull(SQLite::Statement * query, const char * param, const char * key) {
    auto it = _data.find(key);
    if (it == _data.end() || !it->is_string()) {
        query->bind(param); // binds null
    } else {
        query->bind(param, it->get<std::string>());
    }
}
