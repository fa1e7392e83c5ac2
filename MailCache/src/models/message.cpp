//
//  message.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/models/message.hpp"
#include "mailcache/cache_store.hpp"
#include "mailcache/sync_exception.hpp"

#include <algorithm>


std::string Message::TABLE_NAME = "Message";

Message::Message(std::string id, std::string threadId, int64_t internalDate) :
    MailModel(id)
{
    _data["threadId"] = threadId;
    _data["internalDate"] = internalDate;
    _data["isRead"] = false;
    _data["labelIds"] = nlohmann::json::array();
}

Message::Message(SQLite::Statement & query) :
    MailModel(query)
{
}

Message::Message(nlohmann::json json) :
    MailModel(json)
{
    if (!_data.count("threadId") || !_data["threadId"].is_string()) {
        throw SyncException("invalid-message", "Message " + id() + " has no threadId", false);
    }
    if (!_data.count("internalDate") || !_data["internalDate"].is_number()) {
        throw SyncException("invalid-message", "Message " + id() + " has no internalDate", false);
    }
    if (!_data.count("isRead")) {
        _data["isRead"] = false;
    }
    if (!_data.count("labelIds") || !_data["labelIds"].is_array()) {
        _data["labelIds"] = nlohmann::json::array();
    }
}

// mutable attributes

bool Message::isRead() const {
    return _data.at("isRead").get<bool>();
}

void Message::setRead(bool r) {
    _data["isRead"] = r;
}

std::string Message::snippet() const {
    return _stringOrEmpty("snippet");
}

void Message::setSnippet(std::string s) {
    _data["snippet"] = s;
}

std::string Message::bodyPlain() const {
    return _stringOrEmpty("bodyPlain");
}

void Message::setBodyPlain(std::string s) {
    _data["bodyPlain"] = s;
}

std::string Message::bodyHtml() const {
    return _stringOrEmpty("bodyHtml");
}

void Message::setBodyHtml(std::string s) {
    _data["bodyHtml"] = s;
}

std::vector<std::string> Message::labelIds() const {
    std::vector<std::string> results;
    for (const auto & l : _data.at("labelIds")) {
        results.push_back(l.get<std::string>());
    }
    return results;
}

void Message::setLabelIds(const std::vector<std::string> & labelIds) {
    std::vector<std::string> sorted = labelIds;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    _data["labelIds"] = sorted;
}

bool Message::hasLabel(std::string labelId) const {
    for (const auto & l : _data.at("labelIds")) {
        if (l.get<std::string>() == labelId) {
            return true;
        }
    }
    return false;
}

// immutable attributes

std::string Message::threadId() const {
    return _data.at("threadId").get<std::string>();
}

std::string Message::fromAddress() const {
    return _stringOrEmpty("fromAddress");
}

void Message::setFromAddress(std::string s) {
    _data["fromAddress"] = s;
}

std::string Message::toAddress() const {
    return _stringOrEmpty("toAddress");
}

void Message::setToAddress(std::string s) {
    _data["toAddress"] = s;
}

std::string Message::subject() const {
    return _stringOrEmpty("subject");
}

void Message::setSubject(std::string s) {
    _data["subject"] = s;
}

int64_t Message::internalDate() const {
    return _data.at("internalDate").get<int64_t>();
}

std::string Message::tableName() const {
    return Message::TABLE_NAME;
}

std::vector<std::string> Message::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "threadId", "snippet", "fromAddress", "toAddress", "subject", "internalDate", "bodyPlain", "bodyHtml", "isRead"};
}

void Message::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":threadId", threadId());
    query->bind(":internalDate", (long long)internalDate());
    query->bind(":isRead", isRead() ? 1 : 0);
    _bindStringOrNull(query, ":snippet", "snippet");
    _bindStringOrNull(query, ":fromAddress", "fromAddress");
    _bindStringOrNull(query, ":toAddress", "toAddress");
    _bindStringOrNull(query, ":subject", "subject");
    _bindStringOrNull(query, ":bodyPlain", "bodyPlain");
    _bindStringOrNull(query, ":bodyHtml", "bodyHtml");
}

void Message::afterRemove(CacheStore * store) {
    MailModel::afterRemove(store);

    // drop every label association of the message. Runs inside the same
    // transaction as the row delete.
    SQLite::Statement removeLabels(store->db(), "DELETE FROM MessageLabel WHERE messageId = ?");
    removeLabels.bind(1, id());
    removeLabels.exec();
}
