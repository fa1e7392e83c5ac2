//
//  cache_store.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/cache_store.hpp"
#include "mailcache/cache_store_transaction.hpp"
#include "mailcache/constants.hpp"
#include "mailcache/mail_utils.hpp"

#include <ctype.h>
#include <set>

#include "spdlog/spdlog.h"


CacheStore::CacheStore(std::string path) :
    _db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
    _stmtBeginTransaction(_db, "BEGIN IMMEDIATE TRANSACTION"),
    _stmtRollbackTransaction(_db, "ROLLBACK"),
    _stmtCommitTransaction(_db, "COMMIT"),
    _transactionOpen(false),
    _transactionDeltas(),
    _stream(nullptr)
{
    _db.setBusyTimeout(10 * 1000);

    // Note: These are properties of the connection, so they must be set regardless
    // of whether the database setup queries are run.
    SQLite::Statement(_db, "PRAGMA journal_mode = WAL").executeStep();
    SQLite::Statement(_db, "PRAGMA main.cache_size = 10000").exec();
    SQLite::Statement(_db, "PRAGMA main.synchronous = NORMAL").exec();
}

void CacheStore::migrate() {
    SQLite::Statement uv(_db, "PRAGMA user_version");
    uv.executeStep();
    int version = uv.getColumn(0).getInt();

    if (version < CURRENT_SCHEMA_VERSION) {
        for (const std::string & sql : SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
        SQLite::Statement(_db, "PRAGMA user_version = " + std::to_string(CURRENT_SCHEMA_VERSION)).exec();
    }
}

SQLite::Database & CacheStore::db()
{
    return this->_db;
}

void CacheStore::setDeltaStream(std::shared_ptr<DeltaStream> stream) {
    _stream = stream;
}

void CacheStore::beginTransaction() {
    _stmtBeginTransaction.exec();
    _stmtBeginTransaction.reset();
    _transactionOpen = true;
}

void CacheStore::rollbackTransaction() {
    _saveQueries = {};
    _removeQueries = {};
    _transactionDeltas = {};
    _transactionOpen = false;
    _stmtRollbackTransaction.exec();
    _stmtRollbackTransaction.reset();
}

void CacheStore::commitTransaction() {
    _stmtCommitTransaction.exec();
    _stmtCommitTransaction.reset();
    _transactionOpen = false;

    // emit all of the deltas
    if (_transactionDeltas.size()) {
        if (_stream) {
            _stream->emit(_transactionDeltas);
        }
        _transactionDeltas = {};
    }
}

void CacheStore::save(MailModel * model, bool emit) {
    auto tableName = model->tableName();

    if (!_saveQueries.count(tableName)) {
        std::string cols{""};
        std::string values{""};
        std::string pairs{""};
        for (const auto & col : model->columnsForQuery()) {
            cols += col + ",";
            values += ":" + col + ",";
            if (col != "id") {
                pairs += col + " = excluded." + col + ",";
            }
        }
        cols.pop_back();
        values.pop_back();
        pairs.pop_back();

        // ON CONFLICT keeps the rowid, which the search index is keyed on
        auto stmt = std::make_shared<SQLite::Statement>(this->_db, "INSERT INTO " + tableName + " (" + cols + ") VALUES (" + values + ") ON CONFLICT(id) DO UPDATE SET " + pairs);
        _saveQueries[tableName] = stmt;
    }

    auto query = _saveQueries[tableName];
    query->reset();
    query->clearBindings();
    model->bindToQuery(query.get());
    query->exec();

    model->afterSave(this);

    if (emit) {
        DeltaStreamItem delta {DELTA_TYPE_PERSIST, model};
        _emit(delta);
    }
}

void CacheStore::remove(MailModel * model) {
    auto tableName = model->tableName();
    if (!_removeQueries.count(tableName)) {
        _removeQueries[tableName] = std::make_shared<SQLite::Statement>(this->_db, "DELETE FROM " + tableName + " WHERE id = ?");
    }
    model->afterRemove(this);

    auto query = _removeQueries[tableName];
    query->reset();
    query->bind(1, model->id());
    query->exec();

    DeltaStreamItem delta {DELTA_TYPE_UNPERSIST, model};
    _emit(delta);
}

// Messages

void CacheStore::upsertMessages(std::vector<Message> & messages, std::string contextLabelId) {
    for (auto & message : messages) {
        upsertMessage(message, contextLabelId);
    }
}

void CacheStore::upsertMessage(Message & message, std::string contextLabelId) {
    CacheStoreTransaction transaction {this, "upsertMessage"};

    if (contextLabelId != "") {
        _associate(message.id(), contextLabelId);
    }
    for (const auto & labelId : message.labelIds()) {
        _associate(message.id(), labelId);
    }

    // the stored labelIds always mirror MessageLabel, including associations
    // made earlier under other contexts
    message.setLabelIds(labelIdsForMessage(message.id()));
    save(&message);

    transaction.commit();
}

bool CacheStore::removeMessage(std::string id) {
    CacheStoreTransaction transaction {this, "removeMessage"};

    auto message = findMessage(id);
    if (message == nullptr) {
        return false;
    }
    remove(message.get());

    transaction.commit();
    return true;
}

void CacheStore::addLabel(std::string messageId, std::string labelId) {
    CacheStoreTransaction transaction {this, "addLabel"};
    _associate(messageId, labelId);
    _writeLabelIds(messageId);
    transaction.commit();
}

void CacheStore::removeLabel(std::string messageId, std::string labelId) {
    CacheStoreTransaction transaction {this, "removeLabel"};

    SQLite::Statement query(this->_db, "DELETE FROM MessageLabel WHERE messageId = ? AND labelId = ?");
    query.bind(1, messageId);
    query.bind(2, labelId);
    if (query.exec() > 0) {
        _writeLabelIds(messageId);
    }

    transaction.commit();
}

bool CacheStore::setRead(std::string id, bool read) {
    CacheStoreTransaction transaction {this, "setRead"};

    auto message = findMessage(id);
    if (message == nullptr) {
        return false;
    }
    message->setRead(read);
    save(message.get());

    transaction.commit();
    return true;
}

std::vector<std::shared_ptr<Message>> CacheStore::queryByLabel(std::string labelId, int limit, int offset) {
    SQLite::Statement query(this->_db, "SELECT Message.data AS data FROM Message INNER JOIN MessageLabel ON MessageLabel.messageId = Message.id WHERE MessageLabel.labelId = ? ORDER BY Message.internalDate DESC LIMIT ? OFFSET ?");
    query.bind(1, labelId);
    query.bind(2, limit);
    query.bind(3, offset);
    return _collect<Message>(query);
}

std::vector<std::shared_ptr<Message>> CacheStore::queryThread(std::string threadId) {
    return findAll<Message>(Query().equal("threadId", threadId).orderBy("internalDate", true));
}

std::vector<std::shared_ptr<Message>> CacheStore::search(std::string term, int limit) {
    bool searchable = false;
    for (char c : term) {
        if (isalnum((unsigned char)c) || ((unsigned char)c) >= 0x80) {
            searchable = true;
            break;
        }
    }
    if (!searchable) {
        return {};
    }

    SQLite::Statement query(this->_db, "SELECT Message.data AS data FROM MessageSearch INNER JOIN Message ON Message.rowid = MessageSearch.rowid WHERE MessageSearch MATCH ? ORDER BY MessageSearch.rank, Message.internalDate DESC LIMIT ?");
    query.bind(1, MailUtils::ftsPhrase(term));
    query.bind(2, limit);
    return _collect<Message>(query);
}

std::shared_ptr<Message> CacheStore::findMessage(std::string id) {
    return find<Message>(Query().equal("id", id));
}

bool CacheStore::messageExists(std::string id) {
    SQLite::Statement query(this->_db, "SELECT 1 FROM Message WHERE id = ?");
    query.bind(1, id);
    return query.executeStep();
}

int64_t CacheStore::messageDate(std::string id) {
    SQLite::Statement query(this->_db, "SELECT internalDate FROM Message WHERE id = ?");
    query.bind(1, id);
    if (query.executeStep()) {
        return query.getColumn(0).getInt64();
    }
    return -1;
}

std::vector<std::string> CacheStore::labelIdsForMessage(std::string id) {
    SQLite::Statement query(this->_db, "SELECT labelId FROM MessageLabel WHERE messageId = ? ORDER BY labelId");
    query.bind(1, id);
    std::vector<std::string> results;
    while (query.executeStep()) {
        results.push_back(query.getColumn(0).getString());
    }
    return results;
}

std::vector<std::string> CacheStore::messageIdsForLabel(std::string labelId) {
    SQLite::Statement query(this->_db, "SELECT messageId FROM MessageLabel WHERE labelId = ?");
    query.bind(1, labelId);
    std::vector<std::string> results;
    while (query.executeStep()) {
        results.push_back(query.getColumn(0).getString());
    }
    return results;
}

int CacheStore::countMessages() {
    SQLite::Statement query(this->_db, "SELECT COUNT(*) FROM Message");
    query.executeStep();
    return query.getColumn(0).getInt();
}

int CacheStore::countMessagesForLabel(std::string labelId) {
    SQLite::Statement query(this->_db, "SELECT COUNT(*) FROM MessageLabel WHERE labelId = ?");
    query.bind(1, labelId);
    query.executeStep();
    return query.getColumn(0).getInt();
}

// Labels

void CacheStore::replaceLabels(std::vector<Label> & labels) {
    CacheStoreTransaction transaction {this, "replaceLabels"};

    std::set<std::string> incoming;
    for (const auto & label : labels) {
        incoming.insert(label.id());
    }

    Query all;
    for (const auto & existing : findAll<Label>(all)) {
        if (!incoming.count(existing->id())) {
            spdlog::get("logger")->info("Label {} no longer exists remotely, removing it.", existing->id());
            std::vector<std::string> affected = messageIdsForLabel(existing->id());
            remove(existing.get());
            for (const auto & messageId : affected) {
                _writeLabelIds(messageId);
            }
        }
    }
    for (auto & label : labels) {
        save(&label);
    }

    transaction.commit();
}

std::vector<std::shared_ptr<Label>> CacheStore::allLabels() {
    SQLite::Statement query(this->_db, "SELECT data FROM Label ORDER BY (id = '" LABEL_INBOX "') DESC, name ASC");
    return _collect<Label>(query);
}

// Private

void CacheStore::_associate(std::string messageId, std::string labelId) {
    SQLite::Statement query(this->_db, "INSERT OR IGNORE INTO MessageLabel (messageId, labelId) VALUES (?, ?)");
    query.bind(1, messageId);
    query.bind(2, labelId);
    query.exec();
}

void CacheStore::_writeLabelIds(std::string messageId) {
    auto message = findMessage(messageId);
    if (message == nullptr) {
        return;
    }
    message->setLabelIds(labelIdsForMessage(messageId));
    save(message.get());
}

void CacheStore::_emit(DeltaStreamItem & delta) {
    if (_transactionOpen) {
        _transactionDeltas.push_back(delta);
    } else if (_stream) {
        _stream->emit(delta);
    }
}
