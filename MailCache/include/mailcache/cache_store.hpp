/** CacheStore [MailCache]
 *
 * Author(s): Ben Gotow
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

#ifndef CacheStore_hpp
#define CacheStore_hpp

#include <stdio.h>
#include <stdint.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

#include "mailcache/models/label.hpp"
#include "mailcache/models/message.hpp"
#include "mailcache/query.hpp"
#include "mailcache/delta_stream.hpp"


/*
 The persisted cache: messages, labels, their associations and the
 full-text index over messages. Each thread that touches the cache opens
 its own CacheStore on the same file. Every public mutation below runs in
 its own transaction, so callers must not wrap them in another one.
*/
class CacheStore {
    SQLite::Database _db;
    SQLite::Statement _stmtBeginTransaction;
    SQLite::Statement _stmtRollbackTransaction;
    SQLite::Statement _stmtCommitTransaction;

    bool _transactionOpen;
    std::vector<DeltaStreamItem> _transactionDeltas;

    std::map<std::string, std::shared_ptr<SQLite::Statement>> _saveQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _removeQueries;

    std::shared_ptr<DeltaStream> _stream;

public:
    CacheStore(std::string path);

    void migrate();

    SQLite::Database & db();

    void setDeltaStream(std::shared_ptr<DeltaStream> stream);

    void beginTransaction();

    void rollbackTransaction();

    void commitTransaction();

    void save(MailModel * model, bool emit = true);

    void remove(MailModel * model);

    // Messages

    void upsertMessages(std::vector<Message> & messages, std::string contextLabelId);

    void upsertMessage(Message & message, std::string contextLabelId);

    // Returns false if no message with the id was cached.
    bool removeMessage(std::string id);

    void addLabel(std::string messageId, std::string labelId);

    void removeLabel(std::string messageId, std::string labelId);

    bool setRead(std::string id, bool read);

    std::vector<std::shared_ptr<Message>> queryByLabel(std::string labelId, int limit, int offset = 0);

    std::vector<std::shared_ptr<Message>> queryThread(std::string threadId);

    std::vector<std::shared_ptr<Message>> search(std::string term, int limit);

    std::shared_ptr<Message> findMessage(std::string id);

    bool messageExists(std::string id);

    // Returns -1 if the message is not cached.
    int64_t messageDate(std::string id);

    std::vector<std::string> labelIdsForMessage(std::string id);

    std::vector<std::string> messageIdsForLabel(std::string labelId);

    int countMessages();

    int countMessagesForLabel(std::string labelId);

    // Labels

    void replaceLabels(std::vector<Label> & labels);

    std::vector<std::shared_ptr<Label>> allLabels();

    // Find - Template methods which must be defined in header file

    template<typename ModelClass>
    std::shared_ptr<ModelClass> find(Query & query) {
        query.limit(1);
        SQLite::Statement statement(this->_db, "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);
        if (statement.executeStep()) {
            return std::make_shared<ModelClass>(statement);
        }
        return nullptr;
    }

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findAll(Query & query) {
        SQLite::Statement statement(this->_db, "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);

        std::vector<std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results.push_back(std::make_shared<ModelClass>(statement));
        }

        return results;
    }

private:
    void _associate(std::string messageId, std::string labelId);

    // Rewrites the message's stored labelIds from MessageLabel and emits it.
    void _writeLabelIds(std::string messageId);

    void _emit(DeltaStreamItem & delta);

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> _collect(SQLite::Statement & statement) {
        std::vector<std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results.push_back(std::make_shared<ModelClass>(statement));
        }
        return results;
    }
};


#endif /* CacheStore_hpp */
