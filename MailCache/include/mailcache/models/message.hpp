/** Message [MailCache]
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

#ifndef Message_hpp
#define Message_hpp

#include <stdio.h>
#include <stdint.h>
#include <vector>
#include <string>
#include "SQLiteCpp/SQLiteCpp.h"

#include "mailcache/models/mail_model.hpp"

#include "nlohmann/json.hpp"


class CacheStore;

class Message : public MailModel {

public:
    static std::string TABLE_NAME;

    Message(std::string id, std::string threadId, int64_t internalDate);
    Message(SQLite::Statement & query);
    Message(nlohmann::json json);

    // mutable attributes

    bool isRead() const;
    void setRead(bool r);

    std::string snippet() const;
    void setSnippet(std::string s);

    std::string bodyPlain() const;
    void setBodyPlain(std::string s);

    std::string bodyHtml() const;
    void setBodyHtml(std::string s);

    // labels observed on the remote copy, or captured from the cache
    // when the message is snapshotted for the undo journal
    std::vector<std::string> labelIds() const;
    void setLabelIds(const std::vector<std::string> & labelIds);
    bool hasLabel(std::string labelId) const;

    // immutable attributes

    std::string threadId() const;
    std::string fromAddress() const;
    void setFromAddress(std::string s);
    std::string toAddress() const;
    void setToAddress(std::string s);
    std::string subject() const;
    void setSubject(std::string s);
    int64_t internalDate() const;

    std::string tableName() const override;
    std::vector<std::string> columnsForQuery() override;
    void bindToQuery(SQLite::Statement * query) override;

    void afterRemove(CacheStore * store) override;
};

#endif /* Message_hpp */
