/** MailModel [MailCache]
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

#ifndef MailModel_hpp
#define MailModel_hpp

#include <stdio.h>
#include <vector>
#include <string>

#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"


class CacheStore;

/*
 Every persisted model keeps its full state in a JSON document which is
 written to the `data` column. The other columns are projections of it
 used for querying and for the full-text index triggers.

 Copying a model copies the document, so a copy is a deep snapshot.
*/
class MailModel {
public:
    nlohmann::json _data;

    static std::string TABLE_NAME;
    virtual std::string tableName() const;

    MailModel(std::string id);
    MailModel(SQLite::Statement & query);
    MailModel(nlohmann::json json);
    virtual ~MailModel() = default;

    std::string id() const;

    virtual void bindToQuery(SQLite::Statement * query);

    virtual void afterSave(CacheStore * store);
    virtual void afterRemove(CacheStore * store);

    virtual std::vector<std::string> columnsForQuery() = 0;

    virtual nlohmann::json toJSON() const;

protected:
    std::string _stringOrEmpty(const char * key) const;
    void _bindStringOrNull(SQLite::Statement * query, const char * param, const char * key);
};

#endif /* MailModel_hpp */
