/** Label [MailCache]
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

#ifndef Label_hpp
#define Label_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailcache/models/mail_model.hpp"

#define LABEL_INBOX             "INBOX"
#define LABEL_TYPE_SYSTEM       "system"
#define LABEL_TYPE_USER         "user"


class Label : public MailModel {

public:
    static std::string TABLE_NAME;

    Label(std::string id, std::string name, std::string type);
    Label(SQLite::Statement & query);
    Label(nlohmann::json json);

    std::string name() const;
    std::string type() const;
    bool isSystem() const;

    // "CATEGORY_SOCIAL" => "Category Social"
    std::string displayName() const;

    std::string colorForeground() const;
    std::string colorBackground() const;
    void setColors(std::string foreground, std::string background);

    std::string tableName() const override;
    std::vector<std::string> columnsForQuery() override;
    void bindToQuery(SQLite::Statement * query) override;

    void afterRemove(CacheStore * store) override;
};

#endif /* Label_hpp */
