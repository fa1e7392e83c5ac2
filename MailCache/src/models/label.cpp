//
//  label.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/models/label.hpp"
#include "mailcache/cache_store.hpp"
#include "mailcache/mail_utils.hpp"
#include "mailcache/sync_exception.hpp"


std::string Label::TABLE_NAME = "Label";

Label::Label(std::string id, std::string name, std::string type) :
    MailModel(id)
{
    _data["name"] = name;
    _data["type"] = type;
}

Label::Label(SQLite::Statement & query) :
    MailModel(query)
{
}

Label::Label(nlohmann::json json) :
    MailModel(json)
{
    if (!_data.count("name") || !_data["name"].is_string()) {
        _data["name"] = id();
    }
    if (!_data.count("type") || !_data["type"].is_string()) {
        _data["type"] = LABEL_TYPE_USER;
    }
}

std::string Label::name() const {
    return _data.at("name").get<std::string>();
}

std::string Label::type() const {
    return _data.at("type").get<std::string>();
}

bool Label::isSystem() const {
    return type() == LABEL_TYPE_SYSTEM;
}

std::string Label::displayName() const {
    return MailUtils::titleCase(name());
}

std::string Label::colorForeground() const {
    return _stringOrEmpty("colorForeground");
}

std::string Label::colorBackground() const {
    return _stringOrEmpty("colorBackground");
}

void Label::setColors(std::string foreground, std::string background) {
    if (foreground == "") {
        _data.erase("colorForeground");
    } else {
        _data["colorForeground"] = foreground;
    }
    if (background == "") {
        _data.erase("colorBackground");
    } else {
        _data["colorBackground"] = background;
    }
}

std::string Label::tableName() const {
    return Label::TABLE_NAME;
}

std::vector<std::string> Label::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "name", "type", "colorForeground", "colorBackground"};
}

void Label::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":name", name());
    query->bind(":type", type());
    _bindStringOrNull(query, ":colorForeground", "colorForeground");
    _bindStringOrNull(query, ":colorBackground", "colorBackground");
}

void Label::afterRemove(CacheStore * store) {
    MailModel::afterRemove(store);

    SQLite::Statement removeMessages(store->db(), "DELETE FROM MessageLabel WHERE labelId = ?");
    removeMessages.bind(1, id());
    removeMessages.exec();
}
