/** Constants [MailCache]
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

#ifndef constants_hpp
#define constants_hpp

#include <string>
#include <vector>

#define CURRENT_SCHEMA_VERSION  1

static std::vector<std::string> SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS Label ("
        "id VARCHAR(40) PRIMARY KEY,"
        "data TEXT,"
        "name TEXT NOT NULL,"
        "type VARCHAR(16) NOT NULL,"
        "colorForeground VARCHAR(16),"
        "colorBackground VARCHAR(16))",

    "CREATE TABLE IF NOT EXISTS Message ("
        "id VARCHAR(40) PRIMARY KEY,"
        "data TEXT,"
        "threadId VARCHAR(40) NOT NULL,"
        "snippet TEXT,"
        "fromAddress TEXT,"
        "toAddress TEXT,"
        "subject TEXT,"
        "internalDate INTEGER NOT NULL,"
        "bodyPlain TEXT,"
        "bodyHtml TEXT,"
        "isRead INTEGER DEFAULT 0)",

    "CREATE INDEX IF NOT EXISTS MessageDateIndex ON Message(internalDate DESC)",
    "CREATE INDEX IF NOT EXISTS MessageThreadIndex ON Message(threadId)",

    // associations are removed explicitly by the store, never by cascade
    "CREATE TABLE IF NOT EXISTS MessageLabel ("
        "messageId VARCHAR(40) NOT NULL,"
        "labelId VARCHAR(40) NOT NULL,"
        "PRIMARY KEY (messageId, labelId))",

    "CREATE INDEX IF NOT EXISTS MessageLabelLabelIndex ON MessageLabel(labelId)",

    "CREATE VIRTUAL TABLE IF NOT EXISTS MessageSearch USING fts5("
        "subject,"
        "fromAddress,"
        "snippet,"
        "bodyPlain,"
        "content='Message',"
        "content_rowid='rowid')",

    "CREATE TRIGGER IF NOT EXISTS MessageSearchInsert AFTER INSERT ON Message BEGIN "
        "INSERT INTO MessageSearch(rowid, subject, fromAddress, snippet, bodyPlain) "
        "VALUES (new.rowid, new.subject, new.fromAddress, new.snippet, new.bodyPlain); "
    "END",

    "CREATE TRIGGER IF NOT EXISTS MessageSearchDelete AFTER DELETE ON Message BEGIN "
        "INSERT INTO MessageSearch(MessageSearch, rowid, subject, fromAddress, snippet, bodyPlain) "
        "VALUES ('delete', old.rowid, old.subject, old.fromAddress, old.snippet, old.bodyPlain); "
    "END",

    "CREATE TRIGGER IF NOT EXISTS MessageSearchUpdate AFTER UPDATE ON Message BEGIN "
        "INSERT INTO MessageSearch(MessageSearch, rowid, subject, fromAddress, snippet, bodyPlain) "
        "VALUES ('delete', old.rowid, old.subject, old.fromAddress, old.snippet, old.bodyPlain); "
        "INSERT INTO MessageSearch(rowid, subject, fromAddress, snippet, bodyPlain) "
        "VALUES (new.rowid, new.subject, new.fromAddress, new.snippet, new.bodyPlain); "
    "END",
};

#endif /* constants_hpp */
