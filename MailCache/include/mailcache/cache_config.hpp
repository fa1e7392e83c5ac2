/** CacheConfig [MailCache]
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

#ifndef CacheConfig_hpp
#define CacheConfig_hpp

#include <string>

#include "nlohmann/json.hpp"

#define CONFIG_FILE_NAME    "mailcache.json"

/*
 Settings read from $CONFIG_DIR_PATH/mailcache.json. Every key is optional,
 a missing file yields the defaults. Invalid values throw SyncException
 with key "invalid-config".
*/
class CacheConfig {
public:
    std::string configDirPath;
    std::string databaseFile;
    int syncIntervalSeconds;
    int pageSize;
    bool verbose;

    CacheConfig();
    CacheConfig(std::string configDirPath, nlohmann::json json);

    static CacheConfig load();

    std::string databasePath() const;
    std::string logPath() const;

    nlohmann::json toJSON() const;

private:
    static int positiveInt(const nlohmann::json & json, const char * key, int fallback);
};

#endif /* CacheConfig_hpp */
