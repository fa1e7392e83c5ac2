//
//  cache_config.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/cache_config.hpp"
#include "mailcache/mail_utils.hpp"
#include "mailcache/sync_exception.hpp"

#include <climits>
#include <fstream>


CacheConfig::CacheConfig() :
    configDirPath("."),
    databaseFile("mailcache.db"),
    syncIntervalSeconds(30),
    pageSize(50),
    verbose(false)
{
}

CacheConfig::CacheConfig(std::string configDirPath, nlohmann::json json) :
    CacheConfig()
{
    this->configDirPath = configDirPath;

    if (json.is_null()) {
        return;
    }
    if (!json.is_object()) {
        throw SyncException("invalid-config", std::string(CONFIG_FILE_NAME) + " must contain a JSON object", false);
    }
    if (json.count("databaseFile")) {
        if (!json["databaseFile"].is_string() || json["databaseFile"].get<std::string>() == "") {
            throw SyncException("invalid-config", "databaseFile must be a non-empty string", false);
        }
        databaseFile = json["databaseFile"].get<std::string>();
    }
    syncIntervalSeconds = positiveInt(json, "syncIntervalSeconds", syncIntervalSeconds);
    pageSize = positiveInt(json, "pageSize", pageSize);

    if (json.count("verbose")) {
        if (!json["verbose"].is_boolean()) {
            throw SyncException("invalid-config", "verbose must be true or false", false);
        }
        verbose = json["verbose"].get<bool>();
    }
}

CacheConfig CacheConfig::load() {
    std::string dir = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (dir == "") {
        throw SyncException("invalid-config", "CONFIG_DIR_PATH is not set", false);
    }

    std::ifstream file(dir + FS_PATH_SEP + CONFIG_FILE_NAME);
    if (!file.good()) {
        return CacheConfig(dir, nullptr);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (nlohmann::json::parse_error & ex) {
        throw SyncException("invalid-config", std::string(CONFIG_FILE_NAME) + " is not valid JSON: " + ex.what(), false);
    }
    return CacheConfig(dir, json);
}

std::string CacheConfig::databasePath() const {
    if (databaseFile.size() > 0 && databaseFile[0] == '/') {
        return databaseFile;
    }
    return configDirPath + FS_PATH_SEP + databaseFile;
}

std::string CacheConfig::logPath() const {
    return configDirPath + FS_PATH_SEP + "mailcache.log";
}

nlohmann::json CacheConfig::toJSON() const {
    return {
        {"configDirPath", configDirPath},
        {"databaseFile", databaseFile},
        {"syncIntervalSeconds", syncIntervalSeconds},
        {"pageSize", pageSize},
        {"verbose", verbose},
    };
}

int CacheConfig::positiveInt(const nlohmann::json & json, const char * key, int fallback) {
    if (!json.count(key)) {
        return fallback;
    }
    const nlohmann::json & value = json.at(key);
    if (!value.is_number_integer() || value.get<long long>() <= 0 || value.get<long long>() > INT_MAX) {
        throw SyncException("invalid-config", std::string(key) + " must be a positive integer no larger than " + std::to_string(INT_MAX), false);
    }
    return value.get<int>();
}
