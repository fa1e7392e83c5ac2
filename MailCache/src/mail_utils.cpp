//
//  mail_utils.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/mail_utils.hpp"

#include <stdlib.h>
#include <ctype.h>


std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string MailUtils::timestampForTime(time_t time) {
    tm result;
    localtime_r(&time, &result);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%d %H:%M:%S", &result);
    return std::string(buffer);
}

std::string MailUtils::titleCase(std::string name) {
    std::string result;
    bool startOfWord = true;

    for (size_t i = 0; i < name.size(); i ++) {
        char c = name[i];
        if (c == '_' || c == '-' || c == ' ') {
            if (!result.empty() && result.back() != ' ') {
                result.push_back(' ');
            }
            startOfWord = true;
            continue;
        }
        // camelCase boundary: "someLabel" => "Some Label"
        if (!startOfWord && isupper((unsigned char)c) && i > 0 && islower((unsigned char)name[i - 1])) {
            result.push_back(' ');
            startOfWord = true;
        }
        if (startOfWord) {
            result.push_back((char)toupper((unsigned char)c));
        } else {
            result.push_back((char)tolower((unsigned char)c));
        }
        startOfWord = false;
    }

    if (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

std::string MailUtils::ftsPhrase(std::string term) {
    std::string escaped{"\""};
    for (char c : term) {
        if (c == '"') {
            escaped += "\"\"";
        } else {
            escaped.push_back(c);
        }
    }
    escaped += "\"";
    return escaped;
}

std::string MailUtils::qmarks(size_t count) {
    if (count == 0) {
        return "";
    }
    std::string qmarks{"?"};
    for (size_t i = 1; i < count; i ++) {
        qmarks = qmarks + ",?";
    }
    return qmarks;
}
