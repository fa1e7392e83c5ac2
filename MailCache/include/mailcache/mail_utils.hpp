/** MailUtils [MailCache]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <memory>
#include <string>
#include <vector>
#include <time.h>

#include <stdio.h>


#if defined(_MSC_VER)
#define FS_PATH_SEP "\\"
#else
#define FS_PATH_SEP "/"
#endif


class MailUtils {

public:
    static std::string getEnvUTF8(std::string key);

    static std::string timestampForTime(time_t time);

    static std::string titleCase(std::string name);

    // Wraps user input as a single FTS5 phrase so that operators
    // (AND, NEAR, column filters, quotes) are matched literally.
    static std::string ftsPhrase(std::string term);

    static std::string qmarks(size_t count);
};

#endif /* MailUtils_hpp */
