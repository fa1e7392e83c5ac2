/** SyncException [MailCache]
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

#ifndef SyncException_hpp
#define SyncException_hpp

#include <string>
#include "nlohmann/json.hpp"
#include "mailcache/generic_exception.hpp"


/*
 Raised by the remote gateway (and anything that talks to it). Storage
 failures are reported as SQLite::Exception and never wrapped in here.
*/
class SyncException : public GenericException {
protected:
    bool retryable = false;
    bool offline = false;

public:
    SyncException(std::string key, std::string di, bool retryable);
    SyncException(std::string key, std::string di, bool retryable, bool offline);
    std::string key;
    std::string debuginfo;
    bool isRetryable();
    bool isOffline();
    virtual bool isAuthentication();
    nlohmann::json toJSON() override;
};


/*
 The session provider could not produce an authenticated gateway. Never
 retried by the core; surfaced to whoever asked for the session.
*/
class AuthenticationException : public SyncException {
public:
    AuthenticationException(std::string di);
    bool isAuthentication() override;
};


#endif /* SyncException_hpp */
