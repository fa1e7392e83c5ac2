/** RemoteGateway [MailCache]
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

#ifndef RemoteGateway_hpp
#define RemoteGateway_hpp

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include "mailcache/models/label.hpp"
#include "mailcache/models/message.hpp"
#include "mailcache/sync_exception.hpp"


struct RemoteListingEntry {
    std::string id;
    int64_t internalDate;
};

struct RemoteListing {
    std::vector<RemoteListingEntry> entries;

    // false when the service truncated the listing to a page. A partial
    // listing says nothing about messages that are missing from it.
    bool complete;
};

/*
 The mailbox service as seen by the cache. Implementations throw
 SyncException (or AuthenticationException) on failure. The mutating
 calls must be idempotent: trashing a trashed message is not an error.
*/
class RemoteGateway {
public:
    virtual ~RemoteGateway() {}

    virtual std::vector<Label> listLabels() = 0;

    virtual RemoteListing listMessages(std::string labelId) = 0;

    virtual Message getMessage(std::string id) = 0;

    virtual void trash(std::string id) = 0;
    virtual void untrash(std::string id) = 0;

    virtual void archive(std::string id) = 0;
    virtual void unarchive(std::string id) = 0;

    virtual void markRead(std::string id, bool read) = 0;
};

/*
 Produces an authenticated gateway, refreshing credentials as needed.
 Throws AuthenticationException when no session can be established.
*/
class SessionProvider {
public:
    virtual ~SessionProvider() {}

    virtual std::shared_ptr<RemoteGateway> gateway() = 0;
};

#endif /* RemoteGateway_hpp */
