/** CacheStoreTransaction [MailCache]
 *
 * Author(s): Ben Gotow
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

#ifndef CacheStoreTransaction_hpp
#define CacheStoreTransaction_hpp

#include <chrono>
#include <string>

#include "mailcache/cache_store.hpp"


class CacheStoreTransaction
{
public:
    /**
     * @brief Begins the SQLite transaction
     *
     * @param[in] store the CacheStore
     *
     * Exception is thrown in case of error, then the Transaction is NOT initiated.
     */
    explicit CacheStoreTransaction(CacheStore * store, std::string nameHint = "");

    /**
     * @brief Safely rollback the transaction if it has not been committed.
     */
    virtual ~CacheStoreTransaction() noexcept; // nothrow

    /**
     * @brief Commit the transaction. Deltas collected while it was open
     * are delivered afterwards.
     */
    void commit();

private:
    // Transaction must be non-copyable
    CacheStoreTransaction(const CacheStoreTransaction&);
    CacheStoreTransaction& operator=(const CacheStoreTransaction&);

private:
    CacheStore* mStore;     // < Reference to the store owning the connection
    bool        mCommited;  // < True when commit has been called
    std::chrono::system_clock::time_point mStart;
    std::chrono::system_clock::time_point mBegan;
    std::string mNameHint;
};

#endif /* CacheStoreTransaction_hpp */
