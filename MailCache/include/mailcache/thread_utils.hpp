/** ThreadUtils [MailCache]
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

#ifndef ThreadUtils_hpp
#define ThreadUtils_hpp

#include <stddef.h>
#include <string>

// Names are shown in the log pattern, so the reconciler, remote queue and
// main thread can be told apart in mailcache.log.
std::string GetThreadName(size_t spdlog_thread_id);
void SetThreadName(const char* threadName);

#endif /* ThreadUtils_hpp */
