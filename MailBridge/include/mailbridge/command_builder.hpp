/** CommandBuilder [MailBridge]
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

#ifndef CommandBuilder_hpp
#define CommandBuilder_hpp

#include <string>
#include <vector>

#include "mailbridge/models/sync_configuration.hpp"

// argv for the transfer engine. Element 0 is the binary.
typedef std::vector<std::string> ParameterSet;

/*
 Builds the engine invocation for one attempt. The age, count and size bounds
 and the throttle are present in every invocation. The result is passed to
 execvp as-is, so values never need shell quoting.
*/
ParameterSet BuildSyncCommand(const SyncConfiguration & config);

// Space separated rendering with the password values replaced by [hidden].
std::string RedactedCommand(const ParameterSet & params);

#endif /* CommandBuilder_hpp */
