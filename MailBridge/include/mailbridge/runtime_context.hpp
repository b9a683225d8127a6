/** RuntimeContext [MailBridge]
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

#ifndef RuntimeContext_hpp
#define RuntimeContext_hpp

#include <string>

/*
 Every path the daemon reads or writes, derived once from the application
 directory and handed to the components that need it.
*/
struct RuntimeContext {
    std::string appDir;
    std::string logDir;
    std::string logPath;
    std::string dataDir;
    std::string healthPath;
    std::string pidPath;
    std::string engineOutputPath;

    // `dir` wins, then APP_DIR, then the working directory.
    static RuntimeContext ForApplicationDirectory(std::string dir);
};

#endif /* RuntimeContext_hpp */
