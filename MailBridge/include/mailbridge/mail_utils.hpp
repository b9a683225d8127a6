/** MailUtils [MailBridge]
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

#include <stdio.h>
#include <time.h>
#include "MailCore/MailCore.h"

struct EndpointSettings;

class MailUtils {

public:
    static std::string getEnvUTF8(std::string key);
    static void setEnvUTF8(std::string key, std::string value, bool overwrite);

    static bool parseBool(std::string value, bool fallback);
    static int parsePositiveInt(std::string value, int fallback, bool * usedFallback = nullptr);

    static std::string trim(const std::string & s);
    static std::string toLower(std::string s);
    static std::string maskSecret(const std::string & value);

    static std::string localTimestampForTime(time_t time);

    static std::vector<std::string> splitLines(const std::string & text);
    static std::vector<std::string> lastLines(const std::string & text, size_t count);

    static bool readFile(const std::string & path, std::string & contents);
    static bool writeFileAtomically(const std::string & path, const std::string & contents);
    static bool isDirectoryWritable(const std::string & path);
    static bool ensureDirectory(const std::string & path);

    static void configureSessionForEndpoint(mailcore::IMAPSession & session, const EndpointSettings & endpoint);
};

#endif /* MailUtils_hpp */
