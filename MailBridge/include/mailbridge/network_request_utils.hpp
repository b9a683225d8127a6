/** NetworkRequestUtils [MailBridge]
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

#ifndef NetworkRequestUtils_hpp
#define NetworkRequestUtils_hpp

#include <atomic>
#include <string>

#include <curl/curl.h>
#include <stdio.h>
#include "nlohmann/json.hpp"

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp);

std::string FindLinuxCertsBundle();

CURL * CreateJSONRequest(std::string url, std::string method = "GET", std::string authorization = "", const char * payloadChars = nullptr);

// The transfer fails with CURLE_ABORTED_BY_CALLBACK shortly after *abortFlag becomes true.
void SetRequestAbortFlag(CURL * curl_handle, const std::atomic<bool> * abortFlag);

// Frees the handle and the header list attached by CreateJSONRequest.
void CleanupRequest(CURL * curl_handle);

const std::string PerformRequest(CURL * curl_handle);
const nlohmann::json PerformJSONRequest(CURL * curl_handle);

void ValidateRequestResp(CURLcode res, CURL * curl_handle, std::string resp);

const nlohmann::json MakeOAuthRefreshRequest(std::string tokenURL, std::string clientId, std::string clientSecret, std::string refreshToken);

#endif /* NetworkRequestUtils_hpp */
