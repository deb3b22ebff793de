// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#ifndef FSIMAGE_SRC_HTTP_HTTP_CLIENT_H
#define FSIMAGE_SRC_HTTP_HTTP_CLIENT_H

#include <curl/curl.h>
#include <stdint.h>

#include <functional>
#include <string>

#include "common/status.h"

namespace fsimage {

// Helper class to access HTTP resource
//
// libcurl is not initialized here: the process must call
// curl_global_init(CURL_GLOBAL_ALL) once, before any thread creates an
// HttpClient, and curl_global_cleanup() on exit.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // this function must call before other functions,
    // you can call this multiple times to reuse this object
    Status init(const std::string& url);

    void set_connect_timeout_ms(int64_t timeout_ms) {
        curl_easy_setopt(_curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    }

    // Abort the request when the body stalls: less than one byte per second
    // received for timeout_ms.
    void set_read_timeout_ms(int64_t timeout_ms);

    // Preferred size of the chunks handed to the execute() callback.
    void set_buffer_size(size_t buffer_size) {
        curl_easy_setopt(_curl, CURLOPT_BUFFERSIZE, static_cast<long>(buffer_size));
    }

    // Declared length of the response body, -1 if the peer did not send one.
    // Only valid once the response headers have been received.
    int64_t get_content_length() const {
        curl_off_t cl = -1;
        curl_easy_getinfo(_curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl);
        return cl;
    }

    // URL-encode a query parameter value.
    static std::string escape(const std::string& value);

    // Execute a GET request. callback is invoked for every chunk of the body;
    // returning false from it aborts the request.
    // Connection failures, http status >= 400 and timeouts are returned
    // as RemoteError.
    Status execute(const std::function<bool(const void* data, size_t length)>& callback);

    // Execute a GET request and collect the whole body in response.
    Status execute(std::string* response);

    size_t on_response_data(const void* data, size_t length);

private:
    const char* _to_errmsg(CURLcode code);

private:
    CURL* _curl = nullptr;
    using HttpCallback = std::function<bool(const void* data, size_t length)>;
    const HttpCallback* _callback = nullptr;
    char _error_buf[CURL_ERROR_SIZE];
};

} // namespace fsimage

#endif // FSIMAGE_SRC_HTTP_HTTP_CLIENT_H
