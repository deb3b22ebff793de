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

#ifndef FSIMAGE_SRC_CHECKPOINT_STREAM_SOURCE_H
#define FSIMAGE_SRC_CHECKPOINT_STREAM_SOURCE_H

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <string>

#include "common/status.h"

namespace fsimage {

// Transport a FetchClient pulls a remote file through.
//
// fetch() pushes the response to the caller: on_header is called exactly
// once, before the first byte of the body, with the length the peer
// declared or -1 when it declared none. on_data is then called for every
// chunk of the body. A non-OK status returned by either callback aborts
// the transfer and fetch() returns that status unchanged.
class StreamSource {
public:
    typedef std::function<Status(int64_t content_length)> HeaderCallback;
    typedef std::function<Status(const void* data, size_t size)> DataCallback;

    virtual ~StreamSource() {}

    // read_timeout_ms bounds how long the body may stall.
    virtual Status fetch(const std::string& url, int64_t read_timeout_ms, size_t buffer_size,
                         const HeaderCallback& on_header, const DataCallback& on_data) = 0;
};

// StreamSource over libcurl. Connection, http and timeout failures are
// returned as RemoteError. Needs curl_global_init() to have been called
// once by the process, see HttpClient.
class HttpStreamSource : public StreamSource {
public:
    // connect_timeout_ms of 0 keeps the libcurl default.
    explicit HttpStreamSource(int64_t connect_timeout_ms = 0);

    static int64_t connect_timeout_ms_from_config();

    Status fetch(const std::string& url, int64_t read_timeout_ms, size_t buffer_size,
                 const HeaderCallback& on_header, const DataCallback& on_data) override;

private:
    const int64_t _connect_timeout_ms;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_CHECKPOINT_STREAM_SOURCE_H
