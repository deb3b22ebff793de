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

#ifndef FSIMAGE_SRC_CHECKPOINT_FETCH_CLIENT_H
#define FSIMAGE_SRC_CHECKPOINT_FETCH_CLIENT_H

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "common/status.h"

namespace fsimage {

class StreamSource;

enum class TransferMode {
    // fetch the image or edit log from the primary
    DOWNLOAD,
    // the primary fetches a merged image back from the secondary
    UPLOAD
};

struct FetchOptions {
    size_t buffer_size = 4096;
    // read timeout of DOWNLOAD transfers
    int64_t read_timeout_ms = 10 * 60 * 1000;
    // read timeout of UPLOAD transfers
    int64_t upload_read_timeout_ms = 2 * 60 * 60 * 1000;

    // A non-positive io_file_buffer_size falls back to 4096.
    static FetchOptions from_config();
};

struct TransferResult {
    int64_t bytes_received = 0;
    bool has_digest = false;
    // 16 raw bytes
    std::string digest;
    std::string digest_hex;
};

// Pulls one remote file and copies it into every destination path.
//
// The received byte count must equal the length the peer declared,
// otherwise the fetch fails with Corruption. Destinations are closed on
// every path; partially written files are left to the caller.
class FetchClient {
public:
    FetchClient(const FetchOptions& options, StreamSource* source);

    // destinations may be empty: the body is then only counted and digested.
    Status fetch(const std::string& url, TransferMode mode,
                 const std::vector<std::string>& destinations, bool compute_digest,
                 TransferResult* result);

    // URL of the image servlet on peer ("host:port").
    static std::string make_url(const std::string& peer, const std::string& query);

private:
    const FetchOptions _options;
    StreamSource* _source;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_CHECKPOINT_FETCH_CLIENT_H
