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

#include "checkpoint/fetch_client.h"

#include <memory>
#include <sstream>

#include "checkpoint/stream_source.h"
#include "common/config.h"
#include "common/logging.h"
#include "http/http_headers.h"
#include "util/file_handle.h"
#include "util/md5.h"
#include "util/stopwatch.hpp"

namespace fsimage {

FetchOptions FetchOptions::from_config() {
    FetchOptions options;
    if (config::io_file_buffer_size > 0) {
        options.buffer_size = static_cast<size_t>(config::io_file_buffer_size);
    } else {
        LOG(WARNING) << "invalid io_file_buffer_size " << config::io_file_buffer_size
                     << ", use " << options.buffer_size;
    }
    options.read_timeout_ms = config::image_download_read_timeout_sec * 1000L;
    options.upload_read_timeout_ms = config::image_upload_read_timeout_sec * 1000L;
    return options;
}

FetchClient::FetchClient(const FetchOptions& options, StreamSource* source)
        : _options(options), _source(source) {}

std::string FetchClient::make_url(const std::string& peer, const std::string& query) {
    return "http://" + peer + "/getimage?" + query;
}

Status FetchClient::fetch(const std::string& url, TransferMode mode,
                          const std::vector<std::string>& destinations, bool compute_digest,
                          TransferResult* result) {
    int64_t timeout_ms = mode == TransferMode::UPLOAD ? _options.upload_read_timeout_ms
                                                      : _options.read_timeout_ms;
    LOG(INFO) << "begin to fetch image from: " << url
              << ", destinations: " << destinations.size() << ", timeout(ms): " << timeout_ms;

    std::unique_ptr<Md5Digest> digest;
    if (compute_digest) {
        digest.reset(new Md5Digest());
    }
    std::vector<std::unique_ptr<FileHandle>> files;
    int64_t advertised_size = -1;
    int64_t received = 0;

    auto on_header = [&](int64_t content_length) {
        if (content_length < 0) {
            LOG(WARNING) << "no content length in response. url=" << url;
            return Status::ProtocolError(std::string(HttpHeaders::CONTENT_LENGTH) +
                                         " header is not provided by the peer when trying "
                                         "to fetch " + url);
        }
        advertised_size = content_length;
        for (auto& path : destinations) {
            std::unique_ptr<FileHandle> file(new FileHandle());
            RETURN_IF_ERROR(file->open(path, O_WRONLY | O_CREAT | O_TRUNC));
            files.push_back(std::move(file));
        }
        return Status::OK();
    };
    auto on_data = [&](const void* data, size_t size) {
        if (digest != nullptr) {
            digest->update(data, size);
        }
        for (auto& file : files) {
            RETURN_IF_ERROR(file->write(data, size));
        }
        received += size;
        return Status::OK();
    };

    MonotonicStopWatch watch;
    watch.start();
    Status st = _source->fetch(url, timeout_ms, _options.buffer_size, on_header, on_data);

    for (auto& file : files) {
        Status close_st = file->close();
        if (!close_st.ok() && st.ok()) {
            st = close_st;
        }
    }
    files.clear();

    // A body cut short by the peer or the network is an integrity failure
    // once a length was declared. Local and protocol failures keep their kind.
    bool size_checked = st.ok() || (st.is_remote_error() && advertised_size >= 0);
    if (size_checked && received != advertised_size) {
        LOG(WARNING) << "fetch image length error"
                     << ", url=" << url << ", advertised_size=" << advertised_size
                     << ", received=" << received << ", transport=" << st.to_string();
        std::stringstream ss;
        ss << "File " << url << " received length " << received
           << " is not of the advertised size " << advertised_size;
        return Status::Corruption(ss.str());
    }
    if (!st.ok()) {
        LOG(WARNING) << "fail to fetch image. url=" << url << ", received=" << received
                     << ", error=" << st.to_string();
        return st;
    }

    result->bytes_received = received;
    result->has_digest = compute_digest;
    if (digest != nullptr) {
        digest->digest();
        result->digest = digest->raw();
        result->digest_hex = digest->hex();
    } else {
        result->digest.clear();
        result->digest_hex.clear();
    }

    uint64_t total_time_ms = watch.elapsed_time() / 1000 / 1000;
    double rate = 0.0;
    if (total_time_ms > 0) {
        rate = received / ((double)total_time_ms) / 1000;
    }
    LOG(INFO) << "succeed to fetch image from: " << url << ", size: " << received << " B"
              << ", cost: " << total_time_ms << " ms"
              << ", rate: " << rate << " MB/s";
    return Status::OK();
}

} // namespace fsimage
