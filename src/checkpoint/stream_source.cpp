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

#include "checkpoint/stream_source.h"

#include "common/config.h"
#include "common/logging.h"
#include "http/http_client.h"

namespace fsimage {

HttpStreamSource::HttpStreamSource(int64_t connect_timeout_ms)
        : _connect_timeout_ms(connect_timeout_ms) {}

int64_t HttpStreamSource::connect_timeout_ms_from_config() {
    return config::image_transfer_connect_timeout_sec * 1000L;
}

Status HttpStreamSource::fetch(const std::string& url, int64_t read_timeout_ms,
                               size_t buffer_size, const HeaderCallback& on_header,
                               const DataCallback& on_data) {
    HttpClient client;
    RETURN_IF_ERROR(client.init(url));
    if (_connect_timeout_ms > 0) {
        client.set_connect_timeout_ms(_connect_timeout_ms);
    }
    client.set_read_timeout_ms(read_timeout_ms);
    client.set_buffer_size(buffer_size);

    // the declared length is known once the first body chunk arrives
    bool header_done = false;
    Status callback_status;
    auto callback = [&](const void* data, size_t length) {
        if (!header_done) {
            header_done = true;
            callback_status = on_header(client.get_content_length());
            if (!callback_status.ok()) {
                return false;
            }
        }
        callback_status = on_data(data, length);
        return callback_status.ok();
    };
    Status st = client.execute(callback);
    if (!callback_status.ok()) {
        return callback_status;
    }
    RETURN_IF_ERROR(st);

    // empty body
    if (!header_done) {
        return on_header(client.get_content_length());
    }
    return Status::OK();
}

} // namespace fsimage
