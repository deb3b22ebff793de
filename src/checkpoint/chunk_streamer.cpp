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

#include "checkpoint/chunk_streamer.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <vector>

#include "checkpoint/fault_injector.h"
#include "checkpoint/output_sink.h"
#include "common/config.h"
#include "common/logging.h"
#include "util/file_handle.h"
#include "util/throttler.h"

namespace fsimage {

ServeOptions ServeOptions::from_config() {
    ServeOptions options;
    if (config::io_file_buffer_size > 0) {
        options.buffer_size = static_cast<size_t>(config::io_file_buffer_size);
    } else {
        LOG(WARNING) << "invalid io_file_buffer_size " << config::io_file_buffer_size
                     << ", use " << options.buffer_size;
    }
    options.bandwidth_per_sec = config::image_transfer_bandwidth_per_sec;
    if (config::image_transfer_throttle_period_ms > 0) {
        options.throttle_period_ms = config::image_transfer_throttle_period_ms;
    } else {
        LOG(WARNING) << "invalid image_transfer_throttle_period_ms "
                     << config::image_transfer_throttle_period_ms << ", use "
                     << options.throttle_period_ms;
    }
    return options;
}

std::unique_ptr<Throttler> ServeOptions::create_throttler() const {
    if (bandwidth_per_sec <= 0) {
        return nullptr;
    }
    return std::unique_ptr<Throttler>(
            new DataTransferThrottler(bandwidth_per_sec, throttle_period_ms));
}

ChunkStreamer::ChunkStreamer(size_t buffer_size, StreamFaultInjector* fault_injector)
        : _buffer_size(buffer_size), _fault_injector(fault_injector) {
    CHECK_GT(buffer_size, 0);
}

Status ChunkStreamer::content_length(const std::string& path, int64_t* length) {
    boost::system::error_code ec;
    uintmax_t size = boost::filesystem::file_size(path, ec);
    if (ec) {
        LOG(WARNING) << "fail to get file size. path=" << path << ", error=" << ec.message();
        return Status::IOError("fail to get size of " + path + ": " + ec.message());
    }
    *length = static_cast<int64_t>(size);
    return Status::OK();
}

Status ChunkStreamer::serve(OutputSink* sink, const std::string& source_path,
                            Throttler* throttler) const {
    FaultAction fault = FaultAction::NONE;
    if (_fault_injector != nullptr) {
        boost::system::error_code ec;
        boost::filesystem::path cwd = boost::filesystem::current_path(ec);
        if (ec) {
            return Status::IOError("fail to get current directory: " + ec.message());
        }
        boost::filesystem::path abs_path = boost::filesystem::absolute(source_path, cwd);
        fault = _fault_injector->on_serve(abs_path.string());
        if (fault == FaultAction::FAIL) {
            return Status::IOError("injected failure while serving " + abs_path.string());
        }
    }

    FileHandle file;
    RETURN_IF_ERROR(file.open(source_path, O_RDONLY));

    std::vector<char> buf(_buffer_size);
    if (fault == FaultAction::TRUNCATE) {
        int64_t file_length = 0;
        RETURN_IF_ERROR(file.length(&file_length));
        size_t to_drop = std::min(static_cast<size_t>(file_length / 2), _buffer_size);
        while (to_drop > 0) {
            size_t bytes_read = 0;
            RETURN_IF_ERROR(file.read(buf.data(), to_drop, &bytes_read));
            if (bytes_read == 0) {
                break;
            }
            to_drop -= bytes_read;
        }
    }

    int64_t bytes_sent = 0;
    while (true) {
        size_t bytes_read = 0;
        RETURN_IF_ERROR(file.read(buf.data(), _buffer_size, &bytes_read));
        if (bytes_read == 0) {
            break;
        }
        Status st = sink->write(buf.data(), bytes_read);
        if (!st.ok()) {
            LOG(WARNING) << "fail to send file. path=" << source_path
                         << ", sent=" << bytes_sent << ", error=" << st.to_string();
            if (st.is_io_error()) {
                return st;
            }
            return Status::IOError(st.get_error_msg());
        }
        bytes_sent += bytes_read;
        if (throttler != nullptr) {
            throttler->admit(bytes_read);
        }
    }
    VLOG_FILE << "finish serving file. path=" << source_path << ", size=" << bytes_sent;
    return Status::OK();
}

} // namespace fsimage
