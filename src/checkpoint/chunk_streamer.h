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

#ifndef FSIMAGE_SRC_CHECKPOINT_CHUNK_STREAMER_H
#define FSIMAGE_SRC_CHECKPOINT_CHUNK_STREAMER_H

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>

#include "common/status.h"

namespace fsimage {

class OutputSink;
class StreamFaultInjector;
class Throttler;

// Serving side settings taken from the process configuration.
struct ServeOptions {
    size_t buffer_size = 4096;
    // 0 means not throttled
    int64_t bandwidth_per_sec = 0;
    int64_t throttle_period_ms = 500;

    // Non-positive buffer size or period in the configuration fall back
    // to the defaults above.
    static ServeOptions from_config();

    // The throttler to share between all transfers served with these
    // options, nullptr when not throttled.
    std::unique_ptr<Throttler> create_throttler() const;
};

// Streams a local file into an OutputSink in chunks of buffer_size bytes.
// Stateless after construction, one instance may serve concurrent transfers.
class ChunkStreamer {
public:
    explicit ChunkStreamer(size_t buffer_size, StreamFaultInjector* fault_injector = nullptr);

    // Send the whole content of source_path to sink. When throttler is not
    // null every chunk is admitted after it was written.
    // Open, read and sink failures are returned as IOError.
    Status serve(OutputSink* sink, const std::string& source_path, Throttler* throttler) const;

    // Length of the file at path, the value the serving layer declares
    // as Content-Length before calling serve().
    static Status content_length(const std::string& path, int64_t* length);

private:
    const size_t _buffer_size;
    StreamFaultInjector* _fault_injector;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_CHECKPOINT_CHUNK_STREAMER_H
