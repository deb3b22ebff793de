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

#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>

#include <boost/filesystem.hpp>
#include <fstream>
#include <vector>

#include "checkpoint/fault_injector.h"
#include "checkpoint/output_sink.h"
#include "common/config.h"
#include "util/logging.h"
#include "util/throttler.h"

namespace fsimage {

class StringSink : public OutputSink {
public:
    Status write(const void* data, size_t size) override {
        if (_fail_after >= 0 && static_cast<int>(chunks.size()) >= _fail_after) {
            return Status::RemoteError("connection reset by peer");
        }
        content.append(static_cast<const char*>(data), size);
        chunks.push_back(size);
        return Status::OK();
    }

    void fail_after(int writes) { _fail_after = writes; }

    std::string content;
    std::vector<size_t> chunks;

private:
    int _fail_after = -1;
};

class CountingThrottler : public Throttler {
public:
    void admit(int64_t bytes) override {
        total += bytes;
        ++calls;
    }

    int64_t total = 0;
    int calls = 0;
};

class ChunkStreamerTest : public testing::Test {
public:
    void SetUp() override {
        _test_dir = "./ut_dir/chunk_streamer_test";
        boost::filesystem::remove_all(_test_dir);
        boost::filesystem::create_directories(_test_dir);
    }
    void TearDown() override { boost::filesystem::remove_all(_test_dir); }

protected:
    std::string write_file(const std::string& name, size_t size) {
        std::string content;
        content.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            content.push_back(static_cast<char>((i * 31 + 7) % 251));
        }
        std::string path = _test_dir + "/" + name;
        std::ofstream out(path, std::ios::binary);
        out.write(content.data(), content.size());
        _content = content;
        return path;
    }

    std::string _test_dir;
    std::string _content;
};

TEST_F(ChunkStreamerTest, Serve) {
    std::string path = write_file("fsimage", 10000);
    ChunkStreamer streamer(4096);
    StringSink sink;
    CountingThrottler throttler;
    ASSERT_TRUE(streamer.serve(&sink, path, &throttler).ok());
    ASSERT_EQ(_content, sink.content);
    ASSERT_EQ(std::vector<size_t>({4096, 4096, 1808}), sink.chunks);
    ASSERT_EQ(10000, throttler.total);
    ASSERT_EQ(3, throttler.calls);
}

TEST_F(ChunkStreamerTest, ServeWithoutThrottler) {
    std::string path = write_file("edits", 4096);
    ChunkStreamer streamer(1024);
    StringSink sink;
    ASSERT_TRUE(streamer.serve(&sink, path, nullptr).ok());
    ASSERT_EQ(_content, sink.content);
    ASSERT_EQ(4U, sink.chunks.size());
}

TEST_F(ChunkStreamerTest, EmptyFile) {
    std::string path = write_file("edits", 0);
    ChunkStreamer streamer(4096);
    StringSink sink;
    CountingThrottler throttler;
    ASSERT_TRUE(streamer.serve(&sink, path, &throttler).ok());
    ASSERT_TRUE(sink.chunks.empty());
    ASSERT_EQ(0, throttler.calls);
}

TEST_F(ChunkStreamerTest, SourceNotExist) {
    ChunkStreamer streamer(4096);
    StringSink sink;
    ASSERT_TRUE(streamer.serve(&sink, _test_dir + "/not_exist", nullptr).is_io_error());
    ASSERT_TRUE(sink.content.empty());
}

TEST_F(ChunkStreamerTest, SinkFailure) {
    std::string path = write_file("fsimage", 10000);
    ChunkStreamer streamer(4096);
    StringSink sink;
    sink.fail_after(1);
    Status st = streamer.serve(&sink, path, nullptr);
    ASSERT_TRUE(st.is_io_error());
    ASSERT_EQ(4096U, sink.content.size());
}

TEST_F(ChunkStreamerTest, InjectFailure) {
    std::string path = write_file("fsimage", 10000);
    PathFaultInjector injector(FaultAction::FAIL, "chunk_streamer_test/fsimage");
    ChunkStreamer streamer(4096, &injector);
    StringSink sink;
    ASSERT_TRUE(streamer.serve(&sink, path, nullptr).is_io_error());
    ASSERT_TRUE(sink.content.empty());

    // other files are served normally
    std::string edits = write_file("edits", 100);
    ASSERT_TRUE(streamer.serve(&sink, edits, nullptr).ok());
    ASSERT_EQ(_content, sink.content);
}

TEST_F(ChunkStreamerTest, InjectTruncate) {
    std::string path = write_file("fsimage", 10000);
    PathFaultInjector injector(FaultAction::TRUNCATE, "fsimage");
    ChunkStreamer streamer(4096, &injector);
    StringSink sink;
    ASSERT_TRUE(streamer.serve(&sink, path, nullptr).ok());
    // min(10000 / 2, 4096) bytes are dropped
    ASSERT_EQ(_content.substr(4096), sink.content);

    path = write_file("fsimage_small", 100);
    StringSink small_sink;
    ASSERT_TRUE(streamer.serve(&small_sink, path, nullptr).ok());
    ASSERT_EQ(_content.substr(50), small_sink.content);
}

TEST_F(ChunkStreamerTest, InjectorSeesAbsolutePath) {
    class RecordingInjector : public StreamFaultInjector {
    public:
        FaultAction on_serve(const std::string& source_path) override {
            path = source_path;
            return FaultAction::NONE;
        }
        std::string path;
    };
    std::string path = write_file("fsimage", 10);
    RecordingInjector injector;
    ChunkStreamer streamer(4096, &injector);
    StringSink sink;
    ASSERT_TRUE(streamer.serve(&sink, path, nullptr).ok());
    ASSERT_TRUE(boost::filesystem::path(injector.path).is_absolute());
    ASSERT_EQ(_content, sink.content);
}

TEST_F(ChunkStreamerTest, ContentLength) {
    std::string path = write_file("fsimage", 12345);
    int64_t length = 0;
    ASSERT_TRUE(ChunkStreamer::content_length(path, &length).ok());
    ASSERT_EQ(12345, length);
    ASSERT_TRUE(ChunkStreamer::content_length(_test_dir + "/not_exist", &length).is_io_error());
}

TEST_F(ChunkStreamerTest, ServeOptions) {
    ServeOptions options = ServeOptions::from_config();
    ASSERT_EQ(4096U, options.buffer_size);
    ASSERT_EQ(500, options.throttle_period_ms);
    ASSERT_TRUE(options.create_throttler() == nullptr);

    std::string conf_file = _test_dir + "/throttled.conf";
    {
        std::ofstream out(conf_file);
        out << "image_transfer_bandwidth_per_sec = 1048576\n";
    }
    ASSERT_TRUE(config::init(conf_file.c_str()));
    options = ServeOptions::from_config();
    config::init(nullptr);
    ASSERT_EQ(1048576, options.bandwidth_per_sec);
    std::unique_ptr<Throttler> throttler = options.create_throttler();
    ASSERT_TRUE(throttler != nullptr);
    ASSERT_EQ(1048576, static_cast<DataTransferThrottler*>(throttler.get())->bandwidth());
}

TEST_F(ChunkStreamerTest, ServeOptionsInvalidConfig) {
    std::string conf_file = _test_dir + "/invalid.conf";
    {
        std::ofstream out(conf_file);
        out << "io_file_buffer_size = -1\n"
            << "image_transfer_throttle_period_ms = 0\n";
    }
    ASSERT_TRUE(config::init(conf_file.c_str()));
    ServeOptions options = ServeOptions::from_config();
    config::init(nullptr);
    ASSERT_EQ(4096U, options.buffer_size);
    ASSERT_EQ(500, options.throttle_period_ms);

    {
        std::ofstream out(conf_file);
        out << "io_file_buffer_size = 0\n";
    }
    ASSERT_TRUE(config::init(conf_file.c_str()));
    options = ServeOptions::from_config();
    config::init(nullptr);
    ASSERT_EQ(4096U, options.buffer_size);

    // the fallback size streams a file as usual
    std::string path = write_file("fsimage", 10000);
    ChunkStreamer streamer(options.buffer_size);
    StringSink sink;
    ASSERT_TRUE(streamer.serve(&sink, path, nullptr).ok());
    ASSERT_EQ(10000U, sink.content.size());
    ASSERT_EQ(3U, sink.chunks.size());
}

} // namespace fsimage

int main(int argc, char** argv) {
    setenv("FSIMAGE_HOME", ".", 0);
    if (!fsimage::config::init(nullptr)) {
        fprintf(stderr, "error init config.\n");
        return -1;
    }
    fsimage::init_glog("fsimage-test");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
