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


#include "common/config.h"

#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>

#include <boost/filesystem.hpp>
#include <fstream>

#include "common/status.h"
#include "util/logging.h"

namespace fsimage {

class ConfigTest : public testing::Test {
public:
    void SetUp() override {
        _test_dir = "./ut_dir/config_test";
        boost::filesystem::remove_all(_test_dir);
        boost::filesystem::create_directories(_test_dir);
    }
    void TearDown() override {
        boost::filesystem::remove_all(_test_dir);
        // restore defaults for the following tests
        config::init(nullptr);
    }

protected:
    std::string _test_dir;
};

TEST_F(ConfigTest, Defaults) {
    ASSERT_TRUE(config::init(nullptr));
    ASSERT_EQ(4096, config::io_file_buffer_size);
    ASSERT_EQ(0, config::image_transfer_bandwidth_per_sec);
    ASSERT_EQ(500, config::image_transfer_throttle_period_ms);
    ASSERT_EQ(600, config::image_download_read_timeout_sec);
    ASSERT_EQ(7200, config::image_upload_read_timeout_sec);
    ASSERT_EQ("INFO", config::sys_log_level);
    ASSERT_TRUE(config::sys_log_verbose_modules.empty());
}

TEST_F(ConfigTest, LoadFile) {
    setenv("FSIMAGE_TEST_LOG_ROOT", "/tmp/fsimage", 1);
    std::string conf_file = _test_dir + "/fsimage.conf";
    {
        std::ofstream out(conf_file);
        out << "# transfer settings\n"
            << "\n"
            << "io_file_buffer_size = 65536\n"
            << "image_transfer_bandwidth_per_sec=1048576\n"
            << "sys_log_dir = ${FSIMAGE_TEST_LOG_ROOT}/log\n"
            << "sys_log_verbose_modules = chunk_streamer,fetch_client\n"
            << "unknown_item = 1\n";
    }
    ASSERT_TRUE(config::init(conf_file.c_str(), true));
    ASSERT_EQ(65536, config::io_file_buffer_size);
    ASSERT_EQ(1048576, config::image_transfer_bandwidth_per_sec);
    ASSERT_EQ("/tmp/fsimage/log", config::sys_log_dir);
    ASSERT_EQ(2U, config::sys_log_verbose_modules.size());
    ASSERT_EQ("fetch_client", config::sys_log_verbose_modules[1]);
    ASSERT_EQ("65536", (*config::full_conf_map)["io_file_buffer_size"]);
}

TEST_F(ConfigTest, BadValue) {
    std::string conf_file = _test_dir + "/bad.conf";
    {
        std::ofstream out(conf_file);
        out << "io_file_buffer_size = 4k\n";
    }
    ASSERT_FALSE(config::init(conf_file.c_str()));
    ASSERT_FALSE(config::init("./ut_dir/config_test/not_exist.conf"));
}

TEST_F(ConfigTest, SetConfig) {
    ASSERT_TRUE(config::init(nullptr));
    ASSERT_TRUE(config::set_config("image_download_read_timeout_sec", "30").ok());
    ASSERT_EQ(30, config::image_download_read_timeout_sec);
    ASSERT_TRUE(config::set_config("image_transfer_connect_timeout_sec", "10").ok());
    ASSERT_EQ(10, config::image_transfer_connect_timeout_sec);

    ASSERT_TRUE(config::set_config("no_such_item", "1").is_not_found());
    // not mutable at runtime
    ASSERT_TRUE(config::set_config("io_file_buffer_size", "1024").is_invalid_argument());
    ASSERT_EQ(4096, config::io_file_buffer_size);
    // the serving throttler reads it once
    ASSERT_TRUE(config::set_config("image_transfer_bandwidth_per_sec", "2048")
                        .is_invalid_argument());
    ASSERT_EQ(0, config::image_transfer_bandwidth_per_sec);
    ASSERT_TRUE(config::set_config("image_upload_read_timeout_sec", "abc").is_invalid_argument());
    ASSERT_EQ(7200, config::image_upload_read_timeout_sec);
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
