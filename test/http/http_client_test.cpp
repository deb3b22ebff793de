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


#include "http/http_client.h"

#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>

#include <boost/filesystem.hpp>
#include <fstream>

#include "common/config.h"
#include "util/logging.h"

namespace fsimage {

class HttpClientTest : public testing::Test {
public:
    void SetUp() override {
        _test_dir = boost::filesystem::absolute("./ut_dir/http_client_test").string();
        boost::filesystem::remove_all(_test_dir);
        boost::filesystem::create_directories(_test_dir);
    }
    void TearDown() override { boost::filesystem::remove_all(_test_dir); }

protected:
    std::string _test_dir;
};

TEST_F(HttpClientTest, ConnectionRefused) {
    HttpClient client;
    ASSERT_TRUE(client.init("http://127.0.0.1:1/getimage?getimage=1").ok());
    client.set_connect_timeout_ms(1000);
    std::string response;
    Status st = client.execute(&response);
    ASSERT_TRUE(st.is_remote_error());
    ASSERT_TRUE(response.empty());
}

TEST_F(HttpClientTest, ReadLocalFile) {
    std::string file_name = _test_dir + "/fsimage";
    {
        std::ofstream out(file_name);
        out << "image content";
    }
    HttpClient client;
    ASSERT_TRUE(client.init("file://" + file_name).ok());
    client.set_buffer_size(4096);
    std::string response;
    ASSERT_TRUE(client.execute(&response).ok());
    ASSERT_EQ("image content", response);
    ASSERT_EQ(13, client.get_content_length());

    // the handle is reusable
    ASSERT_TRUE(client.init("file://" + _test_dir + "/not_exist").ok());
    response.clear();
    ASSERT_TRUE(client.execute(&response).is_remote_error());
}

TEST_F(HttpClientTest, AbortFromCallback) {
    std::string file_name = _test_dir + "/edits";
    {
        std::ofstream out(file_name);
        out << "edit log content";
    }
    HttpClient client;
    ASSERT_TRUE(client.init("file://" + file_name).ok());
    int calls = 0;
    auto callback = [&calls](const void* data, size_t length) {
        ++calls;
        return false;
    };
    ASSERT_TRUE(client.execute(callback).is_remote_error());
    ASSERT_EQ(1, calls);
}

TEST_F(HttpClientTest, Escape) {
    ASSERT_EQ("nn1.example.com", HttpClient::escape("nn1.example.com"));
    ASSERT_EQ("a%20b%26c%3Dd", HttpClient::escape("a b&c=d"));
    ASSERT_EQ("-1%3A2%3A3", HttpClient::escape("-1:2:3"));
}

} // namespace fsimage

int main(int argc, char** argv) {
    setenv("FSIMAGE_HOME", ".", 0);
    if (!fsimage::config::init(nullptr)) {
        fprintf(stderr, "error init config.\n");
        return -1;
    }
    fsimage::init_glog("fsimage-test");
    curl_global_init(CURL_GLOBAL_ALL);
    ::testing::InitGoogleTest(&argc, argv);
    int ret = RUN_ALL_TESTS();
    curl_global_cleanup();
    return ret;
}
