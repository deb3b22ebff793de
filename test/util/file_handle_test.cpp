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


#include "util/file_handle.h"

#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>

#include <boost/filesystem.hpp>

#include "common/config.h"
#include "util/logging.h"

namespace fsimage {

class FileHandleTest : public testing::Test {
public:
    void SetUp() override {
        _test_dir = "./ut_dir/file_handle_test";
        boost::filesystem::remove_all(_test_dir);
        boost::filesystem::create_directories(_test_dir);
    }
    void TearDown() override { boost::filesystem::remove_all(_test_dir); }

protected:
    std::string _test_dir;
};

TEST_F(FileHandleTest, WriteAndRead) {
    std::string file_name = _test_dir + "/fsimage";
    {
        FileHandle file;
        ASSERT_TRUE(file.open(file_name, O_WRONLY | O_CREAT | O_TRUNC).ok());
        ASSERT_TRUE(file.is_open());
        ASSERT_EQ(file_name, file.file_name());
        ASSERT_TRUE(file.write("hello ", 6).ok());
        ASSERT_TRUE(file.write("world", 5).ok());
        // closed by the destructor
    }

    FileHandle file;
    ASSERT_TRUE(file.open(file_name, O_RDONLY).ok());
    int64_t length = 0;
    ASSERT_TRUE(file.length(&length).ok());
    ASSERT_EQ(11, length);

    char buf[8];
    size_t bytes_read = 0;
    ASSERT_TRUE(file.read(buf, sizeof(buf), &bytes_read).ok());
    ASSERT_EQ(8U, bytes_read);
    ASSERT_EQ("hello wo", std::string(buf, bytes_read));
    ASSERT_TRUE(file.read(buf, sizeof(buf), &bytes_read).ok());
    ASSERT_EQ("rld", std::string(buf, bytes_read));
    ASSERT_TRUE(file.read(buf, sizeof(buf), &bytes_read).ok());
    ASSERT_EQ(0U, bytes_read);

    ASSERT_TRUE(file.close().ok());
    ASSERT_FALSE(file.is_open());
    ASSERT_TRUE(file.close().ok());
}

TEST_F(FileHandleTest, OpenFailed) {
    FileHandle file;
    Status st = file.open(_test_dir + "/no_such_dir/fsimage", O_WRONLY | O_CREAT);
    ASSERT_TRUE(st.is_io_error());
    ASSERT_FALSE(file.is_open());

    st = file.open(_test_dir + "/not_exist", O_RDONLY);
    ASSERT_TRUE(st.is_io_error());
}

TEST_F(FileHandleTest, WriteReadOnly) {
    std::string file_name = _test_dir + "/edits";
    FileHandle writer;
    ASSERT_TRUE(writer.open(file_name, O_WRONLY | O_CREAT).ok());
    ASSERT_TRUE(writer.close().ok());

    FileHandle reader;
    ASSERT_TRUE(reader.open(file_name, O_RDONLY).ok());
    ASSERT_TRUE(reader.write("x", 1).is_io_error());
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
