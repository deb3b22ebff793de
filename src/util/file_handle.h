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

#ifndef FSIMAGE_SRC_UTIL_FILE_HANDLE_H
#define FSIMAGE_SRC_UTIL_FILE_HANDLE_H

#include <fcntl.h>
#include <stdint.h>

#include <string>

#include "common/status.h"

namespace fsimage {

// Owns a POSIX file descriptor. The descriptor is closed when the handle
// goes out of scope, so every early return of a caller releases the file.
// This class is NOT thread-safe.
class FileHandle {
public:
    FileHandle();
    ~FileHandle();

    Status open(const std::string& file_name, int flag, int mode = 0644);
    // Close the file. Safe to call on a handle that is not open.
    Status close();

    // Read at most size bytes. *bytes_read is set to 0 at end of file.
    Status read(void* buf, size_t size, size_t* bytes_read);
    // Write all size bytes or fail.
    Status write(const void* buf, size_t size);

    Status length(int64_t* length) const;

    bool is_open() const { return _fd != -1; }
    const std::string& file_name() const { return _file_name; }

private:
    FileHandle(const FileHandle&) = delete;
    const FileHandle& operator=(const FileHandle&) = delete;

    int _fd;
    std::string _file_name;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_UTIL_FILE_HANDLE_H
