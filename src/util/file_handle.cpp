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

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <sstream>

#include "common/logging.h"

namespace fsimage {

static std::string errno_message(const std::string& op, const std::string& file_name) {
    char errmsg[64];
    std::stringstream ss;
    ss << "failed to " << op << " file. file=" << file_name << ", error="
       << strerror_r(errno, errmsg, sizeof(errmsg));
    return ss.str();
}

FileHandle::FileHandle() : _fd(-1) {}

FileHandle::~FileHandle() {
    WARN_IF_ERROR(close(), "failed to close file on destruction");
}

Status FileHandle::open(const std::string& file_name, int flag, int mode) {
    if (_fd != -1 && _file_name == file_name) {
        return Status::OK();
    }
    RETURN_IF_ERROR(close());

    do {
        _fd = ::open(file_name.c_str(), flag, mode);
    } while (_fd < 0 && errno == EINTR);

    if (_fd < 0) {
        std::string msg = errno_message("open", file_name);
        LOG(WARNING) << msg;
        return Status::IOError(msg);
    }

    VLOG_FILE << "success to open file. file=" << file_name << ", fd=" << _fd;
    _file_name = file_name;
    return Status::OK();
}

Status FileHandle::close() {
    if (_fd < 0) {
        return Status::OK();
    }

    int fd = _fd;
    _fd = -1;
    // no retry on EINTR, the descriptor is released either way on linux
    if (::close(fd) < 0) {
        std::string msg = errno_message("close", _file_name);
        LOG(WARNING) << msg;
        return Status::IOError(msg);
    }

    VLOG_FILE << "finished to close file. file=" << _file_name << ", fd=" << fd;
    return Status::OK();
}

Status FileHandle::read(void* buf, size_t size, size_t* bytes_read) {
    ssize_t rd_size = 0;
    do {
        rd_size = ::read(_fd, buf, size);
    } while (rd_size < 0 && errno == EINTR);

    if (rd_size < 0) {
        std::string msg = errno_message("read", _file_name);
        LOG(WARNING) << msg << ", size=" << size;
        return Status::IOError(msg);
    }
    *bytes_read = static_cast<size_t>(rd_size);
    return Status::OK();
}

Status FileHandle::write(const void* buf, size_t size) {
    const char* ptr = static_cast<const char*>(buf);
    size_t left = size;
    while (left > 0) {
        ssize_t wr_size = ::write(_fd, ptr, left);
        if (wr_size < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string msg = errno_message("write", _file_name);
            LOG(WARNING) << msg << ", size=" << size;
            return Status::IOError(msg);
        }
        if (wr_size == 0) {
            return Status::IOError("write returned 0 bytes. file=" + _file_name);
        }
        ptr += wr_size;
        left -= static_cast<size_t>(wr_size);
    }
    return Status::OK();
}

Status FileHandle::length(int64_t* length) const {
    struct stat stat_data;
    if (fstat(_fd, &stat_data) < 0) {
        std::string msg = errno_message("stat", _file_name);
        LOG(WARNING) << msg;
        return Status::IOError(msg);
    }
    *length = stat_data.st_size;
    return Status::OK();
}

} // namespace fsimage
