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

#ifndef FSIMAGE_SRC_COMMON_STATUS_H
#define FSIMAGE_SRC_COMMON_STATUS_H

#include <ostream>
#include <string>

#include "common/compiler_util.h"
#include "common/logging.h"

namespace fsimage {

enum class StatusCode {
    OK = 0,
    // request parameters that do not describe a valid transfer
    INVALID_ARGUMENT = 1,
    // peer response without the metadata the protocol requires
    PROTOCOL_ERROR = 2,
    // received bytes do not match what the peer declared
    CORRUPTION = 3,
    // local file could not be opened, read, written or closed
    IO_ERROR = 4,
    // connection, http or timeout failure against the peer
    REMOTE_ERROR = 5,
    NOT_FOUND = 6,
    INTERNAL_ERROR = 7
};

class Status {
public:
    Status() : _code(StatusCode::OK) {}

    // copy c'tor makes copy of error detail so Status can be returned by value
    Status(const Status& other) = default;
    Status(Status&& other) = default;
    Status& operator=(const Status& other) = default;
    Status& operator=(Status&& other) = default;

    static Status OK() { return Status(); }

    static Status InvalidArgument(const std::string& msg) {
        return Status(StatusCode::INVALID_ARGUMENT, msg);
    }
    static Status ProtocolError(const std::string& msg) {
        return Status(StatusCode::PROTOCOL_ERROR, msg);
    }
    static Status Corruption(const std::string& msg) {
        return Status(StatusCode::CORRUPTION, msg);
    }
    static Status IOError(const std::string& msg) {
        return Status(StatusCode::IO_ERROR, msg);
    }
    static Status RemoteError(const std::string& msg) {
        return Status(StatusCode::REMOTE_ERROR, msg);
    }
    static Status NotFound(const std::string& msg) {
        return Status(StatusCode::NOT_FOUND, msg);
    }
    static Status InternalError(const std::string& msg) {
        return Status(StatusCode::INTERNAL_ERROR, msg);
    }

    bool ok() const { return _code == StatusCode::OK; }

    bool is_invalid_argument() const { return _code == StatusCode::INVALID_ARGUMENT; }
    bool is_protocol_error() const { return _code == StatusCode::PROTOCOL_ERROR; }
    bool is_corruption() const { return _code == StatusCode::CORRUPTION; }
    bool is_io_error() const { return _code == StatusCode::IO_ERROR; }
    bool is_remote_error() const { return _code == StatusCode::REMOTE_ERROR; }
    bool is_not_found() const { return _code == StatusCode::NOT_FOUND; }
    bool is_internal_error() const { return _code == StatusCode::INTERNAL_ERROR; }

    StatusCode code() const { return _code; }

    // Return a string representation of this status suitable for printing.
    // Returns the string "OK" for success.
    std::string to_string() const;

    // Return a string representation of the status code, without the message
    // text or sub code information.
    std::string code_as_string() const;

    // Error message without the code prefix. Empty for OK.
    const std::string& get_error_msg() const { return _msg; }

    // Clone this status and add the specified prefix to the message.
    // If this status is OK, then an OK status will be returned.
    Status clone_and_prepend(const std::string& msg) const;

    bool operator==(const Status& st) const { return _code == st._code && _msg == st._msg; }
    bool operator!=(const Status& st) const { return !(*this == st); }

private:
    Status(StatusCode code, const std::string& msg) : _code(code), _msg(msg) {}

    StatusCode _code;
    std::string _msg;
};

inline std::ostream& operator<<(std::ostream& os, const Status& st) {
    return os << st.to_string();
}

// some generally useful macros
#define RETURN_IF_ERROR(stmt)                  \
    do {                                       \
        const Status& _status_ = (stmt);       \
        if (UNLIKELY(!_status_.ok())) {        \
            return _status_;                   \
        }                                      \
    } while (false)

/// @brief Emit a warning if @c to_call returns a bad status.
#define WARN_IF_ERROR(to_call, warning_prefix)                           \
    do {                                                                 \
        const Status& _s = (to_call);                                    \
        if (UNLIKELY(!_s.ok())) {                                        \
            LOG(WARNING) << (warning_prefix) << ": " << _s.to_string(); \
        }                                                                \
    } while (false)

} // namespace fsimage

#endif // FSIMAGE_SRC_COMMON_STATUS_H
