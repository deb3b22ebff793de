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

#include "common/status.h"

namespace fsimage {

std::string Status::code_as_string() const {
    switch (_code) {
    case StatusCode::OK:
        return "OK";
    case StatusCode::INVALID_ARGUMENT:
        return "Invalid argument";
    case StatusCode::PROTOCOL_ERROR:
        return "Protocol error";
    case StatusCode::CORRUPTION:
        return "Corruption";
    case StatusCode::IO_ERROR:
        return "IO error";
    case StatusCode::REMOTE_ERROR:
        return "Remote error";
    case StatusCode::NOT_FOUND:
        return "Not found";
    case StatusCode::INTERNAL_ERROR:
        return "Internal error";
    }
    return "Unknown code(" + std::to_string(static_cast<int>(_code)) + ")";
}

std::string Status::to_string() const {
    std::string result(code_as_string());
    if (ok()) {
        return result;
    }
    result.append(": ");
    result.append(_msg);
    return result;
}

Status Status::clone_and_prepend(const std::string& msg) const {
    if (ok()) {
        return *this;
    }
    return Status(_code, msg + ": " + _msg);
}

} // namespace fsimage
