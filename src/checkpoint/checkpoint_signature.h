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

#ifndef FSIMAGE_SRC_CHECKPOINT_CHECKPOINT_SIGNATURE_H
#define FSIMAGE_SRC_CHECKPOINT_CHECKPOINT_SIGNATURE_H

#include <ostream>
#include <string>

namespace fsimage {

// Identifies the checkpoint a pushed image belongs to.
// The content is opaque to the transfer layer: it is carried from the
// request to the caller, which validates it against the namespace state.
class CheckpointSignature {
public:
    CheckpointSignature() {}
    explicit CheckpointSignature(const std::string& str) : _str(str) {}

    const std::string& to_string() const { return _str; }

    bool operator==(const CheckpointSignature& other) const { return _str == other._str; }
    bool operator!=(const CheckpointSignature& other) const { return !(*this == other); }

private:
    std::string _str;
};

inline std::ostream& operator<<(std::ostream& os, const CheckpointSignature& sig) {
    return os << sig.to_string();
}

} // namespace fsimage

#endif // FSIMAGE_SRC_CHECKPOINT_CHECKPOINT_SIGNATURE_H
