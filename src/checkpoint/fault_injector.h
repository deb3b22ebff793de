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

#ifndef FSIMAGE_SRC_CHECKPOINT_FAULT_INJECTOR_H
#define FSIMAGE_SRC_CHECKPOINT_FAULT_INJECTOR_H

#include <string>

namespace fsimage {

enum class FaultAction {
    NONE,
    // fail the transfer before any byte is sent
    FAIL,
    // silently drop the head of the file
    TRUNCATE
};

// Decides which fault, if any, a ChunkStreamer injects while serving a file.
// Consulted once per serve. Implementations must be safe to call from
// concurrent transfers.
class StreamFaultInjector {
public:
    virtual ~StreamFaultInjector() {}

    virtual FaultAction on_serve(const std::string& source_path) = 0;
};

// Injects a fixed action into every transfer whose source path contains
// path_pattern.
class PathFaultInjector : public StreamFaultInjector {
public:
    PathFaultInjector(FaultAction action, const std::string& path_pattern);

    FaultAction on_serve(const std::string& source_path) override;

private:
    const FaultAction _action;
    const std::string _path_pattern;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_CHECKPOINT_FAULT_INJECTOR_H
