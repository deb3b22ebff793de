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

#include "checkpoint/fault_injector.h"

#include "common/logging.h"

namespace fsimage {

PathFaultInjector::PathFaultInjector(FaultAction action, const std::string& path_pattern)
        : _action(action), _path_pattern(path_pattern) {}

FaultAction PathFaultInjector::on_serve(const std::string& source_path) {
    if (_action == FaultAction::NONE || source_path.find(_path_pattern) == std::string::npos) {
        return FaultAction::NONE;
    }
    LOG(WARNING) << "inject fault into transfer of " << source_path
                 << ", action=" << (_action == FaultAction::FAIL ? "FAIL" : "TRUNCATE");
    return _action;
}

} // namespace fsimage
