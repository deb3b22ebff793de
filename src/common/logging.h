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

#ifndef FSIMAGE_SRC_COMMON_LOGGING_H
#define FSIMAGE_SRC_COMMON_LOGGING_H

// Wrapper around the glog header. Every file includes this instead of
// glog directly so the verbose levels below stay consistent.
#include <glog/logging.h>

// Define VLOG levels. Per-chunk information is logged at a higher level
// than per-transfer information.
#define VLOG_FILE VLOG(2)
#define VLOG_PROGRESS VLOG(3)

#endif // FSIMAGE_SRC_COMMON_LOGGING_H
