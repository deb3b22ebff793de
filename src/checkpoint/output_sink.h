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

#ifndef FSIMAGE_SRC_CHECKPOINT_OUTPUT_SINK_H
#define FSIMAGE_SRC_CHECKPOINT_OUTPUT_SINK_H

#include <stddef.h>

#include "common/status.h"

namespace fsimage {

// Byte sink a served file is streamed into, typically the body of an
// http response.
class OutputSink {
public:
    virtual ~OutputSink() {}

    virtual Status write(const void* data, size_t size) = 0;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_CHECKPOINT_OUTPUT_SINK_H
