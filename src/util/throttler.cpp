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

#include "util/throttler.h"

#include <algorithm>
#include <chrono>

#include "common/logging.h"

namespace fsimage {

const int64_t DataTransferThrottler::DEFAULT_PERIOD_MS;

DataTransferThrottler::DataTransferThrottler(int64_t bandwidth_per_sec, int64_t period_ms)
        : _period_ms(period_ms),
          _bandwidth_per_sec(bandwidth_per_sec),
          _bytes_per_period(std::max<int64_t>(1, bandwidth_per_sec * period_ms / 1000)),
          _cur_period_start_ms(_now_ms()),
          _cur_reserve(_bytes_per_period),
          _total_admitted(0) {
    CHECK_GT(period_ms, 0);
    CHECK_GT(bandwidth_per_sec, 0);
}

int64_t DataTransferThrottler::_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
            .count();
}

void DataTransferThrottler::admit(int64_t bytes) {
    if (bytes <= 0) {
        return;
    }

    std::unique_lock<std::mutex> l(_mutex);
    _cur_reserve -= bytes;
    _total_admitted += bytes;

    // the lock is released while waiting, so other transfers keep drawing
    // from the same budget
    while (_cur_reserve <= 0) {
        int64_t now = _now_ms();
        int64_t cur_period_end = _cur_period_start_ms + _period_ms;
        if (now < cur_period_end) {
            _period_cond.wait_for(l, std::chrono::milliseconds(cur_period_end - now));
        } else {
            _cur_period_start_ms = now;
            _cur_reserve += _bytes_per_period;
        }
    }
    VLOG_PROGRESS << "throttler admitted " << bytes << " bytes, total=" << _total_admitted;
}

} // namespace fsimage
