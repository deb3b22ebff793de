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

#ifndef FSIMAGE_SRC_UTIL_THROTTLER_H
#define FSIMAGE_SRC_UTIL_THROTTLER_H

#include <stdint.h>

#include <condition_variable>
#include <mutex>

namespace fsimage {

// Paces the byte throughput of transfers.
// One instance may be shared by several concurrent transfers, in which case
// the ceiling applies to their aggregate throughput.
class Throttler {
public:
    virtual ~Throttler() {}

    // Account for bytes that were just sent. May block the caller until
    // sending them fits into the rate ceiling.
    virtual void admit(int64_t bytes) = 0;
};

// Fixed bandwidth throttler. Time is cut into periods and every period
// grants bandwidth * period bytes. A caller that overdraws the budget of
// the current period waits for the following one.
class DataTransferThrottler : public Throttler {
public:
    static const int64_t DEFAULT_PERIOD_MS = 500;

    explicit DataTransferThrottler(int64_t bandwidth_per_sec,
                                   int64_t period_ms = DEFAULT_PERIOD_MS);

    void admit(int64_t bytes) override;

    int64_t bandwidth() const { return _bandwidth_per_sec; }

private:
    static int64_t _now_ms();

    const int64_t _period_ms;
    const int64_t _bandwidth_per_sec;
    const int64_t _bytes_per_period;

    std::mutex _mutex;
    std::condition_variable _period_cond;
    // all fields below are protected by _mutex
    int64_t _cur_period_start_ms;
    int64_t _cur_reserve;
    int64_t _total_admitted;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_UTIL_THROTTLER_H
