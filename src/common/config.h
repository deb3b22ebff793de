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

#ifndef FSIMAGE_SRC_COMMON_CONFIG_H
#define FSIMAGE_SRC_COMMON_CONFIG_H

#include "configbase.h"

namespace fsimage {
namespace config {

    // log dir
    CONF_String(sys_log_dir, "${FSIMAGE_HOME}/log");
    // INFO, WARNING, ERROR, FATAL
    CONF_String(sys_log_level, "INFO");
    // a log file is rolled when it grows over this size, in MB
    CONF_Int32(sys_log_max_size_mb, "1024");
    // verbose log
    CONF_Strings(sys_log_verbose_modules, "");
    // verbose log level
    CONF_Int32(sys_log_verbose_level, "10");
    // log buffer level
    CONF_String(log_buffer_level, "");

    // buffer size used to read and write image and edit log files, and the
    // chunk size of every transfer
    CONF_Int32(io_file_buffer_size, "4096");

    // bandwidth shared by all image transfers served by this process,
    // in bytes per second. 0 means not throttled. Read once when the
    // serving throttler is created.
    CONF_Int64(image_transfer_bandwidth_per_sec, "0");
    // the throttler refills its budget once per period
    CONF_Int32(image_transfer_throttle_period_ms, "500");

    // a fetch aborts when no byte arrives for this long.
    // downloads of the image or edit log from the primary
    CONF_mInt32(image_download_read_timeout_sec, "600");
    // uploads: the primary fetching a merged image from the secondary
    CONF_mInt32(image_upload_read_timeout_sec, "7200");
    CONF_mInt32(image_transfer_connect_timeout_sec, "30");

} // namespace config
} // namespace fsimage

#endif // FSIMAGE_SRC_COMMON_CONFIG_H
