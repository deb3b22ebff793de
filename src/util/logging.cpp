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

#include "util/logging.h"

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

#include "common/config.h"

namespace fsimage {

static bool logging_initialized = false;

static std::mutex logging_mutex;

bool init_glog(const char* basename, bool install_signal_handler) {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);

    if (logging_initialized) {
        return true;
    }

    if (install_signal_handler) {
        google::InstallFailureSignalHandler();
    }

    // make sure the log dir exists, glog silently falls back to stderr otherwise
    boost::system::error_code ec;
    boost::filesystem::create_directories(config::sys_log_dir, ec);
    if (ec) {
        std::cerr << "failed to create log dir " << config::sys_log_dir << ": " << ec.message()
                  << std::endl;
        return false;
    }

    // don't log to stderr
    FLAGS_stderrthreshold = 5;
    // set glog log dir
    FLAGS_log_dir = config::sys_log_dir;
    // 0 means buffer INFO only
    FLAGS_logbuflevel = 0;
    // buffer log messages for at most this many seconds
    FLAGS_logbufsecs = 30;
    // roll the log file when it grows over this size, in MB
    FLAGS_max_log_size = config::sys_log_max_size_mb;
    // stop writing logs when the disk is full
    FLAGS_stop_logging_if_full_disk = true;

    // set log level
    const std::string& loglevel = config::sys_log_level;
    if (boost::iequals(loglevel, "INFO")) {
        FLAGS_minloglevel = 0;
    } else if (boost::iequals(loglevel, "WARNING")) {
        FLAGS_minloglevel = 1;
    } else if (boost::iequals(loglevel, "ERROR")) {
        FLAGS_minloglevel = 2;
    } else if (boost::iequals(loglevel, "FATAL")) {
        FLAGS_minloglevel = 3;
    } else {
        std::cerr << "sys_log_level needs to be INFO, WARNING, ERROR, FATAL" << std::endl;
        return false;
    }

    // set log buffer level
    // default is 0
    const std::string& logbuflevel = config::log_buffer_level;
    if (boost::iequals(logbuflevel, "-1")) {
        FLAGS_logbuflevel = -1;
    } else if (boost::iequals(logbuflevel, "0")) {
        FLAGS_logbuflevel = 0;
    }

    // set verbose modules.
    FLAGS_v = -1;
    const std::vector<std::string>& verbose_modules = config::sys_log_verbose_modules;
    int32_t vlog_level = config::sys_log_verbose_level;
    for (size_t i = 0; i < verbose_modules.size(); i++) {
        if (verbose_modules[i].size() != 0) {
            google::SetVLOGLevel(verbose_modules[i].c_str(), vlog_level);
        }
    }

    google::InitGoogleLogging(basename);

    logging_initialized = true;

    return true;
}

void shutdown_logging() {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);
    google::ShutdownGoogleLogging();
}

} // namespace fsimage
