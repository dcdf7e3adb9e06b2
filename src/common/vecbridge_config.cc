// Copyright (C) 2019-2023 Zilliz. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance
// with the License. You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under the License.

#include "vecbridge/vecbridge_config.h"

#include <cstdlib>
#include <mutex>

#include "vecbridge/log.h"

namespace vecbridge {

void
VecbridgeConfig::InitLog() {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (!google::IsGoogleLoggingInitialized()) {
            google::InitGoogleLogging(VECBRIDGE_MODULE_NAME);
        }
        FLAGS_logtostderr = true;

        const char* env_level = std::getenv("VECBRIDGE_LOG_LEVEL");
        if (env_level != nullptr) {
            LogLevel level;
            if (ParseLogLevel(env_level, level)) {
                SetLogLevel(level);
            } else {
                LOG_VECBRIDGE_WARNING_ << "ignoring unknown VECBRIDGE_LOG_LEVEL: " << env_level;
            }
        }
    });
}

void
VecbridgeConfig::SetLogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace:
            FLAGS_minloglevel = google::GLOG_INFO;
            FLAGS_v = 2;
            break;
        case LogLevel::kDebug:
            FLAGS_minloglevel = google::GLOG_INFO;
            FLAGS_v = 1;
            break;
        case LogLevel::kInfo:
            FLAGS_minloglevel = google::GLOG_INFO;
            FLAGS_v = 0;
            break;
        case LogLevel::kWarning:
            FLAGS_minloglevel = google::GLOG_WARNING;
            FLAGS_v = 0;
            break;
        case LogLevel::kError:
            FLAGS_minloglevel = google::GLOG_ERROR;
            FLAGS_v = 0;
            break;
    }
}

bool
VecbridgeConfig::ParseLogLevel(const std::string& name, LogLevel& level) {
    if (name == "trace") {
        level = LogLevel::kTrace;
    } else if (name == "debug") {
        level = LogLevel::kDebug;
    } else if (name == "info") {
        level = LogLevel::kInfo;
    } else if (name == "warning") {
        level = LogLevel::kWarning;
    } else if (name == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

}  // namespace vecbridge
