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

#pragma once

#include <string>

namespace vecbridge {

class VecbridgeConfig {
 public:
    enum class LogLevel {
        kTrace = 0,
        kDebug = 1,
        kInfo = 2,
        kWarning = 3,
        kError = 4,
    };

    // Initializes glog once per process. Later calls are no-ops. Reads VECBRIDGE_LOG_LEVEL
    // (trace, debug, info, warning, error) when it is set.
    static void
    InitLog();

    static void
    SetLogLevel(LogLevel level);

    // Returns false and leaves `level` untouched when `name` is not a known level.
    static bool
    ParseLogLevel(const std::string& name, LogLevel& level);
};

}  // namespace vecbridge
