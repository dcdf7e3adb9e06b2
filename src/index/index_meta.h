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

#include <cstdint>
#include <string>

#include "vecbridge/expected.h"
#include "vecbridge/index_param.h"
#include "vecbridge/status.h"

namespace vecbridge {

constexpr int64_t kIndexFormatVersion = 1;

// Json sidecar written next to every dumped payload.
struct IndexMeta {
    std::string index_type;
    MetricType metric_type = MetricType::L2;
    int64_t dim = 0;
    int64_t count = 0;
    int64_t version = kIndexFormatVersion;
};

inline std::string
MetaPath(const std::string& path) {
    return path + ".meta";
}

// Dumps write the payload here and move it to `path` once the sidecar is in place.
inline std::string
TempPayloadPath(const std::string& path) {
    return path + ".tmp";
}

Status
WriteIndexMeta(const std::string& path, const IndexMeta& meta);

// Writes the sidecar for a payload already at TempPayloadPath(path), then renames the payload to `path`.
// The temporary payload is removed on failure.
Status
CommitDump(const std::string& path, const IndexMeta& meta);

expected<IndexMeta>
ReadIndexMeta(const std::string& path);

// Checks that the payload and its sidecar exist and that the sidecar describes an index of the given
// shape. Returns the sidecar on success.
expected<IndexMeta>
CheckDumpFiles(const std::string& path, const std::string& index_type, MetricType metric, int64_t dim);

// Opens `path` for writing to learn early whether a dump can succeed there.
Status
CheckWritable(const std::string& path);

}  // namespace vecbridge
