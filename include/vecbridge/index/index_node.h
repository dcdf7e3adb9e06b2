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
#include <memory>
#include <string>
#include <vector>

#include "vecbridge/config.h"
#include "vecbridge/expected.h"
#include "vecbridge/status.h"

namespace vecbridge {

// Nearest first.
struct SearchResult {
    std::vector<int64_t> ids;
    std::vector<float> distances;
};

// An index instance behind the C ABI. Implementations own their locking: Build and Deserialize are
// exclusive, Search and Serialize may run concurrently with each other.
class IndexNode {
 public:
    virtual ~IndexNode() = default;

    // Adds `rows` vectors of `dim` floats. Items the index cannot accept (duplicate id, non-finite
    // component, zero vector under cosine) are skipped and returned; they do not fail the call.
    virtual expected<std::vector<int64_t>>
    Build(int64_t rows, int64_t dim, const int64_t* ids, const float* data) = 0;

    virtual expected<SearchResult>
    Search(const float* query, int64_t dim, int64_t k, const BaseConfig& cfg) const = 0;

    virtual std::unique_ptr<BaseConfig>
    CreateSearchConfig() const = 0;

    // Writes the engine payload to `path` and the json sidecar to `path + ".meta"`.
    virtual Status
    Serialize(const std::string& path) const = 0;

    // Only valid on an empty index.
    virtual Status
    Deserialize(const std::string& path) = 0;

    virtual int64_t
    Dim() const = 0;

    virtual int64_t
    Count() const = 0;

    virtual std::string
    Type() const = 0;
};

}  // namespace vecbridge
