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
#include <unordered_set>
#include <vector>

#include "vecbridge/index_param.h"
#include "vecbridge/status.h"

namespace vecbridge {

Status
CheckBuildArgs(int64_t rows, int64_t dim, const int64_t* ids, const float* data, int64_t index_dim);

Status
CheckSearchArgs(const float* query, int64_t dim, int64_t k, int64_t index_dim);

struct ScreenedBatch {
    std::vector<int64_t> accepted_rows;
    std::vector<int64_t> failed_ids;
};

// Splits a batch into rows the index can take and ids it must reject, keeping input order. A row is
// rejected when its id is already in `existing` or earlier in the batch, when a component is not
// finite, or when it is a zero vector under cosine.
ScreenedBatch
ScreenBatch(int64_t rows, int64_t dim, const int64_t* ids, const float* data, MetricType metric,
            const std::unordered_set<int64_t>& existing);

}  // namespace vecbridge
