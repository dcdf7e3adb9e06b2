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

#include "index/batch.h"

#include "index/metric.h"
#include "vecbridge/log.h"

namespace vecbridge {

Status
CheckBuildArgs(int64_t rows, int64_t dim, const int64_t* ids, const float* data, int64_t index_dim) {
    if (dim != index_dim) {
        return Status::dimension_not_equal_in_format("build dim {} does not match index dim {}", dim, index_dim);
    }
    if (rows < 0) {
        return Status::invalid_args_in_format("number of vectors must not be negative, got {}", rows);
    }
    if (rows > 0 && (ids == nullptr || data == nullptr)) {
        return Status::invalid_args("ids and vectors must not be null");
    }
    return Status::success();
}

Status
CheckSearchArgs(const float* query, int64_t dim, int64_t k, int64_t index_dim) {
    if (dim != index_dim) {
        return Status::dimension_not_equal_in_format("query dim {} does not match index dim {}", dim, index_dim);
    }
    if (query == nullptr) {
        return Status::invalid_args("query vector must not be null");
    }
    if (!IsFiniteVector(query, dim)) {
        return Status::invalid_args("query vector has a non-finite component");
    }
    if (k <= 0) {
        return Status::invalid_args_in_format("k must be positive, got {}", k);
    }
    return Status::success();
}

ScreenedBatch
ScreenBatch(int64_t rows, int64_t dim, const int64_t* ids, const float* data, MetricType metric,
            const std::unordered_set<int64_t>& existing) {
    ScreenedBatch batch;
    batch.accepted_rows.reserve(rows);
    std::unordered_set<int64_t> seen;
    seen.reserve(rows);

    std::vector<float> scratch(NeedsNormalize(metric) ? dim : 0);
    for (int64_t row = 0; row < rows; ++row) {
        auto id = ids[row];
        const float* vec = data + row * dim;
        if (existing.count(id) != 0 || seen.count(id) != 0) {
            LOG_VECBRIDGE_DEBUG_ << "reject duplicate id " << id;
            batch.failed_ids.push_back(id);
            continue;
        }
        if (!IsFiniteVector(vec, dim)) {
            LOG_VECBRIDGE_DEBUG_ << "reject id " << id << ": non-finite component";
            batch.failed_ids.push_back(id);
            continue;
        }
        if (NeedsNormalize(metric) && !NormalizeVector(vec, scratch.data(), dim)) {
            LOG_VECBRIDGE_DEBUG_ << "reject id " << id << ": zero vector under cosine";
            batch.failed_ids.push_back(id);
            continue;
        }
        seen.insert(id);
        batch.accepted_rows.push_back(row);
    }
    return batch;
}

}  // namespace vecbridge
