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

#include <hnswlib/hnswlib.h>

#include <cstddef>
#include <memory>

#include "vecbridge/index_param.h"

namespace vecbridge {

// l2 is squared euclidean; ip and cosine are 1 - <a, b> over the stored (for cosine, normalized) rows.
std::unique_ptr<hnswlib::SpaceInterface<float>>
CreateSpace(MetricType metric, size_t dim);

inline bool
NeedsNormalize(MetricType metric) {
    return metric == MetricType::COSINE;
}

bool
IsFiniteVector(const float* data, size_t dim);

// Writes the unit vector of `in` to `out`. Returns false for a zero vector and leaves `out` as a copy.
bool
NormalizeVector(const float* in, float* out, size_t dim);

}  // namespace vecbridge
