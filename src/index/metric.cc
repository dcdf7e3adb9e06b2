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

#include "index/metric.h"

#include <cmath>
#include <cstring>

namespace vecbridge {

std::unique_ptr<hnswlib::SpaceInterface<float>>
CreateSpace(MetricType metric, size_t dim) {
    switch (metric) {
        case MetricType::L2:
            return std::make_unique<hnswlib::L2Space>(dim);
        case MetricType::IP:
        case MetricType::COSINE:
            return std::make_unique<hnswlib::InnerProductSpace>(dim);
    }
    return nullptr;
}

bool
IsFiniteVector(const float* data, size_t dim) {
    for (size_t i = 0; i < dim; ++i) {
        if (!std::isfinite(data[i])) {
            return false;
        }
    }
    return true;
}

bool
NormalizeVector(const float* in, float* out, size_t dim) {
    double norm = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        norm += static_cast<double>(in[i]) * in[i];
    }
    if (norm <= 0.0) {
        if (out != in) {
            std::memcpy(out, in, dim * sizeof(float));
        }
        return false;
    }
    auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (size_t i = 0; i < dim; ++i) {
        out[i] = in[i] * inv;
    }
    return true;
}

}  // namespace vecbridge
