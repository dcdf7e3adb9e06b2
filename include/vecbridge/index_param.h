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

namespace IndexEnum {
constexpr const char* INDEX_HNSW = "hnsw";
constexpr const char* INDEX_FLAT = "flat";
// Recognized so callers get a precise error; the bundled engine does not provide it.
constexpr const char* INDEX_DISKANN = "diskann";
}  // namespace IndexEnum

namespace meta {
constexpr const char* DTYPE = "dtype";
constexpr const char* METRIC_TYPE = "metric_type";
constexpr const char* DIM = "dim";
constexpr const char* INDEX_TYPE = "index_type";
constexpr const char* COUNT = "count";
constexpr const char* VERSION = "version";
}  // namespace meta

namespace indexparam {
// construction
constexpr const char* HNSW_MAX_DEGREE = "max_degree";
constexpr const char* HNSW_EF_CONSTRUCTION = "ef_construction";
// search
constexpr const char* HNSW_EF_SEARCH = "ef_search";
constexpr const char* HNSW_USE_CONJUGATE_GRAPH_SEARCH = "use_conjugate_graph_search";
}  // namespace indexparam

namespace metric {
constexpr const char* L2 = "l2";
constexpr const char* IP = "ip";
constexpr const char* COSINE = "cosine";
}  // namespace metric

namespace datatype {
constexpr const char* FLOAT32 = "float32";
}  // namespace datatype

enum class MetricType {
    L2,
    IP,
    COSINE,
};

inline const char*
MetricTypeToString(MetricType metric) {
    switch (metric) {
        case MetricType::L2:
            return metric::L2;
        case MetricType::IP:
            return metric::IP;
        case MetricType::COSINE:
            return metric::COSINE;
    }
    return "unknown";
}

}  // namespace vecbridge
