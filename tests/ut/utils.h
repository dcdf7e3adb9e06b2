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

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <numeric>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "vecbridge/config.h"

inline std::vector<float>
GenRandomVectors(int64_t rows, int64_t dim, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> distrib(0.0f, 1.0f);
    std::vector<float> data(rows * dim);
    for (auto& v : data) {
        v = distrib(rng);
    }
    return data;
}

inline std::vector<int64_t>
GenIds(int64_t rows, int64_t start = 0) {
    std::vector<int64_t> ids(rows);
    std::iota(ids.begin(), ids.end(), start);
    return ids;
}

inline float
L2Sqr(const float* a, const float* b, int64_t dim) {
    float sum = 0.0f;
    for (int64_t i = 0; i < dim; ++i) {
        float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

inline float
CosineDistance(const float* a, const float* b, int64_t dim) {
    float dot = 0.0f, na = 0.0f, nb = 0.0f;
    for (int64_t i = 0; i < dim; ++i) {
        dot += a[i] * b[i];
        na += a[i] * a[i];
        nb += b[i] * b[i];
    }
    return 1.0f - dot / (std::sqrt(na) * std::sqrt(nb));
}

inline float
IPDistance(const float* a, const float* b, int64_t dim) {
    float dot = 0.0f;
    for (int64_t i = 0; i < dim; ++i) {
        dot += a[i] * b[i];
    }
    return 1.0f - dot;
}

inline float
Distance(const std::string& metric, const float* a, const float* b, int64_t dim) {
    if (metric == "cosine") {
        return CosineDistance(a, b, dim);
    }
    if (metric == "ip") {
        return IPDistance(a, b, dim);
    }
    return L2Sqr(a, b, dim);
}

// Exact top-k ids under the named metric.
inline std::vector<int64_t>
BruteForceKnn(const std::vector<float>& base, const std::vector<int64_t>& ids, int64_t dim, const float* query,
              int64_t k, const std::string& metric = "l2") {
    std::vector<std::pair<float, int64_t>> dist;
    dist.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        dist.emplace_back(Distance(metric, query, base.data() + i * dim, dim), ids[i]);
    }
    auto n = std::min(static_cast<size_t>(k), dist.size());
    std::partial_sort(dist.begin(), dist.begin() + n, dist.end());
    std::vector<int64_t> result;
    for (size_t i = 0; i < n; ++i) {
        result.push_back(dist[i].second);
    }
    return result;
}

inline float
GetKNNRecall(const std::vector<int64_t>& ground_truth, const std::vector<int64_t>& result) {
    if (ground_truth.empty()) {
        return 1.0f;
    }
    std::unordered_set<int64_t> gt(ground_truth.begin(), ground_truth.end());
    size_t hit = 0;
    for (auto id : result) {
        hit += gt.count(id);
    }
    return static_cast<float>(hit) / ground_truth.size();
}

inline vecbridge::Json
GenHnswParams(int64_t dim, const std::string& metric = "l2") {
    return vecbridge::Json{{"dtype", "float32"},
                           {"metric_type", metric},
                           {"dim", dim},
                           {"hnsw", {{"max_degree", 16}, {"ef_construction", 100}}}};
}

inline vecbridge::Json
GenFlatParams(int64_t dim, const std::string& metric = "l2") {
    return vecbridge::Json{{"dtype", "float32"}, {"metric_type", metric}, {"dim", dim}};
}

inline std::string
GenHnswSearchParams(int64_t ef_search = 100) {
    return vecbridge::Json{{"hnsw", {{"ef_search", ef_search}}}}.dump();
}

// A fresh directory under the system temp dir, removed when the object goes out of scope.
class TempDir {
 public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("vecbridge_ut_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir&
    operator=(const TempDir&) = delete;

    std::string
    File(const std::string& name) const {
        return (path_ / name).string();
    }

 private:
    std::filesystem::path path_;
};
