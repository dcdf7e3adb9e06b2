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

#include <memory>
#include <shared_mutex>
#include <unordered_set>

#include "vecbridge/config.h"
#include "vecbridge/index/index_node.h"

namespace vecbridge {

class HnswIndexNode : public IndexNode {
 public:
    static expected<std::unique_ptr<IndexNode>>
    Create(const Json& params);

    explicit HnswIndexNode(const HnswConfig& config);

    expected<std::vector<int64_t>>
    Build(int64_t rows, int64_t dim, const int64_t* ids, const float* data) override;

    expected<SearchResult>
    Search(const float* query, int64_t dim, int64_t k, const BaseConfig& cfg) const override;

    std::unique_ptr<BaseConfig>
    CreateSearchConfig() const override {
        return std::make_unique<HnswSearchConfig>();
    }

    Status
    Serialize(const std::string& path) const override;

    Status
    Deserialize(const std::string& path) override;

    int64_t
    Dim() const override {
        return config_.dim;
    }

    int64_t
    Count() const override;

    std::string
    Type() const override {
        return IndexEnum::INDEX_HNSW;
    }

 private:
    // Caller holds mutex_ in either mode.
    SearchResult
    SearchLocked(const float* query, size_t k) const;

    static constexpr size_t kInitialCapacity = 1024;

    mutable std::shared_mutex mutex_;
    HnswConfig config_;
    std::unique_ptr<hnswlib::SpaceInterface<float>> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;
    std::unordered_set<int64_t> ids_;
};

}  // namespace vecbridge
