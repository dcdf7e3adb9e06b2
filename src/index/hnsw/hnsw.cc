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

#include "index/hnsw/hnsw.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <new>
#include <stdexcept>

#include "index/batch.h"
#include "index/index_meta.h"
#include "index/metric.h"
#include "vecbridge/log.h"

namespace vecbridge {

expected<std::unique_ptr<IndexNode>>
HnswIndexNode::Create(const Json& params) {
    HnswConfig config;
    auto status = config.Load(params);
    if (!status.ok()) {
        return expected<std::unique_ptr<IndexNode>>::Err(status);
    }
    try {
        return std::unique_ptr<IndexNode>(std::make_unique<HnswIndexNode>(config));
    } catch (const std::bad_alloc&) {
        return expected<std::unique_ptr<IndexNode>>::Err(Status::no_enough_memory("failed to allocate hnsw index"));
    } catch (const std::exception& e) {
        return expected<std::unique_ptr<IndexNode>>::Err(Status::internal_error(e.what()));
    }
}

HnswIndexNode::HnswIndexNode(const HnswConfig& config)
    : config_(config), space_(CreateSpace(config.metric_type, config.dim)) {
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(space_.get(), kInitialCapacity, config_.max_degree,
                                                                config_.ef_construction);
    LOG_VECBRIDGE_INFO_ << "created hnsw index, dim=" << config_.dim
                        << ", metric=" << MetricTypeToString(config_.metric_type)
                        << ", max_degree=" << config_.max_degree << ", ef_construction=" << config_.ef_construction;
}

expected<std::vector<int64_t>>
HnswIndexNode::Build(int64_t rows, int64_t dim, const int64_t* ids, const float* data) {
    auto status = CheckBuildArgs(rows, dim, ids, data, config_.dim);
    if (!status.ok()) {
        return expected<std::vector<int64_t>>::Err(status);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto batch = ScreenBatch(rows, dim, ids, data, config_.metric_type, ids_);

    size_t added = 0;
    try {
        auto required = index_->getCurrentElementCount() + batch.accepted_rows.size();
        if (required > index_->getMaxElements()) {
            index_->resizeIndex(std::max(required, index_->getMaxElements() * 2));
        }

        std::vector<float> normalized(NeedsNormalize(config_.metric_type) ? dim : 0);
        for (auto row : batch.accepted_rows) {
            const float* vec = data + row * dim;
            if (NeedsNormalize(config_.metric_type)) {
                NormalizeVector(vec, normalized.data(), dim);
                vec = normalized.data();
            }
            index_->addPoint(vec, static_cast<hnswlib::labeltype>(ids[row]));
            ids_.insert(ids[row]);
            ++added;
        }
    } catch (const std::bad_alloc&) {
        LOG_VECBRIDGE_WARNING_ << "hnsw build ran out of memory after " << added << " vectors";
        return expected<std::vector<int64_t>>::Err(
            Status::no_enough_memory(fmt::format("out of memory after adding {} of {} vectors", added, rows)));
    } catch (const std::exception& e) {
        LOG_VECBRIDGE_WARNING_ << "hnsw build failed after " << added << " vectors: " << e.what();
        return expected<std::vector<int64_t>>::Err(Status::internal_error(e.what()));
    }

    LOG_VECBRIDGE_INFO_ << "hnsw build added " << added << " vectors, rejected " << batch.failed_ids.size()
                        << ", total " << index_->getCurrentElementCount();
    return std::move(batch.failed_ids);
}

expected<SearchResult>
HnswIndexNode::Search(const float* query, int64_t dim, int64_t k, const BaseConfig& cfg) const {
    auto status = CheckSearchArgs(query, dim, k, config_.dim);
    if (!status.ok()) {
        return expected<SearchResult>::Err(status);
    }
    const auto& search_cfg = static_cast<const HnswSearchConfig&>(cfg);

    std::vector<float> normalized;
    if (NeedsNormalize(config_.metric_type)) {
        normalized.resize(dim);
        NormalizeVector(query, normalized.data(), dim);
        query = normalized.data();
    }

    auto ef = static_cast<size_t>(search_cfg.ef_search);
    try {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (index_->ef_ == ef) {
                return SearchLocked(query, k);
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        index_->setEf(ef);
        return SearchLocked(query, k);
    } catch (const std::bad_alloc&) {
        return expected<SearchResult>::Err(Status::no_enough_memory("out of memory during hnsw search"));
    } catch (const std::exception& e) {
        LOG_VECBRIDGE_WARNING_ << "hnsw search failed: " << e.what();
        return expected<SearchResult>::Err(Status::internal_error(e.what()));
    }
}

SearchResult
HnswIndexNode::SearchLocked(const float* query, size_t k) const {
    SearchResult result;
    if (index_->getCurrentElementCount() == 0) {
        return result;
    }
    auto queue = index_->searchKnn(query, k);
    // The queue pops the farthest match first.
    auto n = queue.size();
    result.ids.resize(n);
    result.distances.resize(n);
    for (auto i = n; i > 0; --i) {
        result.ids[i - 1] = static_cast<int64_t>(queue.top().second);
        result.distances[i - 1] = queue.top().first;
        queue.pop();
    }
    return result;
}

Status
HnswIndexNode::Serialize(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto count = static_cast<int64_t>(index_->getCurrentElementCount());
    if (count == 0) {
        return Status::index_empty("cannot serialize an empty hnsw index");
    }
    auto tmp_path = TempPayloadPath(path);
    auto status = CheckWritable(tmp_path);
    if (!status.ok()) {
        return status;
    }
    try {
        index_->saveIndex(tmp_path);
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return Status::read_error(fmt::format("failed to write {}: {}", tmp_path, e.what()));
    }

    IndexMeta meta;
    meta.index_type = Type();
    meta.metric_type = config_.metric_type;
    meta.dim = config_.dim;
    meta.count = count;
    status = CommitDump(path, meta);
    if (status.ok()) {
        LOG_VECBRIDGE_INFO_ << "dumped hnsw index with " << count << " vectors to " << path;
    }
    return status;
}

Status
HnswIndexNode::Deserialize(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (index_->getCurrentElementCount() != 0) {
        return Status(StatusCode::index_not_empty, "cannot deserialize into a non-empty hnsw index");
    }

    auto meta = CheckDumpFiles(path, Type(), config_.metric_type, config_.dim);
    if (!meta.has_value()) {
        return meta.error();
    }
    {
        std::ifstream probe(path, std::ios::binary);
        if (!probe.is_open()) {
            return Status::read_error("cannot open " + path);
        }
    }

    std::unique_ptr<hnswlib::HierarchicalNSW<float>> loaded;
    try {
        loaded = std::make_unique<hnswlib::HierarchicalNSW<float>>(space_.get(), path);
    } catch (const std::bad_alloc&) {
        return Status::no_enough_memory("out of memory loading " + path);
    } catch (const std::exception& e) {
        return Status::invalid_binary(fmt::format("failed to load {}: {}", path, e.what()));
    }
    if (static_cast<int64_t>(loaded->getCurrentElementCount()) != meta->count) {
        return Status::invalid_binary(fmt::format("{} holds {} vectors, its meta says {}", path,
                                                  loaded->getCurrentElementCount(), meta->count));
    }

    std::unordered_set<int64_t> ids;
    ids.reserve(loaded->label_lookup_.size());
    for (const auto& entry : loaded->label_lookup_) {
        ids.insert(static_cast<int64_t>(entry.first));
    }
    index_ = std::move(loaded);
    ids_ = std::move(ids);
    LOG_VECBRIDGE_INFO_ << "loaded hnsw index with " << ids_.size() << " vectors from " << path;
    return Status::success();
}

int64_t
HnswIndexNode::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<int64_t>(index_->getCurrentElementCount());
}

}  // namespace vecbridge
