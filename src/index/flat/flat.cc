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

#include "index/flat/flat.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <new>
#include <stdexcept>
#include <utility>

#include "index/batch.h"
#include "index/index_meta.h"
#include "index/metric.h"
#include "vecbridge/log.h"

namespace vecbridge {

namespace {

constexpr uint32_t kFlatMagic = 0x4c464256;  // "VBFL"

template <typename T>
void
WritePod(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool
ReadPod(std::ifstream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    return static_cast<bool>(in);
}

}  // namespace

expected<std::unique_ptr<IndexNode>>
FlatIndexNode::Create(const Json& params) {
    FlatConfig config;
    auto status = config.Load(params);
    if (!status.ok()) {
        return expected<std::unique_ptr<IndexNode>>::Err(status);
    }
    return std::unique_ptr<IndexNode>(std::make_unique<FlatIndexNode>(config));
}

FlatIndexNode::FlatIndexNode(const FlatConfig& config)
    : config_(config), space_(CreateSpace(config.metric_type, config.dim)) {
    LOG_VECBRIDGE_INFO_ << "created flat index, dim=" << config_.dim
                        << ", metric=" << MetricTypeToString(config_.metric_type);
}

expected<std::vector<int64_t>>
FlatIndexNode::Build(int64_t rows, int64_t dim, const int64_t* ids, const float* data) {
    auto status = CheckBuildArgs(rows, dim, ids, data, config_.dim);
    if (!status.ok()) {
        return expected<std::vector<int64_t>>::Err(status);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto batch = ScreenBatch(rows, dim, ids, data, config_.metric_type, ids_);

    try {
        auto offset = vectors_.size();
        vectors_.resize(offset + batch.accepted_rows.size() * dim);
        labels_.reserve(labels_.size() + batch.accepted_rows.size());
        ids_.reserve(ids_.size() + batch.accepted_rows.size());

        for (auto row : batch.accepted_rows) {
            const float* vec = data + row * dim;
            float* dst = vectors_.data() + offset;
            if (NeedsNormalize(config_.metric_type)) {
                NormalizeVector(vec, dst, dim);
            } else {
                std::memcpy(dst, vec, dim * sizeof(float));
            }
            offset += dim;
            labels_.push_back(ids[row]);
            ids_.insert(ids[row]);
        }
    } catch (const std::bad_alloc&) {
        // Roll back to the rows that were fully recorded.
        vectors_.resize(labels_.size() * dim);
        return expected<std::vector<int64_t>>::Err(
            Status::no_enough_memory(fmt::format("out of memory adding {} vectors", rows)));
    }

    LOG_VECBRIDGE_INFO_ << "flat build added " << batch.accepted_rows.size() << " vectors, rejected "
                        << batch.failed_ids.size() << ", total " << labels_.size();
    return std::move(batch.failed_ids);
}

expected<SearchResult>
FlatIndexNode::Search(const float* query, int64_t dim, int64_t k, const BaseConfig&) const {
    auto status = CheckSearchArgs(query, dim, k, config_.dim);
    if (!status.ok()) {
        return expected<SearchResult>::Err(status);
    }

    std::vector<float> normalized;
    if (NeedsNormalize(config_.metric_type)) {
        normalized.resize(dim);
        NormalizeVector(query, normalized.data(), dim);
        query = normalized.data();
    }

    auto dist_func = space_->get_dist_func();
    auto dist_param = space_->get_dist_func_param();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    try {
        std::vector<std::pair<float, int64_t>> dist_idx;
        dist_idx.reserve(labels_.size());
        for (size_t i = 0; i < labels_.size(); ++i) {
            const float* vec = vectors_.data() + i * dim;
            dist_idx.emplace_back(dist_func(query, vec, dist_param), labels_[i]);
        }

        auto valid_k = std::min(static_cast<size_t>(k), dist_idx.size());
        std::partial_sort(dist_idx.begin(), dist_idx.begin() + valid_k, dist_idx.end());

        SearchResult result;
        result.ids.reserve(valid_k);
        result.distances.reserve(valid_k);
        for (size_t i = 0; i < valid_k; ++i) {
            result.distances.push_back(dist_idx[i].first);
            result.ids.push_back(dist_idx[i].second);
        }
        return result;
    } catch (const std::bad_alloc&) {
        return expected<SearchResult>::Err(Status::no_enough_memory("out of memory during flat search"));
    }
}

Status
FlatIndexNode::Serialize(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (labels_.empty()) {
        return Status::index_empty("cannot serialize an empty flat index");
    }

    auto tmp_path = TempPayloadPath(path);
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Status::read_error("cannot open " + tmp_path + " for writing");
    }
    uint64_t count = labels_.size();
    uint64_t dim = config_.dim;
    WritePod(out, kFlatMagic);
    WritePod(out, count);
    WritePod(out, dim);
    out.write(reinterpret_cast<const char*>(labels_.data()), labels_.size() * sizeof(int64_t));
    out.write(reinterpret_cast<const char*>(vectors_.data()), vectors_.size() * sizeof(float));
    out.close();
    if (out.fail()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return Status::read_error("failed to write " + tmp_path);
    }

    IndexMeta meta;
    meta.index_type = Type();
    meta.metric_type = config_.metric_type;
    meta.dim = config_.dim;
    meta.count = static_cast<int64_t>(count);
    auto status = CommitDump(path, meta);
    if (status.ok()) {
        LOG_VECBRIDGE_INFO_ << "dumped flat index with " << count << " vectors to " << path;
    }
    return status;
}

Status
FlatIndexNode::Deserialize(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!labels_.empty()) {
        return Status(StatusCode::index_not_empty, "cannot deserialize into a non-empty flat index");
    }

    auto meta = CheckDumpFiles(path, Type(), config_.metric_type, config_.dim);
    if (!meta.has_value()) {
        return meta.error();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Status::read_error("cannot open " + path);
    }
    uint32_t magic = 0;
    uint64_t count = 0;
    uint64_t dim = 0;
    if (!ReadPod(in, magic) || !ReadPod(in, count) || !ReadPod(in, dim)) {
        return Status::invalid_binary(path + " is truncated");
    }
    if (magic != kFlatMagic) {
        return Status::invalid_binary(path + " is not a flat index dump");
    }
    if (dim != static_cast<uint64_t>(config_.dim) || count != static_cast<uint64_t>(meta->count)) {
        return Status::invalid_binary(
            fmt::format("{} header (count={}, dim={}) disagrees with its meta", path, count, dim));
    }

    std::vector<int64_t> labels;
    std::vector<float> vectors;
    try {
        labels.resize(count);
        vectors.resize(count * dim);
    } catch (const std::bad_alloc&) {
        return Status::no_enough_memory("out of memory loading " + path);
    } catch (const std::length_error&) {
        return Status::invalid_binary(fmt::format("{} declares an impossible size: count={}, dim={}", path, count, dim));
    }
    in.read(reinterpret_cast<char*>(labels.data()), labels.size() * sizeof(int64_t));
    in.read(reinterpret_cast<char*>(vectors.data()), vectors.size() * sizeof(float));
    if (!in) {
        return Status::invalid_binary(path + " is truncated");
    }

    std::unordered_set<int64_t> ids(labels.begin(), labels.end());
    if (ids.size() != labels.size()) {
        return Status::invalid_binary(path + " holds duplicate ids");
    }
    labels_ = std::move(labels);
    vectors_ = std::move(vectors);
    ids_ = std::move(ids);
    LOG_VECBRIDGE_INFO_ << "loaded flat index with " << labels_.size() << " vectors from " << path;
    return Status::success();
}

int64_t
FlatIndexNode::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<int64_t>(labels_.size());
}

}  // namespace vecbridge
