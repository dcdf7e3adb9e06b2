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

#include "index/index_meta.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "vecbridge/config.h"

namespace vecbridge {

Status
WriteIndexMeta(const std::string& path, const IndexMeta& meta) {
    Json json = {{meta::INDEX_TYPE, meta.index_type},
                 {meta::DTYPE, datatype::FLOAT32},
                 {meta::METRIC_TYPE, MetricTypeToString(meta.metric_type)},
                 {meta::DIM, meta.dim},
                 {meta::COUNT, meta.count},
                 {meta::VERSION, meta.version}};

    auto meta_path = MetaPath(path);
    std::ofstream out(meta_path, std::ios::trunc);
    if (!out.is_open()) {
        return Status::read_error("cannot open " + meta_path + " for writing");
    }
    out << json.dump();
    out.close();
    if (out.fail()) {
        return Status::read_error("failed to write " + meta_path);
    }
    return Status::success();
}

Status
CommitDump(const std::string& path, const IndexMeta& meta) {
    auto tmp_path = TempPayloadPath(path);
    std::error_code ec;
    auto status = WriteIndexMeta(path, meta);
    if (!status.ok()) {
        std::filesystem::remove(tmp_path, ec);
        return status;
    }
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        auto reason = ec.message();
        std::filesystem::remove(tmp_path, ec);
        return Status::read_error(fmt::format("cannot move {} to {}: {}", tmp_path, path, reason));
    }
    return Status::success();
}

expected<IndexMeta>
ReadIndexMeta(const std::string& path) {
    auto meta_path = MetaPath(path);
    std::ifstream in(meta_path);
    if (!in.is_open()) {
        return expected<IndexMeta>::Err(Status::read_error("cannot open " + meta_path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Json json = Json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return expected<IndexMeta>::Err(Status::invalid_binary(meta_path + " is not a json object"));
    }

    IndexMeta meta;
    try {
        meta.index_type = json.at(meta::INDEX_TYPE).get<std::string>();
        meta.dim = json.at(meta::DIM).get<int64_t>();
        meta.count = json.at(meta::COUNT).get<int64_t>();
        meta.version = json.at(meta::VERSION).get<int64_t>();
        auto metric_name = json.at(meta::METRIC_TYPE).get<std::string>();
        if (!ParseMetricType(metric_name, meta.metric_type)) {
            return expected<IndexMeta>::Err(Status::invalid_binary("unknown metric_type in " + meta_path));
        }
    } catch (const Json::exception& e) {
        return expected<IndexMeta>::Err(Status::invalid_binary(meta_path + ": " + e.what()));
    }
    if (meta.version != kIndexFormatVersion) {
        return expected<IndexMeta>::Err(
            Status::invalid_binary(fmt::format("unsupported index format version {} in {}", meta.version, meta_path)));
    }
    return meta;
}

expected<IndexMeta>
CheckDumpFiles(const std::string& path, const std::string& index_type, MetricType metric, int64_t dim) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return expected<IndexMeta>::Err(Status::missing_file("index file not found: " + path));
    }
    if (!std::filesystem::exists(MetaPath(path), ec)) {
        return expected<IndexMeta>::Err(Status::missing_file("index meta file not found: " + MetaPath(path)));
    }

    auto meta = ReadIndexMeta(path);
    if (!meta.has_value()) {
        return meta;
    }
    if (meta->index_type != index_type) {
        return expected<IndexMeta>::Err(Status::invalid_binary(
            fmt::format("dump holds a {} index, requested {}", meta->index_type, index_type)));
    }
    if (meta->metric_type != metric) {
        return expected<IndexMeta>::Err(Status::invalid_binary(fmt::format(
            "dump uses metric {}, requested {}", MetricTypeToString(meta->metric_type), MetricTypeToString(metric))));
    }
    if (meta->dim != dim) {
        return expected<IndexMeta>::Err(
            Status::dimension_not_equal_in_format("dump has dim {}, requested {}", meta->dim, dim));
    }
    return meta;
}

Status
CheckWritable(const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Status::read_error("cannot open " + path + " for writing");
    }
    return Status::success();
}

}  // namespace vecbridge
