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

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>

#include "vecbridge/expected.h"
#include "vecbridge/index_param.h"
#include "vecbridge/status.h"

namespace vecbridge {

using Json = nlohmann::json;

// Parses text that must hold a single JSON object.
expected<Json>
ParseJsonObject(const std::string& text);

// Loading is strict: unknown keys, missing required keys and wrong types are all invalid_args.
class BaseConfig {
 public:
    virtual ~BaseConfig() = default;

    virtual Status
    Load(const Json& json) = 0;

    Status
    LoadFromString(const std::string& text);

 protected:
    static Status
    CheckKeys(const Json& json, std::initializer_list<const char*> allowed, const std::string& scope);

    static Status
    LoadPositiveInt(const Json& json, const char* key, const std::string& scope, int64_t& out);

    static Status
    LoadString(const Json& json, const char* key, const std::string& scope, std::string& out);

    static Status
    LoadOptionalBool(const Json& json, const char* key, const std::string& scope, bool& out);
};

// Construction-time parameters shared by every index type. Each type adds an object keyed by its own
// name, e.g. {"dim": 128, ..., "hnsw": {...}}.
class IndexConfig : public BaseConfig {
 public:
    std::string dtype;
    MetricType metric_type = MetricType::L2;
    int64_t dim = 0;

    Status
    Load(const Json& json) override;

 protected:
    virtual const char*
    NestedKey() const = 0;

    virtual bool
    NestedRequired() const = 0;

    virtual Status
    LoadNested(const Json& nested) = 0;
};

class HnswConfig : public IndexConfig {
 public:
    int64_t max_degree = 0;
    int64_t ef_construction = 0;

 protected:
    const char*
    NestedKey() const override {
        return IndexEnum::INDEX_HNSW;
    }

    bool
    NestedRequired() const override {
        return true;
    }

    Status
    LoadNested(const Json& nested) override;
};

class FlatConfig : public IndexConfig {
 protected:
    const char*
    NestedKey() const override {
        return IndexEnum::INDEX_FLAT;
    }

    bool
    NestedRequired() const override {
        return false;
    }

    Status
    LoadNested(const Json& nested) override;
};

class HnswSearchConfig : public BaseConfig {
 public:
    int64_t ef_search = 0;
    // hnswlib has no conjugate graph; the flag is accepted for compatibility and otherwise ignored.
    bool use_conjugate_graph_search = true;

    Status
    Load(const Json& json) override;
};

class FlatSearchConfig : public BaseConfig {
 public:
    Status
    Load(const Json& json) override;
};

bool
ParseMetricType(const std::string& name, MetricType& out);

}  // namespace vecbridge
