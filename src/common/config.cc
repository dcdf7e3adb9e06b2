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

#include "vecbridge/config.h"

#include <algorithm>

namespace vecbridge {

namespace {

std::string
Scoped(const std::string& scope, const char* key) {
    return scope.empty() ? std::string(key) : scope + "." + key;
}

}  // namespace

expected<Json>
ParseJsonObject(const std::string& text) {
    Json json = Json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        return expected<Json>::Err(Status::invalid_args_in_format("parameters are not valid json: {}", text));
    }
    if (!json.is_object()) {
        return expected<Json>::Err(
            Status::invalid_args_in_format("parameters must be a json object, got {}", json.type_name()));
    }
    return json;
}

bool
ParseMetricType(const std::string& name, MetricType& out) {
    if (name == metric::L2) {
        out = MetricType::L2;
    } else if (name == metric::IP) {
        out = MetricType::IP;
    } else if (name == metric::COSINE) {
        out = MetricType::COSINE;
    } else {
        return false;
    }
    return true;
}

Status
BaseConfig::LoadFromString(const std::string& text) {
    auto json = ParseJsonObject(text);
    if (!json.has_value()) {
        return json.error();
    }
    return Load(json.value());
}

Status
BaseConfig::CheckKeys(const Json& json, std::initializer_list<const char*> allowed, const std::string& scope) {
    for (const auto& item : json.items()) {
        auto found = std::any_of(allowed.begin(), allowed.end(),
                                 [&](const char* key) { return item.key() == key; });
        if (!found) {
            return Status::invalid_args_in_format("unrecognized parameter: {}", Scoped(scope, item.key().c_str()));
        }
    }
    return Status::success();
}

Status
BaseConfig::LoadPositiveInt(const Json& json, const char* key, const std::string& scope, int64_t& out) {
    auto it = json.find(key);
    if (it == json.end()) {
        return Status::invalid_args_in_format("missing required parameter: {}", Scoped(scope, key));
    }
    if (!it->is_number_integer()) {
        return Status::invalid_args_in_format("parameter {} must be an integer, got {}", Scoped(scope, key),
                                              it->type_name());
    }
    auto value = it->get<int64_t>();
    if (value <= 0) {
        return Status::invalid_args_in_format("parameter {} must be positive, got {}", Scoped(scope, key), value);
    }
    out = value;
    return Status::success();
}

Status
BaseConfig::LoadString(const Json& json, const char* key, const std::string& scope, std::string& out) {
    auto it = json.find(key);
    if (it == json.end()) {
        return Status::invalid_args_in_format("missing required parameter: {}", Scoped(scope, key));
    }
    if (!it->is_string()) {
        return Status::invalid_args_in_format("parameter {} must be a string, got {}", Scoped(scope, key),
                                              it->type_name());
    }
    out = it->get<std::string>();
    return Status::success();
}

Status
BaseConfig::LoadOptionalBool(const Json& json, const char* key, const std::string& scope, bool& out) {
    auto it = json.find(key);
    if (it == json.end()) {
        return Status::success();
    }
    if (!it->is_boolean()) {
        return Status::invalid_args_in_format("parameter {} must be a boolean, got {}", Scoped(scope, key),
                                              it->type_name());
    }
    out = it->get<bool>();
    return Status::success();
}

Status
IndexConfig::Load(const Json& json) {
    const char* nested_key = NestedKey();
    auto status = CheckKeys(json, {meta::DTYPE, meta::METRIC_TYPE, meta::DIM, nested_key}, "");
    if (!status.ok()) {
        return status;
    }

    if (!(status = LoadString(json, meta::DTYPE, "", dtype)).ok()) {
        return status;
    }
    if (dtype != datatype::FLOAT32) {
        return Status::invalid_args_in_format("unsupported dtype: {}, expected one of [{}]", dtype,
                                              datatype::FLOAT32);
    }

    std::string metric_name;
    if (!(status = LoadString(json, meta::METRIC_TYPE, "", metric_name)).ok()) {
        return status;
    }
    if (!ParseMetricType(metric_name, metric_type)) {
        return Status::invalid_args_in_format("unsupported metric_type: {}, expected one of [{}, {}, {}]",
                                              metric_name, metric::L2, metric::IP, metric::COSINE);
    }

    if (!(status = LoadPositiveInt(json, meta::DIM, "", dim)).ok()) {
        return status;
    }

    auto nested = json.find(nested_key);
    if (nested == json.end()) {
        if (NestedRequired()) {
            return Status::invalid_args_in_format("missing required parameter: {}", nested_key);
        }
        return LoadNested(Json::object());
    }
    if (!nested->is_object()) {
        return Status::invalid_args_in_format("parameter {} must be an object, got {}", nested_key,
                                              nested->type_name());
    }
    return LoadNested(*nested);
}

Status
HnswConfig::LoadNested(const Json& nested) {
    const std::string scope = IndexEnum::INDEX_HNSW;
    auto status = CheckKeys(nested, {indexparam::HNSW_MAX_DEGREE, indexparam::HNSW_EF_CONSTRUCTION}, scope);
    if (!status.ok()) {
        return status;
    }
    if (!(status = LoadPositiveInt(nested, indexparam::HNSW_MAX_DEGREE, scope, max_degree)).ok()) {
        return status;
    }
    return LoadPositiveInt(nested, indexparam::HNSW_EF_CONSTRUCTION, scope, ef_construction);
}

Status
FlatConfig::LoadNested(const Json& nested) {
    return CheckKeys(nested, {}, IndexEnum::INDEX_FLAT);
}

Status
HnswSearchConfig::Load(const Json& json) {
    const std::string scope = IndexEnum::INDEX_HNSW;
    auto status = CheckKeys(json, {IndexEnum::INDEX_HNSW}, "");
    if (!status.ok()) {
        return status;
    }
    auto nested = json.find(IndexEnum::INDEX_HNSW);
    if (nested == json.end()) {
        return Status::invalid_args_in_format("missing required parameter: {}", scope);
    }
    if (!nested->is_object()) {
        return Status::invalid_args_in_format("parameter {} must be an object, got {}", scope, nested->type_name());
    }
    status = CheckKeys(*nested, {indexparam::HNSW_EF_SEARCH, indexparam::HNSW_USE_CONJUGATE_GRAPH_SEARCH}, scope);
    if (!status.ok()) {
        return status;
    }
    if (!(status = LoadPositiveInt(*nested, indexparam::HNSW_EF_SEARCH, scope, ef_search)).ok()) {
        return status;
    }
    return LoadOptionalBool(*nested, indexparam::HNSW_USE_CONJUGATE_GRAPH_SEARCH, scope,
                            use_conjugate_graph_search);
}

Status
FlatSearchConfig::Load(const Json& json) {
    auto status = CheckKeys(json, {IndexEnum::INDEX_FLAT}, "");
    if (!status.ok()) {
        return status;
    }
    auto nested = json.find(IndexEnum::INDEX_FLAT);
    if (nested == json.end()) {
        return Status::success();
    }
    if (!nested->is_object()) {
        return Status::invalid_args_in_format("parameter {} must be an object, got {}", IndexEnum::INDEX_FLAT,
                                              nested->type_name());
    }
    return CheckKeys(*nested, {}, IndexEnum::INDEX_FLAT);
}

}  // namespace vecbridge
