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

#include "vecbridge/c_api.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <vector>

#include "vecbridge/index/index_factory.h"
#include "vecbridge/log.h"
#include "vecbridge/status.h"
#include "vecbridge/vecbridge_config.h"

#ifndef VECBRIDGE_VERSION_STRING
#define VECBRIDGE_VERSION_STRING "0.1.0"
#endif

struct vecbridge_index {
    std::unique_ptr<vecbridge::IndexNode> node;
};

namespace vecbridge {

namespace {

// Handed out when a record cannot be allocated, since NULL would read as success.
vecbridge_error_t kOutOfMemoryError = {static_cast<int>(StatusCode::no_enough_memory),
                                       "out of memory allocating an error record"};

vecbridge_error_t*
MakeError(StatusCode code, const std::string& message) {
    // Allocation of the record itself must not throw across the boundary.
    auto* error = new (std::nothrow) vecbridge_error_t;
    if (error == nullptr) {
        return &kOutOfMemoryError;
    }
    error->type = static_cast<int>(code);
    auto len = std::min(message.size(), static_cast<size_t>(VECBRIDGE_ERROR_MESSAGE_SIZE - 1));
    std::memcpy(error->message, message.data(), len);
    error->message[len] = '\0';
    return error;
}

vecbridge_error_t*
MakeError(const Status& status) {
    LOG_VECBRIDGE_DEBUG_ << status.what();
    return MakeError(status.code(), status.message());
}

vecbridge_error_t*
NullArgument(const char* name) {
    return MakeError(StatusCode::invalid_args, std::string(name) + " must not be null");
}

template <typename T>
T*
CopyOut(const std::vector<T>& values) {
    if (values.empty()) {
        return nullptr;
    }
    auto* out = new T[values.size()];
    std::memcpy(out, values.data(), values.size() * sizeof(T));
    return out;
}

bool
FitsInt64(size_t value) {
    return value <= static_cast<size_t>(std::numeric_limits<int64_t>::max());
}

// Every entry point runs its body through this so no exception crosses the C boundary.
template <typename Func>
vecbridge_error_t*
Guarded(const char* op, Func&& func) {
    try {
        return func();
    } catch (const std::bad_alloc&) {
        LOG_VECBRIDGE_WARNING_ << op << " ran out of memory";
        return MakeError(StatusCode::no_enough_memory, std::string(op) + ": out of memory");
    } catch (const std::exception& e) {
        LOG_VECBRIDGE_ERROR_ << op << " failed: " << e.what();
        return MakeError(StatusCode::internal_error, std::string(op) + ": " + e.what());
    }
}

vecbridge_error_t*
CreateNode(const char* index_type, const char* parameters, std::unique_ptr<IndexNode>& out) {
    auto node = IndexFactory::Instance().CreateFromString(index_type, parameters);
    if (!node.has_value()) {
        return MakeError(node.error());
    }
    out = std::move(node.value());
    return nullptr;
}

}  // namespace

}  // namespace vecbridge

using vecbridge::FitsInt64;
using vecbridge::Guarded;
using vecbridge::MakeError;
using vecbridge::NullArgument;
using vecbridge::StatusCode;

extern "C" {

const char*
vecbridge_version(void) {
    return VECBRIDGE_VERSION_STRING;
}

vecbridge_error_t*
vecbridge_create_index(const char* in_index_type, const char* in_parameters, vecbridge_index_t** out_index) {
    if (out_index == nullptr) {
        return NullArgument("out_index");
    }
    *out_index = nullptr;
    if (in_index_type == nullptr) {
        return NullArgument("in_index_type");
    }
    if (in_parameters == nullptr) {
        return NullArgument("in_parameters");
    }
    vecbridge::VecbridgeConfig::InitLog();

    return Guarded("create_index", [&]() -> vecbridge_error_t* {
        std::unique_ptr<vecbridge::IndexNode> node;
        if (auto* error = vecbridge::CreateNode(in_index_type, in_parameters, node)) {
            return error;
        }
        *out_index = new vecbridge_index_t{std::move(node)};
        return nullptr;
    });
}

vecbridge_error_t*
vecbridge_build_index(vecbridge_index_t* in_index, size_t in_num_vectors, size_t in_dim, const int64_t* in_ids,
                      const float* in_vectors, int64_t** out_failed_ids, size_t* out_num_failed) {
    if (out_failed_ids == nullptr) {
        return NullArgument("out_failed_ids");
    }
    if (out_num_failed == nullptr) {
        return NullArgument("out_num_failed");
    }
    *out_failed_ids = nullptr;
    *out_num_failed = 0;
    if (in_index == nullptr || in_index->node == nullptr) {
        return NullArgument("in_index");
    }
    if (!FitsInt64(in_num_vectors) || !FitsInt64(in_dim)) {
        return MakeError(StatusCode::invalid_args, "vector count or dimension out of range");
    }

    return Guarded("build_index", [&]() -> vecbridge_error_t* {
        auto failed = in_index->node->Build(static_cast<int64_t>(in_num_vectors), static_cast<int64_t>(in_dim),
                                            in_ids, in_vectors);
        if (!failed.has_value()) {
            return MakeError(failed.error());
        }
        *out_failed_ids = vecbridge::CopyOut(failed.value());
        *out_num_failed = failed.value().size();
        return nullptr;
    });
}

vecbridge_error_t*
vecbridge_knn_search_index(const vecbridge_index_t* in_index, size_t in_dim, const float* in_query_vector,
                           size_t in_k, const char* in_search_parameters, int64_t** out_ids,
                           float** out_distances, size_t* out_num_results) {
    if (out_ids == nullptr) {
        return NullArgument("out_ids");
    }
    if (out_distances == nullptr) {
        return NullArgument("out_distances");
    }
    if (out_num_results == nullptr) {
        return NullArgument("out_num_results");
    }
    *out_ids = nullptr;
    *out_distances = nullptr;
    *out_num_results = 0;
    if (in_index == nullptr || in_index->node == nullptr) {
        return NullArgument("in_index");
    }
    if (in_search_parameters == nullptr) {
        return NullArgument("in_search_parameters");
    }
    if (!FitsInt64(in_dim) || !FitsInt64(in_k)) {
        return MakeError(StatusCode::invalid_args, "dimension or k out of range");
    }

    return Guarded("knn_search_index", [&]() -> vecbridge_error_t* {
        auto cfg = in_index->node->CreateSearchConfig();
        auto status = cfg->LoadFromString(in_search_parameters);
        if (!status.ok()) {
            return MakeError(status);
        }
        auto result = in_index->node->Search(in_query_vector, static_cast<int64_t>(in_dim),
                                             static_cast<int64_t>(in_k), *cfg);
        if (!result.has_value()) {
            return MakeError(result.error());
        }
        std::unique_ptr<int64_t[]> ids(vecbridge::CopyOut(result.value().ids));
        std::unique_ptr<float[]> distances(vecbridge::CopyOut(result.value().distances));
        *out_num_results = result.value().ids.size();
        *out_ids = ids.release();
        *out_distances = distances.release();
        return nullptr;
    });
}

vecbridge_error_t*
vecbridge_dump_index(const vecbridge_index_t* in_index, const char* in_file_path) {
    if (in_index == nullptr || in_index->node == nullptr) {
        return NullArgument("in_index");
    }
    if (in_file_path == nullptr) {
        return NullArgument("in_file_path");
    }
    return Guarded("dump_index", [&]() -> vecbridge_error_t* {
        auto status = in_index->node->Serialize(in_file_path);
        return status.ok() ? nullptr : MakeError(status);
    });
}

vecbridge_error_t*
vecbridge_load_index(const char* in_file_path, const char* in_index_type, const char* in_parameters,
                     vecbridge_index_t** out_index) {
    if (out_index == nullptr) {
        return NullArgument("out_index");
    }
    *out_index = nullptr;
    if (in_file_path == nullptr) {
        return NullArgument("in_file_path");
    }
    if (in_index_type == nullptr) {
        return NullArgument("in_index_type");
    }
    if (in_parameters == nullptr) {
        return NullArgument("in_parameters");
    }
    vecbridge::VecbridgeConfig::InitLog();

    return Guarded("load_index", [&]() -> vecbridge_error_t* {
        std::unique_ptr<vecbridge::IndexNode> node;
        if (auto* error = vecbridge::CreateNode(in_index_type, in_parameters, node)) {
            return error;
        }
        auto status = node->Deserialize(in_file_path);
        if (!status.ok()) {
            return MakeError(status);
        }
        *out_index = new vecbridge_index_t{std::move(node)};
        return nullptr;
    });
}

vecbridge_error_t*
vecbridge_index_dim(const vecbridge_index_t* in_index, size_t* out_dim) {
    if (out_dim == nullptr) {
        return NullArgument("out_dim");
    }
    if (in_index == nullptr || in_index->node == nullptr) {
        return NullArgument("in_index");
    }
    *out_dim = static_cast<size_t>(in_index->node->Dim());
    return nullptr;
}

vecbridge_error_t*
vecbridge_index_count(const vecbridge_index_t* in_index, size_t* out_count) {
    if (out_count == nullptr) {
        return NullArgument("out_count");
    }
    if (in_index == nullptr || in_index->node == nullptr) {
        return NullArgument("in_index");
    }
    *out_count = static_cast<size_t>(in_index->node->Count());
    return nullptr;
}

void
vecbridge_free_index(vecbridge_index_t* index) {
    delete index;
}

void
vecbridge_free_error(vecbridge_error_t* error) {
    if (error == &vecbridge::kOutOfMemoryError) {
        return;
    }
    delete error;
}

void
vecbridge_free_i64_vector(int64_t* vector) {
    delete[] vector;
}

void
vecbridge_free_f32_vector(float* vector) {
    delete[] vector;
}

}  // extern "C"
