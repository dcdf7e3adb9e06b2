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

#include "vecbridge/index.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "vecbridge/log.h"

namespace vecbridge {

namespace {

struct ErrorDeleter {
    void
    operator()(vecbridge_error_t* error) const {
        vecbridge_free_error(error);
    }
};
using ErrorPtr = std::unique_ptr<vecbridge_error_t, ErrorDeleter>;

struct I64VectorDeleter {
    void
    operator()(int64_t* vector) const {
        vecbridge_free_i64_vector(vector);
    }
};

struct F32VectorDeleter {
    void
    operator()(float* vector) const {
        vecbridge_free_f32_vector(vector);
    }
};

// Takes ownership of a non-null native error record and frees it once converted.
Error
TakeNativeError(Operation op, vecbridge_error_t* raw) {
    ErrorPtr record(raw);
    auto error = Error::FromNative(op, *record);
    LOG_VECBRIDGE_WARNING_ << error.what();
    return error;
}

Status
CheckNoNul(const std::string& value, const char* name) {
    if (value.find('\0') != std::string::npos) {
        return Status::invalid_args_in_format("{} contains a NUL byte", name);
    }
    return Status::success();
}

Error
EmptyHandle() {
    return Error::invalid_argument("index handle is empty (moved from or reset)");
}

}  // namespace

Index::Index(Handle handle, size_t dim, std::string type)
    : handle_(std::move(handle)), dim_(dim), type_(std::move(type)) {
}

Index::Index(Index&& other) noexcept
    : handle_(std::move(other.handle_)), dim_(std::exchange(other.dim_, 0)), type_(std::move(other.type_)) {
    other.type_.clear();
}

Index&
Index::operator=(Index&& other) noexcept {
    if (this != &other) {
        handle_ = std::move(other.handle_);
        dim_ = std::exchange(other.dim_, 0);
        type_ = std::move(other.type_);
        other.type_.clear();
    }
    return *this;
}

Result<Index>
Index::Adopt(vecbridge_index_t* raw, const std::string& index_type) {
    Handle handle(raw);
    if (handle == nullptr) {
        return Result<Index>::Err(Error(ErrorKind::kNativeFailure, VECBRIDGE_INTERNAL_ERROR,
                                        "native layer reported success without a handle"));
    }
    size_t dim = 0;
    if (auto* err = vecbridge_index_dim(handle.get(), &dim)) {
        return Result<Index>::Err(TakeNativeError(Operation::kConstruct, err));
    }
    return Index(std::move(handle), dim, index_type);
}

Result<Index>
Index::Create(const std::string& index_type, const std::string& params) {
    for (auto status : {CheckNoNul(index_type, "index type"), CheckNoNul(params, "parameters")}) {
        if (!status.ok()) {
            return Result<Index>::Err(Error::invalid_argument(status.message()));
        }
    }

    vecbridge_index_t* raw = nullptr;
    if (auto* err = vecbridge_create_index(index_type.c_str(), params.c_str(), &raw)) {
        return Result<Index>::Err(TakeNativeError(Operation::kConstruct, err));
    }
    return Adopt(raw, index_type);
}

Result<Index>
Index::Load(const std::string& path, const std::string& index_type, const std::string& params) {
    for (auto status :
         {CheckNoNul(path, "path"), CheckNoNul(index_type, "index type"), CheckNoNul(params, "parameters")}) {
        if (!status.ok()) {
            return Result<Index>::Err(Error::invalid_argument(status.message()));
        }
    }

    vecbridge_index_t* raw = nullptr;
    if (auto* err = vecbridge_load_index(path.c_str(), index_type.c_str(), params.c_str(), &raw)) {
        return Result<Index>::Err(TakeNativeError(Operation::kConstruct, err));
    }
    return Adopt(raw, index_type);
}

Result<std::vector<int64_t>>
Index::Build(size_t count, size_t dim, const std::vector<int64_t>& ids, const std::vector<float>& vectors) const {
    using R = Result<std::vector<int64_t>>;
    if (!Valid()) {
        return R::Err(EmptyHandle());
    }
    if (ids.size() != count) {
        return R::Err(Error::invalid_argument(fmt::format("expected {} ids, got {}", count, ids.size())));
    }
    if (dim != 0 && count > std::numeric_limits<size_t>::max() / dim) {
        return R::Err(Error::invalid_argument(fmt::format("{} vectors of dim {} overflow", count, dim)));
    }
    if (vectors.size() != count * dim) {
        return R::Err(Error::invalid_argument(
            fmt::format("expected {} floats for {} vectors of dim {}, got {}", count * dim, count, dim, vectors.size())));
    }
    if (dim != dim_) {
        return R::Err(Error::invalid_argument(fmt::format("vector dim {} does not match index dim {}", dim, dim_)));
    }

    int64_t* raw_failed = nullptr;
    size_t num_failed = 0;
    if (auto* err = vecbridge_build_index(handle_.get(), count, dim, ids.data(), vectors.data(), &raw_failed,
                                          &num_failed)) {
        return R::Err(TakeNativeError(Operation::kBuild, err));
    }
    std::unique_ptr<int64_t, I64VectorDeleter> failed(raw_failed);
    if (num_failed == 0) {
        return std::vector<int64_t>();
    }
    LOG_VECBRIDGE_DEBUG_ << num_failed << " of " << count << " ids rejected by " << type_;
    return std::vector<int64_t>(failed.get(), failed.get() + num_failed);
}

Result<KnnSearchOutput>
Index::KnnSearch(const std::vector<float>& query, size_t k, const std::string& search_params) const {
    using R = Result<KnnSearchOutput>;
    if (!Valid()) {
        return R::Err(EmptyHandle());
    }
    if (k == 0) {
        return R::Err(Error::invalid_argument("k must be greater than 0"));
    }
    if (query.size() != dim_) {
        return R::Err(
            Error::invalid_argument(fmt::format("query dim {} does not match index dim {}", query.size(), dim_)));
    }
    if (!std::all_of(query.begin(), query.end(), [](float v) { return std::isfinite(v); })) {
        return R::Err(Error::invalid_argument("query vector has a non-finite component"));
    }
    auto status = CheckNoNul(search_params, "search parameters");
    if (!status.ok()) {
        return R::Err(Error::invalid_argument(status.message()));
    }

    int64_t* raw_ids = nullptr;
    float* raw_distances = nullptr;
    size_t num_results = 0;
    if (auto* err = vecbridge_knn_search_index(handle_.get(), query.size(), query.data(), k, search_params.c_str(),
                                               &raw_ids, &raw_distances, &num_results)) {
        return R::Err(TakeNativeError(Operation::kSearch, err));
    }
    std::unique_ptr<int64_t, I64VectorDeleter> ids(raw_ids);
    std::unique_ptr<float, F32VectorDeleter> distances(raw_distances);

    KnnSearchOutput output;
    if (num_results > 0) {
        output.ids.assign(ids.get(), ids.get() + num_results);
        output.distances.assign(distances.get(), distances.get() + num_results);
    }
    return output;
}

Result<void>
Index::Dump(const std::string& path) const {
    if (!Valid()) {
        return Result<void>::Err(EmptyHandle());
    }
    auto status = CheckNoNul(path, "path");
    if (!status.ok()) {
        return Result<void>::Err(Error::invalid_argument(status.message()));
    }
    if (auto* err = vecbridge_dump_index(handle_.get(), path.c_str())) {
        return Result<void>::Err(TakeNativeError(Operation::kDump, err));
    }
    return Result<void>();
}

Result<size_t>
Index::Count() const {
    if (!Valid()) {
        return Result<size_t>::Err(EmptyHandle());
    }
    size_t count = 0;
    if (auto* err = vecbridge_index_count(handle_.get(), &count)) {
        return Result<size_t>::Err(TakeNativeError(Operation::kQuery, err));
    }
    return count;
}

void
Index::Reset() {
    handle_.reset();
    dim_ = 0;
    type_.clear();
}

}  // namespace vecbridge
