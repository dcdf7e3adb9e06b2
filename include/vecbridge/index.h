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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "vecbridge/c_api.h"
#include "vecbridge/error.h"

namespace vecbridge {

// Output of a k-NN search, nearest first.
struct KnnSearchOutput {
    std::vector<int64_t> ids;
    std::vector<float> distances;
};

// Owns one native index handle and releases it exactly once, on destruction or Reset().
//
// Index is move-only; a moved-from or reset Index is empty and every operation on it returns
// ErrorKind::kInvalidArgument. Operations are const and safe to call from several threads on the same
// Index, the native layer serializes what must be serialized.
//
// Construction parameters for hnsw:
//   {
//       "dtype": "float32",
//       "metric_type": "l2",           // l2, ip or cosine
//       "dim": 128,
//       "hnsw": {"max_degree": 16, "ef_construction": 200}
//   }
// flat takes the same top-level fields and an optional empty "flat" object.
class Index {
 public:
    Index() = default;

    // The source is left empty.
    Index(Index&& other) noexcept;
    Index&
    operator=(Index&& other) noexcept;

    Index(const Index&) = delete;
    Index&
    operator=(const Index&) = delete;

    ~Index() = default;

    static Result<Index>
    Create(const std::string& index_type, const std::string& params);

    // `index_type` and `params` must be the ones the dumped index was created with.
    static Result<Index>
    Load(const std::string& path, const std::string& index_type, const std::string& params);

    // Adds `count` vectors of `dim` floats, row-major. Returns the ids the index rejected (already present,
    // repeated in the batch, non-finite components, zero vector under cosine); the rest are searchable.
    Result<std::vector<int64_t>>
    Build(size_t count, size_t dim, const std::vector<int64_t>& ids, const std::vector<float>& vectors) const;

    // hnsw search parameters: {"hnsw": {"ef_search": 100, "use_conjugate_graph_search": true}}
    // flat search parameters: {}
    Result<KnnSearchOutput>
    KnnSearch(const std::vector<float>& query, size_t k, const std::string& search_params) const;

    // Writes `path` and `path`.meta.
    Result<void>
    Dump(const std::string& path) const;

    Result<size_t>
    Count() const;

    // 0 for an empty Index.
    size_t
    Dim() const {
        return dim_;
    }

    const std::string&
    Type() const {
        return type_;
    }

    bool
    Valid() const {
        return handle_ != nullptr;
    }

    explicit operator bool() const {
        return Valid();
    }

    // Releases the native handle now. Later operations fail with kInvalidArgument.
    void
    Reset();

 private:
    struct HandleDeleter {
        void
        operator()(vecbridge_index_t* handle) const {
            vecbridge_free_index(handle);
        }
    };
    using Handle = std::unique_ptr<vecbridge_index_t, HandleDeleter>;

    Index(Handle handle, size_t dim, std::string type);

    static Result<Index>
    Adopt(vecbridge_index_t* raw, const std::string& index_type);

    Handle handle_;
    size_t dim_ = 0;
    std::string type_;
};

}  // namespace vecbridge
