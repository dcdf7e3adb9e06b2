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

#include "vecbridge/index/index_factory.h"

#include <algorithm>

#include "index/flat/flat.h"
#include "index/hnsw/hnsw.h"
#include "vecbridge/index_param.h"
#include "vecbridge/log.h"

namespace vecbridge {

IndexFactory&
IndexFactory::Instance() {
    static IndexFactory factory;
    return factory;
}

IndexFactory::IndexFactory() {
    Register(IndexEnum::INDEX_HNSW, &HnswIndexNode::Create);
    Register(IndexEnum::INDEX_FLAT, &FlatIndexNode::Create);
}

void
IndexFactory::Register(const std::string& name, CreateFunc func) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (creators_.count(name) != 0) {
        LOG_VECBRIDGE_WARNING_ << "index type " << name << " registered twice, keeping the latest";
    }
    creators_[name] = std::move(func);
}

bool
IndexFactory::HasIndex(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return creators_.count(name) != 0;
}

std::vector<std::string>
IndexFactory::ListIndexes() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, func] : creators_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

expected<std::unique_ptr<IndexNode>>
IndexFactory::Create(const std::string& name, const Json& params) const {
    CreateFunc func;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = creators_.find(name);
        if (it != creators_.end()) {
            func = it->second;
        }
    }
    if (!func) {
        if (name == IndexEnum::INDEX_DISKANN) {
            return expected<std::unique_ptr<IndexNode>>::Err(
                Status::unsupported_index("diskann is not provided by this build, use hnsw or flat"));
        }
        return expected<std::unique_ptr<IndexNode>>::Err(Status::unsupported_index("unknown index type: " + name));
    }
    return func(params);
}

expected<std::unique_ptr<IndexNode>>
IndexFactory::CreateFromString(const std::string& name, const std::string& params_text) const {
    if (!HasIndex(name)) {
        return Create(name, Json::object());
    }
    auto params = ParseJsonObject(params_text);
    if (!params.has_value()) {
        return expected<std::unique_ptr<IndexNode>>::Err(params.error());
    }
    return Create(name, params.value());
}

}  // namespace vecbridge
