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

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "vecbridge/config.h"
#include "vecbridge/expected.h"
#include "vecbridge/index/index_node.h"

namespace vecbridge {

class IndexFactory {
 public:
    // Receives the already parsed construction parameters.
    using CreateFunc = std::function<expected<std::unique_ptr<IndexNode>>(const Json&)>;

    static IndexFactory&
    Instance();

    expected<std::unique_ptr<IndexNode>>
    Create(const std::string& name, const Json& params) const;

    // An unknown index type is reported before the parameters are parsed.
    expected<std::unique_ptr<IndexNode>>
    CreateFromString(const std::string& name, const std::string& params_text) const;

    void
    Register(const std::string& name, CreateFunc func);

    bool
    HasIndex(const std::string& name) const;

    std::vector<std::string>
    ListIndexes() const;

 private:
    IndexFactory();
    IndexFactory(const IndexFactory&) = delete;
    IndexFactory&
    operator=(const IndexFactory&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CreateFunc> creators_;
};

}  // namespace vecbridge
