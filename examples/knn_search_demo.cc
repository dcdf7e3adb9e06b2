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

/**
 * Walks an hnsw index through create, build, search, dump and load.
 *
 *   knn_search_demo [dump_path]
 */

#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

#include "vecbridge/index.h"

using namespace vecbridge;

namespace {

std::vector<float>
GenerateRandomVectors(int num_vectors, int dim) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_real_distribution<float> dis(-1.0, 1.0);

    std::vector<float> data(num_vectors * dim);
    for (auto& val : data) {
        val = dis(gen);
    }
    return data;
}

int
Fail(const char* step, const Error& error) {
    std::cerr << "   " << step << " failed [" << ErrorKindToString(error.kind()) << "]: " << error.message()
              << std::endl;
    return 1;
}

void
PrintResults(const KnnSearchOutput& output) {
    for (size_t i = 0; i < std::min<size_t>(5, output.ids.size()); ++i) {
        std::cout << "     ID: " << output.ids[i] << ", Distance: " << output.distances[i] << std::endl;
    }
}

}  // namespace

int
main(int argc, char* argv[]) {
    std::cout << "=== vecbridge " << vecbridge_version() << " knn search demo ===" << std::endl;

    std::string dump_path = "./knn_search_demo.index";
    if (argc > 1) {
        dump_path = argv[1];
    }

    const int num_train = 1000;
    const int dim = 128;
    const size_t k = 10;
    const std::string index_type = "hnsw";
    const std::string params = R"({
        "dtype": "float32",
        "metric_type": "l2",
        "dim": 128,
        "hnsw": {"max_degree": 16, "ef_construction": 200}
    })";
    const std::string search_params = R"({"hnsw": {"ef_search": 100}})";

    std::cout << "\n1. Creating " << index_type << " index" << std::endl;
    auto created = Index::Create(index_type, params);
    if (!created.has_value()) {
        return Fail("create", created.error());
    }
    auto index = std::move(created).value();
    std::cout << "   Created index of type " << index.Type() << ", dim " << index.Dim() << std::endl;

    std::cout << "\n2. Building index with " << num_train << " vectors" << std::endl;
    auto train_data = GenerateRandomVectors(num_train, dim);
    std::vector<int64_t> ids(num_train);
    std::iota(ids.begin(), ids.end(), 0);
    // One repeated id, to show the rejection path.
    ids.back() = 0;
    auto failed = index.Build(num_train, dim, ids, train_data);
    if (!failed.has_value()) {
        return Fail("build", failed.error());
    }
    std::cout << "   Rejected ids: " << failed.value().size();
    for (auto id : failed.value()) {
        std::cout << " " << id;
    }
    std::cout << std::endl;
    std::cout << "   Index size: " << index.Count().value() << " vectors" << std::endl;

    std::cout << "\n3. Searching top-" << k << std::endl;
    auto query = GenerateRandomVectors(1, dim);
    auto result = index.KnnSearch(query, k, search_params);
    if (!result.has_value()) {
        return Fail("search", result.error());
    }
    std::cout << "   First results (top-5):" << std::endl;
    PrintResults(result.value());

    std::cout << "\n4. Rejected calls report their kind" << std::endl;
    auto bad_dim = index.KnnSearch(std::vector<float>(dim / 2), k, search_params);
    if (!bad_dim.has_value()) {
        std::cout << "   " << bad_dim.error().what() << std::endl;
    }
    auto bad_params = index.KnnSearch(query, k, R"({"hnsw": {"ef": 100}})");
    if (!bad_params.has_value()) {
        std::cout << "   " << bad_params.error().what() << std::endl;
    }

    std::cout << "\n5. Dumping to " << dump_path << std::endl;
    auto dumped = index.Dump(dump_path);
    if (!dumped.has_value()) {
        return Fail("dump", dumped.error());
    }

    std::cout << "\n6. Loading from " << dump_path << std::endl;
    auto loaded = Index::Load(dump_path, index_type, params);
    if (!loaded.has_value()) {
        return Fail("load", loaded.error());
    }
    auto reloaded = loaded->KnnSearch(query, k, search_params);
    if (!reloaded.has_value()) {
        return Fail("search after load", reloaded.error());
    }
    std::cout << "   Restored index size: " << loaded->Count().value() << " vectors" << std::endl;
    std::cout << "   Same results after load: " << (reloaded->ids == result->ids ? "Yes" : "No") << std::endl;

    index.Reset();
    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
