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

#include <algorithm>
#include <limits>
#include <string>
#include <unordered_set>
#include <utility>

#include "catch2/catch_approx.hpp"
#include "catch2/catch_test_macros.hpp"
#include "catch2/generators/catch_generators.hpp"
#include "utils.h"
#include "vecbridge/index.h"
#include "vecbridge/index/index_factory.h"

namespace {
constexpr float kKnnRecallThreshold = 0.9f;

std::string
ParamsFor(const std::string& type, int64_t dim, const std::string& metric = "l2") {
    return type == "hnsw" ? GenHnswParams(dim, metric).dump() : GenFlatParams(dim, metric).dump();
}

std::string
SearchParamsFor(const std::string& type) {
    return type == "hnsw" ? GenHnswSearchParams(100) : std::string("{}");
}

void
RequireSortedByDistance(const vecbridge::KnnSearchOutput& output) {
    REQUIRE(output.ids.size() == output.distances.size());
    for (size_t i = 1; i < output.distances.size(); ++i) {
        REQUIRE(output.distances[i - 1] <= output.distances[i]);
    }
}
}  // namespace

TEST_CASE("Test Hnsw L2 Round Trip", "[index]") {
    const int64_t nb = 1000, dim = 128, topk = 10;

    auto index = vecbridge::Index::Create("hnsw", GenHnswParams(dim).dump());
    REQUIRE(index.has_value());
    REQUIRE(index->Valid());
    CHECK(index->Dim() == dim);
    CHECK(index->Type() == "hnsw");

    auto data = GenRandomVectors(nb, dim);
    auto ids = GenIds(nb);
    auto failed = index->Build(nb, dim, ids, data);
    REQUIRE(failed.has_value());
    CHECK(failed.value().empty());

    auto count = index->Count();
    REQUIRE(count.has_value());
    CHECK(count.value() == static_cast<size_t>(nb));

    auto query = GenRandomVectors(1, dim, 1234);
    auto result = index->KnnSearch(query, topk, GenHnswSearchParams(100));
    REQUIRE(result.has_value());
    REQUIRE(result->ids.size() == static_cast<size_t>(topk));
    RequireSortedByDistance(result.value());
    for (auto id : result->ids) {
        CHECK(id >= 0);
        CHECK(id < nb);
    }

    auto gt = BruteForceKnn(data, ids, dim, query.data(), topk);
    CHECK(GetKNNRecall(gt, result->ids) >= kKnnRecallThreshold);
}

TEST_CASE("Test Index Matches Brute Force", "[index]") {
    using Catch::Approx;
    const int64_t nb = 500, dim = 32, topk = 20;

    auto type = GENERATE(as<std::string>{}, "hnsw", "flat");
    auto metric = GENERATE(as<std::string>{}, "l2", "ip", "cosine");
    auto index = vecbridge::Index::Create(type, ParamsFor(type, dim, metric));
    REQUIRE(index.has_value());

    auto data = GenRandomVectors(nb, dim);
    auto ids = GenIds(nb, 100);
    REQUIRE(index->Build(nb, dim, ids, data).has_value());

    auto query = GenRandomVectors(1, dim, 99);
    auto result = index->KnnSearch(query, topk, SearchParamsFor(type));
    REQUIRE(result.has_value());
    REQUIRE(result->ids.size() == static_cast<size_t>(topk));
    RequireSortedByDistance(result.value());

    auto gt = BruteForceKnn(data, ids, dim, query.data(), topk, metric);
    if (type == "flat") {
        REQUIRE(GetKNNRecall(gt, result->ids) == 1.0f);
        // Nearest distance agrees with a plain computation.
        auto pos = gt[0] - 100;
        auto expected = Distance(metric, query.data(), data.data() + pos * dim, dim);
        CHECK(result->distances[0] == Approx(expected).margin(1e-4));
    } else {
        CHECK(GetKNNRecall(gt, result->ids) >= kKnnRecallThreshold);
    }
}

TEST_CASE("Test Index Construction", "[index]") {
    using vecbridge::ErrorKind;

    SECTION("two handles are independent") {
        auto first = vecbridge::Index::Create("hnsw", GenHnswParams(8).dump());
        auto second = vecbridge::Index::Create("hnsw", GenHnswParams(8).dump());
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());

        auto data = GenRandomVectors(4, 8);
        REQUIRE(first->Build(4, 8, GenIds(4), data).has_value());
        CHECK(first->Count().value() == 4);
        CHECK(second->Count().value() == 0);

        first->Reset();
        CHECK_FALSE(first->Valid());
        CHECK(second->Valid());
        REQUIRE(second->Build(4, 8, GenIds(4), data).has_value());
        CHECK(second->Count().value() == 4);
    }

    SECTION("invalid configuration") {
        auto params = GENERATE(as<std::string>{}, "", "{", "[]", R"({"dim": 8})",
                               R"({"dtype": "float32", "metric_type": "l2", "dim": 8, "hnsw": {"max_degree": 16}})",
                               R"({"dtype": "float32", "metric_type": "l2", "dim": 8,
                                   "hnsw": {"max_degree": 16, "ef_construction": 100}, "extra": true})");
        auto index = vecbridge::Index::Create("hnsw", params);
        REQUIRE_FALSE(index.has_value());
        CHECK(index.error().kind() == ErrorKind::kConfigurationError);
        CHECK(index.error().native_code() == VECBRIDGE_INVALID_ARGUMENT);
    }

    SECTION("unsupported index type") {
        auto type = GENERATE(as<std::string>{}, "diskann", "ivf_pq");
        auto index = vecbridge::Index::Create(type, GenHnswParams(8).dump());
        REQUIRE_FALSE(index.has_value());
        CHECK(index.error().kind() == ErrorKind::kConfigurationError);
        CHECK(index.error().native_code() == VECBRIDGE_UNSUPPORTED_INDEX);
    }

    SECTION("embedded NUL never reaches native code") {
        std::string params = GenHnswParams(8).dump();
        params.push_back('\0');
        params += "garbage";
        auto index = vecbridge::Index::Create("hnsw", params);
        REQUIRE_FALSE(index.has_value());
        CHECK(index.error().kind() == ErrorKind::kInvalidArgument);
        CHECK(index.error().native_code() == 0);

        auto typed = vecbridge::Index::Create(std::string("hnsw\0x", 6), GenHnswParams(8).dump());
        REQUIRE_FALSE(typed.has_value());
        CHECK(typed.error().kind() == ErrorKind::kInvalidArgument);
    }
}

TEST_CASE("Test Index Build", "[index]") {
    using vecbridge::ErrorKind;
    const int64_t dim = 16;

    auto type = GENERATE(as<std::string>{}, "hnsw", "flat");
    auto index = vecbridge::Index::Create(type, ParamsFor(type, dim));
    REQUIRE(index.has_value());

    SECTION("shape mismatches fail before native code") {
        auto data = GenRandomVectors(10, dim);
        auto ids = GenIds(10);

        auto fewer_ids = index->Build(10, dim, GenIds(9), data);
        REQUIRE_FALSE(fewer_ids.has_value());
        CHECK(fewer_ids.error().kind() == ErrorKind::kInvalidArgument);
        CHECK(fewer_ids.error().native_code() == 0);

        auto short_vectors = index->Build(10, dim, ids, GenRandomVectors(9, dim));
        REQUIRE_FALSE(short_vectors.has_value());
        CHECK(short_vectors.error().kind() == ErrorKind::kInvalidArgument);
        CHECK(short_vectors.error().native_code() == 0);

        auto wrong_dim = index->Build(5, dim * 2, GenIds(5), data);
        REQUIRE_FALSE(wrong_dim.has_value());
        CHECK(wrong_dim.error().kind() == ErrorKind::kInvalidArgument);
        CHECK(wrong_dim.error().native_code() == 0);

        auto overflow = index->Build(2, std::numeric_limits<size_t>::max() / 2 + 1, GenIds(2), {});
        REQUIRE_FALSE(overflow.has_value());
        CHECK(overflow.error().kind() == ErrorKind::kInvalidArgument);
        CHECK(overflow.error().native_code() == 0);
        CHECK(overflow.error().message().find("overflow") != std::string::npos);

        CHECK(index->Count().value() == 0);
    }

    SECTION("one duplicate id among N vectors") {
        const int64_t n = 50;
        auto data = GenRandomVectors(n, dim);
        auto ids = GenIds(n);
        ids[n - 1] = ids[7];

        auto failed = index->Build(n, dim, ids, data);
        REQUIRE(failed.has_value());
        REQUIRE(failed->size() == 1);
        CHECK(failed->at(0) == 7);
        CHECK(index->Count().value() == static_cast<size_t>(n - 1));

        // Every accepted vector is its own nearest neighbor.
        for (int64_t i = 0; i < n - 1; ++i) {
            std::vector<float> query(data.begin() + i * dim, data.begin() + (i + 1) * dim);
            auto result = index->KnnSearch(query, 1, SearchParamsFor(type));
            REQUIRE(result.has_value());
            REQUIRE(result->ids.size() == 1);
            CHECK(result->ids[0] == ids[i]);
        }
    }

    SECTION("ids already indexed are rejected across builds") {
        auto first = GenRandomVectors(10, dim, 1);
        REQUIRE(index->Build(10, dim, GenIds(10), first).has_value());

        auto second = GenRandomVectors(10, dim, 2);
        auto failed = index->Build(10, dim, GenIds(10, 5), second);
        REQUIRE(failed.has_value());
        CHECK(*failed == std::vector<int64_t>{5, 6, 7, 8, 9});
        CHECK(index->Count().value() == 15);
    }

    SECTION("non-finite vectors are rejected") {
        auto data = GenRandomVectors(3, dim);
        data[dim] = std::numeric_limits<float>::quiet_NaN();
        auto failed = index->Build(3, dim, GenIds(3), data);
        REQUIRE(failed.has_value());
        CHECK(*failed == std::vector<int64_t>{1});
        CHECK(index->Count().value() == 2);
    }

    SECTION("empty batch") {
        auto failed = index->Build(0, dim, {}, {});
        REQUIRE(failed.has_value());
        CHECK(failed->empty());
    }
}

TEST_CASE("Test Cosine Rejects Zero Vectors", "[index]") {
    const int64_t dim = 4;
    auto index = vecbridge::Index::Create("flat", GenFlatParams(dim, "cosine").dump());
    REQUIRE(index.has_value());

    std::vector<float> data = {1, 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0};
    auto failed = index->Build(3, dim, {10, 11, 12}, data);
    REQUIRE(failed.has_value());
    CHECK(*failed == std::vector<int64_t>{11});

    auto result = index->KnnSearch({2, 0, 0, 0}, 2, "{}");
    REQUIRE(result.has_value());
    REQUIRE(result->ids.size() == 2);
    CHECK(result->ids[0] == 10);
    CHECK(result->distances[0] == Catch::Approx(0.0f).margin(1e-6));
    CHECK(result->distances[1] == Catch::Approx(1.0f).margin(1e-6));
}

TEST_CASE("Test Index Search", "[index]") {
    using vecbridge::ErrorKind;
    const int64_t dim = 8;

    auto type = GENERATE(as<std::string>{}, "hnsw", "flat");
    auto index = vecbridge::Index::Create(type, ParamsFor(type, dim));
    REQUIRE(index.has_value());
    auto query = GenRandomVectors(1, dim, 5);

    SECTION("empty index returns no results") {
        auto result = index->KnnSearch(query, 10, SearchParamsFor(type));
        REQUIRE(result.has_value());
        CHECK(result->ids.empty());
        CHECK(result->distances.empty());
    }

    SECTION("k larger than the index") {
        REQUIRE(index->Build(5, dim, GenIds(5), GenRandomVectors(5, dim)).has_value());
        auto result = index->KnnSearch(query, 10, SearchParamsFor(type));
        REQUIRE(result.has_value());
        REQUIRE(result->ids.size() == 5);
        RequireSortedByDistance(result.value());
        std::unordered_set<int64_t> unique(result->ids.begin(), result->ids.end());
        CHECK(unique.size() == 5);
    }

    SECTION("boundary errors") {
        REQUIRE(index->Build(5, dim, GenIds(5), GenRandomVectors(5, dim)).has_value());

        auto wrong_dim = index->KnnSearch(GenRandomVectors(1, dim + 1), 3, SearchParamsFor(type));
        REQUIRE_FALSE(wrong_dim.has_value());
        CHECK(wrong_dim.error().kind() == ErrorKind::kInvalidArgument);
        CHECK(wrong_dim.error().native_code() == 0);

        auto zero_k = index->KnnSearch(query, 0, SearchParamsFor(type));
        REQUIRE_FALSE(zero_k.has_value());
        CHECK(zero_k.error().kind() == ErrorKind::kInvalidArgument);

        std::string nul_params = SearchParamsFor(type);
        nul_params.push_back('\0');
        auto nul = index->KnnSearch(query, 3, nul_params);
        REQUIRE_FALSE(nul.has_value());
        CHECK(nul.error().kind() == ErrorKind::kInvalidArgument);

        for (auto bad : {std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::infinity(),
                         -std::numeric_limits<float>::infinity()}) {
            auto non_finite = query;
            non_finite[dim - 1] = bad;
            auto result = index->KnnSearch(non_finite, 3, SearchParamsFor(type));
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().kind() == ErrorKind::kInvalidArgument);
            CHECK(result.error().native_code() == 0);
        }
    }

    SECTION("malformed search parameters") {
        REQUIRE(index->Build(5, dim, GenIds(5), GenRandomVectors(5, dim)).has_value());
        auto params = GENERATE(as<std::string>{}, "", "{\"hnsw\":", R"({"hnsw": {"ef_search": -1}})",
                               R"({"diskann": {"beam_search": 4}})");
        auto result = index->KnnSearch(query, 3, params);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().kind() == ErrorKind::kConfigurationError);
    }
}

TEST_CASE("Test Index Ownership", "[index]") {
    using vecbridge::ErrorKind;
    const int64_t dim = 8;

    auto created = vecbridge::Index::Create("hnsw", GenHnswParams(dim).dump());
    REQUIRE(created.has_value());
    vecbridge::Index index = std::move(created).value();
    REQUIRE(index.Valid());
    auto data = GenRandomVectors(4, dim);
    REQUIRE(index.Build(4, dim, GenIds(4), data).has_value());

    auto check_unusable = [&](const vecbridge::Index& idx) {
        CHECK_FALSE(idx.Valid());
        CHECK_FALSE(static_cast<bool>(idx));
        CHECK(idx.Dim() == 0);
        CHECK(idx.Type().empty());

        auto build = idx.Build(4, dim, GenIds(4), data);
        REQUIRE_FALSE(build.has_value());
        CHECK(build.error().kind() == ErrorKind::kInvalidArgument);

        auto search = idx.KnnSearch(GenRandomVectors(1, dim), 1, GenHnswSearchParams());
        REQUIRE_FALSE(search.has_value());
        CHECK(search.error().kind() == ErrorKind::kInvalidArgument);

        auto count = idx.Count();
        REQUIRE_FALSE(count.has_value());
        CHECK(count.error().kind() == ErrorKind::kInvalidArgument);

        TempDir dir;
        auto dump = idx.Dump(dir.File("index"));
        REQUIRE_FALSE(dump.has_value());
        CHECK(dump.error().kind() == ErrorKind::kInvalidArgument);
    };

    SECTION("moved-from handle") {
        vecbridge::Index moved(std::move(index));
        CHECK(moved.Valid());
        CHECK(moved.Count().value() == 4);
        check_unusable(index);
    }

    SECTION("move assignment releases the previous handle") {
        auto other = vecbridge::Index::Create("flat", GenFlatParams(dim).dump());
        REQUIRE(other.has_value());
        vecbridge::Index target = std::move(other).value();
        target = std::move(index);
        CHECK(target.Type() == "hnsw");
        CHECK(target.Count().value() == 4);
        check_unusable(index);
    }

    SECTION("reset handle") {
        index.Reset();
        check_unusable(index);
        index.Reset();
        check_unusable(index);
    }

    SECTION("default constructed handle") {
        vecbridge::Index empty;
        check_unusable(empty);
    }
}

TEST_CASE("Test Native Error Classification", "[index]") {
    using vecbridge::ClassifyNativeError;
    using vecbridge::ErrorKind;
    using vecbridge::Operation;

    CHECK(ClassifyNativeError(Operation::kConstruct, VECBRIDGE_INVALID_ARGUMENT) == ErrorKind::kConfigurationError);
    CHECK(ClassifyNativeError(Operation::kSearch, VECBRIDGE_INVALID_ARGUMENT) == ErrorKind::kConfigurationError);
    CHECK(ClassifyNativeError(Operation::kBuild, VECBRIDGE_INVALID_ARGUMENT) == ErrorKind::kInvalidArgument);
    CHECK(ClassifyNativeError(Operation::kDump, VECBRIDGE_INVALID_ARGUMENT) == ErrorKind::kNativeFailure);

    CHECK(ClassifyNativeError(Operation::kConstruct, VECBRIDGE_UNSUPPORTED_INDEX) == ErrorKind::kConfigurationError);
    CHECK(ClassifyNativeError(Operation::kBuild, VECBRIDGE_UNSUPPORTED_INDEX) == ErrorKind::kBuildError);

    // Count failures are not search failures.
    CHECK(ClassifyNativeError(Operation::kQuery, VECBRIDGE_INVALID_ARGUMENT) == ErrorKind::kNativeFailure);
    CHECK(ClassifyNativeError(Operation::kQuery, VECBRIDGE_UNSUPPORTED_INDEX) == ErrorKind::kNativeFailure);

    auto op = GENERATE(Operation::kConstruct, Operation::kBuild, Operation::kSearch, Operation::kDump,
                       Operation::kQuery);
    CHECK(ClassifyNativeError(op, VECBRIDGE_DIMENSION_NOT_EQUAL) == ErrorKind::kInvalidArgument);
    CHECK(ClassifyNativeError(op, VECBRIDGE_READ_ERROR) == ErrorKind::kNativeFailure);
    CHECK(ClassifyNativeError(op, VECBRIDGE_MISSING_FILE) == ErrorKind::kNativeFailure);
    CHECK(ClassifyNativeError(op, VECBRIDGE_UNKNOWN_ERROR) == ErrorKind::kNativeFailure);
    CHECK(ClassifyNativeError(op, 999) == ErrorKind::kNativeFailure);

    auto expected = op == Operation::kBuild    ? ErrorKind::kBuildError
                    : op == Operation::kSearch ? ErrorKind::kSearchError
                                               : ErrorKind::kNativeFailure;
    CHECK(ClassifyNativeError(op, VECBRIDGE_NO_ENOUGH_MEMORY) == expected);
    CHECK(ClassifyNativeError(op, VECBRIDGE_INTERNAL_ERROR) == expected);
    CHECK(ClassifyNativeError(op, VECBRIDGE_INDEX_EMPTY) == expected);

    vecbridge_error_t record{VECBRIDGE_INTERNAL_ERROR, "engine exploded"};
    auto error = vecbridge::Error::FromNative(Operation::kSearch, record);
    CHECK(error.kind() == ErrorKind::kSearchError);
    CHECK(error.native_code() == VECBRIDGE_INTERNAL_ERROR);
    CHECK(error.message() == "engine exploded");
    CHECK(error.what().find("SearchError") != std::string::npos);
}

TEST_CASE("Test Index Factory", "[index]") {
    auto& factory = vecbridge::IndexFactory::Instance();
    CHECK(factory.ListIndexes() == std::vector<std::string>{"flat", "hnsw"});
    CHECK(factory.HasIndex(vecbridge::IndexEnum::INDEX_HNSW));
    CHECK_FALSE(factory.HasIndex(vecbridge::IndexEnum::INDEX_DISKANN));

    auto node = factory.Create(vecbridge::IndexEnum::INDEX_FLAT, GenFlatParams(4));
    REQUIRE(node.has_value());
    CHECK(node.value()->Type() == "flat");
    CHECK(node.value()->Dim() == 4);

    auto diskann = factory.CreateFromString(vecbridge::IndexEnum::INDEX_DISKANN, "{}");
    REQUIRE_FALSE(diskann.has_value());
    CHECK(diskann.error() == vecbridge::StatusCode::unsupported_index);
}
