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

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "catch2/catch_test_macros.hpp"
#include "catch2/generators/catch_generators.hpp"
#include "utils.h"
#include "vecbridge/config.h"
#include "vecbridge/index.h"

namespace {
std::string
ReadBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
}  // namespace

TEST_CASE("Test Dump And Load", "[serialize]") {
    using vecbridge::ErrorKind;
    const int64_t nb = 1000, dim = 128, topk = 10;

    auto type = GENERATE(as<std::string>{}, "hnsw", "flat");
    auto metric = GENERATE(as<std::string>{}, "l2", "cosine");
    auto params = type == "hnsw" ? GenHnswParams(dim, metric).dump() : GenFlatParams(dim, metric).dump();
    auto search_params = type == "hnsw" ? GenHnswSearchParams(100) : std::string("{}");

    auto index = vecbridge::Index::Create(type, params);
    REQUIRE(index.has_value());
    auto data = GenRandomVectors(nb, dim);
    REQUIRE(index->Build(nb, dim, GenIds(nb), data).has_value());

    TempDir dir;
    auto path = dir.File("index");
    auto dumped = index->Dump(path);
    REQUIRE(dumped.has_value());
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(std::filesystem::exists(path + ".meta"));

    SECTION("loaded index answers the same") {
        auto loaded = vecbridge::Index::Load(path, type, params);
        REQUIRE(loaded.has_value());
        CHECK(loaded->Dim() == dim);
        CHECK(loaded->Type() == type);
        CHECK(loaded->Count().value() == static_cast<size_t>(nb));

        for (uint32_t seed = 0; seed < 5; ++seed) {
            auto query = GenRandomVectors(1, dim, 500 + seed);
            auto before = index->KnnSearch(query, topk, search_params);
            auto after = loaded->KnnSearch(query, topk, search_params);
            REQUIRE(before.has_value());
            REQUIRE(after.has_value());
            CHECK(before->ids == after->ids);
            CHECK(before->distances == after->distances);
        }

        // A loaded index keeps rejecting ids it already holds.
        auto failed = loaded->Build(2, dim, {0, static_cast<int64_t>(nb)}, GenRandomVectors(2, dim, 3));
        REQUIRE(failed.has_value());
        CHECK(*failed == std::vector<int64_t>{0});
        CHECK(loaded->Count().value() == static_cast<size_t>(nb + 1));
    }

    SECTION("sidecar describes the dump") {
        std::ifstream in(path + ".meta");
        REQUIRE(in.is_open());
        auto meta = vecbridge::Json::parse(in);
        CHECK(meta["index_type"] == type);
        CHECK(meta["metric_type"] == metric);
        CHECK(meta["dtype"] == "float32");
        CHECK(meta["dim"] == dim);
        CHECK(meta["count"] == nb);
    }

    SECTION("missing sidecar") {
        std::filesystem::remove(path + ".meta");
        auto loaded = vecbridge::Index::Load(path, type, params);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().kind() == ErrorKind::kNativeFailure);
        CHECK(loaded.error().native_code() == VECBRIDGE_MISSING_FILE);
    }

    SECTION("dimension mismatch") {
        auto other = type == "hnsw" ? GenHnswParams(dim / 2, metric).dump() : GenFlatParams(dim / 2, metric).dump();
        auto loaded = vecbridge::Index::Load(path, type, other);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().kind() == ErrorKind::kInvalidArgument);
        CHECK(loaded.error().native_code() == VECBRIDGE_DIMENSION_NOT_EQUAL);
    }

    SECTION("malformed parameters") {
        auto loaded = vecbridge::Index::Load(path, type, "{}");
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().kind() == ErrorKind::kConfigurationError);
    }

    SECTION("truncated payload") {
        if (type != "flat") {
            return;
        }
        // Shorter than the flat header.
        std::filesystem::resize_file(path, 16);
        auto loaded = vecbridge::Index::Load(path, type, params);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().kind() == ErrorKind::kNativeFailure);
        CHECK(loaded.error().native_code() == VECBRIDGE_INVALID_BINARY);
    }
}

TEST_CASE("Test Dump Failures", "[serialize]") {
    using vecbridge::ErrorKind;
    const int64_t dim = 8;
    TempDir dir;

    auto type = GENERATE(as<std::string>{}, "hnsw", "flat");
    auto params = type == "hnsw" ? GenHnswParams(dim).dump() : GenFlatParams(dim).dump();
    auto index = vecbridge::Index::Create(type, params);
    REQUIRE(index.has_value());

    SECTION("empty index") {
        auto dumped = index->Dump(dir.File("empty"));
        REQUIRE_FALSE(dumped.has_value());
        CHECK(dumped.error().kind() == ErrorKind::kNativeFailure);
        CHECK(dumped.error().native_code() == VECBRIDGE_INDEX_EMPTY);
    }

    SECTION("unwritable path") {
        REQUIRE(index->Build(4, dim, GenIds(4), GenRandomVectors(4, dim)).has_value());
        auto dumped = index->Dump(dir.File("no/such/dir/index"));
        REQUIRE_FALSE(dumped.has_value());
        CHECK(dumped.error().kind() == ErrorKind::kNativeFailure);
        CHECK(dumped.error().native_code() == VECBRIDGE_READ_ERROR);
    }

    SECTION("failed sidecar write keeps the previous dump") {
        REQUIRE(index->Build(4, dim, GenIds(4), GenRandomVectors(4, dim)).has_value());
        auto path = dir.File("index");
        REQUIRE(index->Dump(path).has_value());
        auto payload = ReadBytes(path);
        REQUIRE_FALSE(payload.empty());

        // A directory in place of the sidecar makes the sidecar write fail.
        std::filesystem::remove(path + ".meta");
        std::filesystem::create_directory(path + ".meta");
        REQUIRE(index->Build(4, dim, GenIds(4, 4), GenRandomVectors(4, dim, 9)).has_value());
        auto dumped = index->Dump(path);
        REQUIRE_FALSE(dumped.has_value());
        CHECK(dumped.error().kind() == ErrorKind::kNativeFailure);
        CHECK(dumped.error().native_code() == VECBRIDGE_READ_ERROR);

        CHECK(ReadBytes(path) == payload);
        CHECK_FALSE(std::filesystem::exists(path + ".tmp"));
    }
}
