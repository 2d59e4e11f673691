// test_hash.cpp - Tests for Hasher and hash_value

#include <catch2/catch_all.hpp>
#include <dltypes/hash.h>

#include "test_types.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace dltypes;
using namespace test_types;

TEST_CASE("hash_value agrees with std::hash for primitives", "[hash][primitive]") {
    REQUIRE(hash_value(int64_t{42}) == std::hash<int64_t>{}(42));
    REQUIRE(hash_value(std::string("abc")) == std::hash<std::string>{}("abc"));
}

TEST_CASE("Equal values hash equal", "[hash][equality]") {
    SECTION("vector") {
        std::vector<std::string> a = {"x", "y"};
        std::vector<std::string> b = a;
        REQUIRE(hash_value(a) == hash_value(b));
    }

    SECTION("set built in different orders") {
        std::set<int64_t> a = {3, 1, 2};
        std::set<int64_t> b = {1, 2, 3};
        REQUIRE(hash_value(a) == hash_value(b));
    }

    SECTION("map") {
        std::map<std::string, int64_t> a = {{"a", 1}, {"b", 2}};
        std::map<std::string, int64_t> b = {{"b", 2}, {"a", 1}};
        REQUIRE(hash_value(a) == hash_value(b));
    }

    SECTION("optional and pair") {
        REQUIRE(hash_value(std::optional<int64_t>{7}) == hash_value(std::optional<int64_t>{7}));
        REQUIRE(hash_value(std::pair<std::string, bool>{"k", true}) ==
                hash_value(std::pair<std::string, bool>{"k", true}));
    }

    SECTION("generated records") {
        REQUIRE(hash_value(Endpoint{"db", 1}) == hash_value(Endpoint{"db", 1}));
        REQUIRE(hash_value(Endpoint{"db", 1}) == Endpoint{"db", 1}.hash());
    }

    SECTION("record with an array-backed map") {
        Topology a{"lab", {{"a", Endpoint{"a", 1}}}};
        Topology b = a;
        REQUIRE(hash_value(a) == hash_value(b));
    }
}

TEST_CASE("Distinct values usually hash differently", "[hash][spread]") {
    REQUIRE(hash_value(std::vector<int64_t>{1, 2}) != hash_value(std::vector<int64_t>{2, 1}));
    REQUIRE(hash_value(Endpoint{"db", 1}) != hash_value(Endpoint{"db", 2}));
    REQUIRE(hash_value(std::optional<int64_t>{}) != hash_value(std::optional<int64_t>{5}));
}

TEST_CASE("Nested empty containers stay distinguishable", "[hash][spread]") {
    using Nested = std::vector<std::vector<int64_t>>;
    REQUIRE(hash_value(Nested{}) != hash_value(Nested{{}}));
    REQUIRE(hash_value(Nested{{}}) != hash_value(Nested{{}, {}}));
}
