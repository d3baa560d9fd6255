#include <catch2/catch_all.hpp>
#include <algorithm>
#include <string>
#include <vector>
#include "asset_registry.h"
#include "errors.h"
#include "test_helpers.h"

namespace {
std::vector<std::string> names_of(const std::vector<Asset>& assets) {
    std::vector<std::string> names;
    for (const auto& asset : assets) {
        names.push_back(asset.name);
    }
    return names;
}
}

TEST_CASE("AssetRegistry identity", "[registry]") {
    AssetRegistry registry;
    REQUIRE(registry.insert(create_test_asset("a1", "Rock")));

    SECTION("Lookup by id") {
        REQUIRE(registry.get_by_id("a1").name == "Rock");
        REQUIRE(registry.find("missing") == nullptr);
        REQUIRE_THROWS_AS(registry.get_by_id("missing"), NotFoundError);
    }

    SECTION("Duplicate ids are refused") {
        REQUIRE_FALSE(registry.insert(create_test_asset("a1", "Other")));
        REQUIRE(registry.size() == 1);
    }

    SECTION("Duplicate library paths are refused") {
        Asset clash = create_test_asset("a2", "Rock");
        REQUIRE(clash.library_path == registry.get_by_id("a1").library_path);
        REQUIRE_FALSE(registry.insert(clash));
        REQUIRE_FALSE(registry.contains("a2"));
    }

    SECTION("Remove frees the id and the path") {
        REQUIRE(registry.remove("a1"));
        REQUIRE_FALSE(registry.remove("a1"));
        REQUIRE(registry.empty());
        REQUIRE_FALSE(registry.has_library_path("assets/Rock.png"));
    }

    SECTION("Replace keeps the id") {
        Asset renamed = registry.get_by_id("a1");
        renamed.name = "Boulder";
        REQUIRE(registry.replace("a1", renamed));
        REQUIRE(registry.get_by_id("a1").name == "Boulder");

        Asset other_id = renamed;
        other_id.id = "a9";
        REQUIRE_FALSE(registry.replace("a1", other_id));
        REQUIRE_FALSE(registry.replace("missing", renamed));
    }
}

TEST_CASE("AssetRegistry rebuild", "[registry]") {
    AssetRegistry registry;
    registry.insert(create_test_asset("old", "Old"));

    Asset first = create_test_asset("a1", "Rock");
    Asset same_id = create_test_asset("a1", "Other");
    Asset same_path = create_test_asset("a2", "Rock");
    Asset grass = create_test_asset("a3", "Grass");

    size_t dropped = registry.rebuild({first, same_id, same_path, grass});
    REQUIRE(dropped == 2);
    REQUIRE(registry.size() == 2);
    REQUIRE_FALSE(registry.contains("old"));
    REQUIRE(names_of(registry.all()) == std::vector<std::string>{"Rock", "Grass"});
}

TEST_CASE("AssetRegistry search", "[registry][search]") {
    AssetRegistry registry;
    registry.insert(create_test_asset("a1", "BluePrint_A"));
    registry.insert(create_test_asset("a2", "Rock", "Default", {"blueish"}));
    registry.insert(create_test_asset("a3", "Grass", "Nature"));
    registry.insert(create_test_asset("a4", "Sky", "Nature", {}, "A clear BLUE sky"));

    SECTION("Matches name, tags and description case-insensitively in insertion order") {
        REQUIRE(names_of(registry.search("blue")) == std::vector<std::string>{"BluePrint_A", "Rock", "Sky"});
        REQUIRE(names_of(registry.search("BLUE")) == names_of(registry.search("blue")));
    }

    SECTION("Non-matching assets are excluded") {
        auto results = registry.search("blue");
        REQUIRE(std::none_of(results.begin(), results.end(), [](const Asset& a) { return a.name == "Grass"; }));
        REQUIRE(registry.search("nothing matches this").empty());
    }

    SECTION("Keyword is trimmed, blank keywords return everything") {
        REQUIRE(names_of(registry.search("  rock ")) == std::vector<std::string>{"Rock"});
        REQUIRE(registry.search("").size() == 4);
        REQUIRE(registry.search("   ").size() == 4);
    }

    SECTION("Optional category scope") {
        REQUIRE(names_of(registry.search("blue", std::string("Nature"))) == std::vector<std::string>{"Sky"});
        REQUIRE(registry.search("", std::string("Nature")).size() == 2);
    }

    SECTION("Search reflects replacements") {
        Asset grass = registry.get_by_id("a3");
        grass.tags = {"Blue-green"};
        registry.replace("a3", grass);
        REQUIRE(names_of(registry.search("blue")) == std::vector<std::string>{"BluePrint_A", "Rock", "Grass", "Sky"});
    }

    SECTION("A keyword does not match across field boundaries") {
        registry.insert(create_test_asset("a5", "Stone", "Default", {}, "ware"));
        REQUIRE(registry.search("stoneware").empty());
    }
}

TEST_CASE("AssetRegistry filter_by_category", "[registry]") {
    AssetRegistry registry;
    registry.insert(create_test_asset("a1", "Brick", "Materials"));
    registry.insert(create_test_asset("a2", "Tree", "Nature"));
    registry.insert(create_test_asset("a3", "Tile", "Materials"));

    SECTION("Exact match in insertion order") {
        REQUIRE(names_of(registry.filter_by_category("Materials")) == std::vector<std::string>{"Brick", "Tile"});
        REQUIRE(registry.filter_by_category("materials").empty());
    }

    SECTION("Unknown category is empty, not an error") {
        REQUIRE(registry.filter_by_category("Vehicles").empty());
    }

    SECTION("Index follows removals and category changes") {
        registry.remove("a1");
        Asset tree = registry.get_by_id("a2");
        tree.category = "Materials";
        registry.replace("a2", tree);

        REQUIRE(names_of(registry.filter_by_category("Materials")) == std::vector<std::string>{"Tree", "Tile"});
        REQUIRE(registry.filter_by_category("Nature").empty());
        REQUIRE(registry.ids_in_category("Materials") == std::vector<std::string>{"a2", "a3"});
    }
}
