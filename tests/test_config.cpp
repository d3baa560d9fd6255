#include <catch2/catch_all.hpp>
#include <filesystem>
#include "config.h"
#include "test_helpers.h"

namespace fs = std::filesystem;

TEST_CASE("Config defaults", "[config]") {
    Config config;
    REQUIRE(config.asset_library_path().empty());
    REQUIRE(config.default_category() == "Default");
    REQUIRE(config.auto_generate_thumbnail());
    REQUIRE(config.thumbnail_size() == std::make_pair(256, 256));
    REQUIRE(config.store_backup_count() == 5);
}

TEST_CASE("Config loading", "[config]") {
    fs::path temp_dir = create_temp_dir("asset_shelf_test_config");
    fs::path config_path = temp_dir / "asset_shelf.json";

    SECTION("Missing file yields defaults and remembers the path") {
        Config config = Config::load(config_path);
        REQUIRE(config.config_path() == config_path);
        REQUIRE(config.default_category() == "Default");
    }

    SECTION("Recognized keys are read, unknown keys ignored") {
        create_temp_file(temp_dir, "asset_shelf.json", R"({
            "asset_library_path": "/data/library",
            "default_category": "Uncategorized",
            "auto_generate_thumbnail": false,
            "thumbnail_size": [128, 64],
            "store_backup_count": 2,
            "window_width": 1920
        })");

        Config config = Config::load(config_path);
        REQUIRE(config.asset_library_path() == "/data/library");
        REQUIRE(config.default_category() == "Uncategorized");
        REQUIRE_FALSE(config.auto_generate_thumbnail());
        REQUIRE(config.thumbnail_size() == std::make_pair(128, 64));
        REQUIRE(config.store_backup_count() == 2);
    }

    SECTION("Ill-typed values fall back to defaults") {
        create_temp_file(temp_dir, "asset_shelf.json", R"({
            "default_category": 7,
            "auto_generate_thumbnail": "yes",
            "thumbnail_size": [0, 64],
            "store_backup_count": -1
        })");

        Config config = Config::load(config_path);
        REQUIRE(config.default_category() == "Default");
        REQUIRE(config.auto_generate_thumbnail());
        REQUIRE(config.thumbnail_size() == std::make_pair(256, 256));
        REQUIRE(config.store_backup_count() == 5);
    }

    SECTION("Unparseable file yields defaults") {
        create_temp_file(temp_dir, "asset_shelf.json", "{ not json");
        Config config = Config::load(config_path);
        REQUIRE(config.asset_library_path().empty());
        REQUIRE(config.default_category() == "Default");
    }

    SECTION("Save then load round-trips every setting") {
        Config config = Config::load(config_path);
        config.set_asset_library_path("/data/other");
        REQUIRE(config.set_default_category("Misc"));
        config.set_auto_generate_thumbnail(false);
        REQUIRE(config.set_thumbnail_size(300, 200));
        REQUIRE(config.set_store_backup_count(0));
        REQUIRE(config.save());

        Config reloaded = Config::load(config_path);
        REQUIRE(reloaded.asset_library_path() == "/data/other");
        REQUIRE(reloaded.default_category() == "Misc");
        REQUIRE_FALSE(reloaded.auto_generate_thumbnail());
        REQUIRE(reloaded.thumbnail_size() == std::make_pair(300, 200));
        REQUIRE(reloaded.store_backup_count() == 0);
    }

    cleanup_temp_dir(temp_dir);
}

TEST_CASE("Config setters reject invalid values", "[config]") {
    Config config;
    REQUIRE_FALSE(config.set_default_category("   "));
    REQUIRE_FALSE(config.set_thumbnail_size(-1, 10));
    REQUIRE_FALSE(config.set_store_backup_count(-3));
    REQUIRE(config.default_category() == "Default");
    REQUIRE(config.thumbnail_size() == std::make_pair(256, 256));
    REQUIRE(config.store_backup_count() == 5);

    SECTION("Saving without a path fails") {
        REQUIRE_FALSE(config.save());
    }
}

TEST_CASE("Library layout paths", "[config]") {
    fs::path root = fs::path("library");
    REQUIRE(Config::get_store_path(root) == root / ".asset_db" / "assets.json");
    REQUIRE(Config::get_thumbnail_directory(root) == root / ".asset_db" / "thumbnails");
    REQUIRE(Config::get_backup_directory(root) == root / ".asset_db" / "backup");
    REQUIRE(Config::get_content_directory(root) == root / "assets");
}
