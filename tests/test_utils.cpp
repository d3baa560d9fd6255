#include <catch2/catch_all.hpp>
#include <filesystem>
#include <chrono>
#include "utils.h"
#include "asset.h"
#include "test_helpers.h"

namespace fs = std::filesystem;

TEST_CASE("format_file_size picks a readable unit", "[utils]") {
    REQUIRE(format_file_size(0) == "0 bytes");
    REQUIRE(format_file_size(1023) == "1023 bytes");
    REQUIRE(format_file_size(1024) == "1.0 KB");
    REQUIRE(format_file_size(1536) == "1.5 KB");
    REQUIRE(format_file_size(5ULL * 1024 * 1024) == "5.0 MB");
    REQUIRE(format_file_size(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
}

TEST_CASE("String helpers", "[utils]") {
    SECTION("to_lowercase only touches ASCII letters") {
        REQUIRE(to_lowercase("BluePrint_A") == "blueprint_a");
        REQUIRE(to_lowercase("123-XYZ") == "123-xyz");
    }

    SECTION("trim_string strips surrounding whitespace") {
        REQUIRE(trim_string("  rock  ") == "rock");
        REQUIRE(trim_string("\t\n") == "");
        REQUIRE(trim_string("") == "");
        REQUIRE(trim_string("two words") == "two words");
    }

    SECTION("normalize_path_separators converts backslashes") {
        REQUIRE(normalize_path_separators("assets\\rock\\rock.png") == "assets/rock/rock.png");
    }
}

TEST_CASE("Library-relative path checks", "[utils][filesystem]") {
    SECTION("Paths below the base are accepted") {
        REQUIRE(is_contained_relative_path("assets/rock.png"));
        REQUIRE(is_contained_relative_path("assets\\pack\\rock.png"));
        REQUIRE(is_contained_relative_path("assets/pack/../rock.png"));
    }

    SECTION("Absolute and escaping paths are rejected") {
        REQUIRE_FALSE(is_contained_relative_path("/tmp/victim"));
        REQUIRE_FALSE(is_contained_relative_path("../victim"));
        REQUIRE_FALSE(is_contained_relative_path("assets/../../victim"));
        REQUIRE_FALSE(is_contained_relative_path("assets/.."));
        REQUIRE_FALSE(is_contained_relative_path("."));
        REQUIRE_FALSE(is_contained_relative_path(""));
    }

    SECTION("File stems allow ids but no separators") {
        REQUIRE(is_plain_file_stem("0f8fad5b-d9cb-469f-a165-70867728950e"));
        REQUIRE(is_plain_file_stem("rock_01"));
        REQUIRE_FALSE(is_plain_file_stem("../escape"));
        REQUIRE_FALSE(is_plain_file_stem("a/b"));
        REQUIRE_FALSE(is_plain_file_stem(""));
    }
}

TEST_CASE("Timestamps round-trip through ISO-8601", "[utils][time]") {
    SECTION("Format is UTC with milliseconds") {
        auto time = std::chrono::system_clock::time_point(std::chrono::milliseconds(1714571112250LL));
        REQUIRE(format_timestamp(time) == "2024-05-01T13:45:12.250Z");
    }

    SECTION("current_timestamp survives a round trip unchanged") {
        auto now = current_timestamp();
        auto parsed = parse_timestamp(format_timestamp(now));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == now);
    }

    SECTION("Fraction and zone are optional") {
        auto without_fraction = parse_timestamp("2024-05-01T13:45:12Z");
        auto without_zone = parse_timestamp("2024-05-01T13:45:12");
        REQUIRE(without_fraction.has_value());
        REQUIRE(without_zone.has_value());
        REQUIRE(*without_fraction == *without_zone);
    }

    SECTION("Zone offsets are applied") {
        auto utc = parse_timestamp("2024-05-01T13:45:12Z");
        auto offset = parse_timestamp("2024-05-01T15:45:12+02:00");
        REQUIRE(utc.has_value());
        REQUIRE(offset.has_value());
        REQUIRE(*utc == *offset);
    }

    SECTION("Garbage is rejected") {
        REQUIRE_FALSE(parse_timestamp("yesterday").has_value());
        REQUIRE_FALSE(parse_timestamp("2024-05-01T13:45:12Zjunk").has_value());
        REQUIRE_FALSE(parse_timestamp("").has_value());
    }
}

TEST_CASE("calculate_content_size", "[utils][filesystem]") {
    fs::path temp_dir = create_temp_dir("asset_shelf_test_content_size");

    SECTION("A file reports its own size") {
        fs::path file = create_temp_file(temp_dir, "ten.bin", "0123456789");
        REQUIRE(calculate_content_size(file) == 10);
    }

    SECTION("A directory sums nested files") {
        create_temp_file(temp_dir, "pack/a.txt", "12345");
        create_temp_file(temp_dir, "pack/nested/b.txt", "123");
        fs::create_directories(temp_dir / "pack" / "empty");
        REQUIRE(calculate_content_size(temp_dir / "pack") == 8);
    }

    SECTION("A missing path is zero") {
        REQUIRE(calculate_content_size(temp_dir / "missing") == 0);
    }

    cleanup_temp_dir(temp_dir);
}

TEST_CASE("Media type detection and display info", "[utils][asset]") {
    REQUIRE(get_media_type(".png") == MediaType::Image);
    REQUIRE(get_media_type(".JPG") == MediaType::Image);
    REQUIRE(get_media_type(".mp4") == MediaType::Video);
    REQUIRE(get_media_type(".fbx") == MediaType::Model);
    REQUIRE(get_media_type(".wav") == MediaType::Audio);
    REQUIRE(get_media_type(".xyz") == MediaType::Unknown);
    REQUIRE(get_media_type("") == MediaType::Unknown);
    REQUIRE(get_media_type_string(MediaType::Archive) == "archive");

    REQUIRE(get_asset_kind_string(AssetKind::Directory) == "directory");
    REQUIRE(get_asset_kind_from_string("file") == AssetKind::File);
    REQUIRE_FALSE(get_asset_kind_from_string("package").has_value());

    Asset file = create_test_asset("id-1", "rock");
    file.size = 12 * 1024;
    REQUIRE(get_asset_display_info(file) == "PNG file · 12.0 KB");

    Asset folder = create_test_asset("id-2", "pack");
    folder.kind = AssetKind::Directory;
    folder.library_path = "assets/pack";
    folder.size = 100;
    REQUIRE(get_asset_display_info(folder) == "Directory · 100 bytes");
}
