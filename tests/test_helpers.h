#pragma once

#include "asset.h"
#include "config.h"
#include "metadata_store.h"
#include "thumbnail_pipeline.h"
#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <set>

// Test helper functions for creating mock assets and other test utilities
Asset create_test_asset(
    const std::string& id,
    const std::string& name,
    const std::string& category = Config::CONFIG_DEFAULT_CATEGORY,
    const std::set<std::string>& tags = {},
    const std::string& description = "");

// Mock classes for testing
class MockMetadataStore : public MetadataStore {
public:
    explicit MockMetadataStore(const std::filesystem::path& library_root);

    StoreSnapshot load() override;
    void save(const std::vector<Asset>& assets, const std::vector<std::string>& categories,
        const std::vector<std::string>& retired_ids = {}) override;

    // Test control
    bool fail_on_save = false;
    bool corrupt_on_load = false;

    // Test access to mock data
    StoreSnapshot stored;
    int save_count = 0;
};

class MockThumbnailPipeline : public ThumbnailPipeline {
public:
    explicit MockThumbnailPipeline(const std::filesystem::path& library_root);

    std::optional<std::string> generate(const std::filesystem::path& source_path, AssetKind kind,
        const std::string& asset_id, std::pair<int, int> target_size) override;
    bool remove_thumbnail(const std::string& asset_id) override;

    struct ThumbnailRequest {
        std::string source_path;
        AssetKind kind;
        std::string asset_id;
        std::pair<int, int> target_size;
    };

    // Test control
    bool fail_generation = false;

    std::vector<ThumbnailRequest> generate_requests;
    std::vector<std::string> removed_ids;
};

// Helper functions for managing temporary test files
std::filesystem::path create_temp_dir(const std::string& name = "asset_shelf_test");
std::filesystem::path create_temp_file(const std::filesystem::path& dir, const std::string& name, const std::string& content = "test content");
void cleanup_temp_dir(const std::filesystem::path& dir);

// Writes a solid colour RGBA PNG fixture
std::filesystem::path write_test_png(const std::filesystem::path& path, int width, int height,
    unsigned char r = 200, unsigned char g = 40, unsigned char b = 40);

// Reads a whole file for byte comparisons
std::string read_file_bytes(const std::filesystem::path& path);

// Number of entries directly under the library content directory
size_t count_library_content(const std::filesystem::path& library_root);

// Configuration pointing at library_root, saved next to it
Config create_test_config(const std::filesystem::path& base_dir, const std::filesystem::path& library_root);
