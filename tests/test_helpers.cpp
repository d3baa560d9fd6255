#include "test_helpers.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>
#include <stb_image_write.h>
#include "errors.h"
#include "utils.h"

namespace fs = std::filesystem;

Asset create_test_asset(
    const std::string& id,
    const std::string& name,
    const std::string& category,
    const std::set<std::string>& tags,
    const std::string& description) {
    Asset asset;
    asset.id = id;
    asset.name = name;
    asset.category = category;
    asset.kind = AssetKind::File;
    asset.library_path = std::string(Config::CONTENT_DIRECTORY) + "/" + name + ".png";
    asset.description = description;
    asset.tags = tags;
    asset.size = 1024; // Default size
    asset.created_at = current_timestamp();
    asset.updated_at = asset.created_at;
    return asset;
}

// Mock class implementations

// MockMetadataStore implementation
MockMetadataStore::MockMetadataStore(const fs::path& library_root) : MetadataStore(library_root) {}

StoreSnapshot MockMetadataStore::load() {
    if (corrupt_on_load) {
        throw CorruptStoreError("mock store is corrupt");
    }
    return stored;
}

void MockMetadataStore::save(const std::vector<Asset>& assets, const std::vector<std::string>& categories,
    const std::vector<std::string>& retired_ids) {
    if (fail_on_save) {
        throw PersistenceError("mock disk is full");
    }
    stored.assets = assets;
    stored.categories = categories;
    stored.retired_ids = retired_ids;
    save_count++;
}

// MockThumbnailPipeline implementation
MockThumbnailPipeline::MockThumbnailPipeline(const fs::path& library_root) : ThumbnailPipeline(library_root) {}

std::optional<std::string> MockThumbnailPipeline::generate(const fs::path& source_path, AssetKind kind,
    const std::string& asset_id, std::pair<int, int> target_size) {
    generate_requests.push_back({source_path.u8string(), kind, asset_id, target_size});
    if (fail_generation) {
        return std::nullopt;
    }
    return thumbnail_relative_path(asset_id);
}

bool MockThumbnailPipeline::remove_thumbnail(const std::string& asset_id) {
    removed_ids.push_back(asset_id);
    return true;
}

// Helper functions for temporary test files
fs::path create_temp_dir(const std::string& name) {
    fs::path temp_dir = fs::temp_directory_path() / name;
    std::error_code ec;
    fs::remove_all(temp_dir, ec); // Leftovers from an aborted run
    fs::create_directories(temp_dir);
    return temp_dir;
}

fs::path create_temp_file(const fs::path& dir, const std::string& name, const std::string& content) {
    fs::path file_path = dir / name;
    fs::create_directories(file_path.parent_path());
    std::ofstream file(file_path, std::ios::binary);
    file << content;
    file.close();
    return file_path;
}

void cleanup_temp_dir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
}

fs::path write_test_png(const fs::path& path, int width, int height, unsigned char r, unsigned char g, unsigned char b) {
    std::vector<unsigned char> pixels(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < pixels.size(); i += 4) {
        pixels[i] = r;
        pixels[i + 1] = g;
        pixels[i + 2] = b;
        pixels[i + 3] = 255;
    }
    fs::create_directories(path.parent_path());
    stbi_write_png(path.string().c_str(), width, height, 4, pixels.data(), width * 4);
    return path;
}

std::string read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

size_t count_library_content(const fs::path& library_root) {
    fs::path content_dir = Config::get_content_directory(library_root);
    if (!fs::exists(content_dir)) {
        return 0;
    }
    return static_cast<size_t>(std::distance(fs::directory_iterator(content_dir), fs::directory_iterator()));
}

Config create_test_config(const fs::path& base_dir, const fs::path& library_root) {
    Config config;
    config.set_config_path(base_dir / "asset_shelf.json");
    config.set_asset_library_path(library_root.u8string());
    return config;
}
