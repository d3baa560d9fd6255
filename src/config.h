#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

// Per-installation settings, stored as a JSON object.
// Unknown keys are ignored, missing or ill-typed keys fall back to the defaults below.
class Config {
public:
  // =============================================================================
  // LIBRARY LAYOUT
  // =============================================================================

  static constexpr const char* DATABASE_DIRECTORY = ".asset_db";
  static constexpr const char* STORE_FILE_NAME = "assets.json";
  static constexpr const char* THUMBNAIL_DIRECTORY = "thumbnails";
  static constexpr const char* ICON_DIRECTORY = "icons";
  static constexpr const char* BACKUP_DIRECTORY = "backup";
  static constexpr const char* DOCUMENT_DIRECTORY = "documents";
  static constexpr const char* DOCUMENT_EXTENSION = ".txt";
  static constexpr const char* CONTENT_DIRECTORY = "assets";
  static constexpr const char* THUMBNAIL_EXTENSION = ".png";

  // =============================================================================
  // THUMBNAILS
  // =============================================================================

  static constexpr int THUMBNAIL_CHANNELS = 4;
  static constexpr int THUMBNAIL_PNG_COMPRESSION_LEVEL = 8;
  static constexpr int TYPE_ICON_SIZE = 64;
  // Decoded RGBA of the largest accepted source stays around 1 GiB
  static constexpr uint64_t THUMBNAIL_MAX_SOURCE_PIXELS = 1ULL << 28;

  // =============================================================================
  // CONFIGURATION KEYS & DEFAULTS
  // =============================================================================

  static inline constexpr const char* CONFIG_KEY_ASSET_LIBRARY_PATH = "asset_library_path";
  static inline constexpr const char* CONFIG_KEY_DEFAULT_CATEGORY = "default_category";
  static inline constexpr const char* CONFIG_KEY_AUTO_GENERATE_THUMBNAIL = "auto_generate_thumbnail";
  static inline constexpr const char* CONFIG_KEY_THUMBNAIL_SIZE = "thumbnail_size";
  static inline constexpr const char* CONFIG_KEY_STORE_BACKUP_COUNT = "store_backup_count";
  static inline constexpr const char* CONFIG_DEFAULT_CATEGORY = "Default";
  static constexpr bool CONFIG_DEFAULT_AUTO_GENERATE_THUMBNAIL = true;
  static constexpr int CONFIG_DEFAULT_THUMBNAIL_WIDTH = 256;
  static constexpr int CONFIG_DEFAULT_THUMBNAIL_HEIGHT = 256;
  static constexpr int CONFIG_DEFAULT_STORE_BACKUP_COUNT = 5;

  static constexpr const char* DEFAULT_CONFIG_FILE = "asset_shelf.json";

  // =============================================================================
  // PATH UTILITIES
  // =============================================================================

  static std::filesystem::path get_database_directory(const std::filesystem::path& library_root) {
    return library_root / DATABASE_DIRECTORY;
  }

  static std::filesystem::path get_store_path(const std::filesystem::path& library_root) {
    return get_database_directory(library_root) / STORE_FILE_NAME;
  }

  static std::filesystem::path get_thumbnail_directory(const std::filesystem::path& library_root) {
    return get_database_directory(library_root) / THUMBNAIL_DIRECTORY;
  }

  static std::filesystem::path get_backup_directory(const std::filesystem::path& library_root) {
    return get_database_directory(library_root) / BACKUP_DIRECTORY;
  }

  static std::filesystem::path get_document_directory(const std::filesystem::path& library_root) {
    return get_database_directory(library_root) / DOCUMENT_DIRECTORY;
  }

  static std::filesystem::path get_content_directory(const std::filesystem::path& library_root) {
    return library_root / CONTENT_DIRECTORY;
  }

  // =============================================================================
  // RUNTIME CONFIGURATION
  // =============================================================================

  Config();

  // Reads config_path; a missing or unparseable file yields the defaults.
  // The path is remembered for save().
  static Config load(const std::filesystem::path& config_path);

  // Rewrites the configuration file. Returns false (and logs) on failure.
  bool save() const;

  const std::filesystem::path& config_path() const { return config_path_; }
  const std::string& asset_library_path() const { return asset_library_path_; }
  const std::string& default_category() const { return default_category_; }
  bool auto_generate_thumbnail() const { return auto_generate_thumbnail_; }
  std::pair<int, int> thumbnail_size() const { return {thumbnail_width_, thumbnail_height_}; }
  int store_backup_count() const { return store_backup_count_; }

  void set_config_path(const std::filesystem::path& path) { config_path_ = path; }
  void set_asset_library_path(const std::string& path) { asset_library_path_ = path; }
  bool set_default_category(const std::string& category);
  void set_auto_generate_thumbnail(bool enabled) { auto_generate_thumbnail_ = enabled; }
  bool set_thumbnail_size(int width, int height);
  bool set_store_backup_count(int count);

private:
  std::filesystem::path config_path_;
  std::string asset_library_path_;
  std::string default_category_;
  bool auto_generate_thumbnail_;
  int thumbnail_width_;
  int thumbnail_height_;
  int store_backup_count_;
};
