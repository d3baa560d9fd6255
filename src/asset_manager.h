#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "asset.h"
#include "asset_registry.h"
#include "config.h"
#include "metadata_store.h"
#include "thumbnail_pipeline.h"

// Import progress, reported once per copied file and once per later stage
using ProgressCallback = std::function<void(size_t current, size_t total, const std::string& message)>;

// Everything a caller may say about a new asset
struct AddAssetRequest {
  std::filesystem::path source_path;      // File or directory to copy into the library
  std::optional<std::string> name;        // Defaults to the source file or folder name
  std::optional<std::string> category;    // Defaults to the default category
  std::string description;
  std::set<std::string> tags;
};

// Fields to change on an existing asset; absent fields are left alone
struct AssetPatch {
  std::optional<std::string> name;
  std::optional<std::string> category;
  std::optional<std::string> description;
  std::optional<std::set<std::string>> tags;

  bool empty() const { return !name && !category && !description && !tags; }
};

enum class SortOrder { NewestFirst, OldestFirst, NameAscending, NameDescending, CategoryAscending, CategoryDescending };

// Factories for the collaborators bound to one library root
using StoreFactory = std::function<std::unique_ptr<MetadataStore>(const std::filesystem::path& library_root)>;
using ThumbnailFactory = std::function<std::unique_ptr<ThumbnailPipeline>(const std::filesystem::path& library_root)>;

// Orchestrates every state change across the metadata store, the thumbnail
// cache and the in-memory registry. Constructed once with the configuration,
// opened on a library root, then driven by a single mutating caller at a time.
class AssetManager {
public:
  explicit AssetManager(Config& config, StoreFactory store_factory = nullptr,
    ThumbnailFactory thumbnail_factory = nullptr);
  ~AssetManager() = default;

  AssetManager(const AssetManager&) = delete;
  AssetManager& operator=(const AssetManager&) = delete;

  // Opens the library configured in Config, if any.
  // Returns false when no library path is configured.
  bool open();
  bool is_open() const { return store_ != nullptr; }

  // Set when the last load found an unreadable store and started empty
  const std::optional<std::string>& load_error() const { return load_error_; }

  // Assets
  Asset add_asset(const AddAssetRequest& request, const ProgressCallback& progress = nullptr,
    const std::atomic<bool>* cancel = nullptr);
  void remove_asset(const std::string& id);
  Asset update_asset(const std::string& id, const AssetPatch& patch);
  // Recomputes the size from the library content and regenerates the preview
  Asset refresh_asset(const std::string& id);
  Asset regenerate_thumbnail(const std::string& id);

  Asset get_asset(const std::string& id) const;
  std::vector<Asset> get_all_assets(const std::optional<std::string>& category = std::nullopt) const;
  std::vector<std::string> get_all_asset_names() const;
  std::vector<Asset> search_assets(const std::string& keyword,
    const std::optional<std::string>& category = std::nullopt) const;
  std::vector<Asset> filter_by_category(const std::string& category) const;
  static std::vector<Asset> sort_assets(std::vector<Asset> assets, SortOrder order);

  // Absolute location of an asset's content or preview
  std::filesystem::path resolve_library_path(const Asset& asset) const;
  std::optional<std::filesystem::path> resolve_thumbnail_path(const Asset& asset) const;
  // Note sheet written at import; absent for assets adopted from untracked content
  std::optional<std::filesystem::path> resolve_document_path(const Asset& asset) const;

  // Categories
  void add_category(const std::string& name);
  // Members are reassigned to the default category before the category is dropped
  void remove_category(const std::string& name);
  const std::vector<std::string>& get_categories() const { return categories_; }
  const std::string& default_category() const { return config_.default_category(); }

  // Library root
  // Rejected with ValidationError while live assets exist under the current root
  void set_library_path(const std::filesystem::path& path);
  std::optional<std::filesystem::path> get_library_path() const { return library_root_; }

private:
  Config& config_;
  StoreFactory store_factory_;
  ThumbnailFactory thumbnail_factory_;

  std::optional<std::filesystem::path> library_root_;
  std::unique_ptr<MetadataStore> store_;
  std::unique_ptr<ThumbnailPipeline> thumbnails_;
  AssetRegistry registry_;
  std::vector<std::string> categories_;
  std::vector<std::string> retired_ids_;
  std::optional<std::string> load_error_;

  void open_library(const std::filesystem::path& library_root);
  void load();
  std::vector<Asset> reconcile(std::vector<Asset> assets);
  // Records content under the content directory that no asset claims
  size_t adopt_untracked_content();
  void persist();
  void persist(const std::vector<std::string>& categories, const std::vector<std::string>& retired_ids);

  void require_open() const;
  bool has_category(const std::string& name) const;
  std::string generate_asset_id() const;
  std::filesystem::path choose_target_path(const std::filesystem::path& source_path, const std::string& asset_id) const;
  std::optional<std::string> make_thumbnail(const Asset& asset);
  std::filesystem::path document_path_for(const std::string& asset_id) const;
  void write_document(const Asset& asset) const;
  void remove_document(const std::string& asset_id) const;

  // Content copy with per-file progress and cancellation; the caller discards the partial copy
  void copy_content(const std::filesystem::path& source, const std::filesystem::path& target,
    const ProgressCallback& progress, const std::atomic<bool>* cancel) const;
  // Only deletes below the content directory
  void discard_content(const std::filesystem::path& target) const;
};
