#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "asset.h"
#include "config.h"
#include "image_data.h"

// Produces cached previews under {library_root}/.asset_db/thumbnails.
//
// Images are decoded, fitted inside the target size (aspect ratio kept, never
// upscaled) and written as PNG to thumbnails/{asset_id}.png. Videos go through
// the same path with their first readable frame. Directories and other file
// types share a static type icon under thumbnails/icons/.
//
// Generation is best-effort: every failure is logged and reported as an absent
// thumbnail. The source file is only ever read.
class ThumbnailPipeline {
public:
  explicit ThumbnailPipeline(const std::filesystem::path& library_root);
  virtual ~ThumbnailPipeline() = default;

  // Returns the preview location relative to the library root, or nullopt on failure.
  // Regenerating for the same asset_id overwrites the same file.
  virtual std::optional<std::string> generate(const std::filesystem::path& source_path, AssetKind kind,
    const std::string& asset_id, std::pair<int, int> target_size);

  // Deletes the per-asset preview; shared type icons are left alone.
  // Returns false if a file existed and could not be deleted.
  virtual bool remove_thumbnail(const std::string& asset_id);

  // Library-relative locations
  static std::string thumbnail_relative_path(const std::string& asset_id);
  static std::string type_icon_relative_path(const std::string& icon_name);
  static bool is_type_icon(const std::string& relative_path);

  std::filesystem::path thumbnail_path_for(const std::string& asset_id) const;
  const std::filesystem::path& library_root() const { return library_root_; }

  // Image helpers
  // Streams the file into stb; images above max_pixels are refused before decoding
  static ImageData load_image_data(const std::filesystem::path& path,
    uint64_t max_pixels = Config::THUMBNAIL_MAX_SOURCE_PIXELS);
  static ImageData resize_to_fit(const ImageData& image, int max_width, int max_height);
  static ImageData create_type_icon_data(const std::string& icon_name, int size);
  // Encodes as PNG and replaces output_path through a temporary file
  static void write_png(const ImageData& image, const std::filesystem::path& output_path);

private:
  std::filesystem::path library_root_;

  std::optional<std::string> ensure_type_icon(const std::string& icon_name);
  void discard_stale_thumbnail(const std::string& asset_id);
};
