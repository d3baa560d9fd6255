#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

using time_point = std::chrono::system_clock::time_point;

// Asset kind, fixed when the asset is imported
enum class AssetKind { File, Directory };

// Content type detected from a file extension, drives thumbnail decoding
enum class MediaType { Image, Video, Model, Audio, Font, Shader, Document, Archive, Unknown };

// Asset record
struct Asset {
  std::string id;                            // Opaque unique id, assigned at import, never reused
  std::string name;                          // Display name (non-empty)
  std::string category;                      // Always names an existing category
  AssetKind kind;                            // File or directory
  std::string library_path;                  // Content location relative to the library root (generic separators)
  std::optional<std::string> thumbnail_path; // Preview location relative to the library root, absent if none
  std::string description;                   // Free text
  std::set<std::string> tags;                // Case-sensitive, deduplicated
  uint64_t size;                             // Content size in bytes (sum of files for directories)
  time_point created_at;
  time_point updated_at;                     // Advances on every mutation

  Asset() : kind(AssetKind::File), size(0) {}

  bool operator==(const Asset& other) const;
  bool operator!=(const Asset& other) const { return !(*this == other); }
};

// Asset kind conversions for storage ("file" / "directory")
std::string get_asset_kind_string(AssetKind kind);
std::optional<AssetKind> get_asset_kind_from_string(const std::string& kind_string);

// Media type utility functions
MediaType get_media_type(const std::string& extension);
std::string get_media_type_string(MediaType type);

// "Directory · 1.2 MB" / "PNG file · 12.0 KB"
std::string get_asset_display_info(const Asset& asset);

// Plain text note sheet written next to the library when an asset is imported;
// users fill in the usage and remark sections by hand
std::string render_asset_document(const Asset& asset);
