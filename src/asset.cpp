#include "asset.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>

#include "utils.h"

bool Asset::operator==(const Asset& other) const {
  return id == other.id &&
    name == other.name &&
    category == other.category &&
    kind == other.kind &&
    library_path == other.library_path &&
    thumbnail_path == other.thumbnail_path &&
    description == other.description &&
    tags == other.tags &&
    size == other.size &&
    created_at == other.created_at &&
    updated_at == other.updated_at;
}

std::string get_asset_kind_string(AssetKind kind) {
  switch (kind) {
  case AssetKind::File:
    return "file";
  case AssetKind::Directory:
    return "directory";
  }
  return "file";
}

std::optional<AssetKind> get_asset_kind_from_string(const std::string& kind_string) {
  if (kind_string == "file") {
    return AssetKind::File;
  }
  if (kind_string == "directory") {
    return AssetKind::Directory;
  }
  return std::nullopt;
}

// Media type mapping based on file extensions - O(log n) lookup using map
MediaType get_media_type(const std::string& extension) {

  static const std::map<std::string, MediaType> type_map = {
    // Images
    {".png", MediaType::Image},
    {".jpg", MediaType::Image},
    {".jpeg", MediaType::Image},
    {".gif", MediaType::Image},
    {".bmp", MediaType::Image},
    {".tga", MediaType::Image},
    {".psd", MediaType::Image},
    {".hdr", MediaType::Image},
    {".pic", MediaType::Image},
    {".pnm", MediaType::Image},
    {".ppm", MediaType::Image},
    {".pgm", MediaType::Image},

    // Videos
    {".mp4", MediaType::Video},
    {".mov", MediaType::Video},
    {".mkv", MediaType::Video},
    {".avi", MediaType::Video},
    {".webm", MediaType::Video},
    {".m4v", MediaType::Video},
    {".wmv", MediaType::Video},

    // Models
    {".fbx", MediaType::Model},
    {".obj", MediaType::Model},
    {".dae", MediaType::Model},
    {".gltf", MediaType::Model},
    {".glb", MediaType::Model},
    {".ply", MediaType::Model},
    {".stl", MediaType::Model},
    {".3ds", MediaType::Model},
    {".uasset", MediaType::Model},

    // Audio
    {".wav", MediaType::Audio},
    {".mp3", MediaType::Audio},
    {".ogg", MediaType::Audio},
    {".flac", MediaType::Audio},
    {".aac", MediaType::Audio},
    {".m4a", MediaType::Audio},

    // Fonts
    {".ttf", MediaType::Font},
    {".otf", MediaType::Font},
    {".woff", MediaType::Font},
    {".woff2", MediaType::Font},

    // Shaders
    {".vert", MediaType::Shader},
    {".frag", MediaType::Shader},
    {".comp", MediaType::Shader},
    {".glsl", MediaType::Shader},
    {".hlsl", MediaType::Shader},
    {".usf", MediaType::Shader},

    // Documents
    {".txt", MediaType::Document},
    {".md", MediaType::Document},
    {".pdf", MediaType::Document},
    {".doc", MediaType::Document},
    {".docx", MediaType::Document},

    // Archives
    {".zip", MediaType::Archive},
    {".rar", MediaType::Archive},
    {".7z", MediaType::Archive},
    {".tar", MediaType::Archive},
    {".gz", MediaType::Archive}
  };

  auto it = type_map.find(to_lowercase(extension));
  return (it != type_map.end()) ? it->second : MediaType::Unknown;
}

// Lowercase names, also used as type icon file names
std::string get_media_type_string(MediaType type) {
  switch (type) {
  case MediaType::Image:
    return "image";
  case MediaType::Video:
    return "video";
  case MediaType::Model:
    return "model";
  case MediaType::Audio:
    return "audio";
  case MediaType::Font:
    return "font";
  case MediaType::Shader:
    return "shader";
  case MediaType::Document:
    return "document";
  case MediaType::Archive:
    return "archive";
  case MediaType::Unknown:
    return "unknown";
  }
  return "unknown";
}

std::string get_asset_display_info(const Asset& asset) {
  if (asset.kind == AssetKind::Directory) {
    return "Directory · " + format_file_size(asset.size);
  }

  std::string extension = std::filesystem::u8path(asset.library_path).extension().u8string();
  if (!extension.empty() && extension[0] == '.') {
    extension.erase(0, 1);
  }
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(static_cast<int>(c)));
  });

  if (extension.empty()) {
    return "File · " + format_file_size(asset.size);
  }
  return extension + " file · " + format_file_size(asset.size);
}

std::string render_asset_document(const Asset& asset) {
  const std::string rule(50, '=');
  std::stringstream ss;
  ss << "Asset information\n" << rule << "\n\n"
    << "Name:      " << asset.name << "\n"
    << "Id:        " << asset.id << "\n"
    << "Type:      " << get_asset_kind_string(asset.kind) << "\n"
    << "Category:  " << asset.category << "\n"
    << "Location:  " << asset.library_path << "\n"
    << "Size:      " << format_file_size(asset.size) << "\n"
    << "Created:   " << format_timestamp(asset.created_at) << "\n\n"
    << "Description:\n" << (asset.description.empty() ? "None" : asset.description) << "\n\n"
    << rule << "\n\n"
    << "Usage notes:\n\n\n"
    << "Remarks:\n\n";
  return ss.str();
}
