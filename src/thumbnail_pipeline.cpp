#include "thumbnail_pipeline.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <system_error>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize.h>

#include "config.h"
#include "logger.h"
#include "utils.h"
#include "video_decoder.h"

namespace fs = std::filesystem;

namespace {
constexpr const char* DIRECTORY_ICON = "directory";

void append_to_buffer(void* context, void* data, int size) {
  auto* buffer = static_cast<std::vector<unsigned char>*>(context);
  auto* bytes = static_cast<unsigned char*>(data);
  buffer->insert(buffer->end(), bytes, bytes + size);
}

// stb_image reads through these so the encoded file is never held in memory whole
int read_stream(void* user, char* data, int size) {
  auto* file = static_cast<std::ifstream*>(user);
  file->read(data, size);
  return static_cast<int>(file->gcount());
}

void skip_stream(void* user, int n) {
  auto* file = static_cast<std::ifstream*>(user);
  file->seekg(n, std::ios::cur);
}

int stream_at_end(void* user) {
  auto* file = static_cast<std::ifstream*>(user);
  return file->peek() == std::char_traits<char>::eof() ? 1 : 0;
}

struct IconColor {
  unsigned char r, g, b;
};

IconColor get_icon_color(const std::string& icon_name) {
  static const std::map<std::string, IconColor> colors = {
    {"directory", {230, 180, 60}},
    {"image", {80, 160, 220}},
    {"video", {200, 80, 90}},
    {"model", {120, 90, 200}},
    {"audio", {60, 180, 120}},
    {"font", {110, 110, 110}},
    {"shader", {220, 120, 40}},
    {"document", {90, 120, 150}},
    {"archive", {150, 110, 70}},
    {"unknown", {170, 170, 170}}
  };

  auto it = colors.find(icon_name);
  return (it != colors.end()) ? it->second : colors.at("unknown");
}
}

void ImageData::cleanup() {
  if (data) {
    switch (on_destroy) {
    case OnDestroy::FREE:
      free(data);
      break;
    case OnDestroy::STBI_FREE:
      stbi_image_free(data);
      break;
    case OnDestroy::NONE:
      break;
    }
    data = nullptr;
  }
}

ThumbnailPipeline::ThumbnailPipeline(const fs::path& library_root)
  : library_root_(library_root) {
}

std::string ThumbnailPipeline::thumbnail_relative_path(const std::string& asset_id) {
  return std::string(Config::DATABASE_DIRECTORY) + "/" + Config::THUMBNAIL_DIRECTORY + "/" +
    asset_id + Config::THUMBNAIL_EXTENSION;
}

std::string ThumbnailPipeline::type_icon_relative_path(const std::string& icon_name) {
  return std::string(Config::DATABASE_DIRECTORY) + "/" + Config::THUMBNAIL_DIRECTORY + "/" +
    Config::ICON_DIRECTORY + "/" + icon_name + Config::THUMBNAIL_EXTENSION;
}

bool ThumbnailPipeline::is_type_icon(const std::string& relative_path) {
  const std::string icon_prefix = std::string(Config::DATABASE_DIRECTORY) + "/" + Config::THUMBNAIL_DIRECTORY +
    "/" + Config::ICON_DIRECTORY + "/";
  return normalize_path_separators(relative_path).rfind(icon_prefix, 0) == 0;
}

fs::path ThumbnailPipeline::thumbnail_path_for(const std::string& asset_id) const {
  return library_root_ / fs::u8path(thumbnail_relative_path(asset_id));
}

std::optional<std::string> ThumbnailPipeline::generate(const fs::path& source_path, AssetKind kind,
  const std::string& asset_id, std::pair<int, int> target_size) {
  if (kind == AssetKind::Directory) {
    discard_stale_thumbnail(asset_id);
    return ensure_type_icon(DIRECTORY_ICON);
  }

  MediaType media_type = get_media_type(source_path.extension().u8string());
  if (media_type != MediaType::Image && media_type != MediaType::Video) {
    discard_stale_thumbnail(asset_id);
    return ensure_type_icon(get_media_type_string(media_type));
  }

  const fs::path thumbnail_path = thumbnail_path_for(asset_id);
  try {
    ImageData source = media_type == MediaType::Image ?
      load_image_data(source_path) : decode_first_video_frame(source_path);
    ImageData thumbnail = resize_to_fit(source, target_size.first, target_size.second);
    write_png(thumbnail, thumbnail_path);

    LOG_TRACE("[THUMBNAIL] Generated {} ({}x{} -> {}x{})", thumbnail_path.u8string(),
      source.width, source.height, thumbnail.width, thumbnail.height);
    return thumbnail_relative_path(asset_id);
  }
  catch (const ThumbnailGenerationException& e) {
    LOG_WARN("[THUMBNAIL] No preview for {}: {}", source_path.u8string(), e.what());
  }

  discard_stale_thumbnail(asset_id);
  return std::nullopt;
}

bool ThumbnailPipeline::remove_thumbnail(const std::string& asset_id) {
  const fs::path thumbnail_path = thumbnail_path_for(asset_id);
  std::error_code ec;
  if (!fs::exists(thumbnail_path, ec)) {
    LOG_DEBUG("[THUMBNAIL] No cached preview to delete for {}", asset_id);
    return true;
  }

  fs::remove(thumbnail_path, ec);
  if (ec) {
    LOG_WARN("[THUMBNAIL] Failed to delete {}: {}", thumbnail_path.u8string(), ec.message());
    return false;
  }
  LOG_TRACE("[THUMBNAIL] Deleted {}", thumbnail_path.u8string());
  return true;
}

ImageData ThumbnailPipeline::load_image_data(const fs::path& path, uint64_t max_pixels) {
  // Read through an fstream so non-ASCII paths work on every platform
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw ThumbnailGenerationException("Cannot open image " + path.u8string());
  }
  if (file.peek() == std::char_traits<char>::eof()) {
    throw ThumbnailGenerationException("Image file is empty: " + path.u8string());
  }

  const stbi_io_callbacks callbacks = {read_stream, skip_stream, stream_at_end};
  int width = 0;
  int height = 0;
  int channels_in_file = 0;
  if (!stbi_info_from_callbacks(&callbacks, &file, &width, &height, &channels_in_file)) {
    const char* reason = stbi_failure_reason();
    throw ThumbnailGenerationException("Failed to decode " + path.u8string() + ": " + (reason ? reason : "unknown error"));
  }
  if (static_cast<uint64_t>(width) * static_cast<uint64_t>(height) > max_pixels) {
    throw ThumbnailGenerationException("Image " + path.u8string() + " is too large to preview (" +
      std::to_string(width) + "x" + std::to_string(height) + ")");
  }

  file.clear();
  file.seekg(0, std::ios::beg);

  ImageData image;
  image.data = stbi_load_from_callbacks(&callbacks, &file, &image.width, &image.height, &channels_in_file,
    Config::THUMBNAIL_CHANNELS);
  if (!image.data) {
    const char* reason = stbi_failure_reason();
    throw ThumbnailGenerationException("Failed to decode " + path.u8string() + ": " + (reason ? reason : "unknown error"));
  }
  image.channels = Config::THUMBNAIL_CHANNELS;
  image.on_destroy = OnDestroy::STBI_FREE;
  return image;
}

ImageData ThumbnailPipeline::resize_to_fit(const ImageData& image, int max_width, int max_height) {
  if (!image.is_valid()) {
    throw ThumbnailGenerationException("Cannot resize an empty image");
  }
  if (max_width <= 0 || max_height <= 0) {
    throw ThumbnailGenerationException("Thumbnail target size must be positive");
  }

  const float ratio = std::min({1.0f,
    static_cast<float>(max_width) / static_cast<float>(image.width),
    static_cast<float>(max_height) / static_cast<float>(image.height)});
  const int new_width = std::max(1, static_cast<int>(static_cast<float>(image.width) * ratio));
  const int new_height = std::max(1, static_cast<int>(static_cast<float>(image.height) * ratio));

  ImageData resized;
  resized.width = new_width;
  resized.height = new_height;
  resized.channels = image.channels;
  resized.on_destroy = OnDestroy::FREE;
  const size_t byte_count = static_cast<size_t>(new_width) * new_height * image.channels;
  resized.data = static_cast<unsigned char*>(malloc(byte_count));
  if (!resized.data) {
    throw ThumbnailGenerationException("Out of memory resizing image");
  }

  if (new_width == image.width && new_height == image.height) {
    std::memcpy(resized.data, image.data, byte_count);
    return resized;
  }

  if (!stbir_resize_uint8(image.data, image.width, image.height, 0,
    resized.data, new_width, new_height, 0, image.channels)) {
    throw ThumbnailGenerationException("Failed to resize image");
  }
  return resized;
}

ImageData ThumbnailPipeline::create_type_icon_data(const std::string& icon_name, int size) {
  ImageData icon;
  icon.width = size;
  icon.height = size;
  icon.channels = 4;
  icon.on_destroy = OnDestroy::FREE;
  icon.data = static_cast<unsigned char*>(malloc(static_cast<size_t>(size) * size * 4));
  if (!icon.data) {
    throw ThumbnailGenerationException("Out of memory creating type icon");
  }

  // Flat tile in the type colour with a darker border
  const IconColor color = get_icon_color(icon_name);
  const int border = std::max(1, size / 16);
  for (int y = 0; y < size; y++) {
    for (int x = 0; x < size; x++) {
      const bool edge = x < border || y < border || x >= size - border || y >= size - border;
      unsigned char* pixel = icon.data + (static_cast<size_t>(y) * size + x) * 4;
      pixel[0] = edge ? static_cast<unsigned char>(color.r * 3 / 4) : color.r;
      pixel[1] = edge ? static_cast<unsigned char>(color.g * 3 / 4) : color.g;
      pixel[2] = edge ? static_cast<unsigned char>(color.b * 3 / 4) : color.b;
      pixel[3] = 255;
    }
  }
  return icon;
}

void ThumbnailPipeline::write_png(const ImageData& image, const fs::path& output_path) {
  if (!image.is_valid()) {
    throw ThumbnailGenerationException("Cannot encode an empty image");
  }

  std::error_code ec;
  fs::create_directories(output_path.parent_path(), ec);
  if (ec) {
    throw ThumbnailGenerationException("Failed to create thumbnail directory " +
      output_path.parent_path().u8string() + ": " + ec.message());
  }

  std::vector<unsigned char> encoded;
  stbi_write_png_compression_level = Config::THUMBNAIL_PNG_COMPRESSION_LEVEL;
  if (!stbi_write_png_to_func(append_to_buffer, &encoded, image.width, image.height, image.channels,
    image.data, image.width * image.channels)) {
    throw ThumbnailGenerationException("Failed to encode PNG for " + output_path.u8string());
  }

  fs::path temp_path = output_path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw ThumbnailGenerationException("Failed to open thumbnail output path: " + temp_path.u8string());
    }
    out.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
    if (!out.good()) {
      out.close();
      fs::remove(temp_path, ec);
      throw ThumbnailGenerationException("Failed to write thumbnail to disk: " + temp_path.u8string());
    }
  }

  fs::rename(temp_path, output_path, ec);
  if (ec) {
    std::string message = ec.message();
    fs::remove(temp_path, ec);
    throw ThumbnailGenerationException("Failed to move thumbnail into place at " + output_path.u8string() + ": " + message);
  }
}

std::optional<std::string> ThumbnailPipeline::ensure_type_icon(const std::string& icon_name) {
  const std::string relative_path = type_icon_relative_path(icon_name);
  const fs::path icon_path = library_root_ / fs::u8path(relative_path);

  std::error_code ec;
  if (fs::exists(icon_path, ec)) {
    return relative_path;
  }

  try {
    write_png(create_type_icon_data(icon_name, Config::TYPE_ICON_SIZE), icon_path);
    LOG_DEBUG("[THUMBNAIL] Created type icon {}", icon_path.u8string());
    return relative_path;
  }
  catch (const ThumbnailGenerationException& e) {
    LOG_WARN("[THUMBNAIL] Failed to create type icon '{}': {}", icon_name, e.what());
  }
  return std::nullopt;
}

void ThumbnailPipeline::discard_stale_thumbnail(const std::string& asset_id) {
  const fs::path thumbnail_path = thumbnail_path_for(asset_id);
  std::error_code ec;
  if (fs::exists(thumbnail_path, ec)) {
    if (!remove_thumbnail(asset_id)) {
      LOG_WARN("[THUMBNAIL] Stale preview left behind for {}", asset_id);
    }
  }
}
