#include "metadata_store.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include <json/json.h>

#include "errors.h"
#include "logger.h"
#include "utils.h"

namespace fs = std::filesystem;

namespace {
constexpr const char* KEY_VERSION = "version";
constexpr const char* KEY_ASSETS = "assets";
constexpr const char* KEY_CATEGORIES = "categories";
constexpr const char* KEY_RETIRED_IDS = "retired_ids";

Json::Value asset_to_json(const Asset& asset) {
  Json::Value record(Json::objectValue);
  record["id"] = asset.id;
  record["name"] = asset.name;
  record["asset_type"] = get_asset_kind_string(asset.kind);
  record["path"] = asset.library_path;
  record["category"] = asset.category;
  record["thumbnail_path"] = asset.thumbnail_path ? Json::Value(*asset.thumbnail_path) : Json::Value(Json::nullValue);
  record["description"] = asset.description;

  Json::Value tags(Json::arrayValue);
  for (const auto& tag : asset.tags) {
    tags.append(tag);
  }
  record["tags"] = tags;

  record["size"] = Json::Value(static_cast<Json::UInt64>(asset.size));
  record["created_at"] = format_timestamp(asset.created_at);
  record["updated_at"] = format_timestamp(asset.updated_at);
  return record;
}

// Returns false (and logs why) for records that cannot be turned into an Asset
bool asset_from_json(const Json::Value& record, Asset& asset) {
  if (!record.isObject()) {
    LOG_ERROR("Skipping asset record that is not an object");
    return false;
  }

  const Json::Value& id = record["id"];
  const Json::Value& name = record["name"];
  const Json::Value& kind = record["asset_type"];
  const Json::Value& path = record["path"];
  if (!id.isString() || id.asString().empty() || !name.isString() || !kind.isString() ||
    !path.isString() || path.asString().empty()) {
    LOG_ERROR("Skipping asset record with missing id, name, asset_type or path");
    return false;
  }

  // Ids name per-asset files and paths are resolved against the library root
  if (!is_plain_file_stem(id.asString())) {
    LOG_ERROR("Skipping asset record with unusable id '{}'", id.asString());
    return false;
  }
  if (!is_contained_relative_path(path.asString())) {
    LOG_ERROR("Skipping asset {}: path '{}' points outside the library", id.asString(), path.asString());
    return false;
  }

  std::optional<AssetKind> parsed_kind = get_asset_kind_from_string(kind.asString());
  if (!parsed_kind) {
    LOG_ERROR("Skipping asset {}: unknown asset_type '{}'", id.asString(), kind.asString());
    return false;
  }

  asset.id = id.asString();
  asset.name = name.asString();
  asset.kind = *parsed_kind;
  asset.library_path = normalize_path_separators(path.asString());
  asset.category = record.get("category", "").isString() ? record.get("category", "").asString() : "";
  asset.description = record.get("description", "").isString() ? record.get("description", "").asString() : "";

  const Json::Value& thumbnail = record["thumbnail_path"];
  if (thumbnail.isString() && !thumbnail.asString().empty()) {
    if (is_contained_relative_path(thumbnail.asString())) {
      asset.thumbnail_path = normalize_path_separators(thumbnail.asString());
    }
    else {
      LOG_WARN("Asset {}: ignoring thumbnail_path '{}' outside the library", asset.id, thumbnail.asString());
    }
  }

  const Json::Value& tags = record["tags"];
  if (tags.isArray()) {
    for (const auto& tag : tags) {
      if (tag.isString()) {
        asset.tags.insert(tag.asString());
      }
    }
  }

  const Json::Value& size = record["size"];
  asset.size = size.isUInt64() ? size.asUInt64() : 0;

  const Json::Value& created = record["created_at"];
  std::optional<time_point> created_at = created.isString() ? parse_timestamp(created.asString()) : std::nullopt;
  if (!created_at) {
    LOG_WARN("Asset {} has an invalid created_at, using the current time", asset.id);
    created_at = current_timestamp();
  }
  asset.created_at = *created_at;

  const Json::Value& updated = record["updated_at"];
  std::optional<time_point> updated_at = updated.isString() ? parse_timestamp(updated.asString()) : std::nullopt;
  asset.updated_at = updated_at ? *updated_at : asset.created_at;

  return true;
}

std::string backup_timestamp() {
  auto now = current_timestamp();
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::time_t time_t_value = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  safe_gmtime(&tm_buf, &time_t_value);

  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_' << std::setw(3) << std::setfill('0') << millis;
  return ss.str();
}
}

MetadataStore::MetadataStore(const fs::path& library_root, int backup_count)
  : library_root_(library_root), backup_count_(std::max(0, backup_count)) {
}

bool MetadataStore::exists() const {
  std::error_code ec;
  return fs::exists(store_path(), ec);
}

std::string MetadataStore::serialize(const std::vector<Asset>& assets, const std::vector<std::string>& categories,
  const std::vector<std::string>& retired_ids) {
  Json::Value root(Json::objectValue);
  root[KEY_VERSION] = FORMAT_VERSION;

  Json::Value asset_records(Json::arrayValue);
  for (const auto& asset : assets) {
    asset_records.append(asset_to_json(asset));
  }
  root[KEY_ASSETS] = asset_records;

  Json::Value category_list(Json::arrayValue);
  for (const auto& category : categories) {
    category_list.append(category);
  }
  root[KEY_CATEGORIES] = category_list;

  Json::Value retired(Json::arrayValue);
  for (const auto& id : retired_ids) {
    retired.append(id);
  }
  root[KEY_RETIRED_IDS] = retired;

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  writer["emitUTF8"] = true;
  return Json::writeString(writer, root);
}

StoreSnapshot MetadataStore::deserialize(const std::string& document) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  std::istringstream stream(document);
  if (!Json::parseFromStream(builder, stream, &root, &errors)) {
    throw CorruptStoreError("Metadata store is not valid JSON: " + errors);
  }
  if (!root.isObject()) {
    throw CorruptStoreError("Metadata store root is not an object");
  }

  const Json::Value& asset_records = root[KEY_ASSETS];
  const Json::Value& category_list = root[KEY_CATEGORIES];
  const Json::Value& retired = root[KEY_RETIRED_IDS];
  if (!asset_records.isNull() && !asset_records.isArray()) {
    throw CorruptStoreError("Metadata store 'assets' is not an array");
  }
  if (!category_list.isNull() && !category_list.isArray()) {
    throw CorruptStoreError("Metadata store 'categories' is not an array");
  }
  if (!retired.isNull() && !retired.isArray()) {
    throw CorruptStoreError("Metadata store 'retired_ids' is not an array");
  }

  StoreSnapshot snapshot;

  std::unordered_set<std::string> seen_categories;
  for (const auto& category : category_list) {
    if (!category.isString() || category.asString().empty()) {
      LOG_WARN("Skipping invalid category entry in metadata store");
      continue;
    }
    if (seen_categories.insert(category.asString()).second) {
      snapshot.categories.push_back(category.asString());
    }
  }

  for (const auto& record : asset_records) {
    Asset asset;
    if (asset_from_json(record, asset)) {
      snapshot.assets.push_back(std::move(asset));
    }
  }

  for (const auto& id : retired) {
    if (id.isString()) {
      snapshot.retired_ids.push_back(id.asString());
    }
  }

  return snapshot;
}

StoreSnapshot MetadataStore::load() {
  fs::path path = store_path();
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    LOG_INFO("No metadata store at {}, starting with an empty library", path.u8string());
    return StoreSnapshot{};
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw CorruptStoreError("Cannot open metadata store " + path.u8string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  StoreSnapshot snapshot = deserialize(buffer.str());
  LOG_INFO("Loaded {} assets and {} categories from {}", snapshot.assets.size(), snapshot.categories.size(),
    path.u8string());
  return snapshot;
}

void MetadataStore::save(const std::vector<Asset>& assets, const std::vector<std::string>& categories,
  const std::vector<std::string>& retired_ids) {
  fs::path path = store_path();
  fs::path temp_path = path;
  temp_path += ".tmp";

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw PersistenceError("Failed to create " + path.parent_path().u8string() + ": " + ec.message());
  }

  std::string document = serialize(assets, categories, retired_ids);

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      throw PersistenceError("Failed to open " + temp_path.u8string() + " for writing");
    }
    file.write(document.data(), static_cast<std::streamsize>(document.size()));
    file.flush();
    if (!file) {
      file.close();
      fs::remove(temp_path, ec);
      throw PersistenceError("Failed to write " + temp_path.u8string());
    }
  }

  // rename() replaces the previous document atomically, a crash leaves either the old or the new one
  fs::rename(temp_path, path, ec);
  if (ec) {
    std::string message = ec.message();
    fs::remove(temp_path, ec);
    throw PersistenceError("Failed to replace " + path.u8string() + ": " + message);
  }

  LOG_DEBUG("Saved {} assets and {} categories to {}", assets.size(), categories.size(), path.u8string());

  if (backup_count_ > 0) {
    write_backup(document);
  }
}

void MetadataStore::write_backup(const std::string& document) const {
  fs::path backup_dir = Config::get_backup_directory(library_root_);
  std::error_code ec;
  fs::create_directories(backup_dir, ec);
  if (ec) {
    LOG_WARN("Failed to create backup directory {}: {}", backup_dir.u8string(), ec.message());
    return;
  }

  fs::path backup_path = backup_dir / ("assets_" + backup_timestamp() + ".json");
  std::ofstream file(backup_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    LOG_WARN("Failed to open backup {}", backup_path.u8string());
    return;
  }
  file.write(document.data(), static_cast<std::streamsize>(document.size()));
  file.close();
  if (!file) {
    LOG_WARN("Failed to write backup {}", backup_path.u8string());
    return;
  }
  LOG_TRACE("Wrote metadata backup {}", backup_path.u8string());

  rotate_backups();
}

void MetadataStore::rotate_backups() const {
  fs::path backup_dir = Config::get_backup_directory(library_root_);
  std::vector<fs::path> backups;

  std::error_code ec;
  for (fs::directory_iterator it(backup_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::string file_name = it->path().filename().u8string();
    if (file_name.rfind("assets_", 0) == 0 && it->path().extension() == ".json") {
      backups.push_back(it->path());
    }
  }
  if (ec) {
    LOG_WARN("Failed to list backups in {}: {}", backup_dir.u8string(), ec.message());
    return;
  }

  if (backups.size() <= static_cast<size_t>(backup_count_)) {
    return;
  }

  // Timestamped names sort chronologically; keep the newest
  std::sort(backups.begin(), backups.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().u8string() > b.filename().u8string();
  });
  for (size_t i = static_cast<size_t>(backup_count_); i < backups.size(); i++) {
    fs::remove(backups[i], ec);
    if (ec) {
      LOG_WARN("Failed to delete old backup {}: {}", backups[i].u8string(), ec.message());
    }
  }
}
