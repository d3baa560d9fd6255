#include "config.h"

#include <fstream>
#include <system_error>

#include <json/json.h>

#include "logger.h"
#include "utils.h"

namespace fs = std::filesystem;

namespace {
std::string load_string_setting(const Json::Value& root, const char* key, const std::string& default_value) {
  if (!root.isMember(key)) {
    return default_value;
  }
  const Json::Value& value = root[key];
  if (!value.isString()) {
    LOG_WARN("Invalid config value for key {}, expected a string", key);
    return default_value;
  }
  return value.asString();
}

bool load_bool_setting(const Json::Value& root, const char* key, bool default_value) {
  if (!root.isMember(key)) {
    return default_value;
  }
  const Json::Value& value = root[key];
  if (!value.isBool()) {
    LOG_WARN("Invalid config value for key {}, expected a boolean", key);
    return default_value;
  }
  return value.asBool();
}

int load_int_setting(const Json::Value& root, const char* key, int default_value) {
  if (!root.isMember(key)) {
    return default_value;
  }
  const Json::Value& value = root[key];
  if (!value.isInt()) {
    LOG_WARN("Invalid config value for key {}, expected an integer", key);
    return default_value;
  }
  return value.asInt();
}
}

Config::Config()
  : default_category_(CONFIG_DEFAULT_CATEGORY),
  auto_generate_thumbnail_(CONFIG_DEFAULT_AUTO_GENERATE_THUMBNAIL),
  thumbnail_width_(CONFIG_DEFAULT_THUMBNAIL_WIDTH),
  thumbnail_height_(CONFIG_DEFAULT_THUMBNAIL_HEIGHT),
  store_backup_count_(CONFIG_DEFAULT_STORE_BACKUP_COUNT) {
}

Config Config::load(const fs::path& config_path) {
  Config config;
  config.config_path_ = config_path;

  std::ifstream file(config_path, std::ios::binary);
  if (!file.is_open()) {
    LOG_INFO("No configuration file at {}, using defaults", config_path.u8string());
    return config;
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, file, &root, &errors)) {
    LOG_WARN("Failed to parse configuration file {}: {}", config_path.u8string(), errors);
    return config;
  }
  if (!root.isObject()) {
    LOG_WARN("Configuration file {} is not a JSON object, using defaults", config_path.u8string());
    return config;
  }

  config.asset_library_path_ = load_string_setting(root, CONFIG_KEY_ASSET_LIBRARY_PATH, "");
  if (!config.set_default_category(load_string_setting(root, CONFIG_KEY_DEFAULT_CATEGORY, CONFIG_DEFAULT_CATEGORY))) {
    LOG_WARN("Empty default category in configuration, using '{}'", CONFIG_DEFAULT_CATEGORY);
  }
  config.auto_generate_thumbnail_ = load_bool_setting(root, CONFIG_KEY_AUTO_GENERATE_THUMBNAIL,
    CONFIG_DEFAULT_AUTO_GENERATE_THUMBNAIL);

  if (root.isMember(CONFIG_KEY_THUMBNAIL_SIZE)) {
    const Json::Value& size = root[CONFIG_KEY_THUMBNAIL_SIZE];
    bool valid = size.isArray() && size.size() == 2 && size[0].isInt() && size[1].isInt() &&
      config.set_thumbnail_size(size[0].asInt(), size[1].asInt());
    if (!valid) {
      LOG_WARN("Invalid config value for key {}, expected two positive integers", CONFIG_KEY_THUMBNAIL_SIZE);
    }
  }

  if (!config.set_store_backup_count(load_int_setting(root, CONFIG_KEY_STORE_BACKUP_COUNT,
    CONFIG_DEFAULT_STORE_BACKUP_COUNT))) {
    LOG_WARN("Negative {} in configuration, using {}", CONFIG_KEY_STORE_BACKUP_COUNT, CONFIG_DEFAULT_STORE_BACKUP_COUNT);
  }

  LOG_DEBUG("Loaded configuration from {}", config_path.u8string());
  return config;
}

bool Config::save() const {
  if (config_path_.empty()) {
    LOG_WARN("Configuration has no file path, not saving");
    return false;
  }

  Json::Value root(Json::objectValue);
  root[CONFIG_KEY_ASSET_LIBRARY_PATH] = asset_library_path_;
  root[CONFIG_KEY_DEFAULT_CATEGORY] = default_category_;
  root[CONFIG_KEY_AUTO_GENERATE_THUMBNAIL] = auto_generate_thumbnail_;
  Json::Value size(Json::arrayValue);
  size.append(thumbnail_width_);
  size.append(thumbnail_height_);
  root[CONFIG_KEY_THUMBNAIL_SIZE] = size;
  root[CONFIG_KEY_STORE_BACKUP_COUNT] = store_backup_count_;

  std::error_code ec;
  if (config_path_.has_parent_path()) {
    fs::create_directories(config_path_.parent_path(), ec);
    if (ec) {
      LOG_WARN("Failed to create configuration directory {}: {}", config_path_.parent_path().u8string(), ec.message());
      return false;
    }
  }

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  std::ofstream file(config_path_, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    LOG_WARN("Failed to open configuration file {} for writing", config_path_.u8string());
    return false;
  }
  file << Json::writeString(writer, root) << '\n';
  file.close();
  if (!file) {
    LOG_WARN("Failed to write configuration file {}", config_path_.u8string());
    return false;
  }

  LOG_DEBUG("Saved configuration to {}", config_path_.u8string());
  return true;
}

bool Config::set_default_category(const std::string& category) {
  std::string trimmed = trim_string(category);
  if (trimmed.empty()) {
    return false;
  }
  default_category_ = trimmed;
  return true;
}

bool Config::set_thumbnail_size(int width, int height) {
  if (width <= 0 || height <= 0) {
    return false;
  }
  thumbnail_width_ = width;
  thumbnail_height_ = height;
  return true;
}

bool Config::set_store_backup_count(int count) {
  if (count < 0) {
    return false;
  }
  store_backup_count_ = count;
  return true;
}
