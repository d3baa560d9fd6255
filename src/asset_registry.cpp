#include "asset_registry.h"

#include <algorithm>

#include "errors.h"
#include "logger.h"
#include "utils.h"

size_t AssetRegistry::rebuild(const std::vector<Asset>& assets) {
  clear();

  size_t dropped = 0;
  for (const auto& asset : assets) {
    if (assets_.count(asset.id) > 0) {
      LOG_WARN("[REGISTRY] Dropping record '{}': duplicate id {}", asset.name, asset.id);
      dropped++;
      continue;
    }
    if (library_paths_.count(asset.library_path) > 0) {
      LOG_WARN("[REGISTRY] Dropping record '{}': library path {} already in use", asset.name, asset.library_path);
      dropped++;
      continue;
    }

    order_.push_back(asset.id);
    library_paths_.insert(asset.library_path);
    assets_.emplace(asset.id, Entry{asset, build_search_text(asset)});
  }

  rebuild_category_index();
  LOG_DEBUG("[REGISTRY] Rebuilt index with {} assets", order_.size());
  return dropped;
}

void AssetRegistry::clear() {
  order_.clear();
  assets_.clear();
  category_index_.clear();
  library_paths_.clear();
}

bool AssetRegistry::insert(const Asset& asset) {
  if (asset.id.empty() || assets_.count(asset.id) > 0) {
    return false;
  }
  if (library_paths_.count(asset.library_path) > 0) {
    return false;
  }

  category_index_[asset.category].insert(order_.size());
  order_.push_back(asset.id);
  library_paths_.insert(asset.library_path);
  assets_.emplace(asset.id, Entry{asset, build_search_text(asset)});
  return true;
}

bool AssetRegistry::remove(const std::string& id) {
  auto it = assets_.find(id);
  if (it == assets_.end()) {
    return false;
  }

  library_paths_.erase(it->second.asset.library_path);
  assets_.erase(it);
  order_.erase(std::find(order_.begin(), order_.end(), id));

  // Positions after the removed one shift down
  rebuild_category_index();
  return true;
}

bool AssetRegistry::replace(const std::string& id, const Asset& asset) {
  auto it = assets_.find(id);
  if (it == assets_.end() || asset.id != id) {
    return false;
  }

  Asset& current = it->second.asset;
  if (asset.library_path != current.library_path) {
    if (library_paths_.count(asset.library_path) > 0) {
      return false;
    }
    library_paths_.erase(current.library_path);
    library_paths_.insert(asset.library_path);
  }

  const bool category_changed = asset.category != current.category;
  it->second = Entry{asset, build_search_text(asset)};
  if (category_changed) {
    rebuild_category_index();
  }
  return true;
}

const Asset& AssetRegistry::get_by_id(const std::string& id) const {
  const Asset* asset = find(id);
  if (!asset) {
    throw NotFoundError("Asset not found: " + id);
  }
  return *asset;
}

const Asset* AssetRegistry::find(const std::string& id) const {
  auto it = assets_.find(id);
  return it != assets_.end() ? &it->second.asset : nullptr;
}

bool AssetRegistry::has_library_path(const std::string& library_path) const {
  return library_paths_.count(library_path) > 0;
}

std::vector<Asset> AssetRegistry::search(const std::string& keyword,
  const std::optional<std::string>& category) const {
  const std::string needle = to_lowercase(trim_string(keyword));

  std::vector<Asset> results;
  for (const auto& id : order_) {
    const Entry& entry = assets_.at(id);
    if (category && entry.asset.category != *category) {
      continue;
    }
    if (needle.empty() || entry.search_text.find(needle) != std::string::npos) {
      results.push_back(entry.asset);
    }
  }
  return results;
}

std::vector<Asset> AssetRegistry::filter_by_category(const std::string& category) const {
  std::vector<Asset> results;
  auto it = category_index_.find(category);
  if (it == category_index_.end()) {
    return results;
  }

  results.reserve(it->second.size());
  for (size_t position : it->second) {
    results.push_back(assets_.at(order_[position]).asset);
  }
  return results;
}

std::vector<std::string> AssetRegistry::ids_in_category(const std::string& category) const {
  std::vector<std::string> ids;
  auto it = category_index_.find(category);
  if (it != category_index_.end()) {
    for (size_t position : it->second) {
      ids.push_back(order_[position]);
    }
  }
  return ids;
}

std::vector<Asset> AssetRegistry::all() const {
  std::vector<Asset> results;
  results.reserve(order_.size());
  for (const auto& id : order_) {
    results.push_back(assets_.at(id).asset);
  }
  return results;
}

std::string AssetRegistry::build_search_text(const Asset& asset) {
  // Newline separators keep single-line keywords from matching across fields
  std::string text = to_lowercase(asset.name);
  text += '\n';
  text += to_lowercase(asset.description);
  for (const auto& tag : asset.tags) {
    text += '\n';
    text += to_lowercase(tag);
  }
  return text;
}

void AssetRegistry::rebuild_category_index() {
  category_index_.clear();
  for (size_t i = 0; i < order_.size(); i++) {
    category_index_[assets_.at(order_[i]).asset.category].insert(i);
  }
}
