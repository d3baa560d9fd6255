#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "asset.h"

// In-memory index over the live asset collection.
// Derived from the metadata store and rebuildable from it at any time.
// Not synchronized: callers serialize mutations against reads.
class AssetRegistry {
public:
  AssetRegistry() = default;
  virtual ~AssetRegistry() = default;

  // Replaces the whole index. Records repeating an id or library path already
  // seen are dropped (first wins); returns how many were dropped.
  size_t rebuild(const std::vector<Asset>& assets);
  void clear();

  // Returns false if the id or library path is already taken
  bool insert(const Asset& asset);
  // Returns false if the id is unknown
  bool remove(const std::string& id);
  // Replaces the record in place, keeping its insertion position.
  // Returns false if the id is unknown, the replacement changes the id,
  // or its library path collides with another asset.
  bool replace(const std::string& id, const Asset& asset);

  // Throws NotFoundError for an unknown id
  const Asset& get_by_id(const std::string& id) const;
  const Asset* find(const std::string& id) const;
  bool contains(const std::string& id) const { return assets_.count(id) > 0; }
  bool has_library_path(const std::string& library_path) const;

  // Case-insensitive substring match on name, description and tags, in insertion order.
  // A keyword that is empty after trimming matches everything.
  std::vector<Asset> search(const std::string& keyword,
    const std::optional<std::string>& category = std::nullopt) const;
  // Exact category match in insertion order; an unknown category yields nothing
  std::vector<Asset> filter_by_category(const std::string& category) const;
  std::vector<std::string> ids_in_category(const std::string& category) const;

  std::vector<Asset> all() const;
  size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

private:
  struct Entry {
    Asset asset;
    std::string search_text; // Lowercased name, description and tags, separated by '\n'
  };

  std::vector<std::string> order_;                                  // Ids in insertion order
  std::unordered_map<std::string, Entry> assets_;                   // Id to record
  std::unordered_map<std::string, std::set<size_t>> category_index_; // Category to positions in order_
  std::unordered_set<std::string> library_paths_;

  static std::string build_search_text(const Asset& asset);
  void rebuild_category_index();
};
