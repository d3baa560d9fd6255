#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "asset.h"
#include "config.h"

// Everything the store persists for one library
struct StoreSnapshot {
  std::vector<Asset> assets;            // Insertion order
  std::vector<std::string> categories;  // Unique, case-sensitive
  std::vector<std::string> retired_ids; // Ids of removed assets, never handed out again
};

// Durable snapshot persistence of one library, as a single JSON document at
// {library_root}/.asset_db/assets.json
class MetadataStore {
public:
  static constexpr int FORMAT_VERSION = 1;

  explicit MetadataStore(const std::filesystem::path& library_root,
    int backup_count = Config::CONFIG_DEFAULT_STORE_BACKUP_COUNT);
  virtual ~MetadataStore() = default;

  // Reads the document. A missing document is an empty library.
  // Throws CorruptStoreError if the document cannot be parsed; malformed
  // individual records are skipped with an error log.
  virtual StoreSnapshot load();

  // Writes the full snapshot to a temporary file and renames it over the
  // previous document. Throws PersistenceError if the media is not writable.
  virtual void save(const std::vector<Asset>& assets, const std::vector<std::string>& categories,
    const std::vector<std::string>& retired_ids = {});

  bool exists() const;
  const std::filesystem::path& library_root() const { return library_root_; }
  std::filesystem::path store_path() const { return Config::get_store_path(library_root_); }

  // Serialization, exposed for tests and tooling
  static std::string serialize(const std::vector<Asset>& assets, const std::vector<std::string>& categories,
    const std::vector<std::string>& retired_ids);
  static StoreSnapshot deserialize(const std::string& document);

private:
  std::filesystem::path library_root_;
  int backup_count_;

  // Best-effort timestamped copy of the document just written
  void write_backup(const std::string& document) const;
  void rotate_backups() const;
};
