#include "asset_manager.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "errors.h"
#include "logger.h"
#include "utils.h"

namespace fs = std::filesystem;

namespace {
constexpr size_t ID_SUFFIX_LENGTH = 8;

// updated_at must move forward even when two mutations land in the same millisecond
time_point next_update_time(const time_point& previous) {
  time_point now = current_timestamp();
  return now > previous ? now : previous + std::chrono::milliseconds(1);
}

bool is_within(const fs::path& path, const fs::path& base) {
  std::error_code ec;
  fs::path canonical_path = fs::weakly_canonical(path, ec);
  if (ec) {
    return false;
  }
  fs::path canonical_base = fs::weakly_canonical(base, ec);
  if (ec) {
    return false;
  }

  auto path_it = canonical_path.begin();
  for (auto base_it = canonical_base.begin(); base_it != canonical_base.end(); ++base_it, ++path_it) {
    if (base_it->empty()) {
      continue;
    }
    if (path_it == canonical_path.end() || *path_it != *base_it) {
      return false;
    }
  }
  return true;
}

// Lexical containment: target names an entry strictly below directory
bool is_below(const fs::path& target, const fs::path& directory) {
  const fs::path relative = target.lexically_normal().lexically_relative(directory.lexically_normal());
  return !relative.empty() && relative != "." && *relative.begin() != "..";
}

// Record paths must name an entry inside the content directory
bool is_content_path(const std::string& library_path) {
  return is_contained_relative_path(library_path) &&
    is_below(fs::u8path(library_path), fs::u8path(Config::CONTENT_DIRECTORY));
}

fs::path source_name_path(const fs::path& source_path) {
  return source_path.has_filename() ? source_path : source_path.parent_path();
}
}

AssetManager::AssetManager(Config& config, StoreFactory store_factory, ThumbnailFactory thumbnail_factory)
  : config_(config), store_factory_(std::move(store_factory)), thumbnail_factory_(std::move(thumbnail_factory)) {
  if (!store_factory_) {
    store_factory_ = [this](const fs::path& library_root) {
      return std::make_unique<MetadataStore>(library_root, config_.store_backup_count());
    };
  }
  if (!thumbnail_factory_) {
    thumbnail_factory_ = [](const fs::path& library_root) {
      return std::make_unique<ThumbnailPipeline>(library_root);
    };
  }
}

bool AssetManager::open() {
  if (config_.asset_library_path().empty()) {
    LOG_INFO("No asset library configured yet");
    return false;
  }
  open_library(fs::u8path(config_.asset_library_path()));
  return true;
}

// =============================================================================
// ASSETS
// =============================================================================

Asset AssetManager::add_asset(const AddAssetRequest& request, const ProgressCallback& progress,
  const std::atomic<bool>* cancel) {
  require_open();

  // Validate the request before touching the library
  std::error_code ec;
  const fs::path source = source_name_path(request.source_path);
  if (source.empty() || !fs::exists(source, ec)) {
    throw ValidationError("Source path does not exist: " + request.source_path.u8string());
  }

  const bool is_directory = fs::is_directory(source, ec);
  if (!is_directory && !fs::is_regular_file(source, ec)) {
    throw ValidationError("Source is neither a file nor a directory: " + source.u8string());
  }
  if (is_directory && is_within(*library_root_, source)) {
    throw ValidationError("Cannot import a folder that contains the asset library: " + source.u8string());
  }

  std::string name = source.filename().u8string();
  if (request.name) {
    name = trim_string(*request.name);
    if (name.empty()) {
      throw ValidationError("Asset name must not be empty");
    }
  }

  std::string category = default_category();
  if (request.category) {
    if (!has_category(*request.category)) {
      throw ValidationError("Unknown category: " + *request.category);
    }
    category = *request.category;
  }

  if (!is_directory) {
    std::ifstream readable(source, std::ios::binary);
    if (!readable.is_open()) {
      throw ImportError("Source file is not readable: " + source.u8string());
    }
  }

  const uint64_t source_size = calculate_content_size(source);
  const fs::space_info library_space = fs::space(*library_root_, ec);
  if (!ec && library_space.available < source_size) {
    throw ImportError("Not enough space in the asset library for " + source.u8string() + " (" +
      format_file_size(source_size) + " needed, " + format_file_size(library_space.available) + " available)");
  }

  const std::string asset_id = generate_asset_id();
  const fs::path target = choose_target_path(source, asset_id);

  LOG_INFO("Importing {} -> {}", source.u8string(), target.u8string());

  // Anything thrown from here on, a caller callback included, undoes the import
  Asset asset;
  bool inserted = false;
  try {
    copy_content(source, target, progress, cancel);
    if (cancel && cancel->load()) {
      throw ImportCancelledError("Import cancelled: " + source.u8string());
    }

    asset.id = asset_id;
    asset.name = name;
    asset.category = category;
    asset.kind = is_directory ? AssetKind::Directory : AssetKind::File;
    asset.library_path = std::string(Config::CONTENT_DIRECTORY) + "/" + target.filename().u8string();
    asset.description = request.description;
    asset.tags = request.tags;
    asset.size = calculate_content_size(target);
    asset.created_at = current_timestamp();
    asset.updated_at = asset.created_at;

    if (config_.auto_generate_thumbnail()) {
      if (progress) {
        progress(0, 1, "Generating thumbnail");
      }
      asset.thumbnail_path = make_thumbnail(asset);
    }

    if (!registry_.insert(asset)) {
      throw ImportError("Library slot already taken: " + asset.library_path);
    }
    inserted = true;

    if (progress) {
      progress(0, 1, "Saving library");
    }
    persist();
  }
  catch (...) {
    if (inserted) {
      registry_.remove(asset_id);
    }
    discard_content(target);
    thumbnails_->remove_thumbnail(asset_id);
    throw;
  }

  write_document(asset);

  if (progress) {
    progress(1, 1, "Import complete");
  }
  LOG_INFO("Added asset '{}' ({}, {}) to category '{}'", asset.name, get_asset_kind_string(asset.kind),
    format_file_size(asset.size), asset.category);
  return asset;
}

void AssetManager::remove_asset(const std::string& id) {
  require_open();
  const Asset asset = registry_.get_by_id(id);

  const std::vector<Asset> before = registry_.all();
  std::vector<std::string> retired_ids = retired_ids_;
  retired_ids.push_back(id);

  registry_.remove(id);
  try {
    persist(categories_, retired_ids);
  }
  catch (const PersistenceError&) {
    registry_.rebuild(before);
    throw;
  }
  retired_ids_ = std::move(retired_ids);

  discard_content(resolve_library_path(asset));
  if (!thumbnails_->remove_thumbnail(id)) {
    LOG_WARN("Preview of removed asset '{}' could not be deleted", asset.name);
  }
  remove_document(id);

  LOG_INFO("Removed asset '{}' ({})", asset.name, id);
}

Asset AssetManager::update_asset(const std::string& id, const AssetPatch& patch) {
  require_open();
  const Asset current = registry_.get_by_id(id);

  if (patch.name && trim_string(*patch.name).empty()) {
    throw ValidationError("Asset name must not be empty");
  }
  if (patch.category && !has_category(*patch.category)) {
    throw ValidationError("Unknown category: " + *patch.category);
  }
  if (patch.empty()) {
    LOG_DEBUG("Empty update for asset {}, nothing to do", id);
    return current;
  }

  Asset updated = current;
  if (patch.name) {
    updated.name = trim_string(*patch.name);
  }
  if (patch.category) {
    updated.category = *patch.category;
  }
  if (patch.description) {
    updated.description = *patch.description;
  }
  if (patch.tags) {
    updated.tags = *patch.tags;
  }
  updated.updated_at = next_update_time(current.updated_at);

  registry_.replace(id, updated);
  try {
    persist();
  }
  catch (const PersistenceError&) {
    registry_.replace(id, current);
    throw;
  }

  LOG_INFO("Updated asset '{}' ({})", updated.name, id);
  return updated;
}

Asset AssetManager::refresh_asset(const std::string& id) {
  require_open();
  const Asset current = registry_.get_by_id(id);

  std::error_code ec;
  const fs::path content = resolve_library_path(current);
  if (!fs::exists(content, ec)) {
    throw ImportError("Content of asset '" + current.name + "' is missing: " + content.u8string());
  }

  Asset refreshed = current;
  refreshed.size = calculate_content_size(content);
  if (config_.auto_generate_thumbnail()) {
    refreshed.thumbnail_path = make_thumbnail(refreshed);
  }
  refreshed.updated_at = next_update_time(current.updated_at);

  registry_.replace(id, refreshed);
  try {
    persist();
  }
  catch (const PersistenceError&) {
    registry_.replace(id, current);
    throw;
  }

  LOG_INFO("Refreshed asset '{}' ({})", refreshed.name, format_file_size(refreshed.size));
  return refreshed;
}

Asset AssetManager::regenerate_thumbnail(const std::string& id) {
  require_open();
  const Asset current = registry_.get_by_id(id);

  Asset updated = current;
  updated.thumbnail_path = make_thumbnail(updated);
  updated.updated_at = next_update_time(current.updated_at);

  registry_.replace(id, updated);
  try {
    persist();
  }
  catch (const PersistenceError&) {
    registry_.replace(id, current);
    throw;
  }

  LOG_INFO("Regenerated thumbnail for '{}': {}", updated.name, updated.thumbnail_path.value_or("none"));
  return updated;
}

Asset AssetManager::get_asset(const std::string& id) const {
  return registry_.get_by_id(id);
}

std::vector<Asset> AssetManager::get_all_assets(const std::optional<std::string>& category) const {
  return category ? registry_.filter_by_category(*category) : registry_.all();
}

std::vector<std::string> AssetManager::get_all_asset_names() const {
  std::vector<std::string> names;
  for (const auto& asset : registry_.all()) {
    names.push_back(asset.name);
  }
  return names;
}

std::vector<Asset> AssetManager::search_assets(const std::string& keyword,
  const std::optional<std::string>& category) const {
  return registry_.search(keyword, category);
}

std::vector<Asset> AssetManager::filter_by_category(const std::string& category) const {
  return registry_.filter_by_category(category);
}

std::vector<Asset> AssetManager::sort_assets(std::vector<Asset> assets, SortOrder order) {
  auto by_name = [](const Asset& a, const Asset& b) {
    return to_lowercase(a.name) < to_lowercase(b.name);
  };
  auto by_category = [&by_name](const Asset& a, const Asset& b) {
    std::string category_a = to_lowercase(a.category);
    std::string category_b = to_lowercase(b.category);
    if (category_a != category_b) {
      return category_a < category_b;
    }
    return by_name(a, b);
  };

  switch (order) {
  case SortOrder::NewestFirst:
    std::stable_sort(assets.begin(), assets.end(), [](const Asset& a, const Asset& b) {
      return a.created_at > b.created_at;
    });
    break;
  case SortOrder::OldestFirst:
    std::stable_sort(assets.begin(), assets.end(), [](const Asset& a, const Asset& b) {
      return a.created_at < b.created_at;
    });
    break;
  case SortOrder::NameAscending:
    std::stable_sort(assets.begin(), assets.end(), by_name);
    break;
  case SortOrder::NameDescending:
    std::stable_sort(assets.begin(), assets.end(), [&by_name](const Asset& a, const Asset& b) {
      return by_name(b, a);
    });
    break;
  case SortOrder::CategoryAscending:
    std::stable_sort(assets.begin(), assets.end(), by_category);
    break;
  case SortOrder::CategoryDescending:
    // Reverses the whole (category, name) key, names run Z-A inside each category
    std::stable_sort(assets.begin(), assets.end(), [&by_category](const Asset& a, const Asset& b) {
      return by_category(b, a);
    });
    break;
  }
  return assets;
}

fs::path AssetManager::resolve_library_path(const Asset& asset) const {
  require_open();
  return *library_root_ / fs::u8path(asset.library_path);
}

std::optional<fs::path> AssetManager::resolve_thumbnail_path(const Asset& asset) const {
  if (!asset.thumbnail_path) {
    return std::nullopt;
  }
  require_open();
  return *library_root_ / fs::u8path(*asset.thumbnail_path);
}

std::optional<fs::path> AssetManager::resolve_document_path(const Asset& asset) const {
  require_open();
  std::error_code ec;
  fs::path document_path = document_path_for(asset.id);
  if (!fs::exists(document_path, ec)) {
    return std::nullopt;
  }
  return document_path;
}

// =============================================================================
// CATEGORIES
// =============================================================================

void AssetManager::add_category(const std::string& name) {
  require_open();
  const std::string category = trim_string(name);
  if (category.empty()) {
    throw ValidationError("Category name must not be empty");
  }
  if (has_category(category)) {
    throw DuplicateError("Category already exists: " + category);
  }

  std::vector<std::string> categories = categories_;
  categories.push_back(category);
  persist(categories, retired_ids_);
  categories_ = std::move(categories);

  LOG_INFO("Added category '{}'", category);
}

void AssetManager::remove_category(const std::string& name) {
  require_open();
  if (name == default_category()) {
    throw ProtectedCategoryError("The default category '" + name + "' cannot be removed");
  }
  if (!has_category(name)) {
    throw NotFoundError("Category not found: " + name);
  }

  const std::vector<Asset> before = registry_.all();
  const std::vector<std::string> member_ids = registry_.ids_in_category(name);
  for (const auto& id : member_ids) {
    Asset member = registry_.get_by_id(id);
    member.category = default_category();
    member.updated_at = next_update_time(member.updated_at);
    registry_.replace(id, member);
  }

  std::vector<std::string> categories = categories_;
  categories.erase(std::remove(categories.begin(), categories.end(), name), categories.end());
  try {
    persist(categories, retired_ids_);
  }
  catch (const PersistenceError&) {
    registry_.rebuild(before);
    throw;
  }
  categories_ = std::move(categories);

  LOG_INFO("Removed category '{}', {} assets moved to '{}'", name, member_ids.size(), default_category());
}

// =============================================================================
// LIBRARY ROOT
// =============================================================================

void AssetManager::set_library_path(const fs::path& path) {
  if (path.empty()) {
    throw ValidationError("Library path must not be empty");
  }

  std::error_code ec;
  fs::path library_root = fs::absolute(path, ec);
  if (ec) {
    throw ValidationError("Invalid library path " + path.u8string() + ": " + ec.message());
  }
  library_root = library_root.lexically_normal();

  if (library_root_ && *library_root_ == library_root) {
    LOG_DEBUG("Library path unchanged: {}", library_root.u8string());
    return;
  }
  if (!registry_.empty()) {
    throw ValidationError("Cannot change the library path while " + std::to_string(registry_.size()) +
      " assets are recorded under " + library_root_->u8string());
  }
  if (fs::exists(library_root, ec) && !fs::is_directory(library_root, ec)) {
    throw ValidationError("Library path is not a directory: " + library_root.u8string());
  }
  fs::create_directories(library_root, ec);
  if (ec) {
    throw ValidationError("Cannot create library directory " + library_root.u8string() + ": " + ec.message());
  }

  const std::string previous_path = config_.asset_library_path();
  config_.set_asset_library_path(library_root.u8string());
  if (!config_.save()) {
    config_.set_asset_library_path(previous_path);
    throw PersistenceError("Failed to save configuration to " + config_.config_path().u8string());
  }

  open_library(library_root);
  LOG_INFO("Asset library set to {}", library_root.u8string());
}

// =============================================================================
// LIFECYCLE & PERSISTENCE
// =============================================================================

void AssetManager::open_library(const fs::path& library_root) {
  std::error_code ec;
  fs::create_directories(Config::get_content_directory(library_root), ec);
  if (ec) {
    throw PersistenceError("Failed to create asset library at " + library_root.u8string() + ": " + ec.message());
  }

  library_root_ = library_root;
  store_ = store_factory_(library_root);
  thumbnails_ = thumbnail_factory_(library_root);
  load();
}

void AssetManager::load() {
  load_error_.reset();
  bool store_preserved = true;
  StoreSnapshot snapshot;
  try {
    snapshot = store_->load();
  }
  catch (const CorruptStoreError& e) {
    LOG_ERROR("Asset store is unreadable, starting with an empty library: {}", e.what());
    load_error_ = e.what();

    // Keep the unreadable document aside; the next save replaces it
    std::error_code ec;
    fs::path preserved = store_->store_path();
    preserved += ".corrupt";
    fs::copy_file(store_->store_path(), preserved, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      LOG_WARN("Failed to keep a copy of the unreadable store: {}", ec.message());
      store_preserved = false;
    }
    else {
      LOG_WARN("Unreadable store preserved at {}", preserved.u8string());
    }
  }

  categories_.clear();
  categories_.push_back(default_category());
  for (const auto& category : snapshot.categories) {
    if (!has_category(category)) {
      categories_.push_back(category);
    }
  }
  retired_ids_ = std::move(snapshot.retired_ids);

  size_t dropped = registry_.rebuild(reconcile(std::move(snapshot.assets)));
  LOG_INFO("Loaded {} assets in {} categories from {}{}", registry_.size(), categories_.size(),
    library_root_->u8string(), dropped > 0 ? " (" + std::to_string(dropped) + " duplicates dropped)" : "");

  size_t adopted = adopt_untracked_content();
  if (adopted == 0) {
    return;
  }
  if (!store_preserved) {
    LOG_WARN("Adopted {} untracked items; not saving over the unreadable store", adopted);
    return;
  }
  try {
    persist();
    LOG_INFO("Adopted {} untracked items from {}", adopted, Config::CONTENT_DIRECTORY);
  }
  catch (const PersistenceError&) {
    // Still listed for this session; the next successful save records them
    LOG_WARN("Adopted {} untracked items but could not save them yet", adopted);
  }
}

size_t AssetManager::adopt_untracked_content() {
  std::error_code ec;
  const fs::path content_directory = Config::get_content_directory(*library_root_);
  fs::directory_iterator it(content_directory, ec);
  if (ec) {
    LOG_WARN("Cannot scan {}: {}", content_directory.u8string(), ec.message());
    return 0;
  }

  // Directory order is unspecified, adopt in name order
  std::vector<fs::path> untracked;
  for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    const std::string file_name = it->path().filename().u8string();
    if (file_name.empty() || file_name[0] == '.') {
      continue;
    }
    if (registry_.has_library_path(std::string(Config::CONTENT_DIRECTORY) + "/" + file_name)) {
      continue;
    }
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec) && !it->is_regular_file(entry_ec)) {
      continue;
    }
    untracked.push_back(it->path());
  }
  if (ec) {
    LOG_WARN("Scan of {} stopped early: {}", content_directory.u8string(), ec.message());
  }
  std::sort(untracked.begin(), untracked.end());

  size_t adopted = 0;
  for (const auto& path : untracked) {
    const bool is_directory = fs::is_directory(path, ec);

    Asset asset;
    asset.id = generate_asset_id();
    asset.name = is_directory ? path.filename().u8string() : path.stem().u8string();
    asset.category = default_category();
    asset.kind = is_directory ? AssetKind::Directory : AssetKind::File;
    asset.library_path = std::string(Config::CONTENT_DIRECTORY) + "/" + path.filename().u8string();
    asset.size = calculate_content_size(path);
    asset.created_at = current_timestamp();
    asset.updated_at = asset.created_at;
    if (config_.auto_generate_thumbnail()) {
      asset.thumbnail_path = make_thumbnail(asset);
    }

    if (!registry_.insert(asset)) {
      LOG_WARN("Could not adopt {}: already claimed", asset.library_path);
      thumbnails_->remove_thumbnail(asset.id);
      continue;
    }
    adopted++;
    LOG_INFO("Adopted untracked {} as '{}' ({})", asset.library_path, asset.name, asset.id);
  }
  return adopted;
}

std::vector<Asset> AssetManager::reconcile(std::vector<Asset> assets) {
  std::vector<Asset> live;
  live.reserve(assets.size());

  for (auto& asset : assets) {
    std::error_code ec;
    if (!is_content_path(asset.library_path)) {
      LOG_ERROR("Skipping asset '{}': {} is not inside {}/", asset.name, asset.library_path, Config::CONTENT_DIRECTORY);
      continue;
    }
    if (!fs::exists(resolve_library_path(asset), ec)) {
      LOG_WARN("Skipping asset '{}': content missing at {}", asset.name, asset.library_path);
      if (std::find(retired_ids_.begin(), retired_ids_.end(), asset.id) == retired_ids_.end()) {
        retired_ids_.push_back(asset.id);
      }
      continue;
    }

    if (!has_category(asset.category)) {
      LOG_WARN("Asset '{}' names unknown category '{}', moved to '{}'", asset.name, asset.category, default_category());
      asset.category = default_category();
    }

    if (asset.thumbnail_path && !fs::exists(*library_root_ / fs::u8path(*asset.thumbnail_path), ec)) {
      fs::path cached = thumbnails_->thumbnail_path_for(asset.id);
      if (fs::exists(cached, ec)) {
        asset.thumbnail_path = ThumbnailPipeline::thumbnail_relative_path(asset.id);
      }
      else {
        LOG_DEBUG("Thumbnail of '{}' is missing, cleared", asset.name);
        asset.thumbnail_path.reset();
      }
    }

    live.push_back(std::move(asset));
  }
  return live;
}

void AssetManager::persist() {
  persist(categories_, retired_ids_);
}

void AssetManager::persist(const std::vector<std::string>& categories, const std::vector<std::string>& retired_ids) {
  try {
    store_->save(registry_.all(), categories, retired_ids);
  }
  catch (const PersistenceError& e) {
    LOG_ERROR("Failed to save asset library: {}", e.what());
    throw;
  }
}

// =============================================================================
// HELPERS
// =============================================================================

void AssetManager::require_open() const {
  if (!library_root_ || !store_) {
    throw ValidationError("No asset library is configured");
  }
}

bool AssetManager::has_category(const std::string& name) const {
  return std::find(categories_.begin(), categories_.end(), name) != categories_.end();
}

std::string AssetManager::generate_asset_id() const {
  boost::uuids::random_generator generator;
  while (true) {
    std::string id = boost::uuids::to_string(generator());
    if (!registry_.contains(id) && std::find(retired_ids_.begin(), retired_ids_.end(), id) == retired_ids_.end()) {
      return id;
    }
    LOG_WARN("Generated asset id {} is already taken, drawing again", id);
  }
}

fs::path AssetManager::choose_target_path(const fs::path& source_path, const std::string& asset_id) const {
  const fs::path content_directory = Config::get_content_directory(*library_root_);
  const fs::path file_name = source_path.filename();

  auto is_free = [this](const fs::path& candidate) {
    std::error_code ec;
    const std::string relative = std::string(Config::CONTENT_DIRECTORY) + "/" + candidate.filename().u8string();
    return !fs::exists(candidate, ec) && !registry_.has_library_path(relative);
  };

  fs::path candidate = content_directory / file_name;
  if (is_free(candidate)) {
    return candidate;
  }

  // Directories keep their whole name as the stem
  std::error_code ec;
  const bool is_directory = fs::is_directory(source_path, ec);
  const std::string stem = is_directory ? file_name.u8string() : file_name.stem().u8string();
  const std::string extension = is_directory ? "" : file_name.extension().u8string();

  candidate = content_directory / fs::u8path(stem + "_" + asset_id.substr(0, ID_SUFFIX_LENGTH) + extension);
  if (is_free(candidate)) {
    return candidate;
  }
  return content_directory / fs::u8path(stem + "_" + asset_id + extension);
}

std::optional<std::string> AssetManager::make_thumbnail(const Asset& asset) {
  return thumbnails_->generate(resolve_library_path(asset), asset.kind, asset.id, config_.thumbnail_size());
}

void AssetManager::copy_content(const fs::path& source, const fs::path& target,
  const ProgressCallback& progress, const std::atomic<bool>* cancel) const {
  auto cancelled = [cancel]() { return cancel && cancel->load(); };

  std::error_code ec;
  if (!fs::is_directory(source, ec)) {
    if (cancelled()) {
      throw ImportCancelledError("Import cancelled: " + source.u8string());
    }
    if (progress) {
      progress(0, 1, "Copying " + source.filename().u8string());
    }
    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (ec) {
      throw ImportError("Failed to copy " + source.u8string() + ": " + ec.message());
    }
    if (progress) {
      progress(1, 1, "Copied " + source.filename().u8string());
    }
    return;
  }

  // Collect the file list first so progress has a total
  std::vector<fs::path> files;
  std::vector<fs::path> directories;
  fs::recursive_directory_iterator it(source, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      directories.push_back(it->path().lexically_relative(source));
    }
    else {
      files.push_back(it->path().lexically_relative(source));
    }
  }
  if (ec) {
    throw ImportError("Failed to read folder " + source.u8string() + ": " + ec.message());
  }

  fs::create_directories(target, ec);
  if (ec) {
    throw ImportError("Failed to create " + target.u8string() + ": " + ec.message());
  }
  for (const auto& directory : directories) {
    fs::create_directories(target / directory, ec);
    if (ec) {
      throw ImportError("Failed to create " + (target / directory).u8string() + ": " + ec.message());
    }
  }

  const size_t total = files.size();
  for (size_t i = 0; i < total; i++) {
    if (cancelled()) {
      LOG_INFO("Import of {} cancelled after {}/{} files", source.u8string(), i, total);
      throw ImportCancelledError("Import cancelled: " + source.u8string());
    }
    if (progress) {
      progress(i, total, "Copying " + files[i].generic_u8string());
    }

    fs::copy_file(source / files[i], target / files[i], fs::copy_options::overwrite_existing, ec);
    if (ec) {
      throw ImportError("Failed to copy " + (source / files[i]).u8string() + ": " + ec.message());
    }
  }
  if (progress) {
    progress(total, total, "Copied " + std::to_string(total) + " files");
  }
}

void AssetManager::discard_content(const fs::path& target) const {
  if (!is_below(target, Config::get_content_directory(*library_root_))) {
    LOG_ERROR("Refusing to delete {}: not inside the library content directory", target.u8string());
    return;
  }

  std::error_code ec;
  fs::remove_all(target, ec);
  if (ec) {
    LOG_WARN("Failed to delete library content {}: {}", target.u8string(), ec.message());
  }
}

fs::path AssetManager::document_path_for(const std::string& asset_id) const {
  return Config::get_document_directory(*library_root_) / fs::u8path(asset_id + Config::DOCUMENT_EXTENSION);
}

void AssetManager::write_document(const Asset& asset) const {
  std::error_code ec;
  const fs::path document_path = document_path_for(asset.id);
  fs::create_directories(document_path.parent_path(), ec);
  if (ec) {
    LOG_WARN("Failed to create document directory for '{}': {}", asset.name, ec.message());
    return;
  }

  std::ofstream file(document_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    LOG_WARN("Failed to create document {}", document_path.u8string());
    return;
  }
  file << render_asset_document(asset);
  if (!file) {
    LOG_WARN("Failed to write document {}", document_path.u8string());
    return;
  }
  LOG_DEBUG("Wrote document {}", document_path.u8string());
}

void AssetManager::remove_document(const std::string& asset_id) const {
  std::error_code ec;
  const fs::path document_path = document_path_for(asset_id);
  if (fs::remove(document_path, ec)) {
    LOG_DEBUG("Deleted document {}", document_path.u8string());
  }
  else if (ec) {
    LOG_WARN("Failed to delete document {}: {}", document_path.u8string(), ec.message());
  }
}
