#include "run.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "asset.h"
#include "asset_manager.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"

namespace fs = std::filesystem;

namespace {
// Set from SIGINT, checked between per-file copy steps of a running import
std::atomic<bool> g_cancel_requested(false);

void on_interrupt(int) {
  g_cancel_requested = true;
}

const std::map<std::string, SortOrder> SORT_ORDERS = {
  {"newest", SortOrder::NewestFirst},
  {"oldest", SortOrder::OldestFirst},
  {"name", SortOrder::NameAscending},
  {"name-desc", SortOrder::NameDescending},
  {"category", SortOrder::CategoryAscending},
  {"category-desc", SortOrder::CategoryDescending}
};

struct CommandContext {
  AssetManager& manager;
  const cxxopts::ParseResult& options;
  const std::vector<std::string>& args;
};

std::optional<std::string> optional_string(const cxxopts::ParseResult& options, const std::string& key) {
  if (options.count(key) == 0) {
    return std::nullopt;
  }
  return options[key].as<std::string>();
}

std::set<std::string> tag_set(const cxxopts::ParseResult& options) {
  std::set<std::string> tags;
  if (options.count("tags") > 0) {
    for (const auto& tag : options["tags"].as<std::vector<std::string>>()) {
      std::string trimmed = trim_string(tag);
      if (!trimmed.empty()) {
        tags.insert(trimmed);
      }
    }
  }
  return tags;
}

const std::string& require_argument(const CommandContext& context, size_t index, const std::string& what) {
  if (context.args.size() <= index) {
    throw ValidationError("Missing argument: " + what);
  }
  return context.args[index];
}

std::string join_tags(const std::set<std::string>& tags) {
  std::string joined;
  for (const auto& tag : tags) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += tag;
  }
  return joined;
}

void print_asset_line(const Asset& asset) {
  std::cout << asset.id << "  " << asset.name << "  [" << asset.category << "]  "
    << get_asset_display_info(asset) << "\n";
}

void print_asset_details(const AssetManager& manager, const Asset& asset) {
  const auto document = manager.resolve_document_path(asset);
  std::cout << "Id:          " << asset.id << "\n"
    << "Name:        " << asset.name << "\n"
    << "Kind:        " << get_asset_kind_string(asset.kind) << "\n"
    << "Category:    " << asset.category << "\n"
    << "Size:        " << format_file_size(asset.size) << "\n"
    << "Location:    " << manager.resolve_library_path(asset).u8string() << "\n"
    << "Thumbnail:   " << (asset.thumbnail_path ? manager.resolve_thumbnail_path(asset)->u8string() : "none") << "\n"
    << "Notes:       " << (document ? document->u8string() : "none") << "\n"
    << "Tags:        " << join_tags(asset.tags) << "\n"
    << "Description: " << asset.description << "\n"
    << "Created:     " << format_timestamp(asset.created_at) << "\n"
    << "Updated:     " << format_timestamp(asset.updated_at) << "\n";
}

void print_asset_list(std::vector<Asset> assets, const cxxopts::ParseResult& options) {
  if (options.count("sort") > 0) {
    const std::string sort = options["sort"].as<std::string>();
    auto it = SORT_ORDERS.find(sort);
    if (it == SORT_ORDERS.end()) {
      throw ValidationError("Unknown sort order: " + sort);
    }
    assets = AssetManager::sort_assets(std::move(assets), it->second);
  }

  for (const auto& asset : assets) {
    print_asset_line(asset);
  }
  std::cout << assets.size() << (assets.size() == 1 ? " asset" : " assets") << "\n";
}

// =============================================================================
// COMMANDS
// =============================================================================

void command_add(const CommandContext& context) {
  AddAssetRequest request;
  request.source_path = fs::u8path(require_argument(context, 0, "source path"));
  request.name = optional_string(context.options, "name");
  request.category = optional_string(context.options, "category");
  request.description = optional_string(context.options, "description").value_or("");
  request.tags = tag_set(context.options);

  ProgressCallback progress = nullptr;
  if (context.options.count("verbose") > 0) {
    progress = [](size_t current, size_t total, const std::string& message) {
      std::cerr << "[" << current << "/" << total << "] " << message << "\n";
    };
  }

  std::signal(SIGINT, on_interrupt);
  Asset asset = context.manager.add_asset(request, progress, &g_cancel_requested);
  std::signal(SIGINT, SIG_DFL);

  std::cout << "Added " << asset.id << "\n";
  print_asset_details(context.manager, asset);
}

void command_remove(const CommandContext& context) {
  const std::string& id = require_argument(context, 0, "asset id");
  context.manager.remove_asset(id);
  std::cout << "Removed " << id << "\n";
}

void command_update(const CommandContext& context) {
  const std::string& id = require_argument(context, 0, "asset id");

  AssetPatch patch;
  patch.name = optional_string(context.options, "name");
  patch.category = optional_string(context.options, "category");
  patch.description = optional_string(context.options, "description");
  if (context.options.count("tags") > 0 || context.options.count("clear-tags") > 0) {
    patch.tags = tag_set(context.options);
  }
  if (patch.empty()) {
    throw ValidationError("Nothing to update: pass --name, --category, --description, --tags or --clear-tags");
  }

  print_asset_details(context.manager, context.manager.update_asset(id, patch));
}

void command_show(const CommandContext& context) {
  print_asset_details(context.manager, context.manager.get_asset(require_argument(context, 0, "asset id")));
}

void command_list(const CommandContext& context) {
  print_asset_list(context.manager.get_all_assets(optional_string(context.options, "category")), context.options);
}

void command_search(const CommandContext& context) {
  const std::string keyword = context.args.empty() ? "" : context.args[0];
  print_asset_list(context.manager.search_assets(keyword, optional_string(context.options, "category")),
    context.options);
}

void command_filter(const CommandContext& context) {
  print_asset_list(context.manager.filter_by_category(require_argument(context, 0, "category")), context.options);
}

void command_categories(const CommandContext& context) {
  for (const auto& category : context.manager.get_categories()) {
    size_t count = context.manager.filter_by_category(category).size();
    std::cout << category << " (" << count << ")"
      << (category == context.manager.default_category() ? "  default" : "") << "\n";
  }
}

void command_add_category(const CommandContext& context) {
  const std::string& name = require_argument(context, 0, "category name");
  context.manager.add_category(name);
  std::cout << "Added category " << name << "\n";
}

void command_remove_category(const CommandContext& context) {
  const std::string& name = require_argument(context, 0, "category name");
  size_t members = context.manager.filter_by_category(name).size();
  context.manager.remove_category(name);
  std::cout << "Removed category " << name;
  if (members > 0) {
    std::cout << ", " << members << " assets moved to " << context.manager.default_category();
  }
  std::cout << "\n";
}

void command_library(const CommandContext& context) {
  auto library_path = context.manager.get_library_path();
  std::cout << (library_path ? library_path->u8string() : "(not set)") << "\n";
}

void command_set_library(const CommandContext& context) {
  context.manager.set_library_path(fs::u8path(require_argument(context, 0, "library path")));
  std::cout << "Asset library set to " << context.manager.get_library_path()->u8string() << "\n";
  if (context.manager.load_error()) {
    std::cerr << "Warning: existing store is unreadable, started empty: " << *context.manager.load_error() << "\n";
  }
}

void command_refresh(const CommandContext& context) {
  const std::string& id = require_argument(context, 0, "asset id");
  Asset asset = context.options.count("thumbnail-only") > 0 ?
    context.manager.regenerate_thumbnail(id) : context.manager.refresh_asset(id);
  print_asset_details(context.manager, asset);
}

using CommandHandler = void (*)(const CommandContext& context);

struct Command {
  CommandHandler handler;
  bool needs_library;
};

const std::map<std::string, Command> COMMANDS = {
  {"add", {command_add, true}},
  {"remove", {command_remove, true}},
  {"update", {command_update, true}},
  {"show", {command_show, true}},
  {"list", {command_list, true}},
  {"search", {command_search, true}},
  {"filter", {command_filter, true}},
  {"categories", {command_categories, true}},
  {"add-category", {command_add_category, true}},
  {"remove-category", {command_remove_category, true}},
  {"library", {command_library, false}},
  {"set-library", {command_set_library, false}},
  {"refresh", {command_refresh, true}}
};

cxxopts::Options build_options() {
  cxxopts::Options options("asset_shelf", "Local asset library: import, tag, search and preview files");
  options.positional_help("COMMAND [ARGS...]");
  options.add_options()
    ("c,config", "Configuration file", cxxopts::value<std::string>()->default_value(Config::DEFAULT_CONFIG_FILE))
    ("v,verbose", "Log debug output and import progress")
    ("h,help", "Show help")
    ("n,name", "Asset name (add, update)", cxxopts::value<std::string>())
    ("category", "Category (add, update, list, search)", cxxopts::value<std::string>())
    ("d,description", "Asset description (add, update)", cxxopts::value<std::string>())
    ("t,tags", "Comma separated tags (add, update)", cxxopts::value<std::vector<std::string>>())
    ("clear-tags", "Remove all tags (update)")
    ("s,sort", "newest, oldest, name, name-desc, category, category-desc", cxxopts::value<std::string>())
    ("thumbnail-only", "Only regenerate the preview (refresh)")
    ("command", "Command", cxxopts::value<std::string>())
    ("args", "Command arguments", cxxopts::value<std::vector<std::string>>());
  options.parse_positional({"command", "args"});
  return options;
}

std::string command_list_help() {
  return "Commands:\n"
    "  add SOURCE                 Copy a file or folder into the library\n"
    "  remove ID                  Delete an asset and its content\n"
    "  update ID                  Change name, category, description or tags\n"
    "  show ID                    Print one asset\n"
    "  list                       Print all assets\n"
    "  search KEYWORD             Match name, description and tags\n"
    "  filter CATEGORY            Print the assets of one category\n"
    "  categories                 Print all categories\n"
    "  add-category NAME\n"
    "  remove-category NAME       Members move to the default category\n"
    "  library                    Print the library path\n"
    "  set-library PATH           Choose the library folder\n"
    "  refresh ID                 Recompute size and preview\n";
}
}

int run(int argc, char* argv[]) {
  cxxopts::Options options = build_options();

  cxxopts::ParseResult parsed;
  try {
    parsed = options.parse(argc, argv);
  }
  catch (const cxxopts::exceptions::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  if (parsed.count("help") > 0 || parsed.count("command") == 0) {
    std::cout << options.help() << "\n" << command_list_help();
    return parsed.count("help") > 0 ? 0 : 2;
  }

  Logger::initialize(parsed.count("verbose") > 0 ? LogLevel::Debug : LogLevel::Warning);

  const std::string command_name = parsed["command"].as<std::string>();
  auto command = COMMANDS.find(command_name);
  if (command == COMMANDS.end()) {
    std::cerr << "Unknown command: " << command_name << "\n" << command_list_help();
    return 2;
  }

  const std::vector<std::string> args = parsed.count("args") > 0 ?
    parsed["args"].as<std::vector<std::string>>() : std::vector<std::string>();

  Config config = Config::load(fs::u8path(parsed["config"].as<std::string>()));
  AssetManager manager(config);

  try {
    if (!manager.open() && command->second.needs_library) {
      std::cerr << "No asset library configured. Run: asset_shelf set-library PATH\n";
      return 1;
    }
    if (manager.load_error()) {
      std::cerr << "Warning: asset store is unreadable, started empty: " << *manager.load_error() << "\n";
    }

    command->second.handler(CommandContext{manager, parsed, args});
  }
  catch (const AssetShelfError& e) {
    LOG_DEBUG("Command '{}' failed: {}", command_name, e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  spdlog::shutdown();
  return 0;
}
