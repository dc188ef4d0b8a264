#include <charconv>
#include <exception>
#include <memory>
#include <optional>
#include <print>
#include <string_view>
#include <vector>

#include "Archiver.hpp"
#include "IOManager.hpp"
#include "Organizer.hpp"
#include "StaleScanner.hpp"
#include "TrashBin.hpp"
#include "UI.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

struct Options {
  std::string command;
  fs::path target;
  std::optional<fs::path> dest;
  std::optional<std::uint64_t> older_than;
  std::optional<fs::path> config;
  bool dry_run = false;
  bool yes = false;
};

void print_usage() {
  std::println(stderr, "Usage: sweeper [--config <file>] <command> [options]");
  std::println(stderr, "");
  std::println(stderr, "Commands:");
  std::println(stderr,
               "  organize <dir> [--dry-run]          Sort files into "
               "category folders");
  std::println(stderr,
               "  scan <dir> [--older-than N]         List stale project "
               "folders");
  std::println(stderr,
               "  archive <dir> [--dest D] [--older-than N] [--yes]");
  std::println(stderr,
               "                                      Move stale folders "
               "into YYYY-MM buckets");
  std::println(stderr,
               "  delete <dir> [--older-than N] [--yes]");
  std::println(stderr,
               "                                      Send stale folders to "
               "the trash");
  std::println(stderr,
               "  undo                                Revert the last "
               "organize run");
  std::println(stderr,
               "  tui <dir> [--older-than N]          Interactive review");
}

std::optional<Options> parse_args(int argc, char* argv[]) {
  Options opts;
  std::vector<std::string_view> positional;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next_value = [&]() -> std::optional<std::string_view> {
      if (i + 1 >= argc) {
        std::println(stderr, "Missing value for {}", arg);
        return std::nullopt;
      }
      return std::string_view(argv[++i]);
    };

    if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg == "--yes") {
      opts.yes = true;
    } else if (arg == "--dest") {
      auto value = next_value();
      if (!value) return std::nullopt;
      opts.dest = fs::path(*value);
    } else if (arg == "--config") {
      auto value = next_value();
      if (!value) return std::nullopt;
      opts.config = fs::path(*value);
    } else if (arg == "--older-than") {
      auto value = next_value();
      if (!value) return std::nullopt;
      std::uint64_t days = 0;
      auto [ptr, ec] =
          std::from_chars(value->data(), value->data() + value->size(), days);
      if (ec != std::errc() || ptr != value->data() + value->size()) {
        std::println(stderr, "Invalid number of days: {}", *value);
        return std::nullopt;
      }
      opts.older_than = days;
    } else if (arg.starts_with("--")) {
      std::println(stderr, "Unknown option: {}", arg);
      return std::nullopt;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) return std::nullopt;
  opts.command = std::string(positional[0]);
  if (opts.command == "undo") {
    return positional.size() == 1 ? std::optional<Options>(opts)
                                  : std::nullopt;
  }
  if (positional.size() != 2) return std::nullopt;
  opts.target = fs::path(positional[1]);
  return opts;
}

Config load_settings(const Options& opts, const fs::path& exePath) {
  std::vector<fs::path> configPaths;
  if (opts.config) {
    configPaths.push_back(*opts.config);
  } else {
    configPaths = {exePath / "config.json", fs::current_path() / "config.json",
                   exePath.parent_path() / "config.json"};
  }

  for (const auto& configPath : configPaths) {
    if (!fs::exists(configPath)) continue;
    IOManager::log(std::format("Found config.json at: {}",
                               safe_path_to_string(configPath)));
    auto configOpt = IOManager::load_config(configPath);
    if (!configOpt) {
      throw std::runtime_error(std::format(
          "Invalid configuration in {}", safe_path_to_string(configPath)));
    }
    return *configOpt;
  }
  if (opts.config) {
    throw std::runtime_error(std::format("Config file not found: {}",
                                         safe_path_to_string(*opts.config)));
  }
  IOManager::log("No config.json found. Using defaults.");
  return Config{};
}

void print_report(const ScanReport& report) {
  std::println("Root: {}", safe_path_to_string(report.root));
  std::println("Scanned project folders: {}", report.scanned_count);
  std::println("Stale threshold: {} days\n", report.older_than_days);

  if (report.stale.empty()) {
    std::println("No stale folders found.");
    return;
  }

  std::println("Stale folders (oldest first):");
  for (size_t idx = 0; idx < report.stale.size(); ++idx) {
    const auto& item = report.stale[idx];
    std::println("  {:>2}. {}  (last modified: {})", idx + 1,
                 safe_path_to_string(item.path),
                 format_file_time(item.last_modified));
  }
}

void print_plan(const ArchivePlan& plan) {
  std::println("Archive destination: {}", safe_path_to_string(plan.dest_root));
  std::println("Month bucket: {}", plan.month_bucket);
  std::println("Planned moves: {}\n", plan.moves.size());

  for (size_t idx = 0; idx < plan.moves.size(); ++idx) {
    const auto& mv = plan.moves[idx];
    std::println("  {:>2}. '{}' -> '{}'", idx + 1, safe_path_to_string(mv.from),
                 safe_path_to_string(mv.to));
  }
}

fs::path archive_destination(const Options& opts, const Config& config) {
  if (opts.dest) return *opts.dest;
  if (!config.archive_destination.empty()) return config.archive_destination;
  return opts.target / "Archive";
}

int run_command(const Options& opts, const Config& config) {
  if (opts.command == "organize") {
    Organizer organizer(opts.target);
    std::vector<JournalEntry> journal;
    std::vector<Action> plan;
    try {
      plan = organizer.organize(opts.dry_run, journal);
    } catch (const SweepError&) {
      IOManager::save_journal(config.journal_file, journal);
      throw;
    }
    for (const auto& action : plan) {
      std::println("Move: '{}' -> '{}'", safe_path_to_string(action.from),
                   safe_path_to_string(action.to));
    }
    if (opts.dry_run) {
      std::println("\nDry-run only. Use without --dry-run to apply.");
    } else {
      IOManager::save_journal(config.journal_file, journal);
    }
    return 0;
  }

  if (opts.command == "undo") {
    IOManager::run_undo(config.journal_file);
    std::println("Undo finished. See the log for details.");
    return 0;
  }

  if (opts.command == "scan") {
    const auto report = StaleScanner::scan(
        opts.target, opts.older_than.value_or(config.scan_older_than_days),
        config.scan_max_depth);
    print_report(report);
    return 0;
  }

  if (opts.command == "archive") {
    const auto report = StaleScanner::scan(
        opts.target, opts.older_than.value_or(config.scan_older_than_days),
        config.scan_max_depth);
    const auto plan =
        Archiver::build_plan(report, archive_destination(opts, config));
    print_plan(plan);

    if (opts.yes) {
      Archiver::apply_plan(plan);
      std::println("\nArchived successfully.");
    } else {
      std::println("\nDry-run only. Use --yes to apply.");
    }
    return 0;
  }

  if (opts.command == "delete") {
    const auto report = StaleScanner::scan(
        opts.target, opts.older_than.value_or(config.delete_older_than_days),
        config.scan_max_depth);

    if (report.stale.empty()) {
      std::println("Nothing to delete.");
      return 0;
    }

    print_report(report);

    if (opts.yes) {
      TrashBin::delete_to_trash(report.stale, TrashBin::trash_home());
      std::println("\nMoved to trash successfully.");
    } else {
      std::println("\nDry-run only. Use --yes to move to trash.");
    }
    return 0;
  }

  if (opts.command == "tui") {
    Config tui_config = config;
    if (opts.older_than) tui_config.scan_older_than_days = *opts.older_than;
    IOManager::log("Initializing UI...");
    auto application = std::make_shared<UI>(tui_config, opts.target,
                                            archive_destination(opts, config));
    application->run();
    return 0;
  }

  std::println(stderr, "Unknown command: {}", opts.command);
  print_usage();
  return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto optsOpt = parse_args(argc, argv);
  if (!optsOpt) {
    print_usage();
    return 2;
  }
  const Options& opts = *optsOpt;

  try {
    fs::path exePath;
    if (argc > 0) {
      exePath = fs::path(argv[0]).parent_path();
    }
    if (exePath.empty()) {
      exePath = fs::current_path();
    }

    Config config;
    try {
      config = load_settings(opts, exePath);
    } catch (const std::exception&) {
      IOManager::initialize_logger(config.log_file);
      throw;
    }
    IOManager::initialize_logger(config.log_file);
    IOManager::log(std::format("--- Sweeper started: {} ---", opts.command));

    const int status = run_command(opts, config);
    IOManager::log("--- Sweeper exited normally ---");
    return status;

  } catch (const SweepError& e) {
    IOManager::log(std::format("ERROR ({}): {}", to_string(e.kind()),
                               e.what()));
    std::println(stderr, "Error: {}", e.what());
    if (e.index()) {
      std::println(stderr, "Stopped at item {}; earlier items were applied.",
                   *e.index() + 1);
    }
    return 1;
  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check the log file for details.");
    return 1;
  }
}
