#include "IOManager.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <fstream>
#include <functional>
#include <mutex>

#include "utils.hpp"

namespace {
std::ofstream g_log_stream;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

// Lines logged before initialize_logger() names the log file.
constexpr std::size_t kMaxPendingLines = 1000;
std::deque<std::string> g_pending_lines;
bool g_logger_initialized = false;

}  // namespace

void IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) {
    g_log_stream.close();
  }
  g_log_stream.open(logPath, std::ios_base::app);
  g_logger_initialized = true;
  if (g_log_stream.is_open()) {
    for (const auto& line : g_pending_lines) {
      g_log_stream << line << "\n";
    }
    g_log_stream << std::flush;
  }
  g_pending_lines.clear();
}

void IOManager::close_logger() {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) {
    g_log_stream.close();
  }
  g_logger_initialized = false;
  g_pending_lines.clear();
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (!g_logger_initialized) {
    g_pending_lines.push_back(std::move(full_message));
    if (g_pending_lines.size() > kMaxPendingLines) {
      g_pending_lines.pop_front();
    }
  } else if (g_log_stream.is_open()) {
    g_log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    Config config = configJson.get<Config>();
    if (config.scan_max_depth < 0) {
      log(std::format("Error: scan.max_depth must not be negative (got {})",
                      config.scan_max_depth));
      return std::nullopt;
    }
    return config;
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

void IOManager::run_undo(const fs::path& journalPath) {
  if (!fs::exists(journalPath)) {
    log("No journal file found. Nothing to undo.");
    return;
  }
  std::vector<JournalEntry> journal;
  try {
    std::ifstream journalFile(journalPath);
    json j = json::parse(journalFile);
    journal = j.get<std::vector<JournalEntry>>();
  } catch (const json::exception& e) {
    log(std::format("Error reading journal {}: {}. Nothing undone.",
                    safe_path_to_string(journalPath), e.what()));
    return;
  }
  std::reverse(journal.begin(), journal.end());

  log("Starting undo operation...");
  for (const auto& entry : journal) {
    if (entry.action == ActionType::MOVE) {
      log(std::format("Undoing move: '{}' -> '{}'",
                      safe_path_to_string(entry.to),
                      safe_path_to_string(entry.from)));
      try {
        if (entry.from.has_parent_path() &&
            !fs::exists(entry.from.parent_path())) {
          fs::create_directories(entry.from.parent_path());
        }
        fs::rename(entry.to, entry.from);
      } catch (const fs::filesystem_error& e) {
        log(std::format("   Error undoing move: {}", e.what()));
      }
    }
  }
  fs::remove(journalPath);
  log("Undo complete. Journal file removed.");
}

void IOManager::save_journal(const fs::path& journalPath,
                             const std::vector<JournalEntry>& journal) {
  if (!journal.empty()) {
    std::ofstream j_file(journalPath);
    j_file << json(journal).dump(2);
    log(std::format("Journal saved with {} actions. Run 'sweeper undo' to "
                    "revert them.",
                    journal.size()));
  }
}
