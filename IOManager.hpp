#pragma once

#include <functional>
#include <optional>

#include "types.hpp"

namespace IOManager {
// Opens the log file. Lines logged before this call are kept in memory and
// written out here.
void initialize_logger(const fs::path& logPath);
// Closes the log file; later lines are held until the next initialize.
void close_logger();

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);
std::optional<Config> load_config(const fs::path& configPath);
void run_undo(const fs::path& journalPath);
void save_journal(const fs::path& journalPath,
                  const std::vector<JournalEntry>& journal);
}  // namespace IOManager
