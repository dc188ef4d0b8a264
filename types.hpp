#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

// Depth below a project folder that the tree walk still inspects.
inline constexpr int kDefaultTreeDepth = 3;

struct ProjectItem {
  fs::path path;
  fs::file_time_type last_modified;
};

struct ScanReport {
  fs::path root;
  std::uint64_t older_than_days = 0;
  std::vector<ProjectItem> stale;  // oldest first
  std::vector<ProjectItem> fresh;
  std::size_t scanned_count = 0;
};

struct ArchiveMove {
  fs::path from;
  fs::path to;
};

struct ArchivePlan {
  fs::path dest_root;
  std::string month_bucket;  // "YYYY-MM"
  std::vector<ArchiveMove> moves;
};

struct Config {
  std::uint64_t scan_older_than_days = 30;
  int scan_max_depth = kDefaultTreeDepth;
  std::uint64_t delete_older_than_days = 90;
  fs::path archive_destination;
  fs::path log_file = "sweeper.log";
  fs::path journal_file = "sweeper_journal.json";
};

// Every key is optional; missing ones keep the defaults above.
inline void from_json(const json& j, Config& c) {
  if (j.contains("scan")) {
    const auto& scan = j.at("scan");
    if (scan.contains("older_than_days")) {
      scan.at("older_than_days").get_to(c.scan_older_than_days);
    }
    if (scan.contains("max_depth")) {
      scan.at("max_depth").get_to(c.scan_max_depth);
    }
  }
  if (j.contains("delete") && j.at("delete").contains("older_than_days")) {
    j.at("delete").at("older_than_days").get_to(c.delete_older_than_days);
  }
  if (j.contains("archive") && j.at("archive").contains("destination")) {
    c.archive_destination = j.at("archive").at("destination").get<std::string>();
  }
  if (j.contains("log_file")) {
    c.log_file = j.at("log_file").get<std::string>();
  }
  if (j.contains("journal_file")) {
    c.journal_file = j.at("journal_file").get<std::string>();
  }
}

enum class ActionType { MOVE };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::MOVE, "MOVE"}});
struct JournalEntry {
  ActionType action;
  fs::path from;
  fs::path to;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(JournalEntry, action, from, to);

struct Action {
  fs::path from;
  fs::path to;
  std::string reason;
};

enum class ErrorKind { Path, Compute, Move, Trash, IO };

inline const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Path:
      return "PathError";
    case ErrorKind::Compute:
      return "ComputeError";
    case ErrorKind::Move:
      return "MoveError";
    case ErrorKind::Trash:
      return "TrashError";
    case ErrorKind::IO:
      return "IOError";
  }
  return "Error";
}

// Thrown by every fallible core operation. path() is the item the failing
// operation worked on, target() its destination when there is one.
class SweepError : public std::runtime_error {
 public:
  SweepError(ErrorKind kind, const std::string& message, fs::path path = {},
             fs::path target = {}, std::optional<std::size_t> index = {})
      : std::runtime_error(message),
        m_kind(kind),
        m_path(std::move(path)),
        m_target(std::move(target)),
        m_index(index) {}

  ErrorKind kind() const noexcept { return m_kind; }
  const fs::path& path() const noexcept { return m_path; }
  const fs::path& target() const noexcept { return m_target; }
  // Position of the failing item within the sequence being applied.
  std::optional<std::size_t> index() const noexcept { return m_index; }

 private:
  ErrorKind m_kind;
  fs::path m_path;
  fs::path m_target;
  std::optional<std::size_t> m_index;
};
