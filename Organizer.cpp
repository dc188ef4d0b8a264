#include "Organizer.hpp"

#include <array>
#include <utility>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
constexpr std::string_view kDefaultCategory = "Other";

constexpr std::array<std::pair<std::string_view, std::string_view>, 21>
    kCategoryTable = {{
        {"pdf", "Documents"},     {"doc", "Documents"},
        {"docx", "Documents"},    {"txt", "Documents"},
        {"jpg", "Images"},        {"png", "Images"},
        {"gif", "Images"},        {"webp", "Images"},
        {"zip", "Archives"},      {"rar", "Archives"},
        {"7z", "Archives"},       {"tar", "Archives"},
        {"gz", "Archives"},       {"dmg", "Installers"},
        {"exe", "Installers"},    {"msi", "Installers"},
        {"pkg", "Installers"},    {"deb", "Installers"},
        {"rpm", "Installers"},    {"csv", "Spreadsheets"},
        {"xlsx", "Spreadsheets"},
    }};
}  // namespace

Organizer::Organizer(fs::path targetDir) : m_targetDir(std::move(targetDir)) {}

std::string_view Organizer::category_for(std::string_view ext) {
  for (const auto& [extension, category] : kCategoryTable) {
    if (extension == ext) return category;
  }
  return kDefaultCategory;
}

std::vector<Action> Organizer::generate_plan() const {
  IOManager::log(std::format("Scanning '{}' for files to organize...",
                             safe_path_to_string(m_targetDir)));

  std::error_code ec;
  fs::directory_iterator it(m_targetDir, ec);
  if (ec) {
    throw SweepError(ErrorKind::Path,
                     std::format("read_dir failed: {}: {}",
                                 safe_path_to_string(m_targetDir),
                                 ec.message()),
                     m_targetDir);
  }

  std::vector<Action> plan;
  const fs::directory_iterator end{};
  for (; !ec && it != end; it.increment(ec)) {
    const fs::path& path = it->path();
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) continue;

    std::string ext = safe_path_to_string(path.extension());
    if (!ext.empty()) ext.erase(0, 1);
    const std::string category(category_for(string_to_lower_ascii(ext)));

    fs::path destPath =
        generate_unique_path(m_targetDir / category, path.filename());
    plan.push_back({path, std::move(destPath), category});
  }
  if (ec) {
    throw SweepError(ErrorKind::Path,
                     std::format("read_dir failed: {}: {}",
                                 safe_path_to_string(m_targetDir),
                                 ec.message()),
                     m_targetDir);
  }

  IOManager::log(std::format("Analysis complete. Found {} actions.",
                             plan.size()));
  return plan;
}

void Organizer::apply_plan(const std::vector<Action>& plan,
                           std::vector<JournalEntry>& journal) const {
  for (std::size_t i = 0; i < plan.size(); ++i) {
    const auto& action = plan[i];
    const fs::path parent_dir = action.to.parent_path();

    std::error_code ec;
    if (!fs::exists(parent_dir)) {
      fs::create_directories(parent_dir, ec);
      if (ec) {
        throw SweepError(
            ErrorKind::IO,
            std::format("Failed to create directory '{}': {}",
                        safe_path_to_string(parent_dir), ec.message()),
            action.from, action.to, i);
      }
      IOManager::log(std::format("[DIR] Creating directory: '{}'",
                                 safe_path_to_string(parent_dir)));
    }

    fs::rename(action.from, action.to, ec);
    if (ec) {
      throw SweepError(ErrorKind::Move,
                       std::format("ERROR moving file {}: {}",
                                   safe_path_to_string(action.from),
                                   ec.message()),
                       action.from, action.to, i);
    }
    journal.push_back({ActionType::MOVE, action.from, action.to});
  }
}

std::vector<Action> Organizer::organize(
    bool dry_run, std::vector<JournalEntry>& journal) const {
  std::vector<Action> plan = generate_plan();
  for (const auto& action : plan) {
    IOManager::log(std::format("{}Move: '{}' -> '{}'",
                               dry_run ? "[dry-run] " : "",
                               safe_path_to_string(action.from),
                               safe_path_to_string(action.to)));
  }
  if (!dry_run) {
    apply_plan(plan, journal);
    IOManager::log("Execution complete.");
  }
  return plan;
}
