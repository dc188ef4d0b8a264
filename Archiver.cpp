#include "Archiver.hpp"

#include <set>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {

fs::path resolve_destination(const fs::path& dest_root) {
  std::error_code ec;
  fs::path resolved = fs::canonical(dest_root, ec);
  if (!ec) return resolved;

  // The destination may not exist yet; it is created on apply.
  resolved = fs::weakly_canonical(dest_root, ec);
  if (!ec) return resolved;
  resolved = fs::absolute(dest_root, ec);
  if (!ec) return resolved.lexically_normal();
  return dest_root;
}

}  // namespace

ArchivePlan Archiver::build_plan(const ScanReport& report,
                                 const fs::path& dest_root) {
  ArchivePlan plan;
  plan.dest_root = resolve_destination(dest_root);
  plan.month_bucket = current_month_bucket();

  const fs::path bucket_dir = plan.dest_root / plan.month_bucket;
  std::set<fs::path> planned;

  for (const auto& item : report.stale) {
    if (is_within(item.path, plan.dest_root)) {
      IOManager::log(std::format(
          "Skipping '{}': it is inside the archive destination.",
          safe_path_to_string(item.path)));
      continue;
    }

    fs::path name = item.path.filename();
    if (name.empty() || name == "." || name == "..") {
      name = "unknown";
    }

    fs::path to = avoid_collision(bucket_dir / name, planned);
    planned.insert(to);
    plan.moves.push_back({item.path, std::move(to)});
  }

  IOManager::log(std::format("Archive plan: {} moves into '{}'.",
                             plan.moves.size(),
                             safe_path_to_string(bucket_dir)));
  return plan;
}

void Archiver::apply_plan(const ArchivePlan& plan) {
  for (std::size_t i = 0; i < plan.moves.size(); ++i) {
    const auto& move = plan.moves[i];
    const fs::path parent_dir = move.to.parent_path();

    std::error_code ec;
    if (!parent_dir.empty()) {
      fs::create_directories(parent_dir, ec);
      if (ec) {
        throw SweepError(
            ErrorKind::IO,
            std::format("Failed to create dir: {}: {}",
                        safe_path_to_string(parent_dir), ec.message()),
            move.from, move.to, i);
      }
    }

    IOManager::log(std::format("Moving '{}' -> '{}'",
                               safe_path_to_string(move.from),
                               safe_path_to_string(move.to)));
    fs::rename(move.from, move.to, ec);
    if (ec) {
      throw SweepError(ErrorKind::Move,
                       std::format("Failed to move '{}' -> '{}': {}",
                                   safe_path_to_string(move.from),
                                   safe_path_to_string(move.to), ec.message()),
                       move.from, move.to, i);
    }
  }
  IOManager::log(
      std::format("Archived {} folders successfully.", plan.moves.size()));
}
