#include "StaleScanner.hpp"

#include <algorithm>
#include <chrono>
#include <functional>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {

void record_mtime(const fs::path& path,
                  std::optional<fs::file_time_type>& newest) {
  std::error_code ec;
  const auto mtime = fs::last_write_time(path, ec);
  if (ec) return;
  if (!newest || mtime > *newest) {
    newest = mtime;
  }
}

// `depth` is the depth of `dir` relative to the walk root.
void walk_tree(const fs::path& dir, int depth, int max_depth,
               std::optional<fs::file_time_type>& newest) {
  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied,
                            ec);
  if (ec) return;

  const fs::directory_iterator end{};
  for (; !ec && it != end; it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    const int entry_depth = depth + 1;
    record_mtime(entry.path(), newest);

    if (entry_depth >= max_depth) continue;
    std::error_code type_ec;
    if (entry.is_symlink(type_ec) || type_ec) continue;
    if (entry.is_directory(type_ec) && !type_ec) {
      walk_tree(entry.path(), entry_depth, max_depth, newest);
    }
  }
}

}  // namespace

std::optional<fs::file_time_type> StaleScanner::newest_mtime_in_tree(
    const fs::path& dir, int max_depth) {
  std::optional<fs::file_time_type> newest;
  if (max_depth < 0) return newest;

  record_mtime(dir, newest);
  if (max_depth > 0) {
    walk_tree(dir, 0, max_depth, newest);
  }
  return newest;
}

fs::file_time_type StaleScanner::compute_cutoff(fs::file_time_type now,
                                                std::uint64_t older_than_days) {
  using Duration = fs::file_time_type::duration;
  using Rep = Duration::rep;

  const auto ticks_per_day = static_cast<std::uint64_t>(
      std::chrono::duration_cast<Duration>(std::chrono::days{1}).count());
  // Exact distance to the oldest representable time; unsigned arithmetic
  // cannot overflow here because now >= min.
  const std::uint64_t headroom =
      static_cast<std::uint64_t>(now.time_since_epoch().count()) -
      static_cast<std::uint64_t>(
          fs::file_time_type::min().time_since_epoch().count());

  if (older_than_days > headroom / ticks_per_day) {
    throw SweepError(
        ErrorKind::Compute,
        std::format("Failed to compute cutoff time: {} days reaches before "
                    "the oldest representable time",
                    older_than_days));
  }

  const std::uint64_t cutoff_ticks =
      static_cast<std::uint64_t>(now.time_since_epoch().count()) -
      older_than_days * ticks_per_day;
  return fs::file_time_type(Duration(static_cast<Rep>(cutoff_ticks)));
}

std::vector<StaleScanner::TimestampProbe> StaleScanner::default_probes(
    int max_depth) {
  return {
      [max_depth](const fs::path& p) {
        return newest_mtime_in_tree(p, max_depth);
      },
      [](const fs::path& p) -> std::optional<fs::file_time_type> {
        std::error_code ec;
        const auto mtime = fs::last_write_time(p, ec);
        if (ec) return std::nullopt;
        return mtime;
      },
  };
}

fs::file_time_type StaleScanner::effective_timestamp(
    const fs::path& dir, const std::vector<TimestampProbe>& probes) {
  for (const auto& probe : probes) {
    if (auto mtime = probe(dir)) {
      return *mtime;
    }
  }
  IOManager::log(std::format(
      "Warning: No readable timestamp for '{}'. Treating it as stale.",
      safe_path_to_string(dir)));
  return fs::file_time_type::min();
}

ScanReport StaleScanner::scan(const fs::path& root,
                              std::uint64_t older_than_days, int max_depth) {
  return scan(root, older_than_days, default_probes(max_depth));
}

ScanReport StaleScanner::scan(const fs::path& root,
                              std::uint64_t older_than_days,
                              const std::vector<TimestampProbe>& probes) {
  std::error_code ec;
  const fs::path canonical_root = fs::canonical(root, ec);
  if (ec) {
    throw SweepError(ErrorKind::Path,
                     std::format("Cannot access path: {}: {}",
                                 safe_path_to_string(root), ec.message()),
                     root);
  }

  const fs::file_time_type cutoff =
      compute_cutoff(fs::file_time_type::clock::now(), older_than_days);

  IOManager::log(std::format("Scanning '{}' for folders older than {} days...",
                             safe_path_to_string(canonical_root),
                             older_than_days));

  fs::directory_iterator it(canonical_root, ec);
  if (ec) {
    throw SweepError(ErrorKind::Path,
                     std::format("read_dir failed: {}: {}",
                                 safe_path_to_string(canonical_root),
                                 ec.message()),
                     canonical_root);
  }

  ScanReport report;
  report.root = canonical_root;
  report.older_than_days = older_than_days;

  for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) break;
    const fs::path path = it->path();

    std::error_code type_ec;
    if (!it->is_directory(type_ec) || type_ec) continue;

    if (safe_path_to_string(path.filename()).starts_with('.')) continue;

    ++report.scanned_count;
    ProjectItem item{path, effective_timestamp(path, probes)};
    if (item.last_modified <= cutoff) {
      report.stale.push_back(std::move(item));
    } else {
      report.fresh.push_back(std::move(item));
    }
  }

  if (ec) {
    throw SweepError(ErrorKind::Path,
                     std::format("read_dir failed: {}: {}",
                                 safe_path_to_string(canonical_root),
                                 ec.message()),
                     canonical_root);
  }

  std::stable_sort(report.stale.begin(), report.stale.end(),
                   [](const ProjectItem& a, const ProjectItem& b) {
                     return a.last_modified < b.last_modified;
                   });

  IOManager::log(std::format("Scan complete. {} folders scanned, {} stale.",
                             report.scanned_count, report.stale.size()));
  return report;
}
