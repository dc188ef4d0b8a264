#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "types.hpp"

namespace StaleScanner {
// One way of reading a project folder's age; nullopt when it cannot tell.
using TimestampProbe =
    std::function<std::optional<fs::file_time_type>(const fs::path&)>;

// Newest modification time among `dir` and the entries up to `max_depth`
// levels below it. Unreadable entries are skipped; returns nullopt when
// nothing at all could be stat-ed. Never throws.
std::optional<fs::file_time_type> newest_mtime_in_tree(
    const fs::path& dir, int max_depth = kDefaultTreeDepth);

// now - older_than_days. Throws SweepError(Compute) if the result would fall
// below the oldest representable file time.
fs::file_time_type compute_cutoff(fs::file_time_type now,
                                  std::uint64_t older_than_days);

// The tree walk bounded by `max_depth`, then the folder's own mtime.
std::vector<TimestampProbe> default_probes(int max_depth);

// First time any probe yields, in order. When all fail the folder gets the
// oldest representable time and thus counts as stale.
fs::file_time_type effective_timestamp(
    const fs::path& dir, const std::vector<TimestampProbe>& probes);

// Partitions the non-hidden immediate subdirectories of `root` into stale
// and fresh project folders. Throws SweepError(Path) when `root` cannot be
// resolved or listed, SweepError(Compute) on a bad threshold.
ScanReport scan(const fs::path& root, std::uint64_t older_than_days,
                int max_depth = kDefaultTreeDepth);

// Same, dating each folder with `probes` instead of default_probes().
ScanReport scan(const fs::path& root, std::uint64_t older_than_days,
                const std::vector<TimestampProbe>& probes);
}  // namespace StaleScanner
