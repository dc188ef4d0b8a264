#pragma once

#include "types.hpp"

namespace Archiver {
// Plans moving every stale folder of `report` into
// dest_root/<current YYYY-MM>/<name>. Folders that are dest_root itself or
// lie inside it are left out. Only performs existence checks.
ArchivePlan build_plan(const ScanReport& report, const fs::path& dest_root);

// Applies the moves in order and stops at the first failure, leaving earlier
// moves in place. Throws SweepError(IO) if a destination folder cannot be
// created and SweepError(Move) if a rename fails; index() is the failing move.
void apply_plan(const ArchivePlan& plan);
}  // namespace Archiver
