#pragma once

#include <vector>

#include "types.hpp"

// Home trash as described by the freedesktop.org Trash specification.
namespace TrashBin {
// $XDG_DATA_HOME/Trash, falling back to $HOME/.local/share/Trash.
fs::path trash_home();

// Moves `path` into <trashHome>/files and records where it came from in
// <trashHome>/info. Returns the new location. An item on another
// filesystem goes to the trash of its own mount instead. Throws
// SweepError(Trash).
fs::path send_to_trash(const fs::path& path, const fs::path& trashHome);

// Trashes `path` into <topdir>/.Trash-<uid>, the per-user trash of a top
// directory. The recorded Path is relative to `topdir`.
fs::path send_to_topdir_trash(const fs::path& path, const fs::path& topdir);

// Outermost ancestor of `path` on the same device, i.e. its mount point.
fs::path mount_root(const fs::path& path);

// Trashes the items in order and stops at the first failure.
void delete_to_trash(const std::vector<ProjectItem>& items,
                     const fs::path& trashHome);
}  // namespace TrashBin
