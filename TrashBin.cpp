#include "TrashBin.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {

// Percent-encodes everything except RFC 3986 unreserved characters and '/'.
std::string encode_trash_path(std::string_view raw) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(raw.size());
  for (char ch : raw) {
    const auto c = static_cast<unsigned char>(ch);
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                            c == '.' || c == '~' || c == '/';
    if (unreserved) {
      out += ch;
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string deletion_date() {
  const std::chrono::zoned_time local{
      std::chrono::current_zone(),
      std::chrono::floor<std::chrono::seconds>(
          std::chrono::system_clock::now())};
  return std::format("{:%Y-%m-%dT%H:%M:%S}", local);
}

[[noreturn]] void fail(const fs::path& path, std::string_view what,
                       const std::error_code& ec) {
  throw SweepError(ErrorKind::Trash,
                   std::format("Failed to move '{}' to trash: {}: {}",
                               safe_path_to_string(path), what, ec.message()),
                   path);
}

// Absolute, normalized path of an existing item, without a trailing slash.
fs::path resolve_item(const fs::path& path) {
  std::error_code ec;
  fs::path original = fs::absolute(path, ec).lexically_normal();
  if (ec) fail(path, "cannot resolve path", ec);
  if (original.filename().empty()) original = original.parent_path();
  if (!fs::exists(fs::symlink_status(original, ec))) {
    fail(path, "no such file or directory",
         std::make_error_code(std::errc::no_such_file_or_directory));
  }
  return original;
}

// Writes the .trashinfo, then renames `original` into <trashDir>/files.
// Returns the rename error with the info file removed again; other failures
// throw.
std::error_code move_into(const fs::path& original, const fs::path& trashDir,
                          const std::string& recorded_path,
                          fs::path& trashed_path) {
  std::error_code ec;
  const fs::path files_dir = trashDir / "files";
  const fs::path info_dir = trashDir / "info";
  fs::create_directories(files_dir, ec);
  if (ec) fail(original, "cannot create trash folder", ec);
  fs::create_directories(info_dir, ec);
  if (ec) fail(original, "cannot create trash folder", ec);

  // The name must be free in both files/ and info/.
  const std::string base_name = safe_path_to_string(original.filename());
  std::string trash_name = base_name;
  for (int counter = 1; fs::exists(files_dir / trash_name) ||
                        fs::exists(info_dir / (trash_name + ".trashinfo"));
       ++counter) {
    trash_name = std::format("{}_{}", base_name, counter);
  }

  const fs::path info_path = info_dir / (trash_name + ".trashinfo");
  trashed_path = files_dir / trash_name;
  {
    std::ofstream info(info_path);
    info << "[Trash Info]\n"
         << "Path=" << encode_trash_path(recorded_path) << "\n"
         << "DeletionDate=" << deletion_date() << "\n";
    info.flush();
    if (!info) {
      fail(original, "cannot write trash info",
           std::make_error_code(std::errc::io_error));
    }
  }

  fs::rename(original, trashed_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(info_path, cleanup_ec);
  }
  return ec;
}

}  // namespace

fs::path TrashBin::trash_home() {
  const char* data_home = std::getenv("XDG_DATA_HOME");
  if (data_home && *data_home) {
    return fs::path(data_home) / "Trash";
  }
  const char* home_dir = std::getenv("HOME");
  if (home_dir && *home_dir) {
    return fs::path(home_dir) / ".local/share/Trash";
  }
  throw SweepError(ErrorKind::Trash,
                   "Cannot locate the trash: neither XDG_DATA_HOME nor HOME "
                   "is set");
}

fs::path TrashBin::mount_root(const fs::path& path) {
  struct stat st {};
  if (::lstat(path.c_str(), &st) != 0) {
    fail(path, "cannot stat", std::error_code(errno, std::generic_category()));
  }
  const dev_t device = st.st_dev;

  fs::path top = path;
  while (top.has_relative_path()) {
    const fs::path parent = top.parent_path();
    if (::stat(parent.c_str(), &st) != 0 || st.st_dev != device) break;
    top = parent;
  }
  return top;
}

fs::path TrashBin::send_to_trash(const fs::path& path,
                                 const fs::path& trashHome) {
  const fs::path original = resolve_item(path);

  fs::path trashed_path;
  std::error_code ec = move_into(original, trashHome,
                                 safe_path_to_string(original), trashed_path);
  if (ec == std::errc::cross_device_link) {
    IOManager::log(std::format(
        "'{}' is on another filesystem than '{}'. Using that filesystem's "
        "trash.",
        safe_path_to_string(original), safe_path_to_string(trashHome)));
    return send_to_topdir_trash(original, mount_root(original));
  }
  if (ec) fail(original, "move failed", ec);

  IOManager::log(std::format("Trashed '{}' -> '{}'",
                             safe_path_to_string(original),
                             safe_path_to_string(trashed_path)));
  return trashed_path;
}

fs::path TrashBin::send_to_topdir_trash(const fs::path& path,
                                        const fs::path& topdir) {
  const fs::path original = resolve_item(path);
  if (!is_within(original, topdir)) {
    fail(original, "not below " + safe_path_to_string(topdir),
         std::make_error_code(std::errc::invalid_argument));
  }
  const fs::path trash_dir = topdir / std::format(".Trash-{}", ::getuid());

  std::error_code ec;
  if (!fs::exists(trash_dir, ec)) {
    fs::create_directory(trash_dir, ec);
    if (ec) fail(original, "cannot create trash folder", ec);
    fs::permissions(trash_dir, fs::perms::owner_all, ec);
    if (ec) fail(original, "cannot create trash folder", ec);
  }

  // Paths in a top directory trash are stored relative to that directory.
  fs::path trashed_path;
  ec = move_into(original, trash_dir,
                 safe_path_to_string(original.lexically_relative(topdir)),
                 trashed_path);
  if (ec) fail(original, "move failed", ec);

  IOManager::log(std::format("Trashed '{}' -> '{}'",
                             safe_path_to_string(original),
                             safe_path_to_string(trashed_path)));
  return trashed_path;
}

void TrashBin::delete_to_trash(const std::vector<ProjectItem>& items,
                               const fs::path& trashHome) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    try {
      send_to_trash(items[i].path, trashHome);
    } catch (const SweepError& e) {
      throw SweepError(e.kind(), e.what(), e.path(), e.target(), i);
    }
  }
  IOManager::log(
      std::format("Moved {} folders to the trash.", items.size()));
}
