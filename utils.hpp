#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <set>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// file extensions.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

// Returns target_path unchanged if nothing exists there. Otherwise appends
// "_1", "_2", ... to the whole path string and returns the first candidate
// that does not exist and is not in `reserved`. Only checks existence; the
// result is not reserved against other processes.
inline fs::path avoid_collision(const fs::path& target_path,
                                const std::set<fs::path>& reserved = {}) {
  auto is_taken = [&reserved](const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec) || reserved.contains(p);
  };
  if (!is_taken(target_path)) {
    return target_path;
  }

  const std::string base = safe_path_to_string(target_path);
  int counter = 1;
  fs::path candidate;
  do {
    const std::string candidate_str = std::format("{}_{}", base, counter++);
    candidate = fs::path(reinterpret_cast<const char8_t*>(candidate_str.c_str()));
  } while (is_taken(candidate));

  return candidate;
}

// Picks a free file name inside `dir` for `file_name` by appending "_N" to
// the name itself ("report.pdf" -> "report.pdf_1").
inline fs::path generate_unique_path(const fs::path& dir,
                                     const fs::path& file_name) {
  fs::path target = dir / file_name;
  if (!fs::exists(target)) {
    return target;
  }

  const std::string name_str = safe_path_to_string(file_name);
  int counter = 1;
  do {
    const std::string new_name = std::format("{}_{}", name_str, counter++);
    target = dir / fs::path(reinterpret_cast<const char8_t*>(new_name.c_str()));
  } while (fs::exists(target));

  return target;
}

// True when `path` is `base` itself or lies below it, compared component by
// component on the lexically normalized forms.
inline bool is_within(const fs::path& path, const fs::path& base) {
  fs::path b = base.lexically_normal();
  if (b.filename().empty() && b.has_relative_path()) {
    b = b.parent_path();
  }
  const fs::path p = path.lexically_normal();
  if (b.empty()) {
    return false;
  }
  auto [b_it, p_it] = std::mismatch(b.begin(), b.end(), p.begin(), p.end());
  return b_it == b.end();
}

// "YYYY-MM" of the current local calendar month.
inline std::string current_month_bucket() {
  const std::chrono::zoned_time local{
      std::chrono::current_zone(),
      std::chrono::floor<std::chrono::seconds>(
          std::chrono::system_clock::now())};
  return std::format("{:%Y-%m}", local);
}

// Local "YYYY-MM-DD HH:MM" for display. The oldest representable time marks
// folders whose timestamp could not be read at all.
inline std::string format_file_time(fs::file_time_type t) {
  if (t == fs::file_time_type::min()) {
    return "unknown";
  }
  const auto sys = std::chrono::clock_cast<std::chrono::system_clock>(t);
  const std::chrono::zoned_time local{
      std::chrono::current_zone(),
      std::chrono::floor<std::chrono::seconds>(sys)};
  return std::format("{:%Y-%m-%d %H:%M}", local);
}
