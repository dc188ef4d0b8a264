#pragma once

#include <string_view>
#include <vector>

#include "types.hpp"

class Organizer {
 public:
  explicit Organizer(fs::path targetDir);

  // Category folder for a lowercased extension without the leading dot.
  static std::string_view category_for(std::string_view ext);

  std::vector<Action> generate_plan() const;

  // Applies the moves in order, appending a journal entry for each one that
  // succeeds. Throws SweepError on the first failure.
  void apply_plan(const std::vector<Action>& plan,
                  std::vector<JournalEntry>& journal) const;

  // Plans, logs each move and applies it unless `dry_run` is set.
  std::vector<Action> organize(bool dry_run,
                               std::vector<JournalEntry>& journal) const;

 private:
  const fs::path m_targetDir;
};
