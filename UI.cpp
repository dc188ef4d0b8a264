#include "UI.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <utility>

#include "Archiver.hpp"
#include "IOManager.hpp"
#include "StaleScanner.hpp"
#include "TrashBin.hpp"
#include "utils.hpp"

using namespace ftxui;

UI::UI(const Config& config, const fs::path& rootDir, const fs::path& destDir)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_config(config),
      m_rootDir(rootDir),
      m_destDir(destDir),
      m_status_text("Ready. Press 'Scan' to begin."),
      m_scan_button_label("  Scan  ") {
  IOManager::log("Initializing UI components...");

  try {
    m_list_component =
        Renderer([&] {
          if (m_entries.empty()) {
            return text(m_status_text) | center;
          }
          Elements elements;
          for (size_t i = 0; i < m_entries.size(); ++i) {
            Element entry =
                text((m_selections[i] ? "[X] " : "[ ] ") + m_entries[i]);
            if ((int)i == m_selected_entry) {
              entry = entry | inverted | focus;
            }
            elements.push_back(entry);
          }
          return vbox(elements) | vscroll_indicator | frame;
        }) |
        CatchEvent([&](Event event) {
          if (m_is_operation_in_progress) {
            return false;
          }
          if (event.is_mouse()) return false;
          if (event == Event::ArrowUp && m_selected_entry > 0) {
            m_selected_entry--;
          } else if (event == Event::ArrowDown &&
                     m_selected_entry < (int)m_entries.size() - 1) {
            m_selected_entry++;
          } else if (event == Event::Character(' ') && !m_selections.empty()) {
            m_selections[m_selected_entry] = !m_selections[m_selected_entry];
          } else {
            return false;
          }
          return true;
        });

    m_log_component = Renderer([&] {
      Elements logs;
      {
        std::scoped_lock lock(m_log_mutex);
        for (const auto& msg : m_log_messages) {
          logs.push_back(text(msg));
        }
      }
      return vbox(logs) | vscroll_indicator | frame | flex;
    });

  } catch (const std::exception& e) {
    IOManager::log(std::format(
        "CRITICAL: Failed to initialize UI components: {}", e.what()));
    throw;
  }
}

void UI::AddLogMessage(std::string_view message) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_messages.push_back(std::string(message));
    if (m_log_messages.size() > 100) {
      m_log_messages.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void UI::update_ui_from_report() {
  m_entries.clear();
  m_selections.clear();
  m_selected_entry = 0;
  if (!m_report) return;

  for (const auto& item : m_report->stale) {
    m_entries.push_back(std::format("{}  (last modified: {})",
                                    safe_path_to_string(item.path.filename()),
                                    format_file_time(item.last_modified)));
    m_selections.push_back(true);
  }
  if (m_report->stale.empty()) {
    m_status_text = std::format("No stale folders among {} scanned.",
                                m_report->scanned_count);
  } else {
    m_status_text = std::format(
        "{} of {} folders are stale. Space toggles, 'a' archives, 't' trashes.",
        m_report->stale.size(), m_report->scanned_count);
  }
}

std::vector<ProjectItem> UI::selected_items() const {
  std::vector<ProjectItem> items;
  if (!m_report) return items;
  for (size_t i = 0; i < m_report->stale.size(); ++i) {
    if (m_selections[i]) {
      items.push_back(m_report->stale[i]);
    }
  }
  return items;
}

// Runs `work` and then a fresh scan on a worker thread. Only one operation
// runs at a time, so the core never sees concurrent calls.
void UI::run_operation(
    std::string status, std::vector<ProjectItem> items,
    std::function<std::string(const std::vector<ProjectItem>&)> work) {
  if (m_is_operation_in_progress) return;
  m_is_operation_in_progress = true;
  m_workers.reap_finished();
  m_status_text = std::move(status);

  m_workers.start([self = shared_from_this(), items = std::move(items),
                   work = std::move(work)](const std::stop_token& stoken) {
    OperationOutcome outcome = run_then_rescan(
        [&] { return work(items); },
        [&] {
          return StaleScanner::scan(self->m_rootDir,
                                    self->m_config.scan_older_than_days,
                                    self->m_config.scan_max_depth);
        });
    if (!stoken.stop_requested()) {
      self->m_screen.Post([self, outcome = std::move(outcome)]() mutable {
        self->m_report = std::move(outcome.report);
        self->update_ui_from_report();
        if (!outcome.status.empty()) {
          self->m_status_text = std::move(outcome.status);
        }
      });
    }
    self->m_is_operation_in_progress = false;
  });
}

void UI::start_scan() {
  run_operation("Scanning... Please wait.", {},
                [](const std::vector<ProjectItem>&) { return std::string(); });
}

void UI::archive_selected() {
  auto items = selected_items();
  if (items.empty()) {
    m_status_text = "Nothing selected to archive.";
    return;
  }
  ScanReport selection = *m_report;
  selection.stale = std::move(items);
  const fs::path dest = m_destDir;

  run_operation(
      "Archiving...", {},
      [selection = std::move(selection), dest](const std::vector<ProjectItem>&) {
        ArchivePlan plan = Archiver::build_plan(selection, dest);
        Archiver::apply_plan(plan);
        return std::format("Archived {} folders into '{}'.", plan.moves.size(),
                           safe_path_to_string(plan.dest_root /
                                               plan.month_bucket));
      });
}

void UI::trash_selected() {
  auto items = selected_items();
  if (items.empty()) {
    m_status_text = "Nothing selected to trash.";
    return;
  }
  run_operation("Moving to trash...", std::move(items),
                [](const std::vector<ProjectItem>& selected) {
                  TrashBin::delete_to_trash(selected, TrashBin::trash_home());
                  return std::format("Moved {} folders to the trash.",
                                     selected.size());
                });
}

void UI::run() {
  try {
    IOManager::set_log_handler(
        [this](std::string_view message) { this->AddLogMessage(message); });

    auto scan_button = Button(&m_scan_button_label, [this] { start_scan(); });
    auto archive_button = Button(" Archive (a) ", [this] {
      if (!m_is_operation_in_progress) archive_selected();
    });
    auto trash_button = Button(" Trash (t) ", [this] {
      if (!m_is_operation_in_progress) trash_selected();
    });
    auto quit_button = Button("  Quit  ", [this] {
      IOManager::log("Quit requested. Stopping worker threads...");
      m_workers.request_stop_all();
      m_screen.Exit();
    });

    auto top_menu = Container::Horizontal(
        {scan_button, archive_button, trash_button, quit_button});

    m_main_container = Container::Vertical({
        top_menu,
        m_list_component,
        m_log_component,
    });

    auto with_shortcuts = CatchEvent(m_main_container, [this](Event event) {
      if (m_is_operation_in_progress || !m_report) return false;
      if (event == Event::Character('a')) {
        archive_selected();
        return true;
      }
      if (event == Event::Character('t')) {
        trash_selected();
        return true;
      }
      return false;
    });

    auto final_renderer = Renderer(with_shortcuts, [&] {
      bool is_busy = m_is_operation_in_progress;
      m_scan_button_label = is_busy ? "  Busy...  " : "  Scan  ";

      auto top_pane = vbox(
          {hbox({text(" Sweeper ") | bold, filler(),
                 text(std::format("{}  (> {} days)",
                                  safe_path_to_string(m_rootDir),
                                  m_config.scan_older_than_days))}) |
               color(Color::White) | bgcolor(Color::Blue),
           top_menu->Render(), separator(), m_list_component->Render() | flex,
           separator(),
           hbox({text(" " + m_status_text), filler(),
                 text("Archive: " + safe_path_to_string(m_destDir) + " ") |
                     dim})});

      auto log_pane =
          vbox({text("Log Output") | bold, m_log_component->Render() | flex});

      return vbox({top_pane | flex_grow, separator(),
                   log_pane | size(HEIGHT, EQUAL, 10)}) |
             border;
    });

    IOManager::log("Starting UI event loop...");
    m_screen.Loop(final_renderer);
    IOManager::log("UI event loop exited. Waiting for threads to join...");

    m_workers = WorkerSet{};

    IOManager::log("All threads joined. Exiting.");
    IOManager::set_log_handler(nullptr);

  } catch (const std::exception& e) {
    IOManager::log(
        std::format("CRITICAL: Exception in UI::run(): {}", e.what()));
    throw;
  }
}
