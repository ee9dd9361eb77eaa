/**
 * @file filebrowserui.cpp
 * @brief Implementation of the FileBrowserUI class
 *
 * Key implementation areas:
 * - Per-state key dispatch
 * - Filter editing
 * - Delete confirmation with safety checks
 * - Rendering of listing, file view, input box, help and status lines
 *
 * @see FileBrowserUI
 * @see filebrowserui.hpp
 */

#include "filebrowserui.hpp"
#include "browsererror.hpp"
#include "filesafety.hpp"
#include "utils.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

// ============================================================================
// UI SETUP
// ============================================================================

/**
 * @brief Builds the screen layout and hooks up the global key handler
 *
 * The document is a single renderer; all keys go through handleEvent(),
 * since which key does what depends on the session state rather than on
 * component focus.
 */
void FileBrowserUI::initialize() {
  m_menuEntries = ::getMenuEntries(); // from uicontrol.hpp

  auto layout = Renderer([this] {
    return vbox({renderMainView() | flex, renderInput(), renderHelp(),
                 text("STATUS: " + m_currentStatus) |
                     color(Color::GrayLight)});
  });

  m_document = CatchEvent(layout, [this](Event event) {
    if (m_dialogActive) {
      return false;
    }
    return handleEvent(event);
  });
}

/**
 * @brief Starts the FTXUI screen loop
 *
 * @see handleEvent()
 */
void FileBrowserUI::run() {
  m_screen.Loop(m_document);
  spdlog::debug("UI loop finished, last status: {}", m_currentStatus);
}

// ============================================================================
// EVENT DISPATCH
// ============================================================================

bool FileBrowserUI::handleEvent(const Event &event) {
  if (event.is_mouse()) {
    return false;
  }

  const NavigationState &state = m_session.state();

  if (state.isFileView()) {
    return handleFileViewEvent(event);
  }
  if (state.isHistorySearch()) {
    return handleHistoryEvent(event);
  }
  if (state.isEdit()) {
    return handleEditSearchEvent(event);
  }
  return handleNormalSearchEvent(event);
}

void FileBrowserUI::runGuarded(const std::function<void()> &action) {
  try {
    action();
  } catch (const BrowserError &e) {
    m_currentStatus = e.what();
    spdlog::error("{}", e.what());
  } catch (const std::exception &e) {
    m_currentStatus = std::string("Unexpected error: ") + e.what();
    spdlog::error("Unexpected error: {}", e.what());
  }
}

/**
 * @brief (Normal, Search): shortcut keys and cursor movement
 */
bool FileBrowserUI::handleNormalSearchEvent(const Event &event) {
  if (event == Event::Character('j') || event == Event::ArrowDown) {
    m_session.moveDown();
    return true;
  }
  if (event == Event::Character('k') || event == Event::ArrowUp) {
    m_session.moveUp();
    return true;
  }
  if (event == Event::Return) {
    submitHighlighted();
    return true;
  }

  if (auto action = findActionByKey(event.input())) {
    handleShortcut(*action);
    return true;
  }
  return false;
}

/**
 * @brief (Edit, Search): typing edits the filter
 */
bool FileBrowserUI::handleEditSearchEvent(const Event &event) {
  if (event == Event::Tab) {
    m_session.toggleEdit();
    return true;
  }
  if (event == Event::ArrowUp) {
    m_session.moveUp();
    return true;
  }
  if (event == Event::ArrowDown) {
    m_session.moveDown();
    return true;
  }
  if (event == Event::Return) {
    submitHighlighted();
    return true;
  }
  if (event == Event::Escape) {
    m_input.clear();
    runGuarded([this] { m_session.updateFilter(m_input); });
    return true;
  }
  return editInput(event);
}

/**
 * @brief (Edit, History): typing filters the visited directories
 */
bool FileBrowserUI::handleHistoryEvent(const Event &event) {
  if (event == Event::Tab) {
    m_input.clear();
    runGuarded([this] { m_session.leaveHistory(); });
    return true;
  }
  if (event == Event::ArrowUp) {
    m_session.moveUp();
    return true;
  }
  if (event == Event::ArrowDown) {
    m_session.moveDown();
    return true;
  }
  if (event == Event::Return) {
    submitHighlighted();
    return true;
  }
  return editInput(event);
}

/**
 * @brief (Normal, FileView): scrolling, 'q' closes the file
 */
bool FileBrowserUI::handleFileViewEvent(const Event &event) {
  bool handled = true;

  runGuarded([&] {
    if (event == Event::Character('q')) {
      m_session.closeFile();
    } else if (event == Event::Character('j') || event == Event::ArrowDown) {
      m_session.scrollDown();
    } else if (event == Event::Character('k') || event == Event::ArrowUp) {
      m_session.scrollUp();
    } else if (event == Event::Character('h') || event == Event::ArrowLeft) {
      m_session.scrollLeft();
    } else if (event == Event::Character('l') || event == Event::ArrowRight) {
      m_session.scrollRight();
    } else if (event == Event::PageDown) {
      m_session.scrollDown(FILE_PAGE_ROWS);
    } else if (event == Event::PageUp) {
      m_session.scrollUp(FILE_PAGE_ROWS);
    } else if (event == Event::Home) {
      m_session.scrollHome();
    } else if (event == Event::End) {
      m_session.scrollEnd(FILE_PAGE_ROWS);
    } else {
      handled = false;
    }
  });

  return handled;
}

// ============================================================================
// ACTIONS
// ============================================================================

/**
 * @brief Executes a browse shortcut
 *
 * @see ActionMap
 */
void FileBrowserUI::handleShortcut(ActionID action) {
  switch (action) {
  case ActionID::Quit:
    m_screen.Exit();
    return;

  case ActionID::EditFilter:
    m_session.toggleEdit();
    return;

  case ActionID::Expand:
    runGuarded([this] {
      m_session.expand();
      m_currentStatus = "Expanded to level " +
                         std::to_string(m_session.engine().expandLevel());
    });
    return;

  case ActionID::Collapse:
    runGuarded([this] {
      m_session.collapse();
      m_currentStatus = "Collapsed to level " +
                         std::to_string(m_session.engine().expandLevel());
    });
    return;

  case ActionID::Refresh:
    runGuarded([this] {
      m_session.refresh();
      m_currentStatus =
          "Refreshed " + m_session.engine().currentDirectory().string();
    });
    return;

  case ActionID::History:
    m_input.clear();
    runGuarded([this] { m_session.enterHistory(); });
    return;

  case ActionID::ToParent:
    m_input.clear();
    runGuarded([this] {
      if (m_session.toParent() == SubmitOutcome::Nothing) {
        m_currentStatus = "Already at the filesystem root.";
      }
    });
    return;

  case ActionID::Delete:
    confirmAndDelete();
    return;
  }
}

/**
 * @brief Handles text input of the input box
 *
 * Backspace removes the last UTF-8 character; printable characters are
 * appended. Either way the listing is re-filtered and the cursor moves back
 * to the top.
 */
bool FileBrowserUI::editInput(const Event &event) {
  if (event == Event::Backspace) {
    if (m_input.empty()) {
      return true;
    }
    // Drop UTF-8 continuation bytes together with their lead byte
    while (!m_input.empty() &&
           (static_cast<unsigned char>(m_input.back()) & 0xC0) == 0x80) {
      m_input.pop_back();
    }
    if (!m_input.empty()) {
      m_input.pop_back();
    }
  } else if (event.is_character()) {
    m_input += event.character();
  } else {
    return false;
  }

  runGuarded([this] { m_session.updateFilter(m_input); });
  return true;
}

void FileBrowserUI::submitHighlighted() {
  runGuarded([this] {
    const SubmitOutcome outcome = m_session.submit();

    switch (outcome) {
    case SubmitOutcome::Nothing:
      m_currentStatus = "Nothing selected.";
      return;
    case SubmitOutcome::EnteredDirectory:
      m_input.clear();
      m_currentStatus =
          "Loaded " + std::to_string(m_session.engine().selected().size()) +
          " items";
      return;
    case SubmitOutcome::OpenedFile: {
      const FilePreview *preview = m_session.preview();
      m_currentStatus =
          "File: " + preview->path().string() + " (" +
          formatBytes(static_cast<long long>(preview->fileSize())) + ")";
      return;
    }
    case SubmitOutcome::DroppedStale:
      m_currentStatus = "Removed a folder that no longer exists from history.";
      break;
    case SubmitOutcome::Refreshed:
      m_currentStatus = "Entry no longer exists, folder refreshed.";
      break;
    }

    m_input.clear();
    m_session.updateFilter(m_input);
  });
}

// ============================================================================
// DELETE OPERATIONS
// ============================================================================

void FileBrowserUI::confirmAndDelete() {
  const Entry *entry = m_session.highlightedEntry();
  if (entry == nullptr || entry->isParentShortcut()) {
    m_currentStatus = "No file selected.";
    return;
  }

  const auto status = FileSafety::checkDeletion(entry->fullPath());
  if (!FileSafety::mayDelete(status)) {
    m_currentStatus = FileSafety::getStatusMessage(status, entry->fullPath());
    return;
  }

  const bool removable =
      status == FileSafety::DeletionStatus::WarningRemovableMedia;
  if (!showDeleteConfirmation(*entry, removable)) {
    m_currentStatus = "Delete cancelled.";
    return;
  }

  const DeleteResult result = m_session.deleteHighlighted();
  m_currentStatus = (result.m_deleted ? "✓ " : "✗ ") + result.m_message;
}

/**
 * @brief Displays confirmation dialog before deletion
 *
 * Dialog contents:
 * - Warning text (red): "DELETE FILE?" or "DELETE DIRECTORY? (RECURSIVE)"
 * - Path (yellow) and, for files, size
 * - Removable media warning (magenta) if applicable
 * - Instructions: 'y' to confirm, 'n' or ESC to cancel
 */
bool FileBrowserUI::showDeleteConfirmation(const Entry &entry, bool removable) {
  m_dialogActive = true;
  bool confirmed = false;
  auto dialogScreen = ScreenInteractive::TerminalOutput();

  const std::string path = entry.fullPath().string();
  std::string sizeLine;
  if (entry.isFile()) {
    std::error_code ec;
    const auto bytes = std::filesystem::file_size(entry.fullPath(), ec);
    sizeLine = ec ? "Size: unknown"
                   : "Size: " + formatBytes(static_cast<long long>(bytes));
  }

  auto dialogRenderer = Renderer([&] {
    std::string warning =
        entry.isFile() ? "DELETE FILE?" : "DELETE DIRECTORY? (RECURSIVE)";

    std::vector<Element> content = {
        text(warning) | bold | color(Color::Red) | hcenter, separator(),
        text("Path: " + path) | color(Color::Yellow)};

    if (!sizeLine.empty()) {
      content.push_back(text(sizeLine));
    }

    if (removable) {
      content.push_back(separator());
      content.push_back(text("This is on REMOVABLE MEDIA") |
                        color(Color::Magenta) | bold);
    }

    content.push_back(separator());
    content.push_back(
        hbox({text("Press ") | color(Color::GrayLight),
              text("'y'") | bold | color(Color::Green),
              text(" to confirm, ") | color(Color::GrayLight),
              text("'n'") | bold | color(Color::Red),
              text(" or ") | color(Color::GrayLight), text("ESC") | bold,
              text(" to cancel") | color(Color::GrayLight)}) |
        hcenter);

    return vbox(content) | border | center;
  });

  auto dialogHandler = CatchEvent(dialogRenderer, [&](Event event) {
    if (event == Event::Character('y') || event == Event::Character('Y')) {
      confirmed = true;
      dialogScreen.Exit();
      return true;
    }
    if (event == Event::Character('n') || event == Event::Character('N') ||
        event == Event::Escape) {
      confirmed = false;
      dialogScreen.Exit();
      return true;
    }
    return false;
  });

  dialogScreen.Loop(dialogHandler);
  m_dialogActive = false;

  return confirmed;
}

// ============================================================================
// RENDERING
// ============================================================================

Element FileBrowserUI::renderMainView() {
  if (m_session.preview() != nullptr) {
    return renderFileView();
  }
  return renderListing();
}

std::string FileBrowserUI::listingTitle() const {
  const auto &engine = m_session.engine();

  if (m_session.state().isHistorySearch()) {
    return "History: " + std::to_string(engine.selected().size()) + " items";
  }

  std::string title = engine.currentDirectory().string();
  try {
    title += " " + formatTimestamp(engine.currentSnapshot().loadedAt);
  } catch (const BrowserError &e) {
    spdlog::debug("No load time for title: {}", e.what());
  }
  if (engine.expandLevel() > 0) {
    title += " [level " + std::to_string(engine.expandLevel()) + "]";
  }
  return title;
}

std::string FileBrowserUI::rowLabel(const Entry &entry) const {
  try {
    return m_session.engine().displayText(entry);
  } catch (const BrowserError &) {
    return entry.fullPath().string();
  }
}

/**
 * @brief Listing with the highlighted row inverted
 *
 * Directories are drawn in light cyan. The highlighted row carries focus so
 * the frame scrolls to keep it visible.
 */
Element FileBrowserUI::renderListing() {
  const auto &selected = m_session.engine().selected();
  const auto highlight = m_session.highlightIndex();

  Elements rows;
  rows.reserve(selected.size());
  for (std::size_t i = 0; i < selected.size(); ++i) {
    const Entry &entry = selected[i];
    auto row = text(rowLabel(entry));
    if (!entry.isFile()) {
      row = row | color(Color::CyanLight);
    }
    if (highlight && *highlight == i) {
      row = row | inverted | focus;
    }
    rows.push_back(row);
  }

  if (rows.empty()) {
    rows.push_back(text("(no matching entries)") | dim);
  }

  return vbox({text(listingTitle()) | bold | color(Color::Green), separator(),
               vbox(std::move(rows)) | vscroll_indicator | frame | flex}) |
         border;
}

/**
 * @brief Visible window of the opened file
 *
 * Rows start at the session's vertical offset, columns are cut at its
 * horizontal offset (bytes).
 */
Element FileBrowserUI::renderFileView() {
  const FilePreview *preview = m_session.preview();
  const auto &lines = preview->lines();

  const int terminalHeight = Terminal::Size().dimy;
  const auto visible =
      static_cast<std::size_t>(std::max(1, terminalHeight - 8));

  const std::size_t first = std::min(m_session.scrollRow(), lines.size());
  const std::size_t last = std::min(first + visible, lines.size());
  const std::size_t column = m_session.scrollColumn();

  Elements rows;
  for (std::size_t i = first; i < last; ++i) {
    const std::string &line = lines[i];
    rows.push_back(text(column < line.size() ? line.substr(column) : ""));
  }

  const std::string position = " [" + std::to_string(first) + "/" +
                               std::to_string(preview->rowCount()) + "]";

  return vbox({text(preview->path().string() + position) | bold |
                   color(Color::Green),
               separator(), vbox(std::move(rows)) | flex}) |
         border;
}

Element FileBrowserUI::renderInput() {
  auto box = window(text("Input"), text(m_input));
  if (m_session.state().isEdit()) {
    box = box | color(Color::Yellow);
  }
  return box;
}

Element FileBrowserUI::renderHelp() {
  const NavigationState &state = m_session.state();

  if (state.isFileView()) {
    return text("FileView  (q) Close  (j/k/h/l) Scroll  (PgUp/PgDn) Page  "
                "(Home/End) Jump") |
           color(Color::BlueLight);
  }
  if (state.isHistorySearch()) {
    return text("FileSearchHistory  type to filter  (Enter) Open  "
                "(Tab) Back to FileSearch") |
           color(Color::BlueLight);
  }
  if (state.isEdit()) {
    return text("FileSearch  type to filter  (Esc) Clear  (Enter) Open  "
                "(Tab) Normal mode") |
           color(Color::BlueLight);
  }

  Elements entries;
  for (const auto &entry : m_menuEntries) {
    entries.push_back(text(entry + "  "));
  }
  return hbox(std::move(entries)) | color(Color::BlueLight);
}
