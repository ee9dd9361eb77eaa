/**
 * @file browsersession.cpp
 * @brief Implementation of BrowserSession
 */

#include "browsersession.hpp"
#include "browsererror.hpp"
#include "config.hpp"
#include "filesafety.hpp"
#include "selection.hpp"

#include <algorithm>
#include <climits>
#include <system_error>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace fs = std::filesystem;

BrowserSession::BrowserSession(const fs::path &startDirectory,
                               std::size_t cacheCapacity,
                               std::uintmax_t maxPreviewBytes)
    : m_engine(m_state, m_reader, startDirectory, cacheCapacity),
      m_maxPreviewBytes(maxPreviewBytes) {}

BrowserSession::BrowserSession(const Config &config)
    : BrowserSession(config.startDirectory(), config.cacheCapacity(),
                     config.maxPreviewBytes()) {}

void BrowserSession::moveUp() {
  if (m_rawHighlightIndex > INT_MIN) {
    --m_rawHighlightIndex;
  }
}

void BrowserSession::moveDown() {
  if (m_rawHighlightIndex < INT_MAX) {
    ++m_rawHighlightIndex;
  }
}

std::optional<std::size_t> BrowserSession::highlightIndex() const {
  const auto &selected = m_engine.selected();
  if (selected.empty()) {
    return std::nullopt;
  }
  return wrapIndex(m_rawHighlightIndex, selected.size());
}

const Entry *BrowserSession::highlightedEntry() const {
  return safeAt(m_engine.selected(), highlightIndex());
}

void BrowserSession::updateFilter(const std::optional<std::string> &filter) {
  m_engine.update(filter);
  resetIndex();
}

SubmitOutcome BrowserSession::submit() {
  const auto index = highlightIndex();
  if (!index) {
    return SubmitOutcome::Nothing;
  }

  fs::path target;
  try {
    target = m_engine.submit(*index);
  } catch (const BrowserError &e) {
    if (e.kind() != ErrorKind::Path) {
      throw;
    }

    if (m_state.isHistorySearch()) {
      spdlog::warn("Dropping stale history entry: {}", e.what());
      m_engine.dropInvalidFolder(*index);
      return SubmitOutcome::DroppedStale;
    }

    spdlog::warn("Highlighted entry vanished, refreshing: {}", e.what());
    m_engine.refresh();
    return SubmitOutcome::Refreshed;
  }

  std::error_code ec;
  if (fs::is_directory(target, ec)) {
    if (m_state.isHistorySearch()) {
      m_state.toSearch();
    }
    m_engine.enter(target);
    resetIndex();
    return SubmitOutcome::EnteredDirectory;
  }

  m_preview = FilePreview::load(target, m_maxPreviewBytes);
  m_scrollRow = 0;
  m_scrollColumn = 0;
  m_state.toFileView();
  spdlog::info("Opened {}", target.string());
  return SubmitOutcome::OpenedFile;
}

SubmitOutcome BrowserSession::toParent() {
  if (m_state.isHistorySearch()) {
    throw BrowserError(ErrorKind::State,
                       "parent folder is not available in history view");
  }

  updateFilter(std::string());
  const Entry *first = highlightedEntry();
  if (first == nullptr || !first->isParentShortcut()) {
    return SubmitOutcome::Nothing;
  }
  return submit();
}

void BrowserSession::expand() { m_engine.expand(); }

void BrowserSession::collapse() { m_engine.collapse(); }

void BrowserSession::refresh() { m_engine.refresh(); }

DeleteResult BrowserSession::deleteHighlighted() {
  if (m_state.isHistorySearch()) {
    return {false, "Deleting is not available in history view"};
  }

  const Entry *entry = highlightedEntry();
  if (entry == nullptr) {
    return {false, "Nothing to delete"};
  }
  if (entry->isParentShortcut()) {
    return {false, "Cannot delete the parent folder entry"};
  }

  const fs::path target = entry->fullPath();
  const auto status = FileSafety::checkDeletion(target);
  if (!FileSafety::mayDelete(status)) {
    const std::string message = FileSafety::getStatusMessage(status, target);
    spdlog::warn("Refused to delete: {}", message);
    return {false, message};
  }

  std::error_code ec;
  const fs::file_status linkStatus = fs::symlink_status(target, ec);
  if (!ec) {
    if (fs::is_directory(linkStatus)) {
      fs::remove_all(target, ec);
    } else {
      fs::remove(target, ec);
    }
  }
  if (ec) {
    spdlog::error("Failed to delete {}: {}", target.string(), ec.message());
    return {false, "Failed to delete " + target.string() + ": " + ec.message()};
  }
  spdlog::info("Deleted {}", target.string());

  try {
    m_engine.refresh();
  } catch (const BrowserError &e) {
    spdlog::error("Refresh after deleting {} failed: {}", target.string(),
                  e.what());
    return {true, "Deleted " + target.string() + ", refresh failed: " + e.what()};
  }
  return {true, "Deleted " + target.string()};
}

void BrowserSession::enterHistory() {
  m_state.toHistorySearch();
  updateFilter(std::string());
}

void BrowserSession::leaveHistory() {
  m_state.toSearch();
  updateFilter(std::string());
}

void BrowserSession::toggleEdit() {
  if (m_state.isEdit()) {
    m_state.toSearch();
  } else {
    m_state.toSearchEdit();
  }
}

void BrowserSession::closeFile() {
  m_preview.reset();
  m_scrollRow = 0;
  m_scrollColumn = 0;
  m_state.restorePreviousState();
}

const FilePreview &BrowserSession::requireOpenFile() const {
  if (!m_preview) {
    throw BrowserError(ErrorKind::State, "no file is open");
  }
  return *m_preview;
}

void BrowserSession::scrollDown(std::size_t rows) {
  const FilePreview &preview = requireOpenFile();
  m_scrollRow = std::min(m_scrollRow + rows, preview.rowCount());
}

void BrowserSession::scrollUp(std::size_t rows) {
  requireOpenFile();
  m_scrollRow = rows > m_scrollRow ? 0 : m_scrollRow - rows;
}

void BrowserSession::scrollRight(std::size_t columns) {
  const FilePreview &preview = requireOpenFile();
  m_scrollColumn = std::min(m_scrollColumn + columns, preview.maxLineWidth());
}

void BrowserSession::scrollLeft(std::size_t columns) {
  requireOpenFile();
  m_scrollColumn = columns > m_scrollColumn ? 0 : m_scrollColumn - columns;
}

void BrowserSession::scrollHome() {
  requireOpenFile();
  m_scrollRow = 0;
  m_scrollColumn = 0;
}

void BrowserSession::scrollEnd(std::size_t page) {
  const FilePreview &preview = requireOpenFile();
  m_scrollRow = preview.rowCount() > page ? preview.rowCount() - page : 0;
}
