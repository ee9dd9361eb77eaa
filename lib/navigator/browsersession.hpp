/**
 * @file browsersession.hpp
 * @brief One interactive browsing session: state machine, engine, highlight
 *        cursor and the opened file
 *
 * BrowserSession is what a frontend talks to. It applies the caller-side
 * policies on top of NavigationEngine:
 * - submitting a directory enters it (leaving history view first)
 * - submitting a file opens a preview and switches to the file view
 * - a row whose target vanished is dropped from history, or triggers a
 *   refresh of the current directory when browsing
 *
 * @see NavigationEngine
 * @see NavigationState
 * @see FilePreview
 */

#ifndef BROWSERSESSION_HPP
#define BROWSERSESSION_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "directorycache.hpp"
#include "entry.hpp"
#include "filepreview.hpp"
#include "filesystemreader.hpp"
#include "navigationengine.hpp"
#include "navigationstate.hpp"

class Config;

/** @brief What submit() ended up doing */
enum class SubmitOutcome {
  /** @brief Nothing highlighted */
  Nothing,
  EnteredDirectory,
  OpenedFile,
  /** @brief Stale history row removed together with its cache entry */
  DroppedStale,
  /** @brief Stale row in browse view, current directory re-read */
  Refreshed
};

/** @brief Result of deleteHighlighted() */
struct DeleteResult {
  bool m_deleted;
  /** @brief Status line text */
  std::string m_message;
};

class BrowserSession {
private:
  // Declaration order matters: the engine keeps references to both
  NavigationState m_state;
  FilesystemReader m_reader;
  NavigationEngine m_engine;

  std::uintmax_t m_maxPreviewBytes;
  std::optional<FilePreview> m_preview;

  /** @brief Unbounded cursor, wrapped onto the selection when read */
  int m_rawHighlightIndex = 0;

  std::size_t m_scrollRow = 0;
  std::size_t m_scrollColumn = 0;

  const FilePreview &requireOpenFile() const;

public:
  /**
   * @brief Starts a session in @p startDirectory, in (Edit, Search)
   *
   * @throws BrowserError if the start directory cannot be entered
   */
  BrowserSession(const std::filesystem::path &startDirectory,
                 std::size_t cacheCapacity = DirectoryCache::DEFAULT_CAPACITY,
                 std::uintmax_t maxPreviewBytes = FilePreview::DEFAULT_MAX_BYTES);

  /** @brief Starts a session from the configured directory and limits */
  explicit BrowserSession(const Config &config);

  BrowserSession(const BrowserSession &) = delete;
  BrowserSession &operator=(const BrowserSession &) = delete;

  // ===== Highlight cursor =====

  /** @brief Moves the cursor one row up, saturating at INT_MIN */
  void moveUp();

  /** @brief Moves the cursor one row down, saturating at INT_MAX */
  void moveDown();

  void resetIndex() { m_rawHighlightIndex = 0; }

  /** @brief Highlighted row, std::nullopt when nothing is selected */
  std::optional<std::size_t> highlightIndex() const;

  /** @brief Highlighted entry or nullptr */
  const Entry *highlightedEntry() const;

  int rawHighlightIndex() const { return m_rawHighlightIndex; }

  // ===== Listing =====

  /**
   * @brief Re-filters the listing and moves the cursor back to the top
   */
  void updateFilter(const std::optional<std::string> &filter);

  /**
   * @brief Acts on the highlighted row
   *
   * @throws BrowserError (Path) if the file is too large or not a regular
   *         file, (Io) if it cannot be read; non-Path errors of the engine
   *         propagate
   */
  SubmitOutcome submit();

  /**
   * @brief Goes to the parent of the current directory
   *
   * Clears the filter, highlights the ".." row and submits it. Does nothing
   * at the filesystem root, where there is no ".." row.
   *
   * @throws BrowserError (State) in history view
   */
  SubmitOutcome toParent();

  void expand();
  void collapse();
  void refresh();

  /**
   * @brief Deletes the highlighted file or folder (recursively) from disk
   *
   * Targets rejected by FileSafety are left alone. On success the current
   * directory is refreshed.
   *
   * @return DeleteResult with the status line text; never throws for
   *         refused or failed deletions
   */
  DeleteResult deleteHighlighted();

  // ===== Mode switches =====

  /** @brief (Normal, Search) -> (Edit, History) with a cleared filter */
  void enterHistory();

  /** @brief Back to (Normal, Search) with a cleared filter */
  void leaveHistory();

  /** @brief Switches between (Normal, Search) and (Edit, Search) */
  void toggleEdit();

  /** @brief Drops the preview and returns to the state before it opened */
  void closeFile();

  // ===== File view =====

  void scrollDown(std::size_t rows = 1);
  void scrollUp(std::size_t rows = 1);
  void scrollRight(std::size_t columns = 1);
  void scrollLeft(std::size_t columns = 1);
  void scrollHome();

  /** @brief Shows the last @p page rows */
  void scrollEnd(std::size_t page);

  std::size_t scrollRow() const { return m_scrollRow; }
  std::size_t scrollColumn() const { return m_scrollColumn; }

  // ===== Accessors =====

  const NavigationState &state() const { return m_state; }
  const NavigationEngine &engine() const { return m_engine; }

  /** @brief Opened file or nullptr */
  const FilePreview *preview() const {
    return m_preview ? &*m_preview : nullptr;
  }
};

#endif // BROWSERSESSION_HPP
