/**
 * @file filebrowserui.hpp
 * @brief Terminal user interface of treeseek using FTXUI
 *
 * Layout, top to bottom:
 * - listing (browse or history) or the opened file
 * - "Input" box holding the filter, yellow while editing
 * - help line for the active state
 * - status line
 *
 * The UI holds no navigation state of its own besides the text of the
 * input box; everything else is read from BrowserSession on each frame.
 *
 * @see BrowserSession
 * @see ActionMap
 */

#ifndef FILEBROWSERUI_HPP
#define FILEBROWSERUI_HPP

#include "browsersession.hpp"
#include "uicontrol.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#include <functional>
#include <string>
#include <vector>

using namespace ftxui;

/**
 * @class FileBrowserUI
 * @brief Fullscreen FTXUI frontend driving a BrowserSession
 *
 * Every key press is dispatched on the session's (input mode, view mode)
 * pair. Errors raised while handling a key are caught per event, shown on
 * the status line and logged; they never end the program.
 */
class FileBrowserUI {
private:
  // ===== Session and UI State =====

  /** @brief Navigation session shown by this UI */
  BrowserSession &m_session;

  /** @brief Text of the input box (the active filter) */
  std::string m_input;

  /** @brief Current status message displayed in the UI */
  std::string m_currentStatus = "Ready.";

  /** @brief Rows moved by PageUp/PageDown and shown by End in the file view */
  static constexpr int FILE_PAGE_ROWS = 30;

  // ===== UI Components =====

  /** @brief Whole screen: main view, input box, help and status lines */
  Component m_document;

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  /** @brief Help-line labels for the browse shortcuts */
  std::vector<std::string> m_menuEntries;

  /** @brief Flag indicating whether the delete dialog is open */
  bool m_dialogActive = false;

  // ===== Event Handling =====

  /**
   * @brief Routes a key press to the handler of the active state
   * @return true if the event was consumed
   */
  bool handleEvent(const Event &event);

  bool handleNormalSearchEvent(const Event &event);
  bool handleEditSearchEvent(const Event &event);
  bool handleHistoryEvent(const Event &event);
  bool handleFileViewEvent(const Event &event);

  /**
   * @brief Executes a browse shortcut from the ActionMap
   */
  void handleShortcut(ActionID action);

  /**
   * @brief Appends typed text to, or removes the last character from, the
   *        input box and re-filters
   * @return true if the event edited the input
   */
  bool editInput(const Event &event);

  /**
   * @brief Submits the highlighted row and reports the outcome
   */
  void submitHighlighted();

  /**
   * @brief Runs @p action, turning exceptions into a status message
   */
  void runGuarded(const std::function<void()> &action);

  // ===== Deletion =====

  /**
   * @brief Asks for confirmation, then deletes the highlighted entry
   *
   * Entries rejected by FileSafety are reported without a dialog.
   */
  void confirmAndDelete();

  /**
   * @brief Displays confirmation dialog before deletion
   *
   * @param entry Entry about to be deleted
   * @param removable Target is on removable media
   *
   * @return true if the user pressed 'y'
   */
  bool showDeleteConfirmation(const Entry &entry, bool removable);

  // ===== Rendering =====

  Element renderMainView();
  Element renderListing();
  Element renderFileView();
  Element renderInput();
  Element renderHelp();

  /** @brief Title of the listing: directory and load time, or item count */
  std::string listingTitle() const;

  /** @brief Label of a row in the listing */
  std::string rowLabel(const Entry &entry) const;

public:
  explicit FileBrowserUI(BrowserSession &session) : m_session(session) {}

  /**
   * @brief Builds the component tree; must be called before run()
   */
  void initialize();

  /**
   * @brief Starts the main UI event loop
   *
   * Blocks until the user quits.
   */
  void run();
};

#endif // FILEBROWSERUI_HPP
