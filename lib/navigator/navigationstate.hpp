/**
 * @file navigationstate.hpp
 * @brief Input-mode x view-mode state machine of the browser
 *
 * Reachable states:
 *
 *   [Normal+Search] <---> [Edit+Search]
 *        |                     |
 *        v                     v
 *   [Normal+FileView]   [Edit+HistoryFolderView]
 *
 * Every transition remembers the state it left, so restorePreviousState()
 * can undo exactly one step (used when closing the file view).
 */

#ifndef NAVIGATIONSTATE_HPP
#define NAVIGATIONSTATE_HPP

/** @brief How keyboard input is interpreted */
enum class InputMode {
  /** @brief Shortcut keys navigate */
  Normal,
  /** @brief Typed characters edit the filter */
  Edit
};

/** @brief What the main area shows */
enum class ViewMode {
  /** @brief Current directory, filtered */
  Search,
  /** @brief Contents of an opened file */
  FileView,
  /** @brief Every cached directory, filtered */
  HistoryFolderView
};

class NavigationState {
private:
  InputMode m_inputMode = InputMode::Edit;
  ViewMode m_viewMode = ViewMode::Search;
  InputMode m_prevInputMode = InputMode::Edit;
  ViewMode m_prevViewMode = ViewMode::Search;

  void savePreviousState();
  void transition(InputMode input, ViewMode view);

public:
  /** @brief (Normal, Search): browse with shortcut keys */
  void toSearch();
  /** @brief (Edit, Search): type a filter for the current directory */
  void toSearchEdit();
  /** @brief (Edit, HistoryFolderView): type a filter over visited folders */
  void toHistorySearch();
  /** @brief (Normal, FileView): scroll through an opened file */
  void toFileView();

  /**
   * @brief Returns to the state before the last transition
   *
   * Does not record a new previous state, so calling it twice in a row has
   * the same effect as calling it once.
   */
  void restorePreviousState();

  bool isEdit() const { return m_inputMode == InputMode::Edit; }
  bool isHistorySearch() const {
    return m_viewMode == ViewMode::HistoryFolderView;
  }
  bool isFileView() const { return m_viewMode == ViewMode::FileView; }

  InputMode inputMode() const { return m_inputMode; }
  ViewMode viewMode() const { return m_viewMode; }
};

#endif // NAVIGATIONSTATE_HPP
