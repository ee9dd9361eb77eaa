#include "navigationstate.hpp"

void NavigationState::savePreviousState() {
  m_prevInputMode = m_inputMode;
  m_prevViewMode = m_viewMode;
}

void NavigationState::transition(InputMode input, ViewMode view) {
  savePreviousState();
  m_inputMode = input;
  m_viewMode = view;
}

void NavigationState::toSearch() {
  transition(InputMode::Normal, ViewMode::Search);
}

void NavigationState::toSearchEdit() {
  transition(InputMode::Edit, ViewMode::Search);
}

void NavigationState::toHistorySearch() {
  transition(InputMode::Edit, ViewMode::HistoryFolderView);
}

void NavigationState::toFileView() {
  transition(InputMode::Normal, ViewMode::FileView);
}

void NavigationState::restorePreviousState() {
  m_inputMode = m_prevInputMode;
  m_viewMode = m_prevViewMode;
}
