/**
 * @file uicontrol.hpp
 * @brief Shortcut keys of the browse view and their help-line labels
 *
 * The action system maps:
 * - Action identifiers (ActionID enum)
 * - Keys (the raw input FTXUI reports for the key press)
 * - Help-line strings (with shortcut hints)
 *
 * Only the (Normal, Search) state uses shortcuts; the other states have
 * fixed bindings handled directly by FileBrowserUI.
 *
 * @see ActionID
 * @see ActionInfo
 * @see ActionMap
 */

#ifndef UI_CONTROL_HPP
#define UI_CONTROL_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct ActionInfo
 * @brief Shortcut key and help-line label of one action
 */
struct ActionInfo {
  /** @brief Key as FTXUI reports it (control keys as their ASCII code) */
  char m_shortcut;

  /** @brief Help-line label including the key hint (e.g., "(q) Quit") */
  std::string m_menuTitle;
};

/**
 * @enum ActionID
 * @brief Actions reachable by shortcut while browsing
 */
enum class ActionID {
  /** @brief Switch to filter editing (Tab) */
  EditFilter,

  /** @brief Flatten one more level into the listing (shortcut: 'e') */
  Expand,

  /** @brief Fold the listing back by one level (shortcut: 'c') */
  Collapse,

  /** @brief Re-read the current directory (shortcut: 'u') */
  Refresh,

  /** @brief Show every visited directory (shortcut: 'h') */
  History,

  /** @brief Go to the parent directory (Ctrl+K) */
  ToParent,

  /** @brief Delete the highlighted entry after confirmation (Ctrl+D) */
  Delete,

  /** @brief Quit the application (shortcut: 'q') */
  Quit
};

/**
 * @brief Global mapping of actions to their keys and help-line labels
 *
 * @note Shortcuts are case-sensitive
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::EditFilter, {'\t', "(Tab) Filter"}},
    {ActionID::Expand, {'e', "(e) Expand"}},
    {ActionID::Collapse, {'c', "(c) Collapse"}},
    {ActionID::Refresh, {'u', "(u) Refresh"}},
    {ActionID::History, {'h', "(h) History"}},
    {ActionID::ToParent, {'\x0B', "(^K) Parent"}},
    {ActionID::Delete, {'\x04', "(^D) Delete"}},
    {ActionID::Quit, {'q', "(q) Quit"}}};

/**
 * @brief Help-line labels in ActionID order
 */
inline std::vector<std::string> getMenuEntries() {
  std::vector<std::string> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    entries.push_back(info.m_menuTitle);
  }
  return entries;
}

/**
 * @brief Looks up the action bound to a key press
 *
 * @param input Raw input of the key event (FTXUI's Event::input())
 *
 * @return The action, or std::nullopt if the key is not a shortcut
 */
inline std::optional<ActionID> findActionByKey(const std::string &input) {
  if (input.size() != 1) {
    return std::nullopt;
  }
  for (const auto &[id, info] : ActionMap) {
    if (info.m_shortcut == input[0]) {
      return id;
    }
  }
  return std::nullopt;
}

#endif // UI_CONTROL_HPP
