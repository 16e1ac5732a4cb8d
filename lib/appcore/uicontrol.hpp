/**
 * @file uicontrol.hpp
 * @brief UI action definitions and keyboard shortcut mappings
 *
 * Central mapping between:
 * - Action identifiers (ActionID enum)
 * - Keyboard shortcuts (single character keys)
 * - Menu and help strings (with shortcut hints)
 * - The part of the UI where the shortcut applies (ActionScope)
 *
 * Navigation keys (arrows, Enter, Esc, Tab, Backspace) are not listed
 * here; they are handled directly by the screens.
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
 * @enum ActionScope
 * @brief Where a shortcut is active
 */
enum class ActionScope {
  Global,      ///< everywhere unless an overlay is open
  Dashboard,   ///< server status overview
  Files,       ///< local file panel of the main screen
  Tree,        ///< remote resource tree of the main screen
  Connections  ///< saved connection list
};

/**
 * @struct ActionInfo
 * @brief Information about a UI action including shortcut and menu title
 */
struct ActionInfo {
  /** @brief Single character keyboard shortcut for this action */
  char m_shortcut;

  /** @brief Formatted menu title string including shortcut hint (e.g., "(q) Quit") */
  std::string m_menu_title;

  ActionScope m_scope;
};

/**
 * @enum ActionID
 * @brief Enumeration of all available UI actions
 */
enum class ActionID {
  Quit,
  Help,
  ShowConnections,
  ShowDashboard,
  Refresh,

  /** @brief Upload marked files (or the file under the cursor) */
  Upload,
  ToggleMark,
  GoToDirectory,
  FileInfo,

  Create,
  Edit,
  Delete,
  Publish,
  ResourceInfo,
  Preview,
  Download,
  Search,
  /** @brief Seed or truncate the tile cache of a layer */
  TileCache,

  AddConnection,
  EditConnection,
  RemoveConnection,
  TestConnection
};

/**
 * @brief Global mapping of actions to their shortcuts and menu titles
 *
 * @note Shortcuts are case-sensitive ('d' vs 'D' are different)
 * @note A shortcut may be reused in different scopes
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::Quit, {'q', "(q) Quit", ActionScope::Global}},
    {ActionID::Help, {'?', "(?) Help", ActionScope::Global}},
    {ActionID::ShowConnections,
     {'c', "(c) Connections", ActionScope::Global}},
    {ActionID::ShowDashboard, {'d', "(d) Dashboard", ActionScope::Global}},
    {ActionID::Refresh, {'r', "(r) Refresh", ActionScope::Global}},

    {ActionID::Upload, {'u', "(u) Upload", ActionScope::Files}},
    {ActionID::ToggleMark, {' ', "(Space) Mark", ActionScope::Files}},
    {ActionID::GoToDirectory, {'g', "(g) Go to", ActionScope::Files}},
    {ActionID::FileInfo, {'i', "(i) Info", ActionScope::Files}},

    {ActionID::Create, {'n', "(n) New", ActionScope::Tree}},
    {ActionID::Edit, {'e', "(e) Edit", ActionScope::Tree}},
    {ActionID::Delete, {'x', "(x) Delete", ActionScope::Tree}},
    {ActionID::Publish, {'p', "(p) Publish", ActionScope::Tree}},
    {ActionID::ResourceInfo, {'i', "(i) Info", ActionScope::Tree}},
    {ActionID::Preview, {'v', "(v) Preview", ActionScope::Tree}},
    {ActionID::Download, {'D', "(D) Download", ActionScope::Tree}},
    {ActionID::Search, {'/', "(/) Search", ActionScope::Tree}},
    {ActionID::TileCache, {'T', "(T) Tiles", ActionScope::Tree}},

    {ActionID::AddConnection, {'a', "(a) Add", ActionScope::Connections}},
    {ActionID::EditConnection, {'e', "(e) Edit", ActionScope::Connections}},
    {ActionID::RemoveConnection,
     {'x', "(x) Remove", ActionScope::Connections}},
    {ActionID::TestConnection, {'t', "(t) Test", ActionScope::Connections}}};

/**
 * @brief Looks up the action bound to @p key in @p scope
 *
 * Global actions are only found with ActionScope::Global.
 */
inline std::optional<ActionID> actionForKey(ActionScope scope, char key) {
  for (const auto &[id, info] : ActionMap) {
    if (info.m_scope == scope && info.m_shortcut == key)
      return id;
  }
  return std::nullopt;
}

/**
 * @brief Extracts menu entry strings of one scope from the ActionMap
 *
 * @return Menu titles in ActionID order
 */
inline std::vector<std::string> getMenuEntries(ActionScope scope) {
  std::vector<std::string> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    if (info.m_scope == scope)
      entries.push_back(info.m_menu_title);
  }
  return entries;
}

#endif // UI_CONTROL_HPP
