#include "views.hpp"

#include <algorithm>
#include <chrono>

#include "uicontrol.hpp"
#include "utils.hpp"

using namespace ftxui;

namespace {

const std::vector<std::string> kBlocks = {"▁", "▂", "▃", "▄",
                                          "▅", "▆", "▇", "█"};
const std::vector<std::string> kSpinner = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                           "⠴", "⠦", "⠧", "⠇", "⠏"};

std::string spinnerFrame() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  return kSpinner[static_cast<size_t>(ms / 80) % kSpinner.size()];
}

Color fileColor(int code) {
  switch (code) {
  case 2:
    return Color::Green;
  case 3:
    return Color::Yellow;
  case 4:
    return Color::Blue;
  case 5:
    return Color::Magenta;
  default:
    return Color::Default;
  }
}

Element selectable(Element row, bool selected, bool focused) {
  if (!selected)
    return row;
  row = row | focus;
  return focused ? row | inverted : row | bold;
}

Element panel(const std::string &title, Element body, bool focused) {
  Element header = text(title) | bold;
  header = focused ? header | color(Color::Green) : header | dim;
  return vbox({header, separator(), body | vscroll_indicator | frame | flex}) |
         border;
}

std::string nodeIcon(const Node &node) {
  if (!node.isExpandable())
    return "  ";
  if (node.loading)
    return spinnerFrame() + " ";
  return node.expanded ? "▾ " : "▸ ";
}

Element treeRow(const Node &node) {
  Element name = text(nodeIcon(node) + node.name);
  switch (node.kind) {
  case NodeKind::Root:
    name = name | bold;
    break;
  case NodeKind::Connection:
    name = name | color(Color::Cyan) | bold;
    break;
  case NodeKind::Workspace:
    name = name | color(Color::Yellow);
    break;
  case NodeKind::Category:
    name = name | color(Color::GrayLight);
    break;
  case NodeKind::Resource:
    if (node.enabled && !*node.enabled)
      name = name | dim;
    break;
  }

  Elements parts{text(std::string(node.depth() * 2, ' ')), name};
  if (node.enabled && !*node.enabled)
    parts.push_back(text(" (disabled)") | dim);
  if (node.loaded && node.isExpandable() && node.children.empty() &&
      node.kind != NodeKind::Root)
    parts.push_back(text(" (empty)") | dim);
  if (node.error)
    parts.push_back(text("  ✗ " + *node.error) | color(Color::Red));
  return hbox(std::move(parts));
}

Element fileRow(const FileInfo &file) {
  Element name =
      text((file.isMarked() ? "* " : "  ") + file.getDisplayName()) |
      color(fileColor(file.getColorCode()));
  if (file.isMarked())
    name = name | bold;
  Element size = file.isDirectory()
                     ? text("")
                     : text(formatBytes(file.getFileSize())) |
                           color(Color::GrayLight);
  return hbox({name | flex, size});
}

std::string screenTitle(Screen screen) {
  switch (screen) {
  case Screen::Dashboard:
    return "Dashboard";
  case Screen::Main:
    return "Browser";
  case Screen::Connections:
    return "Connections";
  }
  return "";
}

ActionScope currentScope(const AppState &state) {
  switch (state.screen) {
  case Screen::Dashboard:
    return ActionScope::Dashboard;
  case Screen::Main:
    return state.panel == Panel::Files ? ActionScope::Files
                                       : ActionScope::Tree;
  case Screen::Connections:
    return ActionScope::Connections;
  }
  return ActionScope::Global;
}

Element menuBar(const AppState &state) {
  Elements parts;
  parts.push_back(text(" geoshell ") | bold | color(Color::Cyan));
  parts.push_back(text("│ " + screenTitle(state.screen) + " │ ") |
                  color(Color::GrayLight));
  for (const auto &entry : getMenuEntries(currentScope(state)))
    parts.push_back(text(entry + "  "));
  parts.push_back(filler());
  for (const auto &entry : getMenuEntries(ActionScope::Global))
    parts.push_back(text(entry + " ") | color(Color::GrayLight));
  return hbox(std::move(parts));
}

Element statusBar(const AppState &state) {
  Element line = text("STATUS: " + state.status);
  line = state.statusIsError ? line | color(Color::Red)
                             : line | color(Color::GrayLight);
  Elements parts{line};
  parts.push_back(filler());
  if (state.upload.active() && !state.upload.done())
    parts.push_back(text(spinnerFrame() + " uploading ") |
                    color(Color::Cyan));
  if (state.crud.busy())
    parts.push_back(text(spinnerFrame() + " working ") | color(Color::Cyan));
  return hbox(std::move(parts));
}

} // namespace

std::string sparkline(const std::vector<double> &samples) {
  if (samples.empty())
    return "";
  const auto [low, high] = std::minmax_element(samples.begin(), samples.end());
  const double range = *high - *low;
  std::string out;
  for (double sample : samples) {
    size_t level = 0;
    if (range > 0)
      level = static_cast<size_t>((sample - *low) / range *
                                  static_cast<double>(kBlocks.size() - 1));
    out += kBlocks[std::min(level, kBlocks.size() - 1)];
  }
  return out;
}

Element renderDashboard(const AppState &state, const World &world) {
  const auto &connections = world.registry->connections();
  Elements rows;

  if (connections.empty()) {
    rows.push_back(text("No servers configured. Press 'c' and then 'a' to "
                        "add one.") |
                   color(Color::Yellow) | center);
  }

  for (size_t i = 0; i < connections.size(); ++i) {
    const Connection &connection = connections[i];
    const ServerStatus *status = state.health.status(connection.id);
    const PingHistory *history = state.health.history(connection.id);

    Element badge = text("● unknown ") | color(Color::GrayLight);
    std::string details = "waiting for first probe";
    if (status && status->online) {
      badge = text("● online  ") | color(Color::Green) | bold;
      details = "GeoServer " + status->version + "  " +
                std::to_string(status->responseTimeMs) + " ms  mem " +
                std::to_string(static_cast<int>(status->memoryUsedPct)) +
                "%  ws " + std::to_string(status->workspaceCount) +
                "  layers " + std::to_string(status->layerCount) +
                "  stores " + std::to_string(status->dataStoreCount) +
                "  styles " + std::to_string(status->styleCount);
    } else if (status) {
      badge = text("● offline ") | color(Color::Red) | bold;
      details = status->error;
    }

    Element row = vbox(
        {hbox({badge, text(connection.name) | bold,
               text("  " + connection.url) | color(Color::GrayLight)}),
         hbox({text("          "), text(details) | flex,
               text(history ? sparkline(history->samples()) : "") |
                   color(Color::Cyan)})});
    rows.push_back(selectable(row, i == state.dashboardRow, true));
    rows.push_back(separatorLight());
  }

  std::string title = "Servers";
  if (state.health.loading())
    title += "  " + spinnerFrame() + " refreshing";
  return panel(title, vbox(std::move(rows)), true);
}

Element renderMain(const AppState &state, const World &world) {
  const LocalBrowser &browser = *world.browser;
  const bool files_focused = state.panel == Panel::Files;

  Elements file_rows;
  const auto &entries = browser.entries();
  for (size_t i = 0; i < entries.size(); ++i)
    file_rows.push_back(selectable(fileRow(entries[i]),
                                   static_cast<int>(i) == browser.cursor(),
                                   files_focused));
  if (entries.empty())
    file_rows.push_back(text("(empty)") | dim);

  std::string files_title = browser.currentDir().string();
  if (browser.markedCount() > 0)
    files_title += "  [" + std::to_string(browser.markedCount()) + " marked]";

  Elements tree_rows;
  const Node *cursor = state.tree.cursor();
  for (const Node *node : state.tree.visibleRows())
    tree_rows.push_back(
        selectable(treeRow(*node), node == cursor, !files_focused));

  std::string tree_title = "Remote";
  if (!cursor->workspace.empty())
    tree_title += "  → " + cursor->workspace;

  return hbox({panel(files_title, vbox(std::move(file_rows)), files_focused) |
                   flex,
               panel(tree_title, vbox(std::move(tree_rows)), !files_focused) |
                   flex});
}

Element renderConnections(const AppState &state, const World &world) {
  const auto &connections = world.config.connections;
  Elements rows;
  if (connections.empty())
    rows.push_back(text("No connections. Press 'a' to add one.") |
                   color(Color::Yellow));

  for (size_t i = 0; i < connections.size(); ++i) {
    const Connection &connection = connections[i];
    const bool active = connection.id == world.config.activeConnection;
    Element row =
        hbox({text(active ? "★ " : "  ") | color(Color::Yellow),
              text(connection.name) | bold | size(WIDTH, EQUAL, 24),
              text(connection.url) | flex,
              text(connection.username.empty() ? "" : connection.username) |
                  color(Color::GrayLight)});
    rows.push_back(selectable(row, i == state.connectionRow, true));
  }
  return panel("Saved connections", vbox(std::move(rows)), true);
}

Element renderApp(const AppState &state, const World &world) {
  Element body;
  switch (state.screen) {
  case Screen::Dashboard:
    body = renderDashboard(state, world);
    break;
  case Screen::Main:
    body = renderMain(state, world);
    break;
  case Screen::Connections:
    body = renderConnections(state, world);
    break;
  }

  Element document =
      vbox({menuBar(state), separator(), body | flex, statusBar(state)});
  if (const Overlay *overlay = state.overlays.active())
    return dbox({document, overlay->render()});
  return document;
}
