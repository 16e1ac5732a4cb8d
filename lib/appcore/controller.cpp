#include "controller.hpp"

#include <spdlog/spdlog.h>

#include "dialogs.hpp"
#include "views.hpp"

using namespace ftxui;

namespace {

/** @brief The typed character of a single-byte key event */
std::optional<char> keyChar(const Event &event) {
  if (!event.is_character() || event.character().size() != 1)
    return std::nullopt;
  return event.character()[0];
}

bool isUp(const Event &event) {
  return event == Event::ArrowUp || event == Event::Character('k');
}

bool isDown(const Event &event) {
  return event == Event::ArrowDown || event == Event::Character('j');
}

void appendActions(std::vector<std::string> &lines, const std::string &title,
                   ActionScope scope) {
  lines.push_back(title);
  for (const auto &entry : getMenuEntries(scope))
    lines.push_back("  " + entry);
  lines.push_back("");
}

} // namespace

AppController::AppController(World world) : m_world(std::move(world)) {
  m_world.registry->setConnections(m_world.config.connections);
  m_state.tree.rebuild(m_world.registry->connections());

  const auto &connections = m_world.registry->connections();
  for (size_t i = 0; i < connections.size(); ++i) {
    if (connections[i].id == m_world.config.activeConnection)
      m_state.dashboardRow = i;
  }
  spdlog::info("controller ready with {} connection(s)", connections.size());
}

std::vector<Effect> AppController::start() {
  auto effects = refreshHealth(true);
  effects.push_back(m_state.health.startTimer(pingInterval()));
  return effects;
}

std::vector<Effect> AppController::update(const Message &message) {
  if (auto *m = std::get_if<KeyPressed>(&message))
    return onKey(m->event);
  if (auto *m = std::get_if<ChildrenLoaded>(&message))
    return m_state.tree.onChildrenLoaded(*m, *m_world.registry);
  if (auto *m = std::get_if<OverlayTick>(&message))
    return m_state.overlays.onTick(*m);

  if (std::holds_alternative<HealthRefreshRequested>(message))
    return refreshHealth(true);
  if (auto *m = std::get_if<HealthTick>(&message))
    return onHealthTick(*m);
  if (auto *m = std::get_if<ProbeFinished>(&message))
    return onProbeFinished(*m);
  if (auto *m = std::get_if<StatusesUpdated>(&message))
    return onStatusesUpdated(*m);

  if (auto *m = std::get_if<StartUpload>(&message))
    return onStartUpload(*m);
  if (auto *m = std::get_if<UploadProgress>(&message))
    return onUploadProgress(*m);
  if (auto *m = std::get_if<FileUploaded>(&message))
    return onFileUploaded(*m);
  if (auto *m = std::get_if<UploadContinue>(&message))
    return onUploadContinue(*m);
  if (auto *m = std::get_if<UploadDone>(&message))
    return onUploadDone(*m);
  if (auto *m = std::get_if<UploadClosed>(&message))
    return onUploadClosed(*m);

  if (auto *m = std::get_if<CrudStateLoaded>(&message))
    return onCrudStateLoaded(*m);
  if (auto *m = std::get_if<CrudConfirmed>(&message))
    return onCrudConfirmed(*m);
  if (auto *m = std::get_if<CrudCancelled>(&message))
    return onCrudCancelled(*m);
  if (auto *m = std::get_if<CrudCompleted>(&message))
    return onCrudCompleted(*m);

  if (auto *m = std::get_if<ConnectionSubmitted>(&message))
    return onConnectionSubmitted(*m);
  if (auto *m = std::get_if<ConnectionRemoved>(&message))
    return onConnectionRemoved(*m);
  if (auto *m = std::get_if<ConnectionTested>(&message))
    return onConnectionTested(*m);
  if (auto *m = std::get_if<ConfigSaved>(&message))
    return onConfigSaved(*m);

  if (auto *m = std::get_if<SearchSelected>(&message))
    return onSearchSelected(*m);
  if (auto *m = std::get_if<PreviewLoaded>(&message))
    return onPreviewLoaded(*m);
  if (auto *m = std::get_if<DownloadFinished>(&message))
    return onDownloadFinished(*m);
  if (auto *m = std::get_if<DirectoryChosen>(&message)) {
    if (!m_world.browser->changeDirectory(m->path))
      setStatus(m_world.browser->lastError(), true);
    return {};
  }

  if (auto *m = std::get_if<EffectFailed>(&message)) {
    setStatus(m->label + " failed: " + m->error, true);
    return {};
  }
  return {};
}

void AppController::setStatus(std::string text, bool error) {
  if (error)
    spdlog::warn("{}", text);
  m_state.status = std::move(text);
  m_state.statusIsError = error;
}

std::chrono::milliseconds AppController::pingInterval() const {
  return std::chrono::seconds(m_world.config.pingInterval());
}

std::vector<Effect>
AppController::openOverlay(std::unique_ptr<Overlay> overlay) {
  if (const Overlay *active = m_state.overlays.active()) {
    if (!active->isClosing()) {
      // the replaced dialog will never answer
      if (active->id() == m_state.crud.overlayId())
        m_state.crud.abandon();
      if (active->id() == m_state.progressOverlayId)
        m_state.progressOverlayId = 0;
    }
  }
  return m_state.overlays.open(std::move(overlay));
}

void AppController::switchScreen(Screen screen) {
  if (screen == m_state.screen)
    return;
  m_previous_screen = m_state.screen;
  m_state.screen = screen;
}

// ============================================================================
// INPUT ROUTING
// ============================================================================

std::vector<Effect> AppController::onKey(const Event &event) {
  if (!m_state.overlays.empty())
    return m_state.overlays.handleKey(event);
  if (auto effects = onScreenKey(event))
    return std::move(*effects);
  return onGlobalKey(event);
}

std::optional<std::vector<Effect>>
AppController::onScreenKey(const Event &event) {
  switch (m_state.screen) {
  case Screen::Dashboard:
    return onDashboardKey(event);
  case Screen::Main:
    return m_state.panel == Panel::Files ? onFilesKey(event)
                                         : onTreeKey(event);
  case Screen::Connections:
    return onConnectionsKey(event);
  }
  return std::nullopt;
}

std::vector<Effect> AppController::onGlobalKey(const Event &event) {
  if (event == Event::Tab) {
    if (m_state.screen == Screen::Main)
      m_state.panel =
          m_state.panel == Panel::Files ? Panel::Tree : Panel::Files;
    else
      switchScreen(Screen::Main);
    return {};
  }
  if (event == Event::Escape) {
    if (m_state.screen == Screen::Connections)
      switchScreen(m_previous_screen);
    else if (m_state.screen == Screen::Main)
      switchScreen(Screen::Dashboard);
    return {};
  }

  auto key = keyChar(event);
  if (!key)
    return {};
  auto action = actionForKey(ActionScope::Global, *key);
  if (!action)
    return {};

  switch (*action) {
  case ActionID::Quit:
    m_state.quitRequested = true;
    return {};
  case ActionID::Help:
    return showHelp();
  case ActionID::ShowConnections:
    switchScreen(Screen::Connections);
    return {};
  case ActionID::ShowDashboard:
    switchScreen(Screen::Dashboard);
    return {};
  case ActionID::Refresh:
    if (m_state.screen == Screen::Main) {
      m_world.browser->refresh();
      setStatus("Refreshing");
      return refreshTree(std::nullopt, m_state.tree.snapshot());
    }
    return refreshHealth(true);
  default:
    break;
  }
  return {};
}

std::optional<std::vector<Effect>>
AppController::onDashboardKey(const Event &event) {
  const auto &connections = m_world.registry->connections();
  if (isUp(event)) {
    if (m_state.dashboardRow > 0)
      --m_state.dashboardRow;
    return std::vector<Effect>{};
  }
  if (isDown(event)) {
    if (m_state.dashboardRow + 1 < connections.size())
      ++m_state.dashboardRow;
    return std::vector<Effect>{};
  }
  if (event == Event::Return && m_state.dashboardRow < connections.size()) {
    const Connection &connection = connections[m_state.dashboardRow];
    m_world.config.activeConnection = connection.id;
    switchScreen(Screen::Main);
    m_state.panel = Panel::Tree;
    Node *node = m_state.tree.findPath({connection.name});
    if (!node)
      return std::vector<Effect>{};
    m_state.tree.setCursor(*node);
    return m_state.tree.expand(*node, *m_world.registry);
  }
  return std::nullopt;
}

std::optional<std::vector<Effect>>
AppController::onFilesKey(const Event &event) {
  LocalBrowser &browser = *m_world.browser;
  const int count = static_cast<int>(browser.entries().size());

  if (isUp(event))
    browser.moveCursor(-1);
  else if (isDown(event))
    browser.moveCursor(1);
  else if (event == Event::PageUp)
    browser.moveCursor(-10);
  else if (event == Event::PageDown)
    browser.moveCursor(10);
  else if (event == Event::Home)
    browser.setCursor(0);
  else if (event == Event::End)
    browser.setCursor(count - 1);
  else if (event == Event::Return || event == Event::ArrowRight ||
           event == Event::Character('l')) {
    const FileInfo *entry = browser.current();
    if (entry && !entry->isDirectory())
      return showFileInfo();
    if (!browser.enterSelected() && !browser.lastError().empty())
      setStatus(browser.lastError(), true);
  } else if (event == Event::Backspace || event == Event::ArrowLeft ||
             event == Event::Character('h')) {
    if (!browser.goUp() && !browser.lastError().empty())
      setStatus(browser.lastError(), true);
  } else {
    auto key = keyChar(event);
    auto action = key ? actionForKey(ActionScope::Files, *key) : std::nullopt;
    if (!action)
      return std::nullopt;
    switch (*action) {
    case ActionID::Upload:
      return startUpload();
    case ActionID::ToggleMark:
      browser.toggleMark();
      browser.moveCursor(1);
      break;
    case ActionID::GoToDirectory:
      return promptDirectory();
    case ActionID::FileInfo:
      return showFileInfo();
    default:
      return std::nullopt;
    }
  }
  return std::vector<Effect>{};
}

std::optional<std::vector<Effect>>
AppController::onTreeKey(const Event &event) {
  ResourceTree &tree = m_state.tree;
  Node *node = tree.cursor();

  if (isUp(event))
    tree.moveCursor(-1);
  else if (isDown(event))
    tree.moveCursor(1);
  else if (event == Event::PageUp)
    tree.moveCursor(-10);
  else if (event == Event::PageDown)
    tree.moveCursor(10);
  else if (event == Event::Home)
    tree.moveCursorToEdge(false);
  else if (event == Event::End)
    tree.moveCursorToEdge(true);
  else if (event == Event::Return)
    return tree.toggle(*node, *m_world.registry);
  else if (event == Event::ArrowRight || event == Event::Character('l'))
    return tree.expand(*node, *m_world.registry);
  else if (event == Event::ArrowLeft || event == Event::Character('h')) {
    if (node->expanded && node->kind != NodeKind::Root)
      tree.collapse(*node);
    else if (node->parent)
      tree.setCursor(*node->parent);
  } else {
    auto key = keyChar(event);
    auto action = key ? actionForKey(ActionScope::Tree, *key) : std::nullopt;
    if (!action)
      return std::nullopt;
    switch (*action) {
    case ActionID::Create:
      return beginCrud(CrudOp::Create);
    case ActionID::Edit:
      return beginCrud(CrudOp::Edit);
    case ActionID::Delete:
      return beginCrud(CrudOp::Delete);
    case ActionID::Publish:
      return beginCrud(CrudOp::Publish);
    case ActionID::ResourceInfo:
      return showResourceInfo();
    case ActionID::Preview:
      return openPreview();
    case ActionID::Download:
      return startDownload();
    case ActionID::Search:
      return openSearch();
    case ActionID::TileCache:
      return manageTileCache();
    default:
      return std::nullopt;
    }
  }
  return std::vector<Effect>{};
}

std::optional<std::vector<Effect>>
AppController::onConnectionsKey(const Event &event) {
  const auto &connections = m_world.config.connections;
  if (isUp(event)) {
    if (m_state.connectionRow > 0)
      --m_state.connectionRow;
    return std::vector<Effect>{};
  }
  if (isDown(event)) {
    if (m_state.connectionRow + 1 < connections.size())
      ++m_state.connectionRow;
    return std::vector<Effect>{};
  }

  const Connection *selected = m_state.connectionRow < connections.size()
                                   ? &connections[m_state.connectionRow]
                                   : nullptr;
  if (event == Event::Return)
    return selected ? openConnectionForm(selected) : std::vector<Effect>{};

  auto key = keyChar(event);
  auto action =
      key ? actionForKey(ActionScope::Connections, *key) : std::nullopt;
  if (!action)
    return std::nullopt;
  switch (*action) {
  case ActionID::AddConnection:
    return openConnectionForm(nullptr);
  case ActionID::EditConnection:
    return selected ? openConnectionForm(selected) : std::vector<Effect>{};
  case ActionID::RemoveConnection:
    return confirmRemoveConnection();
  case ActionID::TestConnection:
    return testConnection();
  default:
    break;
  }
  return std::nullopt;
}

std::vector<Effect> AppController::showHelp() {
  std::vector<std::string> lines;
  appendActions(lines, "Global", ActionScope::Global);
  lines.push_back("  (Tab) Switch panel / open main screen");
  lines.push_back("  (Esc) Back");
  lines.push_back("");
  appendActions(lines, "Dashboard", ActionScope::Dashboard);
  lines.push_back("  (Enter) Browse the selected server");
  lines.push_back("");
  appendActions(lines, "Local files", ActionScope::Files);
  lines.push_back("  (Enter) Open directory   (Backspace) Parent directory");
  lines.push_back("");
  appendActions(lines, "Resource tree", ActionScope::Tree);
  lines.push_back("  (Enter) Expand/collapse  (←) Collapse or go to parent");
  lines.push_back("");
  appendActions(lines, "Connections", ActionScope::Connections);
  return openOverlay(std::make_unique<InfoOverlay>("Help", lines));
}

std::vector<Effect> AppController::persistConfig() {
  if (!m_world.store)
    return {};
  if (m_persist_inflight) {
    m_persist_dirty = true;
    return {};
  }
  m_persist_inflight = true;
  auto store = m_world.store;
  AppConfig config = m_world.config;
  return {makeEffect(
      EffectKind::Persist, "save configuration",
      [store, config](EffectContext &) -> Message {
        return ConfigSaved{store->save(config)};
      },
      [](const std::string &error) -> Message {
        return ConfigSaved{Status::failure(error)};
      })};
}

std::vector<Effect> AppController::onConfigSaved(const ConfigSaved &message) {
  m_persist_inflight = false;
  if (!message.status)
    setStatus("Saving configuration failed: " + message.status.error(), true);
  if (!m_persist_dirty)
    return {};
  m_persist_dirty = false;
  return persistConfig();
}

Status AppController::shutdown() {
  m_world.config.lastLocalPath = m_world.browser->currentDir().string();
  if (!m_world.store)
    return Status::success();
  Status status = m_world.store->save(m_world.config);
  if (status)
    spdlog::info("configuration saved to {}", m_world.store->path().string());
  else
    spdlog::error("saving configuration failed: {}", status.error());
  return status;
}

Element AppController::render() const { return renderApp(m_state, m_world); }
