/**
 * @file controller.hpp
 * @brief The event loop's transition function
 *
 * AppController::update() consumes one message, mutates AppState and
 * returns the effects to run. It never blocks and never performs I/O
 * itself; everything slow is returned as an Effect whose result comes
 * back as another message.
 *
 * Key routing, most specific first:
 * 1. the active overlay (it swallows every key)
 * 2. the current screen (and, on the main screen, the focused panel)
 * 3. global keys (quit, help, screen switching, refresh)
 */

#ifndef CONTROLLER_HPP
#define CONTROLLER_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include <ftxui/dom/elements.hpp>

#include "appstate.hpp"
#include "effect.hpp"
#include "message.hpp"
#include "uicontrol.hpp"

class AppController {
private:
  AppState m_state;
  World m_world;
  Screen m_previous_screen = Screen::Dashboard;
  // One save at a time; a change during a save is written after it
  bool m_persist_inflight = false;
  bool m_persist_dirty = false;
  // Connections changed while a status refresh was running
  bool m_health_pending = false;

  void setStatus(std::string text, bool error = false);
  std::chrono::milliseconds pingInterval() const;
  std::vector<Effect> openOverlay(std::unique_ptr<Overlay> overlay);
  void switchScreen(Screen screen);

  // Input
  std::vector<Effect> onKey(const ftxui::Event &event);
  std::optional<std::vector<Effect>> onScreenKey(const ftxui::Event &event);
  std::vector<Effect> onGlobalKey(const ftxui::Event &event);
  std::optional<std::vector<Effect>> onDashboardKey(const ftxui::Event &event);
  std::optional<std::vector<Effect>> onFilesKey(const ftxui::Event &event);
  std::optional<std::vector<Effect>> onTreeKey(const ftxui::Event &event);
  std::optional<std::vector<Effect>>
  onConnectionsKey(const ftxui::Event &event);
  std::vector<Effect> showHelp();

  // Resource tree
  std::vector<Effect> refreshTree(std::optional<TreePath> focus,
                                  const TreeSnapshot &snapshot);
  std::vector<Effect> openSearch();
  std::vector<Effect> onSearchSelected(const SearchSelected &message);
  std::vector<Effect> showResourceInfo();
  std::vector<Effect> showFileInfo();
  std::vector<Effect> openPreview();
  std::vector<Effect> onPreviewLoaded(const PreviewLoaded &message);
  std::vector<Effect> startDownload();
  std::vector<Effect> onDownloadFinished(const DownloadFinished &message);
  std::vector<Effect> promptDirectory();

  // CRUD
  std::vector<Effect> beginCrud(CrudOp op);
  std::vector<Effect> manageTileCache();
  std::vector<Effect> startCrud(CrudRequest request);
  std::vector<Effect> openCrudWizard(const WizardSpec &spec);
  std::vector<Effect> onCrudStateLoaded(const CrudStateLoaded &message);
  std::vector<Effect> onCrudConfirmed(const CrudConfirmed &message);
  std::vector<Effect> onCrudCancelled(const CrudCancelled &message);
  std::vector<Effect> onCrudCompleted(const CrudCompleted &message);

  // Upload
  std::vector<Effect> startUpload();
  std::vector<Effect> onStartUpload(const StartUpload &message);
  std::vector<Effect> onUploadProgress(const UploadProgress &message);
  std::vector<Effect> onFileUploaded(const FileUploaded &message);
  std::vector<Effect> onUploadContinue(const UploadContinue &message);
  std::vector<Effect> onUploadDone(const UploadDone &message);
  std::vector<Effect> onUploadClosed(const UploadClosed &message);

  // Connections and health
  std::vector<Effect> refreshHealth(bool manual);
  std::vector<Effect> onProbeFinished(const ProbeFinished &message);
  std::vector<Effect> onStatusesUpdated(const StatusesUpdated &message);
  std::vector<Effect> onHealthTick(const HealthTick &message);
  std::vector<Effect> openConnectionForm(const Connection *existing);
  std::vector<Effect> confirmRemoveConnection();
  std::vector<Effect> testConnection();
  std::vector<Effect> onConnectionSubmitted(const ConnectionSubmitted &message);
  std::vector<Effect> onConnectionRemoved(const ConnectionRemoved &message);
  std::vector<Effect> onConnectionTested(const ConnectionTested &message);
  std::vector<Effect> connectionsChanged();
  std::vector<Effect> persistConfig();
  std::vector<Effect> onConfigSaved(const ConfigSaved &message);

public:
  explicit AppController(World world);

  /** @brief Effects to run once at startup (first health refresh and timer) */
  std::vector<Effect> start();

  std::vector<Effect> update(const Message &message);

  const AppState &state() const { return m_state; }
  AppState &state() { return m_state; }
  const World &world() const { return m_world; }
  bool quitRequested() const { return m_state.quitRequested; }

  /** @brief Current screen plus the active overlay */
  ftxui::Element render() const;

  /** @brief Remembers the local directory and writes the configuration */
  Status shutdown();
};

#endif // CONTROLLER_HPP
