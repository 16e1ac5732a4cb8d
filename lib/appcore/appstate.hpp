/**
 * @file appstate.hpp
 * @brief Everything the UI shows, owned by AppController
 */

#ifndef APPSTATE_HPP
#define APPSTATE_HPP

#include <memory>
#include <string>

#include "configstore.hpp"
#include "connectionregistry.hpp"
#include "crudflow.hpp"
#include "healthpoller.hpp"
#include "localbrowser.hpp"
#include "overlaystack.hpp"
#include "resourcetree.hpp"
#include "uploadpipeline.hpp"
#include "verification.hpp"

enum class Screen { Dashboard, Main, Connections };

/** @brief Focused panel of the main screen */
enum class Panel { Files, Tree };

struct AppState {
  Screen screen = Screen::Dashboard;
  Panel panel = Panel::Files;
  std::string status = "Ready";
  bool statusIsError = false;
  bool quitRequested = false;

  ResourceTree tree;
  OverlayStack overlays;
  UploadPipeline upload;
  CrudFlow crud;
  HealthPoller health;

  /** @brief Selected row of the dashboard and of the connection list */
  size_t dashboardRow = 0;
  size_t connectionRow = 0;
  /** @brief Overlay showing the running upload, 0 if none */
  uint64_t progressOverlayId = 0;
};

/**
 * @struct World
 * @brief Collaborators of the controller that live outside AppState
 *
 * @c store may be null, in which case configuration changes are kept in
 * memory only.
 */
struct World {
  AppConfig config;
  std::shared_ptr<ConfigStore> store;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<LocalBrowser> browser;
  std::shared_ptr<const ILocalSummaryReader> summaryReader;
};

#endif // APPSTATE_HPP
