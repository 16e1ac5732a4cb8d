#include "controller.hpp"

#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "dialogs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::string yesNo(bool value) { return value ? "yes" : "no"; }

std::string formatBounds(const BoundingBox &box) {
  if (!box.valid)
    return "unknown";
  return fmt::format("{:.4f}, {:.4f} - {:.4f}, {:.4f} {}", box.minx, box.miny,
                     box.maxx, box.maxy, box.crs);
}

std::vector<std::string> layerLines(const LayerConfig &layer,
                                    const Result<FeatureSummary> &summary) {
  std::vector<std::string> lines;
  lines.push_back("Layer:      " + layer.name);
  lines.push_back("Store:      " + layer.store +
                  (layer.storeType.empty() ? "" : " (" + layer.storeType + ")"));
  lines.push_back("Enabled:    " + yesNo(layer.enabled));
  lines.push_back("Bounds:     " + formatBounds(layer.bounds));
  lines.push_back("Style:      " + (layer.defaultStyle.empty()
                                        ? std::string("none")
                                        : layer.defaultStyle));
  lines.push_back("");
  lines.push_back("Styles (" + std::to_string(layer.styles.size()) + "):");
  for (const auto &style : layer.styles)
    lines.push_back("  " + style);

  // raster layers have no feature type to describe
  if (!summary)
    return lines;
  const FeatureSummary &features = summary.value();
  lines.push_back("");
  lines.push_back("Features:   " + (features.featureCount < 0
                                        ? std::string("unknown")
                                        : std::to_string(features.featureCount)));
  lines.push_back("Geometry:   " + (features.geometryType.empty()
                                        ? std::string("none")
                                        : features.geometryType));
  lines.push_back("Attributes (" + std::to_string(features.attributes.size()) +
                  "):");
  for (const auto &attribute : features.attributes)
    lines.push_back("  " + attribute);
  return lines;
}

std::vector<std::string> layerGroupLines(const LayerGroupConfig &group) {
  std::vector<std::string> lines;
  lines.push_back("Group:      " + group.name);
  lines.push_back("Title:      " + group.title);
  lines.push_back("Mode:       " + group.mode);
  lines.push_back("Bounds:     " + formatBounds(group.bounds));
  lines.push_back("");
  lines.push_back("Layers (" + std::to_string(group.layers.size()) + "):");
  for (size_t i = 0; i < group.layers.size(); ++i) {
    std::string line = "  " + group.layers[i];
    if (i < group.styles.size() && !group.styles[i].empty())
      line += "  [" + group.styles[i] + "]";
    lines.push_back(line);
  }
  return lines;
}

using Lines = Result<std::vector<std::string>>;

} // namespace

std::vector<Effect> AppController::refreshTree(std::optional<TreePath> focus,
                                               const TreeSnapshot &snapshot) {
  m_state.tree.rebuild(m_world.registry->connections());
  TreeSnapshot target = snapshot;
  if (focus)
    target.cursor = *focus;
  return m_state.tree.restore(target, *m_world.registry);
}

std::vector<Effect> AppController::openSearch() {
  std::vector<SearchCandidate> candidates;
  for (const Node *node : m_state.tree.loadedNodes())
    candidates.push_back(
        {node->id, node->name, joinPath(node->path()), nodeKindLabel(*node)});
  if (candidates.empty()) {
    setStatus("Nothing loaded to search yet");
    return {};
  }

  auto overlay = std::make_unique<SearchOverlay>(std::move(candidates));
  overlay->setOnConfirm([](const FormValues &values) {
    const std::string id = valueOf(values, "node_id");
    if (id.empty())
      return ConfirmOutcome::reject("Nothing selected");
    return ConfirmOutcome::accept(
        immediate(SearchSelected{std::stoull(id)}));
  });
  return openOverlay(std::move(overlay));
}

std::vector<Effect>
AppController::onSearchSelected(const SearchSelected &message) {
  Node *node = m_state.tree.find(message.nodeId);
  if (!node) {
    setStatus("That entry no longer exists", true);
    return {};
  }
  m_state.tree.reveal(*node);
  switchScreen(Screen::Main);
  m_state.panel = Panel::Tree;
  setStatus("Found " + joinPath(node->path()));
  return {};
}

std::vector<Effect> AppController::showResourceInfo() {
  const Node *node = m_state.tree.cursor();
  std::vector<std::string> lines;
  lines.push_back("Name:       " + node->name);
  lines.push_back("Type:       " + nodeKindLabel(*node));
  lines.push_back("Path:       " + joinPath(node->path()));

  if (const Connection *connection =
          m_world.registry->find(node->connectionId)) {
    lines.push_back("Server:     " + connection->name + " (" +
                    connection->url + ")");
    if (const ServerStatus *status =
            m_state.health.status(connection->id)) {
      lines.push_back("Status:     " +
                      std::string(status->online ? "online" : "offline"));
      if (status->online) {
        lines.push_back("Version:    " + status->version);
        lines.push_back("Response:   " +
                        std::to_string(status->responseTimeMs) + " ms");
      } else if (!status->error.empty()) {
        lines.push_back("Error:      " + status->error);
      }
    }
  }
  if (!node->workspace.empty())
    lines.push_back("Workspace:  " + node->workspace);
  if (node->enabled)
    lines.push_back("Enabled:    " + yesNo(*node->enabled));
  if (node->isExpandable())
    lines.push_back("Children:   " +
                    (node->loaded ? std::to_string(node->children.size())
                                  : std::string("not loaded")));
  if (node->error)
    lines.push_back("Error:      " + *node->error);

  return openOverlay(std::make_unique<InfoOverlay>("Info: " + node->name, lines));
}

std::vector<Effect> AppController::showFileInfo() {
  const FileInfo *file = m_world.browser->current();
  if (!file)
    return {};
  std::vector<std::string> lines;
  lines.push_back("Path:       " + file->getPath());
  lines.push_back("Type:       " + fileTypeLabel(file->getType()));
  if (!file->isDirectory()) {
    lines.push_back("Size:       " + formatBytes(file->getFileSize()));
    lines.push_back("Uploadable: " + yesNo(file->isUploadable()));
    lines.push_back("Verifiable: " + yesNo(isVerifiable(file->getType())));
  }
  return openOverlay(
      std::make_unique<InfoOverlay>("File: " + file->getDisplayName(), lines));
}

std::vector<Effect> AppController::openPreview() {
  const Node *node = m_state.tree.cursor();
  const bool layer = node->kind == NodeKind::Resource &&
                     node->category == Category::Layers;
  const bool group = node->kind == NodeKind::Resource &&
                     node->category == Category::LayerGroups;
  if (!layer && !group) {
    setStatus("Preview is available for layers and layer groups");
    return {};
  }
  auto client = m_world.registry->client(node->connectionId);
  if (!client) {
    setStatus("Connection is no longer configured", true);
    return {};
  }

  auto overlay = std::make_unique<PreviewOverlay>("Preview: " + node->name);
  const uint64_t overlay_id = overlay->id();
  const std::string workspace = node->workspace;
  const std::string name = node->name;
  auto effects = openOverlay(std::move(overlay));

  effects.push_back(makeEffect(
      EffectKind::Load, "preview " + name,
      [client, workspace, name, layer, overlay_id](EffectContext &) -> Message {
        if (layer) {
          auto config = client->getLayerConfig(workspace, name);
          if (!config)
            return PreviewLoaded{overlay_id, Lines::failure(config.error())};
          return PreviewLoaded{
              overlay_id,
              Lines::success(layerLines(config.value(),
                                        client->describeLayer(workspace, name)))};
        }
        auto config = client->getLayerGroup(workspace, name);
        if (!config)
          return PreviewLoaded{overlay_id, Lines::failure(config.error())};
        return PreviewLoaded{overlay_id,
                             Lines::success(layerGroupLines(config.value()))};
      },
      [overlay_id](const std::string &error) -> Message {
        return PreviewLoaded{overlay_id, Lines::failure(error)};
      }));
  return effects;
}

std::vector<Effect>
AppController::onPreviewLoaded(const PreviewLoaded &message) {
  auto *preview =
      m_state.overlays.activeAs<PreviewOverlay>(message.overlayId);
  if (!preview) {
    spdlog::debug("preview {} closed before it loaded", message.overlayId);
    return {};
  }
  if (message.lines)
    preview->setContent(message.lines.value());
  else
    preview->setFailed(message.lines.error());
  return {};
}

std::vector<Effect> AppController::startDownload() {
  const Node *node = m_state.tree.cursor();
  if (node->kind != NodeKind::Resource ||
      (node->category != Category::Layers &&
       node->category != Category::CoverageStores &&
       node->category != Category::Styles)) {
    setStatus("Select a layer, coverage store or style to download");
    return {};
  }
  auto client = m_world.registry->client(node->connectionId);
  if (!client) {
    setStatus("Connection is no longer configured", true);
    return {};
  }

  const Category category = node->category;
  const std::string extension = category == Category::Layers ? ".zip"
                                : category == Category::CoverageStores
                                    ? ".tif"
                                    : ".sld";
  const std::string target =
      (m_world.browser->currentDir() / (node->name + extension)).string();
  const std::string workspace = node->workspace;
  const std::string name = node->name;

  setStatus("Downloading " + name + " to " + target);
  return {makeEffect(
      EffectKind::Download, "download " + name,
      [client, category, workspace, name, target](EffectContext &) -> Message {
        Result<std::string> data =
            category == Category::Layers ? client->downloadLayer(workspace, name)
            : category == Category::CoverageStores
                ? client->downloadCoverage(workspace, name)
                : client->downloadStyle(workspace, name);
        if (!data)
          return DownloadFinished{target, data.status()};

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(data.value().data(),
                  static_cast<std::streamsize>(data.value().size()));
        if (!out)
          return DownloadFinished{target,
                                  Status::failure("cannot write " + target)};
        return DownloadFinished{target, Status::success()};
      },
      [target](const std::string &error) -> Message {
        return DownloadFinished{target, Status::failure(error)};
      })};
}

std::vector<Effect>
AppController::onDownloadFinished(const DownloadFinished &message) {
  if (!message.status) {
    setStatus("Download failed: " + message.status.error(), true);
    return {};
  }
  m_world.browser->refresh();
  setStatus("Downloaded " + message.path);
  return {};
}

std::vector<Effect> AppController::promptDirectory() {
  auto dialog = std::make_unique<InputDialog>(
      "Go to directory", "Path:", m_world.browser->currentDir().string());
  dialog->setOnConfirm([](const FormValues &values) {
    const std::string path = trim(valueOf(values, "value"));
    std::error_code ec;
    if (path.empty() || !fs::is_directory(path, ec))
      return ConfirmOutcome::reject("Not a directory: " + path);
    return ConfirmOutcome::accept(immediate(DirectoryChosen{path}));
  });
  return openOverlay(std::move(dialog));
}
