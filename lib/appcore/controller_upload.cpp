#include "controller.hpp"

#include <spdlog/spdlog.h>

#include "dialogs.hpp"

namespace {

/** @brief Tree path of the resource created by uploading @p file */
TreePath uploadedPath(const std::string &connection,
                      const std::string &workspace, const UploadFile &file) {
  Category category = Category::DataStores;
  if (isStyleFile(file.type))
    category = Category::Styles;
  else if (file.type == FileType::GeoTIFF)
    category = Category::CoverageStores;
  return {connection, workspace, categoryTitle(category), file.storeName};
}

} // namespace

std::vector<Effect> AppController::startUpload() {
  if (m_state.upload.active()) {
    setStatus("An upload is already running", true);
    return {};
  }

  const auto files = m_world.browser->selectedFiles();
  if (files.empty()) {
    setStatus("Mark Shapefile, GeoPackage, GeoTIFF, SLD or CSS files to upload");
    return {};
  }

  const Node *node = m_state.tree.cursor();
  if (node->workspace.empty()) {
    setStatus("Select the target workspace in the resource tree first");
    return {};
  }

  UploadBatch batch;
  batch.connectionId = node->connectionId;
  batch.workspace = node->workspace;
  for (const auto &file : files)
    batch.files.push_back({file.getPath(), file.getStem(), file.getType()});

  auto dialog =
      std::make_unique<ConfirmDialog>("Upload", uploadConfirmText(batch));
  dialog->setOnConfirm([batch](const FormValues &) {
    return ConfirmOutcome::accept(immediate(StartUpload{batch}));
  });
  return openOverlay(std::move(dialog));
}

std::vector<Effect> AppController::onStartUpload(const StartUpload &message) {
  if (m_state.upload.active()) {
    setStatus("An upload is already running", true);
    return {};
  }
  auto client = m_world.registry->client(message.batch.connectionId);
  if (!client) {
    setStatus("Connection is no longer configured", true);
    return {};
  }

  auto effects = m_state.upload.start(message.batch, client,
                                      m_world.summaryReader);
  auto progress = std::make_unique<ProgressOverlay>(
      "Uploading to " + message.batch.workspace, m_state.upload.batchId(),
      m_state.upload.total());
  const uint64_t batch_id = m_state.upload.batchId();
  progress->setOnConfirm([batch_id](const FormValues &) {
    return ConfirmOutcome::accept(immediate(UploadClosed{batch_id}));
  });

  auto opened = openOverlay(std::move(progress));
  m_state.progressOverlayId = m_state.overlays.active()->id();
  m_world.browser->clearMarks();
  append(opened, std::move(effects));
  return opened;
}

std::vector<Effect>
AppController::onUploadProgress(const UploadProgress &message) {
  if (message.batchId != m_state.upload.batchId())
    return {};
  if (auto *progress = m_state.overlays.activeAs<ProgressOverlay>(
          m_state.progressOverlayId))
    progress->update(message);
  setStatus("Uploading " + std::to_string(message.index + 1) + "/" +
            std::to_string(message.total) + ": " + message.fileName);
  return {};
}

std::vector<Effect> AppController::onFileUploaded(const FileUploaded &message) {
  return m_state.upload.onFileUploaded(message);
}

std::vector<Effect>
AppController::onUploadContinue(const UploadContinue &message) {
  return m_state.upload.onContinue(message);
}

std::vector<Effect> AppController::onUploadDone(const UploadDone &message) {
  UploadPipeline &upload = m_state.upload;
  if (!upload.onDone(message))
    return {};

  if (upload.succeeded()) {
    setStatus("Uploaded " + std::to_string(upload.uploadedCount()) +
              " file(s) to " + upload.batch().workspace);
  } else {
    const size_t failed = *upload.failedIndex();
    setStatus("Upload stopped at file " + std::to_string(failed + 1) + "/" +
                  std::to_string(upload.total()) + ": " +
                  upload.outcomes()[failed].error,
              true);
  }

  if (auto *progress = m_state.overlays.activeAs<ProgressOverlay>(
          m_state.progressOverlayId)) {
    progress->finish(upload.succeeded(), uploadReport(upload));
    return {};
  }
  // the progress view was replaced; nobody is left to dismiss it
  return onUploadClosed(UploadClosed{message.batchId});
}

std::vector<Effect> AppController::onUploadClosed(const UploadClosed &message) {
  UploadPipeline &upload = m_state.upload;
  if (!upload.onClosed(message))
    return {};
  m_state.progressOverlayId = 0;

  auto last = upload.lastUploaded();
  if (!last)
    return {};
  const Connection *connection =
      m_world.registry->find(upload.batch().connectionId);
  if (!connection)
    return {};
  return refreshTree(
      uploadedPath(connection->name, upload.batch().workspace, *last),
      m_state.tree.snapshot());
}
