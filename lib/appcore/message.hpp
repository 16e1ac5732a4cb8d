/**
 * @file message.hpp
 * @brief Everything that can arrive at AppController::update()
 *
 * Messages are values. Results of background work carry the id of the
 * thing they belong to (tree node, upload batch, CRUD request, overlay,
 * health refresh) so that late arrivals for something that no longer
 * exists are recognised and dropped.
 */

#ifndef MESSAGE_HPP
#define MESSAGE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <ftxui/component/event.hpp>

#include "formtypes.hpp"
#include "models.hpp"
#include "result.hpp"
#include "uploadbatch.hpp"

/** @brief Result of an effect that has nothing to report */
struct Noop {};

/** @brief A key or other terminal input event */
struct KeyPressed {
  ftxui::Event event;
};

/** @brief An effect threw; reported in the status bar */
struct EffectFailed {
  std::string label;
  std::string error;
};

/** @brief Children listing of a tree node finished */
struct ChildrenLoaded {
  uint64_t nodeId = 0;
  Result<std::vector<ResourceItem>> items;
};

/** @brief One frame of an overlay's closing transition */
struct OverlayTick {
  uint64_t overlayId = 0;
};

// Health

struct HealthRefreshRequested {};

struct HealthTick {
  uint64_t generation = 0;
};

struct ProbeFinished {
  uint64_t refreshId = 0;
  size_t index = 0;
  ServerStatus status;
};

/** @brief All probes of one refresh completed */
struct StatusesUpdated {
  uint64_t refreshId = 0;
  std::vector<ServerStatus> statuses;
};

// Upload

/** @brief Operator confirmed an upload batch */
struct StartUpload {
  UploadBatch batch;
};

struct UploadProgress {
  uint64_t batchId = 0;
  size_t index = 0;
  size_t total = 0;
  std::string fileName;
  bool done = false;
};

struct FileUploaded {
  uint64_t batchId = 0;
  size_t index = 0;
  Status status;
  std::optional<VerificationResult> verification;
};

/** @brief Previous file finished successfully, go on with @c nextIndex */
struct UploadContinue {
  uint64_t batchId = 0;
  size_t nextIndex = 0;
};

struct UploadDone {
  uint64_t batchId = 0;
};

/** @brief Operator dismissed the progress view of a finished batch */
struct UploadClosed {
  uint64_t batchId = 0;
};

// CRUD

struct CrudStateLoaded {
  uint64_t requestId = 0;
  Result<WizardSpec> form;
};

struct CrudConfirmed {
  uint64_t requestId = 0;
  FormValues values;
};

struct CrudCancelled {
  uint64_t requestId = 0;
};

struct CrudCompleted {
  uint64_t requestId = 0;
  Status status;
};

// Connections

/** @brief Add (empty id) or edit a saved connection */
struct ConnectionSubmitted {
  std::string id;
  FormValues values;
};

struct ConnectionRemoved {
  std::string id;
};

struct ConnectionTested {
  std::string id;
  Result<ServerStatus> status;
};

struct ConfigSaved {
  Status status;
};

// Miscellaneous tree actions

struct SearchSelected {
  uint64_t nodeId = 0;
};

struct PreviewLoaded {
  uint64_t overlayId = 0;
  Result<std::vector<std::string>> lines;
};

struct DownloadFinished {
  std::string path;
  Status status;
};

/** @brief Local directory typed into the "go to" dialog */
struct DirectoryChosen {
  std::string path;
};

using Message =
    std::variant<Noop, KeyPressed, EffectFailed, ChildrenLoaded, OverlayTick,
                 HealthRefreshRequested, HealthTick, ProbeFinished,
                 StatusesUpdated, StartUpload, UploadProgress, FileUploaded,
                 UploadContinue, UploadDone, UploadClosed, CrudStateLoaded,
                 CrudConfirmed,
                 CrudCancelled, CrudCompleted, ConnectionSubmitted,
                 ConnectionRemoved, ConnectionTested, ConfigSaved,
                 SearchSelected, PreviewLoaded, DownloadFinished,
                 DirectoryChosen>;

#endif // MESSAGE_HPP
