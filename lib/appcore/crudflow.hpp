/**
 * @file crudflow.hpp
 * @brief State machine behind create, edit, delete and publish dialogs
 *
 *     Idle ──begin──> LoadingRemoteState ──loaded──> WizardOpen
 *       │                     │ failed                 │   │
 *       │                     v                cancel  │   │ confirm
 *       │                   Idle  <────────────────────┘   v
 *       └──begin (no remote state)──> WizardOpen       Submitting ──completed──> Idle
 *
 * Only one operation runs at a time. Every transition names the request
 * it belongs to; messages of earlier requests are rejected.
 */

#ifndef CRUDFLOW_HPP
#define CRUDFLOW_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "formtypes.hpp"
#include "resourcetree.hpp"

enum class CrudPhase { Idle, LoadingRemoteState, WizardOpen, Submitting };

enum class CrudOp { Create, Edit, Delete, Publish };

enum class CrudTarget {
  Workspace,
  DataStore,
  CoverageStore,
  Style,
  Layer,
  LayerGroup,
  Contact,
  /** @brief GeoWebCache tiles of a layer; only edited (seed, truncate) */
  TileCache
};

struct CrudRequest {
  uint64_t id = 0;
  CrudOp op = CrudOp::Create;
  CrudTarget target = CrudTarget::Workspace;
  std::string connectionId;
  std::string connectionName;
  std::string workspace;
  /** @brief Existing resource name; empty for Create */
  std::string name;
};

std::string crudTargetNoun(CrudTarget target);
/** @brief "Create workspace", "Delete layer group", ... */
std::string crudTitle(CrudOp op, CrudTarget target);
/** @brief Maps a tree category onto the resource type it lists */
std::optional<CrudTarget> targetForCategory(Category category);

class CrudFlow {
private:
  CrudPhase m_phase = CrudPhase::Idle;
  CrudRequest m_request;
  uint64_t m_next_id = 1;
  uint64_t m_overlay_id = 0;
  TreeSnapshot m_snapshot;
  FormValues m_values;

  bool isCurrent(uint64_t request_id, CrudPhase phase) const {
    return m_phase == phase && m_request.id == request_id;
  }

public:
  /**
   * @brief Starts a new operation
   *
   * @param needs_remote_state Load the current configuration before
   *        showing the dialog
   * @return the request id, or nullopt while another operation runs
   */
  std::optional<uint64_t> begin(CrudRequest request, bool needs_remote_state,
                                TreeSnapshot snapshot);

  /** @brief LoadingRemoteState -> WizardOpen on success, Idle on failure */
  bool stateLoaded(uint64_t request_id, bool ok);
  void attachOverlay(uint64_t overlay_id) { m_overlay_id = overlay_id; }
  /** @brief WizardOpen -> Submitting, remembering the submitted answer */
  bool confirm(uint64_t request_id, FormValues values);
  /** @brief WizardOpen -> Idle */
  bool cancel(uint64_t request_id);
  /** @brief Submitting -> Idle */
  bool complete(uint64_t request_id);
  /** @brief Back to Idle when the dialog disappears without an answer */
  void abandon();

  CrudPhase phase() const { return m_phase; }
  bool busy() const { return m_phase != CrudPhase::Idle; }
  const CrudRequest &request() const { return m_request; }
  uint64_t overlayId() const { return m_overlay_id; }
  /** @brief Tree state when the operation began */
  const TreeSnapshot &snapshot() const { return m_snapshot; }
  const FormValues &values() const { return m_values; }
};

#endif // CRUDFLOW_HPP
