#include "crudflow.hpp"

#include <spdlog/spdlog.h>

std::string crudTargetNoun(CrudTarget target) {
  switch (target) {
  case CrudTarget::Workspace:
    return "workspace";
  case CrudTarget::DataStore:
    return "data store";
  case CrudTarget::CoverageStore:
    return "coverage store";
  case CrudTarget::Style:
    return "style";
  case CrudTarget::Layer:
    return "layer";
  case CrudTarget::LayerGroup:
    return "layer group";
  case CrudTarget::Contact:
    return "contact information";
  case CrudTarget::TileCache:
    return "tile cache";
  }
  return "resource";
}

std::string crudTitle(CrudOp op, CrudTarget target) {
  if (target == CrudTarget::TileCache)
    return "Manage tile cache";
  std::string verb;
  switch (op) {
  case CrudOp::Create:
    verb = "Create";
    break;
  case CrudOp::Edit:
    verb = "Edit";
    break;
  case CrudOp::Delete:
    verb = "Delete";
    break;
  case CrudOp::Publish:
    verb = "Publish";
    break;
  }
  return verb + " " + crudTargetNoun(target);
}

std::optional<CrudTarget> targetForCategory(Category category) {
  switch (category) {
  case Category::DataStores:
    return CrudTarget::DataStore;
  case Category::CoverageStores:
    return CrudTarget::CoverageStore;
  case Category::Styles:
    return CrudTarget::Style;
  case Category::Layers:
    return CrudTarget::Layer;
  case Category::LayerGroups:
    return CrudTarget::LayerGroup;
  case Category::None:
    break;
  }
  return std::nullopt;
}

std::optional<uint64_t> CrudFlow::begin(CrudRequest request,
                                        bool needs_remote_state,
                                        TreeSnapshot snapshot) {
  if (busy()) {
    spdlog::debug("{} rejected, request {} still active",
                  crudTitle(request.op, request.target), m_request.id);
    return std::nullopt;
  }
  request.id = m_next_id++;
  m_request = std::move(request);
  m_snapshot = std::move(snapshot);
  m_overlay_id = 0;
  m_values.clear();
  m_phase = needs_remote_state ? CrudPhase::LoadingRemoteState
                               : CrudPhase::WizardOpen;
  spdlog::debug("crud request {}: {}", m_request.id,
                crudTitle(m_request.op, m_request.target));
  return m_request.id;
}

bool CrudFlow::stateLoaded(uint64_t request_id, bool ok) {
  if (!isCurrent(request_id, CrudPhase::LoadingRemoteState))
    return false;
  m_phase = ok ? CrudPhase::WizardOpen : CrudPhase::Idle;
  return true;
}

bool CrudFlow::confirm(uint64_t request_id, FormValues values) {
  if (!isCurrent(request_id, CrudPhase::WizardOpen))
    return false;
  m_values = std::move(values);
  m_phase = CrudPhase::Submitting;
  return true;
}

bool CrudFlow::cancel(uint64_t request_id) {
  if (!isCurrent(request_id, CrudPhase::WizardOpen))
    return false;
  m_phase = CrudPhase::Idle;
  return true;
}

bool CrudFlow::complete(uint64_t request_id) {
  if (!isCurrent(request_id, CrudPhase::Submitting))
    return false;
  m_phase = CrudPhase::Idle;
  return true;
}

void CrudFlow::abandon() {
  if (m_phase == CrudPhase::WizardOpen ||
      m_phase == CrudPhase::LoadingRemoteState)
    m_phase = CrudPhase::Idle;
}
