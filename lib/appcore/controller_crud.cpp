#include "controller.hpp"

#include <spdlog/spdlog.h>

#include "crudforms.hpp"
#include "dialogs.hpp"

std::vector<Effect> AppController::beginCrud(CrudOp op) {
  const Node *node = m_state.tree.cursor();
  const Connection *connection = m_world.registry->find(node->connectionId);

  if (node->kind == NodeKind::Root || !connection) {
    if (op == CrudOp::Create) {
      switchScreen(Screen::Connections);
      return openConnectionForm(nullptr);
    }
    setStatus("Select a server, workspace or resource first");
    return {};
  }

  CrudRequest request;
  request.op = op;
  request.connectionId = connection->id;
  request.connectionName = connection->name;
  request.workspace = node->workspace;

  switch (node->kind) {
  case NodeKind::Connection:
    if (op == CrudOp::Create) {
      request.target = CrudTarget::Workspace;
    } else if (op == CrudOp::Edit) {
      request.target = CrudTarget::Contact;
    } else {
      setStatus("Servers are removed on the connections screen (c)");
      return {};
    }
    break;

  case NodeKind::Workspace:
    if (op == CrudOp::Publish) {
      setStatus("Select a data store or coverage store to publish");
      return {};
    }
    request.target = CrudTarget::Workspace;
    if (op != CrudOp::Create)
      request.name = node->name;
    break;

  case NodeKind::Category:
  case NodeKind::Resource: {
    auto target = targetForCategory(node->category);
    if (!target)
      return {};
    request.target = *target;
    if (node->kind == NodeKind::Category && op != CrudOp::Create) {
      setStatus("Select a " + resourceNoun(node->category) + " first");
      return {};
    }
    if (op == CrudOp::Create && request.target == CrudTarget::Layer) {
      setStatus("Layers are published from a store (p)");
      return {};
    }
    if (op == CrudOp::Publish && request.target != CrudTarget::DataStore &&
        request.target != CrudTarget::CoverageStore) {
      setStatus("Only data stores and coverage stores can be published");
      return {};
    }
    if (op != CrudOp::Create)
      request.name = node->name;
    break;
  }

  case NodeKind::Root:
    return {};
  }

  return startCrud(std::move(request));
}

std::vector<Effect> AppController::manageTileCache() {
  const Node *node = m_state.tree.cursor();
  const Connection *connection = m_world.registry->find(node->connectionId);
  if (!connection || node->kind != NodeKind::Resource ||
      node->category != Category::Layers) {
    setStatus("Select a layer to manage its tile cache");
    return {};
  }

  CrudRequest request;
  request.op = CrudOp::Edit;
  request.target = CrudTarget::TileCache;
  request.connectionId = connection->id;
  request.connectionName = connection->name;
  request.workspace = node->workspace;
  request.name = node->name;
  return startCrud(std::move(request));
}

std::vector<Effect> AppController::startCrud(CrudRequest request) {
  auto client = m_world.registry->client(request.connectionId);
  if (!client) {
    setStatus("Connection is no longer configured", true);
    return {};
  }

  const bool remote = needsRemoteState(request);
  const std::string title = crudTitle(request.op, request.target);
  auto id = m_state.crud.begin(request, remote, m_state.tree.snapshot());
  if (!id) {
    setStatus("Another operation is still in progress", true);
    return {};
  }
  const CrudRequest current = m_state.crud.request();

  if (current.op == CrudOp::Delete || current.op == CrudOp::Publish) {
    auto dialog =
        std::make_unique<ConfirmDialog>(title, crudConfirmText(current));
    const uint64_t request_id = *id;
    dialog->setOnConfirm([request_id](const FormValues &) {
      return ConfirmOutcome::accept(immediate(CrudConfirmed{request_id, {}}));
    });
    dialog->setOnCancel([request_id]() -> std::optional<Effect> {
      return immediate(CrudCancelled{request_id});
    });
    m_state.crud.attachOverlay(dialog->id());
    return openOverlay(std::move(dialog));
  }

  if (!remote) {
    // create forms are assembled locally, the client is not called
    auto form = loadCrudForm(*client, current);
    if (!form) {
      m_state.crud.abandon();
      setStatus(title + " failed: " + form.error(), true);
      return {};
    }
    return openCrudWizard(form.value());
  }

  setStatus(title + ": loading current configuration");
  const uint64_t request_id = *id;
  return {makeEffect(
      EffectKind::Load, title,
      [client, current](EffectContext &) -> Message {
        return CrudStateLoaded{current.id, loadCrudForm(*client, current)};
      },
      [request_id](const std::string &error) -> Message {
        return CrudStateLoaded{request_id, Result<WizardSpec>::failure(error)};
      })};
}

std::vector<Effect> AppController::openCrudWizard(const WizardSpec &spec) {
  auto wizard = std::make_unique<WizardOverlay>(spec);
  const CrudRequest request = m_state.crud.request();

  wizard->setOnConfirm([request](const FormValues &values) {
    std::string error = validateCrudForm(request, values);
    if (!error.empty())
      return ConfirmOutcome::reject(error);
    return ConfirmOutcome::accept(immediate(CrudConfirmed{request.id, values}));
  });
  wizard->setOnCancel([id = request.id]() -> std::optional<Effect> {
    return immediate(CrudCancelled{id});
  });

  auto effects = openOverlay(std::move(wizard));
  m_state.crud.attachOverlay(m_state.overlays.active()->id());
  return effects;
}

std::vector<Effect>
AppController::onCrudStateLoaded(const CrudStateLoaded &message) {
  if (!m_state.crud.stateLoaded(message.requestId, message.form.ok())) {
    spdlog::debug("dropping stale form for request {}", message.requestId);
    return {};
  }
  const CrudRequest &request = m_state.crud.request();
  if (!message.form) {
    setStatus(crudTitle(request.op, request.target) +
                  " failed: " + message.form.error(),
              true);
    return {};
  }
  setStatus(crudTitle(request.op, request.target));
  return openCrudWizard(message.form.value());
}

std::vector<Effect>
AppController::onCrudConfirmed(const CrudConfirmed &message) {
  if (!m_state.crud.confirm(message.requestId, message.values))
    return {};

  const CrudRequest request = m_state.crud.request();
  const std::string title = crudTitle(request.op, request.target);
  auto client = m_world.registry->client(request.connectionId);
  if (!client)
    return {immediate(CrudCompleted{
        request.id, Status::failure("connection is no longer configured")})};

  setStatus(title + "...");
  const FormValues values = message.values;
  const uint64_t request_id = request.id;
  return {makeEffect(
      EffectKind::Submit, title,
      [client, request, values](EffectContext &) -> Message {
        return CrudCompleted{request.id, submitCrud(*client, request, values)};
      },
      [request_id](const std::string &error) -> Message {
        return CrudCompleted{request_id, Status::failure(error)};
      })};
}

std::vector<Effect>
AppController::onCrudCancelled(const CrudCancelled &message) {
  if (m_state.crud.cancel(message.requestId))
    setStatus("Cancelled");
  return {};
}

std::vector<Effect>
AppController::onCrudCompleted(const CrudCompleted &message) {
  if (!m_state.crud.complete(message.requestId))
    return {};

  const CrudRequest request = m_state.crud.request();
  const std::string title = crudTitle(request.op, request.target);
  if (!message.status) {
    setStatus(title + " failed: " + message.status.error(), true);
    return {};
  }

  setStatus(title + " completed successfully");
  spdlog::info("{} '{}' on {}", title, request.name, request.connectionName);
  if (request.target == CrudTarget::Contact ||
      request.target == CrudTarget::TileCache)
    return {};
  return refreshTree(crudResultPath(request, m_state.crud.values()),
                     m_state.crud.snapshot());
}
