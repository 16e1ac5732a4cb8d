#include "resourcetree.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace {

using Listing = Result<std::vector<ResourceItem>>;

Listing listChildren(IResourceClient &client, NodeKind kind, Category category,
                     const std::string &workspace) {
  if (kind == NodeKind::Connection)
    return client.listWorkspaces();

  switch (category) {
  case Category::DataStores:
    return client.listDataStores(workspace);
  case Category::CoverageStores:
    return client.listCoverageStores(workspace);
  case Category::Styles:
    return client.listStyles(workspace);
  case Category::Layers:
    return client.listLayers(workspace);
  case Category::LayerGroups:
    return client.listLayerGroups(workspace);
  case Category::None:
    break;
  }
  return Listing::failure("node has no remote children");
}

const Category kWorkspaceCategories[] = {
    Category::DataStores, Category::CoverageStores, Category::Styles,
    Category::Layers, Category::LayerGroups};

} // namespace

std::string categoryTitle(Category category) {
  switch (category) {
  case Category::DataStores:
    return "Data Stores";
  case Category::CoverageStores:
    return "Coverage Stores";
  case Category::Styles:
    return "Styles";
  case Category::Layers:
    return "Layers";
  case Category::LayerGroups:
    return "Layer Groups";
  case Category::None:
    break;
  }
  return "";
}

std::string resourceNoun(Category category) {
  switch (category) {
  case Category::DataStores:
    return "data store";
  case Category::CoverageStores:
    return "coverage store";
  case Category::Styles:
    return "style";
  case Category::Layers:
    return "layer";
  case Category::LayerGroups:
    return "layer group";
  case Category::None:
    break;
  }
  return "resource";
}

std::string nodeKindLabel(const Node &node) {
  switch (node.kind) {
  case NodeKind::Root:
    return "servers";
  case NodeKind::Connection:
    return "server";
  case NodeKind::Workspace:
    return "workspace";
  case NodeKind::Category:
    return "category";
  case NodeKind::Resource:
    return resourceNoun(node.category);
  }
  return "";
}

std::vector<std::string> Node::path() const {
  std::vector<std::string> segments;
  for (const Node *node = this; node && node->kind != NodeKind::Root;
       node = node->parent)
    segments.push_back(node->name);
  std::reverse(segments.begin(), segments.end());
  return segments;
}

Node *Node::child(const std::string &child_name) const {
  for (const auto &c : children) {
    if (c->name == child_name)
      return c.get();
  }
  return nullptr;
}

int Node::depth() const {
  int d = 0;
  for (const Node *node = parent; node; node = node->parent)
    ++d;
  return d;
}

ResourceTree::ResourceTree() { rebuild({}); }

Node *ResourceTree::addChild(Node &parent, std::string name, NodeKind kind,
                             Category category) {
  auto node = std::make_unique<Node>();
  node->id = m_next_id++;
  node->name = std::move(name);
  node->kind = kind;
  node->category = category;
  node->connectionId = parent.connectionId;
  node->workspace = parent.workspace;
  node->parent = &parent;
  Node *raw = node.get();
  m_index[raw->id] = raw;
  parent.children.push_back(std::move(node));
  return raw;
}

void ResourceTree::discardChildren(Node &node) {
  for (auto &c : node.children) {
    discardChildren(*c);
    m_index.erase(c->id);
    if (m_cursor_id == c->id)
      m_cursor_id = node.id;
  }
  node.children.clear();
}

void ResourceTree::rebuild(const std::vector<Connection> &connections) {
  m_index.clear();
  m_restore.reset();

  m_root = std::make_unique<Node>();
  m_root->id = m_next_id++;
  m_root->name = "Servers";
  m_root->kind = NodeKind::Root;
  m_root->loaded = true;
  m_root->expanded = true;
  m_index[m_root->id] = m_root.get();

  for (const auto &connection : connections) {
    Node *node = addChild(*m_root, connection.name, NodeKind::Connection,
                          Category::None);
    node->connectionId = connection.id;
  }
  m_cursor_id = m_root->id;
}

Node *ResourceTree::find(uint64_t id) const {
  auto it = m_index.find(id);
  return it == m_index.end() ? nullptr : it->second;
}

Node *ResourceTree::findPath(const TreePath &path) const {
  Node *node = m_root.get();
  for (const auto &segment : path) {
    node = node->child(segment);
    if (!node)
      return nullptr;
  }
  return node;
}

std::vector<Effect> ResourceTree::expand(Node &node,
                                         const ConnectionRegistry &registry) {
  if (!node.isExpandable())
    return {};
  node.expanded = true;
  if (node.loaded || node.loading)
    return {};

  if (node.kind == NodeKind::Workspace) {
    for (Category category : kWorkspaceCategories)
      addChild(node, categoryTitle(category), NodeKind::Category, category);
    node.loaded = true;
    return {};
  }

  auto client = registry.client(node.connectionId);
  if (!client) {
    node.error = "connection is no longer configured";
    return {};
  }

  node.loading = true;
  node.error.reset();

  const uint64_t id = node.id;
  const NodeKind kind = node.kind;
  const Category category = node.category;
  const std::string workspace = node.workspace;
  return {makeEffect(
      EffectKind::Fetch, "list " + node.name,
      [client, id, kind, category, workspace](EffectContext &) -> Message {
        return ChildrenLoaded{id,
                              listChildren(*client, kind, category, workspace)};
      },
      [id](const std::string &error) -> Message {
        return ChildrenLoaded{id, Listing::failure(error)};
      })};
}

void ResourceTree::collapse(Node &node) {
  if (node.kind == NodeKind::Root)
    return;
  node.expanded = false;
  if (m_restore)
    m_restore->snapshot.expanded.erase(node.path());
}

std::vector<Effect> ResourceTree::toggle(Node &node,
                                         const ConnectionRegistry &registry) {
  if (node.expanded) {
    collapse(node);
    return {};
  }
  return expand(node, registry);
}

std::vector<Effect>
ResourceTree::onChildrenLoaded(const ChildrenLoaded &message,
                               const ConnectionRegistry &registry) {
  Node *node = find(message.nodeId);
  if (!node) {
    spdlog::debug("dropping listing for discarded node {}", message.nodeId);
    return {};
  }

  node->loading = false;
  if (!message.items) {
    node->error = message.items.error();
    spdlog::warn("loading {} failed: {}", node->name, message.items.error());
  } else {
    discardChildren(*node);
    const NodeKind child_kind = node->kind == NodeKind::Connection
                                    ? NodeKind::Workspace
                                    : NodeKind::Resource;
    for (const auto &item : message.items.value()) {
      Node *c = addChild(*node, item.name, child_kind, node->category);
      if (child_kind == NodeKind::Workspace)
        c->workspace = item.name;
      c->enabled = item.enabled;
    }
    node->loaded = true;
    node->error.reset();
  }

  if (m_restore)
    return continueRestore(registry);
  return {};
}

TreeSnapshot ResourceTree::snapshot() const {
  TreeSnapshot snap;
  if (Node *c = cursor())
    snap.cursor = c->path();

  std::vector<const Node *> stack{m_root.get()};
  while (!stack.empty()) {
    const Node *node = stack.back();
    stack.pop_back();
    if (node->expanded && node->kind != NodeKind::Root)
      snap.expanded.insert(node->path());
    for (const auto &c : node->children)
      stack.push_back(c.get());
  }
  return snap;
}

std::vector<Effect> ResourceTree::restore(const TreeSnapshot &snapshot,
                                          const ConnectionRegistry &registry) {
  RestorePlan plan;
  plan.snapshot = snapshot;
  // the cursor can only be reached through its ancestors
  for (size_t n = 1; n < snapshot.cursor.size(); ++n)
    plan.snapshot.expanded.insert(
        TreePath(snapshot.cursor.begin(), snapshot.cursor.begin() + n));
  m_restore = std::move(plan);
  return continueRestore(registry);
}

std::vector<Effect>
ResourceTree::continueRestore(const ConnectionRegistry &registry) {
  std::vector<Effect> effects;

  // std::set orders shorter prefixes first, so parents expand before children
  for (const auto &path : m_restore->snapshot.expanded) {
    Node *node = findPath(path);
    if (node && !node->expanded)
      append(effects, expand(*node, registry));
  }

  if (!m_restore->cursorHandled) {
    if (Node *target = findPath(m_restore->snapshot.cursor)) {
      m_cursor_id = target->id;
      m_restore->cursorHandled = true;
    }
  }

  if (!anyLoading(*m_root)) {
    if (!m_restore->cursorHandled) {
      spdlog::debug("restore target {} not found, cursor back to root",
                    joinPath(m_restore->snapshot.cursor));
      m_cursor_id = m_root->id;
    }
    m_restore.reset();
  }
  return effects;
}

bool ResourceTree::anyLoading(const Node &node) const {
  if (node.loading)
    return true;
  for (const auto &c : node.children) {
    if (anyLoading(*c))
      return true;
  }
  return false;
}

void ResourceTree::reveal(Node &node) {
  for (Node *p = node.parent; p; p = p->parent)
    p->expanded = true;
  setCursor(node);
}

Node *ResourceTree::cursor() const {
  Node *node = find(m_cursor_id);
  return node ? node : m_root.get();
}

void ResourceTree::setCursor(const Node &node) {
  m_cursor_id = node.id;
  if (m_restore)
    m_restore->cursorHandled = true;
}

std::vector<const Node *> ResourceTree::visibleRows() const {
  std::vector<const Node *> rows;
  collectVisible(*m_root, rows);
  return rows;
}

void ResourceTree::collectVisible(const Node &node,
                                  std::vector<const Node *> &rows) const {
  rows.push_back(&node);
  if (!node.expanded)
    return;
  for (const auto &c : node.children)
    collectVisible(*c, rows);
}

int ResourceTree::cursorRow() const {
  const auto rows = visibleRows();
  const Node *c = cursor();
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i] == c)
      return static_cast<int>(i);
  }
  return 0;
}

void ResourceTree::moveCursor(int delta) {
  const auto rows = visibleRows();
  int row = cursorRow() + delta;
  row = std::clamp(row, 0, static_cast<int>(rows.size()) - 1);
  setCursor(*rows[row]);
}

void ResourceTree::moveCursorToEdge(bool last) {
  const auto rows = visibleRows();
  setCursor(last ? *rows.back() : *rows.front());
}

std::vector<const Node *> ResourceTree::loadedNodes() const {
  std::vector<const Node *> nodes;
  std::vector<const Node *> stack{m_root.get()};
  while (!stack.empty()) {
    const Node *node = stack.back();
    stack.pop_back();
    if (node->kind != NodeKind::Root)
      nodes.push_back(node);
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it)
      stack.push_back(it->get());
  }
  return nodes;
}
