/**
 * @file resourcetree.hpp
 * @brief Lazily loaded tree of remote resources
 *
 * Layout:
 *
 *     Servers                    (root)
 *     └─ <connection>            children fetched: workspaces
 *        └─ <workspace>          children created locally: five categories
 *           ├─ Data Stores       children fetched
 *           ├─ Coverage Stores   children fetched
 *           ├─ Styles            children fetched
 *           ├─ Layers            children fetched
 *           └─ Layer Groups      children fetched
 *
 * A node's children are requested at most once until the tree is rebuilt.
 * Every node has an id that stays unique for the lifetime of the tree, so
 * a listing that arrives after its node was discarded is ignored.
 */

#ifndef RESOURCETREE_HPP
#define RESOURCETREE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "connectionregistry.hpp"
#include "effect.hpp"
#include "models.hpp"

enum class NodeKind { Root, Connection, Workspace, Category, Resource };

enum class Category {
  None,
  DataStores,
  CoverageStores,
  Styles,
  Layers,
  LayerGroups
};

/** @brief Display title of a category node ("Data Stores", ...) */
std::string categoryTitle(Category category);

/** @brief Singular noun for a resource of @p category ("data store", ...) */
std::string resourceNoun(Category category);

struct Node;

/** @brief "workspace", "data store", ... as shown next to search results */
std::string nodeKindLabel(const Node &node);

struct Node {
  uint64_t id = 0;
  std::string name;
  NodeKind kind = NodeKind::Root;
  /** @brief For category and resource nodes: the category they belong to */
  Category category = Category::None;
  std::string connectionId;
  std::string workspace;

  std::vector<std::unique_ptr<Node>> children;
  Node *parent = nullptr;

  bool loaded = false;
  bool loading = false;
  bool expanded = false;
  std::optional<std::string> error;
  /** @brief Enabled flag of the resource, when the server reports it */
  std::optional<bool> enabled;

  bool isExpandable() const { return kind != NodeKind::Resource; }
  /** @brief Names from the root's first child down to this node */
  std::vector<std::string> path() const;
  Node *child(const std::string &child_name) const;
  int depth() const;
};

using TreePath = std::vector<std::string>;

/**
 * @struct TreeSnapshot
 * @brief Cursor and expansion state captured by name path
 */
struct TreeSnapshot {
  TreePath cursor;
  std::set<TreePath> expanded;
};

class ResourceTree {
private:
  struct RestorePlan {
    TreeSnapshot snapshot;
    bool cursorHandled = false;
  };

  std::unique_ptr<Node> m_root;
  std::unordered_map<uint64_t, Node *> m_index;
  uint64_t m_next_id = 1;
  uint64_t m_cursor_id = 0;
  std::optional<RestorePlan> m_restore;

  Node *addChild(Node &parent, std::string name, NodeKind kind,
                 Category category);
  void discardChildren(Node &node);
  std::vector<Effect> continueRestore(const ConnectionRegistry &registry);
  void collectVisible(const Node &node, std::vector<const Node *> &rows) const;
  bool anyLoading(const Node &node) const;

public:
  ResourceTree();

  /** @brief Discards everything and recreates one node per connection */
  void rebuild(const std::vector<Connection> &connections);

  Node &root() { return *m_root; }
  const Node &root() const { return *m_root; }
  Node *find(uint64_t id) const;
  /** @brief Node at @p path, nullptr if some segment does not exist (yet) */
  Node *findPath(const TreePath &path) const;

  /**
   * @brief Expands @p node, loading its children on first expansion
   *
   * Idempotent: a node that is loaded or currently loading never causes a
   * second fetch.
   */
  std::vector<Effect> expand(Node &node, const ConnectionRegistry &registry);
  void collapse(Node &node);
  std::vector<Effect> toggle(Node &node, const ConnectionRegistry &registry);

  /** @brief Applies a finished listing; unknown node ids are ignored */
  std::vector<Effect> onChildrenLoaded(const ChildrenLoaded &message,
                                       const ConnectionRegistry &registry);

  TreeSnapshot snapshot() const;

  /**
   * @brief Re-applies @p snapshot to a freshly rebuilt tree
   *
   * Expansion proceeds as listings arrive. When the cursor path cannot be
   * found once nothing is loading anymore, the cursor falls back to the
   * root.
   */
  std::vector<Effect> restore(const TreeSnapshot &snapshot,
                              const ConnectionRegistry &registry);
  bool restoring() const { return m_restore.has_value(); }

  /** @brief Expands all ancestors of @p node and puts the cursor on it */
  void reveal(Node &node);

  // Cursor
  Node *cursor() const;
  void setCursor(const Node &node);
  void moveCursor(int delta);
  void moveCursorToEdge(bool last);
  int cursorRow() const;
  std::vector<const Node *> visibleRows() const;

  /** @brief Every node below the root in display order, for search */
  std::vector<const Node *> loadedNodes() const;
  size_t size() const { return m_index.size(); }
};

#endif // RESOURCETREE_HPP
