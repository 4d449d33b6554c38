/**
 * @file NodeSet.hpp
 * @brief Identity set of the nodes on the active merge path
 *
 * A merge registers each container it descends into and removes it again
 * on the way out. Finding a node that is already registered means the
 * node is its own ancestor.
 */

#ifndef SHARETREE_NODESET_HPP
#define SHARETREE_NODESET_HPP

#include "sharetree/Value.hpp"

#include <cstddef>
#include <unordered_set>

namespace sharetree {

/**
 * @brief Set of nodes keyed by identity, not by content
 */
class NodeSet {
public:
    bool has(const Node* node) const;

    /// @return false if the node was already a member
    bool add(const Node* node);

    /// @return false if the node was not a member
    bool remove(const Node* node);

    std::size_t size() const noexcept { return nodes_.size(); }
    bool empty() const noexcept { return nodes_.empty(); }
    void clear() noexcept { nodes_.clear(); }

private:
    std::unordered_set<const Node*> nodes_;
};

/**
 * @brief Keeps a node registered for the lifetime of the guard
 *
 * Membership is released on scope exit, including when a user callback
 * throws out of the nested walk.
 */
class AncestorGuard {
public:
    AncestorGuard(NodeSet& set, const Node* node)
        : set_(set), node_(node) {
        set_.add(node_);
    }

    ~AncestorGuard() {
        set_.remove(node_);
    }

    AncestorGuard(const AncestorGuard&) = delete;
    AncestorGuard& operator=(const AncestorGuard&) = delete;

private:
    NodeSet& set_;
    const Node* node_;
};

} // namespace sharetree

#endif // SHARETREE_NODESET_HPP
