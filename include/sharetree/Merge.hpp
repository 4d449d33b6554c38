/**
 * @file Merge.hpp
 * @brief Structural-sharing merge of two trees
 *
 * merge(source, revision) returns a tree deeply equal to revision that
 * reuses every unchanged subtree of source by reference. Only the nodes on
 * the path to an actual change are cloned, and source is never modified.
 *
 * Merging rules, applied at every node:
 * - Same value (node identity, or equal leaves): source is kept
 * - Either side a leaf, or node kinds differ: revision replaces source
 * - Otherwise keys are merged one by one; a key missing from revision is
 *   deleted, keys only in revision are copied in by reference
 */

#ifndef SHARETREE_MERGE_HPP
#define SHARETREE_MERGE_HPP

#include "sharetree/DotPath.hpp"
#include "sharetree/NodeSet.hpp"
#include "sharetree/Value.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sharetree {

/**
 * @brief Opt-out hook consulted before each value is merged
 *
 * Receives the path of the value and both candidates. Returning true keeps
 * the source value (and its whole subtree) as is.
 */
using Prefilter = std::function<bool(const Path& path, const Value& source, const Value& revision)>;

/// Narrows which nodes are walked; only consulted for values holding a node.
using ContainerPredicate = std::function<bool(const Value& value)>;

/// Must return a node of the same kind with the same entries.
using CloneFunction = std::function<NodePtr(const Node& node)>;

/**
 * @brief Per-call merge configuration
 *
 * Empty is_container / shallow_clone mean sharetree::is_container and
 * sharetree::shallow_clone.
 */
struct MergeOptions {
    Prefilter prefilter;
    ContainerPredicate is_container;
    CloneFunction shallow_clone;
};

/**
 * @brief Traversal state owned by a single merge call
 */
struct WalkState {
    Path path;
    NodeSet ancestors;
};

/**
 * @brief Merge revision into source, sharing unchanged subtrees
 *
 * Low-level entry point: the caller owns the traversal state. path is the
 * location of source within the enclosing tree and is restored on return;
 * ancestors holds the nodes already on the path. source itself is not
 * registered as an ancestor.
 *
 * If a child node turns out to be its own ancestor, the walk of the
 * enclosing node is abandoned and the revision value under that child's
 * key is returned in place of the whole node.
 *
 * @return source, revision, or a shallow clone of source carrying the
 *         merged children
 */
Value walk_tree(const Value& source, const Value& revision,
                WalkState& state, const MergeOptions& options);

/**
 * @brief Merge revision into source with fresh traversal state
 *
 * Examples:
 * ```cpp
 * Value source = Node::make_object({{"a", Node::make_object({{"b", 1}, {"c", 2}})}, {"d", 3}});
 * Value revision = Node::make_object({{"a", Node::make_object({{"b", 1}, {"c", 5}})}, {"d", 3}});
 * Value result = merge(source, revision);
 * // result and result["a"] are new nodes; result["d"] is source's 3
 *
 * Value same_result = merge(source, source);
 * // same_result.node() == source.node()
 * ```
 */
Value merge(const Value& source, const Value& revision,
            const MergeOptions& options = MergeOptions());

/**
 * @brief Prefilter keeping the given dot-paths from source
 *
 * Each entry is split with split_dot_path() and matches when the current
 * merge path has exactly those segments, so "a.b" names key "b" under key
 * "a" and never a key literally called "a.b". Everything below a matching
 * path is kept as well. Use frozen_key_paths() for keys containing '.' or
 * empty keys.
 */
Prefilter frozen_paths(const std::vector<std::string>& dot_paths);

/**
 * @brief Prefilter keeping the given key paths from source
 *
 * Paths are compared segment by segment, so any key can be named.
 */
Prefilter frozen_key_paths(const std::vector<Path>& paths);

/**
 * @brief Prefilter keeping source nodes of the given kinds
 */
Prefilter frozen_kinds(const std::vector<Kind>& kinds);

/**
 * @brief Prefilter that holds when any of the given prefilters holds
 *
 * Empty prefilters in the list are skipped.
 */
Prefilter any_of(std::vector<Prefilter> prefilters);

} // namespace sharetree

#endif // SHARETREE_MERGE_HPP
