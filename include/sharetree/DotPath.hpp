/**
 * @file DotPath.hpp
 * @brief Dot-notation paths into trees
 *
 * A Path is the list of keys from a root to a value, as maintained by the
 * merge engine. Its dot form ("database.host", "servers.0.name") is used by
 * prefilters, error messages and the command line.
 *
 * Lookup rules:
 * - get_by_dot() without default raises KeyError if a segment is missing
 * - get_by_dot() with default returns the default for missing segments,
 *   but still raises TypeError when asked to traverse a leaf
 * - contains_dot() returns false for missing segments and raises
 *   TypeError when asked to traverse a leaf
 */

#ifndef SHARETREE_DOTPATH_HPP
#define SHARETREE_DOTPATH_HPP

#include "sharetree/Value.hpp"
#include "sharetree/Errors.hpp"

#include <string>
#include <vector>

namespace sharetree {

/// Keys from the root of a tree to one of its values.
using Path = std::vector<std::string>;

/**
 * @brief Split a dot-path into segments
 *
 * Examples:
 * - "database.host" → ["database", "host"]
 * - "servers.0.name" → ["servers", "0", "name"]
 * - "" → []
 * - "a..b" → ["a", "b"]
 */
Path split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const Path& segments);

/**
 * @brief Get value from a tree using a dot-path (strict)
 *
 * Keys are looked up verbatim in every kind of node, so array elements
 * are addressed by their decimal index.
 *
 * @param tree Root value
 * @param path Dot-separated path; "" yields the root
 * @return The value at path
 * @throws KeyError if any segment is not found
 * @throws TypeError if traversal hits a leaf before the final segment
 *
 * ```cpp
 * Value cfg = Node::make_object({{"db", Node::make_object({{"host", "localhost"}})}});
 * get_by_dot(cfg, "db.host");    // "localhost"
 * get_by_dot(cfg, "db.port");    // throws KeyError
 * get_by_dot(cfg, "db.host.x");  // throws TypeError (host is a string)
 * ```
 */
Value get_by_dot(const Value& tree, const std::string& path);

/**
 * @brief Get value from a tree using a dot-path (with default)
 *
 * @return The value at path, or default_val if a segment is missing
 * @throws TypeError if traversal hits a leaf before the final segment
 */
Value get_by_dot(const Value& tree, const std::string& path, const Value& default_val);

/**
 * @brief Check if a dot-path resolves in a tree
 *
 * @throws TypeError if traversal hits a leaf before the final segment
 */
bool contains_dot(const Value& tree, const std::string& path);

} // namespace sharetree

#endif // SHARETREE_DOTPATH_HPP
