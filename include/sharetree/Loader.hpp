/**
 * @file Loader.hpp
 * @brief Conversion between documents and trees
 *
 * Builds trees from:
 * - nlohmann::json values
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * and renders trees back to JSON or TOML text. Objects and TOML tables
 * become Object nodes, arrays become Array nodes; Record nodes render as
 * objects/tables.
 */

#ifndef SHARETREE_LOADER_HPP
#define SHARETREE_LOADER_HPP

#include "sharetree/Value.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sharetree {

// ============================================================================
// nlohmann::json conversion
// ============================================================================

/**
 * @brief Build a fresh tree from a JSON value
 *
 * Unsigned integers above INT64_MAX become floats; discarded and binary
 * JSON values become null.
 */
Value from_json(const nlohmann::json& doc);

/**
 * @brief Render a tree as a JSON value
 *
 * Absent renders as null.
 *
 * @throws CycleError if a node is reached again below itself
 */
nlohmann::json to_json(const Value& tree);

// ============================================================================
// File loading
// ============================================================================

/**
 * @brief Load a tree from a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a tree from a TOML file
 *
 * Dates and times are kept as their TOML text.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a tree, picking the format by extension
 *
 * ".json" and ".toml" are recognised case-insensitively.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws UnsupportedFormatError for any other extension
 * @throws ParseError if the content is invalid
 */
Value load_tree_file(const std::string& path);

/**
 * @brief Lowercased extension of path including the dot, e.g. ".json"
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Rendering
// ============================================================================

/**
 * @brief Render a tree as JSON text
 * @param indent Spaces per level; negative for a single line
 * @throws CycleError for cyclic trees
 */
std::string to_json_string(const Value& tree, int indent = 2);

/**
 * @brief Render a tree as TOML text
 *
 * TOML has no null: null leaves are written as empty strings.
 *
 * @throws TypeError if the root is not an object or record node
 * @throws CycleError for cyclic trees
 */
std::string to_toml_string(const Value& tree);

} // namespace sharetree

#endif // SHARETREE_LOADER_HPP
