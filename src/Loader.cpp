/**
 * @file Loader.cpp
 * @brief Document loading and rendering
 *
 * JSON goes through nlohmann::json, TOML through toml++. Both are converted
 * to and from trees here so that the merge engine only ever sees Values.
 */

#include "sharetree/Loader.hpp"
#include "sharetree/DotPath.hpp"
#include "sharetree/Errors.hpp"
#include "sharetree/NodeSet.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace sharetree {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert a toml++ node to a tree.
 */
Value toml_to_tree(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(static_cast<std::int64_t>(node.as_integer()->get()));

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            auto arr = Node::make_array();
            for (const auto& elem : *node.as_array()) {
                arr->push_back(toml_to_tree(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            auto obj = Node::make_object();
            for (const auto& [key, val] : *node.as_table()) {
                obj->set(std::string(key.str()), toml_to_tree(val));
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

/**
 * @brief Tracks the path and the nodes being rendered to reject cycles.
 */
struct RenderState {
    Path path;
    NodeSet ancestors;
};

nlohmann::json to_json_impl(const Value& value, RenderState& state) {
    if (value.is_absent() || value.is_null()) return nullptr;
    if (value.is_boolean()) return value.as_boolean();
    if (value.is_integer()) return value.as_integer();
    if (value.is_float()) return value.as_float();
    if (value.is_string()) return value.as_string();

    const Node* node = value.node();
    if (state.ancestors.has(node)) {
        throw CycleError(join_dot_path(state.path));
    }
    AncestorGuard guard(state.ancestors, node);

    nlohmann::json out = node->kind().shape() == Shape::Array
        ? nlohmann::json::array()
        : nlohmann::json::object();

    for (const auto& [key, child] : *node) {
        state.path.push_back(key);
        nlohmann::json rendered = to_json_impl(child, state);
        state.path.pop_back();

        if (out.is_array()) {
            out.push_back(std::move(rendered));
        } else {
            out[key] = std::move(rendered);
        }
    }
    return out;
}

// ---- Tree -> TOML (value-based construction; no raw nodes) -----------------

toml::array make_toml_array(const Node& node, RenderState& state);  // fwd
toml::table make_toml_table(const Node& node, RenderState& state);  // fwd

/**
 * @brief Append a leaf or nested node to a TOML array or table.
 *
 * Insert is called with the converted value; Absent is skipped.
 */
template <typename Insert>
void insert_toml_value(const Value& value, RenderState& state, Insert&& insert) {
    if (value.is_absent()) {
        return;
    }
    if (value.is_node()) {
        const Node& child = *value.node();
        if (child.kind().shape() == Shape::Array) {
            insert(make_toml_array(child, state));
        } else {
            insert(make_toml_table(child, state));
        }
    } else if (value.is_string()) {
        insert(value.as_string());
    } else if (value.is_boolean()) {
        insert(value.as_boolean());
    } else if (value.is_integer()) {
        insert(value.as_integer());
    } else if (value.is_float()) {
        insert(value.as_float());
    } else {
        // No TOML null
        insert(std::string{});
    }
}

/**
 * @brief Registers node for the duration of a conversion, rejecting cycles.
 */
template <typename Fn>
auto with_node(const Node& node, RenderState& state, Fn&& fn) {
    if (state.ancestors.has(&node)) {
        throw CycleError(join_dot_path(state.path));
    }
    AncestorGuard guard(state.ancestors, &node);
    return fn();
}

toml::array make_toml_array(const Node& node, RenderState& state) {
    return with_node(node, state, [&] {
        toml::array out;
        for (const auto& [key, child] : node) {
            state.path.push_back(key);
            insert_toml_value(child, state, [&](auto&& v) {
                out.push_back(std::forward<decltype(v)>(v));
            });
            state.path.pop_back();
        }
        return out;
    });
}

toml::table make_toml_table(const Node& node, RenderState& state) {
    return with_node(node, state, [&] {
        toml::table out;
        for (const auto& entry : node) {
            const std::string& key = entry.first;
            state.path.push_back(key);
            insert_toml_value(entry.second, state, [&](auto&& v) {
                out.insert(key, std::forward<decltype(v)>(v));
            });
            state.path.pop_back();
        }
        return out;
    });
}

} // anonymous namespace

// ============================================================================
// nlohmann::json conversion
// ============================================================================

Value from_json(const nlohmann::json& doc) {
    switch (doc.type()) {
        case nlohmann::json::value_t::object: {
            auto obj = Node::make_object();
            for (auto it = doc.begin(); it != doc.end(); ++it) {
                obj->set(it.key(), from_json(it.value()));
            }
            return obj;
        }

        case nlohmann::json::value_t::array: {
            auto arr = Node::make_array();
            for (const auto& elem : doc) {
                arr->push_back(from_json(elem));
            }
            return arr;
        }

        case nlohmann::json::value_t::string:
            return Value(doc.get<std::string>());

        case nlohmann::json::value_t::boolean:
            return Value(doc.get<bool>());

        case nlohmann::json::value_t::number_integer:
            return Value(doc.get<std::int64_t>());

        case nlohmann::json::value_t::number_unsigned: {
            const auto u = doc.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<std::int64_t>(u));
            }
            // Oversize for int64; fall back to double
            return Value(static_cast<double>(u));
        }

        case nlohmann::json::value_t::number_float:
            return Value(doc.get<double>());

        default:
            return Value(nullptr);
    }
}

nlohmann::json to_json(const Value& tree) {
    RenderState state;
    return to_json_impl(tree, state);
}

// ============================================================================
// File loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);

    try {
        return from_json(nlohmann::json::parse(content));
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(path, 0, 0, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_to_tree(table);
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Value load_tree_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw UnsupportedFormatError(path, ext);
}

// ============================================================================
// Rendering
// ============================================================================

std::string to_json_string(const Value& tree, int indent) {
    return to_json(tree).dump(indent);
}

std::string to_toml_string(const Value& tree) {
    const Node* root = tree.node();
    if (root == nullptr || root->kind().shape() == Shape::Array) {
        throw TypeError("", "object or record", type_name(tree));
    }

    RenderState state;
    toml::table table = make_toml_table(*root, state);

    std::ostringstream oss;
    oss << table;
    return oss.str();
}

} // namespace sharetree
