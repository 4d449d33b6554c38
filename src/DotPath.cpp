/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "sharetree/DotPath.hpp"

#include <optional>
#include <sstream>

namespace sharetree {

Path split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    Path segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    // Add final segment
    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const Path& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {
    /**
     * @brief Walk path segments from tree
     * @return The value found, or std::nullopt at the first missing segment
     * @throws TypeError when a leaf must be traversed
     */
    std::optional<Value> resolve(const Value& tree, const std::string& path) {
        const auto segments = split_dot_path(path);

        Value current = tree;
        for (const auto& seg : segments) {
            const Node* node = current.node();
            if (node == nullptr) {
                throw TypeError(path, "object, array or record", type_name(current));
            }
            if (!node->has(seg)) {
                return std::nullopt;
            }
            current = node->get(seg);
        }

        return current;
    }
}

Value get_by_dot(const Value& tree, const std::string& path) {
    const auto segments = split_dot_path(path);

    Value current = tree;
    for (const auto& seg : segments) {
        const Node* node = current.node();
        if (node == nullptr) {
            throw TypeError(path, "object, array or record", type_name(current));
        }
        if (!node->has(seg)) {
            throw KeyError(path, seg);
        }
        current = node->get(seg);
    }

    return current;
}

Value get_by_dot(const Value& tree, const std::string& path, const Value& default_val) {
    auto found = resolve(tree, path);
    return found ? *found : default_val;
}

bool contains_dot(const Value& tree, const std::string& path) {
    return resolve(tree, path).has_value();
}

} // namespace sharetree
