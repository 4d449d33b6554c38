/**
 * @file Merge.cpp
 * @brief Implementation of the structural-sharing merge
 */

#include "sharetree/Merge.hpp"

#include <algorithm>
#include <set>
#include <utility>
#include <variant>

namespace sharetree {

namespace {

    /// Returned by crawl() when a node is reached again below itself.
    struct CycleEscape {};

    using CrawlResult = std::variant<Value, CycleEscape>;

    bool walkable(const Value& value, const MergeOptions& options) {
        if (!value.is_node()) {
            return false;
        }
        return options.is_container ? options.is_container(value) : is_container(value);
    }

    NodePtr clone_of(const Node& node, const MergeOptions& options) {
        return options.shallow_clone ? options.shallow_clone(node) : shallow_clone(node);
    }

    /**
     * @brief Pushes a key onto the path for the lifetime of the guard
     */
    class PathGuard {
    public:
        PathGuard(Path& path, const std::string& key) : path_(path) {
            path_.push_back(key);
        }

        ~PathGuard() {
            path_.pop_back();
        }

        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;

    private:
        Path& path_;
    };

    /**
     * @brief Merge one child value, tracking ancestors
     *
     * Assumes state.path already ends with the child's key.
     */
    CrawlResult crawl(const Value& source, const Value& revision,
                      WalkState& state, const MergeOptions& options) {
        if (options.prefilter && options.prefilter(state.path, source, revision)) {
            return CrawlResult(std::in_place_type<Value>, source);
        }

        if (!walkable(source, options)) {
            return CrawlResult(std::in_place_type<Value>,
                               walk_tree(source, revision, state, options));
        }

        const Node* node = source.node();
        if (state.ancestors.has(node)) {
            // The occurrence further up owns the membership.
            return CrawlResult(std::in_place_type<CycleEscape>);
        }

        AncestorGuard guard(state.ancestors, node);
        return CrawlResult(std::in_place_type<Value>,
                           walk_tree(source, revision, state, options));
    }

} // anonymous namespace

Value walk_tree(const Value& source, const Value& revision,
                WalkState& state, const MergeOptions& options) {
    if (same(source, revision)) {
        return source;
    }

    // Leaves, Absent and opaque nodes are replaced wholesale.
    if (!walkable(source, options) || !walkable(revision, options)) {
        return revision;
    }

    const Node& src = *source.node();
    const Node& rev = *revision.node();

    // An array never merges into an object, nor a record into another
    // record kind.
    if (src.kind() != rev.kind()) {
        return revision;
    }

    // Clone of src, created on the first change. src is never written, so
    // its entries can be walked in place.
    NodePtr working;
    std::vector<std::string> removed;

    for (const auto& entry : src) {
        const std::string& key = entry.first;
        const Value& source_value = entry.second;
        const Value revision_value = rev.get(key);

        CrawlResult result = [&] {
            PathGuard guard(state.path, key);
            return crawl(source_value, revision_value, state, options);
        }();

        // One cyclic key gives up on the whole node.
        if (std::holds_alternative<CycleEscape>(result)) {
            return revision_value;
        }

        Value& merged = std::get<Value>(result);
        if (same(merged, source_value)) {
            continue;
        }

        if (!working) {
            working = clone_of(src, options);
        }

        if (merged.is_absent()) {
            removed.push_back(key);
        } else {
            working->set(key, std::move(merged));
        }
    }

    if (!removed.empty()) {
        working->erase_all(removed);
    }

    // Every revision key was already in source.
    if (src.size() - removed.size() == rev.size()) {
        return working ? Value(working) : source;
    }

    if (!working) {
        working = clone_of(src, options);
    }

    // Keys only in revision are shared as they are, not merged.
    for (const auto& [key, value] : rev) {
        if (!working->has(key)) {
            working->set(key, value);
        }
    }

    return Value(working);
}

Value merge(const Value& source, const Value& revision, const MergeOptions& options) {
    WalkState state;
    return walk_tree(source, revision, state, options);
}

Prefilter frozen_paths(const std::vector<std::string>& dot_paths) {
    std::vector<Path> paths;
    paths.reserve(dot_paths.size());
    for (const auto& dot_path : dot_paths) {
        paths.push_back(split_dot_path(dot_path));
    }
    return frozen_key_paths(paths);
}

Prefilter frozen_key_paths(const std::vector<Path>& paths) {
    std::set<Path> frozen(paths.begin(), paths.end());
    return [frozen = std::move(frozen)](const Path& path, const Value&, const Value&) {
        return frozen.count(path) > 0;
    };
}

Prefilter frozen_kinds(const std::vector<Kind>& kinds) {
    return [kinds](const Path&, const Value& source, const Value&) {
        const Node* node = source.node();
        if (node == nullptr) {
            return false;
        }
        return std::find(kinds.begin(), kinds.end(), node->kind()) != kinds.end();
    };
}

Prefilter any_of(std::vector<Prefilter> prefilters) {
    prefilters.erase(std::remove_if(prefilters.begin(), prefilters.end(),
                                    [](const Prefilter& p) { return !p; }),
                     prefilters.end());
    return [prefilters = std::move(prefilters)](const Path& path, const Value& source,
                                                const Value& revision) {
        for (const auto& prefilter : prefilters) {
            if (prefilter(path, source, revision)) {
                return true;
            }
        }
        return false;
    };
}

} // namespace sharetree
