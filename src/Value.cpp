/**
 * @file Value.cpp
 * @brief Implementation of the tree value model
 */

#include "sharetree/Value.hpp"
#include "sharetree/Errors.hpp"

#include <algorithm>
#include <cstddef>
#include <set>

namespace sharetree {

// ============================================================================
// Value
// ============================================================================

Value::Value(NodePtr node) {
    // A null handle is the null leaf, not an empty node.
    if (node) {
        data_.emplace<NodePtr>(std::move(node));
    } else {
        data_.emplace<std::nullptr_t>(nullptr);
    }
}

bool Value::as_boolean() const {
    if (!is_boolean()) throw TypeError("", "boolean", type_name(*this));
    return std::get<bool>(data_);
}

std::int64_t Value::as_integer() const {
    if (!is_integer()) throw TypeError("", "integer", type_name(*this));
    return std::get<std::int64_t>(data_);
}

double Value::as_float() const {
    if (is_integer()) return static_cast<double>(std::get<std::int64_t>(data_));
    if (!is_float()) throw TypeError("", "float", type_name(*this));
    return std::get<double>(data_);
}

const std::string& Value::as_string() const {
    if (!is_string()) throw TypeError("", "string", type_name(*this));
    return std::get<std::string>(data_);
}

const NodePtr& Value::as_node() const {
    if (!is_node()) throw TypeError("", "node", type_name(*this));
    return std::get<NodePtr>(data_);
}

Node* Value::node() const noexcept {
    const auto* p = std::get_if<NodePtr>(&data_);
    return p ? p->get() : nullptr;
}

// ============================================================================
// Kind
// ============================================================================

std::string Kind::to_string() const {
    switch (shape_) {
        case Shape::Array: return "array";
        case Shape::Object: return "object";
        case Shape::Record: return "record:" + name_;
    }
    return "unknown";
}

// ============================================================================
// Node
// ============================================================================

NodePtr Node::make_object() {
    return std::make_shared<Node>(Kind::object());
}

NodePtr Node::make_object(std::initializer_list<std::pair<std::string, Value>> entries) {
    auto node = make_object();
    for (const auto& [key, value] : entries) {
        node->set(key, value);
    }
    return node;
}

NodePtr Node::make_array() {
    return std::make_shared<Node>(Kind::array());
}

NodePtr Node::make_array(std::vector<Value> elements) {
    auto node = make_array();
    for (auto& element : elements) {
        node->push_back(std::move(element));
    }
    return node;
}

NodePtr Node::make_record(std::string name) {
    return std::make_shared<Node>(Kind::record(std::move(name)));
}

NodePtr Node::make_record(std::string name,
                          std::initializer_list<std::pair<std::string, Value>> entries) {
    auto node = make_record(std::move(name));
    for (const auto& [key, value] : entries) {
        node->set(key, value);
    }
    return node;
}

bool Node::has(const std::string& key) const {
    return index_.find(key) != index_.end();
}

Value Node::get(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return Absent{};
    }
    return entries_[it->second].second;
}

void Node::set(const std::string& key, Value value) {
    if (value.is_absent()) {
        erase(key);
        return;
    }
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(value));
}

bool Node::erase(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    const std::size_t position = it->second;
    index_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
    reindex_from(position);
    return true;
}

std::size_t Node::erase_all(const std::vector<std::string>& keys) {
    // Absent marks the doomed entries; a node never stores it otherwise.
    std::size_t removed = 0;
    std::size_t first = entries_.size();
    for (const auto& key : keys) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            continue;
        }
        entries_[it->second].second = Absent{};
        first = std::min(first, it->second);
        index_.erase(it);
        ++removed;
    }
    if (removed == 0) {
        return 0;
    }

    entries_.erase(std::remove_if(entries_.begin() + static_cast<std::ptrdiff_t>(first),
                                  entries_.end(),
                                  [](const Entry& entry) { return entry.second.is_absent(); }),
                   entries_.end());
    reindex_from(first);
    return removed;
}

void Node::push_back(Value value) {
    set(std::to_string(entries_.size()), std::move(value));
}

void Node::reindex_from(std::size_t position) {
    for (std::size_t i = position; i < entries_.size(); ++i) {
        index_[entries_[i].first] = i;
    }
}

std::vector<std::string> Node::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

// ============================================================================
// Free functions
// ============================================================================

std::string type_name(const Value& val) {
    if (val.is_absent()) return "absent";
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_integer()) return "integer";
    if (val.is_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_node()) return val.node()->kind().to_string();
    return "unknown";
}

bool is_container(const Value& val) {
    return val.is_node();
}

NodePtr shallow_clone(const Node& node) {
    return std::make_shared<Node>(node);
}

bool same(const Value& a, const Value& b) {
    if (a.storage().index() != b.storage().index()) {
        return false;
    }
    if (a.is_node()) {
        return a.node() == b.node();
    }
    return a.storage() == b.storage();
}

namespace {

    using NodePair = std::pair<const Node*, const Node*>;

    bool deep_equal_impl(const Value& a, const Value& b, std::set<NodePair>& visiting) {
        if (!a.is_node() || !b.is_node()) {
            return same(a, b);
        }

        const Node* lhs = a.node();
        const Node* rhs = b.node();
        if (lhs == rhs) {
            return true;
        }
        if (lhs->kind() != rhs->kind() || lhs->size() != rhs->size()) {
            return false;
        }

        // A pair already under comparison is assumed equal; any mismatch
        // is found on the first visit.
        if (!visiting.insert({lhs, rhs}).second) {
            return true;
        }

        bool equal = true;
        for (const auto& [key, value] : *lhs) {
            if (!deep_equal_impl(value, rhs->get(key), visiting)) {
                equal = false;
                break;
            }
        }

        visiting.erase({lhs, rhs});
        return equal;
    }

} // anonymous namespace

bool deep_equal(const Value& a, const Value& b) {
    std::set<NodePair> visiting;
    return deep_equal_impl(a, b, visiting);
}

} // namespace sharetree
