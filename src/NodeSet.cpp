/**
 * @file NodeSet.cpp
 * @brief Implementation of the ancestor node set
 */

#include "sharetree/NodeSet.hpp"

namespace sharetree {

bool NodeSet::has(const Node* node) const {
    return nodes_.count(node) > 0;
}

bool NodeSet::add(const Node* node) {
    return nodes_.insert(node).second;
}

bool NodeSet::remove(const Node* node) {
    return nodes_.erase(node) > 0;
}

} // namespace sharetree
