/**
 * @file Value.hpp
 * @brief Tree value model for structural-sharing merges
 *
 * A Value is either a leaf or a reference-counted container node:
 * - Absent (the "missing" marker, never stored inside a node)
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Node (std::shared_ptr<Node>, shared by reference)
 *
 * Container nodes carry a Kind tag (array, object or a named record kind)
 * and an insertion-ordered key/value map. Merges compare nodes by identity,
 * leaves by payload.
 */

#ifndef SHARETREE_VALUE_HPP
#define SHARETREE_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sharetree {

class Node;

/// Shared handle to a container node.
using NodePtr = std::shared_ptr<Node>;

/**
 * @brief The "missing" marker
 *
 * Produced by looking up a key that a node does not hold. A merge that
 * yields Absent for a key deletes that key.
 */
struct Absent {
    bool operator==(const Absent&) const noexcept { return true; }
    bool operator!=(const Absent&) const noexcept { return false; }
};

/**
 * @brief Dynamic tree value
 *
 * Copying a Value that holds a node copies the handle, not the node.
 */
class Value {
public:
    using Storage = std::variant<Absent, std::nullptr_t, bool, std::int64_t,
                                 double, std::string, NodePtr>;

    Value() = default;
    Value(Absent) {}
    Value(std::nullptr_t) : data_(std::in_place_type<std::nullptr_t>, nullptr) {}
    Value(bool b) : data_(std::in_place_type<bool>, b) {}
    Value(int i) : data_(std::in_place_type<std::int64_t>, i) {}
    Value(long i) : data_(std::in_place_type<std::int64_t>, i) {}
    Value(long long i) : data_(std::in_place_type<std::int64_t>, i) {}
    Value(double d) : data_(std::in_place_type<double>, d) {}
    Value(const char* s) : data_(std::in_place_type<std::string>, s) {}
    Value(std::string s) : data_(std::in_place_type<std::string>, std::move(s)) {}
    Value(NodePtr node);

    // Type queries
    bool is_absent() const noexcept { return std::holds_alternative<Absent>(data_); }
    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(data_); }
    bool is_boolean() const noexcept { return std::holds_alternative<bool>(data_); }
    bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
    bool is_float() const noexcept { return std::holds_alternative<double>(data_); }
    bool is_number() const noexcept { return is_integer() || is_float(); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    bool is_node() const noexcept { return std::holds_alternative<NodePtr>(data_); }

    // Accessors; throw TypeError when the value holds another alternative.
    bool as_boolean() const;
    std::int64_t as_integer() const;
    double as_float() const;
    const std::string& as_string() const;
    const NodePtr& as_node() const;

    /// Raw node pointer, or nullptr for leaves and Absent.
    Node* node() const noexcept;

    const Storage& storage() const noexcept { return data_; }

private:
    Storage data_;
};

/**
 * @brief Container shape of a node
 */
enum class Shape {
    Array,
    Object,
    Record
};

/**
 * @brief Kind tag carried by every node
 *
 * Two nodes are shape compatible when their kinds compare equal: same
 * shape and, for records, the same record name.
 */
class Kind {
public:
    static Kind array() { return Kind(Shape::Array, {}); }
    static Kind object() { return Kind(Shape::Object, {}); }
    static Kind record(std::string name) { return Kind(Shape::Record, std::move(name)); }

    Shape shape() const noexcept { return shape_; }
    const std::string& name() const noexcept { return name_; }

    /// "array", "object" or "record:<name>"
    std::string to_string() const;

    bool operator==(const Kind& other) const noexcept {
        return shape_ == other.shape_ && name_ == other.name_;
    }
    bool operator!=(const Kind& other) const noexcept { return !(*this == other); }

private:
    Kind(Shape shape, std::string name) : shape_(shape), name_(std::move(name)) {}

    Shape shape_;
    std::string name_;
};

/**
 * @brief Mutable container node
 *
 * Keys are strings kept in insertion order. Array nodes use the decimal
 * indices "0", "1", ... as keys. A node never stores Absent: setting a key
 * to Absent erases it.
 *
 * Entries live in a vector with a hashed key index beside it, so lookups,
 * inserts, appends and overwrites are constant time on average. Erasing a
 * single key shifts the entries after it; use erase_all() for many keys.
 * Copying a node copies its entries, sharing the children.
 */
class Node {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    explicit Node(Kind kind) : kind_(std::move(kind)) {}

    static NodePtr make_object();
    static NodePtr make_object(std::initializer_list<std::pair<std::string, Value>> entries);
    static NodePtr make_array();
    static NodePtr make_array(std::vector<Value> elements);
    static NodePtr make_record(std::string name);
    static NodePtr make_record(std::string name,
                               std::initializer_list<std::pair<std::string, Value>> entries);

    const Kind& kind() const noexcept { return kind_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    bool has(const std::string& key) const;

    /// Value stored under key, or Absent.
    Value get(const std::string& key) const;

    /// Insert or overwrite key; Absent erases it.
    void set(const std::string& key, Value value);

    /// @return true if the key was present
    bool erase(const std::string& key);

    /**
     * @brief Erase several keys in one pass over the entries
     * @return Number of keys that were present
     */
    std::size_t erase_all(const std::vector<std::string>& keys);

    /// Append under the next decimal index key.
    void push_back(Value value);

    void clear() noexcept {
        entries_.clear();
        index_.clear();
    }

    std::vector<std::string> keys() const;

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

private:
    void reindex_from(std::size_t position);

    Kind kind_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

/**
 * @brief Human-readable type name
 * @return "absent", "null", "boolean", "integer", "float", "string",
 *         "array", "object" or "record:<name>"
 */
std::string type_name(const Value& val);

/**
 * @brief Default container classification
 * @return true if val holds a node, false for leaves and Absent
 */
bool is_container(const Value& val);

/**
 * @brief Default shallow clone
 *
 * New node of the same kind with the same entries in the same order.
 * Children are shared, not copied.
 */
NodePtr shallow_clone(const Node& node);

/**
 * @brief Identity comparison used by merges
 *
 * Nodes are the same only when they are the same object; leaves when they
 * hold the same alternative with equal payloads. Integer 1 and float 1.0
 * are not the same, and NaN is never the same as itself.
 */
bool same(const Value& a, const Value& b);

/**
 * @brief Structural equality
 *
 * Node kinds, key sets and values must match; key order is ignored.
 * Safe on cyclic trees.
 */
bool deep_equal(const Value& a, const Value& b);

} // namespace sharetree

#endif // SHARETREE_VALUE_HPP
