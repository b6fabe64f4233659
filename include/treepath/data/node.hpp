#pragma once

/// @file node.hpp
/// @brief Field contract of generated data-model types

#include "fwd.hpp"
#include "value.hpp"
#include <treepath/core/error.hpp>
#include <treepath/schema/fwd.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace treepath_data {

// =============================================================================
// Field Kinds
// =============================================================================

/// Structural kind of a field
enum class FieldKind : std::uint8_t {
    Leaf,
    LeafList,
    Container,
    List,
};

/// Declared scalar type of a leaf or leaf-list element
enum class ValueKind : std::uint8_t {
    Any,
    Bool,
    Int,
    Uint,
    Float,
    String,
    Bytes,
    Enum,
};

[[nodiscard]] const char* field_kind_name(FieldKind kind) noexcept;
[[nodiscard]] const char* value_kind_name(ValueKind kind) noexcept;

/// One declared schema path, relative to the owning node
using SchemaPath = std::vector<std::string>;

/// Parse "a|config/a" into its alternative paths. Empty segments are dropped.
[[nodiscard]] std::vector<SchemaPath> parse_schema_paths(const std::string& spec);

/// Join a schema path with '/'
[[nodiscard]] std::string schema_path_string(const SchemaPath& path);

// =============================================================================
// ListAttributes
// =============================================================================

/// Ordering and cardinality of a list field
struct ListAttributes {
    bool ordered_by_user = false;
    std::optional<std::uint64_t> min_elements;
    std::optional<std::uint64_t> max_elements;

    /// Derive from a list schema entry
    [[nodiscard]] static ListAttributes from_schema(const treepath_schema::SchemaEntry& entry);

    [[nodiscard]] static ListAttributes ordered(std::optional<std::uint64_t> max = std::nullopt) {
        ListAttributes attrs;
        attrs.ordered_by_user = true;
        attrs.max_elements = max;
        return attrs;
    }
};

// =============================================================================
// FieldDescriptor
// =============================================================================

/// Declared contract of one field of a node type
struct FieldDescriptor {
    std::string name;
    FieldKind kind = FieldKind::Leaf;
    std::vector<SchemaPath> paths;
    std::vector<SchemaPath> shadow_paths;
    ValueKind value_type = ValueKind::Any;
    std::vector<std::string> enum_values;   ///< Name of enum value i+1
    const NodeType* child_type = nullptr;
    ListAttributes list;
    bool annotation = false;                ///< Tree bookkeeping, skipped by walks

    [[nodiscard]] static FieldDescriptor leaf(std::string name, const std::string& paths,
                                              ValueKind type = ValueKind::Any);
    [[nodiscard]] static FieldDescriptor leaf_list(std::string name, const std::string& paths,
                                                   ValueKind type = ValueKind::Any);
    [[nodiscard]] static FieldDescriptor enumeration(std::string name, const std::string& paths,
                                                     std::vector<std::string> names);
    [[nodiscard]] static FieldDescriptor container(std::string name, const std::string& paths,
                                                   const NodeType& type);
    [[nodiscard]] static FieldDescriptor list_of(std::string name, const std::string& paths,
                                                 const NodeType& type, ListAttributes attrs = {});
    [[nodiscard]] static FieldDescriptor annotation_field(std::string name);

    /// Declare shadow path(s), "|"-separated
    FieldDescriptor& with_shadow(const std::string& paths);

    [[nodiscard]] bool is_leaf_kind() const noexcept {
        return kind == FieldKind::Leaf || kind == FieldKind::LeafList;
    }

    /// Schema name: last segment of the first declared path
    [[nodiscard]] const std::string& schema_name() const noexcept;

    /// Enum name for a numeric value; nullopt when out of range
    [[nodiscard]] std::optional<std::string> enum_name(std::int64_t value) const;

    /// Numeric value for an enum name
    [[nodiscard]] std::optional<std::int64_t> enum_value(const std::string& name) const;
};

// =============================================================================
// NodeType
// =============================================================================

/// Declared shape of a container or list entry
struct NodeType {
    std::string name;
    std::vector<FieldDescriptor> fields;
    std::vector<std::string> keys;          ///< Key leaf field names, in key order

    NodeType() = default;
    explicit NodeType(std::string n) : name(std::move(n)) {}

    NodeType& field(FieldDescriptor descriptor) {
        fields.push_back(std::move(descriptor));
        return *this;
    }

    NodeType& with_keys(std::vector<std::string> key_fields) {
        keys = std::move(key_fields);
        return *this;
    }

    [[nodiscard]] const FieldDescriptor* find_field(const std::string& field_name) const;

    [[nodiscard]] bool is_key_field(const std::string& field_name) const;
};

// =============================================================================
// ListKey
// =============================================================================

/// Ordered (schema name, value) components of a list entry key
class ListKey {
public:
    using Component = std::pair<std::string, Value>;

    ListKey() = default;
    ListKey(std::initializer_list<Component> components) : m_components(components) {}
    explicit ListKey(std::vector<Component> components) : m_components(std::move(components)) {}

    [[nodiscard]] static ListKey single(std::string name, Value value) {
        return ListKey(std::vector<Component>{Component{std::move(name), std::move(value)}});
    }

    [[nodiscard]] const std::vector<Component>& components() const noexcept { return m_components; }
    [[nodiscard]] std::size_t size() const noexcept { return m_components.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_components.empty(); }

    /// Component value by name; nullptr when absent
    [[nodiscard]] const Value* get(const std::string& name) const;

    /// String form per component. Fails when empty or any component is unset.
    [[nodiscard]] treepath_core::Result<std::map<std::string, std::string>> to_strings() const;

    /// "name=value,name2=value2"
    [[nodiscard]] std::string to_string() const;

    /// Every component must match; component order is irrelevant
    bool operator==(const ListKey& other) const;
    bool operator!=(const ListKey& other) const { return !(*this == other); }

    /// Ordering for keyed storage
    bool operator<(const ListKey& other) const;

private:
    std::vector<Component> m_components;
};

// =============================================================================
// DataNode
// =============================================================================

/// Generic capability over a container or list entry of a data tree
class DataNode {
public:
    virtual ~DataNode() = default;

    [[nodiscard]] virtual const NodeType& type() const noexcept = 0;

    /// Leaf or leaf-list value; null when unset or unknown
    [[nodiscard]] virtual const Value& leaf(const std::string& field) const = 0;

    /// Store a leaf value after checking it against the field contract.
    /// A null value clears the field.
    [[nodiscard]] virtual treepath_core::Result<void> set_leaf(const std::string& field, Value value) = 0;

    [[nodiscard]] virtual const DataNode* container(const std::string& field) const = 0;
    [[nodiscard]] virtual DataNode* container(const std::string& field) = 0;
    [[nodiscard]] virtual treepath_core::Result<DataNode*> get_or_create_container(const std::string& field) = 0;

    [[nodiscard]] virtual const ListNode* list(const std::string& field) const = 0;
    [[nodiscard]] virtual ListNode* list(const std::string& field) = 0;
    [[nodiscard]] virtual treepath_core::Result<ListNode*> get_or_create_list(const std::string& field) = 0;

    /// Reset a field to unset (containers and lists are dropped)
    virtual void clear_field(const std::string& field) = 0;

    [[nodiscard]] virtual std::unique_ptr<DataNode> clone() const = 0;

    /// Key embedded in this node's key leaves
    [[nodiscard]] virtual treepath_core::Result<ListKey> list_key() const;
};

// =============================================================================
// Field Enumeration
// =============================================================================

/// One field of a node with its current content
struct FieldRef {
    const FieldDescriptor* field = nullptr;
    const Value* value = nullptr;           ///< Leaf kinds
    const DataNode* container = nullptr;    ///< Container kind, when present
    const ListNode* list = nullptr;         ///< List kind, when present
};

/// Every declared field of @p node in declaration order
[[nodiscard]] std::vector<FieldRef> enumerate_fields(const DataNode& node);

/// Structural equality of two trees
[[nodiscard]] bool deep_equal(const DataNode& a, const DataNode& b);

// =============================================================================
// Value Contract
// =============================================================================

/// Check @p value against @p field, applying integer widening, int to float,
/// enum lookup by name or number and base64 bytes. Null passes through.
[[nodiscard]] treepath_core::Result<Value> coerce_value(const FieldDescriptor& field, const Value& value);

/// Decode a key-predicate string per the field's declared type
[[nodiscard]] treepath_core::Result<Value> parse_scalar(const FieldDescriptor& field, const std::string& text);

} // namespace treepath_data
