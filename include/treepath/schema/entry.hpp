#pragma once

/// @file entry.hpp
/// @brief Schema description tree (containers, lists, leaves)

#include "fwd.hpp"
#include <treepath/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace treepath_schema {

// =============================================================================
// EntryKind
// =============================================================================

/// Kind of schema node
enum class EntryKind : std::uint8_t {
    Module,
    Container,
    List,
    Leaf,
    LeafList,
    Choice,
    Case,
};

/// Get kind name as used in JSON descriptions
[[nodiscard]] const char* entry_kind_name(EntryKind kind) noexcept;

/// Parse kind name
[[nodiscard]] std::optional<EntryKind> entry_kind_from_string(const std::string& str) noexcept;

// =============================================================================
// TypeSpec
// =============================================================================

/// Declared type of a leaf
struct TypeSpec {
    std::string name;           ///< e.g. "string", "uint32", "leafref"
    std::string leafref_path;   ///< Target path for leafref types

    [[nodiscard]] bool is_leafref() const noexcept { return name == "leafref"; }
};

// =============================================================================
// SchemaEntry
// =============================================================================

/// One node of a schema description. Children are owned; the parent pointer
/// is a lookup back-reference only.
class SchemaEntry {
public:
    SchemaEntry(std::string name, EntryKind kind);

    SchemaEntry(const SchemaEntry&) = delete;
    SchemaEntry& operator=(const SchemaEntry&) = delete;

    // -------------------------------------------------------------------------
    // Factories
    // -------------------------------------------------------------------------

    [[nodiscard]] static std::unique_ptr<SchemaEntry> module(std::string name);
    [[nodiscard]] static std::unique_ptr<SchemaEntry> container(std::string name);
    [[nodiscard]] static std::unique_ptr<SchemaEntry> list(std::string name, std::vector<std::string> keys);
    [[nodiscard]] static std::unique_ptr<SchemaEntry> leaf(std::string name, std::string type = "string");
    [[nodiscard]] static std::unique_ptr<SchemaEntry> leaf_list(std::string name, std::string type = "string");
    [[nodiscard]] static std::unique_ptr<SchemaEntry> leafref(std::string name, std::string target);
    [[nodiscard]] static std::unique_ptr<SchemaEntry> choice(std::string name);
    [[nodiscard]] static std::unique_ptr<SchemaEntry> case_(std::string name);

    /// Take ownership of a child and return it
    SchemaEntry& add(std::unique_ptr<SchemaEntry> child);

    // -------------------------------------------------------------------------
    // Builder
    // -------------------------------------------------------------------------

    SchemaEntry& with_ordered_by_user(bool value = true) { m_ordered_by_user = value; return *this; }
    SchemaEntry& with_min_elements(std::uint64_t n) { m_min_elements = n; return *this; }
    SchemaEntry& with_max_elements(std::uint64_t n) { m_max_elements = n; return *this; }
    SchemaEntry& with_config(bool value) { m_config = value; return *this; }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] EntryKind kind() const noexcept { return m_kind; }
    [[nodiscard]] const SchemaEntry* parent() const noexcept { return m_parent; }
    [[nodiscard]] const std::vector<std::unique_ptr<SchemaEntry>>& children() const noexcept { return m_children; }
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return m_keys; }
    [[nodiscard]] bool ordered_by_user() const noexcept { return m_ordered_by_user; }
    [[nodiscard]] std::optional<std::uint64_t> min_elements() const noexcept { return m_min_elements; }
    [[nodiscard]] std::optional<std::uint64_t> max_elements() const noexcept { return m_max_elements; }
    [[nodiscard]] const TypeSpec& type() const noexcept { return m_type; }

    /// Effective config flag (false if this node or any ancestor is state)
    [[nodiscard]] bool is_config() const noexcept;

    [[nodiscard]] bool is_leaf() const noexcept {
        return m_kind == EntryKind::Leaf || m_kind == EntryKind::LeafList;
    }
    [[nodiscard]] bool is_dir() const noexcept { return !is_leaf(); }
    [[nodiscard]] bool is_list() const noexcept { return m_kind == EntryKind::List; }
    [[nodiscard]] bool is_choice_or_case() const noexcept {
        return m_kind == EntryKind::Choice || m_kind == EntryKind::Case;
    }

    /// Full path including choice and case nodes, e.g. "/mod/a/b"
    [[nodiscard]] std::string path() const;

    /// Data path with choice and case nodes removed
    [[nodiscard]] std::string schema_tree_path() const;

    /// Data-tree children: choice and case nodes are replaced by their contents
    [[nodiscard]] std::vector<const SchemaEntry*> data_children() const;

    /// Find a data-tree child by name
    [[nodiscard]] const SchemaEntry* find_child(const std::string& name) const;

    // -------------------------------------------------------------------------
    // Serialization
    // -------------------------------------------------------------------------

    /// Load a schema subtree from its JSON description
    [[nodiscard]] static treepath_core::Result<std::unique_ptr<SchemaEntry>> from_json(const nlohmann::json& j);

    /// Convert back to the JSON description format
    [[nodiscard]] nlohmann::json to_json() const;

private:
    void collect_data_children(std::vector<const SchemaEntry*>& out) const;

    std::string m_name;
    EntryKind m_kind;
    const SchemaEntry* m_parent = nullptr;
    std::vector<std::unique_ptr<SchemaEntry>> m_children;
    std::vector<std::string> m_keys;
    bool m_ordered_by_user = false;
    std::optional<std::uint64_t> m_min_elements;
    std::optional<std::uint64_t> m_max_elements;
    std::optional<bool> m_config;
    TypeSpec m_type;
};

} // namespace treepath_schema
