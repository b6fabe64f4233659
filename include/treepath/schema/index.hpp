#pragma once

/// @file index.hpp
/// @brief Leaf lookup by normalized path and leafref resolution

#include "entry.hpp"

#include <map>
#include <string>
#include <vector>

namespace treepath_schema {

// =============================================================================
// XPath Helpers
// =============================================================================

/// Split a path on '/', dropping text inside [...] predicates.
/// A leading '/' yields an empty first part.
[[nodiscard]] std::vector<std::string> split_xpath_parts(const std::string& path);

/// Strip one "prefix:" from every part. More than one ':' is an error.
[[nodiscard]] treepath_core::Result<std::vector<std::string>>
remove_xpath_namespaces(const std::vector<std::string>& parts);

/// Turn a leafref path into an index key. Absolute paths drop the leading
/// separator; relative paths ("../x") walk up from @p caller's data path.
[[nodiscard]] treepath_core::Result<std::vector<std::string>>
fix_schema_tree_path(const std::string& path, const SchemaEntry* caller);

// =============================================================================
// SchemaIndex
// =============================================================================

/// Immutable map from normalized path (module segment stripped, no prefixes,
/// no predicates) to the leaf or leaf-list entry it names.
class SchemaIndex {
public:
    using Key = std::vector<std::string>;

    SchemaIndex() = default;

    /// Index the module-root entries among @p entries (those whose path is
    /// exactly "/module/entity"); everything else is skipped.
    [[nodiscard]] static treepath_core::Result<SchemaIndex>
    build(const std::vector<const SchemaEntry*>& entries);

    /// Index the data children of each module
    [[nodiscard]] static treepath_core::Result<SchemaIndex>
    build_from_modules(const std::vector<const SchemaEntry*>& modules);

    /// Look up a leaf by key; nullptr when not registered
    [[nodiscard]] const SchemaEntry* find(const Key& key) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    /// All registered keys in sorted order
    [[nodiscard]] std::vector<Key> keys() const;

    /// Resolve @p path relative to @p context (may be nullptr for absolute paths)
    [[nodiscard]] treepath_core::Result<const SchemaEntry*>
    resolve_leafref_target(const std::string& path, const SchemaEntry* context) const;

    /// Resolve a leafref leaf's own target path
    [[nodiscard]] treepath_core::Result<const SchemaEntry*>
    resolve_leafref(const SchemaEntry& leaf) const;

private:
    treepath_core::Result<void> add(Key key, const SchemaEntry* entry);
    treepath_core::Result<void> add_children(const SchemaEntry& entry);

    std::map<Key, const SchemaEntry*> m_entries;
};

/// Join a key with '/' for messages
[[nodiscard]] std::string key_to_string(const SchemaIndex::Key& key);

} // namespace treepath_schema
