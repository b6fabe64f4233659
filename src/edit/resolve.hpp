#pragma once

/// @file resolve.hpp
/// @brief Address resolution shared by the mutation operations

#include <treepath/edit/edit.hpp>
#include <treepath/data/list.hpp>

#include <set>
#include <vector>

namespace treepath_edit::detail {

using treepath_data::DataNode;
using treepath_data::FieldDescriptor;
using treepath_data::ListKey;
using treepath_data::ListNode;
using treepath_data::SchemaPath;
using treepath_path::Path;

// =============================================================================
// Field Path Selection
// =============================================================================

/// Paths a field answers to, and the alternative that is silently ignored
struct FieldPaths {
    std::vector<SchemaPath> primary;
    std::vector<SchemaPath> ignored;
};

/// Shadow paths are ignored unless preferred; when preferred (and declared)
/// the primary paths become the ignored ones
[[nodiscard]] FieldPaths select_paths(const FieldDescriptor& field, const EditOptions& options);

/// "module:name" -> "name"
[[nodiscard]] std::string strip_module_prefix(const std::string& name);

/// Decode string-encoded numbers and booleans, as carried in JSON payloads
[[nodiscard]] treepath_core::Result<treepath_data::Value>
decode_leaf_value(const FieldDescriptor& field, const treepath_data::Value& value);

// =============================================================================
// Resolution
// =============================================================================

enum class Mode {
    Read,       ///< Never create; absent elements yield TargetKind::Missing
    Create,     ///< Create containers, lists and list entries on the way
};

enum class TargetKind {
    Node,       ///< Container, list entry or the subject itself
    Leaf,       ///< Leaf or leaf-list field of `node`
    List,       ///< Whole list field of `node`
    Partial,    ///< Path ends inside the compressed path of a field of `node`
    Ignored,    ///< Matches an ignored alternative or a tolerated unknown field
    Missing,    ///< Some element does not exist (Read mode)
};

/// Outcome of resolving a path
struct Target {
    TargetKind kind = TargetKind::Missing;

    /// Node target: the node itself. Otherwise the node holding `field`.
    DataNode* node = nullptr;
    /// Node target: parent of `node` (null for the subject)
    DataNode* parent = nullptr;
    /// Field matched last; null when the path is empty
    const FieldDescriptor* field = nullptr;

    /// List containing `node` when it is a list entry
    ListNode* entry_list = nullptr;
    ListKey entry_key;

    /// List target: the list (null in Read mode when absent)
    ListNode* list = nullptr;

    /// Partial target: path element names below `node`
    SchemaPath partial;

    /// Key-less paths of every list traversed or addressed
    std::vector<Path> lists;
};

/// Resolve @p path below @p root
[[nodiscard]] treepath_core::Result<Target>
resolve(DataNode& root, const Path& path, const EditOptions& options, Mode mode);

// =============================================================================
// Operation Context
// =============================================================================

/// State shared by the operations of one request
struct EditContext {
    const EditOptions& options;
    std::set<Path> touched_lists;   ///< Relative to the request subject

    /// List holding the subject when a request prefix names a list entry
    ListNode* subject_list = nullptr;
    ListKey subject_key;
    /// Set once a delete removed the subject entry from subject_list
    bool subject_erased = false;
};

[[nodiscard]] treepath_core::Result<void>
delete_path(DataNode& subject, const Path& path, EditContext& ctx);

[[nodiscard]] treepath_core::Result<void>
set_path(DataNode& subject, const Path& path, const treepath_data::Value& value, EditContext& ctx);

/// Merge @p object into @p node, which sits at @p base below the subject
[[nodiscard]] treepath_core::Result<void>
unmarshal_node(DataNode& node, const treepath_data::ValueObject& object, const Path& base, EditContext& ctx);

/// Store @p value in @p field of @p node; @p path addresses the field
[[nodiscard]] treepath_core::Result<void>
unmarshal_field(DataNode& node, const FieldDescriptor& field, const treepath_data::Value& value,
                const Path& path, EditContext& ctx);

/// Re-validate every list recorded in @p ctx
[[nodiscard]] treepath_core::Result<void>
validate_touched(DataNode& subject, const EditContext& ctx);

} // namespace treepath_edit::detail
