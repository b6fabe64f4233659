#pragma once

/// @file edit.hpp
/// @brief Applying edit requests and notifications to a data tree

#include "fwd.hpp"
#include <treepath/path/messages.hpp>
#include <treepath/data/node.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace treepath_edit {

// =============================================================================
// EditOptions
// =============================================================================

/// Mutation behaviour
struct EditOptions {
    /// Address fields by their shadow paths; primary paths become the ignored ones
    bool prefer_shadow_path = false;
    /// Skip unknown path elements and payload members instead of failing
    bool tolerate_unknown_fields = false;
    /// Create missing containers and list entries while setting
    bool init_missing_elements = true;
    /// Re-check every list written by an operation once it completes
    bool validate_lists = true;

    /// Parse an object with the member names above
    [[nodiscard]] static treepath_core::Result<EditOptions> from_json(const nlohmann::json& j);
};

// =============================================================================
// Node Access
// =============================================================================

/// Resolve @p path below @p root, creating missing containers and list
/// entries. Fails when the path addresses a leaf or a whole list.
[[nodiscard]] treepath_core::Result<treepath_data::DataNode*>
get_or_create_node(treepath_data::DataNode& root, const treepath_path::Path& path,
                   const EditOptions& options = {});

/// Resolve an existing node; NotFound when any element is absent
[[nodiscard]] treepath_core::Result<const treepath_data::DataNode*>
get_node(const treepath_data::DataNode& root, const treepath_path::Path& path,
         const EditOptions& options = {});

/// Value of the leaf or leaf-list at @p path. Null when unset, absent, or
/// addressed through an ignored alternative path.
[[nodiscard]] treepath_core::Result<treepath_data::Value>
get_value(const treepath_data::DataNode& root, const treepath_path::Path& path,
          const EditOptions& options = {});

// =============================================================================
// Mutation
// =============================================================================

/// Remove the addressed leaf, container, list or list entry. Missing paths
/// succeed. The empty path clears the whole node except list key leaves;
/// a path ending inside a compressed path clears every field below it.
[[nodiscard]] treepath_core::Result<void>
delete_node(treepath_data::DataNode& root, const treepath_path::Path& path,
            const EditOptions& options = {});

/// Store @p value at @p path. Objects merge into containers and list
/// entries, arrays of objects merge into lists, scalars set leaves.
[[nodiscard]] treepath_core::Result<void>
set_node(treepath_data::DataNode& root, const treepath_path::Path& path,
         const treepath_data::Value& value, const EditOptions& options = {});

/// Merge an object payload keyed by schema names into @p node
[[nodiscard]] treepath_core::Result<void>
unmarshal(treepath_data::DataNode& node, const treepath_data::Value& object,
          const EditOptions& options = {});

/// unmarshal() from JSON text
[[nodiscard]] treepath_core::Result<void>
unmarshal_json(treepath_data::DataNode& node, const std::string& json_text,
               const EditOptions& options = {});

// =============================================================================
// Requests
// =============================================================================

/// Apply deletes, then replaces, then updates. There is no rollback: on
/// failure the tree keeps every change made before the failing operation.
[[nodiscard]] treepath_core::Result<void>
apply_edit(treepath_data::DataNode& root, const treepath_path::EditRequest& request,
           const EditOptions& options = {});

/// Apply each notification as an edit request; an atomic notification also
/// deletes everything under its prefix first. Stops at the first failure.
[[nodiscard]] treepath_core::Result<void>
apply_notifications(treepath_data::DataNode& root,
                    const std::vector<treepath_path::Notification>& notifications,
                    const EditOptions& options = {});

} // namespace treepath_edit
