#pragma once

/// @file diff.hpp
/// @brief Tree flattening and two-tree diff

#include <treepath/path/messages.hpp>
#include <treepath/path/path_spec.hpp>

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <string>
#include <vector>

namespace treepath_diff {

// =============================================================================
// Options
// =============================================================================

/// Diff behaviour
struct DiffOptions {
    bool ignore_additions = false;          ///< Skip leaves present only in the modified tree
    treepath_path::PathOptions paths;

    /// Parse {"ignore_additions", "prefer_shadow_path", "map_to_single_path"}
    [[nodiscard]] static treepath_core::Result<DiffOptions> from_json(const nlohmann::json& j);
};

// =============================================================================
// Flattening
// =============================================================================

/// One set leaf of a flattened tree
struct LeafRecord {
    treepath_data::Value value;
    treepath_path::Path path;           ///< Address used in output
    treepath_path::PathSpec spec;       ///< Every address of the leaf
};

/// Canonical key to leaf, ordered by key
using FlatMap = std::map<std::string, LeafRecord>;

/// Reduce a tree to its set leaves. A leaf reachable by several addresses is
/// recorded once; unset values (null, enum sentinel, empty leaf-list) are skipped.
[[nodiscard]] treepath_core::Result<FlatMap>
flatten(const treepath_data::DataNode& root, const treepath_path::PathOptions& options = {});

// =============================================================================
// Diff
// =============================================================================

/// Edit set turning one tree into another
struct DiffResult {
    std::vector<treepath_path::Update> updates;
    std::vector<treepath_path::Path> deletes;

    [[nodiscard]] bool empty() const noexcept { return updates.empty() && deletes.empty(); }

    /// Package as a notification with no prefix
    [[nodiscard]] treepath_path::Notification to_notification(std::int64_t timestamp = 0) const;
};

/// Compare two trees of the same NodeType. Changed and added leaves become
/// updates carrying the modified value; leaves missing from @p modified
/// become deletes of the original address.
[[nodiscard]] treepath_core::Result<DiffResult>
diff(const treepath_data::DataNode& original, const treepath_data::DataNode& modified,
     const DiffOptions& options = {});

} // namespace treepath_diff
