/// @file diff.cpp
/// @brief Tree flattening and diff implementation

#include <treepath/diff/diff.hpp>
#include <treepath/core/config.hpp>
#include <treepath/core/log.hpp>

namespace treepath_diff {

using treepath_core::Err;
using treepath_core::Ok;
using treepath_core::Result;
using treepath_data::DataNode;
using treepath_data::FieldRef;
using treepath_path::PathSpec;

// =============================================================================
// DiffOptions
// =============================================================================

Result<DiffOptions> DiffOptions::from_json(const nlohmann::json& j) {
    const std::string what = "diff options";
    auto keys = treepath_core::check_option_keys(j,
        {"ignore_additions", "prefer_shadow_path", "map_to_single_path"}, what);
    if (!keys) {
        return Err<DiffOptions>(keys.error());
    }

    DiffOptions options;
    for (auto r : {treepath_core::read_bool_option(j, "ignore_additions", options.ignore_additions, what),
                   treepath_core::read_bool_option(j, "prefer_shadow_path", options.paths.prefer_shadow_path, what),
                   treepath_core::read_bool_option(j, "map_to_single_path", options.paths.map_to_single_path, what)}) {
        if (!r) {
            return Err<DiffOptions>(r.error());
        }
    }
    return Ok(options);
}

// =============================================================================
// Flattening
// =============================================================================

Result<FlatMap> flatten(const DataNode& root, const treepath_path::PathOptions& options) {
    FlatMap out;
    treepath_path::PathWalk walk(options);

    auto result = treepath_path::walk_tree(root, walk,
        [&out](const FieldRef& ref, const PathSpec& spec) -> Result<void> {
            if (ref.value == nullptr || !ref.value->is_set()) {
                return Ok();
            }
            if (spec.empty()) {
                return Err(treepath_core::PathError::no_schema_path(ref.field->name));
            }
            // First field to claim an address set wins
            out.emplace(spec.canonical_key(), LeafRecord{*ref.value, spec.representative(), spec});
            return Ok();
        });
    if (!result) {
        return Err<FlatMap>(result.error());
    }
    return Ok(std::move(out));
}

// =============================================================================
// Diff
// =============================================================================

treepath_path::Notification DiffResult::to_notification(std::int64_t timestamp) const {
    treepath_path::Notification n;
    n.timestamp = timestamp;
    n.updates = updates;
    n.deletes = deletes;
    return n;
}

Result<DiffResult> diff(const DataNode& original, const DataNode& modified, const DiffOptions& options) {
    TREEPATH_LOG_SCOPE(Diff, "diff");
    if (&original.type() != &modified.type()) {
        return Err<DiffResult>(treepath_core::TypeMismatchError::between(
            original.type().name, modified.type().name));
    }

    auto orig_leaves = flatten(original, options.paths);
    if (!orig_leaves) {
        return Err<DiffResult>(orig_leaves.error().with_context("tree", "original"));
    }
    auto mod_leaves = flatten(modified, options.paths);
    if (!mod_leaves) {
        return Err<DiffResult>(mod_leaves.error().with_context("tree", "modified"));
    }

    DiffResult out;
    for (const auto& [key, orig] : *orig_leaves) {
        auto it = mod_leaves->find(key);
        if (it == mod_leaves->end()) {
            out.deletes.push_back(orig.path);
        } else if (orig.value != it->second.value) {
            out.updates.push_back(treepath_path::Update{it->second.path, it->second.value});
        }
    }

    if (!options.ignore_additions) {
        for (const auto& [key, mod] : *mod_leaves) {
            if (orig_leaves->find(key) == orig_leaves->end()) {
                out.updates.push_back(treepath_path::Update{mod.path, mod.value});
            }
        }
    }

    TREEPATH_LOG_DEBUG(Diff, "Diff of {}: {} updates, {} deletes",
        original.type().name, out.updates.size(), out.deletes.size());
    return Ok(std::move(out));
}

} // namespace treepath_diff
