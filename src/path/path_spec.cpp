/// @file path_spec.cpp
/// @brief PathSpec algebra and tree walks

#include <treepath/path/path_spec.hpp>
#include <treepath/core/config.hpp>
#include <treepath/core/log.hpp>

#include <algorithm>

namespace treepath_path {

using treepath_core::Err;
using treepath_core::Ok;
using treepath_core::PathError;
using treepath_core::Result;
using treepath_data::DataNode;
using treepath_data::FieldDescriptor;
using treepath_data::FieldKind;
using treepath_data::SchemaPath;

// =============================================================================
// PathSpec
// =============================================================================

Result<PathSpec> PathSpec::child(const std::vector<SchemaPath>& relative, const std::string& field) const {
    if (m_paths.empty()) {
        return Err<PathSpec>(PathError::missing_parent(field));
    }

    std::vector<Path> out;
    out.reserve(m_paths.size() * relative.size());
    for (const auto& parent : m_paths) {
        for (const auto& rel : relative) {
            Path p = parent;
            for (const auto& name : rel) {
                p.elems.emplace_back(name);
            }
            out.push_back(std::move(p));
        }
    }
    return Ok(PathSpec(std::move(out)));
}

Result<PathSpec> PathSpec::list_entry(const treepath_data::ListKey& key, const std::string& field) const {
    if (m_paths.empty()) {
        return Err<PathSpec>(PathError::missing_parent(field));
    }

    auto strings = key.to_strings();
    if (!strings) {
        return Err<PathSpec>(PathError::invalid_key(field, strings.error().message()));
    }

    std::vector<Path> out = m_paths;
    for (auto& p : out) {
        if (p.elems.empty()) {
            return Err<PathSpec>(PathError::invalid_key(field, "list entry with no parent element"));
        }
        p.elems.back().keys = *strings;
    }
    return Ok(PathSpec(std::move(out)));
}

std::string PathSpec::canonical_key() const {
    std::vector<std::string> keys;
    keys.reserve(m_paths.size());
    for (const auto& p : m_paths) {
        keys.push_back(p.to_string());
    }
    std::sort(keys.begin(), keys.end());

    std::string out;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) out += "|";
        out += keys[i];
    }
    return out;
}

bool PathSpec::operator==(const PathSpec& other) const {
    auto contains_all = [](const std::vector<Path>& a, const std::vector<Path>& b) {
        for (const auto& p : a) {
            if (std::find(b.begin(), b.end(), p) == b.end()) {
                return false;
            }
        }
        return true;
    };
    return contains_all(m_paths, other.m_paths) && contains_all(other.m_paths, m_paths);
}

SchemaPath least_specific_path(const std::vector<SchemaPath>& paths) {
    const SchemaPath* shortest = nullptr;
    for (const auto& p : paths) {
        if (shortest == nullptr || p.size() < shortest->size()) {
            shortest = &p;
        }
    }
    return shortest ? *shortest : SchemaPath{};
}

// =============================================================================
// PathOptions
// =============================================================================

Result<PathOptions> PathOptions::from_json(const nlohmann::json& j) {
    const std::string what = "path options";
    auto keys = treepath_core::check_option_keys(j, {"prefer_shadow_path", "map_to_single_path"}, what);
    if (!keys) {
        return Err<PathOptions>(keys.error());
    }

    PathOptions options;
    for (auto r : {treepath_core::read_bool_option(j, "prefer_shadow_path", options.prefer_shadow_path, what),
                   treepath_core::read_bool_option(j, "map_to_single_path", options.map_to_single_path, what)}) {
        if (!r) {
            return Err<PathOptions>(r.error());
        }
    }
    return Ok(options);
}

Result<std::vector<SchemaPath>> field_schema_paths(const FieldDescriptor& field, const PathOptions& options) {
    std::vector<SchemaPath> paths;
    if (options.prefer_shadow_path) {
        paths = field.shadow_paths;
    }
    if (paths.empty()) {
        paths = field.paths;
    }
    if (paths.empty()) {
        return Err<std::vector<SchemaPath>>(PathError::no_schema_path(field.name));
    }
    if (options.map_to_single_path) {
        return Ok(std::vector<SchemaPath>{least_specific_path(paths)});
    }
    return Ok(std::move(paths));
}

// =============================================================================
// PathWalk
// =============================================================================

void PathWalk::set(const DataNode* node, PathSpec spec) {
    m_specs[node] = std::move(spec);
}

const PathSpec* PathWalk::get(const DataNode* node) const {
    auto it = m_specs.find(node);
    return it != m_specs.end() ? &it->second : nullptr;
}

Result<PathSpec> PathWalk::field_spec(const DataNode& parent, const FieldDescriptor& field) const {
    const PathSpec* parent_spec = get(&parent);
    if (parent_spec == nullptr) {
        return Err<PathSpec>(PathError::missing_parent(field.name));
    }
    auto paths = field_schema_paths(field, m_options);
    if (!paths) {
        return Err<PathSpec>(paths.error());
    }
    return parent_spec->child(*paths, field.name);
}

namespace {

Result<void> walk_node(const DataNode& node, PathWalk& walk, const LeafVisitor& visit) {
    for (const auto& ref : treepath_data::enumerate_fields(node)) {
        const FieldDescriptor& field = *ref.field;
        if (field.annotation) {
            continue;
        }
        if (field.kind == FieldKind::Container && ref.container == nullptr) {
            continue;
        }
        if (field.kind == FieldKind::List && (ref.list == nullptr || ref.list->empty())) {
            continue;
        }

        auto spec = walk.field_spec(node, field);
        if (!spec) {
            return Err(spec.error());
        }

        switch (field.kind) {
            case FieldKind::Leaf:
            case FieldKind::LeafList: {
                if (visit) {
                    auto r = visit(ref, *spec);
                    if (!r) {
                        return r;
                    }
                }
                break;
            }
            case FieldKind::Container: {
                walk.set(ref.container, std::move(spec).value());
                auto r = walk_node(*ref.container, walk, visit);
                if (!r) {
                    return r;
                }
                break;
            }
            case FieldKind::List: {
                for (const auto& [lookup_key, entry] : ref.list->entries()) {
                    auto key = entry->list_key();
                    if (!key) {
                        return Err(key.error());
                    }
                    auto entry_spec = spec->list_entry(*key, field.name);
                    if (!entry_spec) {
                        return Err(entry_spec.error());
                    }
                    walk.set(entry, std::move(entry_spec).value());
                    auto r = walk_node(*entry, walk, visit);
                    if (!r) {
                        return r;
                    }
                }
                break;
            }
        }
    }
    return Ok();
}

} // anonymous namespace

Result<void> walk_tree(const DataNode& root, PathWalk& walk, const LeafVisitor& visit) {
    walk.set(&root, PathSpec::root());
    auto result = walk_node(root, walk, visit);
    TREEPATH_LOG_TRACE(Path, "Walked {} tree, {} nodes addressed", root.type().name, walk.size());
    return result;
}

Result<PathSpec> node_path_spec(const DataNode& root, const DataNode& target, const PathOptions& options) {
    PathWalk walk(options);
    auto result = walk_tree(root, walk, nullptr);
    if (!result) {
        return Err<PathSpec>(result.error());
    }
    const PathSpec* spec = walk.get(&target);
    if (spec == nullptr) {
        return Err<PathSpec>(PathError::missing_parent(target.type().name));
    }
    return Ok(*spec);
}

} // namespace treepath_path
