/// @file resolve.cpp
/// @brief Path resolution against typed data nodes

#include "resolve.hpp"

#include <treepath/core/log.hpp>

#include <algorithm>

namespace treepath_edit::detail {

using treepath_core::Err;
using treepath_core::MutationError;
using treepath_core::Ok;
using treepath_core::PathError;
using treepath_core::Result;
using treepath_data::FieldKind;
using treepath_data::NodeType;
using treepath_data::Value;
using treepath_data::ValueArray;
using treepath_data::ValueKind;
using treepath_path::PathElem;

// =============================================================================
// Field Path Selection
// =============================================================================

FieldPaths select_paths(const FieldDescriptor& field, const EditOptions& options) {
    if (options.prefer_shadow_path && !field.shadow_paths.empty()) {
        return FieldPaths{field.shadow_paths, field.paths};
    }
    return FieldPaths{field.paths, field.shadow_paths};
}

std::string strip_module_prefix(const std::string& name) {
    auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

namespace {

bool string_encoded(ValueKind kind) {
    switch (kind) {
        case ValueKind::Bool:
        case ValueKind::Int:
        case ValueKind::Uint:
        case ValueKind::Float:
            return true;
        default:
            return false;
    }
}

Result<Value> decode_scalar(const FieldDescriptor& field, const Value& value) {
    if (const std::string* s = value.get_if<std::string>(); s != nullptr && string_encoded(field.value_type)) {
        return treepath_data::parse_scalar(field, *s);
    }
    return Ok(value);
}

} // namespace

Result<Value> decode_leaf_value(const FieldDescriptor& field, const Value& value) {
    if (field.kind == FieldKind::LeafList) {
        const ValueArray* items = value.get_if<ValueArray>();
        if (items == nullptr) {
            return Ok(value);
        }
        ValueArray decoded;
        decoded.reserve(items->size());
        for (const auto& item : *items) {
            auto v = decode_scalar(field, item);
            if (!v) {
                return v;
            }
            decoded.push_back(std::move(v).value());
        }
        return Ok(Value(std::move(decoded)));
    }
    return decode_scalar(field, value);
}

// =============================================================================
// Matching
// =============================================================================

namespace {

enum class MatchKind { None, Full, Partial, Ignored };

struct Match {
    MatchKind kind = MatchKind::None;
    const FieldDescriptor* field = nullptr;
    std::size_t length = 0;
};

/// Compare @p count names of @p schema_path with the path starting at @p pos.
/// Only the element matching the last schema path segment may carry keys.
bool names_match(const Path& path, std::size_t pos, const SchemaPath& schema_path, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        const PathElem& elem = path.elems[pos + i];
        if (strip_module_prefix(elem.name) != schema_path[i]) {
            return false;
        }
        if (i + 1 < schema_path.size() && !elem.keys.empty()) {
            return false;
        }
    }
    return true;
}

Match match_field(const NodeType& type, const Path& path, std::size_t pos, const EditOptions& options) {
    const std::size_t remaining = path.size() - pos;

    for (const auto& field : type.fields) {
        if (field.annotation) continue;
        for (const auto& sp : select_paths(field, options).primary) {
            if (!sp.empty() && sp.size() <= remaining && names_match(path, pos, sp, sp.size())) {
                return Match{MatchKind::Full, &field, sp.size()};
            }
        }
    }

    for (const auto& field : type.fields) {
        if (field.annotation) continue;
        for (const auto& sp : select_paths(field, options).primary) {
            if (sp.size() > remaining && names_match(path, pos, sp, remaining)) {
                return Match{MatchKind::Partial, &field, remaining};
            }
        }
    }

    for (const auto& field : type.fields) {
        if (field.annotation) continue;
        for (const auto& sp : select_paths(field, options).ignored) {
            std::size_t count = std::min(sp.size(), remaining);
            if (count > 0 && names_match(path, pos, sp, count)) {
                return Match{MatchKind::Ignored, &field, count};
            }
        }
    }

    return Match{};
}

Path list_path_of(const Path& path, std::size_t end) {
    std::vector<PathElem> elems(path.elems.begin(), path.elems.begin() + static_cast<std::ptrdiff_t>(end));
    elems.back().keys.clear();
    return Path(std::move(elems));
}

/// Build a lookup key from path predicates, decoding each by its key leaf type
Result<ListKey> key_from_predicates(const NodeType& type, const PathElem& elem) {
    if (elem.keys.size() != type.keys.size()) {
        return Err<ListKey>(PathError::invalid_key(elem.name,
            "expected " + std::to_string(type.keys.size()) + " keys, got " +
            std::to_string(elem.keys.size())));
    }

    std::vector<ListKey::Component> components;
    for (const auto& key_field : type.keys) {
        const FieldDescriptor* f = type.find_field(key_field);
        if (f == nullptr) {
            return Err<ListKey>(PathError::invalid_key(elem.name, "unknown key field " + key_field));
        }
        auto it = elem.keys.find(f->schema_name());
        if (it == elem.keys.end()) {
            it = elem.keys.find(f->name);
        }
        if (it == elem.keys.end()) {
            return Err<ListKey>(PathError::invalid_key(elem.name, "missing key " + f->schema_name()));
        }
        auto value = treepath_data::parse_scalar(*f, it->second);
        if (!value) {
            return Err<ListKey>(PathError::invalid_key(elem.name, value.error().message()));
        }
        components.emplace_back(f->schema_name(), std::move(value).value());
    }
    return Ok(ListKey(std::move(components)));
}

} // namespace

// =============================================================================
// Resolution
// =============================================================================

Result<Target> resolve(DataNode& root, const Path& path, const EditOptions& options, Mode mode) {
    const bool create = mode == Mode::Create;

    Target t;
    t.node = &root;
    std::size_t pos = 0;

    while (pos < path.size()) {
        DataNode& cur = *t.node;
        Match m = match_field(cur.type(), path, pos, options);

        switch (m.kind) {
            case MatchKind::None:
                if (options.tolerate_unknown_fields) {
                    TREEPATH_LOG_DEBUG(Edit, "Ignoring unknown element '{}' of {}",
                                                        path.elems[pos].name, cur.type().name);
                    t.kind = TargetKind::Ignored;
                    return Ok(std::move(t));
                }
                return Err<Target>(MutationError::unknown_field(path.elems[pos].name, cur.type().name));

            case MatchKind::Ignored:
                t.kind = TargetKind::Ignored;
                t.field = m.field;
                return Ok(std::move(t));

            case MatchKind::Partial:
                t.kind = TargetKind::Partial;
                t.field = m.field;
                for (std::size_t i = pos; i < path.size(); ++i) {
                    t.partial.push_back(strip_module_prefix(path.elems[i].name));
                }
                return Ok(std::move(t));

            case MatchKind::Full:
                break;
        }

        const FieldDescriptor& field = *m.field;
        const std::size_t end = pos + m.length;
        const PathElem& last = path.elems[end - 1];
        const bool at_end = end == path.size();

        if (!last.keys.empty() && field.kind != FieldKind::List) {
            return Err<Target>(MutationError::resolve_failed(path.to_string(),
                "keys given for non-list field " + field.name));
        }

        switch (field.kind) {
            case FieldKind::Leaf:
            case FieldKind::LeafList:
                if (!at_end) {
                    return Err<Target>(MutationError::resolve_failed(path.to_string(),
                        "path continues below leaf " + field.name));
                }
                t.kind = TargetKind::Leaf;
                t.field = &field;
                return Ok(std::move(t));

            case FieldKind::Container: {
                DataNode* child = nullptr;
                if (create) {
                    auto created = cur.get_or_create_container(field.name);
                    if (!created) {
                        return Err<Target>(created.error());
                    }
                    child = *created;
                } else {
                    child = cur.container(field.name);
                }
                if (child == nullptr) {
                    t.kind = TargetKind::Missing;
                    return Ok(std::move(t));
                }
                t.parent = &cur;
                t.node = child;
                t.field = &field;
                t.entry_list = nullptr;
                t.entry_key = ListKey();
                break;
            }

            case FieldKind::List: {
                ListNode* list = nullptr;
                if (create) {
                    auto created = cur.get_or_create_list(field.name);
                    if (!created) {
                        return Err<Target>(created.error());
                    }
                    list = *created;
                } else {
                    list = cur.list(field.name);
                }
                t.lists.push_back(list_path_of(path, end));

                if (last.keys.empty()) {
                    if (!at_end) {
                        return Err<Target>(MutationError::resolve_failed(path.to_string(),
                            "list " + field.name + " addressed without keys"));
                    }
                    if (list == nullptr) {
                        t.kind = TargetKind::Missing;
                        return Ok(std::move(t));
                    }
                    t.kind = TargetKind::List;
                    t.field = &field;
                    t.list = list;
                    return Ok(std::move(t));
                }

                if (field.child_type == nullptr) {
                    return Err<Target>(MutationError::resolve_failed(path.to_string(),
                        "list " + field.name + " has no entry type"));
                }
                auto key = key_from_predicates(*field.child_type, last);
                if (!key) {
                    return Err<Target>(key.error().with_context("path", path.to_string()));
                }
                if (list == nullptr) {
                    t.kind = TargetKind::Missing;
                    return Ok(std::move(t));
                }
                DataNode* entry = nullptr;
                if (create) {
                    auto created = list->get_or_create(*key);
                    if (!created) {
                        return Err<Target>(created.error());
                    }
                    entry = *created;
                } else {
                    entry = list->find(*key);
                }
                if (entry == nullptr) {
                    t.kind = TargetKind::Missing;
                    return Ok(std::move(t));
                }
                auto normalized = list->normalize_key(*key);
                if (!normalized) {
                    return Err<Target>(normalized.error());
                }
                t.parent = &cur;
                t.node = entry;
                t.field = &field;
                t.entry_list = list;
                t.entry_key = std::move(normalized).value();
                break;
            }
        }
        pos = end;
    }

    t.kind = TargetKind::Node;
    return Ok(std::move(t));
}

} // namespace treepath_edit::detail
