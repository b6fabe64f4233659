/// @file unmarshal.cpp
/// @brief Merging object payloads into typed data nodes

#include "resolve.hpp"

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
using treepath_data::ValueObject;
using treepath_path::PathElem;

namespace {

/// Member of @p object named @p name, ignoring any "module:" qualifier
const Value* find_member(const ValueObject& object, const std::string& name) {
    auto it = object.find(name);
    if (it != object.end()) {
        return &it->second;
    }
    for (const auto& [member, value] : object) {
        if (strip_module_prefix(member) == name) {
            return &value;
        }
    }
    return nullptr;
}

/// Follow @p path through nested objects
const Value* lookup(const ValueObject& object, const SchemaPath& path) {
    const ValueObject* cur = &object;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const Value* v = find_member(*cur, path[i]);
        if (v == nullptr) {
            return nullptr;
        }
        if (i + 1 == path.size()) {
            return v;
        }
        cur = v->get_if<ValueObject>();
        if (cur == nullptr) {
            return nullptr;
        }
    }
    return nullptr;
}

bool starts_with(const SchemaPath& path, const SchemaPath& prefix) {
    return path.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), path.begin());
}

/// Reject members that no field declares, at any nesting depth of a
/// compressed path
Result<void> check_members(const NodeType& type, const ValueObject& object, const SchemaPath& prefix) {
    for (const auto& [member, value] : object) {
        if (!member.empty() && member.front() == '@') {
            continue;   // metadata
        }
        SchemaPath p = prefix;
        p.push_back(strip_module_prefix(member));

        bool exact = false;
        bool partial = false;
        for (const auto& field : type.fields) {
            if (field.annotation) continue;
            for (const auto* alternatives : {&field.paths, &field.shadow_paths}) {
                for (const auto& sp : *alternatives) {
                    if (sp == p) {
                        exact = true;
                    } else if (starts_with(sp, p)) {
                        partial = true;
                    }
                }
            }
        }

        if (exact) {
            continue;
        }
        if (!partial) {
            return Err(MutationError::unknown_field(treepath_data::schema_path_string(p), type.name));
        }
        const ValueObject* nested = value.get_if<ValueObject>();
        if (nested == nullptr) {
            return Err(MutationError::invalid_value(treepath_data::schema_path_string(p), "expected object"));
        }
        auto r = check_members(type, *nested, p);
        if (!r) {
            return r;
        }
    }
    return Ok();
}

/// Key of a list entry payload, read from the members its key leaves map to
Result<ListKey> key_from_payload(const NodeType& type, const ValueObject& object, const EditOptions& options) {
    if (type.keys.empty()) {
        return Err<ListKey>(PathError::invalid_key(type.name, "type declares no key fields"));
    }

    std::vector<ListKey::Component> components;
    for (const auto& key_field : type.keys) {
        const FieldDescriptor* f = type.find_field(key_field);
        if (f == nullptr) {
            return Err<ListKey>(PathError::invalid_key(type.name, "unknown key field " + key_field));
        }

        FieldPaths sel = select_paths(*f, options);
        const Value* v = nullptr;
        for (const auto* alternatives : {&sel.primary, &sel.ignored}) {
            for (const auto& sp : *alternatives) {
                v = lookup(object, sp);
                if (v != nullptr) break;
            }
            if (v != nullptr) break;
        }
        if (v == nullptr) {
            return Err<ListKey>(PathError::invalid_key(type.name, "entry lacks key " + f->schema_name()));
        }

        auto decoded = decode_leaf_value(*f, *v);
        if (!decoded) {
            return Err<ListKey>(decoded.error());
        }
        components.emplace_back(f->schema_name(), std::move(decoded).value());
    }
    return Ok(ListKey(std::move(components)));
}

} // namespace

// =============================================================================
// Unmarshalling
// =============================================================================

Result<void> unmarshal_field(DataNode& node, const FieldDescriptor& field, const Value& value,
                             const Path& path, EditContext& ctx) {
    switch (field.kind) {
        case FieldKind::Leaf:
        case FieldKind::LeafList: {
            auto decoded = decode_leaf_value(field, value);
            if (!decoded) {
                return Err(decoded.error().with_context("path", path.to_string()));
            }
            auto set = node.set_leaf(field.name, std::move(decoded).value());
            if (!set) {
                return Err(set.error().with_context("path", path.to_string()));
            }
            return Ok();
        }

        case FieldKind::Container: {
            if (value.is_null()) {
                return Ok();
            }
            const ValueObject* object = value.get_if<ValueObject>();
            if (object == nullptr) {
                return Err(MutationError::invalid_value(path.to_string(),
                    std::string("expected object, got ") + value.type_name()));
            }
            auto child = node.get_or_create_container(field.name);
            if (!child) {
                return Err(child.error());
            }
            return unmarshal_node(**child, *object, path, ctx);
        }

        case FieldKind::List: {
            if (value.is_null()) {
                return Ok();
            }
            const ValueArray* items = value.get_if<ValueArray>();
            if (items == nullptr) {
                return Err(MutationError::invalid_value(path.to_string(),
                    std::string("expected array, got ") + value.type_name()));
            }
            auto list = node.get_or_create_list(field.name);
            if (!list) {
                return Err(list.error());
            }
            ctx.touched_lists.insert(path);

            for (const auto& item : *items) {
                const ValueObject* object = item.get_if<ValueObject>();
                if (object == nullptr) {
                    return Err(MutationError::invalid_value(path.to_string(),
                        std::string("list entries must be objects, got ") + item.type_name()));
                }
                auto key = key_from_payload((*list)->entry_type(), *object, ctx.options);
                if (!key) {
                    return Err(key.error().with_context("path", path.to_string()));
                }
                auto entry = (*list)->get_or_create(*key);
                if (!entry) {
                    return Err(entry.error().with_context("path", path.to_string()));
                }
                auto strings = key->to_strings();
                if (!strings) {
                    return Err(strings.error());
                }

                Path entry_path = path;
                entry_path.elems.back().keys = std::move(strings).value();
                auto r = unmarshal_node(**entry, *object, entry_path, ctx);
                if (!r) {
                    return r;
                }
            }
            return Ok();
        }
    }
    return Err(MutationError::invalid_value(field.name, "unsupported field kind"));
}

Result<void> unmarshal_node(DataNode& node, const ValueObject& object, const Path& base, EditContext& ctx) {
    const NodeType& type = node.type();
    if (!ctx.options.tolerate_unknown_fields) {
        auto checked = check_members(type, object, {});
        if (!checked) {
            return Err(checked.error().with_context("path", base.to_string()));
        }
    }

    for (const auto& field : type.fields) {
        if (field.annotation) continue;
        for (const auto& sp : select_paths(field, ctx.options).primary) {
            const Value* v = lookup(object, sp);
            if (v == nullptr) {
                continue;
            }
            Path field_path = base;
            for (const auto& name : sp) {
                field_path.elems.emplace_back(name);
            }
            auto r = unmarshal_field(node, field, *v, field_path, ctx);
            if (!r) {
                return r;
            }
        }
    }
    return Ok();
}

} // namespace treepath_edit::detail
