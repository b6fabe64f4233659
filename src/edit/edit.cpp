/// @file edit.cpp
/// @brief Mutation operations, edit requests and notifications

#include <treepath/edit/edit.hpp>
#include <treepath/core/config.hpp>
#include <treepath/core/log.hpp>
#include <treepath/data/validation.hpp>

#include "resolve.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace treepath_edit {

using treepath_core::Err;
using treepath_core::Error;
using treepath_core::ErrorCode;
using treepath_core::MutationError;
using treepath_core::Ok;
using treepath_core::Result;
using treepath_data::DataNode;
using treepath_data::Value;
using treepath_path::Path;

using detail::EditContext;
using detail::Mode;
using detail::Target;
using detail::TargetKind;

// =============================================================================
// EditOptions
// =============================================================================

Result<EditOptions> EditOptions::from_json(const nlohmann::json& j) {
    const std::string what = "edit options";
    auto keys = treepath_core::check_option_keys(j,
        {"prefer_shadow_path", "tolerate_unknown_fields", "init_missing_elements", "validate_lists"}, what);
    if (!keys) {
        return Err<EditOptions>(keys.error());
    }

    EditOptions options;
    for (auto r : {treepath_core::read_bool_option(j, "prefer_shadow_path", options.prefer_shadow_path, what),
                   treepath_core::read_bool_option(j, "tolerate_unknown_fields", options.tolerate_unknown_fields, what),
                   treepath_core::read_bool_option(j, "init_missing_elements", options.init_missing_elements, what),
                   treepath_core::read_bool_option(j, "validate_lists", options.validate_lists, what)}) {
        if (!r) {
            return Err<EditOptions>(r.error());
        }
    }
    return Ok(options);
}

// =============================================================================
// Operation Bodies
// =============================================================================

namespace detail {

namespace {

/// Clear every field of @p node; key leaves survive when it is a list entry
void clear_node(DataNode& node) {
    const auto& type = node.type();
    for (const auto& field : type.fields) {
        if (!type.keys.empty() && type.is_key_field(field.name)) {
            continue;
        }
        node.clear_field(field.name);
    }
}

/// Clear the fields of @p node whose paths lie below @p prefix
void clear_below(DataNode& node, const SchemaPath& prefix, const EditOptions& options) {
    const auto& type = node.type();
    for (const auto& field : type.fields) {
        if (field.annotation) continue;
        if (!type.keys.empty() && type.is_key_field(field.name)) continue;
        for (const auto& sp : select_paths(field, options).primary) {
            if (sp.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), sp.begin())) {
                node.clear_field(field.name);
                break;
            }
        }
    }
}

} // namespace

Result<void> delete_path(DataNode& subject, const Path& path, EditContext& ctx) {
    auto resolved = resolve(subject, path, ctx.options, Mode::Read);
    if (!resolved) {
        return Err(resolved.error());
    }
    Target& t = *resolved;
    ctx.touched_lists.insert(t.lists.begin(), t.lists.end());

    switch (t.kind) {
        case TargetKind::Missing:
        case TargetKind::Ignored:
            return Ok();

        case TargetKind::Node:
            if (t.field == nullptr) {
                clear_node(*t.node);
            } else if (t.entry_list != nullptr) {
                t.entry_list->erase(t.entry_key);
            } else {
                t.parent->clear_field(t.field->name);
            }
            return Ok();

        case TargetKind::Leaf:
            // An entry without its key leaf cannot stay in its list
            if (t.node->type().is_key_field(t.field->name)) {
                if (t.entry_list != nullptr) {
                    t.entry_list->erase(t.entry_key);
                    return Ok();
                }
                if (t.node == &subject && ctx.subject_list != nullptr) {
                    ctx.subject_list->erase(ctx.subject_key);
                    ctx.subject_erased = true;
                    return Ok();
                }
            }
            t.node->clear_field(t.field->name);
            return Ok();

        case TargetKind::List:
            t.node->clear_field(t.field->name);
            return Ok();

        case TargetKind::Partial:
            clear_below(*t.node, t.partial, ctx.options);
            return Ok();
    }
    return Ok();
}

Result<void> set_path(DataNode& subject, const Path& path, const Value& value, EditContext& ctx) {
    const Mode mode = ctx.options.init_missing_elements ? Mode::Create : Mode::Read;
    auto resolved = resolve(subject, path, ctx.options, mode);
    if (!resolved) {
        return Err(resolved.error());
    }
    Target& t = *resolved;
    ctx.touched_lists.insert(t.lists.begin(), t.lists.end());

    switch (t.kind) {
        case TargetKind::Ignored:
            return Ok();

        case TargetKind::Missing:
            return Err(MutationError::resolve_failed(path.to_string(), "element does not exist"));

        case TargetKind::Leaf:
        case TargetKind::List:
            return unmarshal_field(*t.node, *t.field, value, Path(path.elems), ctx);

        case TargetKind::Node: {
            const treepath_data::ValueObject* object = value.get_if<treepath_data::ValueObject>();
            if (object == nullptr) {
                return Err(MutationError::invalid_value(path.to_string(),
                    std::string("expected object, got ") + value.type_name()));
            }
            return unmarshal_node(*t.node, *object, Path(path.elems), ctx);
        }

        case TargetKind::Partial: {
            if (!value.is_object()) {
                return Err(MutationError::invalid_value(path.to_string(),
                    std::string("expected object, got ") + value.type_name()));
            }
            Value nested = value;
            for (auto it = t.partial.rbegin(); it != t.partial.rend(); ++it) {
                nested = Value(treepath_data::ValueObject{{*it, std::move(nested)}});
            }
            Path base(std::vector<treepath_path::PathElem>(
                path.elems.begin(), path.elems.end() - static_cast<std::ptrdiff_t>(t.partial.size())));
            return unmarshal_node(*t.node, nested.as_object(), base, ctx);
        }
    }
    return Ok();
}

Result<void> validate_touched(DataNode& subject, const EditContext& ctx) {
    for (const auto& path : ctx.touched_lists) {
        auto resolved = resolve(subject, path, ctx.options, Mode::Read);
        if (!resolved) {
            return Err(resolved.error());
        }
        if (resolved->kind != TargetKind::List || resolved->list == nullptr) {
            continue;
        }
        auto result = treepath_data::validate_list(*resolved->list, path.to_string());
        if (!result.valid) {
            TREEPATH_LOG_DEBUG(Edit, "List {} failed validation: {}", path.to_string(),
                                                result.first_error());
            return Err(result.to_error());
        }
    }
    return Ok();
}

} // namespace detail

// =============================================================================
// Node Access
// =============================================================================

Result<DataNode*> get_or_create_node(DataNode& root, const Path& path, const EditOptions& options) {
    auto resolved = detail::resolve(root, path, options, Mode::Create);
    if (!resolved) {
        return Err<DataNode*>(resolved.error());
    }
    if (resolved->kind != TargetKind::Node) {
        return Err<DataNode*>(MutationError::not_a_node(path.to_string()));
    }
    return Ok(resolved->node);
}

namespace {

// Read mode never writes through the node
Result<Target> resolve_existing(const DataNode& root, const Path& path, const EditOptions& options) {
    return detail::resolve(const_cast<DataNode&>(root), path, options, Mode::Read);
}

} // namespace

Result<const DataNode*> get_node(const DataNode& root, const Path& path, const EditOptions& options) {
    auto resolved = resolve_existing(root, path, options);
    if (!resolved) {
        return Err<const DataNode*>(resolved.error());
    }
    switch (resolved->kind) {
        case TargetKind::Node:
            return Ok<const DataNode*>(resolved->node);
        case TargetKind::Missing:
        case TargetKind::Ignored:
            return Err<const DataNode*>(Error(ErrorCode::NotFound, "no node at " + path.to_string()));
        default:
            return Err<const DataNode*>(MutationError::not_a_node(path.to_string()));
    }
}

Result<Value> get_value(const DataNode& root, const Path& path, const EditOptions& options) {
    auto resolved = resolve_existing(root, path, options);
    if (!resolved) {
        return Err<Value>(resolved.error());
    }
    switch (resolved->kind) {
        case TargetKind::Leaf:
            return Ok(resolved->node->leaf(resolved->field->name));
        case TargetKind::Missing:
        case TargetKind::Ignored:
            return Ok(Value::null());
        default:
            return Err<Value>(MutationError::resolve_failed(path.to_string(), "not a leaf"));
    }
}

// =============================================================================
// Mutation
// =============================================================================

Result<void> delete_node(DataNode& root, const Path& path, const EditOptions& options) {
    EditContext ctx{options, {}};
    auto r = detail::delete_path(root, path, ctx);
    if (!r || !options.validate_lists) {
        return r;
    }
    return detail::validate_touched(root, ctx);
}

Result<void> set_node(DataNode& root, const Path& path, const Value& value, const EditOptions& options) {
    EditContext ctx{options, {}};
    auto r = detail::set_path(root, path, value, ctx);
    if (!r || !options.validate_lists) {
        return r;
    }
    return detail::validate_touched(root, ctx);
}

Result<void> unmarshal(DataNode& node, const Value& object, const EditOptions& options) {
    const treepath_data::ValueObject* members = object.get_if<treepath_data::ValueObject>();
    if (members == nullptr) {
        return Err(MutationError::invalid_value(node.type().name,
            std::string("expected object, got ") + object.type_name()));
    }
    EditContext ctx{options, {}};
    auto r = detail::unmarshal_node(node, *members, Path(), ctx);
    if (!r || !options.validate_lists) {
        return r;
    }
    return detail::validate_touched(node, ctx);
}

Result<void> unmarshal_json(DataNode& node, const std::string& json_text, const EditOptions& options) {
    auto parsed = treepath_core::parse_json(json_text, "payload");
    if (!parsed) {
        return Err(parsed.error());
    }
    return unmarshal(node, Value::from_json(*parsed), options);
}

// =============================================================================
// Requests
// =============================================================================

namespace {

Error with_operation(Error error, const char* operation, const Path& path) {
    error.with_context("operation", operation);
    error.with_context("path", path.to_string());
    return error;
}

} // namespace

Result<void> apply_edit(DataNode& root, const treepath_path::EditRequest& request, const EditOptions& options) {
    TREEPATH_LOG_SCOPE(Edit, "apply_edit");
    DataNode* subject = &root;
    Path carried;
    EditContext prefix_ctx{options, {}};
    EditContext ctx{options, {}};

    if (request.prefix && !request.prefix->empty()) {
        auto resolved = detail::resolve(root, *request.prefix, options, Mode::Create);
        if (resolved && resolved->kind == TargetKind::Node) {
            subject = resolved->node;
            ctx.subject_list = resolved->entry_list;
            ctx.subject_key = resolved->entry_key;
            prefix_ctx.touched_lists.insert(resolved->lists.begin(), resolved->lists.end());
        } else {
            TREEPATH_LOG_DEBUG(Edit, "Prefix {} is not a node ({}), applying paths from the root",
                request.prefix->to_string(),
                resolved ? "resolves below a node" : resolved.error().message());
            carried = *request.prefix;
        }
    }

    auto full_path = [&carried](const Path& path) -> Result<Path> {
        if (carried.empty()) {
            return Ok(path);
        }
        return treepath_path::join_paths(carried, path);
    };

    // A delete of the subject's key leaf removes the subject entry; later
    // operations recreate it from the prefix
    auto live_subject = [&]() -> Result<void> {
        if (!ctx.subject_erased) {
            return Ok();
        }
        auto again = detail::resolve(root, *request.prefix, options, Mode::Create);
        if (!again) {
            return Err(again.error());
        }
        subject = again->node;
        ctx.subject_list = again->entry_list;
        ctx.subject_key = again->entry_key;
        ctx.subject_erased = false;
        return Ok();
    };

    for (const auto& path : request.deletes) {
        auto p = full_path(path);
        if (!p) {
            return Err(with_operation(p.error(), "delete", path));
        }
        if (auto live = live_subject(); !live) {
            return Err(with_operation(live.error(), "delete", *p));
        }
        auto r = detail::delete_path(*subject, *p, ctx);
        if (!r) {
            return Err(with_operation(r.error(), "delete", *p));
        }
    }

    for (const auto& update : request.replaces) {
        auto p = full_path(update.path);
        if (!p) {
            return Err(with_operation(p.error(), "replace", update.path));
        }
        if (auto live = live_subject(); !live) {
            return Err(with_operation(live.error(), "replace", *p));
        }
        auto removed = detail::delete_path(*subject, *p, ctx);
        if (!removed) {
            return Err(with_operation(removed.error(), "replace", *p));
        }
        if (auto live = live_subject(); !live) {
            return Err(with_operation(live.error(), "replace", *p));
        }
        auto r = detail::set_path(*subject, *p, update.value, ctx);
        if (!r) {
            return Err(with_operation(r.error(), "replace", *p));
        }
    }

    for (const auto& update : request.updates) {
        auto p = full_path(update.path);
        if (!p) {
            return Err(with_operation(p.error(), "update", update.path));
        }
        if (auto live = live_subject(); !live) {
            return Err(with_operation(live.error(), "update", *p));
        }
        auto r = detail::set_path(*subject, *p, update.value, ctx);
        if (!r) {
            return Err(with_operation(r.error(), "update", *p));
        }
    }

    TREEPATH_LOG_DEBUG(Edit, "Applied edit: {} deletes, {} replaces, {} updates",
                                        request.deletes.size(), request.replaces.size(),
                                        request.updates.size());

    if (!options.validate_lists) {
        return Ok();
    }
    if (!ctx.subject_erased) {
        auto checked = detail::validate_touched(*subject, ctx);
        if (!checked) {
            return checked;
        }
    }
    return detail::validate_touched(root, prefix_ctx);
}

Result<void> apply_notifications(DataNode& root, const std::vector<treepath_path::Notification>& notifications,
                                 const EditOptions& options) {
    for (std::size_t i = 0; i < notifications.size(); ++i) {
        const auto& n = notifications[i];

        treepath_path::EditRequest request;
        request.prefix = n.prefix;
        request.deletes = n.deletes;
        request.updates = n.updates;
        if (n.atomic) {
            request.deletes.emplace_back();
        }

        auto r = apply_edit(root, request, options);
        if (!r) {
            Error error = r.error();
            error.with_context("notification", std::to_string(i));
            return Err(std::move(error));
        }
    }
    return Ok();
}

} // namespace treepath_edit
