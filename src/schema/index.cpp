/// @file index.cpp
/// @brief SchemaIndex implementation

#include <treepath/schema/index.hpp>
#include <treepath/core/log.hpp>

namespace treepath_schema {

using treepath_core::Err;
using treepath_core::Ok;
using treepath_core::Result;
using treepath_core::SchemaError;

namespace {

/// Split on '/' without predicate handling
std::vector<std::string> split_plain(const std::string& path) {
    std::vector<std::string> parts;
    std::string buf;
    for (char c : path) {
        if (c == '/') {
            parts.push_back(buf);
            buf.clear();
        } else {
            buf.push_back(c);
        }
    }
    parts.push_back(buf);
    return parts;
}

/// Data path of an entry with the leading "" and module segments removed
SchemaIndex::Key data_key(const SchemaEntry& entry) {
    auto parts = split_plain(entry.schema_tree_path());
    if (parts.size() <= 2) {
        return {};
    }
    return SchemaIndex::Key(parts.begin() + 2, parts.end());
}

} // anonymous namespace

// =============================================================================
// XPath Helpers
// =============================================================================

std::vector<std::string> split_xpath_parts(const std::string& path) {
    std::vector<std::string> parts;
    std::string buf;
    bool in_key = false;

    for (char c : path) {
        switch (c) {
            case '/':
                if (!in_key) {
                    parts.push_back(buf);
                    buf.clear();
                    continue;
                }
                break;
            case '[':
                in_key = true;
                continue;
            case ']':
                in_key = false;
                continue;
            default:
                break;
        }
        if (!in_key) {
            buf.push_back(c);
        }
    }
    if (!buf.empty()) {
        parts.push_back(buf);
    }
    return parts;
}

Result<std::vector<std::string>> remove_xpath_namespaces(const std::vector<std::string>& parts) {
    std::vector<std::string> fixed;
    fixed.reserve(parts.size());

    for (const auto& part : parts) {
        auto colon = part.find(':');
        if (colon == std::string::npos) {
            fixed.push_back(part);
            continue;
        }
        if (part.find(':', colon + 1) != std::string::npos) {
            return Err<std::vector<std::string>>(SchemaError::invalid_path(
                part, "path element contains multiple namespace specifiers"));
        }
        fixed.push_back(part.substr(colon + 1));
    }
    return Ok(std::move(fixed));
}

Result<std::vector<std::string>> fix_schema_tree_path(const std::string& path, const SchemaEntry* caller) {
    using Parts = std::vector<std::string>;

    auto stripped = remove_xpath_namespaces(split_xpath_parts(path));
    if (!stripped) {
        return stripped;
    }
    Parts parts = std::move(stripped).value();
    if (parts.empty()) {
        return Err<Parts>(SchemaError::invalid_path(path, "empty path"));
    }

    if (parts[0] != "..") {
        if (parts[0].empty()) {
            return Ok(Parts(parts.begin() + 1, parts.end()));
        }
        return Err<Parts>(SchemaError::invalid_path(path, "must begin with either '../' or '/'"));
    }

    if (caller == nullptr) {
        return Err<Parts>(SchemaError::module_context(path, "<none>"));
    }
    if (caller->kind() == EntryKind::Module || caller->parent() == nullptr) {
        return Err<Parts>(SchemaError::module_context(path, caller->path()));
    }

    Parts caller_path = data_key(*caller);
    Parts remaining;
    for (const auto& part : parts) {
        if (part == "..") {
            if (caller_path.empty()) {
                return Err<Parts>(SchemaError::above_root(path, caller->path()));
            }
            caller_path.pop_back();
            continue;
        }
        remaining.push_back(part);
    }

    caller_path.insert(caller_path.end(), remaining.begin(), remaining.end());
    return Ok(std::move(caller_path));
}

std::string key_to_string(const SchemaIndex::Key& key) {
    std::string out;
    for (const auto& part : key) {
        out += "/";
        out += part;
    }
    return out.empty() ? "/" : out;
}

// =============================================================================
// SchemaIndex
// =============================================================================

Result<SchemaIndex> SchemaIndex::build(const std::vector<const SchemaEntry*>& entries) {
    SchemaIndex index;

    for (const SchemaEntry* entry : entries) {
        if (entry == nullptr) {
            continue;
        }
        // Only "/module/entity" entries are roots
        if (split_plain(entry->path()).size() != 3) {
            continue;
        }
        auto result = entry->is_leaf()
            ? index.add(data_key(*entry), entry)
            : index.add_children(*entry);
        if (!result) {
            return Err<SchemaIndex>(result.error());
        }
    }

    TREEPATH_LOG_DEBUG(Schema, "Built schema index with {} leaves", index.size());
    return Ok(std::move(index));
}

Result<SchemaIndex> SchemaIndex::build_from_modules(const std::vector<const SchemaEntry*>& modules) {
    std::vector<const SchemaEntry*> roots;
    for (const SchemaEntry* module : modules) {
        if (module == nullptr) {
            continue;
        }
        if (module->kind() != EntryKind::Module) {
            return Err<SchemaIndex>(SchemaError::parse("'" + module->name() + "' is not a module"));
        }
        for (const auto& child : module->children()) {
            roots.push_back(child.get());
        }
    }
    return build(roots);
}

Result<void> SchemaIndex::add(Key key, const SchemaEntry* entry) {
    auto [it, inserted] = m_entries.emplace(std::move(key), entry);
    if (!inserted) {
        return Err(SchemaError::duplicate_path(key_to_string(it->first)));
    }
    return Ok();
}

Result<void> SchemaIndex::add_children(const SchemaEntry& entry) {
    for (const SchemaEntry* child : entry.data_children()) {
        auto result = child->is_leaf()
            ? add(data_key(*child), child)
            : add_children(*child);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

const SchemaEntry* SchemaIndex::find(const Key& key) const {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? it->second : nullptr;
}

std::vector<SchemaIndex::Key> SchemaIndex::keys() const {
    std::vector<Key> out;
    out.reserve(m_entries.size());
    for (const auto& [key, entry] : m_entries) {
        out.push_back(key);
    }
    return out;
}

Result<const SchemaEntry*> SchemaIndex::resolve_leafref_target(const std::string& path,
                                                                const SchemaEntry* context) const {
    auto fixed = fix_schema_tree_path(path, context);
    if (!fixed) {
        TREEPATH_LOG_DEBUG(Schema, "Cannot map leafref path {}: {}", path, fixed.error().message());
        return Err<const SchemaEntry*>(fixed.error());
    }

    const SchemaEntry* target = find(*fixed);
    if (target == nullptr) {
        return Err<const SchemaEntry*>(SchemaError::unregistered(key_to_string(*fixed)));
    }
    return Ok(target);
}

Result<const SchemaEntry*> SchemaIndex::resolve_leafref(const SchemaEntry& leaf) const {
    if (!leaf.type().is_leafref() || leaf.type().leafref_path.empty()) {
        return Err<const SchemaEntry*>(SchemaError::not_leafref(leaf.path()));
    }
    return resolve_leafref_target(leaf.type().leafref_path, &leaf);
}

} // namespace treepath_schema
