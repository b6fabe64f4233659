/// @file entry.cpp
/// @brief Schema description tree implementation

#include <treepath/schema/entry.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace treepath_schema {

using treepath_core::Err;
using treepath_core::Ok;
using treepath_core::Result;
using treepath_core::SchemaError;

// =============================================================================
// EntryKind Utilities
// =============================================================================

const char* entry_kind_name(EntryKind kind) noexcept {
    switch (kind) {
        case EntryKind::Module: return "module";
        case EntryKind::Container: return "container";
        case EntryKind::List: return "list";
        case EntryKind::Leaf: return "leaf";
        case EntryKind::LeafList: return "leaf-list";
        case EntryKind::Choice: return "choice";
        case EntryKind::Case: return "case";
        default: return "unknown";
    }
}

std::optional<EntryKind> entry_kind_from_string(const std::string& str) noexcept {
    if (str == "module") return EntryKind::Module;
    if (str == "container") return EntryKind::Container;
    if (str == "list") return EntryKind::List;
    if (str == "leaf") return EntryKind::Leaf;
    if (str == "leaf-list" || str == "leaf_list") return EntryKind::LeafList;
    if (str == "choice") return EntryKind::Choice;
    if (str == "case") return EntryKind::Case;
    return std::nullopt;
}

// =============================================================================
// SchemaEntry
// =============================================================================

SchemaEntry::SchemaEntry(std::string name, EntryKind kind)
    : m_name(std::move(name))
    , m_kind(kind) {}

std::unique_ptr<SchemaEntry> SchemaEntry::module(std::string name) {
    return std::make_unique<SchemaEntry>(std::move(name), EntryKind::Module);
}

std::unique_ptr<SchemaEntry> SchemaEntry::container(std::string name) {
    return std::make_unique<SchemaEntry>(std::move(name), EntryKind::Container);
}

std::unique_ptr<SchemaEntry> SchemaEntry::list(std::string name, std::vector<std::string> keys) {
    auto e = std::make_unique<SchemaEntry>(std::move(name), EntryKind::List);
    e->m_keys = std::move(keys);
    return e;
}

std::unique_ptr<SchemaEntry> SchemaEntry::leaf(std::string name, std::string type) {
    auto e = std::make_unique<SchemaEntry>(std::move(name), EntryKind::Leaf);
    e->m_type.name = std::move(type);
    return e;
}

std::unique_ptr<SchemaEntry> SchemaEntry::leaf_list(std::string name, std::string type) {
    auto e = std::make_unique<SchemaEntry>(std::move(name), EntryKind::LeafList);
    e->m_type.name = std::move(type);
    return e;
}

std::unique_ptr<SchemaEntry> SchemaEntry::leafref(std::string name, std::string target) {
    auto e = std::make_unique<SchemaEntry>(std::move(name), EntryKind::Leaf);
    e->m_type.name = "leafref";
    e->m_type.leafref_path = std::move(target);
    return e;
}

std::unique_ptr<SchemaEntry> SchemaEntry::choice(std::string name) {
    return std::make_unique<SchemaEntry>(std::move(name), EntryKind::Choice);
}

std::unique_ptr<SchemaEntry> SchemaEntry::case_(std::string name) {
    return std::make_unique<SchemaEntry>(std::move(name), EntryKind::Case);
}

SchemaEntry& SchemaEntry::add(std::unique_ptr<SchemaEntry> child) {
    child->m_parent = this;
    m_children.push_back(std::move(child));
    return *m_children.back();
}

bool SchemaEntry::is_config() const noexcept {
    for (const SchemaEntry* e = this; e != nullptr; e = e->m_parent) {
        if (e->m_config.has_value() && !*e->m_config) {
            return false;
        }
    }
    return true;
}

std::string SchemaEntry::path() const {
    if (m_parent == nullptr) {
        return "/" + m_name;
    }
    return m_parent->path() + "/" + m_name;
}

std::string SchemaEntry::schema_tree_path() const {
    std::vector<const SchemaEntry*> chain;
    for (const SchemaEntry* e = this; e != nullptr; e = e->m_parent) {
        if (!e->is_choice_or_case()) {
            chain.push_back(e);
        }
    }

    std::ostringstream oss;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        oss << "/" << (*it)->m_name;
    }
    return oss.str();
}

std::vector<const SchemaEntry*> SchemaEntry::data_children() const {
    std::vector<const SchemaEntry*> out;
    collect_data_children(out);
    return out;
}

void SchemaEntry::collect_data_children(std::vector<const SchemaEntry*>& out) const {
    for (const auto& child : m_children) {
        if (child->is_choice_or_case()) {
            child->collect_data_children(out);
        } else {
            out.push_back(child.get());
        }
    }
}

const SchemaEntry* SchemaEntry::find_child(const std::string& name) const {
    for (const SchemaEntry* child : data_children()) {
        if (child->m_name == name) {
            return child;
        }
    }
    return nullptr;
}

// =============================================================================
// Serialization
// =============================================================================

Result<std::unique_ptr<SchemaEntry>> SchemaEntry::from_json(const nlohmann::json& j) {
    using EntryPtr = std::unique_ptr<SchemaEntry>;

    if (!j.is_object()) {
        return Err<EntryPtr>(SchemaError::parse("entry must be an object"));
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        return Err<EntryPtr>(SchemaError::parse("entry requires a string 'name'"));
    }
    std::string name = j["name"].get<std::string>();

    if (!j.contains("kind") || !j["kind"].is_string()) {
        return Err<EntryPtr>(SchemaError::parse("entry '" + name + "' requires a string 'kind'"));
    }
    auto kind = entry_kind_from_string(j["kind"].get<std::string>());
    if (!kind) {
        return Err<EntryPtr>(SchemaError::parse(
            "entry '" + name + "' has unknown kind '" + j["kind"].get<std::string>() + "'"));
    }

    auto entry = std::make_unique<SchemaEntry>(name, *kind);

    if (j.contains("keys")) {
        const auto& keys = j["keys"];
        if (keys.is_string()) {
            // YANG style: space separated key names
            std::istringstream iss(keys.get<std::string>());
            std::string key;
            while (iss >> key) {
                entry->m_keys.push_back(key);
            }
        } else if (keys.is_array()) {
            for (const auto& key : keys) {
                if (!key.is_string()) {
                    return Err<EntryPtr>(SchemaError::parse("keys of '" + name + "' must be strings"));
                }
                entry->m_keys.push_back(key.get<std::string>());
            }
        } else {
            return Err<EntryPtr>(SchemaError::parse("keys of '" + name + "' must be a string or array"));
        }
        if (!entry->m_keys.empty() && *kind != EntryKind::List) {
            return Err<EntryPtr>(SchemaError::parse("only lists declare keys: '" + name + "'"));
        }
    }

    if (j.contains("ordered_by")) {
        const auto& ordered = j["ordered_by"];
        if (!ordered.is_string() ||
            (ordered.get<std::string>() != "user" && ordered.get<std::string>() != "system")) {
            return Err<EntryPtr>(SchemaError::parse("ordered_by of '" + name + "' must be 'user' or 'system'"));
        }
        entry->m_ordered_by_user = ordered.get<std::string>() == "user";
    }

    for (const char* bound : {"min_elements", "max_elements"}) {
        if (!j.contains(bound)) {
            continue;
        }
        if (!j[bound].is_number_unsigned()) {
            return Err<EntryPtr>(SchemaError::parse(
                std::string(bound) + " of '" + name + "' must be a non-negative integer"));
        }
        auto n = j[bound].get<std::uint64_t>();
        if (std::string(bound) == "min_elements") {
            entry->m_min_elements = n;
        } else {
            entry->m_max_elements = n;
        }
    }
    if (entry->m_min_elements && entry->m_max_elements && *entry->m_min_elements > *entry->m_max_elements) {
        return Err<EntryPtr>(SchemaError::parse("min_elements exceeds max_elements in '" + name + "'"));
    }

    if (j.contains("config")) {
        if (!j["config"].is_boolean()) {
            return Err<EntryPtr>(SchemaError::parse("config of '" + name + "' must be a boolean"));
        }
        entry->m_config = j["config"].get<bool>();
    }

    if (j.contains("type")) {
        if (!j["type"].is_string()) {
            return Err<EntryPtr>(SchemaError::parse("type of '" + name + "' must be a string"));
        }
        entry->m_type.name = j["type"].get<std::string>();
    }
    if (j.contains("path")) {
        if (!j["path"].is_string()) {
            return Err<EntryPtr>(SchemaError::parse("path of '" + name + "' must be a string"));
        }
        entry->m_type.leafref_path = j["path"].get<std::string>();
    }
    if (entry->m_type.is_leafref() && entry->m_type.leafref_path.empty()) {
        return Err<EntryPtr>(SchemaError::parse("leafref '" + name + "' requires a 'path'"));
    }
    if (entry->is_leaf() && entry->m_type.name.empty()) {
        entry->m_type.name = "string";
    }

    if (j.contains("children")) {
        if (!j["children"].is_array()) {
            return Err<EntryPtr>(SchemaError::parse("children of '" + name + "' must be an array"));
        }
        if (entry->is_leaf() && !j["children"].empty()) {
            return Err<EntryPtr>(SchemaError::parse("leaf '" + name + "' cannot have children"));
        }
        for (const auto& cj : j["children"]) {
            auto child = SchemaEntry::from_json(cj);
            if (!child) {
                return Err<EntryPtr>(child.error());
            }
            entry->add(std::move(child).value());
        }
    }

    for (const auto& key : entry->m_keys) {
        const SchemaEntry* key_leaf = entry->find_child(key);
        if (key_leaf == nullptr || key_leaf->kind() != EntryKind::Leaf) {
            return Err<EntryPtr>(SchemaError::parse("list '" + name + "' has no key leaf '" + key + "'"));
        }
    }

    return Ok(std::move(entry));
}

nlohmann::json SchemaEntry::to_json() const {
    nlohmann::json j;
    j["name"] = m_name;
    j["kind"] = entry_kind_name(m_kind);

    if (!m_keys.empty()) {
        j["keys"] = m_keys;
    }
    if (m_kind == EntryKind::List || m_kind == EntryKind::LeafList) {
        j["ordered_by"] = m_ordered_by_user ? "user" : "system";
    }
    if (m_min_elements) {
        j["min_elements"] = *m_min_elements;
    }
    if (m_max_elements) {
        j["max_elements"] = *m_max_elements;
    }
    if (m_config) {
        j["config"] = *m_config;
    }
    if (is_leaf()) {
        j["type"] = m_type.name;
        if (!m_type.leafref_path.empty()) {
            j["path"] = m_type.leafref_path;
        }
    }
    if (!m_children.empty()) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto& child : m_children) {
            children.push_back(child->to_json());
        }
        j["children"] = std::move(children);
    }
    return j;
}

} // namespace treepath_schema
