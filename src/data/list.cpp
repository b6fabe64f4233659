/// @file list.cpp
/// @brief KeyedList and OrderedList implementation

#include <treepath/data/list.hpp>
#include <treepath/data/struct.hpp>

namespace treepath_data {

using treepath_core::Err;
using treepath_core::Ok;
using treepath_core::PathError;
using treepath_core::Result;
using treepath_core::ValidationError;

// =============================================================================
// ListNode
// =============================================================================

std::vector<ListKey> ListNode::keys() const {
    std::vector<ListKey> out;
    for (auto& [key, entry] : entries()) {
        out.push_back(key);
    }
    return out;
}

Result<ListKey> ListNode::normalize_key(const ListKey& key) const {
    const NodeType& t = entry_type();
    if (t.keys.empty()) {
        return Err<ListKey>(PathError::invalid_key(t.name, "type declares no key fields"));
    }
    if (key.size() != t.keys.size()) {
        return Err<ListKey>(PathError::invalid_key(t.name,
            "expected " + std::to_string(t.keys.size()) + " key components, got " +
            std::to_string(key.size())));
    }

    std::vector<ListKey::Component> components;
    components.reserve(t.keys.size());
    for (const auto& key_field : t.keys) {
        const FieldDescriptor* f = t.find_field(key_field);
        if (f == nullptr) {
            return Err<ListKey>(PathError::invalid_key(t.name, "unknown key field " + key_field));
        }
        const Value* v = key.get(f->schema_name());
        if (v == nullptr) {
            v = key.get(f->name);
        }
        if (v == nullptr) {
            return Err<ListKey>(PathError::invalid_key(t.name, "missing key component " + f->schema_name()));
        }
        auto converted = coerce_value(*f, *v);
        if (!converted) {
            return Err<ListKey>(PathError::invalid_key(t.name, converted.error().message()));
        }
        if (!converted->is_set()) {
            return Err<ListKey>(PathError::invalid_key(t.name, "unset key component " + f->schema_name()));
        }
        components.emplace_back(f->schema_name(), std::move(converted).value());
    }
    return Ok(ListKey(std::move(components)));
}

const DataNode* ListNode::find(const ListKey& key) const {
    auto normalized = normalize_key(key);
    if (!normalized) {
        return nullptr;
    }
    return find_exact(*normalized);
}

DataNode* ListNode::find(const ListKey& key) {
    auto normalized = normalize_key(key);
    if (!normalized) {
        return nullptr;
    }
    return find_exact(*normalized);
}

Result<DataNode*> ListNode::append(std::unique_ptr<DataNode> entry) {
    if (!entry) {
        return Err<DataNode*>(PathError::invalid_key(entry_type().name, "null entry"));
    }
    if (&entry->type() != m_entry_type && entry->type().name != m_entry_type->name) {
        return Err<DataNode*>(treepath_core::TypeMismatchError::between(m_entry_type->name, entry->type().name));
    }

    auto embedded = entry->list_key();
    if (!embedded) {
        return Err<DataNode*>(embedded.error());
    }
    auto key = normalize_key(*embedded);
    if (!key) {
        return Err<DataNode*>(key.error());
    }
    if (find_exact(*key) != nullptr) {
        return Err<DataNode*>(ValidationError::duplicate_key(entry_type().name, key->to_string()));
    }
    return Ok(insert(std::move(key).value(), std::move(entry)));
}

Result<DataNode*> ListNode::get_or_create(const ListKey& key) {
    auto normalized = normalize_key(key);
    if (!normalized) {
        return Err<DataNode*>(normalized.error());
    }
    if (DataNode* existing = find_exact(*normalized)) {
        return Ok(existing);
    }

    auto entry = make_entry(*normalized);
    if (!entry) {
        return Err<DataNode*>(entry.error());
    }
    return Ok(insert(std::move(normalized).value(), std::move(entry).value()));
}

bool ListNode::erase(const ListKey& key) {
    auto normalized = normalize_key(key);
    if (!normalized) {
        return false;
    }
    return erase_exact(*normalized);
}

Result<std::unique_ptr<DataNode>> ListNode::make_entry(const ListKey& key) const {
    using EntryPtr = std::unique_ptr<DataNode>;

    auto entry = Struct::make(entry_type());
    for (const auto& key_field : entry_type().keys) {
        const FieldDescriptor* f = entry_type().find_field(key_field);
        const Value* v = f ? key.get(f->schema_name()) : nullptr;
        if (v == nullptr) {
            return Err<EntryPtr>(PathError::invalid_key(entry_type().name, "missing key component " + key_field));
        }
        auto set = entry->set_leaf(key_field, *v);
        if (!set) {
            return Err<EntryPtr>(set.error());
        }
    }
    return Ok(EntryPtr(std::move(entry)));
}

std::unique_ptr<ListNode> make_list(const NodeType& entry_type, const ListAttributes& attrs) {
    if (attrs.ordered_by_user) {
        return std::make_unique<OrderedList>(entry_type, attrs);
    }
    return std::make_unique<KeyedList>(entry_type, attrs);
}

// =============================================================================
// KeyedList
// =============================================================================

std::vector<std::pair<ListKey, const DataNode*>> KeyedList::entries() const {
    std::vector<std::pair<ListKey, const DataNode*>> out;
    out.reserve(m_entries.size());
    for (const auto& [key, entry] : m_entries) {
        out.emplace_back(key, entry.get());
    }
    return out;
}

std::vector<std::pair<ListKey, DataNode*>> KeyedList::mutable_entries() {
    std::vector<std::pair<ListKey, DataNode*>> out;
    out.reserve(m_entries.size());
    for (auto& [key, entry] : m_entries) {
        out.emplace_back(key, entry.get());
    }
    return out;
}

std::unique_ptr<ListNode> KeyedList::clone() const {
    auto copy = std::make_unique<KeyedList>(entry_type(), attributes());
    for (const auto& [key, entry] : m_entries) {
        copy->m_entries.emplace(key, entry->clone());
    }
    return copy;
}

DataNode* KeyedList::find_exact(const ListKey& key) const {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? it->second.get() : nullptr;
}

DataNode* KeyedList::insert(ListKey key, std::unique_ptr<DataNode> entry) {
    auto [it, inserted] = m_entries.insert_or_assign(std::move(key), std::move(entry));
    return it->second.get();
}

bool KeyedList::erase_exact(const ListKey& key) {
    return m_entries.erase(key) > 0;
}

// =============================================================================
// OrderedList
// =============================================================================

std::vector<std::pair<ListKey, const DataNode*>> OrderedList::entries() const {
    std::vector<std::pair<ListKey, const DataNode*>> out;
    out.reserve(m_entries.size());
    for (const auto& [key, entry] : m_entries) {
        out.emplace_back(key, entry.get());
    }
    return out;
}

std::vector<std::pair<ListKey, DataNode*>> OrderedList::mutable_entries() {
    std::vector<std::pair<ListKey, DataNode*>> out;
    out.reserve(m_entries.size());
    for (auto& [key, entry] : m_entries) {
        out.emplace_back(key, entry.get());
    }
    return out;
}

void OrderedList::clear() {
    m_entries.clear();
    m_index.clear();
}

std::unique_ptr<ListNode> OrderedList::clone() const {
    auto copy = std::make_unique<OrderedList>(entry_type(), attributes());
    for (const auto& [key, entry] : m_entries) {
        copy->m_entries.emplace_back(key, entry->clone());
    }
    copy->rebuild_index();
    return copy;
}

Result<DataNode*> OrderedList::append_new(const ListKey& key) {
    auto normalized = normalize_key(key);
    if (!normalized) {
        return Err<DataNode*>(normalized.error());
    }
    if (find_exact(*normalized) != nullptr) {
        return Err<DataNode*>(ValidationError::duplicate_key(entry_type().name, normalized->to_string()));
    }
    return get_or_create(*normalized);
}

const DataNode* OrderedList::at(std::size_t index) const {
    return index < m_entries.size() ? m_entries[index].second.get() : nullptr;
}

DataNode* OrderedList::find_exact(const ListKey& key) const {
    auto it = m_index.find(key);
    return it != m_index.end() ? m_entries[it->second].second.get() : nullptr;
}

DataNode* OrderedList::insert(ListKey key, std::unique_ptr<DataNode> entry) {
    auto it = m_index.find(key);
    if (it != m_index.end()) {
        m_entries[it->second].second = std::move(entry);
        return m_entries[it->second].second.get();
    }
    m_index.emplace(key, m_entries.size());
    m_entries.emplace_back(std::move(key), std::move(entry));
    return m_entries.back().second.get();
}

bool OrderedList::erase_exact(const ListKey& key) {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return false;
    }
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return true;
}

void OrderedList::rebuild_index() {
    m_index.clear();
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        m_index.emplace(m_entries[i].first, i);
    }
}

} // namespace treepath_data
