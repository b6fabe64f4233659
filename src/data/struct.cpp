/// @file struct.cpp
/// @brief Generic DataNode implementation

#include <treepath/data/struct.hpp>

namespace treepath_data {

using treepath_core::Err;
using treepath_core::MutationError;
using treepath_core::Ok;
using treepath_core::Result;

namespace {

const Value& null_value() {
    static const Value null;
    return null;
}

} // anonymous namespace

const FieldDescriptor* Struct::expect_field(const std::string& field, FieldKind kind) const {
    const FieldDescriptor* f = m_type->find_field(field);
    if (f == nullptr || f->kind != kind) {
        return nullptr;
    }
    return f;
}

// =============================================================================
// Leaves
// =============================================================================

const Value& Struct::leaf(const std::string& field) const {
    auto it = m_leaves.find(field);
    return it != m_leaves.end() ? it->second : null_value();
}

Result<void> Struct::set_leaf(const std::string& field, Value value) {
    const FieldDescriptor* f = m_type->find_field(field);
    if (f == nullptr) {
        return Err(MutationError::unknown_field(field, m_type->name));
    }
    if (!f->is_leaf_kind()) {
        return Err(MutationError::invalid_value(field,
            std::string(field_kind_name(f->kind)) + " field does not hold a value"));
    }

    auto converted = coerce_value(*f, value);
    if (!converted) {
        return Err(converted.error());
    }
    if (converted->is_null()) {
        m_leaves.erase(field);
    } else {
        m_leaves[field] = std::move(converted).value();
    }
    return Ok();
}

// =============================================================================
// Containers
// =============================================================================

const DataNode* Struct::container(const std::string& field) const {
    auto it = m_containers.find(field);
    return it != m_containers.end() ? it->second.get() : nullptr;
}

DataNode* Struct::container(const std::string& field) {
    auto it = m_containers.find(field);
    return it != m_containers.end() ? it->second.get() : nullptr;
}

Result<DataNode*> Struct::get_or_create_container(const std::string& field) {
    if (DataNode* existing = container(field)) {
        return Ok(existing);
    }
    const FieldDescriptor* f = expect_field(field, FieldKind::Container);
    if (f == nullptr || f->child_type == nullptr) {
        return Err<DataNode*>(MutationError::unknown_field(field, m_type->name));
    }
    auto& slot = m_containers[field];
    slot = Struct::make(*f->child_type);
    return Ok(slot.get());
}

// =============================================================================
// Lists
// =============================================================================

const ListNode* Struct::list(const std::string& field) const {
    auto it = m_lists.find(field);
    return it != m_lists.end() ? it->second.get() : nullptr;
}

ListNode* Struct::list(const std::string& field) {
    auto it = m_lists.find(field);
    return it != m_lists.end() ? it->second.get() : nullptr;
}

Result<ListNode*> Struct::get_or_create_list(const std::string& field) {
    if (ListNode* existing = list(field)) {
        return Ok(existing);
    }
    const FieldDescriptor* f = expect_field(field, FieldKind::List);
    if (f == nullptr || f->child_type == nullptr) {
        return Err<ListNode*>(MutationError::unknown_field(field, m_type->name));
    }
    auto& slot = m_lists[field];
    slot = make_list(*f->child_type, f->list);
    return Ok(slot.get());
}

// =============================================================================
// Misc
// =============================================================================

void Struct::clear_field(const std::string& field) {
    m_leaves.erase(field);
    m_containers.erase(field);
    m_lists.erase(field);
}

std::unique_ptr<DataNode> Struct::clone() const {
    auto copy = Struct::make(*m_type);
    copy->m_leaves = m_leaves;
    for (const auto& [name, child] : m_containers) {
        copy->m_containers.emplace(name, child->clone());
    }
    for (const auto& [name, child] : m_lists) {
        copy->m_lists.emplace(name, child->clone());
    }
    return copy;
}

} // namespace treepath_data
