#pragma once

/// @file struct.hpp
/// @brief Generic DataNode for any NodeType

#include "node.hpp"
#include "list.hpp"

#include <map>
#include <memory>
#include <string>

namespace treepath_data {

/// DataNode storing fields by name, shaped by a NodeType
class Struct final : public DataNode {
public:
    explicit Struct(const NodeType& type) : m_type(&type) {}

    [[nodiscard]] static std::unique_ptr<Struct> make(const NodeType& type) {
        return std::make_unique<Struct>(type);
    }

    [[nodiscard]] const NodeType& type() const noexcept override { return *m_type; }

    [[nodiscard]] const Value& leaf(const std::string& field) const override;
    [[nodiscard]] treepath_core::Result<void> set_leaf(const std::string& field, Value value) override;

    [[nodiscard]] const DataNode* container(const std::string& field) const override;
    [[nodiscard]] DataNode* container(const std::string& field) override;
    [[nodiscard]] treepath_core::Result<DataNode*> get_or_create_container(const std::string& field) override;

    [[nodiscard]] const ListNode* list(const std::string& field) const override;
    [[nodiscard]] ListNode* list(const std::string& field) override;
    [[nodiscard]] treepath_core::Result<ListNode*> get_or_create_list(const std::string& field) override;

    void clear_field(const std::string& field) override;

    [[nodiscard]] std::unique_ptr<DataNode> clone() const override;

private:
    [[nodiscard]] const FieldDescriptor* expect_field(const std::string& field, FieldKind kind) const;

    const NodeType* m_type;
    std::map<std::string, Value> m_leaves;
    std::map<std::string, std::unique_ptr<DataNode>> m_containers;
    std::map<std::string, std::unique_ptr<ListNode>> m_lists;
};

} // namespace treepath_data
