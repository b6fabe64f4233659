#pragma once

/// @file list.hpp
/// @brief Keyed and user-ordered list containers

#include "node.hpp"

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace treepath_data {

// =============================================================================
// ListNode
// =============================================================================

/// Collection of keyed entries of one NodeType. Entries are stored under the
/// lookup key they were inserted with; the key leaves inside an entry can be
/// changed afterwards, which validate_list() reports.
class ListNode {
public:
    ListNode(const NodeType& entry_type, ListAttributes attrs)
        : m_entry_type(&entry_type), m_attrs(std::move(attrs)) {}
    virtual ~ListNode() = default;

    ListNode(const ListNode&) = delete;
    ListNode& operator=(const ListNode&) = delete;

    [[nodiscard]] const NodeType& entry_type() const noexcept { return *m_entry_type; }
    [[nodiscard]] const ListAttributes& attributes() const noexcept { return m_attrs; }

    /// True when iteration follows insertion order
    [[nodiscard]] virtual bool ordered() const noexcept = 0;
    [[nodiscard]] virtual std::size_t size() const noexcept = 0;
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// Lookup keys in iteration order
    [[nodiscard]] std::vector<ListKey> keys() const;

    /// (lookup key, entry) pairs in iteration order
    [[nodiscard]] virtual std::vector<std::pair<ListKey, const DataNode*>> entries() const = 0;
    [[nodiscard]] virtual std::vector<std::pair<ListKey, DataNode*>> mutable_entries() = 0;

    /// Find by key; components are matched by schema name and converted to
    /// the key leaves' declared types first
    [[nodiscard]] const DataNode* find(const ListKey& key) const;
    [[nodiscard]] DataNode* find(const ListKey& key);

    /// Insert an entry under its embedded key. Fails when that key is
    /// malformed or already present.
    [[nodiscard]] treepath_core::Result<DataNode*> append(std::unique_ptr<DataNode> entry);

    /// Find the entry for @p key, or create one with its key leaves populated
    [[nodiscard]] treepath_core::Result<DataNode*> get_or_create(const ListKey& key);

    /// Remove an entry; false when absent
    bool erase(const ListKey& key);

    virtual void clear() = 0;

    [[nodiscard]] virtual std::unique_ptr<ListNode> clone() const = 0;

    /// Convert @p key to the entry type's key order and value types
    [[nodiscard]] treepath_core::Result<ListKey> normalize_key(const ListKey& key) const;

protected:
    [[nodiscard]] virtual DataNode* find_exact(const ListKey& key) const = 0;
    virtual DataNode* insert(ListKey key, std::unique_ptr<DataNode> entry) = 0;
    virtual bool erase_exact(const ListKey& key) = 0;

    /// New empty entry populated with the key leaves of @p key
    [[nodiscard]] treepath_core::Result<std::unique_ptr<DataNode>> make_entry(const ListKey& key) const;

private:
    const NodeType* m_entry_type;
    ListAttributes m_attrs;
};

/// Create the list implementation matching @p attrs
[[nodiscard]] std::unique_ptr<ListNode> make_list(const NodeType& entry_type, const ListAttributes& attrs);

// =============================================================================
// KeyedList
// =============================================================================

/// System-ordered list: iteration in key order
class KeyedList final : public ListNode {
public:
    KeyedList(const NodeType& entry_type, ListAttributes attrs = {})
        : ListNode(entry_type, std::move(attrs)) {}

    [[nodiscard]] bool ordered() const noexcept override { return false; }
    [[nodiscard]] std::size_t size() const noexcept override { return m_entries.size(); }
    [[nodiscard]] std::vector<std::pair<ListKey, const DataNode*>> entries() const override;
    [[nodiscard]] std::vector<std::pair<ListKey, DataNode*>> mutable_entries() override;
    void clear() override { m_entries.clear(); }
    [[nodiscard]] std::unique_ptr<ListNode> clone() const override;

protected:
    [[nodiscard]] DataNode* find_exact(const ListKey& key) const override;
    DataNode* insert(ListKey key, std::unique_ptr<DataNode> entry) override;
    bool erase_exact(const ListKey& key) override;

private:
    std::map<ListKey, std::unique_ptr<DataNode>> m_entries;
};

// =============================================================================
// OrderedList
// =============================================================================

/// User-ordered list: iteration in append order, lookup by key
class OrderedList final : public ListNode {
public:
    OrderedList(const NodeType& entry_type, ListAttributes attrs = ListAttributes::ordered())
        : ListNode(entry_type, std::move(attrs)) {}

    [[nodiscard]] bool ordered() const noexcept override { return true; }
    [[nodiscard]] std::size_t size() const noexcept override { return m_entries.size(); }
    [[nodiscard]] std::vector<std::pair<ListKey, const DataNode*>> entries() const override;
    [[nodiscard]] std::vector<std::pair<ListKey, DataNode*>> mutable_entries() override;
    void clear() override;
    [[nodiscard]] std::unique_ptr<ListNode> clone() const override;

    /// Create and append a new entry for @p key; fails if the key exists
    [[nodiscard]] treepath_core::Result<DataNode*> append_new(const ListKey& key);

    /// Entry at @p index in append order; nullptr when out of range
    [[nodiscard]] const DataNode* at(std::size_t index) const;

protected:
    [[nodiscard]] DataNode* find_exact(const ListKey& key) const override;
    DataNode* insert(ListKey key, std::unique_ptr<DataNode> entry) override;
    bool erase_exact(const ListKey& key) override;

private:
    void rebuild_index();

    std::vector<std::pair<ListKey, std::unique_ptr<DataNode>>> m_entries;
    std::map<ListKey, std::size_t> m_index;
};

} // namespace treepath_data
