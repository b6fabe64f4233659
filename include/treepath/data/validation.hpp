#pragma once

/// @file validation.hpp
/// @brief List invariant checks (keys, duplicates, cardinality)

#include "list.hpp"

#include <string>
#include <vector>

namespace treepath_data {

// =============================================================================
// ValidationResult
// =============================================================================

/// One violated list invariant, located by data path
struct ValidationIssue {
    treepath_core::ValidationError::Kind kind;
    std::string path;
    std::string message;

    /// "path: message", or just the message for the root
    [[nodiscard]] std::string to_string() const;
};

/// Every issue found by one validation pass. `valid` is false as soon as one
/// issue is recorded.
struct ValidationResult {
    bool valid = true;
    std::vector<ValidationIssue> issues;

    [[nodiscard]] static ValidationResult ok() { return {}; }

    void merge(const ValidationResult& other);
    void add_issue(treepath_core::ValidationError::Kind kind, std::string path, std::string message);

    [[nodiscard]] bool has(treepath_core::ValidationError::Kind kind) const;

    /// Empty when valid
    [[nodiscard]] std::string first_error() const;

    /// First issue as an Error (valid results yield a generic error)
    [[nodiscard]] treepath_core::Error to_error() const;
};

// =============================================================================
// Validation
// =============================================================================

/// Check one list and every list nested below it. @p path prefixes issue paths.
[[nodiscard]] ValidationResult validate_list(const ListNode& list, const std::string& path = "");

/// Check every list in the tree under @p root
[[nodiscard]] ValidationResult validate_tree(const DataNode& root, const std::string& path = "");

/// validate_tree() in Result form; the error carries the first issue and
/// the issue count as context
[[nodiscard]] treepath_core::Result<void> validate(const DataNode& root);

} // namespace treepath_data
