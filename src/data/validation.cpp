/// @file validation.cpp
/// @brief List invariant checks

#include <treepath/data/validation.hpp>

#include <algorithm>
#include <set>

namespace treepath_data {

using treepath_core::Err;
using treepath_core::Ok;
using treepath_core::Result;
using Kind = treepath_core::ValidationError::Kind;

namespace {

std::string entry_path(const std::string& list_path, const ListKey& key) {
    return list_path + "[" + key.to_string() + "]";
}

void check_cardinality(const ListNode& list, const std::string& path, ValidationResult& result) {
    const auto& attrs = list.attributes();
    std::size_t n = list.size();

    if (attrs.min_elements && n < *attrs.min_elements) {
        result.add_issue(Kind::Cardinality, path,
            "has " + std::to_string(n) + " elements, minimum is " + std::to_string(*attrs.min_elements));
    }
    if (attrs.max_elements && n > *attrs.max_elements) {
        result.add_issue(Kind::Cardinality, path,
            "has " + std::to_string(n) + " elements, maximum is " + std::to_string(*attrs.max_elements));
    }
}

} // anonymous namespace

std::string ValidationIssue::to_string() const {
    return path.empty() ? message : path + ": " + message;
}

void ValidationResult::merge(const ValidationResult& other) {
    valid = valid && other.valid;
    issues.insert(issues.end(), other.issues.begin(), other.issues.end());
}

void ValidationResult::add_issue(Kind kind, std::string path, std::string message) {
    valid = false;
    issues.push_back(ValidationIssue{kind, std::move(path), std::move(message)});
}

bool ValidationResult::has(Kind kind) const {
    return std::any_of(issues.begin(), issues.end(),
                       [kind](const ValidationIssue& issue) { return issue.kind == kind; });
}

std::string ValidationResult::first_error() const {
    return issues.empty() ? std::string{} : issues.front().to_string();
}

treepath_core::Error ValidationResult::to_error() const {
    if (issues.empty()) {
        return treepath_core::Error(treepath_core::ErrorCode::ValidationError, "validation failed");
    }

    const auto& first = issues.front();
    treepath_core::ValidationError err{first.kind, first.to_string(), first.path};
    treepath_core::Error error(std::move(err));
    error.with_context("issues", std::to_string(issues.size()));
    return error;
}

ValidationResult validate_list(const ListNode& list, const std::string& path) {
    ValidationResult result;
    check_cardinality(list, path, result);

    std::set<ListKey> seen;
    for (const auto& [lookup_key, entry] : list.entries()) {
        std::string here = entry_path(path, lookup_key);

        auto embedded = entry->list_key();
        if (!embedded) {
            result.add_issue(Kind::MissingKey, here, embedded.error().message());
            continue;
        }

        bool complete = true;
        for (const auto& [name, value] : embedded->components()) {
            if (!value.is_set()) {
                result.add_issue(Kind::MissingKey, here, "missing key field " + name);
                complete = false;
            }
        }

        if (complete) {
            auto normalized = list.normalize_key(*embedded);
            if (!normalized) {
                result.add_issue(Kind::KeyMismatch, here, normalized.error().message());
            } else {
                if (*normalized != lookup_key) {
                    result.add_issue(Kind::KeyMismatch, here,
                        "entry key " + normalized->to_string() + " does not match lookup key " +
                        lookup_key.to_string());
                }
                if (!seen.insert(*normalized).second) {
                    result.add_issue(Kind::DuplicateKey, here, "duplicate key " + normalized->to_string());
                }
            }
        }

        result.merge(validate_tree(*entry, here));
    }
    return result;
}

ValidationResult validate_tree(const DataNode& root, const std::string& path) {
    ValidationResult result;

    for (const auto& ref : enumerate_fields(root)) {
        std::string here = path + "/" + ref.field->schema_name();
        if (ref.container != nullptr) {
            result.merge(validate_tree(*ref.container, here));
        } else if (ref.list != nullptr) {
            result.merge(validate_list(*ref.list, here));
        }
    }
    return result;
}

Result<void> validate(const DataNode& root) {
    auto result = validate_tree(root);
    if (!result.valid) {
        return Err(result.to_error());
    }
    return Ok();
}

} // namespace treepath_data
