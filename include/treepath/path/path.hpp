#pragma once

/// @file path.hpp
/// @brief Protocol addresses: element names with key predicates

#include "fwd.hpp"
#include <treepath/core/error.hpp>

#include <map>
#include <string>
#include <vector>

namespace treepath_path {

// =============================================================================
// PathElem
// =============================================================================

/// One address element: a name plus key predicates
struct PathElem {
    std::string name;
    std::map<std::string, std::string> keys;

    PathElem() = default;
    PathElem(std::string n) : name(std::move(n)) {}
    PathElem(std::string n, std::map<std::string, std::string> k)
        : name(std::move(n)), keys(std::move(k)) {}
    PathElem(const char* n) : name(n) {}

    /// "name[k=v][k2=v2]" with ']' and '\' escaped in values
    [[nodiscard]] std::string to_string() const;

    bool operator==(const PathElem& other) const {
        return name == other.name && keys == other.keys;
    }
    bool operator!=(const PathElem& other) const { return !(*this == other); }
    bool operator<(const PathElem& other) const {
        if (name != other.name) return name < other.name;
        return keys < other.keys;
    }
};

// =============================================================================
// Path
// =============================================================================

/// Absolute address, optionally qualified by an origin
struct Path {
    std::vector<PathElem> elems;
    std::string origin;

    Path() = default;
    Path(std::initializer_list<PathElem> e) : elems(e) {}
    explicit Path(std::vector<PathElem> e, std::string o = {})
        : elems(std::move(e)), origin(std::move(o)) {}

    /// Parse "/a/b[k=v]/c". "" and "/" yield the empty path.
    [[nodiscard]] static treepath_core::Result<Path> parse(const std::string& text);

    /// Path of plain names
    [[nodiscard]] static Path from_names(const std::vector<std::string>& names);

    [[nodiscard]] bool empty() const noexcept { return elems.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return elems.size(); }

    /// "/a/b[k=v]"; "/" for the empty path. The origin is not rendered.
    [[nodiscard]] std::string to_string() const;

    /// Copy with @p elem appended
    [[nodiscard]] Path child(PathElem elem) const;

    /// True when every element of @p prefix matches the start of this path
    [[nodiscard]] bool has_prefix(const Path& prefix) const;

    bool operator==(const Path& other) const {
        return origin == other.origin && elems == other.elems;
    }
    bool operator!=(const Path& other) const { return !(*this == other); }
    bool operator<(const Path& other) const {
        if (origin != other.origin) return origin < other.origin;
        return elems < other.elems;
    }
};

/// Concatenate @p prefix and @p path. Origins must agree when both are set.
[[nodiscard]] treepath_core::Result<Path> join_paths(const Path& prefix, const Path& path);

} // namespace treepath_path
