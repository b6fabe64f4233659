#pragma once

/// @file messages.hpp
/// @brief Protocol message shapes exchanged with callers

#include "path.hpp"
#include <treepath/data/value.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace treepath_path {

/// Address plus value
struct Update {
    Path path;
    treepath_data::Value value;

    bool operator==(const Update& other) const {
        return path == other.path && value == other.value;
    }
};

/// Change report: an atomic notification deletes everything under the
/// prefix before its updates are applied
struct Notification {
    std::int64_t timestamp = 0;
    std::optional<Path> prefix;
    std::vector<Path> deletes;
    std::vector<Update> updates;
    bool atomic = false;
};

/// Set-style request; deletes, replaces and updates apply in that order
struct EditRequest {
    std::optional<Path> prefix;
    std::vector<Path> deletes;
    std::vector<Update> replaces;
    std::vector<Update> updates;

    [[nodiscard]] bool empty() const noexcept {
        return deletes.empty() && replaces.empty() && updates.empty();
    }
};

} // namespace treepath_path
