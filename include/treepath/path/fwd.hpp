#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for treepath_path module

namespace treepath_path {

struct PathElem;
struct Path;
struct Update;
struct Notification;
struct EditRequest;
class PathSpec;
struct PathOptions;
class PathWalk;

} // namespace treepath_path
