#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for treepath_edit module

namespace treepath_edit {

struct EditOptions;

} // namespace treepath_edit
