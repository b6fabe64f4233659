#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for treepath_schema module

#include <cstdint>

namespace treepath_schema {

enum class EntryKind : std::uint8_t;
struct TypeSpec;
class SchemaEntry;
class SchemaIndex;

} // namespace treepath_schema
