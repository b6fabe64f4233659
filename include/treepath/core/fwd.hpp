#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for treepath_core module

#include <cstdint>

namespace treepath_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

struct SchemaError;
struct PathError;
struct TypeMismatchError;
struct MutationError;
struct ValidationError;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging / Configuration
// =============================================================================

enum class LogModule : std::uint8_t;
struct LogConfig;
class LogScope;

} // namespace treepath_core
