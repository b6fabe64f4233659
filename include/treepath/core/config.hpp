#pragma once

/// @file config.hpp
/// @brief JSON configuration loading for treepath

#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <initializer_list>
#include <string>

namespace treepath_core {

// =============================================================================
// JSON Loading
// =============================================================================

/// Read and parse a JSON document from disk
[[nodiscard]] Result<nlohmann::json> load_json_file(const std::filesystem::path& path);

/// Parse a JSON document held in memory; @p source names it in error messages
[[nodiscard]] Result<nlohmann::json> parse_json(const std::string& text,
                                                const std::string& source = "<string>");

// =============================================================================
// Option Object Helpers
// =============================================================================

/// Fail unless @p j is an object whose keys are all listed in @p known
[[nodiscard]] Result<void> check_option_keys(const nlohmann::json& j,
                                             std::initializer_list<const char*> known,
                                             const std::string& what);

/// Read an optional boolean member; leaves @p out untouched when absent
[[nodiscard]] Result<void> read_bool_option(const nlohmann::json& j, const char* key,
                                            bool& out, const std::string& what);

/// Read an optional string member; leaves @p out untouched when absent
[[nodiscard]] Result<void> read_string_option(const nlohmann::json& j, const char* key,
                                              std::string& out, const std::string& what);

/// Read an optional unsigned member; leaves @p out untouched when absent
[[nodiscard]] Result<void> read_size_option(const nlohmann::json& j, const char* key,
                                            std::size_t& out, const std::string& what);

// =============================================================================
// Logging Configuration
// =============================================================================

/// Build a LogConfig from an object such as
/// `{"level": "info", "modules": {"edit": "debug"}, "file": true, "directory": "logs"}`
[[nodiscard]] Result<LogConfig> log_config_from_json(const nlohmann::json& j);

/// Load a JSON file and apply it with configure_logging()
[[nodiscard]] Result<LogConfig> configure_logging_from_file(const std::filesystem::path& path);

} // namespace treepath_core
