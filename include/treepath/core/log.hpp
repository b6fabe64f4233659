#pragma once

/// @file log.hpp
/// @brief Per-module spdlog loggers for treepath

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace treepath_core {

// =============================================================================
// Modules
// =============================================================================

/// Library areas that log under their own name
enum class LogModule : std::uint8_t {
    Schema,
    Path,
    Diff,
    Edit,
};

/// "treepath.schema", "treepath.path", "treepath.diff" or "treepath.edit"
[[nodiscard]] const char* log_module_name(LogModule module);

/// Inverse of the short names "schema", "path", "diff", "edit"
[[nodiscard]] std::optional<LogModule> parse_log_module(const std::string& name);

// =============================================================================
// Configuration
// =============================================================================

/// All module loggers share one set of sinks built from this
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::map<LogModule, spdlog::level::level_enum> module_levels;   ///< Overrides of level
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;                  ///< Holds treepath.log when file_enabled
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
};

/// Rebuild the shared sinks and re-level every module logger
void configure_logging(const LogConfig& config);

// =============================================================================
// Loggers
// =============================================================================

[[nodiscard]] std::shared_ptr<spdlog::logger> module_logger(LogModule module);

inline std::shared_ptr<spdlog::logger> schema_logger() { return module_logger(LogModule::Schema); }
inline std::shared_ptr<spdlog::logger> path_logger() { return module_logger(LogModule::Path); }
inline std::shared_ptr<spdlog::logger> diff_logger() { return module_logger(LogModule::Diff); }
inline std::shared_ptr<spdlog::logger> edit_logger() { return module_logger(LogModule::Edit); }

// =============================================================================
// Levels
// =============================================================================

/// Set every module to @p level, dropping per-module overrides
void set_global_log_level(spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Accepts spdlog's names plus "warn" and "err"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Trace Scopes
// =============================================================================

/// Logs entry and exit of a block, with its duration, at trace level
class LogScope {
public:
    LogScope(LogModule module, std::string name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
};

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and detach all sinks. Loggers stay valid and silent until the next
/// configure_logging().
void shutdown_logging();

} // namespace treepath_core

// =============================================================================
// Macros
// =============================================================================

#define TREEPATH_LOG(module, level, ...) \
    ::treepath_core::module_logger(::treepath_core::LogModule::module)->log(level, __VA_ARGS__)

#define TREEPATH_LOG_TRACE(module, ...) TREEPATH_LOG(module, ::spdlog::level::trace, __VA_ARGS__)
#define TREEPATH_LOG_DEBUG(module, ...) TREEPATH_LOG(module, ::spdlog::level::debug, __VA_ARGS__)
#define TREEPATH_LOG_INFO(module, ...) TREEPATH_LOG(module, ::spdlog::level::info, __VA_ARGS__)
#define TREEPATH_LOG_WARN(module, ...) TREEPATH_LOG(module, ::spdlog::level::warn, __VA_ARGS__)
#define TREEPATH_LOG_ERROR(module, ...) TREEPATH_LOG(module, ::spdlog::level::err, __VA_ARGS__)

#define TREEPATH_LOG_CONCAT_INNER(a, b) a##b
#define TREEPATH_LOG_CONCAT(a, b) TREEPATH_LOG_CONCAT_INNER(a, b)

/// Trace the enclosing block under @p module
#define TREEPATH_LOG_SCOPE(module, name) \
    ::treepath_core::LogScope TREEPATH_LOG_CONCAT(treepath_log_scope_, __LINE__)( \
        ::treepath_core::LogModule::module, name)
