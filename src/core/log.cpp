/// @file log.cpp
/// @brief Module logger registry
///
/// The four module loggers are created on first use and share one sink set.
/// configure_logging() swaps that set for all of them at once.

#include <treepath/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <vector>

namespace treepath_core {

namespace {

constexpr std::size_t k_module_count = 4;

struct ModuleName {
    LogModule module;
    const char* short_name;
    const char* logger_name;
};

constexpr std::array<ModuleName, k_module_count> k_modules{{
    {LogModule::Schema, "schema", "treepath.schema"},
    {LogModule::Path, "path", "treepath.path"},
    {LogModule::Diff, "diff", "treepath.diff"},
    {LogModule::Edit, "edit", "treepath.edit"},
}};

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

// First entry for a level is its canonical name
constexpr std::array<LevelName, 9> k_levels{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    std::shared_ptr<spdlog::logger> logger(LogModule module) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& slot = m_loggers[static_cast<std::size_t>(module)];
        if (!slot) {
            slot = std::make_shared<spdlog::logger>(log_module_name(module), m_sinks.begin(), m_sinks.end());
            slot->set_level(level_of(module));
        }
        return slot;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        m_sinks = make_sinks(m_config);
        for (std::size_t i = 0; i < m_loggers.size(); ++i) {
            if (m_loggers[i]) {
                m_loggers[i]->sinks() = m_sinks;
                m_loggers[i]->set_level(level_of(static_cast<LogModule>(i)));
            }
        }
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        m_config.module_levels.clear();
        for (auto& logger : m_loggers) {
            if (logger) {
                logger->set_level(level);
            }
        }
    }

    spdlog::level::level_enum level() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.level;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& logger : m_loggers) {
            if (logger) {
                logger->flush();
            }
        }
    }

    void detach_sinks() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sinks.clear();
        for (auto& logger : m_loggers) {
            if (logger) {
                logger->sinks().clear();
            }
        }
    }

private:
    LoggerRegistry() : m_sinks(make_sinks(m_config)) {}

    spdlog::level::level_enum level_of(LogModule module) const {
        auto it = m_config.module_levels.find(module);
        return it != m_config.module_levels.end() ? it->second : m_config.level;
    }

    static std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
            sinks.push_back(std::move(console));
        }

        if (config.file_enabled && !config.log_directory.empty()) {
            const auto file = std::filesystem::path(config.log_directory) / "treepath.log";
            try {
                auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file.string(), config.max_file_size, config.max_files);
                rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
                sinks.push_back(std::move(rotating));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("treepath: cannot open {}: {}", file.string(), e.what());
            }
        }
        return sinks;
    }

    mutable std::mutex m_mutex;
    LogConfig m_config;
    std::vector<spdlog::sink_ptr> m_sinks;
    std::array<std::shared_ptr<spdlog::logger>, k_module_count> m_loggers;
};

} // namespace

// =============================================================================
// Modules
// =============================================================================

const char* log_module_name(LogModule module) {
    for (const auto& m : k_modules) {
        if (m.module == module) {
            return m.logger_name;
        }
    }
    return "treepath";
}

std::optional<LogModule> parse_log_module(const std::string& name) {
    for (const auto& m : k_modules) {
        if (name == m.short_name) {
            return m.module;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Configuration and Loggers
// =============================================================================

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

std::shared_ptr<spdlog::logger> module_logger(LogModule module) {
    return LoggerRegistry::instance().logger(module);
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

spdlog::level::level_enum get_global_log_level() {
    return LoggerRegistry::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& entry : k_levels) {
        if (str == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    for (const auto& entry : k_levels) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "unknown";
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(LogModule module, std::string name)
    : m_logger(module_logger(module))
    , m_name(std::move(name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("enter {}", m_name);
}

LogScope::~LogScope() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("leave {} after {}us", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().flush();
    LoggerRegistry::instance().detach_sinks();
}

} // namespace treepath_core
