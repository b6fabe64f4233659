/// @file config.cpp
/// @brief JSON configuration loading for treepath_core

#include <treepath/core/config.hpp>

#include <fstream>
#include <sstream>

namespace treepath_core {

// =============================================================================
// JSON Loading
// =============================================================================

Result<nlohmann::json> load_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<nlohmann::json>(
            Error(ErrorCode::IOError, "Failed to open JSON file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_json(buffer.str(), path.string());
}

Result<nlohmann::json> parse_json(const std::string& text, const std::string& source) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<nlohmann::json>(
            Error(ErrorCode::ParseError, "JSON parse error in " + source + ": " + e.what()));
    }
    return Ok(std::move(j));
}

// =============================================================================
// Option Object Helpers
// =============================================================================

Result<void> check_option_keys(const nlohmann::json& j,
                               std::initializer_list<const char*> known,
                               const std::string& what) {
    if (!j.is_object()) {
        return Err(Error(ErrorCode::InvalidArgument, what + " must be a JSON object"));
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool found = false;
        for (const char* key : known) {
            if (it.key() == key) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Err(Error(ErrorCode::InvalidArgument,
                             "Unknown option '" + it.key() + "' in " + what));
        }
    }
    return Ok();
}

Result<void> read_bool_option(const nlohmann::json& j, const char* key,
                              bool& out, const std::string& what) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Err(Error(ErrorCode::TypeMismatch,
                         what + "." + key + " must be a boolean"));
    }
    out = it->get<bool>();
    return Ok();
}

Result<void> read_string_option(const nlohmann::json& j, const char* key,
                                std::string& out, const std::string& what) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err(Error(ErrorCode::TypeMismatch,
                         what + "." + key + " must be a string"));
    }
    out = it->get<std::string>();
    return Ok();
}

Result<void> read_size_option(const nlohmann::json& j, const char* key,
                              std::size_t& out, const std::string& what) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err(Error(ErrorCode::TypeMismatch,
                         what + "." + key + " must be a non-negative integer"));
    }
    out = it->get<std::size_t>();
    return Ok();
}

// =============================================================================
// Logging Configuration
// =============================================================================

Result<LogConfig> log_config_from_json(const nlohmann::json& j) {
    const std::string what = "logging";
    auto keys = check_option_keys(j,
        {"level", "modules", "console", "file", "directory", "max_file_size", "max_files"}, what);
    if (!keys) {
        return Err<LogConfig>(keys.error());
    }

    LogConfig config;
    std::string level = log_level_name(config.level);
    for (auto r : {read_string_option(j, "level", level, what),
                   read_bool_option(j, "console", config.console_enabled, what),
                   read_bool_option(j, "file", config.file_enabled, what),
                   read_string_option(j, "directory", config.log_directory, what),
                   read_size_option(j, "max_file_size", config.max_file_size, what),
                   read_size_option(j, "max_files", config.max_files, what)}) {
        if (!r) {
            return Err<LogConfig>(r.error());
        }
    }

    auto parsed = parse_log_level(level);
    if (!parsed) {
        return Err<LogConfig>(Error(ErrorCode::InvalidArgument, "Unknown log level: " + level));
    }
    config.level = *parsed;

    if (auto it = j.find("modules"); it != j.end()) {
        if (!it->is_object()) {
            return Err<LogConfig>(Error(ErrorCode::InvalidArgument, what + ".modules must be an object"));
        }
        for (const auto& [name, value] : it->items()) {
            auto module = parse_log_module(name);
            if (!module) {
                return Err<LogConfig>(Error(ErrorCode::InvalidArgument, "Unknown log module: " + name)
                                          .with_context("option", what + ".modules"));
            }
            auto module_level = value.is_string() ? parse_log_level(value.get<std::string>()) : std::nullopt;
            if (!module_level) {
                return Err<LogConfig>(Error(ErrorCode::InvalidArgument,
                                            what + ".modules." + name + " must name a log level"));
            }
            config.module_levels[*module] = *module_level;
        }
    }

    if (config.file_enabled && config.log_directory.empty()) {
        return Err<LogConfig>(Error(ErrorCode::InvalidArgument,
                                    "logging.file requires logging.directory"));
    }
    return Ok(std::move(config));
}

Result<LogConfig> configure_logging_from_file(const std::filesystem::path& path) {
    auto doc = load_json_file(path);
    if (!doc) {
        return Err<LogConfig>(doc.error());
    }
    auto config = log_config_from_json(*doc);
    if (!config) {
        return config;
    }
    configure_logging(*config);
    return config;
}

} // namespace treepath_core
