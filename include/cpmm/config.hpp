#ifndef CPMM_CONFIG_HPP
#define CPMM_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include "amm.hpp"
#include "log.hpp"

namespace cpmm {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Config - engine and logging settings
//
//   {
//     "custody": "0x0000000000000000000000000000000000009010",
//     "log": { "level": "info", "console": true, "file": "cpmm.log" }
//   }
//
// Every key is optional.
// =============================================================================

class Config {
public:
    EngineConfig engine;
    util::LogConfig log;

    Config() = default;

    // Throws ConfigError on unreadable files or malformed documents
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    std::string to_json() const;

    // Builder methods
    Config& with_custody(const Address& custody) {
        engine.custody = custody;
        return *this;
    }

    Config& with_log_level(util::Severity level) {
        log.level = level;
        return *this;
    }

    Config& with_log_file(std::string path) {
        log.file = std::move(path);
        return *this;
    }

    Config& log_to_console(bool enabled = true) {
        log.console = enabled;
        return *this;
    }
};

} // namespace cpmm

#endif // CPMM_CONFIG_HPP
