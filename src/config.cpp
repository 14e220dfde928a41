// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "cpmm/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace cpmm {

using json = nlohmann::json;

namespace {

const char* severity_name(util::Severity sev) {
    switch (sev) {
        case util::Severity::TRC: return "trace";
        case util::Severity::DBG: return "debug";
        case util::Severity::NFO: return "info";
        case util::Severity::WRN: return "warning";
        case util::Severity::ERR: return "error";
        case util::Severity::FTL: return "fatal";
    }
    return "info";
}

} // anonymous namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Config config = from_json(buffer.str());

    util::Logger log{"Config"};
    LOG(log.info()) << "Loaded config from " << path_str;
    return config;
}

Config Config::from_json(std::string_view content) {
    Config config;

    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid config JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    try {
        if (doc.contains("custody")) {
            auto custody = addresses::from_hex(doc.at("custody").get<std::string>());
            if (!custody || addresses::is_zero(*custody)) {
                throw ConfigError("`custody` must be a non-zero hex address");
            }
            config.engine.custody = *custody;
        }

        if (doc.contains("log")) {
            const json& log = doc.at("log");
            if (!log.is_object()) {
                throw ConfigError("`log` must be an object");
            }

            if (log.contains("level")) {
                auto level = util::severity_from_string(log.at("level").get<std::string>());
                if (!level) {
                    throw ConfigError(
                        "Could not parse `log.level`: expected `trace`, `debug`, `info`, "
                        "`warning`, `error` or `fatal`");
                }
                config.log.level = *level;
            }
            config.log.console = log.value("console", config.log.console);
            if (log.contains("file")) {
                config.log.file = log.at("file").get<std::string>();
            }
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Config type error: ") + e.what());
    }

    return config;
}

std::string Config::to_json() const {
    json doc = {
        {"custody", addresses::to_hex(engine.custody)},
        {"log", {
            {"level", severity_name(log.level)},
            {"console", log.console},
        }},
    };
    if (log.file) {
        doc["log"]["file"] = *log.file;
    }
    return doc.dump(2);
}

} // namespace cpmm
