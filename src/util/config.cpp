#include <upid/config.hpp>
#include <upid/core/b32.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace upid {

static Status validate_prefix(const std::string& prefix) {
    if (prefix.empty() || prefix.size() > b32::PREFIX_CHAR_LEN) {
        return UpidError{UpidError::Config,
            "generator.prefix must be 1 to 4 characters, got '" + prefix + "'"};
    }
    for (char c : prefix) {
        if (!b32::is_valid_char(c)) {
            return UpidError{UpidError::Config,
                "generator.prefix contains invalid character '" + std::string(1, c) + "'",
                std::string("Allowed characters: ") + b32::ENCODE};
        }
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UpidError{UpidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [generator] section
    if (auto gen = doc["generator"].as_table()) {
        for (const auto& [key, val] : *gen) {
            std::string k(key);
            if (k == "prefix") {
                auto s = val.value<std::string>();
                if (!s) {
                    return UpidError{UpidError::Config, "generator.prefix must be a string"};
                }
                UPID_TRY(validate_prefix(*s));
                cfg.generator.prefix = *s;
                cfg.generator_prefix_set = true;
            } else {
                log::warn("ignoring unknown config key 'generator.%s'", k.c_str());
            }
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto s = node->value<std::string>();
            if (!s) {
                return UpidError{UpidError::Config, "log.level must be a string"};
            }
            auto lvl = log::parse_level(*s);
            UPID_TRY(lvl);
            cfg.logging.level = lvl.value();
            cfg.logging_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.logging_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UpidError{UpidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).or_else([&](UpidError& e) {
        e.file = path;
        return Result<Config>::err(e);
    });
}

void Config::merge(const Config& other) {
    if (other.generator_prefix_set) {
        generator.prefix = other.generator.prefix;
        generator_prefix_set = true;
    }
    if (other.logging_level_set) {
        logging.level = other.logging.level;
        logging_level_set = true;
    }
    if (other.logging_color_set) {
        logging.color = other.logging.color;
        logging_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (logging_level_set) log::set_level(logging.level);
    if (logging_color_set) log::set_color_enabled(logging.color);
}

Upid generate(const Config& cfg) {
    return Upid::from_prefix(cfg.generator.prefix);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.upid/config.toml";
}

} // namespace upid
