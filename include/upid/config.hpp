#pragma once

#include <upid/result.hpp>
#include <upid/log.hpp>
#include <upid/core/upid.hpp>
#include <optional>
#include <string>

namespace upid {

struct GeneratorConfig {
    std::string prefix = "zzzz";
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: global < local
struct Config {
    GeneratorConfig generator;
    LogConfig logging;
    // Track which fields were explicitly set (for merge)
    bool generator_prefix_set = false;
    bool logging_level_set = false;
    bool logging_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly-set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push log settings into upid::log; unset fields are left alone
    void apply_logging() const;
};

// A new UPID stamped with the configured default prefix
Upid generate(const Config& cfg);

// ~/.upid/config.toml
std::string global_config_path();

} // namespace upid
