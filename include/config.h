#pragma once
#ifndef CONFIG_H
#define CONFIG_H

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "cache.h"
#include "logger.h"
#include "policy.h"

/**
 * Settings for the cache simulator. Unset policy/capacity are asked for
 * interactively.
 */
struct SimulatorConfig {
    std::optional<CachePolicy> policy;
    std::optional<int64_t> capacity;
    LogLevel log_level = LogLevel::Warn;
    std::string script;         ///< Command file to run instead of the menu, empty = menu
    std::string config_file;    ///< JSON file the settings were loaded from, if any
};

/**
 * Parse a capacity given as text.
 * @throws ConfigError if text is not an integer or is negative
 */
int64_t parse_capacity(const std::string& text);

/**
 * Overlay settings from a JSON document on top of base.
 * Recognised keys: "policy" (string or number), "capacity", "log_level", "script".
 * @throws ConfigError on malformed JSON or invalid values
 */
SimulatorConfig config_from_json(const std::string& text, SimulatorConfig base = {});

/**
 * Read and apply a JSON config file.
 * @throws ConfigError if the file cannot be read or is invalid
 */
SimulatorConfig load_config_file(const std::string& path, SimulatorConfig base = {});

/**
 * Build the config from command line flags:
 *   --config <file> --policy <lru|mru|lfu|1|2|3> --capacity <n>
 *   --log-level <level> --script <file>
 * The config file is applied first, explicit flags override it.
 * @throws ConfigError on invalid values or a missing flag argument
 */
SimulatorConfig parse_args(int argc, const char* const argv[]);

/**
 * Fill in whatever the config leaves unset by prompting on `out` and reading
 * from `in`: the policy menu first, then the capacity. Both answers are read
 * before the policy choice is checked.
 * @return The completed config, or std::nullopt after printing
 *         "Invalid choice!" when the policy selection names no policy
 * @throws ConfigError if the capacity is missing, non-numeric or negative
 */
std::optional<SimulatorConfig> resolve_session(SimulatorConfig config, std::istream& in, std::ostream& out);

#endif // CONFIG_H
