#include "config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace {

CachePolicy require_policy(const std::string& text) {
    auto policy = parse_policy(text);
    if (!policy) {
        throw ConfigError("invalid cache policy '" + text + "' (expected lru, mru or lfu)");
    }
    return *policy;
}

LogLevel require_log_level(const std::string& text) {
    auto level = parse_log_level(text);
    if (!level) {
        throw ConfigError("invalid log level '" + text + "'");
    }
    return *level;
}

} // namespace

int64_t parse_capacity(const std::string& text) {
    int64_t capacity = 0;
    std::istringstream in(text);
    in >> capacity;
    if (in.fail() || !(in >> std::ws).eof()) {
        throw ConfigError("invalid cache capacity '" + text + "'");
    }
    if (capacity < 0) {
        throw ConfigError("cache capacity must be non-negative, got " + text);
    }
    return capacity;
}

SimulatorConfig config_from_json(const std::string& text, SimulatorConfig base) {
    SimulatorConfig config = std::move(base);
    try {
        auto doc = json::parse(text);
        if (!doc.is_object()) {
            throw ConfigError("config must be a JSON object");
        }

        if (doc.contains("policy")) {
            const auto& policy = doc["policy"];
            if (policy.is_number_integer()) {
                config.policy = require_policy(std::to_string(policy.get<int64_t>()));
            } else {
                config.policy = require_policy(policy.get<std::string>());
            }
        }

        if (doc.contains("capacity")) {
            const auto& capacity = doc["capacity"];
            if (!capacity.is_number_integer()) {
                throw ConfigError("'capacity' must be an integer");
            }
            auto value = capacity.get<int64_t>();
            if (value < 0) {
                throw ConfigError("cache capacity must be non-negative, got " + std::to_string(value));
            }
            config.capacity = value;
        }

        if (doc.contains("log_level")) {
            config.log_level = require_log_level(doc["log_level"].get<std::string>());
        }

        config.script = doc.value("script", config.script);
    } catch (const json::exception& e) {
        throw ConfigError(std::string{"invalid config: "} + e.what());
    }
    return config;
}

SimulatorConfig load_config_file(const std::string& path, SimulatorConfig base) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    SimulatorConfig config = config_from_json(buffer.str(), std::move(base));
    config.config_file = path;
    return config;
}

SimulatorConfig parse_args(int argc, const char* const argv[]) {
    std::vector<std::pair<std::string, std::string>> flags;

    // --- Collect "--flag value" pairs ---
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--policy" || arg == "--capacity" ||
            arg == "--log-level" || arg == "--script") {
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + arg);
            }
            flags.emplace_back(arg, argv[++i]);
        } else {
            log_warn("Ignoring unknown argument: " + arg);
        }
    }

    SimulatorConfig config;
    for (const auto& [flag, value] : flags) {
        if (flag == "--config") config = load_config_file(value, config);
    }

    for (const auto& [flag, value] : flags) {
        if (flag == "--policy") config.policy = require_policy(value);
        else if (flag == "--capacity") config.capacity = parse_capacity(value);
        else if (flag == "--log-level") config.log_level = require_log_level(value);
        else if (flag == "--script") config.script = value;
    }
    return config;
}

std::optional<SimulatorConfig> resolve_session(SimulatorConfig config, std::istream& in, std::ostream& out) {
    // Policy and capacity are both read before the policy choice is checked
    std::string choice;
    if (!config.policy) {
        out << "Choose Cache Policy:\n";
        for (auto policy : {CachePolicy::LRU, CachePolicy::MRU, CachePolicy::LFU}) {
            out << static_cast<int>(policy) + 1 << ". " << to_string(policy)
                << " (" << describe(policy) << ")\n";
        }
        out << "Enter choice: ";
        in >> choice;
    }

    std::string capacity;
    bool capacity_read = false;
    if (!config.capacity) {
        out << "Enter cache capacity: ";
        capacity_read = static_cast<bool>(in >> capacity);
    }

    if (!config.policy) {
        config.policy = parse_policy(choice);
        if (!config.policy) {
            out << "Invalid choice!" << std::endl;
            return std::nullopt;
        }
    }

    if (!config.capacity) {
        if (!capacity_read) {
            throw ConfigError("no cache capacity given");
        }
        config.capacity = parse_capacity(capacity);
    }
    return config;
}
