#include "cache_factory.h"
#include "config.h"
#include "logger.h"
#include "simulator.h"
#include <fstream>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        // --- Resolve configuration ---
        SimulatorConfig config = parse_args(argc, argv);
        Logger::instance().set_level(config.log_level);
        if (!config.config_file.empty()) {
            log_info("Loaded config from " + config.config_file);
        }

        auto session = resolve_session(std::move(config), std::cin, std::cout);
        if (!session) {
            return 0;
        }

        // --- Core components ---
        auto cache = make_cache<int, std::string>(*session->policy, *session->capacity);
        CacheSimulator simulator(std::move(cache), std::cout);

        if (!session->script.empty()) {
            std::ifstream script(session->script);
            if (!script) {
                log_error("Cannot open script file: " + session->script);
                return 1;
            }
            simulator.run_script(script);
        } else {
            simulator.run_menu(std::cin);
        }
    } catch (const ConfigError& e) {
        log_error(e.what());
        return 1;
    }

    return 0;
}
