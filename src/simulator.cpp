#include "simulator.h"
#include "cache_format.h"
#include "logger.h"
#include <stdexcept>

CacheSimulator::CacheSimulator(std::unique_ptr<IntCache> cache, std::ostream& out)
    : cache_(std::move(cache)), out_(out)
{
    if (!cache_) {
        throw std::invalid_argument("CacheSimulator requires a cache");
    }
    cache_->set_listener([this](const CacheEvent<int, std::string>& event) {
        on_event(event);
    });
    log_info("Simulating " + to_string(cache_->policy()) + " cache with capacity " +
             std::to_string(cache_->capacity()));
}

CacheSimulator::~CacheSimulator() {
    // Detach so the cache never calls back into a destroyed simulator
    cache_->set_listener({});
}

void CacheSimulator::on_event(const CacheEvent<int, std::string>& event) {
    auto line = format_event(event);
    out_ << line << "\n";
    log_debug(line);
}

bool CacheSimulator::execute(const Command& cmd) {
    switch (cmd.type) {
        case CommandType::Get:
            cache_->get(cmd.key);
            return true;
        case CommandType::Put:
            cache_->put(cmd.key, cmd.value);
            return true;
        case CommandType::Display:
            out_ << format_state(cache_->displayCache()) << "\n";
            return true;
        case CommandType::Exit:
            out_ << "Exiting...\n";
            log_info("Session ended: " + std::to_string(cache_->hits()) + " hits, " +
                     std::to_string(cache_->misses()) + " misses");
            return false;
        case CommandType::Invalid:
            out_ << "Invalid command: " << cmd.error << "\n";
            log_warn("Rejected command: " + cmd.error);
            return true;
    }
    return true;
}

void CacheSimulator::run_menu(std::istream& in) {
    while (true) {
        out_ << "\n1. Get from Cache\n"
             << "2. Put into Cache\n"
             << "3. Display Cache\n"
             << "4. Exit\n"
             << "Choose option: ";

        int choice = 0;
        if (!(in >> choice)) {
            log_warn("Menu input ended or was not a number, leaving menu");
            return;
        }

        Command cmd;
        switch (choice) {
            case 1: {
                out_ << "Enter key: ";
                int key = 0;
                if (!(in >> key)) {
                    log_warn("Expected an integer key, leaving menu");
                    return;
                }
                cmd = Command::get(key);
                break;
            }
            case 2: {
                out_ << "Enter key: ";
                int key = 0;
                if (!(in >> key)) {
                    log_warn("Expected an integer key, leaving menu");
                    return;
                }
                out_ << "Enter value: ";
                std::string value;
                if (!(in >> value)) {
                    log_warn("Expected a value, leaving menu");
                    return;
                }
                cmd = Command::put(key, value);
                break;
            }
            case 3:
                cmd = Command::display();
                break;
            case 4:
                cmd = Command::exit();
                break;
            default:
                out_ << "Invalid option!\n";
                continue;
        }

        if (!execute(cmd)) {
            return;
        }
    }
}

size_t CacheSimulator::run_script(std::istream& in) {
    size_t executed = 0;
    std::string line;
    while (std::getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }
        ++executed;
        if (!execute(parse_command(line))) {
            break;
        }
    }
    return executed;
}
