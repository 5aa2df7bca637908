#pragma once
#ifndef SIMULATOR_H
#define SIMULATOR_H

#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "cache.h"
#include "command.h"

/**
 * Drives a cache from user commands and reports the results as text.
 * - Every cache event is written to `out` as one line ("Cache Hit: 1 -> a")
 *   and mirrored to the logger at DEBUG level
 * - The cache itself never touches a stream
 */
class CacheSimulator {
public:
    using IntCache = Cache<int, std::string>;

    /**
     * @param cache Cache to drive, must not be null
     * @param out   Where results are printed
     */
    CacheSimulator(std::unique_ptr<IntCache> cache, std::ostream& out);
    ~CacheSimulator();

    CacheSimulator(const CacheSimulator&) = delete;
    CacheSimulator& operator=(const CacheSimulator&) = delete;

    /**
     * Run one command.
     * @return false once an Exit command has been executed
     */
    bool execute(const Command& cmd);

    /**
     * Numbered menu loop: 1 get, 2 put, 3 display, 4 exit.
     * Returns on exit, end of input, or non-numeric input.
     */
    void run_menu(std::istream& in);

    /**
     * Run text commands one per line (see parse_command). Blank lines and
     * lines starting with '#' are skipped.
     * @return Number of commands executed, the terminating exit included
     */
    size_t run_script(std::istream& in);

    IntCache& cache() { return *cache_; }

private:
    void on_event(const CacheEvent<int, std::string>& event);

    std::unique_ptr<IntCache> cache_;
    std::ostream& out_;
};

#endif // SIMULATOR_H
