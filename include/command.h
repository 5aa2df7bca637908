#pragma once
#ifndef COMMAND_H
#define COMMAND_H

#include <string>
#include <utility>

enum class CommandType { Get, Put, Display, Exit, Invalid };

/**
 * One simulator request. `key` is used by Get/Put, `value` by Put,
 * `error` explains an Invalid command.
 */
struct Command {
    CommandType type = CommandType::Invalid;
    int key = 0;
    std::string value;
    std::string error;

    static Command get(int key) { return Command{CommandType::Get, key, {}, {}}; }
    static Command put(int key, std::string value) { return Command{CommandType::Put, key, std::move(value), {}}; }
    static Command display() { return Command{CommandType::Display, 0, {}, {}}; }
    static Command exit() { return Command{CommandType::Exit, 0, {}, {}}; }
    static Command invalid(std::string error) { return Command{CommandType::Invalid, 0, {}, std::move(error)}; }
};

/**
 * Parse a text command: "get <key>", "put <key> <value>", "display" or "exit".
 * The verb is case-insensitive; keys are integers, values a single word.
 * Malformed input yields a CommandType::Invalid command, never an exception.
 */
Command parse_command(const std::string& line);

#endif // COMMAND_H
