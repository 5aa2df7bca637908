#include "command.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

bool read_key(std::istringstream& in, int& key) {
    std::string token;
    if (!(in >> token)) return false;
    std::istringstream number(token);
    number >> key;
    return !number.fail() && number.eof();
}

} // namespace

Command parse_command(const std::string& line) {
    std::istringstream in(line);
    std::string verb;
    if (!(in >> verb)) {
        return Command::invalid("empty command");
    }
    std::transform(verb.begin(), verb.end(), verb.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    Command cmd;
    if (verb == "get") {
        int key = 0;
        if (!read_key(in, key)) return Command::invalid("usage: get <key>");
        cmd = Command::get(key);
    } else if (verb == "put") {
        int key = 0;
        std::string value;
        if (!read_key(in, key) || !(in >> value)) return Command::invalid("usage: put <key> <value>");
        cmd = Command::put(key, value);
    } else if (verb == "display") {
        cmd = Command::display();
    } else if (verb == "exit") {
        cmd = Command::exit();
    } else {
        return Command::invalid("unknown command '" + verb + "'");
    }

    std::string extra;
    if (in >> extra) {
        return Command::invalid("unexpected argument '" + extra + "'");
    }
    return cmd;
}
