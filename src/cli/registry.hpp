#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string>

namespace rebranch::cli {

void register_command(const std::string &name, command_fn fn, const std::string &help);
command_fn find_command(const std::string &name);
void print_usage(std::ostream &os);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace rebranch::cli
