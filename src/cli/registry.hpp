#pragma once
#include <string>
#include "cli/command.hpp"

namespace prism::cli {

// Review commands read or change the working tree against HEAD; repository
// commands maintain the object store they review.
enum class command_group { review, repository };

void register_command(const std::string& name, command_fn fn, command_group group,
                      const std::string& synopsis, const std::string& help);
command_fn find_command(const std::string& name);

// Usage text with review commands listed first, names and synopses aligned.
std::string usage_text();
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

} // namespace prism::cli
