#pragma once

namespace rebranch::cli {

// Handler for one command; argv[0] is the command name itself.
using command_fn = int (*)(int argc, char **argv);

} // namespace rebranch::cli
