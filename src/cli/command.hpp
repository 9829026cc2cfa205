#pragma once

namespace gitstack::cli {

// argv[0] is the command name.
using command_fn = int (*)(int argc, char **argv);

} // namespace gitstack::cli
