#include "core/command_line.h"
#include <iostream>

/**
 * Entry point of the SSE bridge.
 * Parses the command line, loads the configuration, sets up logging on
 * stderr and runs the bridge until stdin closes or a signal arrives.
 *
 * @return 0 on a clean shutdown, 1 on a usage or startup error.
 */
int main(int argc, char *argv[]) {
    return bridge::core::run_command_line(argc, argv, std::cerr);
}
