#pragma once

#if !defined(__unix__)
#   error "Error, unsupported platform"
#endif

#include <string>
#include <utility>
#include <vector>

namespace chainsink::native
{
    /**
     * Configures terminal settings for the current platform.
     * This is primarily used to ensure UTF-8 compatible console output.
     *
     * @return true if terminal configuration succeeded or was not required.
     * @return false if terminal configuration failed.
     */
    bool configureTerminal();

    /**
     * Spawns a new process and collects its standard output.
     * Arguments are quoted, so they reach the command verbatim.
     *
     * @param command The command to execute in the new process
     * @param args The arguments to pass to the command
     * @return exit code and captured output
     */
    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args = {});
}
