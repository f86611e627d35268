#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tkr::native
{
    /**
     * Spawns a new process with the given command and waits for it.
     * Arguments are passed as-is, without a shell.
     *
     * @param command The executable, looked up in PATH
     * @param args The arguments to pass to the command
     * @return exit code and captured standard output; -1 when the process could not be started
     */
    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args = {});
}
