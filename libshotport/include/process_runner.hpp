//
// Created by the shotport authors on 07/11/25.
//

#ifndef SHOTPORT_PROCESS_RUNNER_HPP
#define SHOTPORT_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace shotport {

    /**
     * @brief Outcome of a finished child process.
     */
    struct ProcessResult {
        int exit_code = -1;  ///< Exit status, or 128 + signal number if killed
        std::string output;  ///< stdout and stderr, interleaved
    };

    /**
     * @brief Runs a program to completion and captures its output.
     *
     * argv[0] is looked up in PATH. No shell is involved, so arguments are
     * passed verbatim. Stdin of the child is inherited.
     *
     * @param argv Program followed by its arguments; must not be empty.
     * @throws std::system_error if the process cannot be started.
     * @throws std::invalid_argument if @p argv is empty.
     */
    [[nodiscard]] ProcessResult run_process(const std::vector<std::string>& argv);

} // namespace shotport

#endif // SHOTPORT_PROCESS_RUNNER_HPP
