#pragma once
/**
 * @file process.hpp
 * @brief Run a child process synchronously and capture its combined output.
 * @note POSIX only (fork/execvp/poll). Output is stdout and stderr interleaved, as with `2>&1`.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "skufall/config/constants.hpp"

namespace skufall::os {

    /// @brief What to run. @p command is resolved through PATH when it has no '/'.
    struct ProcessSpec {
        std::string command;
        std::vector<std::string> args;
        std::chrono::milliseconds timeout{0}; ///< 0 = wait indefinitely
        std::size_t max_output_bytes{config::constants::OUTPUT_CAPTURE_LIMIT};
    };

    /// @brief Exit status and captured output of a finished child.
    struct ProcessResult {
        int exit_code{-1};          ///< WEXITSTATUS, 128+signal, 124 on timeout, 127 if exec failed
        std::string output;         ///< Combined stdout/stderr (capped)
        bool truncated{false};      ///< Output exceeded max_output_bytes
        bool timed_out{false};      ///< Killed after spec.timeout
        bool started{false};        ///< fork() succeeded; the child ran (or tried to exec)
        std::string error_message;  ///< Spawn failure, or capture failure after start

        bool spawned() const noexcept { return started; }
        /// The child started but its output could not be read to the end.
        bool io_failed() const noexcept { return started && !error_message.empty(); }
    };

    /// @brief Fork, exec and wait. Never throws; spawn and capture failures land in error_message.
    ProcessResult run_process(const ProcessSpec& spec);

    /// @brief Locate an executable like `command -v`. Paths containing '/' are checked directly.
    std::optional<std::string> find_in_path(std::string_view name);

} // namespace skufall::os
