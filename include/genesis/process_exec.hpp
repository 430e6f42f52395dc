#pragma once

#include "genesis/utility.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace genesis {

struct ProcessOptions {
    std::optional<std::filesystem::path> working_dir;
    std::map<std::string, std::string> env; ///< Added on top of the parent environment.
    std::chrono::milliseconds timeout{0};   ///< Zero means no limit.
    std::function<bool()> should_stop;      ///< Polled while the child runs.
};

struct ProcessOutput {
    int status = -1;
    std::string out;
    std::string err;
};

/**
 * @brief Executes a subprocess with stdout/stderr going to the parent's.
 *
 * The child is terminated (then killed after a grace period) when
 * `should_stop` returns true or the timeout expires.
 *
 * @param args The command line arguments (first argument is the executable).
 * @return The exit status, `Cancelled` when stopped through `should_stop`,
 *         or `Process` when the child could not be started or timed out.
 */
Result<int> process_exec(std::vector<std::string> &&args, const ProcessOptions &options = {});

/**
 * @brief Runs a short-lived command to completion and captures its output.
 */
Result<ProcessOutput> process_capture(std::vector<std::string> &&args,
                                      std::optional<std::filesystem::path> working_dir = std::nullopt);

} // namespace genesis
