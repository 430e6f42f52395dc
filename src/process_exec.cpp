#include "genesis/process_exec.hpp"

#include "genesis/logging.hpp"
#include "genesis/utility.hpp"

#include <reproc++/drain.hpp>
#include <reproc++/reproc.hpp>
#include <reproc++/run.hpp>

#include <chrono>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace genesis {

namespace {

constexpr auto POLL_INTERVAL = reproc::milliseconds(100);

// SIGTERM first so the builder can clean up its VM, SIGKILL if it lingers.
const reproc::stop_actions TERMINATE_ACTIONS{
    {reproc::stop::terminate, reproc::milliseconds(10000)},
    {reproc::stop::kill, reproc::milliseconds(2000)},
    {},
};

const reproc::stop_actions WAIT_ACTIONS{
    {reproc::stop::wait, reproc::infinite},
    {},
    {},
};

std::string command_line(const std::vector<std::string> &args) {
    std::string line;
    for (const auto &arg : args) {
        if (!line.empty())
            line += ' ';
        line += arg;
    }
    return line;
}

} // namespace

Result<int> process_exec(std::vector<std::string> &&args, const ProcessOptions &options) {
    if (args.empty()) {
        return fail(ErrorKind::Process, "cannot execute empty command");
    }

    reproc::options reproc_options;
    reproc_options.redirect.out.type = reproc::redirect::parent;
    reproc_options.redirect.err.type = reproc::redirect::parent;
    reproc_options.stop = WAIT_ACTIONS;

    std::string working_dir;
    if (options.working_dir) {
        working_dir = options.working_dir->string();
        reproc_options.working_directory = working_dir.c_str();
    }
    if (!options.env.empty()) {
        reproc_options.env.behavior = reproc::env::extend;
        reproc_options.env.extra = options.env;
    }

    const std::string line = command_line(args);
    GENESIS_LOG_DEBUG("starting process", {str_field("command", line)});

    reproc::process process;
    if (std::error_code ec = process.start(args, reproc_options)) {
        return fail(ErrorKind::Process, "failed to start '{}': {}", line, ec.message());
    }

    const auto started = std::chrono::steady_clock::now();
    while (true) {
        auto [status, ec] = process.wait(POLL_INTERVAL);
        if (!ec) {
            return status;
        }
        if (ec != std::errc::timed_out) {
            return fail(ErrorKind::Process, "failed waiting for '{}': {}", line, ec.message());
        }

        if (options.should_stop && options.should_stop()) {
            GENESIS_LOG_WARN("terminating process", {str_field("command", line), str_field("reason", "cancelled")});
            auto _ = process.stop(TERMINATE_ACTIONS);
            return fail(ErrorKind::Cancelled, "'{}' was cancelled", line);
        }

        if (options.timeout.count() > 0 && std::chrono::steady_clock::now() - started >= options.timeout) {
            GENESIS_LOG_WARN("terminating process", {str_field("command", line), str_field("reason", "timeout")});
            auto _ = process.stop(TERMINATE_ACTIONS);
            return fail(ErrorKind::Process, "'{}' timed out after {}s", line,
                        std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count());
        }
    }
}

Result<ProcessOutput> process_capture(std::vector<std::string> &&args,
                                      std::optional<std::filesystem::path> working_dir) {
    if (args.empty()) {
        return fail(ErrorKind::Process, "cannot execute empty command");
    }

    reproc::options reproc_options;
    reproc_options.stop = WAIT_ACTIONS;
    std::string dir;
    if (working_dir) {
        dir = working_dir->string();
        reproc_options.working_directory = dir.c_str();
    }

    ProcessOutput output;
    reproc::sink::string out_sink(output.out);
    reproc::sink::string err_sink(output.err);

    auto [status, ec] = reproc::run(args, reproc_options, out_sink, err_sink);
    if (ec) {
        return fail(ErrorKind::Process, "failed to run '{}': {}", command_line(args), ec.message());
    }
    output.status = status;
    return output;
}

} // namespace genesis
