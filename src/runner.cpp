#include "internal/subprocess/process.hpp"

#include <algorithm>
#include <csignal>
#include <cstddef>
#include <ostream>
#include <relay/errors.hpp>
#include <relay/runner.hpp>
#include <thread>
#include <vector>

namespace relay
{

namespace
{
constexpr auto POLL_SLICE = std::chrono::milliseconds(100);
constexpr auto REAP_INTERVAL = std::chrono::milliseconds(10);

void drain(subprocess::ReadPipe& pipe, std::string& sink)
{
    char buffer[8192];
    size_t n = pipe.read(buffer, sizeof(buffer));
    if (n == 0)
        pipe.close(); // EOF
    else
        sink.append(buffer, n);
}

// Push as much pending input as the pipe accepts without blocking. A child
// that stops reading (or exits) ends the feed; the error is kept for tracing.
void feed(subprocess::WritePipe& pipe, const std::string& data, size_t& offset,
          std::string& error)
{
    constexpr size_t CHUNK = 64 * 1024;
    try
    {
        while (offset < data.size())
        {
            size_t n = pipe.write(data.data() + offset, std::min(CHUNK, data.size() - offset));
            if (n == 0)
                return; // Full
            offset += n;
        }
    }
    catch (const std::exception& e)
    {
        error = e.what();
    }
    pipe.close();
}
} // namespace

std::string verify_cli(const RelayConfig& config)
{
    if (config.cli_path.empty())
        throw CLINotFoundError("Claude CLI path is empty (check CLAUDE_PATH)");

    if (auto path = subprocess::find_executable(config.cli_path, config.search_path))
        return *path;

    throw CLINotFoundError("Claude CLI not found or not executable: " + config.cli_path);
}

RunResult run_invocation(const Invocation& invocation, const RelayConfig& config,
                         std::chrono::milliseconds timeout)
{
    if (invocation.command.empty())
        throw LaunchError("Empty command");

    // A child that exits without reading its input must not kill us
    std::signal(SIGPIPE, SIG_IGN);

    subprocess::ProcessOptions opts;
    opts.environment = config.child_environment();
    opts.redirect_stdin = invocation.piped_input.has_value();
    opts.redirect_stdout = true;
    opts.redirect_stderr = true;

    const std::string& executable = invocation.command.front();
    std::vector<std::string> args(invocation.command.begin() + 1, invocation.command.end());

    subprocess::Process process;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try
    {
        process.spawn(executable, args, opts);
    }
    catch (const std::exception& e)
    {
        throw LaunchError(e.what());
    }

    RunResult result;
    result.pid = process.pid();

    auto remaining = [&deadline]
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    };

    bool timed_out = false;
    try
    {
        subprocess::ReadPipe& out = process.stdout_pipe();
        subprocess::ReadPipe& err = process.stderr_pipe();

        // Stdin is written from the same loop that drains the output pipes so
        // neither side can block the other past the deadline
        subprocess::WritePipe* in = nullptr;
        size_t fed = 0;
        if (invocation.piped_input)
        {
            in = &process.stdin_pipe();
            in->set_nonblocking();
        }

        while (out.is_open() || err.is_open() || (in && in->is_open()))
        {
            auto left = remaining();
            if (left.count() <= 0)
            {
                timed_out = true;
                break;
            }

            int slice = static_cast<int>(std::min(left, POLL_SLICE).count());
            int ready = subprocess::wait_ready(&out, &err, in, slice);
            if (ready & subprocess::READY_FIRST)
                drain(out, result.stdout_data);
            if (ready & subprocess::READY_SECOND)
                drain(err, result.stderr_data);
            if (ready & subprocess::READY_INPUT)
                feed(*in, *invocation.piped_input, fed, result.stdin_error);
        }

        while (!timed_out)
        {
            if (auto code = process.try_wait())
            {
                result.exit_code = *code;
                break;
            }
            if (remaining().count() <= 0)
                timed_out = true;
            else
                std::this_thread::sleep_for(REAP_INTERVAL);
        }
    }
    catch (const std::exception& e)
    {
        throw LaunchError(std::string("I/O error while running child: ") + e.what());
    }

    if (timed_out)
    {
        process.kill();
        result.outcome = RunOutcome::TimedOut;
        result.exit_code = process.wait();
    }

    return result;
}

int relay_result(const RunResult& result, int timeout_seconds, std::ostream& out,
                 std::ostream& err)
{
    if (result.outcome == RunOutcome::TimedOut)
    {
        err << "Command timed out after " << timeout_seconds << " seconds\n";
        err.flush();
        return EXIT_TIMEOUT;
    }

    if (result.exit_code != 0)
    {
        err << result.stderr_data;
        err.flush();
        // An undecodable wait status still has to look like a failure
        return result.exit_code > 0 ? result.exit_code : EXIT_RUNTIME_ERROR;
    }

    out << result.stdout_data;
    out.flush();
    return 0;
}

} // namespace relay
