#ifndef RELAY_RUNNER_HPP
#define RELAY_RUNNER_HPP

#include <chrono>
#include <iosfwd>
#include <relay/config.hpp>
#include <relay/types.hpp>
#include <string>

namespace relay
{

/**
 * Resolve the configured CLI to an executable file.
 * @return Absolute path of the executable
 * @throws CLINotFoundError if it does not exist or is not executable
 */
std::string verify_cli(const RelayConfig& config);

/**
 * Run one child process to completion or until the timeout expires.
 *
 * The child inherits this process's environment with the CLI directory
 * prepended to PATH. Piped input, when present, is written to the child's
 * stdin and then closed; otherwise the child reads from /dev/null. Stdout
 * and stderr are captured in full.
 *
 * On expiry the child is killed with SIGKILL and the result is
 * RunOutcome::TimedOut; output captured so far is kept.
 *
 * @throws LaunchError if the child cannot be started or its pipes fail
 */
RunResult run_invocation(const Invocation& invocation, const RelayConfig& config,
                         std::chrono::milliseconds timeout);

/**
 * Forward a finished run to the caller's streams.
 * @return The exit code this process should terminate with
 */
int relay_result(const RunResult& result, int timeout_seconds, std::ostream& out,
                 std::ostream& err);

} // namespace relay

#endif // RELAY_RUNNER_HPP
