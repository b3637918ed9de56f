#ifndef RELAY_RELAY_HPP
#define RELAY_RELAY_HPP

// Main header that includes everything

#include <relay/arguments.hpp>
#include <relay/command.hpp>
#include <relay/config.hpp>
#include <relay/errors.hpp>
#include <relay/runner.hpp>
#include <relay/types.hpp>
#include <relay/version.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace relay
{

/**
 * Run the whole pipeline: parse, build, launch, relay.
 *
 * @param args Invocation arguments without the program name
 * @param piped_stdin Standard input if it is not a terminal, else nullptr
 * @param config Settings resolved once at startup
 * @param out Receives the child's stdout on success
 * @param err Receives the child's stderr on failure, and relay diagnostics
 * @return Exit code: 0, the child's code, EXIT_TIMEOUT, EXIT_RUNTIME_ERROR
 *         or EXIT_ARGUMENT_ERROR
 */
int execute(const std::vector<std::string>& args, std::istream* piped_stdin,
            const RelayConfig& config, std::ostream& out, std::ostream& err);

// Throws JSONDecodeError if text is not a single JSON document
void check_json_output(const std::string& text);

// Render a command vector as a JSON array (for traces)
std::string describe_command(const std::vector<std::string>& command);

} // namespace relay

#endif // RELAY_RELAY_HPP
