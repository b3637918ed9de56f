#ifndef RELAY_ARGUMENTS_HPP
#define RELAY_ARGUMENTS_HPP

#include <iosfwd>
#include <relay/types.hpp>
#include <string>
#include <vector>

namespace relay
{

/**
 * Parse invocation arguments (without the program name) into a Request.
 *
 * Parsing is lenient: unknown "--" flags are skipped so that newer CLI flags
 * never break older callers. Only the first positional token becomes the
 * user prompt.
 *
 * @param args Raw arguments, left to right
 * @param piped_stdin Standard input when it is not a terminal, or nullptr.
 *        Read to EOF (and trimmed) only if no positional prompt was given.
 * @throws ArgumentError if --timeout is not an integer
 */
Request parse_arguments(const std::vector<std::string>& args, std::istream* piped_stdin);

// Parse a --timeout value; throws ArgumentError unless it is an in-range int.
// Zero and negative values are accepted and mean the deadline has already passed.
int parse_timeout(const std::string& value);

// Strip leading and trailing whitespace
std::string trim(const std::string& text);

} // namespace relay

#endif // RELAY_ARGUMENTS_HPP
