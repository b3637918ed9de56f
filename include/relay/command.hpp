#ifndef RELAY_COMMAND_HPP
#define RELAY_COMMAND_HPP

#include <relay/config.hpp>
#include <relay/types.hpp>
#include <string>
#include <vector>

namespace relay
{

/**
 * Translate a Request into the command line understood by the Claude CLI.
 *
 * Flags are emitted in a fixed order: --print, --model, --session-id (or
 * --resume), --output-format, --append-system-prompt, then the user prompt.
 * A system prompt longer than INLINE_PROMPT_LIMIT is written to a temp file
 * and passed as "@<path>". A user prompt of INLINE_PROMPT_LIMIT or more is
 * returned as piped input instead of an argument.
 *
 * @throws RelayError if the temp file cannot be created
 */
Invocation build_invocation(const Request& request, const RelayConfig& config);

// Length in Unicode code points of UTF-8 text (invalid bytes count as one each)
std::size_t prompt_length(const std::string& text);

// Write contents to a fresh claude_system_prompt-XXXXXXXX.txt in the temp
// directory, record the path in temp_files and return it. The file is not
// removed afterwards.
std::string write_prompt_temp_file(const std::string& contents,
                                   std::vector<std::string>& temp_files);

} // namespace relay

#endif // RELAY_COMMAND_HPP
