/**
 * claude_relay.cpp - Command-line front end for the Claude CLI
 *
 * Usage:
 *   claude-relay [--print] [--model NAME] [--session-id ID | --resume ID]
 *                [--output-format FMT] [--append-system-prompt TEXT]
 *                [--timeout SECONDS] [PROMPT]
 *
 * When PROMPT is omitted and stdin is not a terminal, the prompt is read from
 * stdin. The CLI is located through CLAUDE_PATH; set CLAUDE_RELAY_DEBUG=1 to
 * trace the forwarded command on stderr.
 */

#include <iostream>
#include <relay/relay.hpp>
#include <unistd.h>

int main(int argc, char* argv[])
{
    try
    {
        const relay::RelayConfig config = relay::RelayConfig::from_environment();

        std::vector<std::string> args(argv + 1, argv + argc);
        std::istream* piped_stdin = isatty(STDIN_FILENO) ? nullptr : &std::cin;

        return relay::execute(args, piped_stdin, config, std::cout, std::cerr);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error running Claude: " << e.what() << "\n";
        return relay::EXIT_RUNTIME_ERROR;
    }
}
