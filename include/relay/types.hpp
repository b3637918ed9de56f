#ifndef RELAY_TYPES_HPP
#define RELAY_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace relay
{

constexpr int DEFAULT_TIMEOUT_SECONDS = 600;

// Prompts longer than this many code points are kept off the command line
constexpr std::size_t INLINE_PROMPT_LIMIT = 5000;

// Exit codes reported by the relay itself (child codes pass through unchanged)
constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_ARGUMENT_ERROR = 2;
constexpr int EXIT_TIMEOUT = 124;

// Parsed invocation arguments
struct Request
{
    std::optional<std::string> model;
    std::optional<std::string> session_id;
    std::optional<std::string> resume_id; // Ignored when session_id is set
    std::optional<std::string> system_prompt;
    std::optional<std::string> output_format;
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    std::optional<std::string> user_prompt; // Positional argument or piped stdin
    bool print_mode = false;
};

// Command line and optional stdin payload for one child process
struct Invocation
{
    std::vector<std::string> command; // command[0] is the executable
    std::optional<std::string> piped_input;
    std::vector<std::string> temp_files; // Created while building, never removed
};

enum class RunOutcome
{
    Completed,
    TimedOut
};

struct RunResult
{
    RunOutcome outcome = RunOutcome::Completed;
    int exit_code = -1; // 128 + signal when the child was killed by a signal
    std::string stdout_data;
    std::string stderr_data;
    std::string stdin_error; // Set when the child stopped accepting piped input
    int pid = 0;

    bool succeeded() const
    {
        return outcome == RunOutcome::Completed && exit_code == 0;
    }
};

} // namespace relay

#endif // RELAY_TYPES_HPP
