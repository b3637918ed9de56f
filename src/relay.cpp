#include <nlohmann/json.hpp>
#include <ostream>
#include <relay/relay.hpp>

using json = nlohmann::json;

namespace relay
{

void check_json_output(const std::string& text)
{
    try
    {
        (void)json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        throw JSONDecodeError(e.what(), e.byte);
    }
}

std::string describe_command(const std::vector<std::string>& command)
{
    json j = command;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

int execute(const std::vector<std::string>& args, std::istream* piped_stdin,
            const RelayConfig& config, std::ostream& out, std::ostream& err)
{
    if (config.debug)
        err << "[DEBUG] claude-relay " << version_string() << "\n";

    Request request;
    try
    {
        request = parse_arguments(args, piped_stdin);
    }
    catch (const ArgumentError& e)
    {
        err << "Error: " << e.what() << "\n";
        return EXIT_ARGUMENT_ERROR;
    }

    RunResult result;
    try
    {
        RelayConfig resolved = config;
        resolved.cli_path = verify_cli(config);

        Invocation invocation = build_invocation(request, resolved);

        if (config.debug)
        {
            err << "[DEBUG] Running: " << describe_command(invocation.command) << "\n";
            if (invocation.piped_input)
                err << "[DEBUG] Piping " << invocation.piped_input->size()
                    << " bytes of prompt to stdin\n";
            for (const auto& path : invocation.temp_files)
                err << "[DEBUG] System prompt written to " << path << "\n";
            err << "[DEBUG] Timeout: " << request.timeout_seconds << "s\n";
        }

        result = run_invocation(invocation, resolved,
                                std::chrono::seconds(request.timeout_seconds));
    }
    catch (const RelayError& e)
    {
        err << "Error running Claude: " << e.what() << "\n";
        return EXIT_RUNTIME_ERROR;
    }

    if (config.debug)
    {
        if (result.outcome == RunOutcome::TimedOut)
            err << "[DEBUG] Child " << result.pid << " killed after timeout\n";
        else
            err << "[DEBUG] Child " << result.pid << " exited with " << result.exit_code << "\n";

        if (!result.stdin_error.empty())
            err << "[DEBUG] Piped input not fully delivered: " << result.stdin_error << "\n";

        if (result.succeeded() && request.output_format == "json")
        {
            try
            {
                check_json_output(result.stdout_data);
            }
            catch (const JSONDecodeError& e)
            {
                err << "Warning: CLI output is not valid JSON (byte " << e.byte_offset()
                    << "): " << e.what() << "\n";
            }
        }
    }

    return relay_result(result, request.timeout_seconds, out, err);
}

} // namespace relay
