#include <cerrno>
#include <cstdlib>
#include <istream>
#include <iterator>
#include <limits>
#include <relay/arguments.hpp>
#include <relay/errors.hpp>

namespace relay
{

namespace
{
constexpr const char* FLAG_PREFIX = "--";

bool is_flag(const std::string& token)
{
    return token.compare(0, 2, FLAG_PREFIX) == 0;
}

// Empty option values are treated as absent
std::optional<std::string> non_empty(const std::string& value)
{
    if (value.empty())
        return std::nullopt;
    return value;
}
} // namespace

std::string trim(const std::string& text)
{
    const char* whitespace = " \t\n\r\f\v";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return {};
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

int parse_timeout(const std::string& value)
{
    std::string text = trim(value);
    if (text.empty())
        throw ArgumentError("Invalid --timeout value: expected an integer number of seconds",
                            value);

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);

    if (end == text.c_str() || *end != '\0')
        throw ArgumentError("Invalid --timeout value '" + value +
                                "': expected an integer number of seconds",
                            value);

    if (errno == ERANGE || parsed > std::numeric_limits<int>::max() ||
        parsed < std::numeric_limits<int>::min())
        throw ArgumentError("Invalid --timeout value '" + value + "': out of range", value);

    return static_cast<int>(parsed);
}

Request parse_arguments(const std::vector<std::string>& args, std::istream* piped_stdin)
{
    Request request;

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--model" && has_value)
            request.model = non_empty(args[++i]);
        else if (arg == "--session-id" && has_value)
            request.session_id = non_empty(args[++i]);
        else if (arg == "--resume" && has_value)
            request.resume_id = non_empty(args[++i]);
        else if (arg == "--append-system-prompt" && has_value)
            request.system_prompt = non_empty(args[++i]);
        else if (arg == "--output-format" && has_value)
            request.output_format = non_empty(args[++i]);
        else if (arg == "--timeout" && has_value)
            request.timeout_seconds = parse_timeout(args[++i]);
        else if (arg == "--print")
            request.print_mode = true;
        else if (!is_flag(arg))
        {
            if (!request.user_prompt && !arg.empty())
                request.user_prompt = arg;
        }
        // Anything else is an unknown flag: skip it
    }

    if (!request.user_prompt && piped_stdin != nullptr)
    {
        std::string contents((std::istreambuf_iterator<char>(*piped_stdin)),
                             std::istreambuf_iterator<char>());
        request.user_prompt = non_empty(trim(contents));
    }

    return request;
}

} // namespace relay
