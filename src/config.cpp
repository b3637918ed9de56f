#include <cstdlib>
#include <filesystem>
#include <relay/config.hpp>

namespace relay
{

namespace
{
bool env_flag_enabled(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}
} // namespace

RelayConfig RelayConfig::from_environment()
{
    RelayConfig config;

    if (const char* cli = std::getenv("CLAUDE_PATH"); cli != nullptr && cli[0] != '\0')
        config.cli_path = cli;

    if (const char* path = std::getenv("PATH"))
        config.search_path = path;

    config.debug = env_flag_enabled("CLAUDE_RELAY_DEBUG");
    return config;
}

std::string RelayConfig::cli_dir() const
{
    return std::filesystem::path(cli_path).parent_path().string();
}

std::map<std::string, std::string> RelayConfig::child_environment() const
{
    std::map<std::string, std::string> env;

    std::string dir = cli_dir();
    if (dir.empty())
    {
        if (!search_path.empty())
            env["PATH"] = search_path;
    }
    else if (search_path.empty())
        env["PATH"] = dir;
    else
        env["PATH"] = dir + ":" + search_path;

    return env;
}

} // namespace relay
