#ifndef RELAY_CONFIG_HPP
#define RELAY_CONFIG_HPP

#include <map>
#include <string>

namespace relay
{

constexpr const char* DEFAULT_CLI_PATH = "/usr/local/bin/claude";

/**
 * Process-wide settings, resolved once at startup.
 *
 * Components take the config by const reference and never consult the
 * environment themselves, so tests can build one by hand.
 */
struct RelayConfig
{
    // Executable the request is forwarded to (CLAUDE_PATH)
    std::string cli_path = DEFAULT_CLI_PATH;
    // PATH inherited from the caller; the child sees cli_dir():search_path
    std::string search_path;
    // Emit [DEBUG] traces on stderr (CLAUDE_RELAY_DEBUG)
    bool debug = false;

    static RelayConfig from_environment();

    // Directory containing cli_path, empty for a bare command name
    std::string cli_dir() const;

    // Environment overrides applied to the child process
    std::map<std::string, std::string> child_environment() const;
};

} // namespace relay

#endif // RELAY_CONFIG_HPP
