#ifndef RELAY_ERRORS_HPP
#define RELAY_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace relay
{

// Base exception
class RelayError : public std::runtime_error
{
  public:
    explicit RelayError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed invocation arguments (e.g. a non-numeric --timeout)
class ArgumentError : public RelayError
{
  public:
    ArgumentError(const std::string& message, const std::string& argument)
        : RelayError(message), argument_(argument)
    {
    }

    const std::string& argument() const
    {
        return argument_;
    }

  private:
    std::string argument_;
};

// CLI not found
class CLINotFoundError : public RelayError
{
  public:
    explicit CLINotFoundError(const std::string& message) : RelayError(message) {}
};

// Pipe, fork or exec failure while starting the child
class LaunchError : public RelayError
{
  public:
    explicit LaunchError(const std::string& message) : RelayError(message) {}
};

// JSON decode error
class JSONDecodeError : public RelayError
{
  public:
    JSONDecodeError(const std::string& message, std::size_t byte_offset)
        : RelayError(message), byte_offset_(byte_offset)
    {
    }

    std::size_t byte_offset() const
    {
        return byte_offset_;
    }

  private:
    std::size_t byte_offset_;
};

} // namespace relay

#endif // RELAY_ERRORS_HPP
