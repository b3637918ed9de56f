#ifndef RELAY_VERSION_HPP
#define RELAY_VERSION_HPP

#include <string>

namespace relay
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace relay

#endif // RELAY_VERSION_HPP
