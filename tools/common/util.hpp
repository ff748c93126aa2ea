#ifndef SSHCONSOLE_TOOLS_COMMON_UTIL_HEADER
#define SSHCONSOLE_TOOLS_COMMON_UTIL_HEADER

#include <optional>
#include <string>

namespace sshconsole {

/// whole file as string, nullopt if it cannot be read
std::optional<std::string> read_file(std::string const& file);

/// "$HOME/<path>", nullopt if HOME is not set
std::optional<std::string> home_path(std::string const& path);

}

#endif
