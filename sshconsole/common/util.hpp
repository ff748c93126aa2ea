#ifndef SSHCONSOLE_COMMON_UTIL_HEADER
#define SSHCONSOLE_COMMON_UTIL_HEADER

#include "types.hpp"

#include <optional>

namespace sshconsole::ssh {

std::string encode_base64(const_span, bool pad = true);

/// nullopt if the text is not valid base64, padding is optional
std::optional<byte_vector> decode_base64(std::string_view);

/// removes spaces, tabs and line ends from both sides
std::string_view trim(std::string_view);

/// splits on separator, keeps empty parts
std::vector<std::string_view> split(std::string_view, char separator);

/// first word of s separated by space or tab, s is left with the rest
std::string_view take_word(std::string_view& s);

/// comma separated list of names as used in the ssh protocol
std::string join_names(std::vector<std::string> const&);
bool contains_name(std::string_view list, std::string_view name);

}

#endif
