#ifndef SSHCONSOLE_COMMON_TYPES_HEADER
#define SSHCONSOLE_COMMON_TYPES_HEADER

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sshconsole::ssh {

using byte_vector = std::vector<std::byte>;
using span = std::span<std::byte>;
using const_span = std::span<std::byte const>;

enum class transport_side {
	client,
	server
};

inline const_span to_span(std::string_view s) {
	return {reinterpret_cast<std::byte const*>(s.data()), s.size()};
}

inline std::string_view to_string_view(const_span s) {
	return {reinterpret_cast<char const*>(s.data()), s.size()};
}

inline byte_vector to_bytes(std::string_view s) {
	const_span v = to_span(s);
	return byte_vector(v.begin(), v.end());
}

// the span must have at least 4 bytes
inline std::uint32_t load_be32(const_span s) {
	return (std::uint32_t(s[0]) << 24) | (std::uint32_t(s[1]) << 16) | (std::uint32_t(s[2]) << 8) | std::uint32_t(s[3]);
}

inline void store_be32(span s, std::uint32_t v) {
	s[0] = std::byte(v >> 24);
	s[1] = std::byte(v >> 16);
	s[2] = std::byte(v >> 8);
	s[3] = std::byte(v);
}

// nettle works with uint8_t
inline std::uint8_t* as_uint8(span s) {
	return reinterpret_cast<std::uint8_t*>(s.data());
}

inline std::uint8_t const* as_uint8(const_span s) {
	return reinterpret_cast<std::uint8_t const*>(s.data());
}

inline std::uint8_t* as_uint8(byte_vector& v) {
	return reinterpret_cast<std::uint8_t*>(v.data());
}

inline std::uint8_t const* as_uint8(byte_vector const& v) {
	return reinterpret_cast<std::uint8_t const*>(v.data());
}

}

#endif
