#ifndef SSHCONSOLE_CRYPTO_X25519_HEADER
#define SSHCONSOLE_CRYPTO_X25519_HEADER

#include "sshconsole/common/types.hpp"

#include <array>
#include <optional>

namespace sshconsole::ssh {

class random;

std::size_t const x25519_size = 32;
using x25519_value = std::array<std::byte, x25519_size>;

/// ephemeral curve25519 key for one key exchange
class x25519_key {
public:
	explicit x25519_key(random&);
	~x25519_key();

	x25519_key(x25519_key const&) = delete;
	x25519_key& operator=(x25519_key const&) = delete;

	x25519_value const& public_key() const { return public_; }

	/// nullopt if the peer key has wrong size or the result is all zeros
	std::optional<x25519_value> shared_secret(const_span peer_public) const;

private:
	x25519_value secret_;
	x25519_value public_;
};

}

#endif
