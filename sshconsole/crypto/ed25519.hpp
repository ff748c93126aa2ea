#ifndef SSHCONSOLE_CRYPTO_ED25519_HEADER
#define SSHCONSOLE_CRYPTO_ED25519_HEADER

#include "sshconsole/common/types.hpp"

#include <array>
#include <optional>

namespace sshconsole::ssh {

class random;

std::size_t const ed25519_key_size = 32;
std::size_t const ed25519_signature_size = 64;

using ed25519_public_key = std::array<std::byte, ed25519_key_size>;
using ed25519_signature = std::array<std::byte, ed25519_signature_size>;

/// ed25519 key pair from the 32 byte seed
class ed25519_private_key {
public:
	/// nullopt if the seed is not 32 bytes
	static std::optional<ed25519_private_key> from_seed(const_span seed);
	static ed25519_private_key generate(random&);

	const_span seed() const { return seed_; }
	ed25519_public_key const& public_key() const { return public_; }

	ed25519_signature sign(const_span message) const;

	bool operator==(ed25519_private_key const&) const = default;

private:
	ed25519_private_key() = default;

	std::array<std::byte, ed25519_key_size> seed_{};
	ed25519_public_key public_{};
};

bool ed25519_verify(ed25519_public_key const&, const_span message, const_span signature);

}

#endif
