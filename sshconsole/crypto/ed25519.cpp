#include "ed25519.hpp"
#include "random.hpp"

#include <nettle/eddsa.h>

#include <algorithm>

namespace sshconsole::ssh {

std::optional<ed25519_private_key> ed25519_private_key::from_seed(const_span seed) {
	if(seed.size() != ed25519_key_size) {
		return std::nullopt;
	}
	ed25519_private_key key;
	std::copy(seed.begin(), seed.end(), key.seed_.begin());
	ed25519_sha512_public_key(as_uint8(span(key.public_)), as_uint8(const_span(key.seed_)));
	return key;
}

ed25519_private_key ed25519_private_key::generate(random& rand) {
	std::array<std::byte, ed25519_key_size> seed;
	rand.fill(seed);
	return *from_seed(seed);
}

ed25519_signature ed25519_private_key::sign(const_span message) const {
	ed25519_signature sig;
	ed25519_sha512_sign(as_uint8(const_span(public_)), as_uint8(const_span(seed_)),
		message.size(), as_uint8(message), as_uint8(span(sig)));
	return sig;
}

bool ed25519_verify(ed25519_public_key const& key, const_span message, const_span signature) {
	if(signature.size() != ed25519_signature_size) {
		return false;
	}
	return ed25519_sha512_verify(as_uint8(const_span(key)), message.size(), as_uint8(message), as_uint8(signature)) == 1;
}

}
