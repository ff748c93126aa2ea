#include "x25519.hpp"
#include "random.hpp"

#include <nettle/curve25519.h>

#include <algorithm>

namespace sshconsole::ssh {

x25519_key::x25519_key(random& rand) {
	rand.fill(secret_);
	curve25519_mul_g(as_uint8(span(public_)), as_uint8(const_span(secret_)));
}

x25519_key::~x25519_key() {
	std::fill(secret_.begin(), secret_.end(), std::byte{});
}

std::optional<x25519_value> x25519_key::shared_secret(const_span peer_public) const {
	if(peer_public.size() != x25519_size) {
		return std::nullopt;
	}
	x25519_value res;
	curve25519_mul(as_uint8(span(res)), as_uint8(const_span(secret_)), as_uint8(peer_public));
	if(std::all_of(res.begin(), res.end(), [](std::byte b) { return b == std::byte{}; })) {
		return std::nullopt;
	}
	return res;
}

}
