#ifndef SSHCONSOLE_CRYPTO_DIGEST_HEADER
#define SSHCONSOLE_CRYPTO_DIGEST_HEADER

#include "sshconsole/common/types.hpp"

#include <nettle/hmac.h>
#include <nettle/sha2.h>

#include <array>

namespace sshconsole::ssh {

std::size_t const sha256_size = SHA256_DIGEST_SIZE;
using sha256_hash = std::array<std::byte, sha256_size>;

class sha256 {
public:
	sha256();

	sha256& update(const_span);
	sha256& update(std::string_view s) { return update(to_span(s)); }

	/// result of the data so far, resets the state
	sha256_hash digest();

private:
	sha256_ctx ctx_;
};

sha256_hash sha256_of(const_span);

class hmac_sha256 {
public:
	explicit hmac_sha256(const_span key);

	hmac_sha256& update(const_span);
	sha256_hash digest();

private:
	hmac_sha256_ctx ctx_;
};

}

#endif
