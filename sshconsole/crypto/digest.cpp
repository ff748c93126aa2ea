#include "digest.hpp"

namespace sshconsole::ssh {

sha256::sha256() {
	sha256_init(&ctx_);
}

sha256& sha256::update(const_span data) {
	sha256_update(&ctx_, data.size(), as_uint8(data));
	return *this;
}

sha256_hash sha256::digest() {
	sha256_hash res;
	sha256_digest(&ctx_, res.size(), as_uint8(span(res)));
	return res;
}

sha256_hash sha256_of(const_span data) {
	return sha256().update(data).digest();
}

hmac_sha256::hmac_sha256(const_span key) {
	hmac_sha256_set_key(&ctx_, key.size(), as_uint8(key));
}

hmac_sha256& hmac_sha256::update(const_span data) {
	hmac_sha256_update(&ctx_, data.size(), as_uint8(data));
	return *this;
}

sha256_hash hmac_sha256::digest() {
	sha256_hash res;
	hmac_sha256_digest(&ctx_, res.size(), as_uint8(span(res)));
	return res;
}

}
