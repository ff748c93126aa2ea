#include "ssh_keys.hpp"
#include "wire.hpp"

#include "sshconsole/common/util.hpp"
#include "sshconsole/crypto/digest.hpp"

#include <algorithm>

namespace sshconsole::ssh {

std::optional<ssh_public_key> ssh_public_key::from_blob(const_span blob) {
	wire_reader in(blob);
	std::string_view type = in.read_string();
	const_span key = in.read_blob();
	if(!in.at_end() || type != ssh_ed25519_name || key.size() != ed25519_key_size) {
		return std::nullopt;
	}
	ed25519_public_key k;
	std::copy(key.begin(), key.end(), k.begin());
	return ssh_public_key(k);
}

byte_vector ssh_public_key::blob() const {
	return wire_writer()
		.add_string(ssh_ed25519_name)
		.add_blob(key_)
		.take();
}

bool ssh_public_key::verify(const_span message, const_span signature_blob) const {
	wire_reader in(signature_blob);
	std::string_view type = in.read_string();
	const_span sig = in.read_blob();
	if(!in.at_end() || type != ssh_ed25519_name) {
		return false;
	}
	return ed25519_verify(key_, message, sig);
}

std::string ssh_public_key::fingerprint() const {
	return "SHA256:" + encode_base64(sha256_of(blob()), false);
}

ssh_public_key ssh_public_key_of(ed25519_private_key const& key) {
	return ssh_public_key(key.public_key());
}

byte_vector ssh_signature(ed25519_private_key const& key, const_span message) {
	return wire_writer()
		.add_string(ssh_ed25519_name)
		.add_blob(key.sign(message))
		.take();
}

}
