#include "crypto.hpp"

#include "sshconsole/common/util.hpp"

#include <stdexcept>

namespace sshconsole::ssh::test {

std::string_view const test_host_key_text = "ed25519 IWK76Glc2Dh7BeaSJrErVAndP6QWHZ06Wk9U5aeoaEI=";
std::string_view const test_user_key_text = "ed25519 AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=";

static ed25519_private_key load_seed(std::string_view text) {
	auto seed = decode_base64(text.substr(text.find(' ') + 1));
	auto key = seed ? ed25519_private_key::from_seed(*seed) : std::nullopt;
	if(!key) {
		throw std::logic_error("invalid test key");
	}
	return *key;
}

ed25519_private_key test_host_private_key() {
	return load_seed(test_host_key_text);
}

ed25519_private_key test_user_private_key() {
	return load_seed(test_user_key_text);
}

}
