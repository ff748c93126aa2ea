#include "keys.hpp"

#include "sshconsole/common/util.hpp"

namespace sshconsole::ssh::console {

host_key::host_key(ed25519_private_key key)
: key_(std::move(key))
{
}

host_key host_key::generate(random& rand) {
	return host_key(ed25519_private_key::generate(rand));
}

std::string host_key::to_string() const {
	return std::string(ed25519_tag) + " " + encode_base64(seed());
}

std::string host_key::fingerprint() const {
	return ssh_public_key_of(key_).fingerprint();
}

std::optional<host_key> host_key_from(std::string_view text, std::string& error) {
	// anything after the key is a comment
	std::string_view rest = text;
	std::string_view tag = take_word(rest);
	std::string_view data = trim(take_word(rest));

	if(tag.empty() || data.empty()) {
		error = "expected '<algorithm> <base64 key>'";
		return std::nullopt;
	}

	if(tag != host_key::ed25519_tag) {
		error = "unsupported host key algorithm '" + std::string(tag) + "'";
		return std::nullopt;
	}

	auto seed = decode_base64(data);
	if(!seed || seed->empty()) {
		error = "invalid base64 key data";
		return std::nullopt;
	}

	auto key = ed25519_private_key::from_seed(*seed);
	if(!key) {
		error = "invalid ed25519 key size " + std::to_string(seed->size());
		return std::nullopt;
	}

	return host_key(std::move(*key));
}

std::optional<host_key> host_key_from(std::string_view text) {
	std::string error;
	return host_key_from(text, error);
}

public_key_credential::public_key_credential(ssh_public_key key)
: key_(std::move(key))
, blob_(key_.blob())
{
}

std::string public_key_credential::to_string() const {
	return std::string(type()) + " " + encode_base64(blob_);
}

bool public_key_credential::matches(std::string_view line) const {
	std::string_view rest = line;
	std::string_view tag = take_word(rest);
	std::string_view data = trim(take_word(rest));

	if(tag != type() || data.empty()) {
		return false;
	}

	// the blob contains the key type and the key data
	auto blob = decode_base64(data);
	return blob && *blob == blob_;
}

bool public_key_credential::is_authorized(std::string_view text) const {
	for(std::string_view line : split(text, '\n')) {
		line = trim(line);
		if(!line.empty() && matches(line)) {
			return true;
		}
	}
	return false;
}

}
