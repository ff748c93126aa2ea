#ifndef SSHCONSOLE_CORE_SSH_KEYS_HEADER
#define SSHCONSOLE_CORE_SSH_KEYS_HEADER

#include "sshconsole/crypto/ed25519.hpp"

#include <optional>
#include <string>

namespace sshconsole::ssh {

std::string_view const ssh_ed25519_name = "ssh-ed25519";

/// Public key in the SSH wire format (RFC 8709), only ssh-ed25519 is supported
class ssh_public_key {
public:
	explicit ssh_public_key(ed25519_public_key const& key)
	: key_(key)
	{}

	/// nullopt if the blob is not ssh-ed25519 key
	static std::optional<ssh_public_key> from_blob(const_span);

	std::string_view type() const { return ssh_ed25519_name; }
	ed25519_public_key const& key() const { return key_; }

	/// string "ssh-ed25519", string key
	byte_vector blob() const;

	/// checks signature blob (string "ssh-ed25519", string signature) over message
	bool verify(const_span message, const_span signature_blob) const;

	/// "SHA256:" and unpadded base64 of the blob's hash, as shown by OpenSSH
	std::string fingerprint() const;

	bool operator==(ssh_public_key const&) const = default;

private:
	ed25519_public_key key_;
};

ssh_public_key ssh_public_key_of(ed25519_private_key const&);

/// signature blob for message
byte_vector ssh_signature(ed25519_private_key const&, const_span message);

}

#endif
