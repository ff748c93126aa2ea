#ifndef SSHCONSOLE_CONSOLE_KEYS_HEADER
#define SSHCONSOLE_CONSOLE_KEYS_HEADER

#include "sshconsole/core/ssh_keys.hpp"

#include <optional>
#include <string>

namespace sshconsole::ssh {
class random;
}

namespace sshconsole::ssh::console {

/** \brief Server host key in the text form "<algorithm> <base64 private key>", only ed25519 is supported
 *
 *  Text after the key (e.g. a comment) is ignored when parsing.
 */
class host_key {
public:
	static constexpr std::string_view ed25519_tag = "ed25519";

	/// new random ed25519 key
	static host_key generate(random&);

	std::string_view algorithm() const { return ed25519_tag; }

	/// the 32 byte ed25519 seed
	const_span seed() const { return key_.seed(); }

	/// inverse of host_key_from
	std::string to_string() const;

	ed25519_private_key const& private_key() const { return key_; }

	/// "SHA256:<base64>" of the public key
	std::string fingerprint() const;

	bool operator==(host_key const&) const = default;

private:
	explicit host_key(ed25519_private_key key);
	friend std::optional<host_key> host_key_from(std::string_view, std::string&);

	ed25519_private_key key_;
};

/// parse host key from text, returns nullopt and sets error if the text is not valid
std::optional<host_key> host_key_from(std::string_view text, std::string& error);
std::optional<host_key> host_key_from(std::string_view text);

/// Public key the client presented for authentication
class public_key_credential {
public:
	explicit public_key_credential(ssh_public_key key);

	ssh_public_key const& key() const { return key_; }

	// "ssh-ed25519"
	std::string_view type() const { return key_.type(); }

	/// the OpenSSH public key line "<type> <base64>" for the key
	std::string to_string() const;

	/// true if the OpenSSH public key line ("ssh-ed25519 <base64> [comment]") has the same key
	bool matches(std::string_view line) const;

	/// true if any line of authorized_keys style text matches
	bool is_authorized(std::string_view text) const;

private:
	ssh_public_key key_;
	byte_vector blob_;
};

}

#endif
