#ifndef SSHCONSOLE_CORE_KEX_HEADER
#define SSHCONSOLE_CORE_KEX_HEADER

#include "ssh_keys.hpp"

#include "sshconsole/crypto/digest.hpp"
#include "sshconsole/crypto/x25519.hpp"

#include <functional>
#include <vector>

namespace sshconsole::ssh {

class logger;
class random;

std::string_view const curve25519_sha256_name = "curve25519-sha256";
std::string_view const curve25519_sha256_libssh_name = "curve25519-sha256@libssh.org";
std::string_view const no_compression_name = "none";

/// contents of SSH_MSG_KEXINIT, the name lists are comma separated
struct kex_init {
	byte_vector cookie;
	std::string kex;
	std::string host_key;
	std::string cipher_c2s;
	std::string cipher_s2c;
	std::string mac_c2s;
	std::string mac_s2c;
	std::string compress_c2s;
	std::string compress_s2c;
	std::string lang_c2s;
	std::string lang_s2c;
	bool first_kex_follows{};

	static std::optional<kex_init> parse(const_span payload);
	byte_vector payload() const;
};

/// algorithms chosen for the key exchange and the following keys
struct kex_algorithms {
	std::string kex;
	std::string host_key;
	std::string cipher_c2s;
	std::string cipher_s2c;
	// empty for aead ciphers
	std::string mac_c2s;
	std::string mac_s2c;
};

/// first algorithm of the client's list that the server also supports (RFC 4253 section 7.1)
std::optional<std::string> choose_algorithm(std::string_view client, std::string_view server);

/// nullopt if some category has no common algorithm, its name is put to failed
std::optional<kex_algorithms> negotiate(kex_init const& client, kex_init const& server, std::string& failed);

/// the data both sides put to the exchange hash besides the kex specific values
struct kex_exchange_data {
	std::string client_version;
	std::string server_version;
	byte_vector client_kexinit;
	byte_vector server_kexinit;
};

/// derived key of size bytes (RFC 4253 section 7.2), letter is 'A' to 'F'
byte_vector derive_key(const_span shared_secret_mpint, const_span exchange_hash, char letter,
	const_span session_id, std::size_t size);

/** \brief curve25519-sha256 key exchange (RFC 8731)
 *
 *  The client sends its public key with client_init() and checks the server's reply with handle_reply().
 *  The server answers the client's init with make_reply(), signed with its host key.
 */
class curve25519_kex {
public:
	curve25519_kex(kex_exchange_data, random&, logger&);

	/// SSH_MSG_KEX_ECDH_INIT payload
	byte_vector client_init() const;

	/// SSH_MSG_KEX_ECDH_REPLY payload for the client's init, nullopt if the init is not valid
	std::optional<byte_vector> make_reply(const_span init_payload, ed25519_private_key const& host_key);

	/// verifies the server's reply, host_key_check decides if the key is trusted when it is set
	bool handle_reply(const_span reply_payload, std::function<bool(ssh_public_key const&)> const& host_key_check);

	/// valid after successful make_reply or handle_reply
	sha256_hash const& exchange_hash() const { return hash_; }

	/// shared secret as mpint
	byte_vector const& shared_secret() const { return secret_; }

	/// the server's host key, set by handle_reply
	std::optional<ssh_public_key> const& host_key() const { return host_key_; }

	std::string const& error() const { return error_; }

private:
	bool fail(std::string message);
	void calc_hash(const_span host_key_blob, const_span client_public, const_span server_public);

	kex_exchange_data data_;
	logger& log_;
	x25519_key key_;

	sha256_hash hash_{};
	byte_vector secret_;
	std::optional<ssh_public_key> host_key_;
	std::string error_;
};

}

#endif
