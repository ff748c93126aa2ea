#include "kex.hpp"
#include "protocol.hpp"
#include "wire.hpp"

#include "sshconsole/common/logger.hpp"
#include "sshconsole/common/util.hpp"
#include "sshconsole/crypto/cipher.hpp"
#include "sshconsole/crypto/random.hpp"

namespace sshconsole::ssh {

std::optional<kex_init> kex_init::parse(const_span payload) {
	wire_reader in(payload);
	if(in.read_byte() != ssh_kexinit) {
		return std::nullopt;
	}

	kex_init k;
	const_span cookie = in.read_bytes(kex_cookie_size);
	k.cookie.assign(cookie.begin(), cookie.end());
	k.kex = in.read_string();
	k.host_key = in.read_string();
	k.cipher_c2s = in.read_string();
	k.cipher_s2c = in.read_string();
	k.mac_c2s = in.read_string();
	k.mac_s2c = in.read_string();
	k.compress_c2s = in.read_string();
	k.compress_s2c = in.read_string();
	k.lang_c2s = in.read_string();
	k.lang_s2c = in.read_string();
	k.first_kex_follows = in.read_bool();
	// reserved
	in.read_uint32();

	if(!in) {
		return std::nullopt;
	}
	return k;
}

byte_vector kex_init::payload() const {
	return wire_writer(ssh_kexinit)
		.add_raw(cookie)
		.add_string(kex)
		.add_string(host_key)
		.add_string(cipher_c2s)
		.add_string(cipher_s2c)
		.add_string(mac_c2s)
		.add_string(mac_s2c)
		.add_string(compress_c2s)
		.add_string(compress_s2c)
		.add_string(lang_c2s)
		.add_string(lang_s2c)
		.add_bool(first_kex_follows)
		.add_uint32(0)
		.take();
}

std::optional<std::string> choose_algorithm(std::string_view client, std::string_view server) {
	for(std::string_view name : split(client, ',')) {
		if(!name.empty() && contains_name(server, name)) {
			return std::string(name);
		}
	}
	return std::nullopt;
}

namespace {

bool choose_into(std::string& res, std::string_view client, std::string_view server, std::string_view what, std::string& failed) {
	auto name = choose_algorithm(client, server);
	if(!name) {
		failed = what;
		return false;
	}
	res = std::move(*name);
	return true;
}

bool is_aead(std::string_view cipher) {
	auto c = find_cipher(cipher);
	return c && c->aead;
}

}

std::optional<kex_algorithms> negotiate(kex_init const& client, kex_init const& server, std::string& failed) {
	kex_algorithms res;
	std::string compress;
	bool ok = choose_into(res.kex, client.kex, server.kex, "kex", failed)
		&& choose_into(res.host_key, client.host_key, server.host_key, "host key", failed)
		&& choose_into(res.cipher_c2s, client.cipher_c2s, server.cipher_c2s, "client to server cipher", failed)
		&& choose_into(res.cipher_s2c, client.cipher_s2c, server.cipher_s2c, "server to client cipher", failed)
		&& (is_aead(res.cipher_c2s) || choose_into(res.mac_c2s, client.mac_c2s, server.mac_c2s, "client to server mac", failed))
		&& (is_aead(res.cipher_s2c) || choose_into(res.mac_s2c, client.mac_s2c, server.mac_s2c, "server to client mac", failed))
		&& choose_into(compress, client.compress_c2s, server.compress_c2s, "client to server compression", failed)
		&& choose_into(compress, client.compress_s2c, server.compress_s2c, "server to client compression", failed);

	if(!ok) {
		return std::nullopt;
	}
	return res;
}

byte_vector derive_key(const_span shared_secret_mpint, const_span exchange_hash, char letter,
	const_span session_id, std::size_t size)
{
	std::byte const x[] = {std::byte(letter)};
	auto k = sha256()
		.update(shared_secret_mpint)
		.update(exchange_hash)
		.update(x)
		.update(session_id)
		.digest();

	byte_vector res(k.begin(), k.end());
	while(res.size() < size) {
		k = sha256()
			.update(shared_secret_mpint)
			.update(exchange_hash)
			.update(res)
			.digest();
		res.insert(res.end(), k.begin(), k.end());
	}
	res.resize(size);
	return res;
}

curve25519_kex::curve25519_kex(kex_exchange_data data, random& rand, logger& log)
: data_(std::move(data))
, log_(log)
, key_(rand)
{
}

bool curve25519_kex::fail(std::string message) {
	log_.log(logger::error, "Key exchange failed: {}", message);
	error_ = std::move(message);
	return false;
}

void curve25519_kex::calc_hash(const_span host_key_blob, const_span client_public, const_span server_public) {
	byte_vector data = wire_writer()
		.add_string(data_.client_version)
		.add_string(data_.server_version)
		.add_blob(data_.client_kexinit)
		.add_blob(data_.server_kexinit)
		.add_blob(host_key_blob)
		.add_blob(client_public)
		.add_blob(server_public)
		.add_raw(secret_)
		.take();
	hash_ = sha256_of(data);
}

byte_vector curve25519_kex::client_init() const {
	return wire_writer(ssh_kex_ecdh_init)
		.add_blob(key_.public_key())
		.take();
}

std::optional<byte_vector> curve25519_kex::make_reply(const_span init_payload, ed25519_private_key const& host_key) {
	wire_reader in(init_payload);
	in.read_byte();
	const_span client_public = in.read_blob();
	if(!in) {
		fail("invalid ecdh init");
		return std::nullopt;
	}

	auto secret = key_.shared_secret(client_public);
	if(!secret) {
		fail("invalid client public key");
		return std::nullopt;
	}
	secret_ = wire_writer().add_mpint(*secret).take();

	byte_vector host_key_blob = ssh_public_key_of(host_key).blob();
	calc_hash(host_key_blob, client_public, key_.public_key());

	log_.log(logger::debug, "Sending ecdh reply");
	return wire_writer(ssh_kex_ecdh_reply)
		.add_blob(host_key_blob)
		.add_blob(key_.public_key())
		.add_blob(ssh_signature(host_key, hash_))
		.take();
}

bool curve25519_kex::handle_reply(const_span reply_payload, std::function<bool(ssh_public_key const&)> const& host_key_check) {
	wire_reader in(reply_payload);
	in.read_byte();
	const_span host_key_blob = in.read_blob();
	const_span server_public = in.read_blob();
	const_span signature = in.read_blob();
	if(!in) {
		return fail("invalid ecdh reply");
	}

	auto key = ssh_public_key::from_blob(host_key_blob);
	if(!key) {
		return fail("unsupported host key");
	}

	auto secret = key_.shared_secret(server_public);
	if(!secret) {
		return fail("invalid server public key");
	}
	secret_ = wire_writer().add_mpint(*secret).take();
	calc_hash(host_key_blob, key_.public_key(), server_public);

	if(!key->verify(hash_, signature)) {
		return fail("host key signature verification failed");
	}
	if(host_key_check && !host_key_check(*key)) {
		return fail("host key not trusted " + key->fingerprint());
	}

	log_.log(logger::debug, "Server host key {}", key->fingerprint());
	host_key_ = key;
	return true;
}

}
