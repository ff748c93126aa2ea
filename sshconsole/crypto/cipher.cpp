#include "cipher.hpp"
#include "digest.hpp"

#include <nettle/aes.h>
#include <nettle/ctr.h>
#include <nettle/gcm.h>
#include <nettle/memops.h>

#include <algorithm>
#include <array>

namespace sshconsole::ssh {

std::string_view const aes256_gcm_name = "aes256-gcm@openssh.com";
std::string_view const aes256_ctr_name = "aes256-ctr";
std::string_view const hmac_sha256_name = "hmac-sha2-256";

std::size_t const length_size = 4;

std::optional<cipher_info> find_cipher(std::string_view name) {
	if(name == aes256_gcm_name) {
		return cipher_info{aes256_gcm_name, AES256_KEY_SIZE, GCM_IV_SIZE, true};
	}
	if(name == aes256_ctr_name) {
		return cipher_info{aes256_ctr_name, AES256_KEY_SIZE, AES_BLOCK_SIZE, false};
	}
	return std::nullopt;
}

std::optional<mac_info> find_mac(std::string_view name) {
	if(name == hmac_sha256_name) {
		return mac_info{hmac_sha256_name, sha256_size};
	}
	return std::nullopt;
}

namespace {

/// aes256-gcm@openssh.com (RFC 5647 with the openssh naming), the length is the additional data
class aes_gcm_cipher : public packet_cipher {
public:
	aes_gcm_cipher(const_span key, const_span iv)
	: packet_cipher(AES_BLOCK_SIZE, GCM_DIGEST_SIZE, length_size, true)
	{
		gcm_aes256_set_key(&ctx_, as_uint8(key));
		std::copy(iv.begin(), iv.end(), iv_.begin());
	}

	std::uint32_t decrypt_length(std::uint32_t, const_span head) override {
		return load_be32(head);
	}

	bool decrypt(std::uint32_t, const_span in, span out) override {
		std::size_t len = in.size() - length_size - tag_size();
		start(in.first(length_size));
		gcm_aes256_decrypt(&ctx_, len, as_uint8(out), as_uint8(in.subspan(length_size, len)));

		std::array<std::byte, GCM_DIGEST_SIZE> tag;
		gcm_aes256_digest(&ctx_, tag.size(), as_uint8(span(tag)));
		next_iv();
		return memeql_sec(tag.data(), in.last(tag_size()).data(), tag.size()) != 0;
	}

	void encrypt(std::uint32_t, const_span in, span out) override {
		std::size_t len = in.size() - length_size;
		std::copy_n(in.begin(), length_size, out.begin());
		start(in.first(length_size));
		gcm_aes256_encrypt(&ctx_, len, as_uint8(out.subspan(length_size)), as_uint8(in.subspan(length_size)));
		gcm_aes256_digest(&ctx_, tag_size(), as_uint8(out.subspan(length_size + len, tag_size())));
		next_iv();
	}

private:
	void start(const_span aad) {
		gcm_aes256_set_iv(&ctx_, iv_.size(), as_uint8(const_span(iv_)));
		gcm_aes256_update(&ctx_, aad.size(), as_uint8(aad));
	}

	// the last 8 bytes of the iv are a big endian counter increased for every packet
	void next_iv() {
		for(std::size_t i = iv_.size(); i-- > 4;) {
			iv_[i] = std::byte(std::uint8_t(iv_[i]) + 1);
			if(iv_[i] != std::byte{}) {
				break;
			}
		}
	}

	gcm_aes256_ctx ctx_;
	std::array<std::byte, GCM_IV_SIZE> iv_;
};

/// aes256-ctr with hmac-sha2-256 over the sequence number and the plain packet
class aes_ctr_hmac_cipher : public packet_cipher {
public:
	aes_ctr_hmac_cipher(const_span key, const_span iv, const_span mac_key)
	: packet_cipher(AES_BLOCK_SIZE, sha256_size, AES_BLOCK_SIZE, false)
	, mac_key_(mac_key.begin(), mac_key.end())
	{
		aes256_set_encrypt_key(&ctx_, as_uint8(key));
		std::copy(iv.begin(), iv.end(), counter_.begin());
	}

	std::uint32_t decrypt_length(std::uint32_t, const_span head) override {
		crypt(head.first(AES_BLOCK_SIZE), first_block_);
		return load_be32(first_block_);
	}

	bool decrypt(std::uint32_t seq, const_span in, span out) override {
		std::size_t len = in.size() - length_size - tag_size();
		// the rest of the first block was decrypted with the length
		std::size_t first_rest = AES_BLOCK_SIZE - length_size;
		std::copy_n(first_block_.begin() + length_size, first_rest, out.begin());
		crypt(in.subspan(AES_BLOCK_SIZE, len - first_rest), out.subspan(first_rest, len - first_rest));

		auto mac = packet_mac(seq, const_span(first_block_).first(length_size), out.first(len));
		return memeql_sec(mac.data(), in.last(tag_size()).data(), mac.size()) != 0;
	}

	void encrypt(std::uint32_t seq, const_span in, span out) override {
		auto mac = packet_mac(seq, in.first(length_size), in.subspan(length_size));
		crypt(in, out.first(in.size()));
		std::copy(mac.begin(), mac.end(), out.begin() + in.size());
	}

private:
	void crypt(const_span in, span out) {
		ctr_crypt(&ctx_, reinterpret_cast<nettle_cipher_func*>(&aes256_encrypt), AES_BLOCK_SIZE,
			as_uint8(span(counter_)), in.size(), as_uint8(out), as_uint8(in));
	}

	sha256_hash packet_mac(std::uint32_t seq, const_span length, const_span rest) const {
		std::array<std::byte, 4> seq_bytes;
		store_be32(seq_bytes, seq);
		return hmac_sha256(mac_key_).update(seq_bytes).update(length).update(rest).digest();
	}

	aes256_ctx ctx_;
	std::array<std::byte, AES_BLOCK_SIZE> counter_;
	std::array<std::byte, AES_BLOCK_SIZE> first_block_{};
	byte_vector mac_key_;
};

}

std::unique_ptr<packet_cipher> make_packet_cipher(std::string_view cipher, std::string_view mac,
	const_span key, const_span iv, const_span mac_key)
{
	auto c = find_cipher(cipher);
	if(!c || key.size() != c->key_size || iv.size() != c->iv_size) {
		return nullptr;
	}
	if(c->name == aes256_gcm_name) {
		return std::make_unique<aes_gcm_cipher>(key, iv);
	}

	auto m = find_mac(mac);
	if(!m || mac_key.size() != m->key_size) {
		return nullptr;
	}
	return std::make_unique<aes_ctr_hmac_cipher>(key, iv, mac_key);
}

}
