#ifndef SSHCONSOLE_CRYPTO_CIPHER_HEADER
#define SSHCONSOLE_CRYPTO_CIPHER_HEADER

#include "sshconsole/common/types.hpp"

#include <memory>
#include <optional>

namespace sshconsole::ssh {

struct cipher_info {
	std::string_view name;
	std::size_t key_size;
	std::size_t iv_size;
	// authenticated, no separate mac is used
	bool aead;
};

struct mac_info {
	std::string_view name;
	std::size_t key_size;
};

std::optional<cipher_info> find_cipher(std::string_view name);
std::optional<mac_info> find_mac(std::string_view name);

/** \brief Encryption and authentication of the binary packets of one direction
 *
 *  The packet on the wire is the 4 byte length, the encrypted padding length, payload and padding, and the tag.
 *  Decryption is done in two steps, the head of the packet is decrypted first to get the length.
 */
class packet_cipher {
public:
	virtual ~packet_cipher() = default;

	packet_cipher(packet_cipher const&) = delete;
	packet_cipher& operator=(packet_cipher const&) = delete;

	std::size_t block_size() const { return block_size_; }

	/// authentication bytes after each packet
	std::size_t tag_size() const { return tag_size_; }

	/// how many bytes are needed to get the packet length
	std::size_t head_size() const { return head_size_; }

	/// the length field is sent in clear and is not counted in the padding
	bool clear_length() const { return clear_length_; }

	/// returns the packet length from the first head_size() bytes
	virtual std::uint32_t decrypt_length(std::uint32_t seq, const_span head) = 0;

	/** \brief Decrypts and authenticates packet whose length was returned by decrypt_length
	 *
	 *  in is the whole packet including the length field and tag, out gets the packet length bytes after the length field.
	 *  Returns false if the authentication fails.
	 */
	virtual bool decrypt(std::uint32_t seq, const_span in, span out) = 0;

	/// in is the plain packet with the length field, out has room for in and the tag
	virtual void encrypt(std::uint32_t seq, const_span in, span out) = 0;

protected:
	packet_cipher(std::size_t block, std::size_t tag, std::size_t head, bool clear_length)
	: block_size_(block)
	, tag_size_(tag)
	, head_size_(head)
	, clear_length_(clear_length)
	{}

private:
	std::size_t const block_size_;
	std::size_t const tag_size_;
	std::size_t const head_size_;
	bool const clear_length_;
};

/// nullptr if the algorithms are not supported or the key material has wrong size, mac is not used for aead ciphers
std::unique_ptr<packet_cipher> make_packet_cipher(std::string_view cipher, std::string_view mac,
	const_span key, const_span iv, const_span mac_key);

}

#endif
