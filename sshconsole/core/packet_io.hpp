#ifndef SSHCONSOLE_CORE_PACKET_IO_HEADER
#define SSHCONSOLE_CORE_PACKET_IO_HEADER

#include "protocol.hpp"

#include "sshconsole/common/buffers.hpp"
#include "sshconsole/crypto/cipher.hpp"

#include <optional>

namespace sshconsole::ssh {

class random;

/** \brief Reads binary packets (RFC 4253 section 6) of one direction
 *
 *  Without cipher the packets are plain and there is no mac.
 */
class packet_reader {
public:
	enum class result {
		need_more,
		ready,
		failed
	};

	explicit packet_reader(std::uint32_t max_size = default_max_packet_size);

	/// reads at most one packet, the payload is set when ready is returned
	result read(in_buffer&, byte_vector& payload);

	/// used from the next packet on
	void set_cipher(std::unique_ptr<packet_cipher>);

	/// sequence number of the packet read last
	std::uint32_t sequence() const { return next_seq_ - 1; }

	/// bytes read since the cipher was set
	std::uint64_t bytes() const { return bytes_; }

	ssh_error_code error() const { return error_; }
	std::string const& error_message() const { return error_message_; }

private:
	result fail(ssh_error_code, std::string message);

	std::uint32_t const max_size_;
	std::unique_ptr<packet_cipher> cipher_;
	std::uint32_t next_seq_{};
	std::uint64_t bytes_{};

	// length of the packet whose head is already decrypted
	std::optional<std::uint32_t> length_;

	ssh_error_code error_{};
	std::string error_message_;
};

/// Writes binary packets of one direction to the out_buffer
class packet_writer {
public:
	packet_writer(out_buffer&, random&);

	void write(const_span payload);

	/// used from the next packet on
	void set_cipher(std::unique_ptr<packet_cipher>);

	/// bytes written since the cipher was set
	std::uint64_t bytes() const { return bytes_; }

	std::uint32_t next_sequence() const { return seq_; }

private:
	out_buffer& out_;
	random& rand_;
	std::unique_ptr<packet_cipher> cipher_;
	std::uint32_t seq_{};
	std::uint64_t bytes_{};
};

}

#endif
