#include "packet_io.hpp"
#include "wire.hpp"

#include "sshconsole/crypto/random.hpp"

#include <algorithm>

namespace sshconsole::ssh {

// block size used for padding when there is no cipher
std::size_t const plain_block_size = 8;
std::size_t const min_padding = 4;
std::size_t const packet_length_size = 4;

packet_reader::packet_reader(std::uint32_t max_size)
: max_size_(max_size)
{
}

void packet_reader::set_cipher(std::unique_ptr<packet_cipher> c) {
	cipher_ = std::move(c);
	bytes_ = 0;
}

packet_reader::result packet_reader::fail(ssh_error_code code, std::string message) {
	error_ = code;
	error_message_ = std::move(message);
	return result::failed;
}

packet_reader::result packet_reader::read(in_buffer& in, byte_vector& payload) {
	if(error_) {
		return result::failed;
	}

	const_span data = in.data();
	if(!length_) {
		std::size_t head = cipher_ ? cipher_->head_size() : packet_length_size;
		if(data.size() < head) {
			return result::need_more;
		}
		std::uint32_t len = cipher_ ? cipher_->decrypt_length(next_seq_, data.first(head)) : load_be32(data);
		if(len > max_size_ || len < min_padding + 1) {
			return fail(ssh_protocol_error, "invalid packet length " + std::to_string(len));
		}

		std::size_t block = cipher_ ? std::max(cipher_->block_size(), plain_block_size) : plain_block_size;
		std::size_t aligned = cipher_ && cipher_->clear_length() ? len : len + packet_length_size;
		if(aligned % block != 0) {
			return fail(ssh_protocol_error, "packet length " + std::to_string(len) + " not multiple of block size");
		}
		length_ = len;
	}

	std::size_t total = packet_length_size + *length_ + (cipher_ ? cipher_->tag_size() : 0);
	if(data.size() < total) {
		return result::need_more;
	}

	byte_vector plain(*length_);
	if(cipher_) {
		if(!cipher_->decrypt(next_seq_, data.first(total), plain)) {
			return fail(ssh_mac_error, "packet authentication failed");
		}
	} else {
		const_span body = data.subspan(packet_length_size, *length_);
		std::copy(body.begin(), body.end(), plain.begin());
	}

	in.consume(total);
	length_.reset();
	++next_seq_;
	bytes_ += total;

	std::size_t padding = std::uint8_t(plain[0]);
	if(padding < min_padding || padding + 1 >= plain.size()) {
		return fail(ssh_protocol_error, "invalid padding length " + std::to_string(padding));
	}

	payload.assign(plain.begin() + 1, plain.end() - padding);
	return result::ready;
}

packet_writer::packet_writer(out_buffer& out, random& rand)
: out_(out)
, rand_(rand)
{
}

void packet_writer::set_cipher(std::unique_ptr<packet_cipher> c) {
	cipher_ = std::move(c);
	bytes_ = 0;
}

void packet_writer::write(const_span payload) {
	std::size_t block = cipher_ ? std::max(cipher_->block_size(), plain_block_size) : plain_block_size;
	std::size_t used = 1 + payload.size() + (cipher_ && cipher_->clear_length() ? 0 : packet_length_size);
	std::size_t padding = block - used % block;
	if(padding < min_padding) {
		padding += block;
	}

	byte_vector packet = wire_writer()
		.add_uint32(std::uint32_t(1 + payload.size() + padding))
		.add_byte(std::uint8_t(padding))
		.add_raw(payload)
		.add_raw(rand_.bytes(padding))
		.take();

	if(cipher_) {
		byte_vector enc(packet.size() + cipher_->tag_size());
		cipher_->encrypt(seq_, packet, enc);
		out_.append(enc);
		bytes_ += enc.size();
	} else {
		out_.append(packet);
		bytes_ += packet.size();
	}
	++seq_;
}

}
