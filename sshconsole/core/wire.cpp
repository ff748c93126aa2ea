#include "wire.hpp"

namespace sshconsole::ssh {

const_span wire_reader::read_bytes(std::size_t n) {
	if(!ok_ || data_.size() - pos_ < n) {
		ok_ = false;
		return {};
	}
	const_span res = data_.subspan(pos_, n);
	pos_ += n;
	return res;
}

std::uint8_t wire_reader::read_byte() {
	const_span s = read_bytes(1);
	return ok_ ? std::uint8_t(s[0]) : 0;
}

bool wire_reader::read_bool() {
	return read_byte() != 0;
}

std::uint32_t wire_reader::read_uint32() {
	const_span s = read_bytes(4);
	return ok_ ? load_be32(s) : 0;
}

const_span wire_reader::read_blob() {
	std::uint32_t len = read_uint32();
	return read_bytes(len);
}

const_span wire_reader::rest() {
	if(!ok_) {
		return {};
	}
	const_span res = data_.subspan(pos_);
	pos_ = data_.size();
	return res;
}

wire_writer& wire_writer::add_byte(std::uint8_t b) {
	data_.push_back(std::byte(b));
	return *this;
}

wire_writer& wire_writer::add_bool(bool b) {
	return add_byte(b ? 1 : 0);
}

wire_writer& wire_writer::add_uint32(std::uint32_t v) {
	std::size_t pos = data_.size();
	data_.resize(pos + 4);
	store_be32(span(data_).subspan(pos), v);
	return *this;
}

wire_writer& wire_writer::add_blob(const_span s) {
	add_uint32(std::uint32_t(s.size()));
	return add_raw(s);
}

wire_writer& wire_writer::add_mpint(const_span s) {
	while(!s.empty() && s[0] == std::byte{}) {
		s = s.subspan(1);
	}
	bool high_bit = !s.empty() && (std::uint8_t(s[0]) & 0x80);
	add_uint32(std::uint32_t(s.size() + (high_bit ? 1 : 0)));
	if(high_bit) {
		add_byte(0);
	}
	return add_raw(s);
}

wire_writer& wire_writer::add_raw(const_span s) {
	data_.insert(data_.end(), s.begin(), s.end());
	return *this;
}

}
