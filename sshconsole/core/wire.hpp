#ifndef SSHCONSOLE_CORE_WIRE_HEADER
#define SSHCONSOLE_CORE_WIRE_HEADER

#include "sshconsole/common/types.hpp"

namespace sshconsole::ssh {

/** \brief Reads the SSH data types (RFC 4251 section 5) from a payload
 *
 *  Once a read runs past the end, the reader stays failed and every further read returns an empty value.
 *  The returned views point into the payload.
 */
class wire_reader {
public:
	explicit wire_reader(const_span data)
	: data_(data)
	{}

	std::uint8_t read_byte();
	bool read_bool();
	std::uint32_t read_uint32();
	const_span read_blob();
	std::string_view read_string() { return to_string_view(read_blob()); }
	const_span read_bytes(std::size_t n);

	/// everything not read yet
	const_span rest();

	bool ok() const { return ok_; }
	bool at_end() const { return ok_ && pos_ == data_.size(); }

	explicit operator bool() const { return ok_; }

private:
	const_span data_;
	std::size_t pos_{};
	bool ok_{true};
};

class wire_writer {
public:
	wire_writer() = default;
	explicit wire_writer(std::uint8_t msg) { add_byte(msg); }

	wire_writer& add_byte(std::uint8_t);
	wire_writer& add_bool(bool);
	wire_writer& add_uint32(std::uint32_t);
	wire_writer& add_blob(const_span);
	wire_writer& add_string(std::string_view s) { return add_blob(to_span(s)); }
	/// big endian unsigned integer, leading zeros are removed and zero byte added if the high bit is set
	wire_writer& add_mpint(const_span);
	wire_writer& add_raw(const_span);

	byte_vector const& data() const { return data_; }
	byte_vector take() { return std::move(data_); }

private:
	byte_vector data_;
};

}

#endif
