#ifndef SSHCONSOLE_COMMON_BUFFERS_HEADER
#define SSHCONSOLE_COMMON_BUFFERS_HEADER

#include "types.hpp"

namespace sshconsole::ssh {

/// Bytes received from the peer, the reader consumes what it has parsed
class in_buffer {
public:
	virtual ~in_buffer() = default;

	/// unconsumed bytes, the span is invalidated by consume()
	virtual const_span data() const = 0;
	virtual void consume(std::size_t) = 0;
};

/// Bytes waiting to be sent to the peer
class out_buffer {
public:
	virtual ~out_buffer() = default;

	virtual void append(const_span) = 0;
};

class string_in_buffer : public in_buffer {
public:
	string_in_buffer() = default;
	explicit string_in_buffer(std::string s) : buf_(std::move(s)) {}

	const_span data() const override { return to_span(buf_); }

	void consume(std::size_t n) override {
		buf_.erase(0, n);
	}

	void add(std::string_view s) { buf_.append(s); }

	std::size_t size() const { return buf_.size(); }
	bool empty() const { return buf_.empty(); }

private:
	std::string buf_;
};

class string_out_buffer : public out_buffer {
public:
	void append(const_span s) override {
		buf_.append(to_string_view(s));
	}

	std::size_t size() const { return buf_.size(); }
	bool empty() const { return buf_.empty(); }
	std::string const& data() const { return buf_; }

	/// removes and returns everything written so far
	std::string take() {
		std::string res;
		res.swap(buf_);
		return res;
	}

private:
	std::string buf_;
};

/// out_buffer of one side is the in_buffer of the other side in tests and local pipes
class string_io_buffer : public in_buffer, public out_buffer {
public:
	const_span data() const override { return to_span(buf_); }
	void consume(std::size_t n) override { buf_.erase(0, n); }
	void append(const_span s) override { buf_.append(to_string_view(s)); }

	std::size_t size() const { return buf_.size(); }
	bool empty() const { return buf_.empty(); }

	std::string take() {
		std::string res;
		res.swap(buf_);
		return res;
	}

private:
	std::string buf_;
};

}

#endif
