#ifndef SSHCONSOLE_COMMON_LOGGER_HEADER
#define SSHCONSOLE_COMMON_LOGGER_HEADER

#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace sshconsole::ssh {

namespace detail {

inline void format_args(std::ostringstream& out, std::string_view fmt) {
	out << fmt;
}

// each {} takes the next argument, extra arguments are dropped
template<typename T, typename... Rest>
void format_args(std::ostringstream& out, std::string_view fmt, T const& value, Rest const&... rest) {
	auto pos = fmt.find("{}");
	if(pos == std::string_view::npos) {
		out << fmt;
		return;
	}
	out << fmt.substr(0, pos) << value;
	format_args(out, fmt.substr(pos + 2), rest...);
}

}

template<typename... Args>
std::string format_message(std::string_view fmt, Args const&... args) {
	std::ostringstream out;
	out << std::boolalpha;
	detail::format_args(out, fmt, args...);
	return out.str();
}

class logger {
public:
	enum type {
		error = 0x1,
		info  = 0x2,
		debug = 0x4,
		trace = 0x8,

		log_none = 0,
		log_all = error | info | debug | trace
	};

	explicit logger(type level = log_all)
	: level_(level)
	{}

	virtual ~logger() = default;

	logger(logger const&) = delete;
	logger& operator=(logger const&) = delete;

	template<typename... Args>
	void log(type t, std::string_view fmt, Args const&... args) {
		if(enabled(t)) {
			write_line(t, format_message(fmt, args...));
		}
	}

	/// writes already formatted line if the level allows it
	void log_line(type t, std::string const& line) {
		if(enabled(t)) {
			write_line(t, line);
		}
	}

	bool enabled(type t) const {
		return (level_ & t) != 0;
	}

	void set_level(type t) {
		level_ = t;
	}

protected:
	virtual void write_line(type, std::string const&) = 0;

private:
	type level_;
};

/// errors go to stderr and the rest to stdout, lines from different threads are not mixed
class stdout_logger : public logger {
public:
	using logger::logger;

protected:
	void write_line(type, std::string const&) override;

private:
	std::mutex mutex_;
};

/// adds tag in front of every line and passes it to the parent logger
class session_logger : public logger {
public:
	session_logger(logger& parent, std::string tag);

protected:
	void write_line(type, std::string const&) override;

private:
	logger& parent_;
	std::string tag_;
};

}

#endif
