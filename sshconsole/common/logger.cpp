#include "logger.hpp"

#include <cstdio>

namespace sshconsole::ssh {

void stdout_logger::write_line(type t, std::string const& line) {
	std::lock_guard lock(mutex_);
	std::FILE* f = t == error ? stderr : stdout;
	std::fwrite(line.data(), 1, line.size(), f);
	std::fputc('\n', f);
	std::fflush(f);
}

session_logger::session_logger(logger& parent, std::string tag)
: parent_(parent)
, tag_(std::move(tag))
{
}

void session_logger::write_line(type t, std::string const& line) {
	parent_.log_line(t, tag_ + line);
}

}
