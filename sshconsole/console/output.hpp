#ifndef SSHCONSOLE_CONSOLE_OUTPUT_HEADER
#define SSHCONSOLE_CONSOLE_OUTPUT_HEADER

#include "callbacks.hpp"

#include <atomic>
#include <cstdint>
#include <string_view>

namespace sshconsole::ssh::console {

/// receiver of the output, lives on the connection's event loop
class output_target {
public:
	virtual ~output_target() = default;

	// data_type 0 is stdout, 1 stderr
	virtual void write_output(std::uint32_t data_type, std::string data) = 0;

	// flush, send exit status and close
	virtual void finish(std::uint32_t exit_status) = 0;
};

/** \brief Output of one command, shared by the channel and the command code
 *
 *  All calls can be made from any thread, the data is passed to the event loop of the connection.
 *  When the last holder lets go of it, the output is released.
 */
class output {
public:
	output(post_function post, std::weak_ptr<output_target> target);
	~output();

	output(output const&) = delete;
	output& operator=(output const&) = delete;

	/// send text to the client's standard output, end lines with "\r\n" for terminals
	void write(std::string_view text);

	/// send text to the client's standard error
	void write_error(std::string_view text);

	/// exit status sent before the channel is closed, defaults to 0
	void set_exit_status(std::uint32_t status);

	/// flush and close the channel, further calls and writes are ignored
	void release();

	bool released() const { return released_; }

private:
	void post_write(std::uint32_t data_type, std::string_view text);

	post_function post_;
	std::weak_ptr<output_target> target_;
	std::atomic<std::uint32_t> exit_status_{};
	std::atomic<bool> released_{};
};

}

#endif
