#ifndef SSHCONSOLE_TEST_UTIL_HEADER
#define SSHCONSOLE_TEST_UTIL_HEADER

#include "sshconsole/common/buffers.hpp"
#include "sshconsole/common/logger.hpp"
#include "sshconsole/core/transport.hpp"

#include <deque>
#include <functional>

namespace sshconsole::ssh::test {

struct test_context {
	test_context(logger& l, std::string tag)
	: slog(l, tag)
	{
	}

	mutable session_logger slog;
	string_io_buffer out_buf;
};

/// functions posted to the event loop in the tests, run with run_posted()
struct post_queue {
	void post(std::function<void()> f) {
		queue.push_back(std::move(f));
	}

	// returns number of functions run
	std::size_t run_posted() {
		std::size_t count = 0;
		while(!queue.empty()) {
			auto f = std::move(queue.front());
			queue.pop_front();
			f();
			++count;
		}
		return count;
	}

	std::deque<std::function<void()>> queue;
};

/// process once, true if anything was read or written or the state changed
template<typename Side>
bool step(Side& side, string_io_buffer& in) {
	std::size_t in_size = in.size();
	std::size_t out_size = side.out_buf.size();
	transport_state state = side.state();
	side.process(in);
	return in.size() != in_size || side.out_buf.size() != out_size || side.state() != state;
}

/** \brief Run client and server until neither makes progress
 *
 *  A disconnected side stops, but the other side still reads what is left for it,
 *  so the client sees the server's disconnect message.
 */
template<typename Client, typename Server>
bool run(Client& client, Server& server) {
	bool progress = true;
	while(progress) {
		progress = step(client, server.out_buf);
		progress = step(server, client.out_buf) || progress;
	}
	return client.error() == ssh_noerror && server.error() == ssh_noerror;
}

}

#endif
