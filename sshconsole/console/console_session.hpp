#ifndef SSHCONSOLE_CONSOLE_SESSION_HEADER
#define SSHCONSOLE_CONSOLE_SESSION_HEADER

#include "console_transport.hpp"

#include "sshconsole/common/buffers.hpp"

#include <asio.hpp>

#include <functional>
#include <memory>

namespace sshconsole::ssh::console {

/** \brief One accepted connection, drives the console transport with the socket
 *
 *  Everything runs on the event loop of the socket, errors close only this connection.
 */
class console_session : public std::enable_shared_from_this<console_session> {
public:
	console_session(asio::ip::tcp::socket socket, server_config const&, console_callbacks const&, logger& base_log, random&, std::string tag);
	~console_session();

	void start();

	/// send disconnect and close after the pending output is written
	void shutdown();

	/// close the connection immediately
	void stop();

	bool is_open() const { return socket_.is_open(); }

private:
	void server_process();
	void run_posted(std::function<void()> const& f);
	asio::awaitable<void> reader();
	asio::awaitable<void> writer();

	asio::ip::tcp::socket socket_;
	asio::steady_timer timer_;

	string_in_buffer in_buf_;
	string_out_buffer out_buf_;

	session_logger log_;
	console_transport server_;
	bool closing_{};
};

}

#endif
