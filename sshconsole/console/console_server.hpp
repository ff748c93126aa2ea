#ifndef SSHCONSOLE_CONSOLE_SERVER_HEADER
#define SSHCONSOLE_CONSOLE_SERVER_HEADER

#include "console_config.hpp"
#include "console_transport.hpp"

#include "sshconsole/crypto/random.hpp"

#include <asio.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sshconsole::ssh::console {

class console_session;

enum class server_state {
	created,
	listening,
	stopped
};
std::string_view to_string(server_state);

/** \brief SSH server that runs single command per session channel
 *
 *  The connections are handled in an event loop thread started by listen(). The authentication
 *  delegates and the command runner are called in that thread.
 */
class console_server {
public:
	/// throws std::invalid_argument if there are no host keys or the port is not valid
	console_server(console_config, logger&, random& = system_random());
	~console_server();

	console_server(console_server const&) = delete;
	console_server& operator=(console_server const&) = delete;

	/// bind and start accepting connections, throws std::system_error if binding fails and std::logic_error if called twice
	void listen();

	/// close the listener and all connections, returns false if already stopped
	/// when called from the event loop thread, does not wait for the thread to finish (see wait())
	bool stop();

	/// wait until the event loop thread has finished
	void wait();

	server_state state() const;

	/// the bound port, valid after listen()
	std::uint16_t local_port() const;

	/// number of connections not yet closed
	std::size_t connection_count() const;

	console_config const& config() const { return config_; }

private:
	void create_ssh_config();
	asio::awaitable<void> accept_loop();
	void start_session(asio::ip::tcp::socket socket);
	void forget_finished();
	void close_all();
	void wait_sessions(std::chrono::steady_clock::time_point deadline);

private:
	console_config const config_;
	logger& log_;
	random& rand_;

	server_config ssh_config_;
	console_callbacks callbacks_;

	asio::io_context io_;
	asio::ip::tcp::acceptor acceptor_;
	asio::steady_timer shutdown_timer_;
	std::thread thread_;

	mutable std::mutex mutex_;
	server_state state_{server_state::created};
	std::uint16_t local_port_{};

	// modified only from the event loop, under mutex_
	std::map<std::uint64_t, std::weak_ptr<console_session>> sessions_;
	std::uint64_t session_counter_{};
};

}

#endif
