#ifndef SSHCONSOLE_CONSOLE_TRANSPORT_HEADER
#define SSHCONSOLE_CONSOLE_TRANSPORT_HEADER

#include "auth_delegate.hpp"
#include "callbacks.hpp"

#include "sshconsole/core/ssh_server.hpp"

namespace sshconsole::ssh::console {

struct console_callbacks {
	auth_delegates auth;
	command_runner runner;
};

/** \brief SSH server transport of one console connection
 *
 *  Authenticates with the delegates and accepts only session channels, which are run by command_handler.
 */
class console_transport : public ssh_server {
public:
	/// base_log must outlive the connection and any authentication completions issued by it
	console_transport(server_config const&, console_callbacks const&, logger& log, logger& base_log, out_buffer&, random&);

	/// used to get back to the connection's event loop, must be set before processing
	void set_post_function(post_function);

	/// authenticated user name, empty before authentication
	std::string const& user() const { return user_; }

protected:
	std::unique_ptr<server_auth> construct_auth() override;
	std::unique_ptr<ssh_connection> construct_connection(auth_context const&) override;

private:
	console_callbacks const& callbacks_;
	logger& base_log_;
	post_function post_;
	std::string user_;
};

}

#endif
