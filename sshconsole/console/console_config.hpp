#ifndef SSHCONSOLE_CONSOLE_CONFIG_HEADER
#define SSHCONSOLE_CONSOLE_CONFIG_HEADER

#include "callbacks.hpp"
#include "keys.hpp"

#include <vector>

namespace sshconsole::ssh::console {

/// Configuration of the console server, not changed after the server is listening
struct console_config {
	// address to bind
	std::string host{"0.0.0.0"};
	// port to bind, 0 picks free port
	int port{2222};

	// host keys, at least one is required
	std::vector<host_key> host_keys;

	// authentication delegates, the methods without delegate are not offered
	password_authenticator password;
	public_key_authenticator public_key;

	// runs the exec request of a session channel
	command_runner runner;

	// how many failed authentication attempts are allowed per connection
	std::size_t auth_tries{5};
	// sent to the client before authentication if not empty
	std::string banner;
	// software name in the version exchange
	std::string software{"sshconsole_0.1"};
};

}

#endif
