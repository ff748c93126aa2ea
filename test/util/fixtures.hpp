#ifndef SSHCONSOLE_TEST_UTIL_FIXTURES_HEADER
#define SSHCONSOLE_TEST_UTIL_FIXTURES_HEADER

#include "test_client.hpp"
#include "configs.hpp"
#include "log.hpp"
#include "util.hpp"

#include "sshconsole/console/command_handler.hpp"
#include "sshconsole/console/console_transport.hpp"
#include "sshconsole/console/output.hpp"

namespace sshconsole::ssh::test {

struct test_client : test_context, transport_config, test_ssh_client {
	test_client(logger& l, transport_config c = test_client_config(), channel_config cc = {})
	: test_context(l, "[client] ")
	, transport_config{std::move(c)}
	, test_ssh_client(*this, slog, out_buf, system_random(), cc)
	{
		side = transport_side::client;
	}
};

struct test_callbacks {
	console::console_callbacks callbacks;
};

struct test_server : test_context, server_config, test_callbacks, post_queue, console::console_transport {
	test_server(logger& l, server_config c = test_server_config())
	: test_context(l, "[server] ")
	, server_config{std::move(c)}
	, console_transport(*this, callbacks, slog, l, out_buf, system_random())
	{
		side = transport_side::server;
		set_post_function([this](std::function<void()> f) { post(std::move(f)); });
	}

	void set_password(std::string user, std::string password) {
		callbacks.auth.password = [=](std::string const& u, std::string const& p, console::auth_completion done) {
			done(u == user && p == password);
		};
	}

	bool user_authenticated() const {
		return ssh_server::auth() && ssh_server::auth()->succeeded();
	}

	// the server side of a session channel, null if it does not exist
	console::command_handler* find_handler(std::uint32_t id) const {
		return connection() ? dynamic_cast<console::command_handler*>(connection()->find_channel(id)) : nullptr;
	}
};

/// client and server that run the key exchange and authentication with password "test"/"secret"
struct console_fixture {
	console_fixture(server_config sc = test_server_config(), transport_config cc = test_client_config(), channel_config client_channels = {})
	: server(test_log(), std::move(sc))
	, client(test_log(), std::move(cc), client_channels)
	{
		server.set_password("test", "secret");
	}

	// run until nothing happens, also running everything posted to the server
	bool run_all() {
		bool ok = run(client, server);
		while(ok && server.run_posted()) {
			ok = run(client, server);
		}
		return ok;
	}

	bool login() {
		if(!run_all() || !client.service_accepted) {
			return false;
		}
		client.send_password_auth("test", "secret");
		return run_all() && client.authenticated;
	}

	std::shared_ptr<test_session> open_session() {
		auto ch = client.open_channel();
		if(ch) {
			run_all();
		}
		return ch;
	}

	test_server server;
	test_client client;
};

}

#endif
