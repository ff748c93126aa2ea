#include "crypto.hpp"
#include "util/fixtures.hpp"

#include "sshconsole/console/auth_delegate.hpp"
#include "sshconsole/console/keys.hpp"

#include <algorithm>
#include <thread>

#include <catch2/catch.hpp>

/* Tested:
	+ none request to get methods, advertised methods follow the delegates
	+ password with sync and async completion
	+ wrong password
	+ public key query gets pk_ok without calling the delegate
	+ public key with sync and async completion
	+ bad signature is not given to the delegate
	+ no delegate for the method
	+ unsupported methods
	+ completion called twice
	+ num of tries
	+ banner only once
	+ running out of tries disconnects
*/

namespace sshconsole::ssh::test {
namespace {

using console::auth_completion;
using console::public_key_credential;

struct auth_fixture {
	auth_fixture(server_config sc = test_server_config())
	: server(test_log(), std::move(sc))
	, client(test_log())
	{
	}

	bool start() {
		return run(client, server) && client.service_accepted;
	}

	bool run_all() {
		bool ok = run(client, server);
		while(ok && server.run_posted()) {
			ok = run(client, server);
		}
		return ok;
	}

	test_server server;
	test_client client;
};

bool has_method(std::vector<std::string> const& methods, std::string_view m) {
	return std::find(methods.begin(), methods.end(), m) != methods.end();
}

}

TEST_CASE("auth methods follow delegates", "[unit][auth]") {
	SECTION("password only") {
		auth_fixture f;
		f.server.set_password("test", "secret");
		REQUIRE(f.start());
		f.client.send_none_auth("test");
		CHECK(f.run_all());
		CHECK(f.client.auth_failures == 1);
		CHECK(f.client.last_methods == std::vector<std::string>{"password"});
	}
	SECTION("public key only") {
		auth_fixture f;
		f.server.callbacks.auth.public_key = [](std::string const&, public_key_credential const&, auth_completion done) { done(true); };
		REQUIRE(f.start());
		f.client.send_none_auth("test");
		CHECK(f.run_all());
		CHECK(f.client.last_methods == std::vector<std::string>{"publickey"});
	}
	SECTION("both") {
		auth_fixture f;
		f.server.set_password("test", "secret");
		f.server.callbacks.auth.public_key = [](std::string const&, public_key_credential const&, auth_completion done) { done(true); };
		REQUIRE(f.start());
		f.client.send_none_auth("test");
		CHECK(f.run_all());
		CHECK(f.client.last_methods.size() == 2);
		CHECK(has_method(f.client.last_methods, "password"));
		CHECK(has_method(f.client.last_methods, "publickey"));
	}
	SECTION("none") {
		auth_fixture f;
		REQUIRE(f.start());
		f.client.send_none_auth("test");
		CHECK(f.run_all());
		CHECK(f.client.last_methods.empty());
		// none request does not use tries
		CHECK(f.server.state() == transport_state::transport);
	}
}

TEST_CASE("password auth", "[unit][auth]") {
	auth_fixture f;
	std::vector<std::string> calls;
	f.server.callbacks.auth.password = [&](std::string const& u, std::string const& p, auth_completion done) {
		calls.push_back(u + ":" + p);
		done(u == "test" && p == "secret");
	};
	REQUIRE(f.start());

	f.client.send_password_auth("test", "wrong");
	CHECK(f.run_all());
	CHECK(f.client.auth_failures == 1);
	CHECK(!f.client.authenticated);
	CHECK(!f.server.user_authenticated());

	f.client.send_password_auth("test", "secret");
	CHECK(f.run_all());
	CHECK(f.client.authenticated);
	CHECK(f.server.user_authenticated());
	CHECK(f.server.user() == "test");
	CHECK(calls == std::vector<std::string>{"test:wrong", "test:secret"});
}

TEST_CASE("async password auth", "[unit][auth]") {
	auth_fixture f;
	std::optional<auth_completion> pending;
	int calls = 0;
	f.server.callbacks.auth.password = [&](std::string const&, std::string const&, auth_completion done) {
		++calls;
		pending = done;
	};
	REQUIRE(f.start());

	f.client.send_password_auth("test", "secret");
	CHECK(f.run_all());
	REQUIRE(pending);
	CHECK(calls == 1);
	CHECK(!f.client.authenticated);

	// re-processing the pending packet does not call the delegate again
	CHECK(f.run_all());
	CHECK(calls == 1);

	CHECK((*pending)(true));
	CHECK(f.run_all());
	CHECK(calls == 1);
	CHECK(f.client.authenticated);
	CHECK(f.server.user() == "test");
}

TEST_CASE("completion called twice", "[unit][auth]") {
	auth_fixture f;
	std::optional<auth_completion> pending;
	f.server.callbacks.auth.password = [&](std::string const&, std::string const&, auth_completion done) {
		pending = done;
	};
	REQUIRE(f.start());

	f.client.send_password_auth("test", "secret");
	CHECK(f.run_all());
	REQUIRE(pending);

	CHECK((*pending)(false));
	// first result stands
	CHECK(!(*pending)(true));
	CHECK(f.run_all());
	CHECK(!f.client.authenticated);
	CHECK(f.client.auth_failures == 1);
}

TEST_CASE("public key auth", "[unit][auth]") {
	auth_fixture f;
	auto user_key = test_user_private_key();
	std::string const authorized = public_key_credential(ssh_public_key_of(user_key)).to_string() + " test@host\n";

	int calls = 0;
	f.server.callbacks.auth.public_key = [&](std::string const& u, public_key_credential const& key, auth_completion done) {
		++calls;
		done(u == "test" && key.is_authorized(authorized));
	};
	REQUIRE(f.start());

	SECTION("query") {
		f.client.send_pk_query("test", user_key);
		CHECK(f.run_all());
		CHECK(f.client.pk_oks == 1);
		CHECK(calls == 0);
		CHECK(!f.client.authenticated);
	}
	SECTION("signed") {
		f.client.send_pk_auth("test", user_key);
		CHECK(f.run_all());
		CHECK(calls == 1);
		CHECK(f.client.authenticated);
		CHECK(f.server.user() == "test");
	}
	SECTION("not authorized") {
		auto other = test_host_private_key();
		f.client.send_pk_auth("test", other);
		CHECK(f.run_all());
		CHECK(calls == 1);
		CHECK(!f.client.authenticated);
		CHECK(f.client.auth_failures == 1);
	}
	SECTION("bad signature") {
		auto other = test_host_private_key();
		f.client.send_bad_pk_auth("test", user_key, other);
		CHECK(f.run_all());
		CHECK(calls == 0);
		CHECK(!f.client.authenticated);
		CHECK(f.client.auth_failures == 1);
	}
}

TEST_CASE("async public key auth", "[unit][auth]") {
	auth_fixture f;
	auto user_key = test_user_private_key();
	std::optional<auth_completion> pending;
	f.server.callbacks.auth.public_key = [&](std::string const&, public_key_credential const&, auth_completion done) {
		pending = done;
	};
	REQUIRE(f.start());

	f.client.send_pk_auth("test", user_key);
	CHECK(f.run_all());
	REQUIRE(pending);
	CHECK(!f.client.authenticated);

	// completing from another thread
	std::thread t([&]{ (*pending)(true); });
	t.join();

	CHECK(f.run_all());
	CHECK(f.client.authenticated);
}

TEST_CASE("auth method without delegate", "[unit][auth]") {
	auth_fixture f;
	int calls = 0;
	f.server.callbacks.auth.password = [&](std::string const&, std::string const&, auth_completion done) {
		++calls;
		done(true);
	};
	REQUIRE(f.start());

	auto user_key = test_user_private_key();
	f.client.send_pk_auth("test", user_key);
	CHECK(f.run_all());
	CHECK(!f.client.authenticated);
	CHECK(f.client.auth_failures == 1);
	CHECK(calls == 0);
}

TEST_CASE("unsupported auth methods", "[unit][auth]") {
	auth_fixture f;
	f.server.set_password("test", "secret");
	REQUIRE(f.start());

	f.client.send_method_auth("test", "hostbased");
	f.client.send_method_auth("test", "keyboard-interactive");
	f.client.send_method_auth("test", "something");
	CHECK(f.run_all());
	CHECK(f.client.auth_failures == 3);
	CHECK(!f.client.authenticated);

	f.client.send_password_auth("test", "secret");
	CHECK(f.run_all());
	CHECK(f.client.authenticated);
}

TEST_CASE("auth num of tries", "[unit][auth]") {
	server_config sc = test_server_config();
	sc.auth.num_of_tries = 3;
	auth_fixture f(std::move(sc));
	f.server.set_password("test", "secret");
	REQUIRE(f.start());

	f.client.send_password_auth("test", "a");
	f.client.send_password_auth("test", "b");
	CHECK(f.run_all());
	CHECK(f.client.auth_failures == 2);
	CHECK(f.server.state() == transport_state::transport);

	f.client.send_password_auth("test", "c");
	// running out of tries is a normal disconnect, not an error
	CHECK(f.run_all());
	CHECK(f.server.state() == transport_state::disconnected);
	CHECK(f.server.error() == ssh_noerror);
	CHECK(f.client.state() == transport_state::disconnected);
	CHECK(f.client.auth_failures == 2);
	CHECK(!f.client.authenticated);
}

TEST_CASE("auth banner", "[unit][auth]") {
	server_config sc = test_server_config();
	sc.auth.banner = "Welcome to console\r\n";
	auth_fixture f(std::move(sc));
	f.server.set_password("test", "secret");
	REQUIRE(f.start());
	CHECK(f.client.banner.empty());

	// sent before the reply to the first request
	f.client.send_none_auth("test");
	CHECK(f.run_all());
	CHECK(f.client.banner == "Welcome to console\r\n");

	f.client.banner.clear();
	f.client.send_password_auth("test", "secret");
	CHECK(f.run_all());
	CHECK(f.client.authenticated);
	CHECK(f.client.banner.empty());
}

}
