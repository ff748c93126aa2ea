#include "configs.hpp"
#include "util.hpp"
#include "util/fixtures.hpp"

#include "sshconsole/core/protocol.hpp"
#include "sshconsole/core/wire.hpp"

#include <catch2/catch.hpp>
#include <algorithm>

namespace sshconsole::ssh::test {

static void send_ignore(ssh_transport& t, std::size_t size) {
	t.send_payload(wire_writer(ssh_ignore).add_string(std::string(size, 'i')).take());
}

TEST_CASE("ssh test", "[unit]") {
	console_fixture f;

	CHECK(f.run_all());

	CHECK(f.client.state() == transport_state::transport);
	CHECK(f.server.state() == transport_state::transport);
	CHECK(f.client.service_accepted);
	CHECK(f.client.peer_version() == "SSH-2.0-sshconsole_0.1");
	CHECK(f.server.peer_version() == "SSH-2.0-sshconsole_test_client");
	CHECK(!f.client.session_id().empty());
	CHECK(std::equal(f.client.session_id().begin(), f.client.session_id().end(),
		f.server.session_id().begin(), f.server.session_id().end()));

	CHECK(f.login());
	CHECK(f.server.user_authenticated());

	send_ignore(f.client, 10);
	send_ignore(f.server, 25);
	CHECK(f.run_all());
	CHECK(f.client.state() == transport_state::transport);
	CHECK(f.server.state() == transport_state::transport);
}

TEST_CASE("ssh test aes ctr", "[unit]") {
	console_fixture f(test_server_aes_ctr_config(), test_client_aes_ctr_config());

	CHECK(f.login());

	CHECK(f.client.state() == transport_state::transport);
	CHECK(f.server.state() == transport_state::transport);

	send_ignore(f.client, 10);
	send_ignore(f.server, 25);
	CHECK(f.run_all());
}

TEST_CASE("ssh test rekey", "[unit]") {
	console_fixture f;
	REQUIRE(f.login());

	SECTION("client starts") {
		f.client.start_rekey();
	}
	SECTION("server starts") {
		f.server.start_rekey();
	}
	SECTION("both start") {
		f.client.start_rekey();
		f.server.start_rekey();
	}
	CHECK(f.run_all());
	CHECK(!f.client.kex_running());
	CHECK(!f.server.kex_running());

	// the new keys work
	auto ch = f.open_session();
	REQUIRE(ch);
	CHECK(ch->state() == channel_state::established);
}

TEST_CASE("ssh test rekey after byte limit", "[unit]") {
	server_config s = test_server_config();
	s.rekey_bytes = 4096;
	console_fixture f(std::move(s));
	REQUIRE(f.login());

	send_ignore(f.client, 5000);
	CHECK(f.run_all());
	CHECK(!f.server.kex_running());
	CHECK(f.server.state() == transport_state::transport);
}

TEST_CASE("ssh failing version exchange", "[unit]") {
	test_server server(test_log());

	string_io_buffer in;
	in.append(to_span("SSH-1.0-old\r\n"));
	CHECK(server.process(in) == transport_op::disconnected);
	CHECK(server.error() == ssh_protocol_version_not_supported);

	SECTION("no software version") {
		test_server other(test_log());
		string_io_buffer in2;
		in2.append(to_span("SSH-2.0-\r\n"));
		CHECK(other.process(in2) == transport_op::disconnected);
		CHECK(other.error() == ssh_protocol_error);
	}
	SECTION("server does not accept other lines") {
		test_server other(test_log());
		string_io_buffer in2;
		in2.append(to_span("hello\r\nSSH-2.0-client\r\n"));
		CHECK(other.process(in2) == transport_op::disconnected);
		CHECK(other.error() == ssh_protocol_error);
	}
}

TEST_CASE("ssh client skips lines before version", "[unit]") {
	console_fixture f;
	f.server.out_buf.append(to_span("Welcome\r\nsome banner line\r\n"));
	CHECK(f.run_all());
	CHECK(f.client.service_accepted);
	CHECK(f.client.peer_version() == "SSH-2.0-sshconsole_0.1");
}

TEST_CASE("ssh no kex", "[unit]") {
	// no common cipher
	console_fixture f(test_server_aes_ctr_config(), test_client_config());

	CHECK(!f.run_all());

	CHECK(f.client.state() == transport_state::disconnected);
	CHECK(f.server.state() == transport_state::disconnected);

	CHECK(f.client.error() == ssh_key_exchange_failed);
	CHECK(f.server.error() == ssh_key_exchange_failed);
}

TEST_CASE("ssh host key not trusted", "[unit]") {
	transport_config c = test_client_config();
	std::optional<std::string> seen;
	c.host_key_check = [&](ssh_public_key const& key) {
		seen = key.fingerprint();
		return false;
	};
	console_fixture f(test_server_config(), std::move(c));

	CHECK(!f.run_all());
	CHECK(seen == ssh_public_key_of(test_host_private_key()).fingerprint());
	CHECK(f.client.error() == ssh_key_exchange_failed);
	CHECK(f.server.state() == transport_state::disconnected);
	CHECK(!f.client.service_accepted);
}

TEST_CASE("ssh failing service request", "[unit]") {
	console_fixture f;

	CHECK(f.run_all());
	REQUIRE(f.client.service_accepted);

	// only one service request is allowed, the connection is started by the authentication
	f.client.send_payload(wire_writer(ssh_service_request).add_string(connection_service_name).take());

	CHECK(!f.run_all());

	CHECK(f.client.state() == transport_state::disconnected);
	CHECK(f.server.state() == transport_state::disconnected);

	// the client just sees the disconnect
	CHECK(f.client.error() == ssh_noerror);
	CHECK(f.server.error() == ssh_service_not_available);
}

TEST_CASE("ssh channel messages need authentication", "[unit]") {
	console_fixture f;
	CHECK(f.run_all());

	f.client.send_payload(wire_writer(ssh_channel_open)
		.add_string("session")
		.add_uint32(0)
		.add_uint32(1024)
		.add_uint32(1024)
		.take());
	CHECK(!f.run_all());
	CHECK(f.server.error() == ssh_protocol_error);
	CHECK(f.client.state() == transport_state::disconnected);
}

TEST_CASE("ssh unknown message", "[unit]") {
	console_fixture f;
	REQUIRE(f.login());

	// the server answers with unimplemented and goes on
	f.client.send_payload(wire_writer(std::uint8_t(200)).add_uint32(1).take());
	CHECK(f.run_all());
	CHECK(f.server.state() == transport_state::transport);
	CHECK(f.client.state() == transport_state::transport);
}

TEST_CASE("ssh failing auth (no tries left)", "[unit]") {
	server_config s = test_server_config();
	s.auth.num_of_tries = 1;
	console_fixture f(std::move(s));

	CHECK(f.run_all());
	f.client.send_password_auth("test", "wrong");

	CHECK(f.run_all());

	CHECK(f.client.state() == transport_state::disconnected);
	CHECK(f.server.state() == transport_state::disconnected);
	CHECK(!f.client.authenticated);
	CHECK(f.client.auth_failures == 0);
}

TEST_CASE("ssh corrupted packet", "[unit]") {
	console_fixture f;
	REQUIRE(f.login());

	send_ignore(f.client, 10);
	std::string data = f.client.out_buf.take();
	data[data.size() / 2] ^= 0x55;
	f.client.out_buf.append(to_span(data));

	CHECK(!f.run_all());
	CHECK(f.server.error() == ssh_mac_error);
	CHECK(f.client.state() == transport_state::disconnected);
}

}
