#include "util/fixtures.hpp"

#include "sshconsole/console/output.hpp"

#include <algorithm>

#include <catch2/catch.hpp>

namespace sshconsole::ssh::test {
namespace {

// runner that writes size bytes of 'A' in chunks
console::command_runner data_runner(std::size_t size, std::size_t chunk) {
	return [=](std::string const&, std::shared_ptr<console::output> out, std::optional<std::string> const&, console::environment const&) {
		for(std::size_t pos = 0; pos < size; pos += chunk) {
			out->write(std::string(std::min(chunk, size - pos), 'A'));
		}
	};
}

}

TEST_CASE("connection test", "[unit]") {
	auto data_size = GENERATE(std::size_t(1), std::size_t(32*1024), std::size_t(100*1024));
	auto window = GENERATE(std::uint32_t(1024), std::uint32_t(2*1024*1024));
	auto packet = GENERATE(std::uint32_t(1024), std::uint32_t(32*1024));
	CAPTURE(data_size, window, packet);

	server_config sc = test_server_config();
	sc.channel.max_packet_size = packet;
	sc.channel.initial_window_size = window;

	channel_config cc;
	cc.max_packet_size = packet;
	cc.initial_window_size = window;

	console_fixture f(std::move(sc), test_client_config(), cc);
	f.server.callbacks.runner = data_runner(data_size, 4000);

	REQUIRE(f.login());

	auto ch = f.open_session();
	REQUIRE(ch);
	REQUIRE(ch->state() == channel_state::established);

	ch->send_exec("data");
	REQUIRE(f.run_all());

	CHECK(f.client.state() == transport_state::transport);
	CHECK(f.server.state() == transport_state::transport);

	CHECK(ch->out.size() == data_size);
	CHECK(ch->out == std::string(data_size, 'A'));
	CHECK(ch->got_eof);
	CHECK(ch->got_close);
	REQUIRE(ch->exit_status);
	CHECK(*ch->exit_status == 0);
	CHECK(ch->state() == channel_state::closed);
}

TEST_CASE("connection test - output larger than the window", "[unit]") {
	std::size_t const data_size = 300*1024;

	channel_config cc;
	cc.initial_window_size = 1024;

	console_fixture f(test_server_config(), test_client_config(), cc);
	f.server.callbacks.runner = data_runner(data_size, 64*1024);

	REQUIRE(f.login());

	auto ch = f.open_session();
	REQUIRE(ch);

	ch->send_exec("data");
	REQUIRE(f.run_all());

	// nothing is dropped, the rest waits for window adjusts
	CHECK(ch->out.size() == data_size);
	CHECK(ch->out == std::string(data_size, 'A'));
	REQUIRE(ch->exit_status);
	CHECK(*ch->exit_status == 0);
	CHECK(ch->got_close);

	// eof, exit status and close come after all the data
	REQUIRE(ch->events.size() >= 3);
	auto tail = std::vector<std::string>(ch->events.end() - 3, ch->events.end());
	CHECK(tail == std::vector<std::string>{"eof", "exit-status", "close"});
	CHECK(std::count(ch->events.begin(), ch->events.end() - 3, "data") == std::ptrdiff_t(ch->events.size() - 3));
}

TEST_CASE("connection test - output waits for the window", "[unit]") {
	channel_config cc;
	cc.initial_window_size = 1024;

	console_fixture f(test_server_config(), test_client_config(), cc);
	std::shared_ptr<console::output> kept;
	f.server.callbacks.runner = [&](std::string const&, std::shared_ptr<console::output> out, std::optional<std::string> const&, console::environment const&) {
		out->write(std::string(4096, 'B'));
		kept = out;
	};

	REQUIRE(f.login());
	auto ch = f.open_session();
	REQUIRE(ch);
	ch->send_exec("data");
	REQUIRE(f.run_all());

	// the client adjusts its window as it reads, so everything gets through
	CHECK(ch->out == std::string(4096, 'B'));
	CHECK(!ch->got_eof);

	auto handler = f.server.find_handler(ch->remote_id);
	REQUIRE(handler);
	CHECK(handler->queued_size() == 0);

	kept.reset();
	REQUIRE(f.run_all());
	CHECK(ch->got_eof);
	CHECK(ch->got_close);
	CHECK(ch->exit_status == 0u);
}

TEST_CASE("connection test - several channels", "[unit]") {
	console_fixture f;
	f.server.callbacks.runner = [](std::string const& cmd, std::shared_ptr<console::output> out, std::optional<std::string> const&, console::environment const&) {
		out->write(cmd);
	};

	REQUIRE(f.login());

	auto ch1 = f.open_session();
	auto ch2 = f.open_session();
	REQUIRE(ch1);
	REQUIRE(ch2);
	CHECK(ch1->remote_id != ch2->remote_id);

	ch2->send_exec("second");
	ch1->send_exec("first");
	REQUIRE(f.run_all());

	CHECK(ch1->out == "first");
	CHECK(ch2->out == "second");
	CHECK(ch1->got_close);
	CHECK(ch2->got_close);
	REQUIRE(f.client.connection());
	CHECK(f.client.connection()->channel_count() == 0);
	REQUIRE(f.server.connection());
	CHECK(f.server.connection()->channel_count() == 0);

	// the connection stays usable
	auto ch3 = f.open_session();
	REQUIRE(ch3);
	ch3->send_exec("third");
	REQUIRE(f.run_all());
	CHECK(ch3->out == "third");
}

TEST_CASE("connection test - channel limit", "[unit]") {
	server_config sc = test_server_config();
	sc.channel.max_channels = 2;
	console_fixture f(std::move(sc));
	REQUIRE(f.login());

	auto ch1 = f.open_session();
	auto ch2 = f.open_session();
	auto ch3 = f.open_session();
	REQUIRE(ch3);
	CHECK(ch1->state() == channel_state::established);
	CHECK(ch2->state() == channel_state::established);
	CHECK(ch3->open_failed);
	CHECK(ch3->open_failure_code == ssh_open_resource_shortage);
	CHECK(f.server.state() == transport_state::transport);
}

TEST_CASE("connection test - rekey keeps channels", "[unit]") {
	console_fixture f;
	std::shared_ptr<console::output> kept;
	f.server.callbacks.runner = [&](std::string const&, std::shared_ptr<console::output> out, std::optional<std::string> const&, console::environment const&) {
		out->write("before\r\n");
		kept = out;
	};
	REQUIRE(f.login());
	auto ch = f.open_session();
	REQUIRE(ch);
	ch->send_exec("cmd");
	REQUIRE(f.run_all());
	CHECK(ch->out == "before\r\n");

	auto id = f.server.session_id();
	byte_vector first_id(id.begin(), id.end());

	f.client.start_rekey();
	CHECK(f.client.kex_running());
	// the server reads the kexinit and answers with its own
	CHECK(step(f.server, f.client.out_buf));
	CHECK(f.server.kex_running());

	// written while the key exchange runs, sent after it
	kept->write("after\r\n");
	kept.reset();
	CHECK(f.server.run_posted() == 2);
	CHECK(ch->out == "before\r\n");

	REQUIRE(f.run_all());

	CHECK(!f.client.kex_running());
	CHECK(!f.server.kex_running());
	CHECK(ch->out == "before\r\nafter\r\n");
	CHECK(ch->got_close);
	// session id stays the one from the first exchange
	CHECK(byte_vector(f.server.session_id().begin(), f.server.session_id().end()) == first_id);
}

}
