#include "sshconsole/console/console_server.hpp"
#include "sshconsole/console/output.hpp"
#include "sshconsole/common/util.hpp"
#include "sshconsole/crypto/random.hpp"
#include "tools/common/command_parser.hpp"
#include "tools/common/util.hpp"

#include <asio.hpp>

#include <iostream>
#include <stdexcept>

namespace sshconsole::ssh {
namespace {

struct echo_commands : sshconsole::command_parser {
	bool help{};
	bool verbose{};
	bool generate_key{};
	std::string bind_address{"0.0.0.0"};
	int port{2525};
	std::string host_key;
	std::string host_key_file;

	echo_commands() {
		add(help, "help", "h", "show help");
		add(verbose, "verbose", "v", "log the ssh protocol");
		add(generate_key, "generate-key", "", "print new host key and exit");
		add(bind_address, "bind", "b", "bind address");
		add(port, "port", "p", "port to listen");
		add(host_key, "host-key", "", "host key as '<algorithm> <base64>'");
		add(host_key_file, "host-key-file", "", "file containing the host key");
	}
};

console::host_key load_host_key(echo_commands const& p, logger& log, random& rand) {
	std::string text = p.host_key;
	if(!p.host_key_file.empty()) {
		auto f = read_file(p.host_key_file);
		if(!f) {
			throw std::runtime_error("could not read host key file '" + p.host_key_file + "'");
		}
		text = *f;
	}

	if(text.empty()) {
		auto key = console::host_key::generate(rand);
		log.log(logger::info, "No host key given, using new key: {}", key.to_string());
		return key;
	}

	std::string error;
	auto key = console::host_key_from(text, error);
	if(!key) {
		throw std::runtime_error("invalid host key: " + error);
	}
	return *key;
}

// the users public keys in ~/.ssh/authorized_keys are allowed, the user name is not checked
void authorize_key(asio::thread_pool& pool, console::public_key_credential const& key, console::auth_completion done) {
	asio::post(pool, [key, done] {
		auto path = home_path(".ssh/authorized_keys");
		auto file = path ? read_file(*path) : std::nullopt;
		done(file && key.is_authorized(*file));
	});
}

// single user "password" with password "admin"
void authorize_password(asio::thread_pool& pool, std::string const& user, std::string const& password, console::auth_completion done) {
	asio::post(pool, [ok = user == "password" && password == "admin", done] {
		done(ok);
	});
}

}
}

int main(int argc, char* argv[]) {
	using namespace sshconsole::ssh;
	try {
		echo_commands p;
		p.parse(argc, argv);
		if(p.help) {
			std::cout << "sshconsole echo server\n";
			echo_commands().print_help(std::cout);
			return 0;
		}

		stdout_logger log(p.verbose ? logger::log_all : logger::type(logger::info | logger::error));

		random& rand = system_random();

		if(p.generate_key) {
			std::cout << console::host_key::generate(rand).to_string() << std::endl;
			return 0;
		}

		asio::io_context main_io;
		auto work = asio::make_work_guard(main_io);
		asio::thread_pool workers(2);

		console::console_config config;
		config.host = p.bind_address;
		config.port = p.port;
		config.host_keys.push_back(load_host_key(p, log, rand));

		config.password = [&](std::string const& user, std::string const& password, console::auth_completion done) {
			authorize_password(workers, user, password, std::move(done));
		};
		config.public_key = [&](std::string const&, console::public_key_credential const& key, console::auth_completion done) {
			authorize_key(workers, key, std::move(done));
		};
		config.runner = [&](std::string const& command, std::shared_ptr<console::output> out, std::optional<std::string> const&, console::environment const&) {
			asio::post(workers, [&main_io, command = std::string(trim(command)), out = std::move(out)]() mutable {
				if(command == "exit") {
					out->write("Goodbye\r\n");
					out.reset();
					asio::post(main_io, [&main_io]{ main_io.stop(); });
				} else {
					out->write("echo: " + command + "\r\n");
				}
			});
		};

		console::console_server server(std::move(config), log, rand);
		server.listen();

		asio::signal_set signals(main_io, SIGINT, SIGTERM);
		signals.async_wait([&](auto, auto){ main_io.stop(); });

		main_io.run();

		server.stop();
		workers.join();

		std::cout << "Echo is done." << std::endl;
	} catch(std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
