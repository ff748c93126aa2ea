#include "console_server.hpp"
#include "console_session.hpp"

#include <asio/experimental/as_tuple.hpp>

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace sshconsole::ssh::console {

using tcp = asio::ip::tcp;
using namespace std::literals;

// how long the connections have to get the disconnect out when stopping
auto const shutdown_grace_time = 1s;
auto const shutdown_poll_time = 20ms;

std::string_view to_string(server_state s) {
	using enum server_state;
	switch(s) {
		case created:   return "created";
		case listening: return "listening";
		case stopped:   return "stopped";
	}
	return "unknown";
}

console_server::console_server(console_config c, logger& log, random& rand)
: config_(std::move(c))
, log_(log)
, rand_(rand)
, acceptor_(io_)
, shutdown_timer_(io_)
{
	if(config_.host_keys.empty()) {
		throw std::invalid_argument("at least one host key is required");
	}
	if(config_.port < 0 || config_.port > 65535) {
		throw std::invalid_argument("invalid port " + std::to_string(config_.port));
	}

	callbacks_.auth.password = config_.password;
	callbacks_.auth.public_key = config_.public_key;
	callbacks_.runner = config_.runner;

	create_ssh_config();
}

console_server::~console_server() {
	stop();
	wait();
}

void console_server::create_ssh_config() {
	for(auto&& k : config_.host_keys) {
		log_.log(logger::info, "Host key {} {}", k.algorithm(), k.fingerprint());
		ssh_config_.host_keys.push_back(k.private_key());
	}
	if(config_.host_keys.size() > 1) {
		log_.log(logger::info, "Only the first ed25519 host key is offered to clients");
	}

	ssh_config_.software = config_.software;

	ssh_config_.auth.allowed = callbacks_.auth.methods();
	ssh_config_.auth.num_of_tries = config_.auth_tries;
	ssh_config_.auth.banner = config_.banner;

	if(!ssh_config_.auth.allowed) {
		log_.log(logger::info, "No authentication delegates set, all authentication attempts will fail");
	}
}

server_state console_server::state() const {
	std::lock_guard lock(mutex_);
	return state_;
}

std::uint16_t console_server::local_port() const {
	std::lock_guard lock(mutex_);
	return local_port_;
}

void console_server::listen() {
	std::lock_guard lock(mutex_);
	if(state_ != server_state::created) {
		throw std::logic_error("listen called in state " + std::string(to_string(state_)));
	}

	asio::error_code ec;
	auto address = asio::ip::make_address(config_.host, ec);
	if(ec) {
		throw std::system_error(ec, "invalid bind address '" + config_.host + "'");
	}

	tcp::endpoint endpoint(address, std::uint16_t(config_.port));

	acceptor_.open(endpoint.protocol(), ec);
	if(!ec) {
		acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
	}
	if(!ec) {
		acceptor_.bind(endpoint, ec);
	}
	if(!ec) {
		acceptor_.listen(asio::socket_base::max_listen_connections, ec);
	}
	if(ec) {
		asio::error_code ignored;
		acceptor_.close(ignored);
		log_.log(logger::error, "Failed to bind {}:{} [{}]", config_.host, config_.port, ec.message());
		throw std::system_error(ec, "failed to bind " + config_.host + ":" + std::to_string(config_.port));
	}

	local_port_ = acceptor_.local_endpoint().port();
	state_ = server_state::listening;

	log_.log(logger::info, "Listening on {}:{}", config_.host, local_port_);

	asio::co_spawn(io_, accept_loop(), asio::detached);
	thread_ = std::thread([this] {
		try {
			io_.run();
		} catch(std::exception const& e) {
			log_.log(logger::error, "Event loop failed: {}", e.what());
		} catch(...) {
			log_.log(logger::error, "Event loop failed with unknown exception");
		}
		log_.log(logger::debug, "Event loop finished");
	});
}

asio::awaitable<void> console_server::accept_loop() {
	while(acceptor_.is_open()) {
		auto [e, socket] = co_await acceptor_.async_accept(asio::experimental::as_tuple(asio::use_awaitable));
		if(!acceptor_.is_open()) {
			break;
		}
		if(!e) {
			start_session(std::move(socket));
		} else {
			log_.log(logger::error, "Accept failed: {}", e.message());
			asio::steady_timer timer(co_await asio::this_coro::executor);
			timer.expires_after(100ms);
			co_await timer.async_wait(asio::use_awaitable);
		}
	}
	log_.log(logger::debug, "Stopped accepting connections");
}

void console_server::forget_finished() {
	std::lock_guard lock(mutex_);
	std::erase_if(sessions_, [](auto const& v) { return v.second.expired(); });
}

std::size_t console_server::connection_count() const {
	std::lock_guard lock(mutex_);
	return std::count_if(sessions_.begin(), sessions_.end(), [](auto const& v) { return !v.second.expired(); });
}

void console_server::start_session(tcp::socket socket) {
	forget_finished();

	std::uint64_t id = ++session_counter_;
	try {
		auto session = std::make_shared<console_session>(std::move(socket), ssh_config_, callbacks_, log_, rand_, "[conn " + std::to_string(id) + "] ");
		{
			std::lock_guard lock(mutex_);
			sessions_[id] = session;
		}
		session->start();
	} catch(std::exception const& e) {
		log_.log(logger::error, "Failed to start connection: {}", e.what());
	}
}

void console_server::close_all() {
	asio::error_code ec;
	acceptor_.close(ec);

	for(auto&& [id, weak] : sessions_) {
		if(auto s = weak.lock()) {
			s->shutdown();
		}
	}

	wait_sessions(std::chrono::steady_clock::now() + shutdown_grace_time);
}

void console_server::wait_sessions(std::chrono::steady_clock::time_point deadline) {
	forget_finished();
	if(sessions_.empty()) {
		return;
	}

	if(std::chrono::steady_clock::now() >= deadline) {
		log_.log(logger::info, "Forcing {} connections closed", sessions_.size());
		std::vector<std::shared_ptr<console_session>> live;
		for(auto&& [id, weak] : sessions_) {
			if(auto s = weak.lock()) {
				live.push_back(std::move(s));
			}
		}
		for(auto&& s : live) {
			s->stop();
		}
		return;
	}

	shutdown_timer_.expires_after(shutdown_poll_time);
	shutdown_timer_.async_wait([this, deadline](asio::error_code const& ec) {
		if(!ec) {
			wait_sessions(deadline);
		}
	});
}

bool console_server::stop() {
	{
		std::lock_guard lock(mutex_);
		if(state_ == server_state::stopped) {
			return false;
		}
		bool was_listening = state_ == server_state::listening;
		state_ = server_state::stopped;
		if(!was_listening) {
			return true;
		}
	}

	log_.log(logger::info, "Stopping server");
	asio::post(io_, [this]{ close_all(); });

	if(std::this_thread::get_id() != thread_.get_id()) {
		wait();
	}
	return true;
}

void console_server::wait() {
	if(thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
		thread_.join();
	}
}

}
