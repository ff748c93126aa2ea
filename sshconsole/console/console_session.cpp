#include "console_session.hpp"

namespace sshconsole::ssh::console {

std::size_t const read_size = 4096;

console_session::console_session(asio::ip::tcp::socket socket, server_config const& config, console_callbacks const& cb, logger& base_log, random& rand, std::string tag)
: socket_(std::move(socket))
, timer_(socket_.get_executor())
, log_(base_log, std::move(tag))
, server_(config, cb, log_, base_log, out_buf_, rand)
{
	timer_.expires_at(std::chrono::steady_clock::time_point::max());
}

console_session::~console_session() {
	log_.log(logger::debug, "Session destroyed");
}

void console_session::start() {
	asio::error_code ec;
	auto remote = socket_.remote_endpoint(ec);
	if(!ec) {
		log_.log(logger::info, "Connection accepted from {}:{}", remote.address().to_string(), remote.port());
	}

	server_.set_post_function(
		[weak = weak_from_this(), exec = socket_.get_executor()](std::function<void()> f) {
			asio::post(exec, [weak, f = std::move(f)] {
				if(auto self = weak.lock()) {
					self->run_posted(f);
				}
			});
		});

	asio::co_spawn(socket_.get_executor(),
		[self = shared_from_this()]{ return self->reader(); }, asio::detached);

	asio::co_spawn(socket_.get_executor(),
		[self = shared_from_this()]{ return self->writer(); }, asio::detached);
}

void console_session::server_process() {
	transport_op res;
	std::size_t bsize;
	do {
		bsize = in_buf_.size();
		res = server_.process(in_buf_);
	} while(res != transport_op::disconnected && res != transport_op::pending_action && bsize != in_buf_.size());

	if(res == transport_op::disconnected) {
		// let the writer get the disconnect packet out before closing
		closing_ = true;
	}
	if(!out_buf_.empty() || closing_) {
		timer_.cancel_one();
	}
}

void console_session::run_posted(std::function<void()> const& f) {
	if(!socket_.is_open()) {
		return;
	}
	try {
		f();
		server_process();
	} catch(std::exception const& e) {
		log_.log(logger::error, "Connection failed: {}", e.what());
		stop();
	} catch(...) {
		log_.log(logger::error, "Connection failed with unknown exception");
		stop();
	}
}

asio::awaitable<void> console_session::reader() {
	try {
		server_process();

		std::string read_data;
		read_data.resize(read_size);
		while(socket_.is_open() && !closing_) {
			std::size_t n = co_await socket_.async_read_some(
				asio::buffer(read_data.data(), read_data.size()), asio::use_awaitable);

			in_buf_.add(std::string_view(read_data).substr(0, n));
			server_process();
		}
	} catch(std::exception const& e) {
		if(socket_.is_open()) {
			log_.log(logger::error, "Connection failed: {}", e.what());
		}
		stop();
	} catch(...) {
		log_.log(logger::error, "Connection failed with unknown exception");
		stop();
	}
}

asio::awaitable<void> console_session::writer() {
	try {
		while(socket_.is_open()) {
			if(!out_buf_.empty()) {
				std::string buf = out_buf_.take();
				log_.log(logger::trace, "Writing out {} bytes", buf.size());
				co_await asio::async_write(socket_, asio::buffer(buf), asio::use_awaitable);
			} else if(closing_) {
				stop();
			} else {
				asio::error_code ec;
				co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
			}
		}
	} catch(std::exception const& e) {
		if(socket_.is_open()) {
			log_.log(logger::error, "Connection failed: {}", e.what());
		}
		stop();
	} catch(...) {
		log_.log(logger::error, "Connection failed with unknown exception");
		stop();
	}
}

void console_session::shutdown() {
	if(!socket_.is_open() || closing_) {
		return;
	}
	log_.log(logger::info, "Shutting down connection");
	server_.disconnect(ssh_disconnect_by_application, "server shutting down");
	server_process();
	closing_ = true;
	timer_.cancel_one();
}

void console_session::stop() {
	if(socket_.is_open()) {
		log_.log(logger::info, "Closing connection");
		asio::error_code ec;
		socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
		socket_.close(ec);
	}
	timer_.cancel();
}

}
