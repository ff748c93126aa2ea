#include "ssh_server.hpp"

namespace sshconsole::ssh {

ssh_server::ssh_server(server_config const& config, logger& log, out_buffer& out, random& rand)
: ssh_transport(config, log, out, rand)
, server_config_(config)
{
}

ssh_server::~ssh_server() = default;

std::unique_ptr<server_auth> ssh_server::construct_auth() {
	return std::make_unique<server_auth>(*this, server_config_.auth);
}

std::unique_ptr<ssh_connection> ssh_server::construct_connection(auth_context const&) {
	return std::make_unique<ssh_connection>(*this, server_config_.channel);
}

void ssh_server::handle_service_request(const_span payload) {
	wire_reader in(payload);
	in.read_byte();
	std::string_view name = in.read_string();
	if(!in) {
		set_error_and_disconnect(ssh_protocol_error, "invalid service request");
		return;
	}

	if(name != user_auth_service_name || auth_) {
		set_error_and_disconnect(ssh_service_not_available, "service not available");
		return;
	}

	log_.log(logger::debug, "Starting user authentication");
	auth_ = construct_auth();
	send_payload(wire_writer(ssh_service_accept).add_string(name).take());
}

handler_result ssh_server::handle_message(std::uint8_t type, const_span payload) {
	if(type == ssh_service_request) {
		handle_service_request(payload);
		return handler_result::handled;
	}

	if(is_userauth_msg(type)) {
		if(!auth_) {
			set_error_and_disconnect(ssh_protocol_error, "authentication service not requested");
			return handler_result::handled;
		}

		auto res = auth_->handle(type, payload);
		if(res == handler_result::handled && auth_->succeeded() && !connection_) {
			connection_ = construct_connection(auth_->info());
			if(!connection_) {
				set_error_and_disconnect(ssh_service_not_available, "service not available");
			}
		}
		return res;
	}

	if(is_connection_msg(type)) {
		if(!connection_) {
			set_error_and_disconnect(ssh_protocol_error, "not authenticated");
			return handler_result::handled;
		}
		return connection_->handle(type, payload);
	}

	return handler_result::unknown;
}

}
