#include "user_auth.hpp"

#include "sshconsole/common/util.hpp"

namespace sshconsole::ssh {

std::string_view const none_method = "none";
std::string_view const password_method = "password";
std::string_view const public_key_method = "publickey";

std::string_view to_string(auth_type t) {
	switch(t) {
		case auth_none:       return none_method;
		case auth_password:   return password_method;
		case auth_public_key: return public_key_method;
	}
	return "unknown";
}

std::string auth_method_names(auth_bits bits) {
	std::vector<std::string> names;
	if(bits & auth_password) {
		names.emplace_back(password_method);
	}
	if(bits & auth_public_key) {
		names.emplace_back(public_key_method);
	}
	return join_names(names);
}

server_auth::server_auth(ssh_transport& t, auth_config const& config)
: transport_(t)
, config_(config)
, log_(t.log())
{
}

handler_result server_auth::handle(std::uint8_t type, const_span payload) {
	if(type != ssh_userauth_request) {
		return handler_result::unknown;
	}
	if(succeeded_) {
		log_.log(logger::debug, "Ignoring authentication request after success");
		return handler_result::handled;
	}

	wire_reader in(payload);
	in.read_byte();
	auth_context ctx;
	ctx.username = in.read_string();
	ctx.service = in.read_string();
	std::string_view method = in.read_string();
	if(!in) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "invalid authentication request");
		return handler_result::handled;
	}

	if(ctx.service != connection_service_name) {
		transport_.set_error_and_disconnect(ssh_service_not_available, "service not available: " + ctx.service);
		return handler_result::handled;
	}

	send_banner();

	log_.log(logger::debug, "Authentication request [user={}, method={}]", ctx.username, method);

	auth_bits allowed = allowed_methods();
	std::optional<auth_state> res = auth_state::failed;
	if(method == password_method && (allowed & auth_password)) {
		res = handle_password(ctx, in);
	} else if(method == public_key_method && (allowed & auth_public_key)) {
		res = handle_public_key(ctx, in);
	} else if(method == none_method) {
		// asks for the methods, not counted as failure
		send_failure();
		return handler_result::handled;
	} else {
		log_.log(logger::info, "Authentication method not allowed [user={}, method={}]", ctx.username, method);
	}

	if(!res || transport_.state() == transport_state::disconnected) {
		return handler_result::handled;
	}

	if(*res == auth_state::pending) {
		return handler_result::pending;
	}

	if(*res == auth_state::succeeded) {
		log_.log(logger::info, "User authenticated [user={}, method={}]", ctx.username, method);
		succeeded_ = true;
		info_ = ctx;
		auth_succeeded(ctx);
		transport_.send_payload(wire_writer(ssh_userauth_success).take());
	} else {
		log_.log(logger::info, "Authentication failed [user={}, method={}]", ctx.username, method);
		failed();
	}
	return handler_result::handled;
}

std::optional<auth_state> server_auth::handle_password(auth_context const& ctx, wire_reader& in) {
	bool change = in.read_bool();
	std::string_view password = in.read_string();
	if(!in) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "invalid password request");
		return auth_state::failed;
	}
	if(change) {
		return auth_state::failed;
	}
	return verify_password(ctx, password);
}

std::optional<auth_state> server_auth::handle_public_key(auth_context const& ctx, wire_reader& in) {
	bool has_signature = in.read_bool();
	std::string_view algorithm = in.read_string();
	const_span blob = in.read_blob();
	if(!in) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "invalid public key request");
		return auth_state::failed;
	}

	auto key = ssh_public_key::from_blob(blob);
	if(algorithm != ssh_ed25519_name || !key) {
		log_.log(logger::info, "Unsupported public key [user={}, algorithm={}]", ctx.username, algorithm);
		return auth_state::failed;
	}

	if(!has_signature) {
		transport_.send_payload(wire_writer(ssh_userauth_pk_ok)
			.add_string(algorithm)
			.add_blob(blob)
			.take());
		return std::nullopt;
	}

	const_span signature = in.read_blob();
	if(!in) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "invalid public key request");
		return auth_state::failed;
	}

	byte_vector signed_data = wire_writer()
		.add_blob(transport_.session_id())
		.add_byte(ssh_userauth_request)
		.add_string(ctx.username)
		.add_string(ctx.service)
		.add_string(public_key_method)
		.add_bool(true)
		.add_string(algorithm)
		.add_blob(blob)
		.take();

	if(!key->verify(signed_data, signature)) {
		log_.log(logger::info, "Invalid public key signature [user={}, key={}]", ctx.username, key->fingerprint());
		return auth_state::failed;
	}
	return verify_public_key(ctx, *key);
}

void server_auth::send_banner() {
	if(!banner_sent_ && !config_.banner.empty()) {
		transport_.send_payload(wire_writer(ssh_userauth_banner)
			.add_string(config_.banner)
			.add_string("")
			.take());
	}
	banner_sent_ = true;
}

void server_auth::send_failure() {
	transport_.send_payload(wire_writer(ssh_userauth_failure)
		.add_string(auth_method_names(allowed_methods()))
		.add_bool(false)
		.take());
}

void server_auth::failed() {
	++failures_;
	if(failures_ >= config_.num_of_tries) {
		log_.log(logger::info, "Too many authentication failures [failures={}]", failures_);
		transport_.disconnect(ssh_no_more_auth_methods_available, "too many authentication failures");
		return;
	}
	send_failure();
}

}
