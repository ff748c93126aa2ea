#include "test_client.hpp"

#include "sshconsole/common/util.hpp"
#include "sshconsole/core/protocol.hpp"

namespace sshconsole::ssh::test {

bool test_session::send_env(std::string_view name, std::string_view value, bool reply) {
	return channel && channel->send_request("env", reply, wire_writer().add_string(name).add_string(value).data());
}

bool test_session::send_exec(std::string_view command, bool reply) {
	return channel && channel->send_request("exec", reply, wire_writer().add_string(command).data());
}

bool test_session::send_shell(bool reply) {
	return channel && channel->send_request("shell", reply);
}

bool test_session::send_text(std::string_view text) {
	return channel && channel->send_data(to_span(text));
}

bool test_session::send_error_text(std::string_view text) {
	return channel && channel->send_extended_data(extended_stderr, to_span(text));
}

bool test_session::send_eof() {
	if(!channel) {
		return false;
	}
	channel->send_eof();
	return true;
}

bool test_session::send_close() {
	if(!channel) {
		return false;
	}
	channel->send_close();
	return true;
}

channel_state test_session::state() const {
	return channel ? channel->state() : channel_state::closed;
}

test_session_channel::test_session_channel(ssh_transport& t, channel_side_info local, std::shared_ptr<test_session> s)
: channel(t, local)
, session_(std::move(s))
{
	session_->channel = this;
}

test_session_channel::~test_session_channel() {
	session_->channel = nullptr;
}

void test_session_channel::on_open_confirmed(const_span) {
	session_->remote_id = remote().id;
}

void test_session_channel::on_open_failed(std::uint32_t code, std::string_view) {
	session_->open_failed = true;
	session_->open_failure_code = code;
}

void test_session_channel::on_data(const_span s) {
	session_->out += to_string_view(s);
	session_->events.push_back("data");
}

void test_session_channel::on_extended_data(std::uint32_t type, const_span s) {
	if(type == extended_stderr) {
		session_->err += to_string_view(s);
	}
	session_->events.push_back("extended");
}

void test_session_channel::on_eof() {
	session_->got_eof = true;
	session_->events.push_back("eof");
}

void test_session_channel::on_close() {
	session_->got_close = true;
	session_->events.push_back("close");
}

void test_session_channel::on_request(std::string_view name, bool want_reply, wire_reader& extra) {
	if(name == "exit-status") {
		std::uint32_t status = extra.read_uint32();
		if(extra) {
			session_->exit_status = status;
			session_->events.push_back("exit-status");
			return;
		}
	}
	channel::on_request(name, want_reply, extra);
}

void test_session_channel::on_request_reply(bool success) {
	if(success) {
		++session_->request_successes;
	} else {
		++session_->request_failures;
	}
}

test_ssh_client::test_ssh_client(transport_config const& c, logger& log, out_buffer& out, random& rand, channel_config cc)
: ssh_transport(c, log, out, rand)
, channel_config_(cc)
{
}

void test_ssh_client::on_kex_done(bool first) {
	if(first) {
		send_payload(wire_writer(ssh_service_request).add_string(user_auth_service_name).take());
	}
}

void test_ssh_client::send_none_auth(std::string_view user) {
	send_method_auth(user, "none");
}

void test_ssh_client::send_password_auth(std::string_view user, std::string_view password) {
	send_payload(wire_writer(ssh_userauth_request)
		.add_string(user)
		.add_string(connection_service_name)
		.add_string("password")
		.add_bool(false)
		.add_string(password)
		.take());
}

void test_ssh_client::send_method_auth(std::string_view user, std::string_view method) {
	send_payload(wire_writer(ssh_userauth_request)
		.add_string(user)
		.add_string(connection_service_name)
		.add_string(method)
		.take());
}

void test_ssh_client::send_pk_query(std::string_view user, ed25519_private_key const& key) {
	send_pk(user, key, nullptr);
}

void test_ssh_client::send_pk_auth(std::string_view user, ed25519_private_key const& key) {
	send_pk(user, key, &key);
}

void test_ssh_client::send_bad_pk_auth(std::string_view user, ed25519_private_key const& key, ed25519_private_key const& wrong_key) {
	send_pk(user, key, &wrong_key);
}

void test_ssh_client::send_pk(std::string_view user, ed25519_private_key const& key, ed25519_private_key const* signer) {
	byte_vector blob = ssh_public_key_of(key).blob();

	wire_writer request(ssh_userauth_request);
	request.add_string(user)
		.add_string(connection_service_name)
		.add_string("publickey")
		.add_bool(signer != nullptr)
		.add_string(ssh_ed25519_name)
		.add_blob(blob);

	if(signer) {
		// signed data is the session id followed by the request without the signature
		byte_vector msg = wire_writer()
			.add_blob(session_id())
			.add_raw(request.data())
			.take();
		request.add_blob(ssh_signature(*signer, msg));
	}

	send_payload(request.data());
}

std::shared_ptr<test_session> test_ssh_client::open_channel(std::string_view type) {
	if(!connection_) {
		return nullptr;
	}
	auto session = std::make_shared<test_session>();
	auto ch = connection_->open_channel(type, [&](ssh_transport& t, channel_side_info local) {
			return std::make_unique<test_session_channel>(t, local, session);
		});
	return ch ? session : nullptr;
}

handler_result test_ssh_client::handle_message(std::uint8_t type, const_span payload) {
	wire_reader in(payload);
	in.read_byte();

	switch(type) {
		case ssh_service_accept:
			service_accepted = true;
			return handler_result::handled;
		case ssh_userauth_banner:
			banner = in.read_string();
			return handler_result::handled;
		case ssh_userauth_failure: {
			std::string_view methods = in.read_string();
			last_partial = in.read_bool();
			last_methods.clear();
			if(!methods.empty()) {
				for(auto m : split(methods, ',')) {
					last_methods.emplace_back(m);
				}
			}
			++auth_failures;
			return handler_result::handled;
		}
		case ssh_userauth_success:
			authenticated = true;
			connection_ = std::make_unique<ssh_connection>(*this, channel_config_);
			return handler_result::handled;
		case ssh_userauth_pk_ok:
			++pk_oks;
			return handler_result::handled;
	}

	if(connection_ && is_connection_msg(type)) {
		return connection_->handle(type, payload);
	}

	return handler_result::unknown;
}

}
