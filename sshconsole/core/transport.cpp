#include "transport.hpp"
#include "wire.hpp"

#include "sshconsole/common/util.hpp"
#include "sshconsole/crypto/random.hpp"

namespace sshconsole::ssh {

std::size_t const max_version_line = 255;
// lines a server may send before its version line
std::size_t const max_pre_version_lines = 50;

std::string_view to_string(transport_op op) {
	using enum transport_op;
	switch(op) {
		case want_read_more:  return "want_read_more";
		case want_write_more: return "want_write_more";
		case pending_action:  return "pending_action";
		case disconnected:    return "disconnected";
	}
	return "unknown";
}

std::string_view to_string(transport_state s) {
	using enum transport_state;
	switch(s) {
		case version_exchange: return "version_exchange";
		case kex:              return "kex";
		case transport:        return "transport";
		case disconnected:     return "disconnected";
	}
	return "unknown";
}

ssh_transport::ssh_transport(transport_config const& config, logger& log, out_buffer& out, random& rand)
: config_(config)
, log_(log)
, rand_(rand)
, out_(out)
, reader_(config.max_in_packet_size)
, writer_(out, rand)
{
}

ssh_transport::~ssh_transport() = default;

void ssh_transport::set_state(transport_state s) {
	if(s != state_) {
		transport_state old = state_;
		log_.log(logger::debug, "Transport state {} -> {}", to_string(old), to_string(s));
		state_ = s;
		on_state_change(old, s);
	}
}

transport_op ssh_transport::process(in_buffer& in) {
	if(state_ == transport_state::disconnected) {
		return transport_op::disconnected;
	}

	wrote_ = false;
	if(!version_sent_) {
		send_version();
		send_kexinit();
	}

	if(state_ == transport_state::version_exchange) {
		if(!read_version(in)) {
			if(state_ == transport_state::disconnected) {
				return transport_op::disconnected;
			}
			return wrote_ ? transport_op::want_write_more : transport_op::want_read_more;
		}
		set_state(transport_state::kex);
	}

	if(!pending_.empty()) {
		byte_vector payload;
		payload.swap(pending_);
		if(dispatch(payload) == handler_result::pending) {
			pending_.swap(payload);
			return transport_op::pending_action;
		}
	}

	if(state_ != transport_state::disconnected) {
		byte_vector payload;
		auto res = reader_.read(in, payload);
		if(res == packet_reader::result::failed) {
			set_error_and_disconnect(reader_.error(), reader_.error_message());
		} else if(res == packet_reader::result::ready) {
			if(dispatch(payload) == handler_result::pending) {
				pending_.swap(payload);
				return transport_op::pending_action;
			}
		}
	}

	if(state_ == transport_state::disconnected) {
		return transport_op::disconnected;
	}

	if(state_ == transport_state::transport && !kex_running_
		&& reader_.bytes() + writer_.bytes() >= config_.rekey_bytes)
	{
		log_.log(logger::debug, "Rekey limit reached");
		start_rekey();
	}

	return wrote_ ? transport_op::want_write_more : transport_op::want_read_more;
}

void ssh_transport::send_version() {
	my_version_ = "SSH-2.0-" + config_.software;
	if(!config_.comment.empty()) {
		my_version_ += " " + config_.comment;
	}
	out_.append(to_span(my_version_ + "\r\n"));
	version_sent_ = true;
	wrote_ = true;
}

bool ssh_transport::read_version(in_buffer& in) {
	while(state_ != transport_state::disconnected) {
		std::string_view data = to_string_view(in.data());
		auto pos = data.find('\n');
		if(pos == std::string_view::npos) {
			if(data.size() > max_version_line) {
				set_error_and_disconnect(ssh_protocol_error, "version line too long");
			}
			return false;
		}
		if(pos > max_version_line) {
			set_error_and_disconnect(ssh_protocol_error, "version line too long");
			return false;
		}

		std::string line(data.substr(0, pos));
		in.consume(pos + 1);
		if(!line.empty() && line.back() == '\r') {
			line.pop_back();
		}

		if(line.starts_with("SSH-")) {
			return parse_version(line);
		}

		if(config_.side == transport_side::server || ++pre_version_lines_ > max_pre_version_lines) {
			set_error_and_disconnect(ssh_protocol_error, "invalid version line");
			return false;
		}
		log_.log(logger::debug, "Ignoring line before version: {}", line);
	}
	return false;
}

bool ssh_transport::parse_version(std::string const& line) {
	std::string_view v = line;
	if(!v.starts_with("SSH-2.0-") && !v.starts_with("SSH-1.99-")) {
		set_error_and_disconnect(ssh_protocol_version_not_supported, "unsupported protocol version");
		return false;
	}

	std::string_view rest = v.substr(v.find('-', 4) + 1);
	std::string_view software = rest.substr(0, rest.find(' '));
	if(software.empty()) {
		set_error_and_disconnect(ssh_protocol_error, "missing software version");
		return false;
	}

	peer_version_ = line;
	log_.log(logger::info, "Peer version: {}", peer_version_);
	return true;
}

void ssh_transport::write_payload(const_span payload) {
	log_.log(logger::trace, "Sending message [type={}, size={}]", int(payload[0]), payload.size());
	writer_.write(payload);
	wrote_ = true;
}

void ssh_transport::send_payload(const_span payload) {
	if(state_ == transport_state::disconnected || payload.empty()) {
		return;
	}
	if(!is_transport_msg(std::uint8_t(payload[0])) && (kex_running_ || state_ != transport_state::transport)) {
		held_.emplace_back(payload.begin(), payload.end());
		return;
	}
	write_payload(payload);
}

handler_result ssh_transport::dispatch(const_span payload) {
	if(payload.empty()) {
		set_error_and_disconnect(ssh_protocol_error, "empty message");
		return handler_result::handled;
	}

	std::uint8_t type = std::uint8_t(payload[0]);
	log_.log(logger::trace, "Received message [type={}, size={}]", int(type), payload.size());

	if(ignore_next_kex_packet_ && is_kex_msg(type) && type != ssh_kexinit && type != ssh_newkeys) {
		log_.log(logger::debug, "Ignoring wrongly guessed key exchange message");
		ignore_next_kex_packet_ = false;
		return handler_result::handled;
	}

	switch(type) {
		case ssh_disconnect:
			handle_disconnect(payload);
			return handler_result::handled;
		case ssh_ignore:
			return handler_result::handled;
		case ssh_debug: {
			wire_reader in(payload);
			in.read_byte();
			in.read_bool();
			log_.log(logger::debug, "Peer debug message: {}", in.read_string());
			return handler_result::handled;
		}
		case ssh_unimplemented: {
			wire_reader in(payload);
			in.read_byte();
			log_.log(logger::info, "Peer did not implement our message [seq={}]", in.read_uint32());
			return handler_result::handled;
		}
		case ssh_kexinit:
			handle_kexinit(payload);
			return handler_result::handled;
		case ssh_newkeys:
			handle_newkeys();
			return handler_result::handled;
		case ssh_kex_ecdh_init:
		case ssh_kex_ecdh_reply:
			handle_kex_message(type, payload);
			return handler_result::handled;
	}

	if(session_id_.empty() || (!peer_kexinit_.empty() && !newkeys_received_)) {
		set_error_and_disconnect(ssh_protocol_error, "unexpected message " + std::to_string(type) + " during key exchange");
		return handler_result::handled;
	}

	auto res = handle_message(type, payload);
	if(res == handler_result::unknown) {
		log_.log(logger::debug, "Unimplemented message [type={}, seq={}]", int(type), reader_.sequence());
		send_payload(wire_writer(ssh_unimplemented).add_uint32(reader_.sequence()).take());
	}
	return res;
}

void ssh_transport::disconnect(ssh_error_code code, std::string_view message) {
	if(state_ == transport_state::disconnected) {
		return;
	}
	log_.log(logger::info, "Disconnecting [code={}, message={}]", int(code), message);
	if(version_sent_) {
		write_payload(wire_writer(ssh_disconnect)
			.add_uint32(code)
			.add_string(message)
			.add_string("")
			.take());
	}
	set_state(transport_state::disconnected);
}

void ssh_transport::set_error_and_disconnect(ssh_error_code code, std::string_view message) {
	if(state_ == transport_state::disconnected) {
		return;
	}
	log_.log(logger::error, "{} [code={}]", message, int(code));
	error_ = code;
	error_message_ = message;
	disconnect(code, message);
}

void ssh_transport::handle_disconnect(const_span payload) {
	wire_reader in(payload);
	in.read_byte();
	std::uint32_t code = in.read_uint32();
	std::string_view message = in.read_string();
	log_.log(logger::info, "Peer disconnected [code={}, message={}]", code, message);
	set_state(transport_state::disconnected);
}

void ssh_transport::start_rekey() {
	if(state_ == transport_state::transport && !kex_running_) {
		log_.log(logger::info, "Starting key exchange");
		send_kexinit();
	}
}

void ssh_transport::send_kexinit() {
	kex_init k;
	k.cookie = rand_.bytes(kex_cookie_size);
	k.kex = join_names(config_.kexes);
	if(config_.side == transport_side::client || !config_.host_keys.empty()) {
		k.host_key = ssh_ed25519_name;
	}
	k.cipher_c2s = k.cipher_s2c = join_names(config_.ciphers);
	k.mac_c2s = k.mac_s2c = join_names(config_.macs);
	k.compress_c2s = k.compress_s2c = no_compression_name;

	my_kexinit_ = k.payload();
	write_payload(my_kexinit_);
	kex_running_ = true;
}

void ssh_transport::handle_kexinit(const_span payload) {
	if(!peer_kexinit_.empty()) {
		set_error_and_disconnect(ssh_protocol_error, "unexpected kexinit");
		return;
	}

	auto peer = kex_init::parse(payload);
	if(!peer) {
		set_error_and_disconnect(ssh_protocol_error, "invalid kexinit");
		return;
	}

	if(!kex_running_) {
		send_kexinit();
	}
	peer_kexinit_.assign(payload.begin(), payload.end());

	auto mine = kex_init::parse(my_kexinit_);
	bool server = config_.side == transport_side::server;

	std::string failed;
	algorithms_ = server ? negotiate(*peer, *mine, failed) : negotiate(*mine, *peer, failed);
	if(!algorithms_) {
		set_error_and_disconnect(ssh_key_exchange_failed, "no common algorithm for " + failed);
		return;
	}

	if(peer->first_kex_follows) {
		auto first = [](std::string const& list) { return list.substr(0, list.find(',')); };
		ignore_next_kex_packet_ = first(peer->kex) != algorithms_->kex || first(peer->host_key) != algorithms_->host_key;
	}

	log_.log(logger::debug, "Negotiated [kex={}, host key={}, ciphers={}/{}, macs={}/{}]",
		algorithms_->kex, algorithms_->host_key, algorithms_->cipher_c2s, algorithms_->cipher_s2c,
		algorithms_->mac_c2s, algorithms_->mac_s2c);

	kex_exchange_data data;
	data.client_version = server ? peer_version_ : my_version_;
	data.server_version = server ? my_version_ : peer_version_;
	data.client_kexinit = server ? peer_kexinit_ : my_kexinit_;
	data.server_kexinit = server ? my_kexinit_ : peer_kexinit_;

	kex_ = std::make_unique<curve25519_kex>(std::move(data), rand_, log_);
	newkeys_sent_ = false;
	newkeys_received_ = false;

	if(!server) {
		write_payload(kex_->client_init());
	}
}

void ssh_transport::handle_kex_message(std::uint8_t type, const_span payload) {
	if(!kex_ || newkeys_sent_) {
		set_error_and_disconnect(ssh_protocol_error, "unexpected key exchange message");
		return;
	}

	if(config_.side == transport_side::server && type == ssh_kex_ecdh_init) {
		auto reply = kex_->make_reply(payload, config_.host_keys.front());
		if(!reply) {
			set_error_and_disconnect(ssh_key_exchange_failed, kex_->error());
			return;
		}
		write_payload(*reply);
	} else if(config_.side == transport_side::client && type == ssh_kex_ecdh_reply) {
		if(!kex_->handle_reply(payload, config_.host_key_check)) {
			set_error_and_disconnect(ssh_key_exchange_failed, kex_->error());
			return;
		}
	} else {
		set_error_and_disconnect(ssh_protocol_error, "unexpected key exchange message");
		return;
	}

	auto out_cipher = take_new_keys(*kex_);
	if(!out_cipher) {
		return;
	}

	write_payload(wire_writer(ssh_newkeys).take());
	writer_.set_cipher(std::move(out_cipher));
	newkeys_sent_ = true;

	if(newkeys_received_) {
		finish_kex();
	}
}

std::unique_ptr<packet_cipher> ssh_transport::take_new_keys(curve25519_kex const& kex) {
	if(session_id_.empty()) {
		session_id_.assign(kex.exchange_hash().begin(), kex.exchange_hash().end());
	}

	auto make = [&](std::string const& cipher, std::string const& mac, char iv_letter, char key_letter, char mac_letter)
		-> std::unique_ptr<packet_cipher>
	{
		auto c = find_cipher(cipher);
		if(!c) {
			return nullptr;
		}
		auto m = find_mac(mac);
		auto derive = [&](char letter, std::size_t size) {
			return derive_key(kex.shared_secret(), kex.exchange_hash(), letter, session_id_, size);
		};
		return make_packet_cipher(cipher, mac, derive(key_letter, c->key_size), derive(iv_letter, c->iv_size),
			m && !c->aead ? derive(mac_letter, m->key_size) : byte_vector{});
	};

	auto c2s = make(algorithms_->cipher_c2s, algorithms_->mac_c2s, 'A', 'C', 'E');
	auto s2c = make(algorithms_->cipher_s2c, algorithms_->mac_s2c, 'B', 'D', 'F');
	if(!c2s || !s2c) {
		set_error_and_disconnect(ssh_key_exchange_failed, "failed to create ciphers");
		return nullptr;
	}

	if(config_.side == transport_side::server) {
		in_cipher_ = std::move(c2s);
		return s2c;
	}
	in_cipher_ = std::move(s2c);
	return c2s;
}

void ssh_transport::handle_newkeys() {
	if(!in_cipher_) {
		set_error_and_disconnect(ssh_protocol_error, "unexpected newkeys");
		return;
	}
	reader_.set_cipher(std::move(in_cipher_));
	newkeys_received_ = true;

	if(newkeys_sent_) {
		finish_kex();
	}
}

void ssh_transport::finish_kex() {
	bool first = state_ != transport_state::transport;

	kex_.reset();
	algorithms_.reset();
	my_kexinit_.clear();
	peer_kexinit_.clear();
	kex_running_ = false;

	log_.log(logger::debug, "Key exchange done");
	if(first) {
		set_state(transport_state::transport);
	}

	while(!held_.empty() && state_ == transport_state::transport) {
		write_payload(held_.front());
		held_.pop_front();
	}

	on_kex_done(first);
}

}
