#include "connection.hpp"

namespace sshconsole::ssh {

ssh_connection::ssh_connection(ssh_transport& t, channel_config const& config)
: transport_(t)
, config_(config)
, log_(t.log())
{
}

ssh_connection::~ssh_connection() = default;

void ssh_connection::add_channel_type(std::string type, channel_factory f) {
	factories_[std::move(type)] = std::move(f);
}

std::optional<std::uint32_t> ssh_connection::free_id() const {
	if(channels_.size() >= config_.max_channels) {
		return std::nullopt;
	}
	std::uint32_t id = next_id_;
	while(channels_.contains(id)) {
		++id;
	}
	return id;
}

channel* ssh_connection::find_channel(std::uint32_t id) const {
	auto it = channels_.find(id);
	return it != channels_.end() ? it->second.get() : nullptr;
}

channel* ssh_connection::open_channel(std::string_view type, channel_factory const& f) {
	auto id = free_id();
	if(!id) {
		log_.log(logger::error, "Too many channels");
		return nullptr;
	}

	channel_side_info local{*id, config_.initial_window_size, config_.max_packet_size};
	auto ch = f(transport_, local);
	if(!ch) {
		return nullptr;
	}

	next_id_ = *id + 1;
	channel* res = ch.get();
	channels_[*id] = std::move(ch);

	log_.log(logger::debug, "Opening channel [id={}, type={}]", *id, type);
	transport_.send_payload(wire_writer(ssh_channel_open)
		.add_string(type)
		.add_uint32(local.id)
		.add_uint32(local.window)
		.add_uint32(local.max_packet)
		.take());
	return res;
}

void ssh_connection::handle_open(wire_reader& in) {
	std::string_view type = in.read_string();
	channel_side_info remote;
	remote.id = in.read_uint32();
	remote.window = in.read_uint32();
	remote.max_packet = in.read_uint32();
	if(!in) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "invalid channel open");
		return;
	}

	auto refuse = [&](channel_open_code code, std::string_view message) {
		log_.log(logger::info, "Refusing channel [type={}, reason={}]", type, message);
		transport_.send_payload(wire_writer(ssh_channel_open_failure)
			.add_uint32(remote.id)
			.add_uint32(code)
			.add_string(message)
			.add_string("")
			.take());
	};

	auto f = factories_.find(type);
	if(f == factories_.end()) {
		refuse(ssh_open_administratively_prohibited, "channel type not allowed");
		return;
	}

	auto id = free_id();
	if(!id) {
		refuse(ssh_open_resource_shortage, "too many channels");
		return;
	}

	channel_side_info local{*id, config_.initial_window_size, config_.max_packet_size};
	auto ch = f->second(transport_, local);
	if(!ch) {
		refuse(ssh_open_resource_shortage, "failed to create channel");
		return;
	}

	next_id_ = *id + 1;
	channel& c = *ch;
	channels_[*id] = std::move(ch);

	log_.log(logger::debug, "Channel opened [id={}, type={}, remote id={}]", *id, type, remote.id);
	transport_.send_payload(wire_writer(ssh_channel_open_confirmation)
		.add_uint32(remote.id)
		.add_uint32(local.id)
		.add_uint32(local.window)
		.add_uint32(local.max_packet)
		.take());
	c.opened(remote, {});
}

void ssh_connection::handle_global_request(wire_reader& in) {
	std::string_view name = in.read_string();
	bool want_reply = in.read_bool();
	if(!in) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "invalid global request");
		return;
	}
	log_.log(logger::debug, "Global request not supported [name={}]", name);
	if(want_reply) {
		transport_.send_payload(wire_writer(ssh_request_failure).take());
	}
}

handler_result ssh_connection::handle(std::uint8_t type, const_span payload) {
	wire_reader in(payload);
	in.read_byte();

	switch(type) {
		case ssh_global_request:
			handle_global_request(in);
			return handler_result::handled;
		case ssh_request_success:
		case ssh_request_failure:
			// we do not send global requests
			return handler_result::handled;
		case ssh_channel_open:
			handle_open(in);
			return handler_result::handled;
	}

	if(type < ssh_channel_open_confirmation || type > ssh_channel_failure) {
		return handler_result::unknown;
	}

	std::uint32_t id = in.read_uint32();
	auto it = channels_.find(id);
	if(!in || it == channels_.end()) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "message for unknown channel " + std::to_string(id));
		return handler_result::handled;
	}

	channel& ch = *it->second;
	bool ok = true;
	if(type == ssh_channel_open_confirmation || type == ssh_channel_open_failure) {
		if(ch.state() != channel_state::opening) {
			ok = false;
		} else if(type == ssh_channel_open_confirmation) {
			channel_side_info remote;
			remote.id = in.read_uint32();
			remote.window = in.read_uint32();
			remote.max_packet = in.read_uint32();
			ok = in.ok();
			if(ok) {
				ch.opened(remote, in.rest());
			}
		} else {
			std::uint32_t code = in.read_uint32();
			std::string_view message = in.read_string();
			ok = in.ok();
			if(ok) {
				ch.open_failed(code, message);
			}
		}
	} else {
		ok = ch.handle(type, in);
	}

	if(!ok) {
		transport_.set_error_and_disconnect(ssh_protocol_error, "invalid channel message");
		return handler_result::handled;
	}

	if(ch.state() == channel_state::closed || ch.state() == channel_state::open_failed) {
		log_.log(logger::debug, "Removing channel [id={}]", id);
		channels_.erase(id);
	}
	return handler_result::handled;
}

}
