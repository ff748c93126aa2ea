#include "channel.hpp"
#include "transport.hpp"

#include <algorithm>
#include <limits>

namespace sshconsole::ssh {

std::string_view to_string(channel_state s) {
	using enum channel_state;
	switch(s) {
		case opening:       return "opening";
		case established:   return "established";
		case close_pending: return "close_pending";
		case closed:        return "closed";
		case open_failed:   return "open_failed";
	}
	return "unknown";
}

channel::channel(ssh_transport& t, channel_side_info local)
: transport_(t)
, log_(t.log())
, initial_window_(local.window)
, local_(local)
{
}

channel::~channel() = default;

void channel::set_state(channel_state s) {
	if(s != state_) {
		log_.log(logger::debug, "Channel state [id={}, {} -> {}]", local_.id, to_string(state_), to_string(s));
		state_ = s;
		on_state_change();
	}
}

void channel::opened(channel_side_info remote, const_span extra) {
	remote_ = remote;
	set_state(channel_state::established);
	on_open_confirmed(extra);
}

void channel::open_failed(std::uint32_t code, std::string_view message) {
	set_state(channel_state::open_failed);
	on_open_failed(code, message);
}

bool channel::send_data(const_span data) {
	return send_extended_data(0, data);
}

bool channel::send_extended_data(std::uint32_t data_type, const_span data) {
	if(state_ != channel_state::established || eof_requested_ || close_requested_) {
		return false;
	}
	queue_data(data_type, data);
	flush();
	return true;
}

void channel::queue_data(std::uint32_t data_type, const_span data) {
	if(data.empty()) {
		return;
	}
	queue_.push_back(pending_data{data_type, byte_vector(data.begin(), data.end())});
	queued_size_ += data.size();
}

void channel::flush() {
	if(state_ != channel_state::established) {
		return;
	}

	while(!queue_.empty() && remote_.window > 0) {
		pending_data& front = queue_.front();
		std::size_t n = std::min<std::size_t>({front.data.size() - front.sent, remote_.window, remote_.max_packet});
		if(n == 0) {
			break;
		}

		wire_writer w(front.type ? ssh_channel_extended_data : ssh_channel_data);
		w.add_uint32(remote_.id);
		if(front.type) {
			w.add_uint32(front.type);
		}
		w.add_blob(const_span(front.data).subspan(front.sent, n));
		transport_.send_payload(w.data());

		remote_.window -= std::uint32_t(n);
		queued_size_ -= n;
		front.sent += n;
		if(front.sent == front.data.size()) {
			queue_.pop_front();
		}
	}

	if(!queue_.empty()) {
		log_.log(logger::trace, "Waiting for window [channel={}, queued={}]", local_.id, queued_size_);
		return;
	}

	if(eof_requested_ && !eof_sent_) {
		eof_sent_ = true;
		transport_.send_payload(wire_writer(ssh_channel_eof).add_uint32(remote_.id).take());
	}
	if(close_requested_ && !close_sent_) {
		do_close();
	}
}

void channel::send_eof() {
	if(state_ != channel_state::established || eof_requested_) {
		return;
	}
	eof_requested_ = true;
	flush();
}

void channel::send_close() {
	if(state_ != channel_state::established || close_requested_) {
		return;
	}
	close_requested_ = true;
	flush();
}

void channel::do_close() {
	on_closing();
	close_sent_ = true;
	transport_.send_payload(wire_writer(ssh_channel_close).add_uint32(remote_.id).take());
	set_state(close_received_ ? channel_state::closed : channel_state::close_pending);
}

bool channel::send_request(std::string_view name, bool want_reply, const_span extra) {
	if(state_ != channel_state::established || close_sent_) {
		return false;
	}
	transport_.send_payload(wire_writer(ssh_channel_request)
		.add_uint32(remote_.id)
		.add_string(name)
		.add_bool(want_reply)
		.add_raw(extra)
		.take());
	return true;
}

void channel::send_request_reply(bool success) {
	if(state_ != channel_state::established || close_sent_) {
		return;
	}
	transport_.send_payload(wire_writer(success ? ssh_channel_success : ssh_channel_failure)
		.add_uint32(remote_.id)
		.take());
}

void channel::on_request(std::string_view name, bool want_reply, wire_reader&) {
	log_.log(logger::debug, "Unsupported channel request [channel={}, name={}]", local_.id, name);
	if(want_reply) {
		send_request_reply(false);
	}
}

void channel::consume_window(std::size_t n) {
	if(n > local_.window) {
		log_.log(logger::info, "Peer sent more than the window [channel={}]", local_.id);
		local_.window = 0;
	} else {
		local_.window -= std::uint32_t(n);
	}

	if(state_ == channel_state::established && local_.window < initial_window_ / 2) {
		transport_.send_payload(wire_writer(ssh_channel_window_adjust)
			.add_uint32(remote_.id)
			.add_uint32(initial_window_ - local_.window)
			.take());
		local_.window = initial_window_;
	}
}

bool channel::handle(std::uint8_t type, wire_reader& in) {
	switch(type) {
		case ssh_channel_window_adjust: {
			std::uint32_t add = in.read_uint32();
			if(!in) {
				return false;
			}
			std::uint64_t w = std::uint64_t(remote_.window) + add;
			remote_.window = std::uint32_t(std::min<std::uint64_t>(w, std::numeric_limits<std::uint32_t>::max()));
			flush();
			return true;
		}
		case ssh_channel_data: {
			const_span data = in.read_blob();
			if(!in) {
				return false;
			}
			consume_window(data.size());
			if(state_ == channel_state::established && !eof_received_) {
				on_data(data);
			}
			return true;
		}
		case ssh_channel_extended_data: {
			std::uint32_t data_type = in.read_uint32();
			const_span data = in.read_blob();
			if(!in) {
				return false;
			}
			consume_window(data.size());
			if(state_ == channel_state::established && !eof_received_) {
				on_extended_data(data_type, data);
			}
			return true;
		}
		case ssh_channel_eof:
			eof_received_ = true;
			on_eof();
			return true;
		case ssh_channel_close:
			close_received_ = true;
			on_close();
			// the peer does not read anything after its close
			queue_.clear();
			queued_size_ = 0;
			if(!close_sent_ && state_ == channel_state::established) {
				do_close();
			}
			set_state(channel_state::closed);
			return true;
		case ssh_channel_request: {
			std::string_view name = in.read_string();
			bool want_reply = in.read_bool();
			if(!in) {
				return false;
			}
			if(state_ == channel_state::established) {
				on_request(name, want_reply, in);
			}
			return true;
		}
		case ssh_channel_success:
		case ssh_channel_failure:
			on_request_reply(type == ssh_channel_success);
			return true;
	}
	return false;
}

}
