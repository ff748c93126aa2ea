#include "command_handler.hpp"

#include "sshconsole/common/logger.hpp"
#include "sshconsole/core/protocol.hpp"

#include <exception>

namespace sshconsole::ssh::console {

std::string_view const input_not_accepted = "Input Not Accepted\r\n";

std::uint32_t const runner_failed_status = 1;

std::string_view to_string(command_state s) {
	using enum command_state;
	switch(s) {
		case awaiting_exec: return "awaiting_exec";
		case dispatched:    return "dispatched";
		case closed:        return "closed";
	}
	return "unknown";
}

// forwards the output to the handler as long as the channel exists
class command_handler::output_link : public output_target {
public:
	output_link(command_handler& h) : handler_(&h) {}

	void write_output(std::uint32_t data_type, std::string data) override {
		if(handler_) {
			handler_->write_output(data_type, std::move(data));
		}
	}

	void finish(std::uint32_t exit_status) override {
		if(handler_) {
			handler_->finish(exit_status);
		}
	}

	void reset() { handler_ = nullptr; }

private:
	command_handler* handler_;
};

command_handler::command_handler(ssh_transport& t, channel_side_info local, command_context ctx)
: channel(t, local)
, context_(std::move(ctx))
, link_(std::make_shared<output_link>(*this))
{
}

command_handler::~command_handler() {
	link_->reset();
}

std::shared_ptr<output> command_handler::make_output() {
	if(output_made_) {
		log_.log(logger::error, "Output created second time for channel id={}, aborting", id());
		std::terminate();
	}
	output_made_ = true;
	return std::make_shared<output>(context_.post, link_);
}

void command_handler::on_request(std::string_view name, bool want_reply, wire_reader& extra) {
	log_.log(logger::debug, "Channel request [channel={}, name={}, reply={}]", id(), name, want_reply);
	if(name == "env") {
		handle_env(want_reply, extra);
	} else if(name == "exec") {
		handle_exec(want_reply, extra);
	} else {
		channel::on_request(name, want_reply, extra);
	}
}

void command_handler::handle_env(bool want_reply, wire_reader& in) {
	std::string_view var = in.read_string();
	std::string_view value = in.read_string();
	if(!in) {
		log_.log(logger::error, "Invalid env request [channel={}]", id());
		if(want_reply) {
			send_request_reply(false);
		}
		return;
	}

	if(exec_state_ == command_state::awaiting_exec) {
		env_[std::string(var)] = std::string(value);
	} else {
		log_.log(logger::debug, "Env request after exec ignored [channel={}, name={}]", id(), var);
	}

	if(want_reply) {
		send_request_reply(true);
	}
}

void command_handler::handle_exec(bool want_reply, wire_reader& in) {
	std::string command(in.read_string());
	if(!in) {
		log_.log(logger::error, "Invalid exec request [channel={}]", id());
		if(want_reply) {
			send_request_reply(false);
		}
		return;
	}

	if(exec_state_ != command_state::awaiting_exec) {
		log_.log(logger::info, "Refusing exec request [channel={}, state={}]", id(), to_string(exec_state_));
		if(want_reply) {
			send_request_reply(false);
		}
		return;
	}

	exec_state_ = command_state::dispatched;
	if(want_reply) {
		send_request_reply(true);
	}

	log_.log(logger::info, "Running command [channel={}, user={}, command={}]", id(), context_.user.value_or(""), command);
	run_command(command);
}

void command_handler::run_command(std::string const& command) {
	// released when the runner lets go of it, also when the runner throws
	auto out = make_output();
	try {
		context_.runner(command, out, context_.user, env_);
	} catch(std::exception const& e) {
		log_.log(logger::error, "Command runner failed [channel={}, error={}]", id(), e.what());
		out->set_exit_status(runner_failed_status);
	} catch(...) {
		log_.log(logger::error, "Command runner failed with unknown exception [channel={}]", id());
		out->set_exit_status(runner_failed_status);
	}
}

void command_handler::reject_input() {
	if(state() != channel_state::established || input_rejected_) {
		return;
	}
	log_.log(logger::info, "Input not accepted, closing channel id={}", id());
	input_rejected_ = true;
	send_extended_data(extended_stderr, to_span(input_not_accepted));
	send_close();
}

void command_handler::on_data(const_span) {
	reject_input();
}

void command_handler::on_extended_data(std::uint32_t, const_span) {
	reject_input();
}

void command_handler::write_output(std::uint32_t data_type, std::string data) {
	if(state() != channel_state::established || finished_ || input_rejected_) {
		return;
	}
	if(data_type == 0) {
		send_data(to_span(data));
	} else {
		send_extended_data(data_type, to_span(data));
	}
}

void command_handler::finish(std::uint32_t exit_status) {
	if(finished_ || input_rejected_) {
		return;
	}
	finished_ = true;
	exit_status_ = exit_status;
	// both wait for the queued output
	send_eof();
	send_close();
}

void command_handler::on_closing() {
	if(finished_) {
		log_.log(logger::debug, "Sending exit status [channel={}, status={}]", id(), exit_status_);
		std::byte status[4];
		store_be32(status, exit_status_);
		send_request("exit-status", false, status);
	}
}

void command_handler::on_state_change() {
	if(state() == channel_state::close_pending || state() == channel_state::closed) {
		exec_state_ = command_state::closed;
	}
}

}
