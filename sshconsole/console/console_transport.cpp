#include "console_transport.hpp"
#include "command_handler.hpp"

namespace sshconsole::ssh::console {

std::string_view const session_channel_type = "session";

console_transport::console_transport(server_config const& conf, console_callbacks const& cb, logger& log, logger& base_log, out_buffer& out, random& rand)
: ssh_server(conf, log, out, rand)
, callbacks_(cb)
, base_log_(base_log)
{
}

void console_transport::set_post_function(post_function p) {
	post_ = std::move(p);
}

std::unique_ptr<server_auth> console_transport::construct_auth() {
	return std::make_unique<auth_delegate>(*this, server_conf().auth, callbacks_.auth, base_log_, post_);
}

std::unique_ptr<ssh_connection> console_transport::construct_connection(auth_context const& info) {
	user_ = info.username;
	auto conn = std::make_unique<ssh_connection>(*this, server_conf().channel);
	conn->add_channel_type(std::string(session_channel_type),
		[this](ssh_transport& t, channel_side_info local) -> std::unique_ptr<channel> {
			command_context ctx{callbacks_.runner, post_, std::nullopt};
			if(!user_.empty()) {
				ctx.user = user_;
			}
			return std::make_unique<command_handler>(t, local, std::move(ctx));
		});

	return conn;
}

}
