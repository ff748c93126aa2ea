#ifndef SSHCONSOLE_CORE_CONNECTION_HEADER
#define SSHCONSOLE_CORE_CONNECTION_HEADER

#include "channel.hpp"
#include "transport.hpp"

#include <functional>
#include <map>
#include <memory>

namespace sshconsole::ssh {

using channel_factory = std::function<std::unique_ptr<channel>(ssh_transport&, channel_side_info local)>;

/** \brief Connection protocol (RFC 4254) on top of the transport
 *
 *  Channels the peer opens are created by the factory registered for the channel type, other types are refused.
 *  Global requests are not supported.
 */
class ssh_connection {
public:
	ssh_connection(ssh_transport&, channel_config const&);
	~ssh_connection();

	ssh_connection(ssh_connection const&) = delete;
	ssh_connection& operator=(ssh_connection const&) = delete;

	void add_channel_type(std::string type, channel_factory);

	/// opens channel to the peer, the channel is returned in opening state
	channel* open_channel(std::string_view type, channel_factory const&);

	channel* find_channel(std::uint32_t id) const;
	std::size_t channel_count() const { return channels_.size(); }

	handler_result handle(std::uint8_t type, const_span payload);

private:
	void handle_open(wire_reader&);
	void handle_global_request(wire_reader&);
	std::optional<std::uint32_t> free_id() const;

	ssh_transport& transport_;
	channel_config const& config_;
	logger& log_;

	std::map<std::string, channel_factory, std::less<>> factories_;
	std::map<std::uint32_t, std::unique_ptr<channel>> channels_;
	std::uint32_t next_id_{};
};

}

#endif
