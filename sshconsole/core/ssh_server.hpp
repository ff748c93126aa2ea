#ifndef SSHCONSOLE_CORE_SSH_SERVER_HEADER
#define SSHCONSOLE_CORE_SSH_SERVER_HEADER

#include "connection.hpp"
#include "user_auth.hpp"

namespace sshconsole::ssh {

struct server_config : transport_config {
	server_config() { side = transport_side::server; }

	auth_config auth;
	channel_config channel;
};

/** \brief Server transport with the user authentication and connection services
 *
 *  The client must authenticate before the connection protocol is started.
 */
class ssh_server : public ssh_transport {
public:
	ssh_server(server_config const&, logger&, out_buffer&, random&);
	~ssh_server();

	server_config const& server_conf() const { return server_config_; }

	/// null before the client requested the authentication service
	server_auth* auth() const { return auth_.get(); }

	/// null before the user is authenticated
	ssh_connection* connection() const { return connection_.get(); }

protected:
	virtual std::unique_ptr<server_auth> construct_auth();
	/// nullptr refuses the service
	virtual std::unique_ptr<ssh_connection> construct_connection(auth_context const&);

	handler_result handle_message(std::uint8_t type, const_span payload) override;

private:
	void handle_service_request(const_span payload);

	server_config const& server_config_;
	std::unique_ptr<server_auth> auth_;
	std::unique_ptr<ssh_connection> connection_;
};

}

#endif
