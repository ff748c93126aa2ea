#ifndef SSHCONSOLE_CORE_USER_AUTH_HEADER
#define SSHCONSOLE_CORE_USER_AUTH_HEADER

#include "ssh_keys.hpp"
#include "transport.hpp"
#include "wire.hpp"

namespace sshconsole::ssh {

enum auth_type : std::uint32_t {
	auth_none = 0,
	auth_password = 1,
	auth_public_key = 2
};
using auth_bits = std::uint32_t;

std::string_view to_string(auth_type);

/// comma separated method names for the bits
std::string auth_method_names(auth_bits);

enum class auth_state {
	pending,
	failed,
	succeeded
};

struct auth_config {
	// methods offered to the client
	auth_bits allowed{auth_password | auth_public_key};
	// failed password and public key attempts before disconnecting
	std::size_t num_of_tries{5};
	// sent before the first authentication reply if not empty
	std::string banner;
};

struct auth_context {
	std::string username;
	std::string service;
};

/** \brief Server side of the user authentication protocol (RFC 4252)
 *
 *  Supports none, password and publickey. A verification can return pending, the request is then
 *  handled again by the transport when it is processed next time.
 */
class server_auth {
public:
	server_auth(ssh_transport&, auth_config const&);
	virtual ~server_auth() = default;

	server_auth(server_auth const&) = delete;
	server_auth& operator=(server_auth const&) = delete;

	handler_result handle(std::uint8_t type, const_span payload);

	bool succeeded() const { return succeeded_; }
	/// user and service of the successful authentication
	auth_context const& info() const { return info_; }

	std::size_t failures() const { return failures_; }

protected:
	virtual auth_bits allowed_methods() const { return config_.allowed; }
	virtual auth_state verify_password(auth_context const&, std::string_view /*password*/) { return auth_state::failed; }
	/// called after the signature has been checked
	virtual auth_state verify_public_key(auth_context const&, ssh_public_key const&) { return auth_state::failed; }
	virtual void auth_succeeded(auth_context const&) {}

	ssh_transport& transport_;
	auth_config const& config_;
	logger& log_;

private:
	std::optional<auth_state> handle_password(auth_context const&, wire_reader&);
	// nullopt when the client only asked if the key is acceptable
	std::optional<auth_state> handle_public_key(auth_context const&, wire_reader&);
	void send_banner();
	void send_failure();
	void failed();

	bool banner_sent_{};
	bool succeeded_{};
	std::size_t failures_{};
	auth_context info_;
};

}

#endif
