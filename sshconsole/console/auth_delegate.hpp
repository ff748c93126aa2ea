#ifndef SSHCONSOLE_CONSOLE_AUTH_DELEGATE_HEADER
#define SSHCONSOLE_CONSOLE_AUTH_DELEGATE_HEADER

#include "callbacks.hpp"
#include "keys.hpp"

#include "sshconsole/core/user_auth.hpp"

namespace sshconsole::ssh::console {

struct auth_delegates {
	password_authenticator password;
	public_key_authenticator public_key;

	// methods that have a delegate
	auth_bits methods() const;
};

namespace detail {
struct auth_attempt;
}

/** \brief Single-shot result of one authentication attempt
 *
 *  Copies share the same attempt, the first call decides the result and later calls are rejected.
 *  Can be called from any thread, but not after the server that issued it has been destroyed.
 */
class auth_completion {
public:
	explicit auth_completion(std::shared_ptr<detail::auth_attempt>);

	/// returns false if the attempt was already resolved
	bool operator()(bool success) const;

private:
	std::shared_ptr<detail::auth_attempt> attempt_;
};

/// User authentication that hands password and public key attempts to the configured delegates
class auth_delegate : public server_auth {
public:
	/// log is used for rejected completions and must outlive them, post wakes the connection when a completion comes later
	auth_delegate(ssh_transport&, auth_config const&, auth_delegates const&, logger& log, post_function post);

	/// name of the authenticated user, valid when the service is done
	std::string const& user() const { return user_; }

protected:
	auth_bits allowed_methods() const override;
	auth_state verify_password(auth_context const&, std::string_view password) override;
	auth_state verify_public_key(auth_context const&, ssh_public_key const&) override;
	void auth_succeeded(auth_context const&) override;

private:
	template<typename Call>
	auth_state resolve(Call&& call);

private:
	auth_delegates const& delegates_;
	logger& completion_log_;
	post_function post_;

	// in flight attempt, kept until the result has been consumed
	std::shared_ptr<detail::auth_attempt> attempt_;
	std::string user_;
};

}

#endif
