#include "auth_delegate.hpp"

#include <atomic>

namespace sshconsole::ssh::console {

namespace detail {
struct auth_attempt {
	auth_attempt(logger& l, post_function p)
	: log(l)
	, post(std::move(p))
	{}

	logger& log;
	post_function post;
	// pending, failed or succeeded
	std::atomic<int> result{pending};

	static int const pending = 0;
	static int const failed = 1;
	static int const succeeded = 2;
};
}

auth_bits auth_delegates::methods() const {
	auth_bits res = auth_none;
	if(password) {
		res |= auth_password;
	}
	if(public_key) {
		res |= auth_public_key;
	}
	return res;
}

auth_completion::auth_completion(std::shared_ptr<detail::auth_attempt> a)
: attempt_(std::move(a))
{
}

bool auth_completion::operator()(bool success) const {
	int expected = detail::auth_attempt::pending;
	int value = success ? detail::auth_attempt::succeeded : detail::auth_attempt::failed;
	if(!attempt_->result.compare_exchange_strong(expected, value, std::memory_order_acq_rel)) {
		attempt_->log.log(logger::error, "Authentication completion called more than once, ignoring [success={}]", success);
		return false;
	}
	if(attempt_->post) {
		attempt_->post([]{});
	}
	return true;
}

auth_delegate::auth_delegate(ssh_transport& t, auth_config const& conf, auth_delegates const& d, logger& log, post_function post)
: server_auth(t, conf)
, delegates_(d)
, completion_log_(log)
, post_(std::move(post))
{
}

auth_bits auth_delegate::allowed_methods() const {
	return server_auth::allowed_methods() & delegates_.methods();
}

template<typename Call>
auth_state auth_delegate::resolve(Call&& call) {
	if(!attempt_) {
		attempt_ = std::make_shared<detail::auth_attempt>(completion_log_, post_);
		call(auth_completion(attempt_));
	}

	int res = attempt_->result.load(std::memory_order_acquire);
	if(res == detail::auth_attempt::pending) {
		return auth_state::pending;
	}

	attempt_.reset();
	return res == detail::auth_attempt::succeeded ? auth_state::succeeded : auth_state::failed;
}

auth_state auth_delegate::verify_password(auth_context const& ctx, std::string_view password) {
	if(!delegates_.password) {
		return auth_state::failed;
	}
	return resolve([&](auth_completion c) {
			delegates_.password(ctx.username, std::string(password), std::move(c));
		});
}

auth_state auth_delegate::verify_public_key(auth_context const& ctx, ssh_public_key const& key) {
	if(!delegates_.public_key) {
		return auth_state::failed;
	}
	return resolve([&](auth_completion c) {
			delegates_.public_key(ctx.username, public_key_credential(key), std::move(c));
		});
}

void auth_delegate::auth_succeeded(auth_context const& ctx) {
	user_ = ctx.username;
}

}
