#include "output.hpp"

namespace sshconsole::ssh::console {

output::output(post_function post, std::weak_ptr<output_target> target)
: post_(std::move(post))
, target_(std::move(target))
{
}

output::~output() {
	release();
}

void output::post_write(std::uint32_t data_type, std::string_view text) {
	if(released_ || text.empty()) {
		return;
	}
	post_([t = target_, data_type, data = std::string(text)]() mutable {
		if(auto target = t.lock()) {
			target->write_output(data_type, std::move(data));
		}
	});
}

void output::write(std::string_view text) {
	post_write(0, text);
}

void output::write_error(std::string_view text) {
	post_write(1, text);
}

void output::set_exit_status(std::uint32_t status) {
	exit_status_ = status;
}

void output::release() {
	if(released_.exchange(true)) {
		return;
	}
	post_([t = target_, status = exit_status_.load()] {
		if(auto target = t.lock()) {
			target->finish(status);
		}
	});
}

}
