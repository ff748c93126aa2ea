#include "random.hpp"

#include "config.hpp"

#include <algorithm>
#include <cerrno>
#include <stdexcept>

#if defined(HAVE_GETRANDOM)
#	include <sys/random.h>
#elif defined(HAVE_GETENTROPY)
#	include <unistd.h>
#else
#	error No operating system random source
#endif

namespace sshconsole::ssh {

// getentropy does not take more at once
std::size_t const max_random_chunk = 256;

void os_random::fill(span out) {
	while(!out.empty()) {
		std::size_t n = std::min(out.size(), max_random_chunk);
#if defined(HAVE_GETRANDOM)
		ssize_t res = ::getrandom(out.data(), n, 0);
		if(res < 0) {
			if(errno == EINTR) {
				continue;
			}
			throw std::runtime_error("getrandom failed");
		}
		n = std::size_t(res);
#else
		if(::getentropy(out.data(), n) != 0) {
			throw std::runtime_error("getentropy failed");
		}
#endif
		out = out.subspan(n);
	}
}

random& system_random() {
	static os_random r;
	return r;
}

}
