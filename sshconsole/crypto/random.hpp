#ifndef SSHCONSOLE_CRYPTO_RANDOM_HEADER
#define SSHCONSOLE_CRYPTO_RANDOM_HEADER

#include "sshconsole/common/types.hpp"

namespace sshconsole::ssh {

class random {
public:
	virtual ~random() = default;

	virtual void fill(span) = 0;

	byte_vector bytes(std::size_t n) {
		byte_vector res(n);
		fill(res);
		return res;
	}
};

/// randomness from the operating system, throws std::runtime_error if it cannot be read
class os_random : public random {
public:
	void fill(span) override;
};

/// process wide os_random, safe to use from any thread
random& system_random();

}

#endif
