#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sshconsole {

std::optional<std::string> read_file(std::string const& file) {
	std::ifstream f(file, std::ios_base::binary);
	if(!f) {
		return std::nullopt;
	}
	std::ostringstream out;
	out << f.rdbuf();
	return out.str();
}

std::optional<std::string> home_path(std::string const& path) {
	char const* home = std::getenv("HOME");
	if(!home || !*home) {
		return std::nullopt;
	}
	return std::string(home) + "/" + path;
}

}
