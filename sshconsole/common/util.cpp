#include "util.hpp"

#include <nettle/base64.h>

namespace sshconsole::ssh {

std::string_view const whitespace = " \t\r\n";

std::string encode_base64(const_span data, bool pad) {
	std::string res(BASE64_ENCODE_RAW_LENGTH(data.size()), '\0');
	base64_encode_raw(res.data(), data.size(), as_uint8(data));
	if(!pad) {
		while(!res.empty() && res.back() == '=') {
			res.pop_back();
		}
	}
	return res;
}

std::optional<byte_vector> decode_base64(std::string_view text) {
	// nettle wants the padding
	std::string padded(text);
	while(padded.size() % 4) {
		padded += '=';
	}

	base64_decode_ctx ctx;
	base64_decode_init(&ctx);

	byte_vector res(BASE64_DECODE_LENGTH(padded.size()));
	std::size_t size = res.size();
	if(!base64_decode_update(&ctx, &size, as_uint8(res), padded.size(), padded.data())) {
		return std::nullopt;
	}
	if(!base64_decode_final(&ctx)) {
		return std::nullopt;
	}
	res.resize(size);
	return res;
}

std::string_view trim(std::string_view s) {
	auto begin = s.find_first_not_of(whitespace);
	if(begin == std::string_view::npos) {
		return {};
	}
	auto end = s.find_last_not_of(whitespace);
	return s.substr(begin, end - begin + 1);
}

std::vector<std::string_view> split(std::string_view s, char separator) {
	std::vector<std::string_view> res;
	while(true) {
		auto pos = s.find(separator);
		res.push_back(s.substr(0, pos));
		if(pos == std::string_view::npos) {
			break;
		}
		s.remove_prefix(pos + 1);
	}
	return res;
}

std::string_view take_word(std::string_view& s) {
	auto begin = s.find_first_not_of(" \t");
	if(begin == std::string_view::npos) {
		s = {};
		return {};
	}
	s.remove_prefix(begin);
	auto end = s.find_first_of(" \t");
	std::string_view word = s.substr(0, end);
	s.remove_prefix(word.size());
	return word;
}

std::string join_names(std::vector<std::string> const& names) {
	std::string res;
	for(auto&& n : names) {
		if(!res.empty()) {
			res += ',';
		}
		res += n;
	}
	return res;
}

bool contains_name(std::string_view list, std::string_view name) {
	for(auto n : split(list, ',')) {
		if(n == name) {
			return true;
		}
	}
	return false;
}

}
