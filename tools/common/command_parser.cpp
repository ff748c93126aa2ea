#include "command_parser.hpp"

#include <iomanip>

namespace sshconsole {

std::string join(std::vector<std::string> const& v, std::string_view separator) {
	std::string res;
	for(auto&& s : v) {
		if(!res.empty()) {
			res += separator;
		}
		res += s;
	}
	return res;
}

void command_parser::parse(int argc, char* args[]) {
	std::string s;
	for(int i = 1; i < argc; ++i) {
		if(i > 1) {
			s += " ";
		}
		std::string arg = args[i];
		if(arg.find_first_of(" \t") != std::string::npos) {
			arg = '"' + arg + '"';
		}
		s += arg;
	}
	parse(s);
}

std::string command_parser::parse_arg(std::istream& in) {
	std::string s;
	if(in.peek() == '"') {
		in.ignore();
		if(!std::getline(in, s, '"')) {
			throw invalid_argument("missing closing quote");
		}
	} else {
		in >> s;
	}
	return s;
}

void command_parser::parse_args(std::istream& in, std::string const& name) {
	auto it = options_.find(name);
	if(it == options_.end()) {
		throw invalid_argument("unknown option '" + name + "'");
	}

	std::vector<std::string> args;
	while(in >> std::ws && in.peek() != '-') {
		args.push_back(parse_arg(in));
	}

	it->second->extract->parse(args);
}

void command_parser::parse(std::string const& s) {
	std::istringstream in(s);
	while(in >> std::ws) {
		if(in.peek() == '-') {
			std::string name;
			in >> name;
			parse_args(in, name);
		} else {
			throw invalid_argument("unexpected argument '" + parse_arg(in) + "'");
		}
	}
}

void command_parser::print_help(std::ostream& out) const {
	for(auto&& [key, opt] : options_) {
		if(key.starts_with("--")) {
			std::string names = key;
			if(!opt->alias.empty()) {
				names += ", -" + opt->alias;
			}
			out << "  " << std::left << std::setw(30) << names << " " << opt->info;

			std::ostringstream value;
			opt->extract->print(value);
			if(!value.str().empty()) {
				out << " (" << value.str() << ")";
			}
			out << "\n";
		}
	}
}

struct flag_option : option_base {
	flag_option(bool& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(!args.empty()) {
			throw invalid_argument("flag does not take arguments: [" + join(args, ",") + "]");
		}
		value_ = true;
	}

	void print(std::ostream& o) const override {
		o << (value_ ? "true" : "false");
	}

	bool& value_;
};

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_impl<flag_option>(var, std::move(name), std::move(alias), std::move(info));
}

}
