#ifndef SSHCONSOLE_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define SSHCONSOLE_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <type_traits>

namespace sshconsole {

struct option_base {
	virtual ~option_base() = default;
	virtual void parse(std::vector<std::string> const&) = 0;
	virtual void print(std::ostream&) const = 0;
};

struct option {
	std::string name;
	std::string alias;
	std::string info;
	std::unique_ptr<option_base> extract;
};

/// Parses "--name value" and "-alias value" style command line options to the registered variables
class command_parser {
public:
	template<typename T>
	void add(T& var, std::string name, std::string alias, std::string info);

	/// named parameter with optional value, set to default constructed T if no value is given
	template<typename T>
	void add(std::optional<T>& var, std::string name, std::string alias, std::string info);

	/// flag without value
	void add(bool& var, std::string name, std::string alias, std::string info);

	void parse(int argc, char* args[]);
	void parse(std::string const&);

	void print_help(std::ostream&) const;

private:
	template<typename Option, typename T>
	void add_impl(T& var, std::string name, std::string alias, std::string info);
	std::string parse_arg(std::istream& in);
	void parse_args(std::istream& in, std::string const& name);

private:
	std::map<std::string, std::shared_ptr<option>> options_;
};

struct invalid_argument : std::runtime_error {
	using std::runtime_error::runtime_error;
};

std::string join(std::vector<std::string> const&, std::string_view separator);

template<typename T>
struct value_option : option_base {
	value_option(T& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() != 1) {
			throw invalid_argument("expected one argument: [" + join(args, ",") + "]");
		}
		if constexpr(std::is_same_v<std::string, T>) {
			value_ = args[0];
		} else {
			std::istringstream in(args[0]);
			if(!(in >> value_) || !(in >> std::ws).eof()) {
				throw invalid_argument("failed to interpret argument '" + args[0] + "'");
			}
		}
	}

	void print(std::ostream& o) const override {
		o << value_;
	}

	T& value_;
};

template<typename T>
struct optional_option : option_base {
	optional_option(std::optional<T>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() > 1) {
			throw invalid_argument("expected at most one argument: [" + join(args, ",") + "]");
		}
		value_.emplace();
		if(!args.empty()) {
			value_option<T>(*value_).parse(args);
		}
	}

	void print(std::ostream& o) const override {
		if(value_) {
			o << *value_;
		}
	}

	std::optional<T>& value_;
};

template<typename Option, typename T>
void command_parser::add_impl(T& var, std::string name, std::string alias, std::string info) {
	auto p = std::make_shared<option>(option{name, alias, std::move(info), std::make_unique<Option>(var)});
	if(!name.empty()) {
		options_.insert({"--" + name, p});
	}
	if(!alias.empty()) {
		options_.insert({"-" + alias, p});
	}
}

template<typename T>
void command_parser::add(T& var, std::string name, std::string alias, std::string info) {
	add_impl<value_option<T>>(var, std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::optional<T>& var, std::string name, std::string alias, std::string info) {
	add_impl<optional_option<T>>(var, std::move(name), std::move(alias), std::move(info));
}

}

#endif
