#ifndef SSHCONSOLE_CONSOLE_COMMAND_HANDLER_HEADER
#define SSHCONSOLE_CONSOLE_COMMAND_HANDLER_HEADER

#include "callbacks.hpp"
#include "output.hpp"

#include "sshconsole/core/channel.hpp"

namespace sshconsole::ssh::console {

enum class command_state {
	awaiting_exec,
	dispatched,
	closed
};
std::string_view to_string(command_state);

struct command_context {
	command_runner runner;
	// runs functions on the connection's event loop
	post_function post;
	// authenticated user, empty if not known
	std::optional<std::string> user;
};

/** \brief Session channel that runs a single exec request
 *
 *  Environment requests before the exec are collected and passed to the runner.
 *  Input from the client is not accepted, it is answered with an error and the channel is closed.
 */
class command_handler : public channel {
public:
	command_handler(ssh_transport&, channel_side_info local, command_context);
	~command_handler();

	command_state exec_state() const { return exec_state_; }
	environment const& env() const { return env_; }

	/// output for the command, can be created only once for the channel
	std::shared_ptr<output> make_output();

protected:
	void on_request(std::string_view name, bool want_reply, wire_reader& extra) override;
	void on_data(const_span) override;
	void on_extended_data(std::uint32_t data_type, const_span) override;
	void on_closing() override;
	void on_state_change() override;

private:
	class output_link;
	friend class output_link;

	void handle_env(bool want_reply, wire_reader&);
	void handle_exec(bool want_reply, wire_reader&);
	void run_command(std::string const& command);
	void reject_input();
	void write_output(std::uint32_t data_type, std::string data);
	void finish(std::uint32_t exit_status);

private:
	command_context context_;
	command_state exec_state_{command_state::awaiting_exec};
	environment env_;

	std::shared_ptr<output_link> link_;
	bool output_made_{};
	bool finished_{};
	bool input_rejected_{};
	std::uint32_t exit_status_{};
};

}

#endif
