#ifndef SSHCONSOLE_CORE_CHANNEL_HEADER
#define SSHCONSOLE_CORE_CHANNEL_HEADER

#include "wire.hpp"

#include <deque>

namespace sshconsole::ssh {

class logger;
class ssh_transport;

enum class channel_state {
	opening,
	established,
	close_pending, // we have sent close and wait for the peer's close
	closed,
	open_failed
};
std::string_view to_string(channel_state);

struct channel_config {
	std::uint32_t initial_window_size{2 * 1024 * 1024};
	std::uint32_t max_packet_size{32 * 1024};
	std::size_t max_channels{16};
};

/// channel id, window and maximum packet size of one side
struct channel_side_info {
	std::uint32_t id{};
	std::uint32_t window{};
	std::uint32_t max_packet{};
};

/** \brief Channel of the connection protocol (RFC 4254 section 5)
 *
 *  Data that does not fit the peer's window is queued without limit and sent when the window is adjusted.
 *  EOF and close are sent only after the queued data.
 */
class channel {
public:
	channel(ssh_transport&, channel_side_info local);
	virtual ~channel();

	channel(channel const&) = delete;
	channel& operator=(channel const&) = delete;

	std::uint32_t id() const { return local_.id; }
	channel_state state() const { return state_; }
	channel_side_info const& remote() const { return remote_; }

	/// false if the channel is not established or output is already ended
	bool send_data(const_span);
	bool send_extended_data(std::uint32_t data_type, const_span);

	void send_eof();
	void send_close();

	bool send_request(std::string_view name, bool want_reply, const_span extra = {});
	void send_request_reply(bool success);

	/// bytes waiting for window
	std::size_t queued_size() const { return queued_size_; }

	bool eof_received() const { return eof_received_; }

public: // called by ssh_connection
	void opened(channel_side_info remote, const_span extra);
	void open_failed(std::uint32_t code, std::string_view message);
	bool handle(std::uint8_t type, wire_reader& in);

protected:
	virtual void on_open_confirmed(const_span /*extra*/) {}
	virtual void on_open_failed(std::uint32_t /*code*/, std::string_view /*message*/) {}
	virtual void on_data(const_span) {}
	virtual void on_extended_data(std::uint32_t /*data_type*/, const_span) {}
	virtual void on_eof() {}
	/// the reader is positioned after want_reply, the default replies failure
	virtual void on_request(std::string_view name, bool want_reply, wire_reader& extra);
	virtual void on_request_reply(bool /*success*/) {}
	/// called just before our close is sent
	virtual void on_closing() {}
	/// the peer has closed the channel
	virtual void on_close() {}
	virtual void on_state_change() {}

	void set_state(channel_state);

	ssh_transport& transport_;
	logger& log_;

private:
	void queue_data(std::uint32_t data_type, const_span);
	void flush();
	void do_close();
	void consume_window(std::size_t);

	struct pending_data {
		// 0 for normal data
		std::uint32_t type;
		byte_vector data;
		std::size_t sent{};
	};

	std::uint32_t const initial_window_;
	channel_side_info local_;
	channel_side_info remote_;
	channel_state state_{channel_state::opening};

	std::deque<pending_data> queue_;
	std::size_t queued_size_{};

	bool eof_requested_{};
	bool eof_sent_{};
	bool eof_received_{};
	bool close_requested_{};
	bool close_sent_{};
	bool close_received_{};
};

}

#endif
