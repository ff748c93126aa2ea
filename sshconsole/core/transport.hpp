#ifndef SSHCONSOLE_CORE_TRANSPORT_HEADER
#define SSHCONSOLE_CORE_TRANSPORT_HEADER

#include "kex.hpp"
#include "packet_io.hpp"

#include "sshconsole/common/logger.hpp"

#include <deque>
#include <memory>

namespace sshconsole::ssh {

enum class transport_op {
	want_read_more,
	want_write_more,
	pending_action, // waiting for some asynchronous action (e.g. authentication result)
	disconnected
};
std::string_view to_string(transport_op);

enum class transport_state {
	version_exchange,
	kex,
	transport,
	disconnected
};
std::string_view to_string(transport_state);

enum class handler_result {
	handled,
	unknown,
	pending
};

struct transport_config {
	transport_side side{transport_side::server};

	// software and comment of the version line
	std::string software{"sshconsole_0.1"};
	std::string comment;

	// server host keys, the first is used
	std::vector<ed25519_private_key> host_keys;

	std::vector<std::string> kexes{std::string(curve25519_sha256_name), std::string(curve25519_sha256_libssh_name)};
	std::vector<std::string> ciphers{"aes256-gcm@openssh.com", "aes256-ctr"};
	std::vector<std::string> macs{"hmac-sha2-256"};

	std::uint32_t max_in_packet_size{default_max_packet_size};

	// new key exchange after this many bytes in either direction
	std::uint64_t rekey_bytes{std::uint64_t(1) << 30};

	// client only, decides if the server's host key is trusted, every key is accepted if not set
	std::function<bool(ssh_public_key const&)> host_key_check;
};

/** \brief SSH Version 2 transport layer (RFC 4253)
 *
 *  Does the version exchange, key exchanges and the binary packet protocol. The messages of the
 *  services above are passed to handle_message() after the first key exchange.
 */
class ssh_transport {
public:
	ssh_transport(transport_config const&, logger&, out_buffer&, random&);
	virtual ~ssh_transport();

	ssh_transport(ssh_transport const&) = delete;
	ssh_transport& operator=(ssh_transport const&) = delete;

	/// This is the main driving function, reads at most one packet from in_buffer and writes to out_buffer
	transport_op process(in_buffer&);

	/// payload starts with the message number, non-transport messages are held back while keys are exchanged
	void send_payload(const_span payload);

	void disconnect(ssh_error_code = ssh_disconnect_by_application, std::string_view message = {});
	void set_error_and_disconnect(ssh_error_code, std::string_view message);

	/// starts new key exchange, no-op if one is running
	void start_rekey();

	transport_state state() const { return state_; }
	bool kex_running() const { return kex_running_; }

	ssh_error_code error() const { return error_; }
	std::string const& error_message() const { return error_message_; }

	/// exchange hash of the first key exchange, empty before it is done
	const_span session_id() const { return session_id_; }

	std::string const& peer_version() const { return peer_version_; }
	transport_config const& config() const { return config_; }
	logger& log() const { return log_; }
	random& rand() const { return rand_; }

protected:
	/// message after the first key exchange that the transport does not handle
	virtual handler_result handle_message(std::uint8_t type, const_span payload) = 0;

	virtual void on_kex_done(bool /*first*/) {}
	virtual void on_state_change(transport_state /*old*/, transport_state /*s*/) {}

	transport_config const& config_;
	logger& log_;

private:
	void set_state(transport_state);
	void send_version();
	bool read_version(in_buffer&);
	bool parse_version(std::string const& line);
	handler_result dispatch(const_span payload);
	void write_payload(const_span payload);

	void send_kexinit();
	void handle_kexinit(const_span payload);
	void handle_kex_message(std::uint8_t type, const_span payload);
	std::unique_ptr<packet_cipher> take_new_keys(curve25519_kex const&);
	void handle_newkeys();
	void finish_kex();
	void handle_disconnect(const_span payload);

private:
	random& rand_;
	out_buffer& out_;
	packet_reader reader_;
	packet_writer writer_;

	transport_state state_{transport_state::version_exchange};
	ssh_error_code error_{};
	std::string error_message_;

	std::string my_version_;
	std::string peer_version_;
	bool version_sent_{};
	std::size_t pre_version_lines_{};
	// something was written during the current process() call
	bool wrote_{};

	// message waiting for an asynchronous result, dispatched again on next process()
	byte_vector pending_;

	// key exchange
	bool kex_running_{};
	bool ignore_next_kex_packet_{};
	byte_vector my_kexinit_;
	byte_vector peer_kexinit_;
	std::optional<kex_algorithms> algorithms_;
	std::unique_ptr<curve25519_kex> kex_;
	std::unique_ptr<packet_cipher> in_cipher_;
	bool newkeys_sent_{};
	bool newkeys_received_{};
	byte_vector session_id_;

	// payloads sent during key exchange
	std::deque<byte_vector> held_;
};

}

#endif
