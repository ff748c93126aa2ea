#ifndef SSHCONSOLE_CORE_PROTOCOL_HEADER
#define SSHCONSOLE_CORE_PROTOCOL_HEADER

#include <cstdint>
#include <string_view>

namespace sshconsole::ssh {

// message numbers (RFC 4250 section 4.1)
enum ssh_msg : std::uint8_t {
	ssh_disconnect = 1,
	ssh_ignore = 2,
	ssh_unimplemented = 3,
	ssh_debug = 4,
	ssh_service_request = 5,
	ssh_service_accept = 6,

	ssh_kexinit = 20,
	ssh_newkeys = 21,
	ssh_kex_ecdh_init = 30,
	ssh_kex_ecdh_reply = 31,

	ssh_userauth_request = 50,
	ssh_userauth_failure = 51,
	ssh_userauth_success = 52,
	ssh_userauth_banner = 53,
	ssh_userauth_pk_ok = 60,

	ssh_global_request = 80,
	ssh_request_success = 81,
	ssh_request_failure = 82,
	ssh_channel_open = 90,
	ssh_channel_open_confirmation = 91,
	ssh_channel_open_failure = 92,
	ssh_channel_window_adjust = 93,
	ssh_channel_data = 94,
	ssh_channel_extended_data = 95,
	ssh_channel_eof = 96,
	ssh_channel_close = 97,
	ssh_channel_request = 98,
	ssh_channel_success = 99,
	ssh_channel_failure = 100
};

inline bool is_transport_msg(std::uint8_t m) { return m >= 1 && m <= 49; }
inline bool is_kex_msg(std::uint8_t m) { return m >= 20 && m <= 49; }
inline bool is_userauth_msg(std::uint8_t m) { return m >= 50 && m <= 79; }
inline bool is_connection_msg(std::uint8_t m) { return m >= 80 && m <= 127; }

// disconnect reason codes, also used as the error of the transport
enum ssh_error_code : std::uint32_t {
	ssh_noerror = 0,
	ssh_host_not_allowed_to_connect = 1,
	ssh_protocol_error = 2,
	ssh_key_exchange_failed = 3,
	ssh_reserved = 4,
	ssh_mac_error = 5,
	ssh_compression_error = 6,
	ssh_service_not_available = 7,
	ssh_protocol_version_not_supported = 8,
	ssh_host_key_not_verifiable = 9,
	ssh_connection_lost = 10,
	ssh_disconnect_by_application = 11,
	ssh_too_many_connections = 12,
	ssh_auth_cancelled_by_user = 13,
	ssh_no_more_auth_methods_available = 14,
	ssh_illegal_user_name = 15
};

enum channel_open_code : std::uint32_t {
	ssh_open_administratively_prohibited = 1,
	ssh_open_connect_failed = 2,
	ssh_open_unknown_channel_type = 3,
	ssh_open_resource_shortage = 4
};

std::uint32_t const extended_stderr = 1;

std::string_view const user_auth_service_name = "ssh-userauth";
std::string_view const connection_service_name = "ssh-connection";

std::size_t const kex_cookie_size = 16;

// upper limit for packet_length of incoming packets
std::uint32_t const default_max_packet_size = 256 * 1024;

}

#endif
