#include "configs.hpp"

namespace sshconsole::ssh::test {

std::string_view const gcm_cipher = "aes256-gcm@openssh.com";
std::string_view const ctr_cipher = "aes256-ctr";

transport_config test_client_config() {
	transport_config c;
	c.side = transport_side::client;
	c.software = "sshconsole_test_client";
	c.ciphers = {std::string(gcm_cipher)};
	return c;
}

server_config test_server_config() {
	server_config c;
	c.host_keys.push_back(test_host_private_key());
	c.ciphers = {std::string(gcm_cipher)};
	return c;
}

transport_config test_client_aes_ctr_config() {
	auto c = test_client_config();
	c.ciphers = {std::string(ctr_cipher)};
	return c;
}

server_config test_server_aes_ctr_config() {
	auto c = test_server_config();
	c.ciphers = {std::string(ctr_cipher)};
	return c;
}

}
