#ifndef SSHCONSOLE_CONSOLE_CALLBACKS_HEADER
#define SSHCONSOLE_CONSOLE_CALLBACKS_HEADER

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace sshconsole::ssh::console {

class auth_completion;
class output;
class public_key_credential;

/// runs the function on the connection's event loop, callable from any thread
using post_function = std::function<void(std::function<void()>)>;

using environment = std::map<std::string, std::string>;

/// called with (username, password, completion), the completion must be called exactly once
using password_authenticator = std::function<void(std::string const&, std::string const&, auth_completion)>;

/// called with (username, key, completion) after the client has proven it owns the key
using public_key_authenticator = std::function<void(std::string const&, public_key_credential const&, auth_completion)>;

/// called with (command, output, username, environment) for the exec request of a session channel
using command_runner = std::function<void(std::string const&, std::shared_ptr<output>, std::optional<std::string> const&, environment const&)>;

}

#endif
