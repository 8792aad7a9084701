#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Handles one command line, returns the reply line ("" == no reply)
using LineHandler = std::function<std::string(const std::string &line)>;

// Serves one line per connection until a client sends QUIT. Unlinks the socket on exit.
bool start_server(const std::string &sock_path, const LineHandler &on_line);

// Sends `line`; when `reply` is set, waits for the server's answer (up to reply_timeout_ms)
bool send_line(const std::string &sock_path,
               const std::string &line,
               std::string       *reply            = nullptr,
               int                reply_timeout_ms = 60000);

std::string expand_user(const std::string &path);

}  // namespace ipc
