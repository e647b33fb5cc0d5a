#pragma once
#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace ipc
{

// one request line in, one reply line out ("" = no reply)
using LineHandler = std::function<std::string(const std::string &)>;

// Serve the control socket until a QUIT line arrives or *stop becomes true.
// Removes the socket file on the way out.
bool start_server(const std::string       &sock_path,
                  const LineHandler       &on_line,
                  const std::atomic_bool *stop = nullptr);

// fire and forget
bool send_line(const std::string &sock_path, const std::string &line);

// send one line and wait for the reply line (without its newline)
std::optional<std::string> request_line(const std::string &sock_path, const std::string &line,
                                        int timeout_ms = 2000);

std::string expand_user(const std::string &path);

}  // namespace ipc
