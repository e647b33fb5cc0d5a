#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static constexpr int ACCEPT_POLL_MS = 200;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        p(sock_path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
        // only restrict directories we created
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
            LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(),
                     ec.message().c_str());
    }
    return true;
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// fills addr; false (errno set) for an empty or too long path
static bool make_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &addr_len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                      std::strlen(addr.sun_path) + 1);
    return true;
}

static bool send_all(int fd, const std::string &data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// read until the first '\n' or EOF; false on error or timeout
static bool read_line(int fd, std::string &out, int timeout_ms)
{
    std::string buf;
    char        chunk[256];
    for (;;)
    {
        if (timeout_ms >= 0)
        {
            pollfd pfd{fd, POLLIN, 0};
            int    rc = poll(&pfd, 1, timeout_ms);
            if (rc == 0)
            {
                LOG_WARN("Timed out waiting for a reply");
                return false;
            }
            if (rc == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR("poll() failed: %s", std::strerror(errno));
                return false;
            }
        }
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0)
        {
            buf.append(chunk, static_cast<size_t>(n));
            if (buf.find('\n') != std::string::npos)
                break;
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }

    // take first line only
    auto pos = buf.find('\n');
    out      = (pos == std::string::npos) ? buf : buf.substr(0, pos);
    // trim optional '\r'
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

bool start_server(const std::string &sock_path, const LineHandler &on_line,
                  const std::atomic_bool *stop)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    // ensure parent directory exists (mkdir -p)
    if (!ensure_parent_dir(sock_path))
        return false;

    if (::unlink(sock_path.c_str()) == -1 && errno != ENOENT)
        LOG_WARN("unlink(%s) failed: %s", sock_path.c_str(), std::strerror(errno));

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Control socket listening on %s", sock_path.c_str());

    bool result = true;
    while (!(stop && stop->load()))
    {
        pollfd pfd{fd, POLLIN, 0};
        int    rc = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (rc == 0)
            continue;  // re-check stop
        if (rc == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
            result = false;
            break;
        }

        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            result = false;
            break;
        }
        set_cloexec(newfd);

        std::string first;
        if (!read_line(newfd, first, 1000))
        {
            close(newfd);
            continue;  // keep server alive; accept next connection
        }

        std::string reply = on_line ? on_line(first) : std::string();
        if (!reply.empty())
        {
            reply.push_back('\n');
            if (!send_all(newfd, reply))
                LOG_WARN("Reply to control client dropped");
        }
        close(newfd);

        if (first == "QUIT")
            break;  // graceful shutdown
    }

    close(fd);
    unlink(sock_path.c_str());
    return result;
}

static int connect_unix(const std::string &sock_path)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return -1;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return -1;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_DEBUG("connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return -1;
    }
    return fd;
}

bool send_line(const std::string &sock_path, const std::string &line)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return false;
    }
    int fd = connect_unix(sock_path);
    if (fd == -1)
        return false;

    LOG_DEBUG("Sending line: %s", line.c_str());
    const bool ok = send_all(fd, line);
    close(fd);
    return ok;
}

std::optional<std::string> request_line(const std::string &sock_path, const std::string &line,
                                        int timeout_ms)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return std::nullopt;
    }
    int fd = connect_unix(sock_path);
    if (fd == -1)
        return std::nullopt;

    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    std::string reply;
    const bool  ok = send_all(fd, out) && read_line(fd, reply, timeout_ms);
    close(fd);
    if (!ok)
        return std::nullopt;
    return reply;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
