#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include "transport/tcp_server.hpp"
#include "util/log.hpp"

namespace transport
{

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static bool set_nonblock(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

TcpConnection::TcpConnection(ConnId id, int fd, std::string peer_addr, int wake_fd)
    : id_(id), fd_(fd), peer_addr_(std::move(peer_addr)), wake_fd_(wake_fd)
{
}

bool TcpConnection::send(const Frame &message)
{
    if (message.size() > MAX_MESSAGE)
    {
        LOG_ERROR("send to %s: message too large (%zu)", peer_addr_.c_str(), message.size());
        return false;
    }

    std::lock_guard<std::mutex> lk(send_mu_);
    if (!open_.load(std::memory_order_acquire) || cut_)
        return false;
    if (out_bytes_ > 0 && out_bytes_ + LEN_PREFIX + message.size() > OUTBOX_LIMIT)
    {
        LOG_WARN("%s is not reading (%zu bytes queued); closing", peer_addr_.c_str(), out_bytes_);
        cut_ = true;
        ::shutdown(fd_, SHUT_RDWR);
        return false;
    }

    const bool was_idle = outbox_.empty();
    outbox_.push_back(frame_message(message));
    out_bytes_ += outbox_.back().size();
    if (!flush_locked())
    {
        LOG_WARN("send to %s failed; closing", peer_addr_.c_str());
        cut_ = true;
        ::shutdown(fd_, SHUT_RDWR);
        return false;
    }
    // the poll loop only watches POLLOUT for connections that have something queued
    if (was_idle && !outbox_.empty())
        wake();
    return true;
}

bool TcpConnection::flush_locked()
{
    while (!outbox_.empty())
    {
        const Frame &front = outbox_.front();
        ssize_t      n = ::send(fd_, front.data() + out_off_, front.size() - out_off_,
                                MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n == -1)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return true;
            LOG_DEBUG("send() to %s failed: %s", peer_addr_.c_str(), std::strerror(errno));
            return false;
        }
        out_off_ += static_cast<std::size_t>(n);
        out_bytes_ -= static_cast<std::size_t>(n);
        if (out_off_ == front.size())
        {
            outbox_.pop_front();
            out_off_ = 0;
        }
    }
    return true;
}

bool TcpConnection::flush()
{
    std::lock_guard<std::mutex> lk(send_mu_);
    if (!open_.load(std::memory_order_acquire) || cut_)
        return true;
    if (flush_locked())
        return true;
    cut_ = true;
    return false;
}

bool TcpConnection::want_write() const
{
    std::lock_guard<std::mutex> lk(send_mu_);
    return !outbox_.empty() && !cut_;
}

std::size_t TcpConnection::backlog() const
{
    std::lock_guard<std::mutex> lk(send_mu_);
    return out_bytes_;
}

void TcpConnection::wake() const
{
    if (wake_fd_ == -1)
        return;
    const char b = 'w';
    // a full pipe already holds a pending wakeup
    if (::write(wake_fd_, &b, 1) == -1 && errno != EAGAIN)
        LOG_DEBUG("wake pipe write failed: %s", std::strerror(errno));
}

void TcpConnection::close()
{
    std::lock_guard<std::mutex> lk(send_mu_);
    if (open_.load(std::memory_order_acquire))
        ::shutdown(fd_, SHUT_RDWR);  // the poll loop sees EOF and reports the close
}

void TcpConnection::mark_closed()
{
    std::lock_guard<std::mutex> lk(send_mu_);
    open_.store(false, std::memory_order_release);
    ::close(fd_);
    fd_ = -1;
    outbox_.clear();
    out_off_ = out_bytes_ = 0;
}

TcpServerTransport::~TcpServerTransport()
{
    stop();
}

bool TcpServerTransport::start(const Settings &s, Callbacks cb)
{
    if (running_.load())
        return false;
    cb_ = std::move(cb);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(s.port);
    if (inet_pton(AF_INET, s.bind_addr.c_str(), &addr.sin_addr) != 1)
    {
        LOG_ERROR("Invalid bind address: %s", s.bind_addr.c_str());
        return false;
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof addr) == -1)
    {
        int saved = errno;
        ::close(fd);
        LOG_ERROR("bind(%s:%u) failed: %s", s.bind_addr.c_str(), (unsigned)s.port,
                  std::strerror(saved));
        return false;
    }
    if (listen(fd, 64) == -1)
    {
        int saved = errno;
        ::close(fd);
        LOG_ERROR("listen() failed: %s", std::strerror(saved));
        return false;
    }

    sockaddr_in bound{};
    socklen_t   blen = sizeof bound;
    if (getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &blen) == 0)
        port_ = ntohs(bound.sin_port);
    else
        port_ = s.port;

    int pipefd[2];
    if (pipe(pipefd) == -1)
    {
        int saved = errno;
        ::close(fd);
        LOG_ERROR("pipe() failed: %s", std::strerror(saved));
        return false;
    }
    set_cloexec(pipefd[0]);
    set_cloexec(pipefd[1]);
    set_nonblock(pipefd[0]);
    set_nonblock(pipefd[1]);
    wake_rd_   = pipefd[0];
    wake_wr_   = pipefd[1];
    listen_fd_ = fd;

    running_.store(true);
    thr_ = std::thread([this] { loop(); });
    LOG_SYSTEM("Listening for workers on %s:%u", s.bind_addr.c_str(), (unsigned)port_);
    return true;
}

void TcpServerTransport::stop()
{
    if (!running_.exchange(false))
        return;
    const char b = 'x';
    if (::write(wake_wr_, &b, 1) == -1 && errno != EAGAIN)
        LOG_WARN("wake pipe write failed: %s", std::strerror(errno));
    if (thr_.joinable())
        thr_.join();

    for (auto &kv : conns_)
        kv.second->mark_closed();
    conns_.clear();
    ::close(listen_fd_);
    ::close(wake_rd_);
    ::close(wake_wr_);
    listen_fd_ = wake_rd_ = wake_wr_ = -1;
}

void TcpServerTransport::loop()
{
    std::vector<pollfd>                         fds;
    std::vector<std::shared_ptr<TcpConnection>> order;
    while (running_.load())
    {
        fds.clear();
        order.clear();
        fds.push_back({wake_rd_, POLLIN, 0});
        fds.push_back({listen_fd_, POLLIN, 0});
        for (auto &kv : conns_)
        {
            const short ev = kv.second->want_write() ? (POLLIN | POLLOUT) : POLLIN;
            fds.push_back({kv.second->fd_, ev, 0});
            order.push_back(kv.second);
        }

        int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
            break;
        }
        if (fds[0].revents)
        {
            // stop() or a connection that just queued output
            char drain[64];
            while (::read(wake_rd_, drain, sizeof drain) > 0)
            {
            }
            if (!running_.load())
                break;
        }
        if (fds[1].revents & POLLIN)
            accept_one();

        for (std::size_t i = 0; i < order.size(); i++)
        {
            const short ev = fds[i + 2].revents;
            if (!ev)
                continue;
            if ((ev & POLLOUT) && !order[i]->flush())
            {
                drop(order[i]);
                continue;
            }
            if ((ev & (POLLIN | POLLERR | POLLHUP)) && !read_one(order[i]))
                drop(order[i]);
        }
    }
}

void TcpServerTransport::accept_one()
{
    sockaddr_in peer{};
    socklen_t   plen = sizeof peer;
    int         fd   = accept(listen_fd_, reinterpret_cast<sockaddr *>(&peer), &plen);
    if (fd == -1)
    {
        if (errno != EINTR && errno != EAGAIN)
            LOG_WARN("accept() failed: %s", std::strerror(errno));
        return;
    }
    set_cloexec(fd);
    if (!set_nonblock(fd))
    {
        LOG_WARN("fcntl(O_NONBLOCK) failed: %s", std::strerror(errno));
        ::close(fd);
        return;
    }

    char ip[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof ip);
    std::string addr = std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));

    auto c = std::make_shared<TcpConnection>(next_id_++, fd, addr, wake_wr_);
    conns_[c->id()] = c;
    LOG_INFO("Connection #%llu from %s", (unsigned long long)c->id(), addr.c_str());
    if (cb_.on_connect)
        cb_.on_connect(c);
}

bool TcpServerTransport::read_one(const std::shared_ptr<TcpConnection> &c)
{
    std::uint8_t buf[64 * 1024];
    ssize_t      n = ::recv(c->fd_, buf, sizeof buf, 0);
    if (n == 0)
        return false;  // EOF
    if (n == -1)
    {
        if (errno == EINTR || errno == EAGAIN)
            return true;
        LOG_DEBUG("recv() from %s failed: %s", c->name().c_str(), std::strerror(errno));
        return false;
    }

    c->rx_.feed(buf, static_cast<std::size_t>(n));
    while (auto msg = c->rx_.next())
    {
        if (cb_.on_message)
            cb_.on_message(c, std::move(*msg));
    }
    if (c->rx_.failed())
    {
        LOG_WARN("Closing %s: framing error", c->name().c_str());
        return false;
    }
    return true;
}

void TcpServerTransport::drop(const std::shared_ptr<TcpConnection> &c)
{
    c->mark_closed();
    conns_.erase(c->id());
    LOG_INFO("Connection #%llu (%s) closed", (unsigned long long)c->id(), c->name().c_str());
    if (cb_.on_close)
        cb_.on_close(c);
}

}  // namespace transport
