#pragma once
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "transport/itransport.hpp"
#include "transport/stream.hpp"

namespace transport
{

// unsent bytes a connection may hold before it is cut off; one message of any size
// is still accepted when the outbox is empty
inline constexpr std::size_t OUTBOX_LIMIT = 8u << 20;

// Non-blocking socket. send() queues the framed message and writes what the kernel
// takes right away; the poll loop drains the rest on POLLOUT.
class TcpConnection final : public IConnection
{
  public:
    TcpConnection(ConnId id, int fd, std::string peer_addr, int wake_fd = -1);

    ConnId      id() const override { return id_; }
    bool        send(const Frame &message) override;  // never blocks
    bool        is_open() const override { return open_.load(std::memory_order_acquire); }
    void        close() override;  // shutdown only; the poll loop owns the fd
    std::string name() const override { return peer_addr_; }

    std::size_t backlog() const;

  private:
    friend class TcpServerTransport;
    void mark_closed();
    bool want_write() const;
    bool flush();         // poll loop, on POLLOUT
    bool flush_locked();  // false on a hard socket error
    void wake() const;

    ConnId             id_;
    int                fd_;
    std::string        peer_addr_;
    int                wake_fd_;
    std::atomic_bool   open_{true};
    mutable std::mutex send_mu_;  // guards fd_ writes and the outbox
    std::deque<Frame>  outbox_;   // framed messages, front partially sent
    std::size_t        out_off_   = 0;
    std::size_t        out_bytes_ = 0;
    bool               cut_       = false;  // overflowed or failed; no more sends
    StreamDecoder      rx_;                 // poll loop only
};

// poll(2) based listener; one thread reads every connection and drains their outboxes
class TcpServerTransport final : public IServerTransport
{
  public:
    TcpServerTransport() = default;
    ~TcpServerTransport() override;

    bool          start(const Settings &s, Callbacks cb) override;
    void          stop() override;
    std::uint16_t port() const override { return port_; }
    std::string   name() const override { return "tcp"; }

  private:
    void loop();
    void accept_one();
    bool read_one(const std::shared_ptr<TcpConnection> &c);
    void drop(const std::shared_ptr<TcpConnection> &c);

    Callbacks                                         cb_{};
    int                                               listen_fd_ = -1;
    int                                               wake_rd_   = -1;
    int                                               wake_wr_   = -1;
    std::uint16_t                                     port_      = 0;
    std::atomic_bool                                  running_{false};
    std::thread                                       thr_;
    ConnId                                            next_id_ = 1;
    std::map<ConnId, std::shared_ptr<TcpConnection>> conns_;  // poll loop only
};

}  // namespace transport
