#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transport/itransport.hpp"

namespace transport {

// In-process link: whatever the server sends is kept in sent() for the test to inspect.
class LoopbackConnection final : public IConnection {
public:
  explicit LoopbackConnection(ConnId id) : id_(id) {}

  ConnId      id() const override { return id_; }
  bool        send(const Frame& message) override;
  bool        is_open() const override { return open_.load(); }
  void        close() override { open_.store(false); }
  std::string name() const override { return "loopback#" + std::to_string(id_); }

  std::vector<Frame> sent() const;
  std::size_t        sent_count() const;
  Frame              last_sent() const;
  void               clear();

private:
  ConnId             id_;
  std::atomic_bool   open_{true};
  mutable std::mutex mu_;
  std::vector<Frame> sent_;
};

// A fake listener that lets tests connect, deliver messages and disconnect by hand.
class LoopbackServer final : public IServerTransport {
public:
  bool          start(const Settings& s, Callbacks cb) override;
  void          stop() override;
  std::uint16_t port() const override { return 0; }
  std::string   name() const override { return "loopback"; }

  std::shared_ptr<LoopbackConnection> connect();
  bool deliver(const std::shared_ptr<LoopbackConnection>& c, Frame message);
  void disconnect(const std::shared_ptr<LoopbackConnection>& c);

private:
  Callbacks cb_{};
  bool      started_{false};
  ConnId    next_id_{1};
};

} // namespace transport
