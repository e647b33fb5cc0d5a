#include "transport/loopback_transport.hpp"

namespace transport
{
// LoopbackServer: drives the dispatcher's transport callbacks without sockets.
bool LoopbackConnection::send(const Frame &message)
{
    if (!open_.load())
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    sent_.push_back(message);
    return true;
}

std::vector<Frame> LoopbackConnection::sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
}

std::size_t LoopbackConnection::sent_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_.size();
}

Frame LoopbackConnection::last_sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_.empty() ? Frame{} : sent_.back();
}

void LoopbackConnection::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    sent_.clear();
}

bool LoopbackServer::start(const Settings & /*s*/, Callbacks cb)
{
    cb_      = std::move(cb);
    started_ = true;
    return true;
}

void LoopbackServer::stop()
{
    started_ = false;
    cb_      = Callbacks{};
}

std::shared_ptr<LoopbackConnection> LoopbackServer::connect()
{
    auto c = std::make_shared<LoopbackConnection>(next_id_++);
    if (started_ && cb_.on_connect)
        cb_.on_connect(c);
    return c;
}

bool LoopbackServer::deliver(const std::shared_ptr<LoopbackConnection> &c, Frame message)
{
    if (!started_ || !cb_.on_message || !c->is_open())
        return false;
    cb_.on_message(c, std::move(message));
    return true;
}

void LoopbackServer::disconnect(const std::shared_ptr<LoopbackConnection> &c)
{
    c->close();
    if (started_ && cb_.on_close)
        cb_.on_close(c);
}

}  // namespace transport
