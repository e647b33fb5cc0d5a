#include "app/peer_registry.hpp"
#include "util/log.hpp"

namespace app
{

std::optional<PeerId> PeerRegistry::register_peer(const transport::ConnPtr &conn,
                                                  std::string              nickname)
{
    if (!conn)
        return std::nullopt;
    if (next_id_ > 0xFFFF)
    {
        LOG_ERROR("register_peer: peer id space exhausted");
        return std::nullopt;
    }
    const PeerId id = static_cast<PeerId>(next_id_++);
    Peer         p;
    p.id       = id;
    p.conn     = conn;
    p.nickname = std::move(nickname);
    by_conn_[conn->id()] = id;
    peers_.emplace(id, std::move(p));
    return id;
}

std::set<TaskId> PeerRegistry::unregister(PeerId id)
{
    auto it = peers_.find(id);
    if (it == peers_.end())
        return {};
    std::set<TaskId> loans = std::move(it->second.loaned);
    if (it->second.conn)
        by_conn_.erase(it->second.conn->id());
    peers_.erase(it);
    return loans;
}

void PeerRegistry::record_loan(PeerId id, TaskId task)
{
    auto it = peers_.find(id);
    if (it != peers_.end())
        it->second.loaned.insert(task);
}

void PeerRegistry::release_loan(PeerId id, TaskId task)
{
    auto it = peers_.find(id);
    if (it != peers_.end())
        it->second.loaned.erase(task);
}

std::optional<PeerId> PeerRegistry::find_by_conn(transport::ConnId conn) const
{
    auto it = by_conn_.find(conn);
    if (it == by_conn_.end())
        return std::nullopt;
    return it->second;
}

transport::IConnection *PeerRegistry::connection(PeerId id) const
{
    auto it = peers_.find(id);
    return it == peers_.end() ? nullptr : it->second.conn.get();
}

const std::set<TaskId> *PeerRegistry::loans(PeerId id) const
{
    auto it = peers_.find(id);
    return it == peers_.end() ? nullptr : &it->second.loaned;
}

const std::string *PeerRegistry::nickname(PeerId id) const
{
    auto it = peers_.find(id);
    return it == peers_.end() ? nullptr : &it->second.nickname;
}

std::size_t PeerRegistry::broadcast(const transport::Frame &frame)
{
    std::size_t n = 0;
    for (auto &kv : peers_)
    {
        auto &conn = kv.second.conn;
        if (!conn || !conn->is_open())
            continue;
        if (conn->send(frame))
        {
            n++;
            LOG_DEBUG("Broadcast to peer #%u", (unsigned)kv.first);
        }
    }
    return n;
}

void PeerRegistry::for_each_open_peer(
    const std::function<bool(PeerId, transport::IConnection &)> &fn)
{
    for (auto &kv : peers_)
    {
        auto &conn = kv.second.conn;
        if (!conn || !conn->is_open())
            continue;
        if (!fn(kv.first, *conn))
            break;
    }
}

}  // namespace app
