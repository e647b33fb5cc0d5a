#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include "tasks/task_store.hpp"
#include "transport/itransport.hpp"

namespace app
{

using tasks::PeerId;
using tasks::TaskId;

// Live worker connections by peer id, and the tasks each one holds on loan.
// Like TaskStore, only touched from the dispatcher's event loop.
class PeerRegistry
{
  public:
    // next id, never reused; nullopt once the 16-bit id space is spent
    std::optional<PeerId> register_peer(const transport::ConnPtr &conn,
                                        std::string              nickname = {});
    // removes the peer and hands back its loan set
    std::set<TaskId> unregister(PeerId id);

    void record_loan(PeerId id, TaskId task);
    void release_loan(PeerId id, TaskId task);

    bool                     contains(PeerId id) const { return peers_.count(id) != 0; }
    std::optional<PeerId>    find_by_conn(transport::ConnId conn) const;
    transport::IConnection  *connection(PeerId id) const;
    const std::set<TaskId>  *loans(PeerId id) const;
    const std::string       *nickname(PeerId id) const;
    std::size_t              size() const { return peers_.size(); }

    // send to every open connection, skipping closed ones; returns how many got it
    std::size_t broadcast(const transport::Frame &frame);

    // visit open peers in id order until fn returns false
    void for_each_open_peer(const std::function<bool(PeerId, transport::IConnection &)> &fn);

  private:
    struct Peer
    {
        PeerId             id{0};
        transport::ConnPtr conn;
        std::string        nickname;
        std::set<TaskId>   loaned;
    };

    std::map<PeerId, Peer>                        peers_;
    std::unordered_map<transport::ConnId, PeerId> by_conn_;
    std::uint32_t                                 next_id_ = 1;  // 0 means "not registered"
};

}  // namespace app
