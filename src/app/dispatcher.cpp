#include <cstdio>

#include "app/dispatcher.hpp"
#include "util/log.hpp"

namespace app
{

using transport::ConnPtr;
using transport::Frame;
using transport::IConnection;

static const char *const COMPLETION_MESSAGE = "All processing tasks are completed on the server.";

Dispatcher::Dispatcher(Finalizer &finalizer, DispatcherSettings s)
    : finalizer_(finalizer), settings_(s)
{
}

Dispatcher::~Dispatcher()
{
    stop();
}

bool Dispatcher::start()
{
    if (running_.exchange(true))
        return false;
    loop_thr_  = std::thread([this] { run(); });
    timer_thr_ = std::thread([this] { sweep_timer(); });
    LOG_DEBUG("Dispatcher started (sweep every %lld ms, timeout %lld ms)",
              (long long)settings_.sweep_interval.count(),
              (long long)settings_.sweep_timeout.count());
    return true;
}

void Dispatcher::stop()
{
    {
        std::lock_guard<std::mutex> lk(timer_mu_);
        if (!running_.exchange(false))
            return;
    }
    timer_cv_.notify_all();
    if (timer_thr_.joinable())
        timer_thr_.join();

    post(Shutdown{});
    if (loop_thr_.joinable())
        loop_thr_.join();
}

void Dispatcher::post(Event ev)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void Dispatcher::run()
{
    for (;;)
    {
        Event ev;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return !queue_.empty(); });
            ev = std::move(queue_.front());
            queue_.pop_front();
        }
        if (std::holds_alternative<Shutdown>(ev))
            break;
        handle(std::move(ev));
    }
    LOG_DEBUG("Dispatcher loop exited");
}

void Dispatcher::sweep_timer()
{
    std::unique_lock<std::mutex> lk(timer_mu_);
    while (running_.load())
    {
        if (timer_cv_.wait_for(lk, settings_.sweep_interval, [this] { return !running_.load(); }))
            break;
        post(SweepTick{tasks::Clock::now()});
    }
}

transport::Callbacks Dispatcher::callbacks()
{
    transport::Callbacks cb;
    cb.on_connect = [this](const ConnPtr &c) { post(PeerConnected{c}); };
    cb.on_message = [this](const ConnPtr &c, Frame f) { post(FrameReceived{c, std::move(f)}); };
    cb.on_close   = [this](const ConnPtr &c) { post(PeerDisconnected{c}); };
    return cb;
}

void Dispatcher::handle(Event ev)
{
    if (auto *e = std::get_if<PeerConnected>(&ev))
        on_connected(e->conn);
    else if (auto *e = std::get_if<FrameReceived>(&ev))
        on_frame(e->conn, e->frame);
    else if (auto *e = std::get_if<PeerDisconnected>(&ev))
        on_disconnected(e->conn);
    else if (auto *e = std::get_if<SweepTick>(&ev))
        on_sweep(e->now);
    else if (auto *e = std::get_if<TasksLoaded>(&ev))
        on_loaded(std::move(e->chunks));
    publish();
}

void Dispatcher::on_connected(const ConnPtr &conn)
{
    LOG_DEBUG("Connection %s waiting for handshake", conn->name().c_str());
}

void Dispatcher::on_frame(const ConnPtr &conn, const Frame &frame)
{
    auto hdr = wire::parse_header(frame);
    if (!hdr)
        return;  // too short; already logged

    if (hdr->command == wire::CMD_HANDSHAKE)
    {
        handle_handshake(conn, frame);
        return;
    }

    // stale or racing traffic from a peer we no longer know: no reply
    if (!registry_.contains(hdr->peer_id))
    {
        LOG_DEBUG("Dropping command %u from unregistered peer #%u", (unsigned)hdr->command,
                  (unsigned)hdr->peer_id);
        return;
    }
    IConnection *pc = registry_.connection(hdr->peer_id);
    if (!pc || pc->id() != conn->id())
    {
        LOG_WARN("Dropping command %u: %s is not peer #%u", (unsigned)hdr->command,
                 conn->name().c_str(), (unsigned)hdr->peer_id);
        return;
    }

    switch (hdr->command)
    {
        case wire::CMD_REQUEST_TASK:
            handle_request(hdr->peer_id, *pc, frame);
            break;
        case wire::CMD_SUBMIT_RESULT:
            handle_submit(hdr->peer_id, frame);
            break;
        default:
            if (!wire::decode_body(hdr->command, frame))
                LOG_WARN("Dropping command %u from peer #%u: malformed body",
                         (unsigned)hdr->command, (unsigned)hdr->peer_id);
            else
                LOG_WARN("Unknown command %u from peer #%u (%zu body bytes)",
                         (unsigned)hdr->command, (unsigned)hdr->peer_id,
                         frame.size() - wire::HDR_SIZE);
            break;
    }
}

void Dispatcher::handle_handshake(const ConnPtr &conn, const Frame &frame)
{
    auto body = wire::decode_body(wire::CMD_HANDSHAKE, frame);
    auto hs   = body ? wire::as_handshake(*body) : std::nullopt;
    if (!hs)
    {
        LOG_WARN("Dropping malformed handshake from %s", conn->name().c_str());
        return;
    }

    // a repeated handshake on the same link keeps its id
    if (auto known = registry_.find_by_conn(conn->id()))
    {
        LOG_DEBUG("Repeated handshake from peer #%u", (unsigned)*known);
        conn->send(wire::encode_ack(*known));
        return;
    }

    const std::string nick = hs->nickname.value_or("");
    auto              id   = registry_.register_peer(conn, nick);
    if (!id)
    {
        LOG_ERROR("Refusing %s: no peer ids left", conn->name().c_str());
        conn->close();
        return;
    }
    LOG_INFO("Registered peer #%u (nickname: %s) from %s", (unsigned)*id,
             nick.empty() ? "N/A" : nick.c_str(), conn->name().c_str());
    if (!conn->send(wire::encode_ack(*id)))
        LOG_WARN("Handshake ack to peer #%u failed", (unsigned)*id);
}

void Dispatcher::handle_request(PeerId peer, IConnection &conn, const Frame &frame)
{
    auto body = wire::decode_body(wire::CMD_REQUEST_TASK, frame);
    if (!body || !wire::as_request_task(*body))
    {
        LOG_WARN("Dropping malformed task request from peer #%u", (unsigned)peer);
        return;
    }

    const tasks::Task *task = store_.loaded() ? store_.get_next_task(peer) : nullptr;
    if (task)
    {
        send_task(peer, conn, *task);
        return;
    }
    LOG_DEBUG("No task for peer #%u", (unsigned)peer);
    conn.send(wire::encode_no_task());
}

bool Dispatcher::send_task(PeerId peer, IConnection &conn, const tasks::Task &task)
{
    registry_.record_loan(peer, task.id);
    // a failed send closes the link; the disconnect path takes the loan back
    if (!conn.send(wire::encode_task_data(static_cast<std::uint16_t>(task.id), task.payload)))
    {
        LOG_WARN("Sending task #%u to peer #%u failed", task.id, (unsigned)peer);
        return false;
    }
    LOG_DEBUG("Sent task #%u to peer #%u", task.id, (unsigned)peer);
    return true;
}

void Dispatcher::handle_submit(PeerId peer, const Frame &frame)
{
    auto body = wire::decode_body(wire::CMD_SUBMIT_RESULT, frame);
    auto sub  = body ? wire::as_submit_result(*body) : std::nullopt;
    if (!sub)
    {
        LOG_WARN("Dropping malformed result submission from peer #%u", (unsigned)peer);
        return;
    }

    const TaskId          id     = sub->task_id;
    const tasks::Task    *before = store_.find(id);
    std::optional<PeerId> holder = before ? before->assigned_peer : std::nullopt;

    if (!store_.submit_result(id, std::move(sub->result)))
    {
        LOG_WARN("Result for task #%u from peer #%u was not accepted", id, (unsigned)peer);
        return;
    }

    registry_.release_loan(peer, id);
    if (holder && *holder != peer)
        registry_.release_loan(*holder, id);
    LOG_DEBUG("Accepted result for task #%u from peer #%u", id, (unsigned)peer);

    if (store_.is_all_done())
        run_finalize();
}

void Dispatcher::run_finalize()
{
    if (final_)
        return;  // runs once

    LOG_SYSTEM("All %zu tasks done; finalizing", store_.tasks().size());
    final_ = finalizer_.finalize(store_);
    snap_final_.store(static_cast<int>(final_->status));

    if (final_->status == FinalizeStatus::Ok)
    {
        const std::size_t n = registry_.broadcast(wire::encode_completion(COMPLETION_MESSAGE));
        LOG_SYSTEM("Finalize ok; completion sent to %zu peer(s)", n);
    }
    else
    {
        LOG_ERROR("Finalize failed: %s", finalize_status_name(final_->status));
    }

    if (on_finalized_)
        on_finalized_(*final_);
}

void Dispatcher::on_disconnected(const ConnPtr &conn)
{
    auto peer = registry_.find_by_conn(conn->id());
    if (!peer)
    {
        LOG_DEBUG("Unregistered connection %s closed", conn->name().c_str());
        return;
    }

    const std::set<TaskId> loans = registry_.unregister(*peer);
    LOG_INFO("Peer #%u disconnected holding %zu task(s)", (unsigned)*peer, loans.size());

    for (TaskId id : loans)
    {
        const tasks::Task *t = store_.find(id);
        // the loan may be stale if a result or the sweep got there first
        if (!t || t->status != tasks::Status::Assigned || t->assigned_peer != *peer)
        {
            LOG_DEBUG("Task #%u no longer held by peer #%u", id, (unsigned)*peer);
            continue;
        }
        store_.revert_to_pending(id);
        LOG_INFO("Task #%u re-queued as pending", id);
        redispatch(id);
    }
}

void Dispatcher::redispatch(TaskId orphan)
{
    bool sent = false;
    registry_.for_each_open_peer([&](PeerId pid, IConnection &c) {
        const tasks::Task *t = store_.get_next_task(pid);
        if (!t)
            return false;
        sent = true;
        if (send_task(pid, c, *t))
            LOG_INFO("Re-assigned task #%u to peer #%u", t->id, (unsigned)pid);
        return false;  // first open peer only
    });
    if (!sent)
        LOG_INFO("Task #%u waits for the next request; no open peer", orphan);
}

void Dispatcher::on_sweep(tasks::Clock::time_point now)
{
    if (!store_.loaded())
        return;
    for (const auto &r : store_.sweep_stuck(settings_.sweep_timeout, now))
    {
        registry_.release_loan(r.peer, r.id);
        LOG_INFO("Reclaimed stuck task #%u from peer #%u", r.id, (unsigned)r.peer);
    }
}

void Dispatcher::on_loaded(std::vector<job::Chunk> chunks)
{
    const std::size_t n = chunks.size();
    if (!store_.load_tasks(std::move(chunks)))
    {
        LOG_ERROR("Loading %zu chunks into the task store failed", n);
        return;
    }
    loaded_.store(true);
    LOG_SYSTEM("%zu tasks loaded; ready for workers", n);
}

void Dispatcher::publish()
{
    const auto c = store_.counts();
    snap_total_.store(c.total);
    snap_pending_.store(c.pending);
    snap_assigned_.store(c.assigned);
    snap_done_.store(c.done);
    snap_peers_.store(registry_.size());
}

std::string Dispatcher::status_line() const
{
    char buf[160];
    std::snprintf(buf, sizeof buf, "tasks=%zu pending=%zu assigned=%zu done=%zu peers=%zu",
                  snap_total_.load(), snap_pending_.load(), snap_assigned_.load(),
                  snap_done_.load(), snap_peers_.load());
    return buf;
}

std::optional<FinalizeStatus> Dispatcher::finalize_outcome() const
{
    const int v = snap_final_.load();
    if (v < 0)
        return std::nullopt;
    return static_cast<FinalizeStatus>(v);
}

}  // namespace app
