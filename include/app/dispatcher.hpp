#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "app/finalizer.hpp"
#include "app/peer_registry.hpp"
#include "job/chunker.hpp"
#include "proto/wire.hpp"
#include "tasks/task_store.hpp"
#include "transport/itransport.hpp"

namespace app
{

// --- events; everything that touches the store or the registry arrives as one of these ---
struct PeerConnected
{
    transport::ConnPtr conn;
};

struct FrameReceived
{
    transport::ConnPtr conn;
    transport::Frame   frame;
};

struct PeerDisconnected
{
    transport::ConnPtr conn;
};

struct SweepTick
{
    tasks::Clock::time_point now;
};

struct TasksLoaded
{
    std::vector<job::Chunk> chunks;
};

struct Shutdown
{
};

using Event =
    std::variant<PeerConnected, FrameReceived, PeerDisconnected, SweepTick, TasksLoaded, Shutdown>;

struct DispatcherSettings
{
    std::chrono::milliseconds sweep_timeout{5000};
    std::chrono::milliseconds sweep_interval{1000};
};

using OnFinalized = std::function<void(const FinalizeReport &)>;

// Single consumer of the event queue. Owns the task store and the peer registry; the loop
// thread (or a test calling handle() directly) is the only code that mutates them.
class Dispatcher
{
  public:
    Dispatcher(Finalizer &finalizer, DispatcherSettings s = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher &)            = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    // loop thread + sweep timer thread
    bool start();
    void stop();

    void post(Event ev);

    // process one event to completion on the calling thread
    void handle(Event ev);

    // transport callbacks that post into the queue
    transport::Callbacks callbacks();

    void set_on_finalized(OnFinalized cb) { on_finalized_ = std::move(cb); }

    // readiness: true once the task set is loaded
    bool ready() const { return loaded_.load(); }

    // "tasks=<n> pending=<p> assigned=<a> done=<d> peers=<k>", safe from any thread
    std::string status_line() const;

    std::optional<FinalizeStatus> finalize_outcome() const;

    // loop thread only (or tests driving handle())
    const tasks::TaskStore &store() const { return store_; }
    const PeerRegistry     &registry() const { return registry_; }

  private:
    void run();
    void sweep_timer();

    void on_connected(const transport::ConnPtr &conn);
    void on_frame(const transport::ConnPtr &conn, const transport::Frame &frame);
    void on_disconnected(const transport::ConnPtr &conn);
    void on_sweep(tasks::Clock::time_point now);
    void on_loaded(std::vector<job::Chunk> chunks);

    void handle_handshake(const transport::ConnPtr &conn, const transport::Frame &frame);
    void handle_request(PeerId peer, transport::IConnection &conn, const transport::Frame &frame);
    void handle_submit(PeerId peer, const transport::Frame &frame);

    bool send_task(PeerId peer, transport::IConnection &conn, const tasks::Task &task);
    void redispatch(TaskId task);
    void run_finalize();
    void publish();

    tasks::TaskStore   store_;
    PeerRegistry       registry_;
    Finalizer         &finalizer_;
    DispatcherSettings settings_;
    OnFinalized        on_finalized_;

    std::optional<FinalizeReport> final_;

    // queue
    std::mutex              mu_;
    std::condition_variable cv_;
    std::deque<Event>       queue_;
    std::thread             loop_thr_;
    std::thread             timer_thr_;
    std::atomic_bool        running_{false};

    std::mutex              timer_mu_;
    std::condition_variable timer_cv_;

    // snapshot for other threads (control socket)
    std::atomic_bool   loaded_{false};
    std::atomic_size_t snap_total_{0};
    std::atomic_size_t snap_pending_{0};
    std::atomic_size_t snap_assigned_{0};
    std::atomic_size_t snap_done_{0};
    std::atomic_size_t snap_peers_{0};
    std::atomic_int    snap_final_{-1};  // FinalizeStatus once finalize ran
};

}  // namespace app
